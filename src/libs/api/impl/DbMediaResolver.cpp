/*
 * Copyright (C) 2026 The LiftLens authors
 *
 * This file is part of LiftLens.
 *
 * LiftLens is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * LiftLens is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with LiftLens.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "DbMediaResolver.hpp"

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Analysis.hpp"

namespace liftlens::api
{
    DbMediaResolver::DbMediaResolver(db::IDb& db, const std::filesystem::path& videoStoragePath)
        : _db{ db }
        , _videoStoragePath{ videoStoragePath }
    {
    }

    std::optional<std::filesystem::path> DbMediaResolver::resolve(streaming::MediaId id)
    {
        db::Session& session{ _db.getTLSSession() };

        std::filesystem::path skeletonVideoPath;
        {
            auto transaction{ session.createReadTransaction() };

            const db::Analysis::pointer analysis{ db::Analysis::find(session, db::AnalysisId{ id.value() }) };
            if (!analysis)
            {
                LIFTLENS_LOG(API, DEBUG, "Analysis " << id.value() << " not found");
                return std::nullopt;
            }

            const std::optional<std::string>& storedPath{ analysis->getSkeletonVideoPath() };
            if (!storedPath || storedPath->empty())
            {
                LIFTLENS_LOG(API, DEBUG, "Analysis " << id.value() << " has no skeleton video");
                return std::nullopt;
            }

            skeletonVideoPath = *storedPath;
        }

        if (skeletonVideoPath.is_relative())
            skeletonVideoPath = _videoStoragePath / skeletonVideoPath;

        return skeletonVideoPath;
    }
} // namespace liftlens::api
