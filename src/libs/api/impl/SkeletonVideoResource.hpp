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

#pragma once

#include <memory>

#include <Wt/Http/Request.h>
#include <Wt/Http/Response.h>
#include <Wt/WResource.h>

#include "SkeletonVideoResourceConfig.hpp"

namespace liftlens::db
{
    class IDb;
}

namespace liftlens::streaming
{
    class MediaRequestHandler;
}

namespace liftlens::api
{
    class SkeletonVideoResource final : public Wt::WResource
    {
    public:
        SkeletonVideoResource(db::IDb& db);
        ~SkeletonVideoResource() override;
        SkeletonVideoResource(const SkeletonVideoResource&) = delete;
        SkeletonVideoResource& operator=(const SkeletonVideoResource&) = delete;

    private:
        void handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response) override;
        void handleAbort(const Wt::Http::Request& request) override;

        // nullptr if the response is already complete (errors)
        std::shared_ptr<streaming::MediaRequestHandler> createRequestHandler(const Wt::Http::Request& request, Wt::Http::Response& response);

        const SkeletonVideoResourceConfig _config;
        db::IDb& _db;
    };
} // namespace liftlens::api
