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

#include "SkeletonVideoResourceConfig.hpp"

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "streaming/ChunkedStreamer.hpp"

namespace liftlens::api
{
    namespace
    {
        std::size_t readChunkSize(core::IConfig& config)
        {
            const unsigned long chunkSize{ config.getULong("stream-chunk-size", streaming::ChunkedStreamer::defaultChunkSize) };
            if (chunkSize == 0)
                throw core::LiftLensException{ "Invalid config value for 'stream-chunk-size': must be greater than 0" };

            return chunkSize;
        }
    } // namespace

    SkeletonVideoResourceConfig readSkeletonVideoResourceConfig(core::IConfig& config)
    {
        return SkeletonVideoResourceConfig{
            .videoStoragePath = config.getPath("video-storage-path", "/var/liftlens/videos"),
            .defaultMimeType = std::string{ config.getString("skeleton-video-mime-type", "video/mp4") },
            .chunkSize = readChunkSize(config),
            .maxStreamDuration = std::chrono::seconds{ config.getULong("stream-max-duration", 3600) },
        };
    }
} // namespace liftlens::api
