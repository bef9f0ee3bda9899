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

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace liftlens::core
{
    class IConfig;
}

namespace liftlens::api
{
    struct SkeletonVideoResourceConfig
    {
        std::filesystem::path videoStoragePath; // base of relative stored paths
        std::string defaultMimeType;
        std::size_t chunkSize;
        std::chrono::seconds maxStreamDuration; // 0 means unbounded
    };

    // Throws core::LiftLensException on invalid values
    SkeletonVideoResourceConfig readSkeletonVideoResourceConfig(core::IConfig& config);
} // namespace liftlens::api
