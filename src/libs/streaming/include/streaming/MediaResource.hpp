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

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "core/TaggedType.hpp"

namespace liftlens::streaming
{
    using MediaId = core::TaggedType<struct MediaIdTag, long long>;

    // Stored media, read-only from the streaming point of view
    struct MediaResource
    {
        MediaId id;
        std::filesystem::path path;
        std::uint64_t size{};
        std::string mimeType;
    };

    // Maps a media id to its storage location
    class IMediaResolver
    {
    public:
        virtual ~IMediaResolver() = default;

        // std::nullopt if the id is unknown or has no stored file
        virtual std::optional<std::filesystem::path> resolve(MediaId id) = 0;
    };

    // std::nullopt if the id cannot be resolved or if the backing file is not there
    // The mime type is deduced from the file extension, or defaultMimeType if unknown
    [[nodiscard]] std::optional<MediaResource> lookupMediaResource(IMediaResolver& resolver, MediaId id, std::string_view defaultMimeType);
} // namespace liftlens::streaming
