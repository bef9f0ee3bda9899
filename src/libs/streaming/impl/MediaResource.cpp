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

#include "streaming/MediaResource.hpp"

#include "core/ILogger.hpp"
#include "core/MimeTypes.hpp"

namespace liftlens::streaming
{
    std::optional<MediaResource> lookupMediaResource(IMediaResolver& resolver, MediaId id, std::string_view defaultMimeType)
    {
        std::optional<std::filesystem::path> path{ resolver.resolve(id) };
        if (!path)
        {
            LIFTLENS_LOG(STREAMING, DEBUG, "Media " << id.value() << " not found");
            return std::nullopt;
        }

        std::error_code ec;
        const std::filesystem::file_status status{ std::filesystem::status(*path, ec) };
        if (ec || !std::filesystem::is_regular_file(status))
        {
            LIFTLENS_LOG(STREAMING, DEBUG, "Media " << id.value() << ": file " << *path << " not found" << (ec ? ": " + ec.message() : ""));
            return std::nullopt;
        }

        const std::uintmax_t fileSize{ std::filesystem::file_size(*path, ec) };
        if (ec)
        {
            LIFTLENS_LOG(STREAMING, ERROR, "Media " << id.value() << ": cannot get size of " << *path << ": " << ec.message());
            return std::nullopt;
        }

        MediaResource resource;
        resource.id = id;
        resource.path = std::move(*path);
        resource.size = fileSize;
        resource.mimeType = core::getMimeType(resource.path.extension());
        if (resource.mimeType.empty())
            resource.mimeType = defaultMimeType;

        LIFTLENS_LOG(STREAMING, DEBUG, "Media " << id.value() << ": file " << resource.path << ", size = " << resource.size << ", mimeType = '" << resource.mimeType << "'");

        return resource;
    }
} // namespace liftlens::streaming
