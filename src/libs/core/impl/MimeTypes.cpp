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

#include "core/MimeTypes.hpp"

#include <unordered_map>

#include "core/String.hpp"

namespace liftlens::core
{
    std::string_view getMimeType(const std::filesystem::path& fileExtension)
    {
        static const std::unordered_map<std::string, std::string_view> entries{
            { ".avi", "video/x-msvideo" },
            { ".m4v", "video/mp4" },
            { ".mkv", "video/x-matroska" },
            { ".mov", "video/quicktime" },
            { ".mp4", "video/mp4" },
            { ".mpeg", "video/mpeg" },
            { ".mpg", "video/mpeg" },
            { ".ogv", "video/ogg" },
            { ".webm", "video/webm" },
        };

        auto it{ entries.find(core::stringUtils::stringToLower(fileExtension.native())) };
        if (it == std::cend(entries))
            return "";

        return it->second;
    }
} // namespace liftlens::core
