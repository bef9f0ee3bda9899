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

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "streaming/MediaResource.hpp"

namespace liftlens::api
{
    // Outcome of the checks made before any byte is sent
    struct RequestDispatch
    {
        int status{ 200 };
        std::vector<std::pair<std::string_view, std::string_view>> headers;

        // set only if status is 200
        std::optional<streaming::MediaResource> resource;
        bool bodyRequested{};
    };

    // Checks the method, parses the analysis id and looks up the media
    // Database errors end up in a 500
    RequestDispatch dispatchRequest(std::size_t requestId, std::string_view method, std::string_view idParam, streaming::IMediaResolver& resolver, std::string_view defaultMimeType);
} // namespace liftlens::api
