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
#include <string_view>

namespace liftlens::streaming
{
    class IByteSink;

    // HTTP response being built, headers must be set before any body data
    class IResponseWriter
    {
    public:
        virtual ~IResponseWriter() = default;

        virtual void setStatus(int status) = 0;
        virtual void setContentLength(std::uint64_t length) = 0;
        virtual void setMimeType(std::string_view mimeType) = 0;
        virtual void addHeader(std::string_view name, std::string_view value) = 0;

        virtual IByteSink& getBodySink() = 0;
    };
} // namespace liftlens::streaming
