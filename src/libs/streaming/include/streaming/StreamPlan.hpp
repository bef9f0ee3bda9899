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
#include <optional>
#include <string>
#include <vector>

#include "streaming/RangeParser.hpp"

namespace liftlens::streaming
{
    struct HttpHeader
    {
        std::string name;
        std::string value;

        bool operator==(const HttpHeader&) const = default;
    };

    struct StreamPlan
    {
        enum class Status
        {
            Full,           // 200
            Partial,        // 206
            NotSatisfiable, // 416
        };

        Status status{ Status::Full };
        std::uint64_t firstByte{};
        std::uint64_t beyondLastByte{};
        std::uint64_t totalSize{};

        bool isPartial() const { return status == Status::Partial; }
        bool isSatisfiable() const { return status != Status::NotSatisfiable; }

        int getHttpStatus() const;
        std::uint64_t getLength() const { return beyondLastByte - firstByte; }
        // Only meaningful if getLength() > 0
        std::uint64_t getLastByte() const { return beyondLastByte - 1; }

        // Headers to be sent along with the status, except Content-Length (see getLength())
        std::vector<HttpHeader> getHeaders() const;
    };

    // Resolves the requested range against the resource size
    // A range that starts at or beyond the end of the resource is not satisfiable
    [[nodiscard]] StreamPlan planStream(std::uint64_t totalSize, const std::optional<ByteRangeRequest>& range);
} // namespace liftlens::streaming
