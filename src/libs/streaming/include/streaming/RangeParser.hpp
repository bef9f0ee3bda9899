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
#include <iosfwd>
#include <optional>
#include <string_view>
#include <variant>

namespace liftlens::streaming
{
    // "first-last", both inclusive
    struct ExplicitByteRange
    {
        std::uint64_t firstByte{};
        std::uint64_t lastByte{};

        bool operator==(const ExplicitByteRange&) const = default;
    };

    // "first-", up to the end of the resource
    struct OpenEndedByteRange
    {
        std::uint64_t firstByte{};

        bool operator==(const OpenEndedByteRange&) const = default;
    };

    // "-length", the last bytes of the resource
    struct SuffixByteRange
    {
        std::uint64_t length{};

        bool operator==(const SuffixByteRange&) const = default;
    };

    using ByteRangeRequest = std::variant<ExplicitByteRange, OpenEndedByteRange, SuffixByteRange>;

    // Parses the value of a "Range" header (empty if the header is absent)
    // Only the first range specifier is returned, the following ones are ignored
    // Anything that cannot be understood gives std::nullopt, meaning the full content must be sent
    [[nodiscard]] std::optional<ByteRangeRequest> parseRangeHeader(std::string_view headerValue);

    std::ostream& operator<<(std::ostream& os, const ByteRangeRequest& range);
} // namespace liftlens::streaming
