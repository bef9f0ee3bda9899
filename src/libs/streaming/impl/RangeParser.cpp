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

#include "streaming/RangeParser.hpp"

#include <ostream>

#include "core/String.hpp"

namespace liftlens::streaming
{
    namespace
    {
        constexpr std::string_view bytesUnitPrefix{ "bytes=" };
        constexpr std::string_view whitespaces{ " \t" };

        std::optional<ByteRangeRequest> parseRangeSpecifier(std::string_view specifier)
        {
            const std::string_view::size_type dashPos{ specifier.find('-') };
            if (dashPos == std::string_view::npos)
                return std::nullopt;

            const std::string_view firstBytePart{ specifier.substr(0, dashPos) };
            const std::string_view lastBytePart{ specifier.substr(dashPos + 1) };

            if (firstBytePart.empty())
            {
                const std::optional<std::uint64_t> suffixLength{ core::stringUtils::readAs<std::uint64_t>(lastBytePart) };
                if (!suffixLength)
                    return std::nullopt;

                return SuffixByteRange{ *suffixLength };
            }

            const std::optional<std::uint64_t> firstByte{ core::stringUtils::readAs<std::uint64_t>(firstBytePart) };
            if (!firstByte)
                return std::nullopt;

            if (lastBytePart.empty())
                return OpenEndedByteRange{ *firstByte };

            const std::optional<std::uint64_t> lastByte{ core::stringUtils::readAs<std::uint64_t>(lastBytePart) };
            if (!lastByte || *lastByte < *firstByte)
                return std::nullopt;

            return ExplicitByteRange{ *firstByte, *lastByte };
        }
    } // namespace

    std::optional<ByteRangeRequest> parseRangeHeader(std::string_view headerValue)
    {
        headerValue = core::stringUtils::stringTrim(headerValue, whitespaces);
        if (!core::stringUtils::stringCaseInsensitiveStartsWith(headerValue, bytesUnitPrefix))
            return std::nullopt;

        headerValue.remove_prefix(bytesUnitPrefix.size());

        // only the first specifier is honored (empty list elements are not specifiers)
        for (std::string_view specifier : core::stringUtils::splitString(headerValue, ','))
        {
            specifier = core::stringUtils::stringTrim(specifier, whitespaces);
            if (!specifier.empty())
                return parseRangeSpecifier(specifier);
        }

        return std::nullopt;
    }

    std::ostream& operator<<(std::ostream& os, const ByteRangeRequest& range)
    {
        if (const auto* explicitRange{ std::get_if<ExplicitByteRange>(&range) })
            os << explicitRange->firstByte << "-" << explicitRange->lastByte;
        else if (const auto* openEndedRange{ std::get_if<OpenEndedByteRange>(&range) })
            os << openEndedRange->firstByte << "-";
        else if (const auto* suffixRange{ std::get_if<SuffixByteRange>(&range) })
            os << "-" << suffixRange->length;

        return os;
    }
} // namespace liftlens::streaming
