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

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Wt
{
    class WDateTime;
} // namespace Wt

namespace liftlens::core::stringUtils
{
    [[nodiscard]] std::vector<std::string_view> splitString(std::string_view string, char separator);

    [[nodiscard]] std::string_view stringTrim(std::string_view str, std::string_view whitespaces = " \t\r");

    [[nodiscard]] std::string stringToLower(std::string_view str);

    [[nodiscard]] bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB);
    [[nodiscard]] bool stringCaseInsensitiveStartsWith(std::string_view str, std::string_view prefix);

    // Digits only, with an optional leading '-' for signed types
    template<typename T>
    [[nodiscard]] std::optional<T> readAs(std::string_view str)
    {
        static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>);

        if (str.empty())
            return std::nullopt;

        T res{};
        const char* const end{ str.data() + str.size() };
        const auto [ptr, ec]{ std::from_chars(str.data(), end, res) };
        if (ec != std::errc{} || ptr != end)
            return std::nullopt;

        return res;
    }

    [[nodiscard]] std::string toISO8601String(const Wt::WDateTime& dateTime);
} // namespace liftlens::core::stringUtils
