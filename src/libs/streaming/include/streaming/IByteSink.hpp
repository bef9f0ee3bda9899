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
#include <span>
#include <system_error>

namespace liftlens::streaming
{
    class IByteSink
    {
    public:
        virtual ~IByteSink() = default;

        // Writes the whole buffer, may block
        // Returns the reason why the data could not be written, if any
        [[nodiscard]] virtual std::error_code write(std::span<const std::byte> data) = 0;
    };
} // namespace liftlens::streaming
