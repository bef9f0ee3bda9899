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

#include <iosfwd>
#include <system_error>

namespace liftlens::streaming
{
    enum class FailureKind
    {
        BenignDisconnect, // peer closed or reset the connection, expected when seeking
        RealFailure,
    };

    // Relies on the error condition only, never on the error message
    [[nodiscard]] FailureKind classifyFailure(std::error_code ec);

    std::ostream& operator<<(std::ostream& os, FailureKind kind);
} // namespace liftlens::streaming
