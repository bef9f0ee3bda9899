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

#include "streaming/DisconnectClassifier.hpp"

#include <ostream>

namespace liftlens::streaming
{
    FailureKind classifyFailure(std::error_code ec)
    {
        if (ec == std::errc::broken_pipe
            || ec == std::errc::connection_reset
            || ec == std::errc::connection_aborted
            || ec == std::errc::not_connected)
        {
            return FailureKind::BenignDisconnect;
        }

        return FailureKind::RealFailure;
    }

    std::ostream& operator<<(std::ostream& os, FailureKind kind)
    {
        switch (kind)
        {
        case FailureKind::BenignDisconnect:
            return os << "benign disconnect";
        case FailureKind::RealFailure:
            return os << "real failure";
        }

        return os;
    }
} // namespace liftlens::streaming
