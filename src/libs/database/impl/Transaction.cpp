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

#include "database/Transaction.hpp"

#include "database/Session.hpp"

namespace liftlens::db
{
    ReadTransaction::ReadTransaction(Session& session)
        : _session{ session }
        , _transaction{ *session.getDboSession() }
    {
        ++_session._activeReadTransactions;
    }

    ReadTransaction::~ReadTransaction()
    {
        --_session._activeReadTransactions;
    }
} // namespace liftlens::db
