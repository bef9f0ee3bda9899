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

#include "database/Session.hpp"

#include "database/Types.hpp"
#include "database/objects/Analysis.hpp"

#include "Db.hpp"

namespace liftlens::db
{
    Session::Session(IDb& db)
        : _db{ db }
    {
        _session.setConnectionPool(static_cast<Db&>(_db).getConnectionPool());

        _session.mapClass<Analysis>("analyses");
    }

    ReadTransaction Session::createReadTransaction()
    {
        return ReadTransaction{ *this };
    }

    void Session::checkReadTransaction() const
    {
        if (_activeReadTransactions == 0)
            throw Exception{ "No active transaction" };
    }
} // namespace liftlens::db
