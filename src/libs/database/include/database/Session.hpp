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

#include <Wt/Dbo/Session.h>

#include "database/Transaction.hpp"

namespace liftlens::db
{
    class IDb;

    // Not thread safe, see IDb::getTLSSession
    class Session
    {
    public:
        Session(IDb& db);
        ~Session() = default;
        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        [[nodiscard]] ReadTransaction createReadTransaction();

        // Throws db::Exception if no transaction is active
        void checkReadTransaction() const;

        Wt::Dbo::Session* getDboSession() { return &_session; }
        IDb& getDb() { return _db; }

    private:
        friend class ReadTransaction;

        IDb& _db;
        Wt::Dbo::Session _session;
        std::size_t _activeReadTransactions{};
    };
} // namespace liftlens::db
