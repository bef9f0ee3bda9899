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

#include <Wt/Dbo/Transaction.h>

namespace liftlens::db
{
    class Session;

    // Registered on its session as long as it lives
    // Rows are written by the ingestion service only, sqlite's WAL mode lets it run concurrently
    class ReadTransaction
    {
    public:
        ~ReadTransaction();
        ReadTransaction(const ReadTransaction&) = delete;
        ReadTransaction& operator=(const ReadTransaction&) = delete;

    private:
        friend class Session;
        ReadTransaction(Session& session);

        Session& _session;
        Wt::Dbo::Transaction _transaction;
    };
} // namespace liftlens::db
