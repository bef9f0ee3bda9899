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

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <Wt/Dbo/SqlConnection.h>
#include <Wt/Dbo/SqlConnectionPool.h>

#include "database/IDb.hpp"

namespace liftlens::db
{
    class Db final : public IDb
    {
    public:
        Db(const std::filesystem::path& dbPath, std::size_t connectionCount);
        ~Db() override;
        Db(const Db&) = delete;
        Db& operator=(const Db&) = delete;

        Session& getTLSSession() override;

        Wt::Dbo::SqlConnectionPool& getConnectionPool() { return *_connectionPool; }

    private:
        // borrows a connection from the pool for the duration of func
        void withConnection(const std::function<void(Wt::Dbo::SqlConnection&)>& func);
        void checkSchema();

        std::unique_ptr<Wt::Dbo::SqlConnectionPool> _connectionPool;

        std::mutex _sessionsMutex;
        std::vector<std::unique_ptr<Session>> _sessions;
    };
} // namespace liftlens::db
