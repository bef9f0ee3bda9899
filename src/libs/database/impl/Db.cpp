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

#include "Db.hpp"

#include <array>
#include <chrono>
#include <string_view>

#include <Wt/Dbo/FixedSqlConnectionPool.h>
#include <Wt/Dbo/backend/Sqlite3.h>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "database/Session.hpp"
#include "database/Types.hpp"

namespace liftlens::db
{
    namespace
    {
        // the ingestion service writes in the same file
        constexpr std::array<std::string_view, 3> connectionPragmas{
            "PRAGMA journal_mode=WAL",
            "PRAGMA synchronous=normal",
            "PRAGMA busy_timeout=5000",
        };

        class Connection final : public Wt::Dbo::backend::Sqlite3
        {
        public:
            Connection(const std::filesystem::path& dbPath)
                : Wt::Dbo::backend::Sqlite3{ dbPath.string() }
            {
                applyPragmas();
            }

            Connection(const Connection& other)
                : Wt::Dbo::backend::Sqlite3{ other }
            {
                applyPragmas();
            }

            Connection& operator=(const Connection&) = delete;

        private:
            std::unique_ptr<SqlConnection> clone() const override
            {
                return std::make_unique<Connection>(*this);
            }

            void applyPragmas()
            {
                for (std::string_view pragma : connectionPragmas)
                    executeSql(std::string{ pragma });
            }
        };

        bool getShowQueries()
        {
            // config may not be set, in unit tests
            core::IConfig* config{ core::Service<core::IConfig>::get() };
            return config && config->getBool("db-show-queries", false);
        }
    } // namespace

    std::unique_ptr<IDb> createDb(const std::filesystem::path& dbPath, std::size_t connectionCount)
    {
        return std::make_unique<Db>(dbPath, connectionCount);
    }

    Db::Db(const std::filesystem::path& dbPath, std::size_t connectionCount)
    {
        if (connectionCount == 0)
            throw Exception{ "Connection count must be greater than 0" };

        LIFTLENS_LOG(DB, INFO, "Opening database " << dbPath << " with " << connectionCount << " connection(s)");

        auto connection{ std::make_unique<Connection>(dbPath) };
        connection->setProperty("show-queries", getShowQueries() ? "true" : "false");

        auto connectionPool{ std::make_unique<Wt::Dbo::FixedSqlConnectionPool>(std::move(connection), static_cast<int>(connectionCount)) };
        connectionPool->setTimeout(std::chrono::seconds{ 10 });
        _connectionPool = std::move(connectionPool);

        withConnection([](Wt::Dbo::SqlConnection& connection) {
            connection.executeSql("PRAGMA temp_store=MEMORY");
        });

        checkSchema();
    }

    Db::~Db() = default;

    Session& Db::getTLSSession()
    {
        // a single Db instance is expected per process
        static thread_local Session* tlsSession{};

        if (!tlsSession)
        {
            auto session{ std::make_unique<Session>(*this) };
            tlsSession = session.get();

            const std::scoped_lock lock{ _sessionsMutex };
            _sessions.push_back(std::move(session));
        }

        return *tlsSession;
    }

    void Db::withConnection(const std::function<void(Wt::Dbo::SqlConnection&)>& func)
    {
        std::unique_ptr<Wt::Dbo::SqlConnection> connection{ _connectionPool->getConnection() };
        try
        {
            func(*connection);
        }
        catch (...)
        {
            _connectionPool->returnConnection(std::move(connection));
            throw;
        }
        _connectionPool->returnConnection(std::move(connection));
    }

    void Db::checkSchema()
    {
        int tableCount{};
        withConnection([&](Wt::Dbo::SqlConnection& connection) {
            auto statement{ connection.prepareStatement("SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = 'analyses'") };
            statement->execute();
            if (statement->nextRow())
                statement->getResult(0, &tableCount);
        });

        // created later by the ingestion service, lookups will fail until then
        LIFTLENS_LOG_IF(DB, WARNING, tableCount == 0, "Table 'analyses' not found");
    }
} // namespace liftlens::db
