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
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <gtest/gtest.h>
#include <Wt/Dbo/backend/Sqlite3.h>

#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Analysis.hpp"

namespace liftlens::db::tests
{
    // Database in a temporary file, removed on destruction
    // Schema and rows go through a connection of its own, as the ingestion service does
    class TmpDatabase final
    {
    public:
        TmpDatabase();
        ~TmpDatabase();
        TmpDatabase(const TmpDatabase&) = delete;
        TmpDatabase& operator=(const TmpDatabase&) = delete;

        IDb& getDb() { return *_db; }
        void executeSql(std::string_view statement);

    private:
        void removeDbFiles();

        const std::filesystem::path _dbPath;
        std::unique_ptr<IDb> _db;
        std::unique_ptr<Wt::Dbo::backend::Sqlite3> _writeConnection;
    };

    // Row inserted by the ingestion service, removed on destruction
    class [[nodiscard]] ScopedAnalysis
    {
    public:
        ScopedAnalysis(TmpDatabase& db, AnalysisId id, std::optional<std::string_view> skeletonVideoPath, std::optional<std::string_view> videoPath = std::nullopt);
        ~ScopedAnalysis();

        ScopedAnalysis(const ScopedAnalysis&) = delete;
        ScopedAnalysis(ScopedAnalysis&&) = delete;
        ScopedAnalysis& operator=(const ScopedAnalysis&) = delete;
        ScopedAnalysis& operator=(ScopedAnalysis&&) = delete;

        AnalysisId getId() const { return _id; }

    private:
        TmpDatabase& _db;
        const AnalysisId _id;
    };

    // Shared by all the tests of the executable: sessions are per thread
    class DatabaseFixture : public ::testing::Test
    {
    public:
        static void SetUpTestSuite();
        static void TearDownTestSuite();

    protected:
        // rows must not leak from one test to another
        void TearDown() override;

    private:
        static inline std::unique_ptr<TmpDatabase> _tmpDb{};

    public:
        TmpDatabase& tmpDb{ *_tmpDb };
        db::Session session{ _tmpDb->getDb() };
    };
} // namespace liftlens::db::tests
