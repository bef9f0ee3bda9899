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

#include "Common.hpp"

#include <initializer_list>
#include <string>
#include <unistd.h>

namespace liftlens::db::tests
{
    namespace
    {
        std::string toSqlValue(std::optional<std::string_view> value)
        {
            if (!value)
                return "NULL";

            std::string res{ "'" };
            for (char c : *value)
            {
                if (c == '\'')
                    res += '\'';
                res += c;
            }
            res += "'";

            return res;
        }
    } // namespace

    ScopedAnalysis::ScopedAnalysis(TmpDatabase& db, AnalysisId id, std::optional<std::string_view> skeletonVideoPath, std::optional<std::string_view> videoPath)
        : _db{ db }
        , _id{ id }
    {
        _db.executeSql("INSERT INTO analyses (id, exercise_id, muscle_group, overall_score, video_path, skeleton_video_path) VALUES ("
                       + _id.toString() + ", 'squat', 'legs', 'good', " + toSqlValue(videoPath) + ", " + toSqlValue(skeletonVideoPath) + ")");
    }

    ScopedAnalysis::~ScopedAnalysis()
    {
        _db.executeSql("DELETE FROM analyses WHERE id = " + _id.toString());
    }

    TmpDatabase::TmpDatabase()
        : _dbPath{ std::filesystem::temp_directory_path() / ("liftlens-test-" + std::to_string(::getpid()) + ".db") }
    {
        removeDbFiles();
        _db = createDb(_dbPath, 2);

        _writeConnection = std::make_unique<Wt::Dbo::backend::Sqlite3>(_dbPath.string());
        _writeConnection->executeSql("PRAGMA busy_timeout=5000");
    }

    TmpDatabase::~TmpDatabase()
    {
        _writeConnection.reset();
        _db.reset();
        removeDbFiles();
    }

    void TmpDatabase::executeSql(std::string_view statement)
    {
        _writeConnection->executeSql(std::string{ statement });
    }

    void TmpDatabase::removeDbFiles()
    {
        for (const char* suffix : { "", "-wal", "-shm" })
            std::filesystem::remove(_dbPath.string() + suffix);
    }

    void DatabaseFixture::SetUpTestSuite()
    {
        _tmpDb = std::make_unique<TmpDatabase>();

        // schema as created by the ingestion service
        _tmpDb->executeSql("CREATE TABLE analyses ("
                           "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                           "exercise_id VARCHAR(50) NOT NULL,"
                           "muscle_group VARCHAR(50) NOT NULL,"
                           "overall_score VARCHAR(20) NOT NULL,"
                           "video_path VARCHAR(500),"
                           "skeleton_video_path VARCHAR(500),"
                           "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP)");
    }

    void DatabaseFixture::TearDownTestSuite()
    {
        _tmpDb.reset();
    }

    void DatabaseFixture::TearDown()
    {
        auto transaction{ session.createReadTransaction() };
        EXPECT_EQ(Analysis::getCount(session), 0);
    }
} // namespace liftlens::db::tests
