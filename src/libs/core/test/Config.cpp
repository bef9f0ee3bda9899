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

#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"

namespace liftlens::core::tests
{
    namespace
    {
        class ScopedConfigFile
        {
        public:
            ScopedConfigFile(std::string_view content)
                : _path{ std::filesystem::temp_directory_path() / ("liftlens_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".conf") }
            {
                std::ofstream ofs{ _path, std::ios::out | std::ios::trunc };
                ofs << content;
            }
            ~ScopedConfigFile() { std::filesystem::remove(_path); }

            ScopedConfigFile(const ScopedConfigFile&) = delete;
            ScopedConfigFile& operator=(const ScopedConfigFile&) = delete;

            const std::filesystem::path& getPath() const { return _path; }

        private:
            const std::filesystem::path _path;
        };
    } // namespace

    TEST(Config, values)
    {
        const ScopedConfigFile configFile{ R"(
listen-port = 5090;
stream-chunk-size = 131072;
stream-max-duration = 0;
log-min-severity = "debug";
video-storage-path = "/var/liftlens/skeleton_videos";
behind-reverse-proxy = true;
trusted-proxies = ( "10.0.0.1", "10.0.0.2" );
)" };

        auto config{ createConfig(configFile.getPath()) };

        EXPECT_EQ(config->getULong("listen-port", 5082), 5090);
        EXPECT_EQ(config->getULong("stream-chunk-size", 65536), 131072);
        EXPECT_EQ(config->getULong("stream-max-duration", 3600), 0);
        EXPECT_EQ(config->getString("log-min-severity", "info"), "debug");
        EXPECT_EQ(config->getPath("video-storage-path", ""), "/var/liftlens/skeleton_videos");
        EXPECT_TRUE(config->getBool("behind-reverse-proxy", false));

        std::vector<std::string> proxies;
        config->visitStrings("trusted-proxies", [&](std::string_view proxy) { proxies.emplace_back(proxy); }, { "127.0.0.1" });
        EXPECT_EQ(proxies, (std::vector<std::string>{ "10.0.0.1", "10.0.0.2" }));
    }

    TEST(Config, defaults)
    {
        const ScopedConfigFile configFile{ "listen-addr = \"0.0.0.0\";\n" };

        auto config{ createConfig(configFile.getPath()) };

        EXPECT_EQ(config->getULong("listen-port", 5082), 5082);
        EXPECT_EQ(config->getString("skeleton-video-mime-type", "video/mp4"), "video/mp4");
        EXPECT_EQ(config->getPath("log-file", ""), "");
        EXPECT_FALSE(config->getBool("db-show-queries", false));

        // wrong type also falls back to the default value
        EXPECT_EQ(config->getULong("listen-addr", 12), 12);

        std::vector<std::string> proxies;
        config->visitStrings("trusted-proxies", [&](std::string_view proxy) { proxies.emplace_back(proxy); }, { "127.0.0.1", "::1" });
        EXPECT_EQ(proxies, (std::vector<std::string>{ "127.0.0.1", "::1" }));
    }

    TEST(Config, parseError)
    {
        const ScopedConfigFile configFile{ "listen-port = ;\n" };

        EXPECT_THROW(createConfig(configFile.getPath()), LiftLensException);
    }

    TEST(Config, missingFile)
    {
        EXPECT_THROW(createConfig("/nonexistent/liftlens.conf"), LiftLensException);
    }
} // namespace liftlens::core::tests
