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

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unistd.h>

#include <gtest/gtest.h>
#include <Wt/Dbo/Exception.h>

#include "RequestDispatch.hpp"

namespace liftlens::api::tests
{
    namespace
    {
        class FakeMediaResolver final : public streaming::IMediaResolver
        {
        public:
            std::optional<std::filesystem::path> path;
            bool throwDboException{};
            std::size_t resolveCount{};

        private:
            std::optional<std::filesystem::path> resolve(streaming::MediaId) override
            {
                ++resolveCount;
                if (throwDboException)
                    throw Wt::Dbo::Exception{ "database is locked" };
                return path;
            }
        };

        class ScopedVideoFile
        {
        public:
            ScopedVideoFile()
                : _path{ std::filesystem::temp_directory_path() / ("liftlens-dispatch-" + std::to_string(::getpid()) + ".mp4") }
            {
                std::ofstream{ _path, std::ios::binary } << "0123456789";
            }
            ~ScopedVideoFile()
            {
                std::filesystem::remove(_path);
            }
            ScopedVideoFile(const ScopedVideoFile&) = delete;
            ScopedVideoFile& operator=(const ScopedVideoFile&) = delete;

            const std::filesystem::path& getPath() const { return _path; }

        private:
            const std::filesystem::path _path;
        };
    } // namespace

    TEST(RequestDispatch, get)
    {
        const ScopedVideoFile file;
        FakeMediaResolver resolver;
        resolver.path = file.getPath();

        const RequestDispatch dispatch{ dispatchRequest(0, "GET", "42", resolver, "video/mp4") };
        EXPECT_EQ(dispatch.status, 200);
        EXPECT_TRUE(dispatch.headers.empty());
        ASSERT_TRUE(dispatch.resource);
        EXPECT_EQ(dispatch.resource->id, streaming::MediaId{ 42 });
        EXPECT_EQ(dispatch.resource->size, 10);
        EXPECT_EQ(dispatch.resource->mimeType, "video/mp4");
        EXPECT_TRUE(dispatch.bodyRequested);
    }

    TEST(RequestDispatch, head)
    {
        const ScopedVideoFile file;
        FakeMediaResolver resolver;
        resolver.path = file.getPath();

        const RequestDispatch dispatch{ dispatchRequest(0, "HEAD", "42", resolver, "video/mp4") };
        EXPECT_EQ(dispatch.status, 200);
        ASSERT_TRUE(dispatch.resource);
        EXPECT_FALSE(dispatch.bodyRequested);
    }

    TEST(RequestDispatch, methodNotAllowed)
    {
        for (std::string_view method : { "POST", "PUT", "DELETE", "OPTIONS", "get" })
        {
            FakeMediaResolver resolver;
            const RequestDispatch dispatch{ dispatchRequest(0, method, "42", resolver, "video/mp4") };

            EXPECT_EQ(dispatch.status, 405) << "method = " << method;
            ASSERT_EQ(dispatch.headers.size(), 1);
            EXPECT_EQ(dispatch.headers.front().first, "Allow");
            EXPECT_EQ(dispatch.headers.front().second, "GET, HEAD");
            EXPECT_FALSE(dispatch.resource);
            EXPECT_EQ(resolver.resolveCount, 0);
        }
    }

    TEST(RequestDispatch, badId)
    {
        for (std::string_view id : { "", "abc", "12abc", "1.5", " 12", "99999999999999999999" })
        {
            FakeMediaResolver resolver;
            const RequestDispatch dispatch{ dispatchRequest(0, "GET", id, resolver, "video/mp4") };

            EXPECT_EQ(dispatch.status, 404) << "id = '" << id << "'";
            EXPECT_TRUE(dispatch.headers.empty());
            EXPECT_FALSE(dispatch.resource);
            EXPECT_EQ(resolver.resolveCount, 0);
        }
    }

    TEST(RequestDispatch, notFound)
    {
        FakeMediaResolver resolver;

        const RequestDispatch dispatch{ dispatchRequest(0, "GET", "42", resolver, "video/mp4") };
        EXPECT_EQ(dispatch.status, 404);
        EXPECT_FALSE(dispatch.resource);
        EXPECT_EQ(resolver.resolveCount, 1);

        // resolved, but nothing on disk
        resolver.path = std::filesystem::temp_directory_path() / "liftlens-dispatch-missing.mp4";
        EXPECT_EQ(dispatchRequest(0, "GET", "42", resolver, "video/mp4").status, 404);
    }

    TEST(RequestDispatch, databaseError)
    {
        FakeMediaResolver resolver;
        resolver.throwDboException = true;

        RequestDispatch dispatch;
        EXPECT_NO_THROW(dispatch = dispatchRequest(0, "GET", "42", resolver, "video/mp4"));
        EXPECT_EQ(dispatch.status, 500);
        EXPECT_TRUE(dispatch.headers.empty());
        EXPECT_FALSE(dispatch.resource);
    }
} // namespace liftlens::api::tests
