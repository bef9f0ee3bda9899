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

#include <gtest/gtest.h>

#include "streaming/StreamPlan.hpp"

namespace liftlens::streaming::tests
{
    namespace
    {
        std::optional<std::string> getHeader(const StreamPlan& plan, std::string_view name)
        {
            for (const HttpHeader& header : plan.getHeaders())
            {
                if (header.name == name)
                    return header.value;
            }

            return std::nullopt;
        }
    } // namespace

    TEST(StreamPlanner, noRange)
    {
        const StreamPlan plan{ planStream(1000, std::nullopt) };
        EXPECT_EQ(plan.status, StreamPlan::Status::Full);
        EXPECT_FALSE(plan.isPartial());
        EXPECT_EQ(plan.getHttpStatus(), 200);
        EXPECT_EQ(plan.firstByte, 0);
        EXPECT_EQ(plan.getLastByte(), 999);
        EXPECT_EQ(plan.getLength(), 1000);
        EXPECT_EQ(plan.getHeaders(), (std::vector<HttpHeader>{ { "Accept-Ranges", "bytes" } }));
    }

    TEST(StreamPlanner, explicitRange)
    {
        const StreamPlan plan{ planStream(1000, ExplicitByteRange{ 500, 599 }) };
        EXPECT_TRUE(plan.isPartial());
        EXPECT_EQ(plan.getHttpStatus(), 206);
        EXPECT_EQ(plan.firstByte, 500);
        EXPECT_EQ(plan.getLastByte(), 599);
        EXPECT_EQ(plan.getLength(), 100);
        EXPECT_EQ(getHeader(plan, "Content-Range"), "bytes 500-599/1000");
        EXPECT_EQ(getHeader(plan, "Accept-Ranges"), "bytes");
    }

    TEST(StreamPlanner, explicitRangeClipped)
    {
        const StreamPlan plan{ planStream(1000, ExplicitByteRange{ 900, 5000 }) };
        EXPECT_EQ(plan.getHttpStatus(), 206);
        EXPECT_EQ(plan.firstByte, 900);
        EXPECT_EQ(plan.getLastByte(), 999);
        EXPECT_EQ(plan.getLength(), 100);
        EXPECT_EQ(getHeader(plan, "Content-Range"), "bytes 900-999/1000");
    }

    TEST(StreamPlanner, explicitRangeHugeLastByte)
    {
        const StreamPlan plan{ planStream(10, ExplicitByteRange{ 0, 18446744073709551615ULL }) };
        EXPECT_EQ(plan.getHttpStatus(), 206);
        EXPECT_EQ(plan.getLength(), 10);
        EXPECT_EQ(getHeader(plan, "Content-Range"), "bytes 0-9/10");
    }

    TEST(StreamPlanner, openEndedRange)
    {
        const StreamPlan plan{ planStream(1000, OpenEndedByteRange{ 0 }) };
        EXPECT_EQ(plan.getHttpStatus(), 206);
        EXPECT_EQ(plan.firstByte, 0);
        EXPECT_EQ(plan.getLastByte(), 999);
        EXPECT_EQ(plan.getLength(), 1000);
        EXPECT_EQ(getHeader(plan, "Content-Range"), "bytes 0-999/1000");
    }

    TEST(StreamPlanner, suffixRange)
    {
        {
            const StreamPlan plan{ planStream(1000, SuffixByteRange{ 100 }) };
            EXPECT_EQ(plan.getHttpStatus(), 206);
            EXPECT_EQ(plan.firstByte, 900);
            EXPECT_EQ(plan.getLastByte(), 999);
            EXPECT_EQ(getHeader(plan, "Content-Range"), "bytes 900-999/1000");
        }

        {
            // longer than the resource
            const StreamPlan plan{ planStream(1000, SuffixByteRange{ 5000 }) };
            EXPECT_EQ(plan.getHttpStatus(), 206);
            EXPECT_EQ(plan.firstByte, 0);
            EXPECT_EQ(plan.getLength(), 1000);
            EXPECT_EQ(getHeader(plan, "Content-Range"), "bytes 0-999/1000");
        }
    }

    TEST(StreamPlanner, notSatisfiable)
    {
        const std::pair<std::uint64_t, ByteRangeRequest> cases[]{
            { 1000, ExplicitByteRange{ 1000, 1000 } },
            { 1000, ExplicitByteRange{ 2000, 3000 } },
            { 1000, OpenEndedByteRange{ 1000 } },
            { 1000, SuffixByteRange{ 0 } },
            { 0, OpenEndedByteRange{ 0 } },
            { 0, ExplicitByteRange{ 0, 10 } },
            { 0, SuffixByteRange{ 10 } },
        };

        for (const auto& [size, range] : cases)
        {
            const StreamPlan plan{ planStream(size, range) };
            EXPECT_FALSE(plan.isSatisfiable()) << "range = " << range << ", size = " << size;
            EXPECT_EQ(plan.getHttpStatus(), 416);
            EXPECT_EQ(plan.getLength(), 0);
            EXPECT_EQ(getHeader(plan, "Content-Range"), "bytes */" + std::to_string(size));
            EXPECT_EQ(getHeader(plan, "Accept-Ranges"), "bytes");
        }
    }

    TEST(StreamPlanner, emptyResource)
    {
        const StreamPlan plan{ planStream(0, std::nullopt) };
        EXPECT_EQ(plan.getHttpStatus(), 200);
        EXPECT_EQ(plan.getLength(), 0);
        EXPECT_FALSE(getHeader(plan, "Content-Range"));
    }

    TEST(StreamPlanner, planInvariants)
    {
        const std::uint64_t sizes[]{ 1, 2, 100, 1000, 1'000'000 };
        const std::uint64_t offsets[]{ 0, 1, 99, 500, 999, 999'999 };

        for (std::uint64_t size : sizes)
        {
            std::vector<std::optional<ByteRangeRequest>> ranges{ std::nullopt };
            for (std::uint64_t first : offsets)
            {
                ranges.push_back(OpenEndedByteRange{ first });
                ranges.push_back(SuffixByteRange{ first + 1 });
                for (std::uint64_t last : offsets)
                {
                    if (last >= first)
                        ranges.push_back(ExplicitByteRange{ first, last });
                }
            }

            for (const std::optional<ByteRangeRequest>& range : ranges)
            {
                const StreamPlan plan{ planStream(size, range) };
                if (!plan.isSatisfiable())
                    continue;

                EXPECT_LE(plan.firstByte, plan.getLastByte());
                EXPECT_LE(plan.getLastByte(), size - 1);
                EXPECT_EQ(plan.getLength(), plan.getLastByte() - plan.firstByte + 1);
                EXPECT_EQ(plan.getHttpStatus(), plan.isPartial() ? 206 : 200);
                EXPECT_EQ(plan.isPartial(), range.has_value());
            }
        }
    }
} // namespace liftlens::streaming::tests
