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

#include "streaming/StreamPlan.hpp"

#include <algorithm>

namespace liftlens::streaming
{
    namespace
    {
        StreamPlan createNotSatisfiablePlan(std::uint64_t totalSize)
        {
            StreamPlan plan;
            plan.status = StreamPlan::Status::NotSatisfiable;
            plan.totalSize = totalSize;
            return plan;
        }

        StreamPlan createPartialPlan(std::uint64_t totalSize, std::uint64_t firstByte, std::uint64_t beyondLastByte)
        {
            StreamPlan plan;
            plan.status = StreamPlan::Status::Partial;
            plan.totalSize = totalSize;
            plan.firstByte = firstByte;
            plan.beyondLastByte = beyondLastByte;
            return plan;
        }
    } // namespace

    int StreamPlan::getHttpStatus() const
    {
        switch (status)
        {
        case Status::Full:
            return 200;
        case Status::Partial:
            return 206;
        case Status::NotSatisfiable:
            return 416;
        }

        return 500;
    }

    std::vector<HttpHeader> StreamPlan::getHeaders() const
    {
        std::vector<HttpHeader> headers;

        headers.push_back({ "Accept-Ranges", "bytes" });
        if (status == Status::Partial)
            headers.push_back({ "Content-Range", "bytes " + std::to_string(firstByte) + "-" + std::to_string(getLastByte()) + "/" + std::to_string(totalSize) });
        else if (status == Status::NotSatisfiable)
            headers.push_back({ "Content-Range", "bytes */" + std::to_string(totalSize) });

        return headers;
    }

    StreamPlan planStream(std::uint64_t totalSize, const std::optional<ByteRangeRequest>& range)
    {
        if (!range)
        {
            StreamPlan plan;
            plan.status = StreamPlan::Status::Full;
            plan.totalSize = totalSize;
            plan.firstByte = 0;
            plan.beyondLastByte = totalSize;
            return plan;
        }

        if (const auto* suffixRange{ std::get_if<SuffixByteRange>(&*range) })
        {
            if (suffixRange->length == 0 || totalSize == 0)
                return createNotSatisfiablePlan(totalSize);

            const std::uint64_t firstByte{ suffixRange->length >= totalSize ? 0 : totalSize - suffixRange->length };
            return createPartialPlan(totalSize, firstByte, totalSize);
        }

        const std::uint64_t firstByte{ std::holds_alternative<ExplicitByteRange>(*range) ? std::get<ExplicitByteRange>(*range).firstByte : std::get<OpenEndedByteRange>(*range).firstByte };
        if (firstByte >= totalSize)
            return createNotSatisfiablePlan(totalSize);

        std::uint64_t beyondLastByte{ totalSize };
        if (const auto* explicitRange{ std::get_if<ExplicitByteRange>(&*range) })
            beyondLastByte = std::min(explicitRange->lastByte, totalSize - 1) + 1;

        return createPartialPlan(totalSize, firstByte, beyondLastByte);
    }
} // namespace liftlens::streaming
