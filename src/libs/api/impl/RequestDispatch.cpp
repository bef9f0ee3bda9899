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

#include "RequestDispatch.hpp"

#include <Wt/Dbo/Exception.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace liftlens::api
{
    RequestDispatch dispatchRequest(std::size_t requestId, std::string_view method, std::string_view idParam, streaming::IMediaResolver& resolver, std::string_view defaultMimeType)
    {
        RequestDispatch res;

        if (method != "GET" && method != "HEAD")
        {
            res.status = 405;
            res.headers.emplace_back("Allow", "GET, HEAD");
            return res;
        }

        const std::optional<long long> id{ core::stringUtils::readAs<long long>(idParam) };
        if (!id)
        {
            LIFTLENS_LOG(API, DEBUG, "Request " << requestId << ": bad analysis id '" << idParam << "'");
            res.status = 404;
            return res;
        }

        try
        {
            res.resource = streaming::lookupMediaResource(resolver, streaming::MediaId{ *id }, defaultMimeType);
        }
        catch (const Wt::Dbo::Exception& e)
        {
            LIFTLENS_LOG(API, ERROR, "Request " << requestId << ": database error: " << e.what());
            res.status = 500;
            return res;
        }

        if (!res.resource)
        {
            res.status = 404;
            return res;
        }

        res.bodyRequested = method == "GET";
        return res;
    }
} // namespace liftlens::api
