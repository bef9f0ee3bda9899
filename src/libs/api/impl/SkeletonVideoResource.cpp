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

#include "SkeletonVideoResource.hpp"

#include <atomic>
#include <string>

#include "api/SkeletonVideoResource.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "streaming/MediaRequestHandler.hpp"
#include "streaming/MediaResource.hpp"

#include "DbMediaResolver.hpp"
#include "RequestDispatch.hpp"
#include "WtResponseWriter.hpp"

namespace liftlens::api
{
    namespace
    {
        using HandlerPtr = std::shared_ptr<streaming::MediaRequestHandler>;
    }

    std::unique_ptr<Wt::WResource> createSkeletonVideoResource(db::IDb& db)
    {
        return std::make_unique<SkeletonVideoResource>(db);
    }

    SkeletonVideoResource::SkeletonVideoResource(db::IDb& db)
        : _config{ readSkeletonVideoResourceConfig(*core::Service<core::IConfig>::get()) }
        , _db{ db }
    {
        LIFTLENS_LOG(API, INFO, "Serving skeleton videos from " << _config.videoStoragePath << ", chunk size = " << _config.chunkSize << ", max stream duration = " << _config.maxStreamDuration.count() << "s");
    }

    SkeletonVideoResource::~SkeletonVideoResource()
    {
        beingDeleted();
    }

    void SkeletonVideoResource::handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response)
    {
        HandlerPtr handler;

        Wt::Http::ResponseContinuation* continuation{ request.continuation() };
        if (!continuation)
        {
            handler = createRequestHandler(request, response);
            if (!handler)
                return;
        }
        else
        {
            handler = Wt::cpp17::any_cast<HandlerPtr>(continuation->data());
        }

        WtResponseWriter responseWriter{ response };
        if (handler->processRequest(responseWriter))
        {
            continuation = response.createContinuation();
            continuation->setData(handler);
        }
    }

    void SkeletonVideoResource::handleAbort(const Wt::Http::Request& request)
    {
        // handler is released along with the continuation anyway
        if (Wt::Http::ResponseContinuation * continuation{ request.continuation() })
        {
            const Wt::cpp17::any data{ continuation->data() };
            if (const HandlerPtr * handler{ Wt::cpp17::any_cast<HandlerPtr>(&data) })
                (*handler)->abort();
        }
    }

    std::shared_ptr<streaming::MediaRequestHandler> SkeletonVideoResource::createRequestHandler(const Wt::Http::Request& request, Wt::Http::Response& response)
    {
        static std::atomic<std::size_t> curRequestId{};
        const std::size_t requestId{ curRequestId++ };

        const std::string& method{ request.method() };
        LIFTLENS_LOG(API, DEBUG, "Handling request " << requestId << ": " << method << " '" << request.path() << "', range = '" << request.headerValue("Range") << "'");

        DbMediaResolver resolver{ _db, _config.videoStoragePath };
        RequestDispatch dispatch{ dispatchRequest(requestId, method, request.urlParam("id"), resolver, _config.defaultMimeType) };
        if (!dispatch.resource)
        {
            response.setStatus(dispatch.status);
            for (const auto& [name, value] : dispatch.headers)
                response.addHeader(std::string{ name }, std::string{ value });
            return nullptr;
        }

        streaming::MediaRequestHandler::Parameters parameters;
        parameters.chunkSize = _config.chunkSize;
        parameters.maxStreamDuration = _config.maxStreamDuration;

        return std::make_shared<streaming::MediaRequestHandler>(*dispatch.resource, request.headerValue("Range"), streaming::MediaRequestHandler::BodyRequested{ dispatch.bodyRequested }, std::move(parameters));
    }
} // namespace liftlens::api
