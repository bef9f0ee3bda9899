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

#include "streaming/MediaRequestHandler.hpp"

#include <ostream>

#include "core/ILogger.hpp"
#include "streaming/Exception.hpp"
#include "streaming/IResponseWriter.hpp"

namespace liftlens::streaming
{
#define MEDIA_REQUEST_LOG(severity, message) LIFTLENS_LOG(STREAMING, severity, "Media " << _resource.id.value() << ": " << message)

    MediaRequestHandler::MediaRequestHandler(const MediaResource& resource, std::string_view rangeHeader, BodyRequested bodyRequested, Parameters parameters)
        : _resource{ resource }
        , _rangeHeader{ rangeHeader }
        , _bodyRequested{ bodyRequested }
        , _parameters{ std::move(parameters) }
    {
    }

    MediaRequestHandler::~MediaRequestHandler() = default;

    bool MediaRequestHandler::processRequest(IResponseWriter& response)
    {
        if (_state == State::Idle)
            processInitialRequest(response);

        if (_state != State::Streaming)
            return false;

        return processChunk(response);
    }

    void MediaRequestHandler::abort()
    {
        if (_state != State::Streaming)
            return;

        _streamer->abort();
        _streamer.reset();
        _state = State::SwallowedDisconnect;
    }

    void MediaRequestHandler::processInitialRequest(IResponseWriter& response)
    {
        std::unique_ptr<IResourceReader> reader;
        try
        {
            reader = _parameters.readerFactory(_resource.path);
        }
        catch (const StreamException& e)
        {
            if (e.getErrorCode() == std::errc::no_such_file_or_directory)
            {
                // removed since the lookup
                MEDIA_REQUEST_LOG(DEBUG, "file " << _resource.path << " is gone");
                response.setStatus(404);
                _state = State::Completed;
            }
            else
            {
                MEDIA_REQUEST_LOG(ERROR, "cannot open " << _resource.path << ": " << e.what());
                response.setStatus(500);
                _state = State::Aborted;
            }
            return;
        }

        const std::optional<ByteRangeRequest> range{ parseRangeHeader(_rangeHeader) };
        _plan = planStream(_resource.size, range);
        _state = State::Planned;

        if (range)
            MEDIA_REQUEST_LOG(DEBUG, "Range requested = " << *range << ", status = " << _plan->getHttpStatus());
        else
            MEDIA_REQUEST_LOG(DEBUG, "No range requested" << (_rangeHeader.empty() ? "" : " (ignored Range header '" + _rangeHeader + "')"));

        const bool needsBody{ _bodyRequested.value() && _plan->isSatisfiable() && _plan->getLength() > 0 };
        if (needsBody)
        {
            // positioning errors can still be reported with a proper status
            try
            {
                ChunkedStreamer::Parameters streamerParameters;
                streamerParameters.chunkSize = _parameters.chunkSize;
                if (_parameters.maxStreamDuration.count() > 0)
                    streamerParameters.deadline = std::chrono::steady_clock::now() + _parameters.maxStreamDuration;

                _streamer = std::make_unique<ChunkedStreamer>(std::move(reader), _plan->firstByte, _plan->getLength(), streamerParameters);
            }
            catch (const StreamException& e)
            {
                MEDIA_REQUEST_LOG(ERROR, "cannot prepare stream: " << e.what());
                response.setStatus(500);
                _state = State::Aborted;
                return;
            }
        }

        emitHeaders(response);

        if (!needsBody)
        {
            _state = State::Completed;
            return;
        }

        _state = State::Streaming;
    }

    void MediaRequestHandler::emitHeaders(IResponseWriter& response)
    {
        response.setStatus(_plan->getHttpStatus());
        for (const HttpHeader& header : _plan->getHeaders())
            response.addHeader(header.name, header.value);
        response.setContentLength(_plan->getLength());
        if (_plan->isSatisfiable())
            response.setMimeType(_resource.mimeType);

        _state = State::HeadersEmitted;
    }

    bool MediaRequestHandler::processChunk(IResponseWriter& response)
    {
        try
        {
            switch (_streamer->processChunk(response.getBodySink()))
            {
            case ChunkedStreamer::State::Streaming:
                return true;

            case ChunkedStreamer::State::Completed:
                MEDIA_REQUEST_LOG(DEBUG, "Job complete! " << _streamer->getBytesWritten() << "/" << _streamer->getLength() << " bytes sent");
                _state = State::Completed;
                break;

            case ChunkedStreamer::State::SwallowedDisconnect:
                _state = State::SwallowedDisconnect;
                break;

            case ChunkedStreamer::State::Aborted:
                _state = State::Aborted;
                break;
            }
        }
        catch (const StreamException& e)
        {
            // headers are already committed: just stop sending
            if (e.getErrorCode() == std::errc::timed_out)
                MEDIA_REQUEST_LOG(WARNING, "streaming stopped: " << e.what());
            else
                MEDIA_REQUEST_LOG(ERROR, "streaming aborted: " << e.what());
            _state = State::Aborted;
        }

        _streamer.reset();
        return false;
    }

    std::ostream& operator<<(std::ostream& os, MediaRequestHandler::State state)
    {
        switch (state)
        {
        case MediaRequestHandler::State::Idle:
            return os << "idle";
        case MediaRequestHandler::State::Planned:
            return os << "planned";
        case MediaRequestHandler::State::HeadersEmitted:
            return os << "headers emitted";
        case MediaRequestHandler::State::Streaming:
            return os << "streaming";
        case MediaRequestHandler::State::Completed:
            return os << "completed";
        case MediaRequestHandler::State::SwallowedDisconnect:
            return os << "swallowed disconnect";
        case MediaRequestHandler::State::Aborted:
            return os << "aborted";
        }

        return os;
    }
} // namespace liftlens::streaming
