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

#include <chrono>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "core/TaggedType.hpp"
#include "streaming/ChunkedStreamer.hpp"
#include "streaming/IResourceReader.hpp"
#include "streaming/MediaResource.hpp"
#include "streaming/StreamPlan.hpp"

namespace liftlens::streaming
{
    class IResponseWriter;

    // Serves one request on a media resource, possibly over several calls (one chunk per call)
    class MediaRequestHandler
    {
    public:
        enum class State
        {
            Idle,
            Planned,
            HeadersEmitted,
            Streaming,
            Completed,
            SwallowedDisconnect,
            Aborted,
        };

        using ResourceReaderFactory = std::function<std::unique_ptr<IResourceReader>(const std::filesystem::path&)>;
        using BodyRequested = core::TaggedBool<struct BodyRequestedTag>;

        struct Parameters
        {
            std::size_t chunkSize{ ChunkedStreamer::defaultChunkSize };
            std::chrono::seconds maxStreamDuration{}; // 0 means unbounded
            ResourceReaderFactory readerFactory{ createFileResourceReader };
        };

        MediaRequestHandler(const MediaResource& resource, std::string_view rangeHeader, BodyRequested bodyRequested, Parameters parameters);
        ~MediaRequestHandler();
        MediaRequestHandler(const MediaRequestHandler&) = delete;
        MediaRequestHandler& operator=(const MediaRequestHandler&) = delete;

        // Returns true if there is more to send: call again once the previous data has been flushed
        [[nodiscard]] bool processRequest(IResponseWriter& response);

        // Client went away between two calls
        void abort();

        State getState() const { return _state; }
        const std::optional<StreamPlan>& getPlan() const { return _plan; }

    private:
        void processInitialRequest(IResponseWriter& response);
        void emitHeaders(IResponseWriter& response);
        bool processChunk(IResponseWriter& response);

        const MediaResource _resource;
        const std::string _rangeHeader;
        const BodyRequested _bodyRequested;
        const Parameters _parameters;

        State _state{ State::Idle };
        std::optional<StreamPlan> _plan;
        std::unique_ptr<ChunkedStreamer> _streamer;
    };

    std::ostream& operator<<(std::ostream& os, MediaRequestHandler::State state);
} // namespace liftlens::streaming
