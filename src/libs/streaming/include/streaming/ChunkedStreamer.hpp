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
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <vector>

namespace liftlens::streaming
{
    class IByteSink;
    class IResourceReader;

    // Pushes [offset, offset + length) of a resource to a sink, one bounded chunk at a time
    // The resource reader is released as soon as a terminal state is reached
    class ChunkedStreamer
    {
    public:
        enum class State
        {
            Streaming,
            Completed,           // length exhausted or end of data reached
            SwallowedDisconnect, // peer went away, not an error
            Aborted,             // real failure, reported by a StreamException
        };

        static constexpr std::size_t defaultChunkSize{ 65'536 };

        struct Parameters
        {
            std::size_t chunkSize{ defaultChunkSize };
            std::optional<std::chrono::steady_clock::time_point> deadline;
        };

        // Throws StreamException if the reader cannot be positioned at offset
        ChunkedStreamer(std::unique_ptr<IResourceReader> reader, std::uint64_t offset, std::uint64_t length, const Parameters& parameters);
        ~ChunkedStreamer();
        ChunkedStreamer(const ChunkedStreamer&) = delete;
        ChunkedStreamer& operator=(const ChunkedStreamer&) = delete;

        // Writes at most one chunk
        // Throws StreamException on real failures (the state is then Aborted)
        State processChunk(IByteSink& sink);

        // Loops on processChunk until a terminal state is reached
        State streamAll(IByteSink& sink);

        // Peer is known to be gone (reported by the HTTP layer between two chunks)
        void abort();

        State getState() const { return _state; }
        std::uint64_t getBytesWritten() const { return _bytesWritten; }
        std::uint64_t getLength() const { return _length; }
        bool holdsResource() const { return static_cast<bool>(_reader); }

    private:
        void terminate(State state);

        std::unique_ptr<IResourceReader> _reader;
        const std::uint64_t _offset;
        const std::uint64_t _length;
        const std::optional<std::chrono::steady_clock::time_point> _deadline;
        std::vector<std::byte> _buffer;
        std::uint64_t _bytesWritten{};
        State _state{ State::Streaming };
    };

    std::ostream& operator<<(std::ostream& os, ChunkedStreamer::State state);
} // namespace liftlens::streaming
