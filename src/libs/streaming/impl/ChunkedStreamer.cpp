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

#include "streaming/ChunkedStreamer.hpp"

#include <algorithm>
#include <ostream>

#include "core/ILogger.hpp"
#include "streaming/DisconnectClassifier.hpp"
#include "streaming/Exception.hpp"
#include "streaming/IByteSink.hpp"
#include "streaming/IResourceReader.hpp"

namespace liftlens::streaming
{
    ChunkedStreamer::ChunkedStreamer(std::unique_ptr<IResourceReader> reader, std::uint64_t offset, std::uint64_t length, const Parameters& parameters)
        : _reader{ std::move(reader) }
        , _offset{ offset }
        , _length{ length }
        , _deadline{ parameters.deadline }
    {
        if (!_reader)
            throw Exception{ "No resource to stream" };
        if (parameters.chunkSize == 0)
            throw Exception{ "Chunk size must be greater than 0" };

        if (_length == 0)
        {
            terminate(State::Completed);
            return;
        }

        _reader->seek(_offset);
        _buffer.resize(static_cast<std::size_t>(std::min<std::uint64_t>(_length, parameters.chunkSize)));
    }

    ChunkedStreamer::~ChunkedStreamer()
    {
        LIFTLENS_LOG_IF(STREAMING, DEBUG, _state == State::Streaming, "Stream dropped after " << _bytesWritten << "/" << _length << " bytes");
    }

    ChunkedStreamer::State ChunkedStreamer::processChunk(IByteSink& sink)
    {
        if (_state != State::Streaming)
            return _state;

        if (_deadline && std::chrono::steady_clock::now() > *_deadline)
        {
            terminate(State::Aborted);
            throw StreamException{ "Stream duration exceeded after " + std::to_string(_bytesWritten) + " bytes", std::make_error_code(std::errc::timed_out) };
        }

        const std::uint64_t restSize{ _length - _bytesWritten };
        const std::size_t pieceSize{ static_cast<std::size_t>(std::min<std::uint64_t>(restSize, _buffer.size())) };

        std::size_t actualPieceSize{};
        try
        {
            actualPieceSize = _reader->read(std::span{ _buffer.data(), pieceSize });
        }
        catch (const StreamException&)
        {
            terminate(State::Aborted);
            throw;
        }

        if (actualPieceSize == 0)
        {
            LIFTLENS_LOG(STREAMING, DEBUG, "End of data reached after " << _bytesWritten << "/" << _length << " bytes");
            terminate(State::Completed);
            return _state;
        }

        if (const std::error_code ec{ sink.write(std::span<const std::byte>{ _buffer.data(), actualPieceSize }) })
        {
            const FailureKind failureKind{ classifyFailure(ec) };
            if (failureKind == FailureKind::BenignDisconnect)
            {
                LIFTLENS_LOG(STREAMING, DEBUG, "Peer disconnected after " << _bytesWritten << "/" << _length << " bytes: " << ec.message());
                terminate(State::SwallowedDisconnect);
                return _state;
            }

            terminate(State::Aborted);
            throw StreamException{ "Cannot write chunk after " + std::to_string(_bytesWritten) + " bytes", ec };
        }

        LIFTLENS_LOG(STREAMING, DEBUG, "Written " << actualPieceSize << " bytes, range = " << _offset + _bytesWritten << "-" << _offset + _bytesWritten + actualPieceSize - 1);
        _bytesWritten += actualPieceSize;

        if (_bytesWritten == _length)
            terminate(State::Completed);

        return _state;
    }

    ChunkedStreamer::State ChunkedStreamer::streamAll(IByteSink& sink)
    {
        while (processChunk(sink) == State::Streaming)
        {
        }

        return _state;
    }

    void ChunkedStreamer::abort()
    {
        if (_state != State::Streaming)
            return;

        LIFTLENS_LOG(STREAMING, DEBUG, "Stream aborted by peer after " << _bytesWritten << "/" << _length << " bytes");
        terminate(State::SwallowedDisconnect);
    }

    void ChunkedStreamer::terminate(State state)
    {
        _state = state;
        _reader.reset();

        _buffer.clear();
        _buffer.shrink_to_fit();
    }

    std::ostream& operator<<(std::ostream& os, ChunkedStreamer::State state)
    {
        switch (state)
        {
        case ChunkedStreamer::State::Streaming:
            return os << "streaming";
        case ChunkedStreamer::State::Completed:
            return os << "completed";
        case ChunkedStreamer::State::SwallowedDisconnect:
            return os << "swallowed disconnect";
        case ChunkedStreamer::State::Aborted:
            return os << "aborted";
        }

        return os;
    }
} // namespace liftlens::streaming
