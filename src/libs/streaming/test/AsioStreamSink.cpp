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

#include <csignal>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read.hpp>

#include <gtest/gtest.h>

#include "streaming/ChunkedStreamer.hpp"
#include "streaming/DisconnectClassifier.hpp"

#include "AsioStreamSink.hpp"
#include "TestUtils.hpp"

namespace liftlens::streaming::tests
{
    namespace
    {
        using Socket = boost::asio::local::stream_protocol::socket;

        class AsioStreamSinkTest : public ::testing::Test
        {
        protected:
            static void SetUpTestSuite()
            {
                // writes to a closed socket must report EPIPE instead of killing the process
                std::signal(SIGPIPE, SIG_IGN);
            }

            AsioStreamSinkTest()
            {
                boost::asio::local::connect_pair(_local, _peer);
            }

            boost::asio::io_context _ioContext;
            Socket _local{ _ioContext };
            Socket _peer{ _ioContext };
        };
    } // namespace

    TEST_F(AsioStreamSinkTest, write)
    {
        AsioStreamSink<Socket> sink{ _local };
        IByteSink& byteSink{ sink };

        const auto content{ generateContent(100) };
        EXPECT_FALSE(byteSink.write(content));

        std::vector<std::byte> received(content.size());
        boost::asio::read(_peer, boost::asio::buffer(received.data(), received.size()));
        EXPECT_EQ(received, content);
    }

    TEST_F(AsioStreamSinkTest, peerClosed)
    {
        _peer.close();

        AsioStreamSink<Socket> sink{ _local };
        IByteSink& byteSink{ sink };

        const auto content{ generateContent(100) };
        const std::error_code ec{ byteSink.write(content) };
        ASSERT_TRUE(ec);
        EXPECT_EQ(classifyFailure(ec), FailureKind::BenignDisconnect) << ec.message();
    }

    TEST_F(AsioStreamSinkTest, streamToClosedPeer)
    {
        const auto content{ generateContent(1'000'000) };
        ReaderStats stats;

        ChunkedStreamer::Parameters parameters;
        parameters.chunkSize = 4096;
        ChunkedStreamer streamer{ std::make_unique<FakeResourceReader>(content, stats), 0, content.size(), parameters };

        AsioStreamSink<Socket> sink{ _local };
        EXPECT_EQ(streamer.processChunk(sink), ChunkedStreamer::State::Streaming);

        _peer.close();

        ChunkedStreamer::State state{};
        EXPECT_NO_THROW(state = streamer.streamAll(sink));
        EXPECT_EQ(state, ChunkedStreamer::State::SwallowedDisconnect);
        EXPECT_LT(streamer.getBytesWritten(), content.size());
        EXPECT_EQ(stats.releaseCount, 1);
    }
} // namespace liftlens::streaming::tests
