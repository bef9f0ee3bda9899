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

#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include "streaming/IByteSink.hpp"

namespace liftlens::streaming::tests
{
    // Sink over any Boost.Asio SyncWriteStream (tcp socket, local socket, ssl stream, ...)
    template<typename SyncWriteStream>
    class AsioStreamSink final : public IByteSink
    {
    public:
        AsioStreamSink(SyncWriteStream& stream)
            : _stream{ stream }
        {
        }

        AsioStreamSink(const AsioStreamSink&) = delete;
        AsioStreamSink& operator=(const AsioStreamSink&) = delete;

    private:
        std::error_code write(std::span<const std::byte> data) override
        {
            boost::system::error_code ec;
            boost::asio::write(_stream, boost::asio::buffer(data.data(), data.size()), ec);
            if (!ec)
                return {};

            // errno based codes are mapped back to the std categories so that they compare with std::errc
            if (ec.category() == boost::system::system_category())
                return std::error_code{ ec.value(), std::system_category() };
            if (ec.category() == boost::system::generic_category())
                return std::error_code{ ec.value(), std::generic_category() };

            return static_cast<std::error_code>(ec);
        }

        SyncWriteStream& _stream;
    };
} // namespace liftlens::streaming::tests
