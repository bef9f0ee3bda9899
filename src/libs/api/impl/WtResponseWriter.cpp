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

#include "WtResponseWriter.hpp"

#include <string>

namespace liftlens::api
{
    WtResponseWriter::WtResponseWriter(Wt::Http::Response& response)
        : _response{ response }
        , _bodySink{ response }
    {
    }

    void WtResponseWriter::setStatus(int status)
    {
        _response.setStatus(status);
    }

    void WtResponseWriter::setContentLength(std::uint64_t length)
    {
        _response.setContentLength(length);
    }

    void WtResponseWriter::setMimeType(std::string_view mimeType)
    {
        _response.setMimeType(std::string{ mimeType });
    }

    void WtResponseWriter::addHeader(std::string_view name, std::string_view value)
    {
        _response.addHeader(std::string{ name }, std::string{ value });
    }

    std::error_code WtResponseWriter::BodySink::write(std::span<const std::byte> data)
    {
        std::ostream& os{ _response.out() };
        os.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!os)
            return std::make_error_code(std::errc::io_error);

        return {};
    }
} // namespace liftlens::api
