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

#include <Wt/Http/Response.h>

#include "streaming/IByteSink.hpp"
#include "streaming/IResponseWriter.hpp"

namespace liftlens::api
{
    class WtResponseWriter final : public streaming::IResponseWriter
    {
    public:
        WtResponseWriter(Wt::Http::Response& response);
        WtResponseWriter(const WtResponseWriter&) = delete;
        WtResponseWriter& operator=(const WtResponseWriter&) = delete;

    private:
        void setStatus(int status) override;
        void setContentLength(std::uint64_t length) override;
        void setMimeType(std::string_view mimeType) override;
        void addHeader(std::string_view name, std::string_view value) override;
        streaming::IByteSink& getBodySink() override { return _bodySink; }

        // Wt buffers the data and reports disconnects through WResource::handleAbort
        class BodySink final : public streaming::IByteSink
        {
        public:
            BodySink(Wt::Http::Response& response)
                : _response{ response } {}

        private:
            std::error_code write(std::span<const std::byte> data) override;

            Wt::Http::Response& _response;
        };

        Wt::Http::Response& _response;
        BodySink _bodySink;
    };
} // namespace liftlens::api
