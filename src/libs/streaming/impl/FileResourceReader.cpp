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

#include "FileResourceReader.hpp"

#include <cerrno>

#include "core/ILogger.hpp"
#include "streaming/Exception.hpp"

namespace liftlens::streaming
{
    std::unique_ptr<IResourceReader> createFileResourceReader(const std::filesystem::path& path)
    {
        return std::make_unique<FileResourceReader>(path);
    }

    FileResourceReader::FileResourceReader(const std::filesystem::path& path)
        : _path{ path }
        , _ifs{ path, std::ios::in | std::ios::binary }
    {
        if (!_ifs)
        {
            std::error_code ec{ errno, std::generic_category() };
            if (!ec)
                ec = std::make_error_code(std::errc::io_error);

            throw StreamException{ "Cannot open file stream for '" + path.string() + "'", ec };
        }

        LIFTLENS_LOG(STREAMING, DEBUG, "Opened file " << _path);
    }

    FileResourceReader::~FileResourceReader()
    {
        LIFTLENS_LOG(STREAMING, DEBUG, "Closing file " << _path);
    }

    void FileResourceReader::seek(std::uint64_t offset)
    {
        _ifs.seekg(static_cast<std::istream::off_type>(offset), std::ios::beg);
        if (_ifs.fail())
            throw StreamException{ "Cannot seek to offset " + std::to_string(offset) + " in '" + _path.string() + "'", std::make_error_code(std::errc::io_error) };
    }

    std::size_t FileResourceReader::read(std::span<std::byte> buffer)
    {
        _ifs.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (_ifs.bad())
            throw StreamException{ "Error reading from '" + _path.string() + "'", std::make_error_code(std::errc::io_error) };

        return static_cast<std::size_t>(_ifs.gcount());
    }
} // namespace liftlens::streaming
