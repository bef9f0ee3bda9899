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

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

namespace liftlens::streaming
{
    // Read cursor on a stored resource, released when destroyed
    class IResourceReader
    {
    public:
        virtual ~IResourceReader() = default;

        // Throws StreamException
        virtual void seek(std::uint64_t offset) = 0;

        // Returns the number of bytes actually read, 0 means end of data
        // Throws StreamException on read errors
        [[nodiscard]] virtual std::size_t read(std::span<std::byte> buffer) = 0;
    };

    // Throws StreamException if the file cannot be opened
    // (error code is std::errc::no_such_file_or_directory if the file is gone)
    std::unique_ptr<IResourceReader> createFileResourceReader(const std::filesystem::path& path);
} // namespace liftlens::streaming
