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

#include <filesystem>
#include <fstream>

#include "streaming/IResourceReader.hpp"

namespace liftlens::streaming
{
    class FileResourceReader final : public IResourceReader
    {
    public:
        FileResourceReader(const std::filesystem::path& path);
        ~FileResourceReader() override;
        FileResourceReader(const FileResourceReader&) = delete;
        FileResourceReader& operator=(const FileResourceReader&) = delete;

    private:
        void seek(std::uint64_t offset) override;
        std::size_t read(std::span<std::byte> buffer) override;

        const std::filesystem::path _path;
        std::ifstream _ifs;
    };
} // namespace liftlens::streaming
