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

#include <functional>
#include <string>

namespace liftlens::db
{
    class IdType
    {
    public:
        using ValueType = long long;

        IdType();
        IdType(ValueType id);

        std::string toString() const;

        ValueType getValue() const { return _id; }
        auto operator<=>(const IdType& other) const = default;

    private:
        ValueType _id;
    };
} // namespace liftlens::db

#define LIFTLENS_DECLARE_IDTYPE(name)                                                  \
    namespace liftlens::db                                                             \
    {                                                                                  \
        class name : public IdType                                                     \
        {                                                                              \
        public:                                                                        \
            using IdType::IdType;                                                      \
            auto operator<=>(const name& other) const = default;                       \
        };                                                                             \
    }                                                                                  \
    namespace std                                                                      \
    {                                                                                  \
        template<>                                                                     \
        class hash<liftlens::db::name>                                                 \
        {                                                                              \
        public:                                                                        \
            size_t operator()(liftlens::db::name id) const                             \
            {                                                                          \
                return std::hash<liftlens::db::name::ValueType>()(id.getValue());      \
            }                                                                          \
        };                                                                             \
    } // ns std
