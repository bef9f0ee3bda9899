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

#include <type_traits>
#include <utility>

#include <Wt/Dbo/ptr.h>

#include "database/IdType.hpp"

namespace liftlens::db
{
    // Const access to a loaded object
    template<typename T>
    class ObjectPtr
    {
    public:
        ObjectPtr() = default;
        ObjectPtr(Wt::Dbo::ptr<T> obj)
            : _obj{ std::move(obj) } {}

        const T* operator->() const { return _obj.get(); }
        explicit operator bool() const { return static_cast<bool>(_obj); }

    private:
        Wt::Dbo::ptr<T> _obj;
    };

    // Base of mapped objects, identified by a strongly typed id
    template<typename T, typename ObjectIdType>
    class Object : public Wt::Dbo::Dbo<T>
    {
        static_assert(std::is_base_of_v<db::IdType, ObjectIdType> && !std::is_same_v<db::IdType, ObjectIdType>, "ObjectIdType must be declared using LIFTLENS_DECLARE_IDTYPE");

    public:
        using pointer = ObjectPtr<T>;
        using IdType = ObjectIdType;

        IdType getId() const { return IdType{ Wt::Dbo::Dbo<T>::id() }; }
    };
} // namespace liftlens::db
