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

#include "database/IdType.hpp"

#include <Wt/Dbo/ptr.h>

namespace liftlens::db
{
    IdType::IdType()
        : _id{ Wt::Dbo::dbo_default_traits::invalidId() }
    {
    }

    IdType::IdType(ValueType id)
        : _id{ id }
    {
    }

    std::string IdType::toString() const
    {
        return std::to_string(_id);
    }
} // namespace liftlens::db
