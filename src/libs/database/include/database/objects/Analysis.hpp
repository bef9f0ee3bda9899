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
#include <optional>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>
#include <Wt/Dbo/ptr.h>

#include "database/Object.hpp"
#include "database/objects/AnalysisId.hpp"

namespace liftlens::db
{
    class Analysis;
}

namespace Wt::Dbo
{
    // table is owned by the ingestion service: no version column
    template<>
    struct dbo_traits<liftlens::db::Analysis> : public dbo_default_traits
    {
        static const char* versionField() { return nullptr; }
    };
} // namespace Wt::Dbo

namespace liftlens::db
{
    class Session;

    // Exercise analysis, written by the ingestion service (only read here)
    class Analysis final : public Object<Analysis, AnalysisId>
    {
    public:
        Analysis() = default;

        // find
        static std::size_t getCount(Session& session);
        static pointer find(Session& session, AnalysisId id);

        // getters
        std::string_view getExerciseId() const { return _exerciseId; }
        std::string_view getMuscleGroup() const { return _muscleGroup; }
        std::string_view getOverallScore() const { return _overallScore; }
        const std::optional<std::string>& getVideoPath() const { return _videoPath; }
        const std::optional<std::string>& getSkeletonVideoPath() const { return _skeletonVideoPath; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _exerciseId, "exercise_id");
            Wt::Dbo::field(a, _muscleGroup, "muscle_group");
            Wt::Dbo::field(a, _overallScore, "overall_score");
            Wt::Dbo::field(a, _videoPath, "video_path");
            Wt::Dbo::field(a, _skeletonVideoPath, "skeleton_video_path");
        }

    private:
        std::string _exerciseId;
        std::string _muscleGroup;
        std::string _overallScore; // "good", "needs_improvement" or "poor"
        std::optional<std::string> _videoPath;
        std::optional<std::string> _skeletonVideoPath;
    };
} // namespace liftlens::db
