/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <vector>

namespace dolly::track {

    // Simulated frame step used when laying out speed-coloured curve segments
    inline constexpr float REFRESH_TIME_STEP = 1.0f / 60.0f;
    // Each curve segment covers this much simulated travel time
    inline constexpr float SEGMENT_DURATION = 1.0f;

    struct CurveSegment {
        std::vector<glm::vec3> points;
        glm::vec3 start_color{1.0f};
        glm::vec3 end_color{1.0f};
    };

    // Derived data a renderer draws for one track. Rebuilt by BezierTrack::refresh().
    struct TrackGeometry {
        std::vector<glm::vec3> control_links; // empty for straight tracks
        std::vector<CurveSegment> segments;
        std::vector<glm::vec3> checkpoint_positions;
        std::vector<glm::vec3> checkpoint_colors;
        bool valid = false;

        void clear() {
            control_links.clear();
            segments.clear();
            checkpoint_positions.clear();
            checkpoint_colors.clear();
            valid = false;
        }
    };

} // namespace dolly::track
