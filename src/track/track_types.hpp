/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <cstdint>

namespace dolly::track {

    inline constexpr float DEFAULT_MIN_SPEED = 0.01f;
    inline constexpr float DEFAULT_MAX_SPEED = 0.3f;

    // Interior checkpoints never reach the endpoints
    inline constexpr float CHECKPOINT_T_MIN = 0.01f;
    inline constexpr float CHECKPOINT_T_MAX = 0.99f;

    inline constexpr float CLOSEST_SAMPLE_STEP = 0.01f;

    enum class TrackRole : uint8_t {
        POSITION,
        LOOK
    };

    struct SpeedRange {
        float min = DEFAULT_MIN_SPEED;
        float max = DEFAULT_MAX_SPEED;

        [[nodiscard]] float midpoint() const { return (min + max) / 2.0f; }
        [[nodiscard]] float normalize(const float speed) const { return (speed - min) / (max - min); }
    };

    struct Checkpoint {
        float t = 0.0f;
        float speed = DEFAULT_MIN_SPEED;
    };

    // Where the playback camera sits for one track pair
    struct CameraPose {
        glm::vec3 position{0.0f};
        glm::vec3 look_at{0.0f};
        glm::vec3 forward{0.0f, 0.0f, 1.0f};
    };

} // namespace dolly::track
