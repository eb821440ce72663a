/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interpolation.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <vector>

namespace dolly::track {

    namespace {
        constexpr float COLOR_BAND = 0.33f;
        constexpr glm::vec3 WHITE{1.0f, 1.0f, 1.0f};
        constexpr glm::vec3 YELLOW{1.0f, 0.92f, 0.016f};
        constexpr glm::vec3 ORANGE{1.0f, 0.647f, 0.0f};
        constexpr glm::vec3 RED{1.0f, 0.0f, 0.0f};

        [[nodiscard]] glm::vec3 mixBand(const glm::vec3& a, const glm::vec3& b, const float f) {
            return glm::mix(a, b, std::clamp(f, 0.0f, 1.0f));
        }
    } // namespace

    glm::vec3 deCasteljau(const std::span<const glm::vec3> control_points, const float t) {
        if (control_points.empty()) {
            return glm::vec3{0.0f};
        }

        std::vector<glm::vec3> level(control_points.begin(), control_points.end());
        for (size_t n = level.size() - 1; n > 0; --n) {
            for (size_t i = 0; i < n; ++i) {
                level[i] = (1.0f - t) * level[i] + t * level[i + 1];
            }
        }
        return level.front();
    }

    size_t findCheckpointSegment(const std::span<const Checkpoint> checkpoints, const float t) {
        size_t current = 0;
        for (size_t i = 0; i < checkpoints.size(); ++i) {
            if (checkpoints[i].t > t) break;
            current = i;
        }
        return current;
    }

    size_t checkpointInsertIndex(const std::span<const Checkpoint> checkpoints, const float t) {
        const auto it = std::upper_bound(checkpoints.begin(), checkpoints.end(), t,
                                         [](const float value, const Checkpoint& cp) { return value < cp.t; });
        return static_cast<size_t>(it - checkpoints.begin());
    }

    float interpolateSpeed(const std::span<const Checkpoint> checkpoints, const float t) {
        if (checkpoints.empty()) {
            return 0.0f;
        }

        const size_t current = findCheckpointSegment(checkpoints, t);
        if (current + 1 >= checkpoints.size()) {
            return checkpoints[current].speed;
        }

        const Checkpoint& a = checkpoints[current];
        const Checkpoint& b = checkpoints[current + 1];
        const float span = b.t - a.t;
        if (span <= 0.0f) {
            return a.speed;
        }
        const float ratio = std::clamp((t - a.t) / span, 0.0f, 1.0f);
        return glm::mix(a.speed, b.speed, ratio);
    }

    glm::vec3 speedColor(const float ratio) {
        if (ratio < 0.0f || ratio > 1.0f) {
            LOG_DEBUG("Speed color requested outside [0,1]: {}", ratio);
            return glm::vec3{0.0f};
        }
        if (ratio < COLOR_BAND) {
            return mixBand(WHITE, YELLOW, ratio / COLOR_BAND);
        }
        if (ratio < 2.0f * COLOR_BAND) {
            return mixBand(YELLOW, ORANGE, (ratio - COLOR_BAND) / COLOR_BAND);
        }
        return mixBand(ORANGE, RED, (ratio - 2.0f * COLOR_BAND) / COLOR_BAND);
    }

} // namespace dolly::track
