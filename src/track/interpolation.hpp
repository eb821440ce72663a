/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "track_types.hpp"
#include <glm/glm.hpp>
#include <span>

namespace dolly::track {

    // Point on the Bezier defined by all control points, by repeated linear interpolation.
    // O(n^2) in the number of control points.
    [[nodiscard]] glm::vec3 deCasteljau(std::span<const glm::vec3> control_points, float t);

    // Index of the last checkpoint whose t is <= the given t (0 when t precedes every checkpoint)
    [[nodiscard]] size_t findCheckpointSegment(std::span<const Checkpoint> checkpoints, float t);

    // Index at which a checkpoint with the given t keeps the list sorted
    [[nodiscard]] size_t checkpointInsertIndex(std::span<const Checkpoint> checkpoints, float t);

    [[nodiscard]] float interpolateSpeed(std::span<const Checkpoint> checkpoints, float t);

    // White -> yellow -> orange -> red over [0,1]; black outside
    [[nodiscard]] glm::vec3 speedColor(float ratio);

} // namespace dolly::track
