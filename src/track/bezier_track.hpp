/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "save_state.hpp"
#include "track_geometry.hpp"
#include "track_types.hpp"
#include <glm/glm.hpp>
#include <span>
#include <vector>

namespace dolly::track {

    // A single Bezier of degree (control points - 1) with a checkpoint speed overlay.
    //
    // Geometry edits never rebuild the derived TrackGeometry; call refresh() once
    // after a batch of edits. Bad indices are ignored rather than reported.
    class BezierTrack {
    public:
        BezierTrack(const glm::vec3& start, const glm::vec3& end, SpeedRange speeds = {});

        // Throws std::runtime_error when the save state has fewer than two control points
        // or mismatched checkpoint lists.
        [[nodiscard]] static BezierTrack fromSaveState(const TrackSaveState& state, SpeedRange speeds = {});
        [[nodiscard]] TrackSaveState makeSaveState() const;

        // Zero vector outside [0,1]
        [[nodiscard]] glm::vec3 positionAt(float t) const;
        [[nodiscard]] float closestParameter(const glm::vec3& target) const;

        // Returns the index the point was inserted at
        size_t addControlPoint(const glm::vec3& position);
        bool deleteControlPoint(size_t index);
        void moveControlPoint(size_t index, const glm::vec3& position);

        size_t addCheckpoint(float t);
        bool deleteCheckpoint(size_t index);
        // New index of the moved checkpoint; endpoints return their fixed index, -1 when out of range
        int moveCheckpoint(int index, float t);

        [[nodiscard]] float speedAt(float t) const;
        void setCheckpointSpeed(size_t index, float speed);
        [[nodiscard]] float checkpointSpeed(size_t index) const;
        [[nodiscard]] float checkpointT(size_t index) const;

        void refresh();

        [[nodiscard]] std::span<const glm::vec3> controlPoints() const { return control_points_; }
        [[nodiscard]] std::span<const Checkpoint> checkpoints() const { return checkpoints_; }
        [[nodiscard]] size_t controlPointCount() const { return control_points_.size(); }
        [[nodiscard]] size_t checkpointCount() const { return checkpoints_.size(); }
        [[nodiscard]] bool isStraight() const { return control_points_.size() == 2; }
        [[nodiscard]] const SpeedRange& speedRange() const { return speeds_; }

        [[nodiscard]] const TrackGeometry& geometry() const { return geometry_; }
        [[nodiscard]] bool needsRefresh() const { return !geometry_.valid; }

    private:
        void invalidate() { geometry_.valid = false; }
        [[nodiscard]] glm::vec3 checkpointColor(float speed) const;

        std::vector<glm::vec3> control_points_;
        std::vector<Checkpoint> checkpoints_;
        SpeedRange speeds_;
        TrackGeometry geometry_;
    };

} // namespace dolly::track
