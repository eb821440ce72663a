/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "bezier_track.hpp"
#include "track_types.hpp"

namespace dolly::track {

    // A position track and a look track sharing one checkpoint timeline.
    //
    // Every checkpoint edit goes through the pair and is applied to both tracks
    // at the same index, so both lists always carry identical t values.
    class TrackPair {
    public:
        TrackPair(BezierTrack position, BezierTrack look);

        [[nodiscard]] BezierTrack& track(TrackRole role) { return role == TrackRole::POSITION ? position_ : look_; }
        [[nodiscard]] const BezierTrack& track(TrackRole role) const {
            return role == TrackRole::POSITION ? position_ : look_;
        }
        [[nodiscard]] BezierTrack& position() { return position_; }
        [[nodiscard]] const BezierTrack& position() const { return position_; }
        [[nodiscard]] BezierTrack& look() { return look_; }
        [[nodiscard]] const BezierTrack& look() const { return look_; }

        size_t addCheckpoint(float t);
        bool deleteCheckpoint(size_t index);
        int moveCheckpoint(int index, float t);
        void setCheckpointSpeed(size_t index, float speed);

        [[nodiscard]] bool checkpointsInSync() const;

        // Camera pose at parameter t; forward is zero when both points coincide
        [[nodiscard]] CameraPose sampleAt(float t) const;

        [[nodiscard]] float cursor() const { return cursor_; }
        void setCursor(float t) { cursor_ = t; }
        [[nodiscard]] const CameraPose& pose() const { return pose_; }
        void setPose(const CameraPose& pose) { pose_ = pose; }

        // Advances the idle playback cursor by one tick; wraps to 0 past 1
        void advance(float dt);

        void refresh();

    private:
        BezierTrack position_;
        BezierTrack look_;
        float cursor_ = 0.0f;
        CameraPose pose_;
    };

} // namespace dolly::track
