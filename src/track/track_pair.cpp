/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "track_pair.hpp"
#include "core/logger.hpp"
#include <cmath>
#include <utility>

namespace dolly::track {

    namespace {
        constexpr float SYNC_EPSILON = 1e-6f;
    }

    TrackPair::TrackPair(BezierTrack position, BezierTrack look)
        : position_(std::move(position)),
          look_(std::move(look)) {
        if (!checkpointsInSync()) {
            LOG_WARN("Track pair created with mismatched checkpoints ({} vs {})",
                     position_.checkpointCount(), look_.checkpointCount());
        }
        pose_ = sampleAt(cursor_);
    }

    size_t TrackPair::addCheckpoint(const float t) {
        const size_t index = position_.addCheckpoint(t);
        look_.addCheckpoint(t);
        return index;
    }

    bool TrackPair::deleteCheckpoint(const size_t index) {
        const bool removed = position_.deleteCheckpoint(index);
        look_.deleteCheckpoint(index);
        return removed;
    }

    int TrackPair::moveCheckpoint(const int index, const float t) {
        const int new_index = position_.moveCheckpoint(index, t);
        look_.moveCheckpoint(index, t);
        return new_index;
    }

    void TrackPair::setCheckpointSpeed(const size_t index, const float speed) {
        position_.setCheckpointSpeed(index, speed);
        look_.setCheckpointSpeed(index, speed);
    }

    bool TrackPair::checkpointsInSync() const {
        const auto a = position_.checkpoints();
        const auto b = look_.checkpoints();
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::abs(a[i].t - b[i].t) > SYNC_EPSILON || std::abs(a[i].speed - b[i].speed) > SYNC_EPSILON) {
                return false;
            }
        }
        return true;
    }

    CameraPose TrackPair::sampleAt(const float t) const {
        CameraPose pose;
        pose.position = position_.positionAt(t);
        pose.look_at = look_.positionAt(t);
        const glm::vec3 dir = pose.look_at - pose.position;
        pose.forward = glm::length(dir) > 0.0f ? glm::normalize(dir) : glm::vec3{0.0f};
        return pose;
    }

    void TrackPair::advance(const float dt) {
        cursor_ += position_.speedAt(cursor_) * dt;
        if (cursor_ > 1.0f) {
            cursor_ = 0.0f;
        }
        pose_ = sampleAt(cursor_);
    }

    void TrackPair::refresh() {
        position_.refresh();
        look_.refresh();
    }

} // namespace dolly::track
