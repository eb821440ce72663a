/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "bezier_track.hpp"
#include "interpolation.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace dolly::track {

    namespace {
        // Keeps refresh() bounded if a speed of zero ever slips through
        constexpr float MIN_REFRESH_STEP = 1e-4f;
        constexpr float ENDPOINT_T_TOLERANCE = 1e-4f;
    }

    BezierTrack::BezierTrack(const glm::vec3& start, const glm::vec3& end, const SpeedRange speeds)
        : control_points_{start, end},
          speeds_(speeds) {
        checkpoints_.push_back({0.0f, speeds_.midpoint()});
        checkpoints_.push_back({1.0f, speeds_.midpoint()});
    }

    BezierTrack BezierTrack::fromSaveState(const TrackSaveState& state, const SpeedRange speeds) {
        const auto& points = state.control_point_positions;
        if (points.size() < 2) {
            throw std::runtime_error(std::format("Track save state needs at least 2 control points, got {}",
                                                 points.size()));
        }
        if (state.checkpoint_t_values.size() != state.checkpoint_speeds.size()) {
            throw std::runtime_error(std::format("Track save state has {} checkpoint t values but {} speeds",
                                                 state.checkpoint_t_values.size(), state.checkpoint_speeds.size()));
        }

        const auto& t_values = state.checkpoint_t_values;
        if (t_values.size() < 2 || std::abs(t_values.front()) > ENDPOINT_T_TOLERANCE ||
            std::abs(t_values.back() - 1.0f) > ENDPOINT_T_TOLERANCE) {
            throw std::runtime_error(std::format("Track save state checkpoints must start at t=0 and end at t=1, got {} values",
                                                 t_values.size()));
        }

        BezierTrack track(points.front(), points.back(), speeds);
        track.control_points_.assign(points.begin(), points.end());

        for (size_t i = 1; i + 1 < t_values.size(); ++i) {
            track.addCheckpoint(t_values[i]);
        }
        for (size_t i = 0; i < state.checkpoint_speeds.size(); ++i) {
            track.setCheckpointSpeed(i, state.checkpoint_speeds[i]);
        }
        return track;
    }

    TrackSaveState BezierTrack::makeSaveState() const {
        TrackSaveState state;
        state.control_point_positions = control_points_;
        state.checkpoint_t_values.reserve(checkpoints_.size());
        state.checkpoint_speeds.reserve(checkpoints_.size());
        for (const auto& cp : checkpoints_) {
            state.checkpoint_t_values.push_back(cp.t);
            state.checkpoint_speeds.push_back(cp.speed);
        }
        return state;
    }

    glm::vec3 BezierTrack::positionAt(const float t) const {
        if (t < 0.0f || t > 1.0f) {
            return glm::vec3{0.0f};
        }
        return deCasteljau(control_points_, t);
    }

    float BezierTrack::closestParameter(const glm::vec3& target) const {
        float best_t = 0.0f;
        float best_dist = std::numeric_limits<float>::infinity();
        for (float t = 0.0f; t <= 1.0f; t += CLOSEST_SAMPLE_STEP) {
            const float dist = glm::distance(positionAt(t), target);
            if (dist < best_dist) {
                best_dist = dist;
                best_t = t;
            }
        }
        return best_t;
    }

    size_t BezierTrack::addControlPoint(const glm::vec3& position) {
        size_t nearest = 0;
        float nearest_dist = std::numeric_limits<float>::max();
        for (size_t i = 0; i < control_points_.size(); ++i) {
            const float dist = glm::distance(position, control_points_[i]);
            if (dist < nearest_dist) {
                nearest = i;
                nearest_dist = dist;
            }
        }

        const size_t last = control_points_.size() - 1;
        size_t index;
        if (nearest == 0) {
            index = 1;
        } else if (nearest == last) {
            index = last;
        } else {
            const float left = glm::distance(position, control_points_[nearest - 1]);
            const float right = glm::distance(position, control_points_[nearest + 1]);
            index = left < right ? nearest : nearest + 1;
        }

        control_points_.insert(control_points_.begin() + static_cast<ptrdiff_t>(index), position);
        invalidate();
        return index;
    }

    bool BezierTrack::deleteControlPoint(const size_t index) {
        if (index == 0 || index + 1 >= control_points_.size()) return false;
        control_points_.erase(control_points_.begin() + static_cast<ptrdiff_t>(index));
        invalidate();
        return true;
    }

    void BezierTrack::moveControlPoint(const size_t index, const glm::vec3& position) {
        if (index >= control_points_.size()) return;
        control_points_[index] = position;
        invalidate();
    }

    size_t BezierTrack::addCheckpoint(const float t) {
        const float clamped = std::clamp(t, CHECKPOINT_T_MIN, CHECKPOINT_T_MAX);
        const size_t index = checkpointInsertIndex(checkpoints_, clamped);
        checkpoints_.insert(checkpoints_.begin() + static_cast<ptrdiff_t>(index),
                            Checkpoint{clamped, speeds_.midpoint()});
        invalidate();
        return index;
    }

    bool BezierTrack::deleteCheckpoint(const size_t index) {
        if (index == 0 || index + 1 >= checkpoints_.size()) return false;
        checkpoints_.erase(checkpoints_.begin() + static_cast<ptrdiff_t>(index));
        invalidate();
        return true;
    }

    int BezierTrack::moveCheckpoint(const int index, const float t) {
        const int last = static_cast<int>(checkpoints_.size()) - 1;
        if (index == 0 || index == last) return index;
        if (index < 0 || index > last) return -1;

        const float speed = checkpoints_[static_cast<size_t>(index)].speed;
        checkpoints_.erase(checkpoints_.begin() + index);

        const float clamped = std::clamp(t, CHECKPOINT_T_MIN, CHECKPOINT_T_MAX);
        const size_t new_index = checkpointInsertIndex(checkpoints_, clamped);
        checkpoints_.insert(checkpoints_.begin() + static_cast<ptrdiff_t>(new_index), Checkpoint{clamped, speed});
        invalidate();
        return static_cast<int>(new_index);
    }

    float BezierTrack::speedAt(const float t) const {
        return interpolateSpeed(checkpoints_, t);
    }

    void BezierTrack::setCheckpointSpeed(const size_t index, const float speed) {
        if (index >= checkpoints_.size()) return;
        checkpoints_[index].speed = std::clamp(speed, speeds_.min, speeds_.max);
        invalidate();
    }

    float BezierTrack::checkpointSpeed(const size_t index) const {
        return index < checkpoints_.size() ? checkpoints_[index].speed : 0.0f;
    }

    float BezierTrack::checkpointT(const size_t index) const {
        return index < checkpoints_.size() ? checkpoints_[index].t : 0.0f;
    }

    glm::vec3 BezierTrack::checkpointColor(const float speed) const {
        return speedColor(speeds_.normalize(speed));
    }

    void BezierTrack::refresh() {
        LOG_TIMER_DEBUG("BezierTrack::refresh");
        geometry_.clear();

        if (control_points_.size() > 2) {
            geometry_.control_links = control_points_;
        }

        // Walk the curve as playback would, cutting a new segment after each simulated second
        float speed = checkpoints_.front().speed;
        float elapsed = 0.0f;
        CurveSegment segment;
        segment.start_color = checkpointColor(speed);

        for (float t = 0.0f; t <= 1.0f; t += std::max(speed * REFRESH_TIME_STEP, MIN_REFRESH_STEP)) {
            elapsed += REFRESH_TIME_STEP;
            speed = speedAt(t);
            const glm::vec3 point = positionAt(t);

            if (elapsed > SEGMENT_DURATION) {
                elapsed = 0.0f;
                const glm::vec3 color = checkpointColor(speed);
                segment.points.push_back(point);
                segment.end_color = color;
                geometry_.segments.push_back(std::move(segment));
                segment = CurveSegment{};
                segment.start_color = color;
            }
            segment.points.push_back(point);
        }
        segment.points.push_back(positionAt(1.0f));
        segment.end_color = checkpointColor(speed);
        geometry_.segments.push_back(std::move(segment));

        geometry_.checkpoint_positions.reserve(checkpoints_.size());
        geometry_.checkpoint_colors.reserve(checkpoints_.size());
        for (const auto& cp : checkpoints_) {
            geometry_.checkpoint_positions.push_back(positionAt(cp.t));
            geometry_.checkpoint_colors.push_back(checkpointColor(cp.speed));
        }

        geometry_.valid = true;
        LOG_TRACE("Track refreshed: {} control points, {} checkpoints, {} segments",
                  control_points_.size(), checkpoints_.size(), geometry_.segments.size());
    }

} // namespace dolly::track
