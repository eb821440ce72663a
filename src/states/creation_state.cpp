/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "creation_state.hpp"
#include "core/logger.hpp"
#include <utility>

namespace dolly::states {

    CreationState::CreationState(const track::SpeedRange speeds)
        : speeds_(speeds) {}

    void CreationState::place(const glm::vec3& position, TickContext& ctx) {
        points_[placed_++] = position;
        LOG_DEBUG("Creation marker {} placed", placed_);
        if (placed_ < CREATION_POINT_COUNT) return;

        track::TrackPair pair(track::BezierTrack(points_[0], points_[1], speeds_),
                              track::BezierTrack(points_[2], points_[3], speeds_));
        pair.refresh();
        const size_t index = ctx.registry.add(std::move(pair));
        LOG_INFO("Created track pair {}", index + 1);
        placed_ = 0;
    }

    StateId CreationState::update(TickContext& ctx) {
        if (ctx.dominant.trigger_down) {
            place(ctx.dominant.probe, ctx);
        } else if (ctx.recessive.trigger_down) {
            place(ctx.recessive.probe, ctx);
        }

        if (const auto next = pollMenu(ctx)) {
            if (*next != id() && placed_ > 0) {
                LOG_DEBUG("Discarding {} creation markers", placed_);
                placed_ = 0;
            }
            return *next;
        }
        return id();
    }

} // namespace dolly::states
