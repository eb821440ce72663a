/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "view_state.hpp"
#include "core/logger.hpp"
#include <format>

namespace dolly::states {

    void ViewState::exit(TickContext& ctx) {
        entering_ = true;
        camera_.reset();
        ctx.feedback.setDominant("");
    }

    StateId ViewState::update(TickContext& ctx) {
        auto& registry = ctx.registry;
        if (registry.empty()) {
            LOG_INFO("There are no tracks to view");
            entering_ = true;
            camera_.reset();
            ctx.menu.setHighlighted(static_cast<int>(StateId::LOCOMOTION));
            return StateId::LOCOMOTION;
        }

        if (entering_) {
            pair_index_ = 0;
            travel_ = registry.at(pair_index_).cursor();
            entering_ = false;
        } else {
            travel_ += registry.at(pair_index_).position().speedAt(travel_) * ctx.dt;
        }

        if (travel_ > 1.0f) {
            travel_ = 0.0f;
        } else {
            camera_ = registry.at(pair_index_).sampleAt(travel_);
        }

        const bool dominant_edge = ctx.dominant.axis_down;
        const bool recessive_edge = ctx.recessive.axis_down;
        if (dominant_edge || recessive_edge) {
            const float dy = dominant_edge ? ctx.dominant.axis.y : 0.0f;
            const float ry = recessive_edge ? ctx.recessive.axis.y : 0.0f;
            const size_t count = registry.size();
            if (dy > 0.0f || ry > 0.0f) {
                pair_index_ = (pair_index_ + 1) % count;
            } else if (dy < 0.0f || ry < 0.0f) {
                pair_index_ = (pair_index_ + count - 1) % count;
            }
            travel_ = registry.at(pair_index_).cursor();
            LOG_DEBUG("Viewing track {}", pair_index_ + 1);
        }

        if (const auto next = pollMenu(ctx); next && *next != id()) {
            exit(ctx);
            return *next;
        }
        ctx.feedback.setDominant(std::format("Track {}", pair_index_ + 1));
        return id();
    }

} // namespace dolly::states
