/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "user_state.hpp"
#include "core/logger.hpp"

namespace dolly::states {

    bool FeedbackText::setDominant(const std::string_view text) {
        if (dominant_ == text) return false;
        dominant_ = text;
        LOG_TRACE("Dominant display: '{}'", dominant_);
        return true;
    }

    bool FeedbackText::setRecessive(const std::string_view text) {
        if (recessive_ == text) return false;
        recessive_ = text;
        LOG_TRACE("Recessive display: '{}'", recessive_);
        return true;
    }

    std::optional<StateId> UserState::pollMenu(const TickContext& ctx) const {
        if (!ctx.recessive.axis_down || ctx.recessive.grip_button) {
            return std::nullopt;
        }
        const int requested = ctx.menu.selectFromDirection(ctx.recessive.axis);
        if (!isOperational(requested)) {
            LOG_WARN("Menu returned invalid state index {}, staying in {}", requested, stateName(id()));
            return id();
        }
        return static_cast<StateId>(requested);
    }

} // namespace dolly::states
