/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "locomotion_state.hpp"
#include "core/logger.hpp"

namespace dolly::states {

    using input::Hand;

    LocomotionState::LocomotionState(const float cast_sensitivity, const float height_offset)
        : cast_sensitivity_(cast_sensitivity),
          height_offset_(0.0f, height_offset, 0.0f) {}

    void LocomotionState::placeMarker(const input::HandInput& hand) {
        marker_ = hand.position + hand.pointer * distance_ - height_offset_;
    }

    void LocomotionState::cancelCast() {
        casting_.reset();
        distance_ = 0.0f;
    }

    StateId LocomotionState::update(TickContext& ctx) {
        if (casting_) {
            const input::HandInput& hand = *casting_ == Hand::DOMINANT ? ctx.dominant : ctx.recessive;
            if (hand.trigger_button) {
                distance_ += cast_sensitivity_ * ctx.dt;
                placeMarker(hand);
            } else {
                ctx.rig.position = marker_;
                LOG_DEBUG("Teleported to ({:.3f}, {:.3f}, {:.3f}) with the {} hand",
                          marker_.x, marker_.y, marker_.z, input::handName(*casting_));
                cancelCast();
            }
        } else if (ctx.dominant.trigger_button) {
            casting_ = Hand::DOMINANT;
            distance_ = 0.0f;
            placeMarker(ctx.dominant);
        } else if (ctx.recessive.trigger_button) {
            casting_ = Hand::RECESSIVE;
            distance_ = 0.0f;
            placeMarker(ctx.recessive);
        }

        if (const auto next = pollMenu(ctx)) {
            if (*next != id()) {
                cancelCast();
            }
            return *next;
        }
        return id();
    }

} // namespace dolly::states
