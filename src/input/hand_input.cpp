/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "hand_input.hpp"

namespace dolly::input {

    namespace {
        [[nodiscard]] bool isCentred(const glm::vec2& axis) {
            return axis.x == 0.0f && axis.y == 0.0f;
        }
    } // namespace

    HandInput InputEdgeTracker::update(const RawHandInput& raw) {
        HandInput in;
        in.position = raw.position;
        in.pointer = raw.pointer;
        in.probe = raw.probe.value_or(raw.position);
        in.axis = raw.axis;
        in.trigger = raw.trigger;
        in.grip = raw.grip;

        in.primary = raw.primary;
        in.secondary = raw.secondary;
        in.grip_button = raw.grip_button;
        in.trigger_button = raw.trigger_button;
        in.menu = raw.menu;
        in.axis_click = raw.axis_click;

        in.primary_down = raw.primary && !prev_.primary;
        in.secondary_down = raw.secondary && !prev_.secondary;
        in.grip_down = raw.grip_button && !prev_.grip_button;
        in.trigger_down = raw.trigger_button && !prev_.trigger_button;
        in.menu_down = raw.menu && !prev_.menu;
        in.axis_click_down = raw.axis_click && !prev_.axis_click;
        in.axis_down = !isCentred(raw.axis) && isCentred(prev_.axis);

        prev_ = raw;
        return in;
    }

} // namespace dolly::input
