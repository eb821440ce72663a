/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace dolly::input {

    enum class Hand : uint8_t {
        DOMINANT,
        RECESSIVE
    };

    [[nodiscard]] constexpr std::string_view handName(const Hand hand) {
        return hand == Hand::DOMINANT ? "dominant" : "recessive";
    }

    // Device state for one controller as polled, before edge derivation
    struct RawHandInput {
        glm::vec3 position{0.0f};
        glm::vec3 pointer{0.0f, 0.0f, 1.0f};
        std::optional<glm::vec3> probe; // controller position when absent
        glm::vec2 axis{0.0f};
        float trigger = 0.0f;
        float grip = 0.0f;

        bool primary = false;
        bool secondary = false;
        bool grip_button = false;
        bool trigger_button = false;
        bool menu = false;
        bool axis_click = false;
    };

    // Per-tick snapshot handed to the user states
    struct HandInput {
        glm::vec3 position{0.0f};
        glm::vec3 pointer{0.0f, 0.0f, 1.0f};
        glm::vec3 probe{0.0f};
        glm::vec2 axis{0.0f};
        float trigger = 0.0f;
        float grip = 0.0f;

        bool primary = false;
        bool secondary = false;
        bool grip_button = false;
        bool trigger_button = false;
        bool menu = false;
        bool axis_click = false;

        // Became pressed this tick
        bool primary_down = false;
        bool secondary_down = false;
        bool grip_down = false;
        bool trigger_down = false;
        bool menu_down = false;
        bool axis_click_down = false;
        // Axis left centre this tick
        bool axis_down = false;

        [[nodiscard]] bool axisCentred() const { return axis.x == 0.0f && axis.y == 0.0f; }
    };

    // Derives "down this tick" edges from consecutive raw snapshots of one hand
    class InputEdgeTracker {
    public:
        [[nodiscard]] HandInput update(const RawHandInput& raw);
        void reset() { prev_ = {}; }

    private:
        RawHandInput prev_;
    };

} // namespace dolly::input
