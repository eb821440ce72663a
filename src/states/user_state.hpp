/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "input/hand_input.hpp"
#include "input/state_menu.hpp"
#include "track/track_registry.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dolly::states {

    enum class StateId : int8_t {
        BASE = -1,
        LOCOMOTION = 0,
        CREATION = 1,
        EDIT = 2,
        VIEW = 3,
        FILE = 4
    };

    inline constexpr int STATE_COUNT = 5;

    [[nodiscard]] constexpr bool isOperational(const int id) { return id >= 0 && id < STATE_COUNT; }

    // Label shown on the recessive display
    [[nodiscard]] constexpr std::string_view stateName(const StateId id) {
        switch (id) {
        case StateId::LOCOMOTION: return "Teleport";
        case StateId::CREATION: return "Create";
        case StateId::EDIT: return "Edit";
        case StateId::VIEW: return "Flythrough";
        case StateId::FILE: return "Save/Load";
        case StateId::BASE: break;
        }
        return "Base";
    }

    // Text labels attached to the two controllers
    class FeedbackText {
    public:
        // Both return true when the label actually changed
        bool setDominant(std::string_view text);
        bool setRecessive(std::string_view text);

        [[nodiscard]] const std::string& dominant() const { return dominant_; }
        [[nodiscard]] const std::string& recessive() const { return recessive_; }

    private:
        std::string dominant_;
        std::string recessive_;
    };

    // The user's reference frame, moved by teleporting
    struct Rig {
        glm::vec3 position{0.0f};
    };

    // Everything one state sees during a tick
    struct TickContext {
        const input::HandInput& dominant;
        const input::HandInput& recessive;
        float dt;
        track::TrackRegistry& registry;
        input::IStateMenu& menu;
        FeedbackText& feedback;
        Rig& rig;
    };

    class UserState {
    public:
        virtual ~UserState() = default;

        [[nodiscard]] virtual StateId id() const = 0;

        // Processes one tick and returns the state to run next; returning id() means stay
        virtual StateId update(TickContext& ctx) = 0;

    protected:
        // Menu request when the recessive axis just left centre with its grip released.
        // Out of range menu indices are reported as a request to stay.
        [[nodiscard]] std::optional<StateId> pollMenu(const TickContext& ctx) const;
    };

} // namespace dolly::states
