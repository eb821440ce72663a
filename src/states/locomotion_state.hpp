/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "user_state.hpp"
#include <optional>

namespace dolly::states {

    // Teleport by casting a marker along the controller pointer.
    // Only one hand casts at a time; dominant is checked first.
    class LocomotionState final : public UserState {
    public:
        LocomotionState(float cast_sensitivity, float height_offset);

        [[nodiscard]] StateId id() const override { return StateId::LOCOMOTION; }
        StateId update(TickContext& ctx) override;

        [[nodiscard]] std::optional<input::Hand> castingHand() const { return casting_; }
        [[nodiscard]] float castDistance() const { return distance_; }
        [[nodiscard]] const glm::vec3& marker() const { return marker_; }

    private:
        void placeMarker(const input::HandInput& hand);
        void cancelCast();

        float cast_sensitivity_;
        glm::vec3 height_offset_;
        std::optional<input::Hand> casting_;
        float distance_ = 0.0f;
        glm::vec3 marker_{0.0f};
    };

} // namespace dolly::states
