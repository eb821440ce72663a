/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "user_state.hpp"
#include <array>

namespace dolly::states {

    inline constexpr size_t CREATION_POINT_COUNT = 4;

    // Collects four probe placements: position track start/end, then look track start/end
    class CreationState final : public UserState {
    public:
        explicit CreationState(track::SpeedRange speeds = {});

        [[nodiscard]] StateId id() const override { return StateId::CREATION; }
        StateId update(TickContext& ctx) override;

        [[nodiscard]] size_t placedCount() const { return placed_; }
        [[nodiscard]] const glm::vec3& placement(size_t i) const { return points_[i]; }

    private:
        void place(const glm::vec3& position, TickContext& ctx);

        track::SpeedRange speeds_;
        std::array<glm::vec3, CREATION_POINT_COUNT> points_{};
        size_t placed_ = 0;
    };

} // namespace dolly::states
