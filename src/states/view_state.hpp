/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "user_state.hpp"
#include <optional>

namespace dolly::states {

    // Flies the preview camera along one track pair, looping at the end
    class ViewState final : public UserState {
    public:
        [[nodiscard]] StateId id() const override { return StateId::VIEW; }
        StateId update(TickContext& ctx) override;

        [[nodiscard]] size_t pairIndex() const { return pair_index_; }
        [[nodiscard]] float travel() const { return travel_; }
        [[nodiscard]] const std::optional<track::CameraPose>& camera() const { return camera_; }
        [[nodiscard]] bool active() const { return !entering_; }

    private:
        void exit(TickContext& ctx);

        bool entering_ = true;
        size_t pair_index_ = 0;
        float travel_ = 0.0f;
        std::optional<track::CameraPose> camera_;
    };

} // namespace dolly::states
