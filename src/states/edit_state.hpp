/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "user_state.hpp"
#include <array>
#include <cstdint>
#include <optional>

namespace dolly::states {

    enum class SelectionKind : uint8_t {
        CONTROL_POINT,
        CHECKPOINT
    };

    // A point held by one hand. Checkpoint selections always refer to the position track.
    struct Selection {
        size_t pair = 0;
        track::TrackRole role = track::TrackRole::POSITION;
        SelectionKind kind = SelectionKind::CONTROL_POINT;
        size_t index = 0;

        bool operator==(const Selection&) const = default;
    };

    // Drag control points with the trigger, retime checkpoints with the grip.
    //
    // Each hand owns at most one selection and grabbing a point the other hand
    // holds takes it over. Held indices follow insertions and deletions made
    // on the same track.
    class EditState final : public UserState {
    public:
        EditState(float selection_radius, float adjustment_sensitivity);

        [[nodiscard]] StateId id() const override { return StateId::EDIT; }
        StateId update(TickContext& ctx) override;

        [[nodiscard]] const std::optional<Selection>& selection(input::Hand hand) const {
            return held_[slot(hand)];
        }

    private:
        [[nodiscard]] static size_t slot(input::Hand hand) { return hand == input::Hand::DOMINANT ? 0 : 1; }
        [[nodiscard]] std::optional<Selection>& held(input::Hand hand) { return held_[slot(hand)]; }

        [[nodiscard]] std::optional<Selection> findControlPoint(const track::TrackRegistry& registry,
                                                                const glm::vec3& probe) const;
        [[nodiscard]] std::optional<Selection> findCheckpoint(const track::TrackRegistry& registry,
                                                              const glm::vec3& probe) const;

        void trySelect(input::Hand hand, const input::HandInput& in, const track::TrackRegistry& registry);
        void grab(input::Hand hand, const Selection& selection);
        void hold(input::Hand hand, const input::HandInput& in, TickContext& ctx);
        void dominantActions(TickContext& ctx);
        void recessiveActions(TickContext& ctx);

        // Index bookkeeping for every held selection except the one owned by `except`
        void onControlPointInserted(size_t pair, track::TrackRole role, size_t index,
                                    std::optional<input::Hand> except = std::nullopt);
        void onControlPointRemoved(size_t pair, track::TrackRole role, size_t index,
                                   std::optional<input::Hand> except = std::nullopt);
        void onCheckpointInserted(size_t pair, size_t index, std::optional<input::Hand> except = std::nullopt);
        void onCheckpointRemoved(size_t pair, size_t index, std::optional<input::Hand> except = std::nullopt);
        void onPairRemoved(size_t pair);

        void clearSelections();

        float selection_radius_;
        float adjustment_sensitivity_;
        std::array<std::optional<Selection>, 2> held_;
    };

} // namespace dolly::states
