/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/settings.hpp"
#include "creation_state.hpp"
#include "edit_state.hpp"
#include "file_state.hpp"
#include "io/track_store.hpp"
#include "locomotion_state.hpp"
#include "user_state.hpp"
#include "view_state.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dolly::states {

    // Per-hand probe offset from the controller, adjusted with grip + thumbstick
    struct ProbeRig {
        glm::vec3 offset{0.0f};
        bool locked = false;
    };

    // Owns the track registry and the five user states, and runs one tick of
    // dual-hand input through whichever state is active.
    class StateManager {
    public:
        // A null menu gets a radial menu with one sector per state
        StateManager(const core::Settings& settings,
                     std::unique_ptr<io::ITrackStore> store,
                     std::unique_ptr<input::IStateMenu> menu = nullptr);

        StateManager(const StateManager&) = delete;
        StateManager& operator=(const StateManager&) = delete;

        // Exceptions from malformed save data propagate to the caller
        void tick(input::HandInput dominant, input::HandInput recessive, float dt);

        void refreshAll();

        [[nodiscard]] StateId activeState() const { return active_; }
        [[nodiscard]] track::TrackRegistry& registry() { return registry_; }
        [[nodiscard]] const track::TrackRegistry& registry() const { return registry_; }
        [[nodiscard]] const FeedbackText& feedback() const { return feedback_; }
        [[nodiscard]] const Rig& rig() const { return rig_; }
        [[nodiscard]] const ProbeRig& probe(input::Hand hand) const { return probes_[slot(hand)]; }
        [[nodiscard]] input::IStateMenu& menu() { return *menu_; }
        [[nodiscard]] uint64_t tickCount() const { return tick_count_; }

        [[nodiscard]] const LocomotionState& locomotion() const { return *locomotion_; }
        [[nodiscard]] const CreationState& creation() const { return *creation_; }
        [[nodiscard]] const EditState& edit() const { return *edit_; }
        [[nodiscard]] const ViewState& view() const { return *view_; }
        [[nodiscard]] const FileState& file() const { return *file_; }

        [[nodiscard]] static std::vector<std::string> menuLabels();

    private:
        [[nodiscard]] static size_t slot(input::Hand hand) { return hand == input::Hand::DOMINANT ? 0 : 1; }
        void applyProbe(input::Hand hand, input::HandInput& in, float dt);

        core::Settings settings_;
        std::unique_ptr<io::ITrackStore> store_;
        std::unique_ptr<input::IStateMenu> menu_;
        track::TrackRegistry registry_;
        FeedbackText feedback_;
        Rig rig_;
        std::array<ProbeRig, 2> probes_{};

        std::unique_ptr<LocomotionState> locomotion_;
        std::unique_ptr<CreationState> creation_;
        std::unique_ptr<EditState> edit_;
        std::unique_ptr<ViewState> view_;
        std::unique_ptr<FileState> file_;
        std::array<UserState*, STATE_COUNT> states_{};

        StateId active_ = StateId::LOCOMOTION;
        uint64_t tick_count_ = 0;
    };

} // namespace dolly::states
