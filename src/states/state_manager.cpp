/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "state_manager.hpp"
#include "core/logger.hpp"
#include <stdexcept>
#include <utility>

namespace dolly::states {

    using input::Hand;

    namespace {
        constexpr glm::vec3 UP{0.0f, 1.0f, 0.0f};
        constexpr glm::vec3 DEFAULT_FORWARD{0.0f, 0.0f, 1.0f};
        constexpr float MIN_DIRECTION_LENGTH = 1e-6f;
    } // namespace

    StateManager::StateManager(const core::Settings& settings,
                               std::unique_ptr<io::ITrackStore> store,
                               std::unique_ptr<input::IStateMenu> menu)
        : settings_(settings),
          store_(std::move(store)),
          menu_(std::move(menu)) {
        if (!store_) {
            throw std::invalid_argument("StateManager requires a track store");
        }
        if (!menu_) {
            menu_ = std::make_unique<input::RadialStateMenu>(menuLabels());
        }

        const track::SpeedRange speeds{settings_.min_speed, settings_.max_speed};
        locomotion_ = std::make_unique<LocomotionState>(settings_.cast_sensitivity, settings_.height_offset);
        creation_ = std::make_unique<CreationState>(speeds);
        edit_ = std::make_unique<EditState>(settings_.selection_radius, settings_.adjustment_sensitivity);
        view_ = std::make_unique<ViewState>();
        file_ = std::make_unique<FileState>(*store_, speeds);

        states_ = {locomotion_.get(), creation_.get(), edit_.get(), view_.get(), file_.get()};

        menu_->setHighlighted(static_cast<int>(active_));
        feedback_.setRecessive(stateName(active_));
    }

    std::vector<std::string> StateManager::menuLabels() {
        std::vector<std::string> labels;
        labels.reserve(STATE_COUNT);
        for (int i = 0; i < STATE_COUNT; ++i) {
            labels.emplace_back(stateName(static_cast<StateId>(i)));
        }
        return labels;
    }

    void StateManager::applyProbe(const Hand hand, input::HandInput& in, const float dt) {
        auto& probe = probes_[slot(hand)];

        if (in.grip_button && in.axis_click_down) {
            probe.locked = !probe.locked;
            LOG_DEBUG("{} probe {}", input::handName(hand), probe.locked ? "locked" : "unlocked");
        }

        if (in.grip_button && !in.axisCentred() && !probe.locked) {
            // Thumbstick moves the probe in the controller's horizontal frame
            glm::vec3 forward{in.pointer.x, 0.0f, in.pointer.z};
            forward = glm::length(forward) > MIN_DIRECTION_LENGTH ? glm::normalize(forward) : DEFAULT_FORWARD;
            const glm::vec3 right = glm::normalize(glm::cross(UP, forward));
            const glm::vec3 dir = glm::normalize(right * in.axis.x + forward * in.axis.y);
            probe.offset += dir * settings_.probe_sensitivity * dt;
        }

        in.probe += probe.offset;
    }

    void StateManager::tick(input::HandInput dominant, input::HandInput recessive, const float dt) {
        applyProbe(Hand::DOMINANT, dominant, dt);
        applyProbe(Hand::RECESSIVE, recessive, dt);

        TickContext ctx{dominant, recessive, dt, registry_, *menu_, feedback_, rig_};
        const StateId requested = states_[static_cast<size_t>(active_)]->update(ctx);

        if (!isOperational(static_cast<int>(requested))) {
            LOG_WARN("Ignoring request for invalid state {}", static_cast<int>(requested));
        } else if (requested != active_) {
            LOG_INFO("State changed: {} -> {}", stateName(active_), stateName(requested));
            active_ = requested;
        }

        registry_.advanceCursors(dt);
        feedback_.setRecessive(stateName(active_));
        ++tick_count_;
    }

    void StateManager::refreshAll() {
        registry_.refreshAll();
    }

} // namespace dolly::states
