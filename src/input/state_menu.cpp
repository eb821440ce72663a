/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "state_menu.hpp"
#include "core/logger.hpp"
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <utility>

namespace dolly::input {

    RadialStateMenu::RadialStateMenu(std::vector<std::string> labels, const int initial)
        : labels_(std::move(labels)) {
        if (labels_.empty()) {
            throw std::invalid_argument("RadialStateMenu needs at least one sector");
        }
        setHighlighted(initial);
    }

    int RadialStateMenu::selectFromDirection(const glm::vec2& axis) {
        if (axis.x == 0.0f && axis.y == 0.0f) {
            return highlighted_;
        }

        constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;
        const float sector = TWO_PI / static_cast<float>(labels_.size());

        // Clockwise angle from straight up, in [0, 2pi)
        float angle = std::atan2(axis.x, axis.y);
        if (angle < 0.0f) angle += TWO_PI;

        const int index = static_cast<int>(std::floor((angle + sector / 2.0f) / sector)) % sectorCount();
        highlighted_ = index;
        LOG_DEBUG("State menu selected '{}' ({})", labels_[static_cast<size_t>(index)], index);
        return index;
    }

    void RadialStateMenu::setHighlighted(const int index) {
        if (index < 0 || index >= sectorCount()) {
            LOG_WARN("Ignoring out of range menu highlight {}", index);
            return;
        }
        highlighted_ = index;
    }

} // namespace dolly::input
