/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace dolly::input {

    // Maps a thumbstick direction to a requested state index
    class IStateMenu {
    public:
        virtual ~IStateMenu() = default;

        virtual int selectFromDirection(const glm::vec2& axis) = 0;
        virtual void setHighlighted(int index) = 0;
        [[nodiscard]] virtual int highlighted() const = 0;
    };

    // N equal sectors; sector 0 is centred straight up and indices increase clockwise.
    class RadialStateMenu final : public IStateMenu {
    public:
        explicit RadialStateMenu(std::vector<std::string> labels, int initial = 0);

        int selectFromDirection(const glm::vec2& axis) override;
        void setHighlighted(int index) override;
        [[nodiscard]] int highlighted() const override { return highlighted_; }

        [[nodiscard]] const std::vector<std::string>& labels() const { return labels_; }
        [[nodiscard]] int sectorCount() const { return static_cast<int>(labels_.size()); }

    private:
        std::vector<std::string> labels_;
        int highlighted_ = 0;
    };

} // namespace dolly::input
