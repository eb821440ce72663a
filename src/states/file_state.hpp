/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "io/track_store.hpp"
#include "user_state.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dolly::states {

    inline constexpr std::string_view NEW_FILE_LABEL = "<save to new file>";

    // Browses save files plus a trailing "new file" slot; saves, loads and deletes track sets
    class FileState final : public UserState {
    public:
        explicit FileState(io::ITrackStore& store, track::SpeedRange speeds = {});

        [[nodiscard]] StateId id() const override { return StateId::FILE; }
        StateId update(TickContext& ctx) override;

        [[nodiscard]] const std::vector<std::filesystem::path>& files() const { return files_; }
        [[nodiscard]] size_t selectedIndex() const { return selected_; }
        [[nodiscard]] bool newFileSelected() const { return selected_ == files_.size(); }
        [[nodiscard]] std::string selectedLabel() const;

    private:
        void save(const track::TrackRegistry& registry);
        void load(track::TrackRegistry& registry);
        void removeSelected();
        void cycle(float direction);
        void selectNewFile() { selected_ = files_.size(); }

        io::ITrackStore& store_;
        track::SpeedRange speeds_;
        std::vector<std::filesystem::path> files_;
        size_t selected_ = 0;
    };

} // namespace dolly::states
