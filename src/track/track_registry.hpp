/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "save_state.hpp"
#include "track_pair.hpp"
#include <vector>

namespace dolly::track {

    // Ordered collection of track pairs shared by every user state
    class TrackRegistry {
    public:
        size_t add(TrackPair pair);
        bool remove(size_t index);
        void clear();

        [[nodiscard]] TrackPair& at(size_t index) { return pairs_.at(index); }
        [[nodiscard]] const TrackPair& at(size_t index) const { return pairs_.at(index); }
        [[nodiscard]] size_t size() const { return pairs_.size(); }
        [[nodiscard]] bool empty() const { return pairs_.empty(); }

        auto begin() { return pairs_.begin(); }
        auto end() { return pairs_.end(); }
        [[nodiscard]] auto begin() const { return pairs_.begin(); }
        [[nodiscard]] auto end() const { return pairs_.end(); }

        void advanceCursors(float dt);
        void refreshAll();

        [[nodiscard]] SaveData makeSaveData() const;
        // Replaces the registry contents; throws if any track fails to rebuild,
        // in which case the registry is left untouched
        void loadSaveData(const SaveData& data, SpeedRange speeds = {});

    private:
        std::vector<TrackPair> pairs_;
    };

} // namespace dolly::track
