/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "track_registry.hpp"
#include "core/logger.hpp"
#include <utility>

namespace dolly::track {

    size_t TrackRegistry::add(TrackPair pair) {
        pairs_.push_back(std::move(pair));
        return pairs_.size() - 1;
    }

    bool TrackRegistry::remove(const size_t index) {
        if (index >= pairs_.size()) return false;
        pairs_.erase(pairs_.begin() + static_cast<ptrdiff_t>(index));
        return true;
    }

    void TrackRegistry::clear() {
        pairs_.clear();
    }

    void TrackRegistry::advanceCursors(const float dt) {
        for (auto& pair : pairs_) {
            pair.advance(dt);
        }
    }

    void TrackRegistry::refreshAll() {
        LOG_TIMER_DEBUG("TrackRegistry::refreshAll");
        for (auto& pair : pairs_) {
            pair.refresh();
        }
    }

    SaveData TrackRegistry::makeSaveData() const {
        SaveData data;
        data.position_tracks.reserve(pairs_.size());
        data.look_tracks.reserve(pairs_.size());
        for (const auto& pair : pairs_) {
            data.position_tracks.push_back(pair.position().makeSaveState());
            data.look_tracks.push_back(pair.look().makeSaveState());
        }
        return data;
    }

    void TrackRegistry::loadSaveData(const SaveData& data, const SpeedRange speeds) {
        std::vector<TrackPair> loaded;
        loaded.reserve(data.position_tracks.size());
        for (size_t i = 0; i < data.position_tracks.size() && i < data.look_tracks.size(); ++i) {
            TrackPair pair(BezierTrack::fromSaveState(data.position_tracks[i], speeds),
                           BezierTrack::fromSaveState(data.look_tracks[i], speeds));
            pair.refresh();
            loaded.push_back(std::move(pair));
        }
        pairs_ = std::move(loaded);
        LOG_DEBUG("Registry loaded with {} track pairs", pairs_.size());
    }

} // namespace dolly::track
