/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <nlohmann/json_fwd.hpp>
#include <vector>

namespace dolly::track {

    // Everything needed to rebuild one BezierTrack
    struct TrackSaveState {
        std::vector<glm::vec3> control_point_positions;
        std::vector<float> checkpoint_t_values;
        std::vector<float> checkpoint_speeds;
    };

    // Contents of one save file. Index i of both lists forms track pair i.
    struct SaveData {
        std::vector<TrackSaveState> position_tracks;
        std::vector<TrackSaveState> look_tracks;
    };

    [[nodiscard]] nlohmann::json toJson(const TrackSaveState& state);
    [[nodiscard]] nlohmann::json toJson(const SaveData& data);

    // Both throw on malformed input (nlohmann::json::exception or std::runtime_error)
    [[nodiscard]] TrackSaveState trackStateFromJson(const nlohmann::json& j);
    [[nodiscard]] SaveData saveDataFromJson(const nlohmann::json& j);

} // namespace dolly::track
