/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "save_state.hpp"
#include <format>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace dolly::track {

    namespace {
        constexpr const char* KEY_CONTROL_POINTS = "controlPointPositions";
        constexpr const char* KEY_CHECKPOINT_T = "checkpointTValues";
        constexpr const char* KEY_CHECKPOINT_SPEEDS = "checkpointSpeeds";
        constexpr const char* KEY_POSITION_TRACKS = "positionTracks";
        constexpr const char* KEY_LOOK_TRACKS = "lookTracks";

        glm::vec3 vec3FromJson(const nlohmann::json& j) {
            if (!j.is_array() || j.size() != 3) {
                throw std::runtime_error(std::format("Expected [x,y,z] control point, got {}", j.dump()));
            }
            return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>()};
        }

        std::vector<TrackSaveState> trackListFromJson(const nlohmann::json& j, const char* key) {
            std::vector<TrackSaveState> tracks;
            for (const auto& jt : j.at(key)) {
                tracks.push_back(trackStateFromJson(jt));
            }
            return tracks;
        }
    } // namespace

    nlohmann::json toJson(const TrackSaveState& state) {
        nlohmann::json j;
        j[KEY_CONTROL_POINTS] = nlohmann::json::array();
        for (const auto& p : state.control_point_positions) {
            j[KEY_CONTROL_POINTS].push_back({p.x, p.y, p.z});
        }
        j[KEY_CHECKPOINT_T] = state.checkpoint_t_values;
        j[KEY_CHECKPOINT_SPEEDS] = state.checkpoint_speeds;
        return j;
    }

    nlohmann::json toJson(const SaveData& data) {
        nlohmann::json j;
        j[KEY_POSITION_TRACKS] = nlohmann::json::array();
        j[KEY_LOOK_TRACKS] = nlohmann::json::array();
        for (const auto& t : data.position_tracks) {
            j[KEY_POSITION_TRACKS].push_back(toJson(t));
        }
        for (const auto& t : data.look_tracks) {
            j[KEY_LOOK_TRACKS].push_back(toJson(t));
        }
        return j;
    }

    TrackSaveState trackStateFromJson(const nlohmann::json& j) {
        TrackSaveState state;
        for (const auto& jp : j.at(KEY_CONTROL_POINTS)) {
            state.control_point_positions.push_back(vec3FromJson(jp));
        }
        state.checkpoint_t_values = j.at(KEY_CHECKPOINT_T).get<std::vector<float>>();
        state.checkpoint_speeds = j.at(KEY_CHECKPOINT_SPEEDS).get<std::vector<float>>();
        return state;
    }

    SaveData saveDataFromJson(const nlohmann::json& j) {
        SaveData data;
        data.position_tracks = trackListFromJson(j, KEY_POSITION_TRACKS);
        data.look_tracks = trackListFromJson(j, KEY_LOOK_TRACKS);
        if (data.position_tracks.size() != data.look_tracks.size()) {
            throw std::runtime_error(std::format("Save data has {} position tracks but {} look tracks",
                                                 data.position_tracks.size(), data.look_tracks.size()));
        }
        return data;
    }

} // namespace dolly::track
