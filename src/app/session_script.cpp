/* SPDX-FileCopyrightText: 2025 Dolly Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "session_script.hpp"
#include "core/logger.hpp"
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace dolly::app {

    namespace {
        // One hour of input at 60 Hz
        constexpr int MAX_FRAME_REPEAT = 60 * 60 * 60;

        glm::vec3 read_vec3(const nlohmann::json& j, const char* key, const glm::vec3& fallback) {
            if (!j.contains(key)) return fallback;
            const auto& v = j.at(key);
            return {v.at(0).get<float>(), v.at(1).get<float>(), v.at(2).get<float>()};
        }

        input::RawHandInput read_hand(const nlohmann::json& j) {
            input::RawHandInput raw;
            if (j.is_null()) return raw;

            raw.position = read_vec3(j, "position", raw.position);
            raw.pointer = read_vec3(j, "pointer", raw.pointer);
            if (j.contains("probe")) {
                raw.probe = read_vec3(j, "probe", raw.position);
            }
            if (j.contains("axis")) {
                raw.axis = {j["axis"].at(0).get<float>(), j["axis"].at(1).get<float>()};
            }
            raw.trigger = j.value("trigger", 0.0f);
            raw.grip = j.value("grip", 0.0f);

            raw.primary = j.value("primary", false);
            raw.secondary = j.value("secondary", false);
            raw.grip_button = j.value("grip_button", false);
            raw.trigger_button = j.value("trigger_button", false);
            raw.menu = j.value("menu", false);
            raw.axis_click = j.value("axis_click", false);
            return raw;
        }
    } // namespace

    std::expected<std::vector<SessionFrame>, std::string> session_from_json(const nlohmann::json& j) {
        try {
            std::vector<SessionFrame> frames;
            for (const auto& jf : j.at("frames")) {
                SessionFrame frame;
                frame.dt = jf.value("dt", DEFAULT_FRAME_DT);
                if (frame.dt < 0.0f) {
                    return std::unexpected(std::format("Frame {} has negative dt", frames.size()));
                }
                frame.dominant = read_hand(jf.value("dominant", nlohmann::json{}));
                frame.recessive = read_hand(jf.value("recessive", nlohmann::json{}));

                const int repeat = jf.value("repeat", 1);
                if (repeat < 0 || repeat > MAX_FRAME_REPEAT) {
                    return std::unexpected(std::format("Frame {} has repeat {} outside [0, {}]",
                                                       frames.size(), repeat, MAX_FRAME_REPEAT));
                }
                for (int i = 0; i < repeat; ++i) {
                    frames.push_back(frame);
                }
            }
            return frames;
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(std::format("Malformed session script: {}", e.what()));
        }
    }

    std::expected<std::vector<SessionFrame>, std::string> load_session(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return std::unexpected(std::format("Failed to open session script: {}", path.string()));
        }

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            return std::unexpected(std::format("Failed to parse session script {}: {}", path.string(), e.what()));
        }

        auto frames = session_from_json(j);
        if (frames) {
            LOG_INFO("Loaded {} frames from {}", frames->size(), path.string());
        }
        return frames;
    }

} // namespace dolly::app
