/* SPDX-FileCopyrightText: 2025 Dolly Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "input/hand_input.hpp"
#include <expected>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace dolly::app {

    inline constexpr float DEFAULT_FRAME_DT = 1.0f / 60.0f;

    // One recorded tick of device input
    struct SessionFrame {
        float dt = DEFAULT_FRAME_DT;
        input::RawHandInput dominant;
        input::RawHandInput recessive;
    };

    // {"frames":[{"dt":s, "repeat":n, "dominant":{...}, "recessive":{...}}, ...]}
    // A frame with "repeat" is expanded into n identical frames.
    std::expected<std::vector<SessionFrame>, std::string> session_from_json(const nlohmann::json& j);
    std::expected<std::vector<SessionFrame>, std::string> load_session(const std::filesystem::path& path);

} // namespace dolly::app
