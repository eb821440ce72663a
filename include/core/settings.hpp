/* SPDX-FileCopyrightText: 2025 Dolly Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"
#include <expected>
#include <filesystem>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace dolly::core {

    // Tunables for the interaction states. Every key in the settings file is optional.
    struct Settings {
        float selection_radius = 0.075f;
        float adjustment_sensitivity = 0.3f;
        float cast_sensitivity = 2.0f;
        float probe_sensitivity = 0.5f;
        float min_speed = 0.01f;
        float max_speed = 0.3f;
        float height_offset = 0.0f;
        std::filesystem::path save_directory = ".";
        LogLevel log_level = LogLevel::Info;
        // Per-module thresholds on top of log_level; Off silences the module
        std::map<LogModule, LogLevel> module_log_levels;
    };

    // Reads settings from a JSON file, keeping defaults for missing keys
    std::expected<Settings, std::string> loadSettings(const std::filesystem::path& path);

    // Applies the keys present in j on top of base
    std::expected<Settings, std::string> settingsFromJson(const nlohmann::json& j, Settings base = {});

    std::expected<void, std::string> validateSettings(const Settings& settings);

    // Pushes the global and per-module log levels into the Logger
    void applyLogSettings(const Settings& settings);

} // namespace dolly::core
