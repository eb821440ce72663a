/* SPDX-FileCopyrightText: 2025 Dolly Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/settings.hpp"
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace dolly::core {

    namespace {
        std::expected<float, std::string> readFloat(const nlohmann::json& j, const char* key, const float fallback) {
            if (!j.contains(key)) return fallback;
            if (!j[key].is_number()) {
                return std::unexpected(std::format("Setting '{}' must be a number", key));
            }
            return j[key].get<float>();
        }
    } // namespace

    std::expected<Settings, std::string> settingsFromJson(const nlohmann::json& j, Settings base) {
        if (!j.is_object()) {
            return std::unexpected("Settings must be a JSON object");
        }

        struct FloatKey {
            const char* name;
            float* target;
        };
        const FloatKey float_keys[] = {
            {"selection_radius", &base.selection_radius},
            {"adjustment_sensitivity", &base.adjustment_sensitivity},
            {"cast_sensitivity", &base.cast_sensitivity},
            {"probe_sensitivity", &base.probe_sensitivity},
            {"min_speed", &base.min_speed},
            {"max_speed", &base.max_speed},
            {"height_offset", &base.height_offset},
        };
        for (const auto& [name, target] : float_keys) {
            auto value = readFloat(j, name, *target);
            if (!value) return std::unexpected(value.error());
            *target = *value;
        }

        if (j.contains("save_directory")) {
            if (!j["save_directory"].is_string()) {
                return std::unexpected("Setting 'save_directory' must be a string");
            }
            base.save_directory = j["save_directory"].get<std::string>();
        }

        if (j.contains("log_level")) {
            if (!j["log_level"].is_string()) {
                return std::unexpected("Setting 'log_level' must be a string");
            }
            const auto name = j["log_level"].get<std::string>();
            const auto level = parse_log_level(name);
            if (!level) {
                return std::unexpected(std::format("Unknown log level '{}'", name));
            }
            base.log_level = *level;
        }

        if (j.contains("module_log_levels")) {
            const auto& modules = j["module_log_levels"];
            if (!modules.is_object()) {
                return std::unexpected("Setting 'module_log_levels' must be an object");
            }
            for (const auto& [name, value] : modules.items()) {
                const auto module = parse_log_module(name);
                if (!module) {
                    return std::unexpected(std::format("Unknown log module '{}'", name));
                }
                const auto level = value.is_string() ? parse_log_level(value.get<std::string>()) : std::nullopt;
                if (!level) {
                    return std::unexpected(std::format("Invalid log level for module '{}'", name));
                }
                base.module_log_levels[*module] = *level;
            }
        }

        if (auto valid = validateSettings(base); !valid) {
            return std::unexpected(valid.error());
        }
        return base;
    }

    std::expected<Settings, std::string> loadSettings(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return std::unexpected(std::format("Failed to open settings file: {}", path.string()));
        }

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            return std::unexpected(std::format("Failed to parse settings file {}: {}", path.string(), e.what()));
        }

        auto settings = settingsFromJson(j);
        if (settings) {
            LOG_INFO("Loaded settings from {}", path.string());
        }
        return settings;
    }

    std::expected<void, std::string> validateSettings(const Settings& settings) {
        if (settings.selection_radius <= 0.0f) {
            return std::unexpected(std::format("selection_radius must be positive, got {}", settings.selection_radius));
        }
        if (settings.min_speed <= 0.0f) {
            return std::unexpected(std::format("min_speed must be positive, got {}", settings.min_speed));
        }
        if (settings.min_speed >= settings.max_speed) {
            return std::unexpected(std::format("min_speed ({}) must be below max_speed ({})",
                                               settings.min_speed, settings.max_speed));
        }
        if (settings.adjustment_sensitivity < 0.0f || settings.cast_sensitivity < 0.0f ||
            settings.probe_sensitivity < 0.0f) {
            return std::unexpected("Sensitivities must not be negative");
        }
        return {};
    }

    void applyLogSettings(const Settings& settings) {
        auto& logger = Logger::get();
        logger.set_level(settings.log_level);
        for (const auto& [module, level] : settings.module_log_levels) {
            if (level == LogLevel::Off) {
                logger.enable_module(module, false);
            } else {
                logger.enable_module(module, true);
                logger.set_module_level(module, level);
            }
        }
    }

} // namespace dolly::core
