/* SPDX-FileCopyrightText: 2025 Dolly Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace dolly::app {

    struct AppParams {
        std::filesystem::path script;
        std::optional<std::filesystem::path> config;
        std::optional<std::filesystem::path> save_directory;
        std::optional<core::LogLevel> log_level;
        std::optional<std::filesystem::path> log_file;
        bool show_help = false;
    };

    // args excludes the program name
    std::expected<AppParams, std::string> parse_args(std::span<const std::string_view> args);
    std::expected<AppParams, std::string> parse_args(int argc, char* argv[]);

    [[nodiscard]] std::string usage();

} // namespace dolly::app
