/* SPDX-FileCopyrightText: 2025 Dolly Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "argument_parser.hpp"
#include "core/settings.hpp"
#include "session_script.hpp"
#include "states/state_manager.hpp"
#include <expected>
#include <string>
#include <vector>

namespace dolly::app {

    // Headless driver: replays a recorded session through a StateManager
    class Application {
    public:
        int run(const AppParams& params);

        // Runs every frame through the manager, deriving button edges per hand
        static void replay(states::StateManager& manager, const std::vector<SessionFrame>& frames);

    private:
        static std::expected<core::Settings, std::string> resolve_settings(const AppParams& params);
        static void log_summary(const states::StateManager& manager);
    };

} // namespace dolly::app
