/* SPDX-FileCopyrightText: 2025 Dolly Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "application.hpp"
#include "core/logger.hpp"
#include "io/track_store.hpp"
#include <memory>
#include <utility>

namespace dolly::app {

    std::expected<core::Settings, std::string> Application::resolve_settings(const AppParams& params) {
        core::Settings settings;
        if (params.config) {
            auto loaded = core::loadSettings(*params.config);
            if (!loaded) return std::unexpected(loaded.error());
            settings = std::move(*loaded);
        }
        if (params.save_directory) {
            settings.save_directory = *params.save_directory;
        }
        if (params.log_level) {
            settings.log_level = *params.log_level;
        }
        return settings;
    }

    void Application::replay(states::StateManager& manager, const std::vector<SessionFrame>& frames) {
        LOG_TIMER("Session replay");
        input::InputEdgeTracker dominant;
        input::InputEdgeTracker recessive;
        for (const auto& frame : frames) {
            manager.tick(dominant.update(frame.dominant), recessive.update(frame.recessive), frame.dt);
        }
    }

    void Application::log_summary(const states::StateManager& manager) {
        const auto& registry = manager.registry();
        LOG_INFO("Replayed {} ticks, final state: {}", manager.tickCount(), states::stateName(manager.activeState()));
        LOG_INFO("{} track pairs", registry.size());
        for (size_t i = 0; i < registry.size(); ++i) {
            const auto& pair = registry.at(i);
            LOG_INFO("  Track {}: {} position / {} look control points, {} checkpoints, cursor {:.3f}",
                     i + 1, pair.position().controlPointCount(), pair.look().controlPointCount(),
                     pair.position().checkpointCount(), pair.cursor());
            if (!pair.checkpointsInSync()) {
                LOG_WARN("  Track {} has diverging checkpoints", i + 1);
            }
        }
        const auto& rig = manager.rig().position;
        LOG_INFO("Rig position: ({:.3f}, {:.3f}, {:.3f})", rig.x, rig.y, rig.z);
    }

    int Application::run(const AppParams& params) {
        auto settings = resolve_settings(params);
        if (!settings) {
            LOG_ERROR("Invalid configuration: {}", settings.error());
            return -1;
        }
        core::applyLogSettings(*settings);

        auto frames = load_session(params.script);
        if (!frames) {
            LOG_ERROR("{}", frames.error());
            return -1;
        }

        try {
            states::StateManager manager(*settings, std::make_unique<io::JsonTrackStore>(settings->save_directory));
            replay(manager, *frames);
            manager.refreshAll();
            log_summary(manager);
        } catch (const std::exception& e) {
            LOG_CRITICAL("Session aborted: {}", e.what());
            return -1;
        }
        return 0;
    }

} // namespace dolly::app
