/* SPDX-FileCopyrightText: 2025 Dolly Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "argument_parser.hpp"
#include <format>
#include <vector>

namespace dolly::app {

    std::string usage() {
        return "Usage: dolly --script <session.json> [options]\n"
               "\n"
               "Replays a recorded two-hand input session through the track editor.\n"
               "\n"
               "Options:\n"
               "  --script <file>      Input session to replay (required)\n"
               "  --config <file>      Settings JSON file\n"
               "  --save-dir <dir>     Directory holding track_state_<n>.json files\n"
               "  --log-level <level>  trace, debug, info, perf, warn, error, critical or off\n"
               "  --log-file <file>    Also write the log to this file\n"
               "  -h, --help           Show this message\n";
    }

    std::expected<AppParams, std::string> parse_args(const std::span<const std::string_view> args) {
        AppParams params;
        bool have_script = false;

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string_view arg = args[i];

            if (arg == "-h" || arg == "--help") {
                params.show_help = true;
                return params;
            }

            const bool takes_value = arg == "--script" || arg == "--config" || arg == "--save-dir" ||
                                     arg == "--log-level" || arg == "--log-file";
            if (!takes_value) {
                return std::unexpected(std::format("Unknown argument '{}'", arg));
            }
            if (i + 1 >= args.size()) {
                return std::unexpected(std::format("Missing value for {}", arg));
            }
            const std::string_view value = args[++i];

            if (arg == "--script") {
                params.script = value;
                have_script = true;
            } else if (arg == "--config") {
                params.config = value;
            } else if (arg == "--save-dir") {
                params.save_directory = value;
            } else if (arg == "--log-file") {
                params.log_file = value;
            } else {
                const auto level = core::parse_log_level(value);
                if (!level) {
                    return std::unexpected(std::format("Invalid log level '{}'", value));
                }
                params.log_level = *level;
            }
        }

        if (!have_script) {
            return std::unexpected("Missing required --script argument");
        }
        return params;
    }

    std::expected<AppParams, std::string> parse_args(const int argc, char* argv[]) {
        std::vector<std::string_view> args;
        args.reserve(argc > 1 ? static_cast<size_t>(argc - 1) : 0);
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }
        return parse_args(std::span<const std::string_view>(args));
    }

} // namespace dolly::app
