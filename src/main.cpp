/* SPDX-FileCopyrightText: 2025 Dolly Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "app/argument_parser.hpp"
#include "core/logger.hpp"

#include <print>
#include <string>
#include <utility>

int main(int argc, char* argv[]) {
    auto params_result = dolly::app::parse_args(argc, argv);
    if (!params_result) {
        std::println(stderr, "Error: {}\n\n{}", params_result.error(), dolly::app::usage());
        return -1;
    }

    auto params = std::move(*params_result);
    if (params.show_help) {
        std::print("{}", dolly::app::usage());
        return 0;
    }

    dolly::core::Logger::get().init(params.log_level.value_or(dolly::core::LogLevel::Info),
                                    params.log_file ? params.log_file->string() : std::string{});

    LOG_INFO("========================================");
    LOG_INFO("Dolly");
    LOG_INFO("========================================");

    dolly::app::Application app;
    const int rc = app.run(params);
    dolly::core::Logger::get().flush();
    return rc;
}
