/*
 * Copyright (c) 2021-present, Trail of Bits, Inc.
 * All rights reserved.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/cfg/argv.h>

int main(int argc, char** argv) {
    // tests that provoke errors are quiet unless SPDLOG_LEVEL says otherwise
    spdlog::set_level(spdlog::level::critical);
    spdlog::cfg::load_env_levels();
    spdlog::cfg::load_argv_levels(argc, argv);

    doctest::Context context;
    context.applyCommandLine(argc, argv);

    return context.run();
}
