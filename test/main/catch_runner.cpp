/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "catch_runner.hpp"

#define CATCH_CONFIG_RUNNER
#include "catch2/catch.hpp"

// Catch2 only tolerates one session per process, so it lives forever.
static Catch::Session sSession;

int exec_catch2(int argc, char** argv) {
  // Otherwise options from previous runs would carry over.
  sSession.configData() = Catch::ConfigData();

  int res = sSession.applyCommandLine(argc, argv);
  if (res != 0) {
    return res;
  }
  return sSession.run() > 0 ? 1 : 0;
}
