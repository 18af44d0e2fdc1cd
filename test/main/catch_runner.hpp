/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

/*
 * Runs the registered test cases with the given command line. Returns 0 iff
 * every test passed. Safe to call repeatedly from the console.
 */
int exec_catch2(int argc, char** argv);
