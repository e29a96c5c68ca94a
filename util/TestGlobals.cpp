/*
 * B3Engine
 * Copyright (C) 2021-2022  Frank J. T. Wojcik
 *
 * This program is free software: you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see
 * <https://www.gnu.org/licenses/>.
 */
#include "Platform.h"
#include "TestGlobals.h"

//--------
// What each test suite prints upon failure
const char * g_failstr = "*********FAIL*********\n";

//--------
// Set by --impl
const char * g_testImpl = NULL;

//--------
// Overall test pass/fail counts
uint32_t g_testPass, g_testFail;
std::vector<std::pair<const char *, char *>> g_testFailures;

//--------
// Per-test timing
uint64_t g_prevtime;
bool     g_showTestTimes;
