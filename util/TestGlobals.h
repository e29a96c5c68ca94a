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
//-----------------------------------------------------------------------------
// Basic infrastructure that all self-tests use
#pragma once

#include "Timing.h"

#include <vector>

//-----------------------------------------------------------------------------
// Global variables from main.cpp

// What each test suite prints upon failure
extern const char * g_failstr;

// If not NULL, per-implementation tests only cover this implementation
extern const char * g_testImpl;

//-----------------------------------------------------------------------------
// Verbosity flags

typedef uint32_t flags_t;

#define REPORT(flagname, var) (!!(var & FLAG_REPORT_ ## flagname))

#define FLAG_REPORT_VERBOSE      (1 << 0)

//-----------------------------------------------------------------------------
// Recording test results for final summary printout

extern uint32_t g_testPass, g_testFail;
extern std::vector<std::pair<const char *, char *>> g_testFailures;
extern uint64_t g_prevtime;
extern bool     g_showTestTimes;

static inline void recordTestResult( bool pass, const char * suitename, const char * testname ) {
    if (testname != NULL) {
        // Skip any leading spaces in the testname
        testname += strspn(testname, " ");
    }

    if (g_showTestTimes) {
        uint64_t curtime = monotonic_clock();
        if (testname != NULL) {
            printf("Elapsed: %f seconds\t[%s\t%s]\n\n", (double)(curtime - g_prevtime) / (double)NSEC_PER_SEC,
                    suitename, testname);
        } else {
            printf("Elapsed: %f seconds\t[%s]\n\n", (double)(curtime - g_prevtime) / (double)NSEC_PER_SEC, suitename);
        }
        g_prevtime = curtime;
    }

    if (pass) {
        g_testPass++;
    } else {
        g_testFail++;

        char * ntestname = NULL;
        if (testname != NULL) {
            ntestname = strdup(testname);
            if (!ntestname) {
                printf("OOM\n");
                exit(1);
            }
        }
        g_testFailures.push_back(std::pair<const char *, char *>(suitename, ntestname));
    }
}
