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
#include "Timing.h"
#include "TestGlobals.h"
#include "Random.h"
#include "Blake3.h"
#include "Blake3Parallel.h"
#include "version.h"

#include "PlatformTest.h"
#include "TreeTest.h"
#include "HasherTest.h"
#include "XofTest.h"
#include "HexTest.h"
#include "SpeedTest.h"

#include <cstdio>
#include <cstdint>
#include <cinttypes>
#include <cerrno>
#include <clocale>
#include <string>
#include <vector>

//-----------------------------------------------------------------------------
// Locally-visible configuration
static bool g_exitCodeResult = false;

static bool g_testAll;
static bool g_testPlatform;
static bool g_testTree;
static bool g_testHasher;
static bool g_testXof;
static bool g_testHex;
static bool g_testSpeed;

struct TestOpts {
    bool &       var;
    bool         defaultvalue;  // What "All" sets the test to
    bool         testspeedonly; // If true, then disabling test doesn't affect "All" testing
    const char * name;
};
static TestOpts g_testopts[] = {
    { g_testAll,              true,     false,    "All" },
    { g_testPlatform,         true,     false,    "Platform" },
    { g_testTree,             true,     false,    "Tree" },
    { g_testHasher,           true,     false,    "Hasher" },
    { g_testXof,              true,     false,    "Xof" },
    { g_testHex,              true,     false,    "Hex" },
    { g_testSpeed,           false,      true,    "Speed" },
};

static void set_default_tests( bool enable ) {
    for (size_t i = 0; i < sizeof(g_testopts) / sizeof(TestOpts); i++) {
        if (enable) {
            g_testopts[i].var = g_testopts[i].defaultvalue;
        } else if (g_testopts[i].defaultvalue) {
            g_testopts[i].var = false;
        }
    }
}

static void parse_tests( const char * str, bool enable_tests ) {
    while (*str != '\0') {
        size_t       len;
        const char * p = strchr(str, ',');
        if (p == NULL) {
            len = strlen(str);
        } else {
            len = p - str;
        }

        struct TestOpts * found = NULL;
        bool foundmultiple      = false;
        for (size_t i = 0; i < sizeof(g_testopts) / sizeof(TestOpts); i++) {
            const char * testname = g_testopts[i].name;
            // Allow the user to specify test names by case-agnostic
            // unique prefix.
            if (strncasecmp(str, testname, len) == 0) {
                if (found != NULL) {
                    foundmultiple = true;
                }
                found = &g_testopts[i];
                if (testname[len] == '\0') {
                    // Exact match found, don't bother looking further, and
                    // don't error out.
                    foundmultiple = false;
                    break;
                }
            }
        }
        if (foundmultiple) {
            printf("Ambiguous test name: --%stest=%.*s\n", enable_tests ? "" : "no", (int)len, str);
            goto error;
        }
        if (found == NULL) {
            printf("Invalid option: --%stest=%.*s\n", enable_tests ? "" : "no", (int)len, str);
            goto error;
        }

        found->var = enable_tests;

        // If "All" tests are being enabled or disabled, then adjust the
        // individual test variables to match. Otherwise, if a material
        // "All" test (not just a speed test) is being specifically
        // disabled, then don't consider "All" tests as being run.
        if (&found->var == &g_testAll) {
            set_default_tests(enable_tests);
        } else if (!enable_tests && found->defaultvalue && !found->testspeedonly) {
            g_testAll = false;
        }

        if (p == NULL) {
            break;
        }
        str += len + 1;
    }

    return;

  error:
    printf("Valid tests: --test=%s", g_testopts[0].name);
    for (size_t i = 1; i < sizeof(g_testopts) / sizeof(TestOpts); i++) {
        printf(",%s", g_testopts[i].name);
    }
    printf(" \n");
    exit(1);
}

static uint64_t parse_u64( const char * str, const char * what ) {
    errno = 0;
    char *   endptr;
    uint64_t value = strtoull(str, &endptr, 0);
    if ((errno != 0) || (str[0] == '\0') || (str[0] == '-') || (*endptr != '\0')) {
        printf("Error parsing %s \"%s\"\n", what, str);
        exit(1);
    }
    return value;
}

//-----------------------------------------------------------------------------
// Self-tests

static bool runTests( flags_t flags ) {
    bool result = true;

    if (g_testPlatform) {
        result &= PlatformTest(flags);
    }

    if (g_testTree) {
        result &= TreeTest(flags);
    }

    if (g_testHasher) {
        result &= HasherTest(flags);
    }

    if (g_testXof) {
        result &= XofTest(flags);
    }

    if (g_testHex) {
        result &= HexTest(flags);
    }

    if (g_testSpeed) {
        result &= SpeedTest(flags);
    }

    printf("----------------------------------------------------------------------------------------------\n");
    printf("Overall result: %s            ( %d / %d passed)\n", result ? "pass" : "FAIL",
            g_testPass, g_testPass + g_testFail);
    if (!result) {
        const char * prev = "";
        printf("Failures");
        for (auto x: g_testFailures) {
            if (strcmp(prev, x.first) != 0) {
                printf("%c\n    %-20s: [%s", (strlen(prev) == 0) ? ':' : ']', x.first, x.second ? x.second : "");
                prev = x.first;
            } else {
                printf(", %s", x.second ? x.second : "");
            }
        }
        printf("]\n");
    }
    printf("----------------------------------------------------------------------------------------------\n");
    for (auto x: g_testFailures) {
        free(x.second);
    }

    return result;
}

//-----------------------------------------------------------------------------
// Hashing files

struct SumOpts {
    bool          keyed;
    uint8_t       key[BLAKE3_KEY_LEN];
    const char *  context;
    uint64_t      length;
    uint64_t      seek;
    bool          parallel;
};

static const size_t SUM_BUFSIZE          = 64 * 1024;
static const size_t SUM_PARALLEL_BUFSIZE = 16 * 1024 * 1024;

static Blake3Hasher sum_hasher( const SumOpts & opts, const Blake3Platform & platform ) {
    if (opts.keyed) {
        return Blake3Hasher(opts.key, platform);
    }
    if (opts.context != NULL) {
        return Blake3Hasher::newDeriveKey(opts.context, platform);
    }
    return Blake3Hasher(platform);
}

static bool sum_file( const char * name, const SumOpts & opts, const Blake3Platform & platform ) {
    const bool is_stdin = (strcmp(name, "-") == 0);
    FILE *     f        = is_stdin ? stdin : fopen(name, "rb");

    if (f == NULL) {
        fprintf(stderr, "ERROR: could not open %s: %s\n", name, strerror(errno));
        return false;
    }

    Blake3Hasher         hasher = sum_hasher(opts, platform);
    Blake3ThreadJoiner   joiner;
    std::vector<uint8_t> buf( opts.parallel ? SUM_PARALLEL_BUFSIZE : SUM_BUFSIZE );
    size_t               n;

    while ((n = fread(&buf[0], 1, buf.size(), f)) > 0) {
        if (opts.parallel) {
            hasher.update_parallel(&buf[0], n, joiner);
        } else {
            hasher.update(&buf[0], n);
        }
    }

    const bool read_error = (ferror(f) != 0);
    if (!is_stdin) {
        fclose(f);
    }
    if (read_error) {
        fprintf(stderr, "ERROR: could not read %s\n", name);
        return false;
    }

    Blake3OutputReader reader = hasher.finalize_xof();
    uint8_t            out[BLAKE3_BLOCK_LEN];
    uint64_t           remaining = opts.length;

    reader.set_position(opts.seek);
    while (remaining > 0) {
        const size_t take = (remaining > sizeof(out)) ? sizeof(out) : (size_t)remaining;
        reader.fill(out, take);
        for (size_t i = 0; i < take; i++) {
            printf("%02x", out[i]);
        }
        remaining -= take;
    }
    printf("  %s\n", name);

    return true;
}

static bool sumFiles( const std::vector<const char *> & files, const SumOpts & opts,
        const Blake3Platform & platform ) {
    bool result = true;

    if (files.empty()) {
        return sum_file("-", opts, platform);
    }
    for (const char * name: files) {
        result &= sum_file(name, opts, platform);
    }
    return result;
}

//-----------------------------------------------------------------------------

static void usage( void ) {
    printf("Usage: B3Engine [--[no]test=<testname>[,...]] [--verbose] [--ncpu=N]\n"
           "                [--impl=<implname>] [--randseed=<RNG_base_seed>]\n"
           "                [--[no]exit-code-on-failure] [--[no]time-tests]\n"
           "\n"
           "       B3Engine --sum [--keyed=<64 hex digits>] [--derive-key=<context>]\n"
           "                [--length=N] [--seek=N] [--parallel] [--impl=<implname>]\n"
           "                [<file>|-]...\n"
           "\n"
           "       B3Engine [--list]|[--tests]|[--version]|[--help]\n"
           "\n"
           "  Implementation and test names can be supplied using any case letters.\n");
}

int main( int argc, const char ** argv ) {
    setbuf(stdout, NULL); // Unbuffer stdout always
    setbuf(stderr, NULL); // Unbuffer stderr always
    std::setlocale(LC_COLLATE, "C");
    std::setlocale(LC_CTYPE, "C");

    if (!isLE() && !isBE()) {
        printf("Runtime endian detection failed! Cannot continue\n");
        exit(1);
    }

    set_default_tests(true);

    bool                       summing = false;
    SumOpts                    sumopts = {};
    std::vector<const char *>  files;
    const char *               implname = NULL;

    sumopts.length = BLAKE3_OUT_LEN;

    flags_t flags = 0;
    for (int argnb = 1; argnb < argc; argnb++) {
        const char * const arg = argv[argnb];
        if ((strncmp(arg, "--", 2) == 0) && (arg[2] != '\0')) {
            // This is a command
            if (strcmp(arg, "--help") == 0) {
                usage();
                exit(0);
            }
            if (strcmp(arg, "--list") == 0) {
                listImpls();
                exit(0);
            }
            if (strcmp(arg, "--tests") == 0) {
                printf("Valid tests:\n");
                for (size_t i = 0; i < sizeof(g_testopts) / sizeof(TestOpts); i++) {
                    printf("  %s\n", g_testopts[i].name);
                }
                exit(0);
            }
            if (strcmp(arg, "--version") == 0) {
                printf("B3Engine %s\n", VERSION);
                exit(0);
            }
            if (strcmp(arg, "--verbose") == 0) {
                flags |= FLAG_REPORT_VERBOSE;
                continue;
            }
            if (strcmp(arg, "--exit-code-on-failure") == 0) {
                g_exitCodeResult = true;
                continue;
            }
            if (strcmp(arg, "--noexit-code-on-failure") == 0) {
                g_exitCodeResult = false;
                continue;
            }
            if (strcmp(arg, "--time-tests") == 0) {
                g_showTestTimes = true;
                continue;
            }
            if (strcmp(arg, "--notime-tests") == 0) {
                g_showTestTimes = false;
                continue;
            }
            if (strncmp(arg, "--randseed=", 11) == 0) {
                Rand::GLOBAL_SEED = parse_u64(&arg[11], "RNG seed value");
                continue;
            }
            if (strncmp(arg, "--ncpu=", 7) == 0) {
#if defined(HAVE_THREADS)
                errno = 0;
                char *   endptr;
                long int Ncpu = strtol(&arg[7], &endptr, 0);
                if ((errno != 0) || (arg[7] == '\0') || (*endptr != '\0') || (Ncpu < 1)) {
                    printf("Error parsing cpu number \"%s\"\n", &arg[7]);
                    exit(1);
                }
                if (Ncpu > 32) {
                    printf("WARNING: limiting to 32 threads\n");
                    Ncpu = 32;
                }
                g_NCPU = Ncpu;
                continue;
#else
                printf("WARNING: compiled without threads; ignoring --ncpu\n");
                continue;
#endif
            }
            if (strncmp(arg, "--impl=", 7) == 0) {
                implname = &arg[7];
                continue;
            }
            if (strncmp(arg, "--test=", 7) == 0) {
                // If a list of tests is given, only test those
                g_testAll = false;
                set_default_tests(false);
                parse_tests(&arg[7], true);
                continue;
            }
            if (strncmp(arg, "--notest=", 9) == 0) {
                parse_tests(&arg[9], false);
                continue;
            }
            if (strcmp(arg, "--sum") == 0) {
                summing = true;
                continue;
            }
            if (strncmp(arg, "--keyed=", 8) == 0) {
                Blake3Hash  key;
                std::string err;
                if (!Blake3Hash::fromHex(&arg[8], strlen(&arg[8]), &key, &err)) {
                    printf("Error parsing key: %s\n", err.c_str());
                    exit(1);
                }
                memcpy(sumopts.key, key.as_bytes(), BLAKE3_KEY_LEN);
                sumopts.keyed = true;
                continue;
            }
            if (strncmp(arg, "--derive-key=", 13) == 0) {
                sumopts.context = &arg[13];
                continue;
            }
            if (strncmp(arg, "--length=", 9) == 0) {
                sumopts.length = parse_u64(&arg[9], "output length");
                continue;
            }
            if (strncmp(arg, "--seek=", 7) == 0) {
                sumopts.seek = parse_u64(&arg[7], "output position");
                continue;
            }
            if (strcmp(arg, "--parallel") == 0) {
                sumopts.parallel = true;
                continue;
            }
            // invalid command
            printf("Invalid command \n");
            usage();
            exit(1);
        }
        // Not a command ? => interpreted as a file name
        files.push_back(arg);
    }

    const Blake3Impl * impl = NULL;
    if (implname != NULL) {
        if ((impl = findImpl(implname)) == NULL) {
            blake3_fatal("unknown implementation '%s' (see --list)", implname);
        }
        if (!impl->Supported()) {
            blake3_fatal("implementation '%s' is not supported on this CPU", impl->name);
        }
        g_testImpl = impl->name;
    }

    if (summing) {
        if (sumopts.keyed && (sumopts.context != NULL)) {
            printf("--keyed and --derive-key cannot be used together\n");
            exit(1);
        }
        if (sumopts.length > UINT64_MAX - sumopts.seek) {
            printf("--seek plus --length is past the end of the output\n");
            exit(1);
        }
        const Blake3Platform platform = (impl != NULL) ? Blake3Platform(impl) : Blake3Platform::detect();
        return sumFiles(files, sumopts, platform) ? 0 : 1;
    }

    if (!files.empty()) {
        printf("File names are only used with --sum\n");
        usage();
        exit(1);
    }

    printf("B3Engine %s self-test, using %s by default\n\n", VERSION, Blake3Platform::detect().name());

    bool     result    = true;
    uint64_t timeBegin = g_prevtime = monotonic_clock();

    result = runTests(flags);

    uint64_t timeEnd = monotonic_clock();

    printf("Testing took %f seconds\n\n", (double)(timeEnd - timeBegin) / (double)NSEC_PER_SEC);

    return (!result && g_exitCodeResult) ? 99 : 0;
}
