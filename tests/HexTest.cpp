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
#include "Blake3.h"

#include "TestVectors.h"
#include "HexTest.h"

#include <string>
#include <cctype>

#define maybeprintf(...) if (REPORT(VERBOSE, flags)) { printf(__VA_ARGS__); }

static bool expect_error( const std::string & hex, const char * expected_err, flags_t flags ) {
    const Blake3Hash untouched = blake3_hash("untouched", 9);
    Blake3Hash       out       = untouched;
    std::string      err;

    if (Blake3Hash::fromHex(hex.data(), hex.size(), &out, &err)) {
        maybeprintf(" \"%s\" parsed unexpectedly:", hex.c_str());
        return false;
    }
    if (err != expected_err) {
        maybeprintf(" got error \"%s\", expected \"%s\":", err.c_str(), expected_err);
        return false;
    }
    return out == untouched;
}

bool HexTest( flags_t flags ) {
    const char * foo_hex = "04e0bb39f30b1a3feb89f536c93be15055482df748674b00d26e5a75777702e9";
    bool         result  = true;

    printf("[[[ Hex Tests ]]]\n\n");

    const Blake3Hash foo = blake3_hash("foo", 3);
    result &= foo.toHex() == foo_hex;

    // Either case parses, and round-trips to lower case
    std::string upper = foo_hex;
    for (size_t i = 0; i < upper.size(); i++) {
        upper[i] = (char)toupper((unsigned char)upper[i]);
    }
    Blake3Hash  parsed;
    std::string err;
    result &= Blake3Hash::fromHex(upper.data(), upper.size(), &parsed, &err);
    result &= parsed == foo;
    result &= parsed.toHex() == foo_hex;
    result &= memcmp(parsed.as_bytes(), foo.as_bytes(), BLAKE3_OUT_LEN) == 0;

    uint8_t bytes[BLAKE3_OUT_LEN];
    paint_test_input(bytes, sizeof(bytes));
    result &= Blake3Hash::fromBytes(bytes).toHex() ==
            "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f";

    recordTestResult(result, "Hex", "Encode and decode");

    // Equality is over every byte
    bool eqresult = true;
    for (size_t i = 0; i < BLAKE3_OUT_LEN; i++) {
        uint8_t other[BLAKE3_OUT_LEN];
        memcpy(other, bytes, sizeof(other));
        other[i] ^= 0x80;
        eqresult &= Blake3Hash::fromBytes(other) != Blake3Hash::fromBytes(bytes);
        eqresult &= !(Blake3Hash::fromBytes(other) == Blake3Hash::fromBytes(bytes));
    }
    eqresult &= Blake3Hash::fromBytes(bytes) == Blake3Hash::fromBytes(bytes);
    recordTestResult(eqresult, "Hex", "Equality");
    result   &= eqresult;

    bool errresult = true;
    errresult &= expect_error("0123456789abc", "expected 64 hex bytes, received 13", flags);
    errresult &= expect_error(std::string(foo_hex) + "0", "expected 64 hex bytes, received 65", flags);
    errresult &= expect_error("", "expected 64 hex bytes, received 0", flags);

    std::string bad = foo_hex;
    bad[17] = 'Z';
    errresult &= expect_error(bad, "invalid hex character: 'Z'", flags);
    bad[17] = ' ';
    errresult &= expect_error(bad, "invalid hex character: ' '", flags);
    bad[17] = (char)0x80;
    errresult &= expect_error(bad, "invalid hex character: 0x80", flags);
    bad[17] = (char)0xff;
    errresult &= expect_error(bad, "invalid hex character: 0xff", flags);
    bad[17] = '\n';
    errresult &= expect_error(bad, "invalid hex character: '\\n'", flags);
    bad[17] = '\t';
    errresult &= expect_error(bad, "invalid hex character: '\\t'", flags);
    bad[17] = '\'';
    errresult &= expect_error(bad, "invalid hex character: '\\''", flags);
    bad[17] = '\\';
    errresult &= expect_error(bad, "invalid hex character: '\\\\'", flags);
    bad[17] = (char)0x01;
    errresult &= expect_error(bad, "invalid hex character: '\\u{1}'", flags);
    bad[17] = (char)0x1b;
    errresult &= expect_error(bad, "invalid hex character: '\\u{1b}'", flags);
    bad[17] = (char)0x7f;
    errresult &= expect_error(bad, "invalid hex character: '\\u{7f}'", flags);
    bad[17] = '\0';
    errresult &= expect_error(bad, "invalid hex character: '\\0'", flags);
    recordTestResult(errresult, "Hex", "Errors");
    result    &= errresult;

    printf("%s\n", result ? "pass" : "FAIL");
    printf("\n%s", result ? "" : g_failstr);

    return result;
}
