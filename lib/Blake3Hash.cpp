/*
 * BLAKE3 engine
 * Copyright (C) 2021-2022  Frank J. T. Wojcik
 *
 * Permission is hereby granted, free of charge, to any person
 * obtaining a copy of this software and associated documentation
 * files (the "Software"), to deal in the Software without
 * restriction, including without limitation the rights to use,
 * copy, modify, merge, publish, distribute, sublicense, and/or
 * sell copies of the Software, and to permit persons to whom the
 * Software is furnished to do so, subject to the following
 * conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
 * OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT
 * HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,
 * WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
 * FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR
 * OTHER DEALINGS IN THE SOFTWARE.
 *
 * based on:
 *     BLAKE3 source code package - official C implementations
 * used under terms of CC0.
 */
#include "Platform.h"
#include "Blake3.h"

static const char hexdigits[] = "0123456789abcdef";

Blake3Hash Blake3Hash::fromBytes( const uint8_t in[BLAKE3_OUT_LEN] ) {
    Blake3Hash h;

    memcpy(h.bytes, in, BLAKE3_OUT_LEN);
    return h;
}

std::string Blake3Hash::toHex( void ) const {
    std::string s(2 * BLAKE3_OUT_LEN, '0');

    for (size_t i = 0; i < BLAKE3_OUT_LEN; i++) {
        s[2 * i + 0] = hexdigits[bytes[i] >> 4];
        s[2 * i + 1] = hexdigits[bytes[i] & 15];
    }
    return s;
}

static int hexval( char c ) {
    if ((c >= '0') && (c <= '9')) {
        return c - '0';
    }
    if ((c >= 'a') && (c <= 'f')) {
        return c - 'a' + 10;
    }
    if ((c >= 'A') && (c <= 'F')) {
        return c - 'A' + 10;
    }
    return -1;
}

// ASCII is shown as a quoted character, with the usual backslash
// escapes and \u{..} for other control characters. Anything else is
// shown as a hex byte value.
static void describe_hex_char( unsigned char c, char * buf, size_t buflen ) {
    const char * esc = NULL;

    if (c >= 0x80) {
        snprintf(buf, buflen, "0x%x", c);
        return;
    }
    switch (c) {
    case '\0':  esc = "\\0";  break;
    case '\t':  esc = "\\t";  break;
    case '\n':  esc = "\\n";  break;
    case '\r':  esc = "\\r";  break;
    case '\'': esc = "\\'";  break;
    case '\\': esc = "\\\\"; break;
    }
    if (esc != NULL) {
        snprintf(buf, buflen, "'%s'", esc);
    } else if ((c < 0x20) || (c == 0x7f)) {
        snprintf(buf, buflen, "'\\u{%x}'", c);
    } else {
        snprintf(buf, buflen, "'%c'", c);
    }
}

bool Blake3Hash::fromHex( const char * hex, size_t len, Blake3Hash * out, std::string * err ) {
    uint8_t tmp[BLAKE3_OUT_LEN];
    char    msg[64];

    if (len != 2 * BLAKE3_OUT_LEN) {
        snprintf(msg, sizeof(msg), "expected %d hex bytes, received %zu", 2 * BLAKE3_OUT_LEN, len);
        *err = msg;
        return false;
    }
    for (size_t i = 0; i < len; i++) {
        const unsigned char c = (unsigned char)hex[i];
        const int           v = hexval((char)c);
        if (v < 0) {
            char desc[16];
            describe_hex_char(c, desc, sizeof(desc));
            snprintf(msg, sizeof(msg), "invalid hex character: %s", desc);
            *err = msg;
            return false;
        }
        if ((i & 1) == 0) {
            tmp[i / 2]  = (uint8_t)(v << 4);
        } else {
            tmp[i / 2] |= (uint8_t)v;
        }
    }
    memcpy(out->bytes, tmp, BLAKE3_OUT_LEN);
    return true;
}

// Constant time
bool Blake3Hash::operator == ( const Blake3Hash & other ) const {
    volatile uint8_t diff = 0;

    for (size_t i = 0; i < BLAKE3_OUT_LEN; i++) {
        diff |= bytes[i] ^ other.bytes[i];
    }
    return diff == 0;
}
