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
#include "Random.h"
#include "Blake3.h"

#include "TestVectors.h"
#include "PlatformTest.h"

#include <vector>

// These sentinel bytes MUST be different values
static const uint8_t  sentinel1 = 0x5c;
static const uint8_t  sentinel2 = 0x36;
static_assert(sentinel1 != sentinel2, "valid sentinel bytes in PlatformTest");

static const uint32_t column_marker = 0xA5A5A5A5;

#define maybeprintf(...) if (REPORT(VERBOSE, flags)) { printf(__VA_ARGS__); }

static bool verify_sentinel( const uint8_t * buf, size_t len, const uint8_t sentinel, flags_t flags ) {
    for (size_t i = 0; i < len; i++) {
        if (buf[i] != sentinel) {
            maybeprintf(" guard byte %zu: 0x%02X != 0x%02X:", i, buf[i], sentinel);
            return false;
        }
    }
    return true;
}

static bool verify_bytes( const uint8_t * expected, const uint8_t * actual, size_t len, flags_t flags ) {
    if (likely(memcmp(expected, actual, len) == 0)) {
        return true;
    }
    for (size_t i = 0; i < len; i++) {
        if (expected[i] != actual[i]) {
            maybeprintf(" byte %zu mismatch (0x%02X != 0x%02X):", i, actual[i], expected[i]);
            break;
        }
    }
    return false;
}

static bool verify_column( const Blake3TransposedVectors & tv, size_t column, const uint32_t expected[8],
        flags_t flags ) {
    uint32_t actual[8];

    tv.getColumn(column, actual);
    if (memcmp(actual, expected, sizeof(actual)) == 0) {
        return true;
    }
    maybeprintf(" column %zu mismatch:", column);
    return false;
}

static void test_key_words( uint32_t key[8] ) {
    words_from_le_bytes_32(test_key_bytes(), key);
}

//-----------------------------------------------------------------------------
// Small helpers and the registry

static bool test_helpers( flags_t flags ) {
    bool result = true;

    maybeprintf("Checking helpers and registry     ");

    result &= counter_low(UINT64_C(0x123456789abcdef0)) == UINT32_C(0x9abcdef0);
    result &= counter_high(UINT64_C(0x123456789abcdef0)) == UINT32_C(0x12345678);

    result &= largest_power_of_two_leq(0) == 1;
    result &= largest_power_of_two_leq(1) == 1;
    result &= largest_power_of_two_leq(2) == 2;
    result &= largest_power_of_two_leq(3) == 2;
    result &= largest_power_of_two_leq(4) == 4;
    result &= largest_power_of_two_leq(1000) == 512;
    result &= largest_power_of_two_leq(UINT64_MAX) == (UINT64_C(1) << 63);

    result &= left_len(BLAKE3_CHUNK_LEN + 1) == BLAKE3_CHUNK_LEN;
    result &= left_len(2 * BLAKE3_CHUNK_LEN - 1) == BLAKE3_CHUNK_LEN;
    result &= left_len(2 * BLAKE3_CHUNK_LEN) == BLAKE3_CHUNK_LEN;
    result &= left_len(2 * BLAKE3_CHUNK_LEN + 1) == 2 * BLAKE3_CHUNK_LEN;
    result &= left_len(3 * BLAKE3_CHUNK_LEN) == 2 * BLAKE3_CHUNK_LEN;
    result &= left_len(4 * BLAKE3_CHUNK_LEN) == 2 * BLAKE3_CHUNK_LEN;
    result &= left_len(4 * BLAKE3_CHUNK_LEN + 1) == 4 * BLAKE3_CHUNK_LEN;

    uint8_t  bytes[32], bytes2[32];
    uint32_t words[8];
    paint_test_input(bytes, sizeof(bytes));
    words_from_le_bytes_32(bytes, words);
    le_bytes_from_words_32(words, bytes2);
    result &= words[0] == UINT32_C(0x03020100);
    result &= words[7] == UINT32_C(0x1f1e1d1c);
    result &= memcmp(bytes, bytes2, sizeof(bytes)) == 0;

    // Each schedule row is the previous one, permuted
    for (size_t i = 0; i < 16; i++) {
        result &= BLAKE3_MSG_SCHEDULE[0][i] == i;
    }
    for (size_t r = 1; r < 7; r++) {
        for (size_t i = 0; i < 16; i++) {
            result &= BLAKE3_MSG_SCHEDULE[r][i] == BLAKE3_MSG_SCHEDULE[r - 1][BLAKE3_MSG_PERMUTATION[i]];
        }
    }

    const Blake3Impl * portable = findImpl("PORTABLE");
    result &= (portable != NULL) && (portable == Blake3Platform::portable().implementation());
    result &= findImpl("no-such-implementation") == NULL;

    const Blake3Platform best = Blake3Platform::detect();
    result &= best.implementation()->Supported();
    for (const Blake3Impl * impl: findAllImpls()) {
        if (impl->Supported() && (impl->simd_degree > best.simd_degree())) {
            maybeprintf(" %s is wider than the detected %s:", impl->name, best.name());
            result = false;
        }
    }

    recordTestResult(result, "Platform", "Helpers");

    maybeprintf("%s\n", result ? "pass" : "FAIL");
    return result;
}

//-----------------------------------------------------------------------------
// Single-block compression, checked against the reference for the
// portable variant and against portable for the others

static bool test_compress( const Blake3Platform & impl, const Blake3Platform & portable, flags_t flags ) {
    const uint8_t  test_flags[] = { 0, CHUNK_START | CHUNK_END | ROOT, KEYED_HASH | PARENT };
    const uint8_t  test_lens[]  = { BLAKE3_BLOCK_LEN, 23, 0 };
    const uint64_t counter      = UINT64_C(0x0000000712345678);
    uint8_t        block[BLAKE3_BLOCK_LEN];
    uint32_t       block_words[16];
    uint32_t       key[8];
    bool           result       = true;

    paint_test_input(block, sizeof(block));
    for (size_t i = 0; i < 16; i++) {
        block_words[i] = GET_U32_LE(block, 4 * i);
    }
    test_key_words(key);

    for (uint8_t fl: test_flags) {
        for (uint8_t len: test_lens) {
            uint32_t ref_out[16];
            uint8_t  ref_bytes[64];
            uint32_t cv_impl[8], cv_port[8];
            uint8_t  xof_impl[64], xof_port[64];

            ref_compress(key, block_words, counter, len, fl, ref_out);
            for (size_t i = 0; i < 16; i++) {
                PUT_U32_LE(ref_out[i], ref_bytes, 4 * i);
            }

            memcpy(cv_impl, key, sizeof(cv_impl));
            memcpy(cv_port, key, sizeof(cv_port));
            impl.compress_in_place(cv_impl, block, len, counter, fl);
            portable.compress_in_place(cv_port, block, len, counter, fl);
            result &= memcmp(cv_port, ref_out, sizeof(cv_port)) == 0;
            result &= memcmp(cv_impl, cv_port, sizeof(cv_impl)) == 0;

            impl.compress_xof(key, block, len, counter, fl, xof_impl);
            portable.compress_xof(key, block, len, counter, fl, xof_port);
            result &= verify_bytes(ref_bytes, xof_port, 64, flags);
            result &= verify_bytes(xof_port, xof_impl, 64, flags);
        }
    }

    recordTestResult(result, "Platform", "compress");

    return result;
}

//-----------------------------------------------------------------------------
// hash_many() over whole chunks and over parent nodes

static bool test_hash_many( const Blake3Platform & impl, const Blake3Platform & portable, flags_t flags ) {
    const size_t         NUM_INPUTS  = BLAKE3_MAX_SIMD_DEGREE_OR_2;
    const size_t         input_counts[] = { 1, 5, NUM_INPUTS };
    std::vector<uint8_t> input( NUM_INPUTS * BLAKE3_CHUNK_LEN );
    const uint8_t *      inputs[NUM_INPUTS];
    uint8_t              expected[NUM_INPUTS * BLAKE3_OUT_LEN];
    uint8_t              out[(NUM_INPUTS + 1) * BLAKE3_OUT_LEN];
    uint32_t             key[8];
    bool                 result = true;

    paint_test_input(&input[0], input.size());
    test_key_words(key);

    for (uint64_t counter: INITIAL_COUNTERS) {
        // Chunks
        for (size_t i = 0; i < NUM_INPUTS; i++) {
            uint32_t cv[8];
            inputs[i] = &input[i * BLAKE3_CHUNK_LEN];
            memcpy(cv, key, sizeof(cv));
            for (size_t b = 0; b < BLAKE3_CHUNK_LEN / BLAKE3_BLOCK_LEN; b++) {
                uint8_t block_flags = KEYED_HASH;
                if (b == 0) {
                    block_flags |= CHUNK_START;
                }
                if (b == BLAKE3_CHUNK_LEN / BLAKE3_BLOCK_LEN - 1) {
                    block_flags |= CHUNK_END;
                }
                portable.compress_in_place(cv, inputs[i] + b * BLAKE3_BLOCK_LEN,
                        BLAKE3_BLOCK_LEN, counter + i, block_flags);
            }
            le_bytes_from_words_32(cv, &expected[i * BLAKE3_OUT_LEN]);
        }
        for (size_t n: input_counts) {
            memset(out, sentinel1, sizeof(out));
            impl.hash_many(inputs, n, BLAKE3_CHUNK_LEN / BLAKE3_BLOCK_LEN, key, counter,
                    INCREMENT_COUNTER_YES, KEYED_HASH, CHUNK_START, CHUNK_END, out);
            result &= verify_bytes(expected, out, n * BLAKE3_OUT_LEN, flags);
            result &= verify_sentinel(&out[n * BLAKE3_OUT_LEN], sizeof(out) - n * BLAKE3_OUT_LEN, sentinel1, flags);
        }

        // Parents. The counter is not incremented, and is passed as-is.
        for (size_t i = 0; i < NUM_INPUTS; i++) {
            uint32_t cv[8];
            inputs[i] = &input[i * BLAKE3_BLOCK_LEN];
            memcpy(cv, key, sizeof(cv));
            portable.compress_in_place(cv, inputs[i], BLAKE3_BLOCK_LEN, counter, KEYED_HASH | PARENT);
            le_bytes_from_words_32(cv, &expected[i * BLAKE3_OUT_LEN]);
        }
        for (size_t n: input_counts) {
            memset(out, sentinel2, sizeof(out));
            impl.hash_many(inputs, n, 1, key, counter, INCREMENT_COUNTER_NO, KEYED_HASH | PARENT, 0, 0, out);
            result &= verify_bytes(expected, out, n * BLAKE3_OUT_LEN, flags);
            result &= verify_sentinel(&out[n * BLAKE3_OUT_LEN], sizeof(out) - n * BLAKE3_OUT_LEN, sentinel2, flags);
        }
    }

    recordTestResult(result, "Platform", "hash_many");

    return result;
}

//-----------------------------------------------------------------------------
// hash_chunks(), in two calls that land at different column offsets.
// The second call ends with a partial chunk.

static void expected_chunk_cv( const Blake3Platform & portable, const uint8_t * input, size_t len,
        const uint32_t key[8], uint64_t counter, uint8_t chunk_flags, uint32_t cv[8] ) {
    Blake3ChunkState chunk( key, chunk_flags, portable );
    uint8_t          cv_bytes[BLAKE3_OUT_LEN];

    chunk.set_counter(counter);
    chunk.update(input, len);
    chunk.finalize(false, cv_bytes);
    words_from_le_bytes_32(cv_bytes, cv);
}

static bool test_hash_chunks( const Blake3Platform & impl, const Blake3Platform & portable, flags_t flags ) {
    const size_t         first_chunks = 5;
    const size_t         first_column = 3;
    const size_t         second_len   = 7 * BLAKE3_CHUNK_LEN + 300;
    const size_t         total_len    = first_chunks * BLAKE3_CHUNK_LEN + second_len;
    const size_t         total_chunks = first_chunks + 8;
    std::vector<uint8_t> input( total_len );
    uint32_t             key[8];
    bool                 result       = true;

    paint_test_input(&input[0], input.size());
    test_key_words(key);

    for (uint64_t counter: INITIAL_COUNTERS) {
        Blake3TransposedVectors tv_impl, tv_port;

        impl.hash_chunks(&input[0], first_chunks * BLAKE3_CHUNK_LEN, key, counter, KEYED_HASH,
                tv_impl, first_column);
        impl.hash_chunks(&input[first_chunks * BLAKE3_CHUNK_LEN], second_len, key, counter + first_chunks,
                KEYED_HASH, tv_impl, first_column + first_chunks);
        portable.hash_chunks(&input[0], first_chunks * BLAKE3_CHUNK_LEN, key, counter, KEYED_HASH,
                tv_port, first_column);
        portable.hash_chunks(&input[first_chunks * BLAKE3_CHUNK_LEN], second_len, key, counter + first_chunks,
                KEYED_HASH, tv_port, first_column + first_chunks);

        for (size_t c = 0; c < total_chunks; c++) {
            const size_t start = c * BLAKE3_CHUNK_LEN;
            const size_t len   = (total_len - start > BLAKE3_CHUNK_LEN) ? BLAKE3_CHUNK_LEN : total_len - start;
            uint32_t     cv[8];
            expected_chunk_cv(portable, &input[start], len, key, counter + c, KEYED_HASH, cv);
            result &= verify_column(tv_impl, first_column + c, cv, flags);
        }

        // Nothing outside the written columns may change
        const uint32_t zero[8] = { 0 };
        for (size_t col = 0; col < BLAKE3_TRANSPOSED_COLUMNS; col++) {
            if ((col < first_column) || (col >= first_column + total_chunks)) {
                result &= verify_column(tv_impl, col, zero, flags);
            }
        }

        result &= tv_impl == tv_port;
    }

    recordTestResult(result, "Platform", "hash_chunks");

    return result;
}

//-----------------------------------------------------------------------------
// hash_parents(), into a separate buffer at an offset, and in place

static void expected_parent_cv( const Blake3Platform & portable, const Blake3TransposedVectors & in,
        size_t parent, const uint32_t key[8], uint8_t parent_flags, uint32_t cv[8] ) {
    uint32_t children[16];
    uint8_t  block[BLAKE3_BLOCK_LEN];

    in.getColumn(2 * parent + 0, &children[0]);
    in.getColumn(2 * parent + 1, &children[8]);
    le_bytes_from_words_32(&children[0], &block[ 0]);
    le_bytes_from_words_32(&children[8], &block[32]);
    memcpy(cv, key, 8 * sizeof(uint32_t));
    portable.compress_in_place(cv, block, BLAKE3_BLOCK_LEN, 0, parent_flags | PARENT);
}

static bool test_hash_parents( const Blake3Platform & impl, const Blake3Platform & portable, flags_t flags ) {
    const size_t            parent_counts[] = { 1, 3, 4, 8, 13, BLAKE3_MAX_SIMD_DEGREE };
    Blake3TransposedVectors in;
    uint32_t                key[8];
    bool                    result = true;
    Rand                    r( 293847 );

    test_key_words(key);
    for (size_t row = 0; row < 8; row++) {
        for (size_t col = 0; col < BLAKE3_TRANSPOSED_COLUMNS; col++) {
            in[row][col] = (uint32_t)r.rand_u64();
        }
    }

    for (size_t n: parent_counts) {
        const size_t            output_column = BLAKE3_TRANSPOSED_COLUMNS - n;
        Blake3TransposedVectors out;
        uint32_t                marker[8];

        for (size_t i = 0; i < 8; i++) {
            marker[i] = column_marker;
        }
        for (size_t col = 0; col < BLAKE3_TRANSPOSED_COLUMNS; col++) {
            out.setColumn(col, marker);
        }

        impl.hash_parents(Blake3ParentInOut::Separate(in, n, out, output_column), key, KEYED_HASH);
        for (size_t i = 0; i < n; i++) {
            uint32_t cv[8];
            expected_parent_cv(portable, in, i, key, KEYED_HASH, cv);
            result &= verify_column(out, output_column + i, cv, flags);
        }
        for (size_t col = 0; col < output_column; col++) {
            result &= verify_column(out, col, marker, flags);
        }

        Blake3TransposedVectors in_place = in;
        impl.hash_parents(Blake3ParentInOut::InPlace(in_place, n), key, KEYED_HASH);
        for (size_t i = 0; i < n; i++) {
            uint32_t cv[8];
            expected_parent_cv(portable, in, i, key, KEYED_HASH, cv);
            result &= verify_column(in_place, i, cv, flags);
        }
        for (size_t col = n; col < BLAKE3_TRANSPOSED_COLUMNS; col++) {
            uint32_t orig[8];
            in.getColumn(col, orig);
            result &= verify_column(in_place, col, orig, flags);
        }
    }

    recordTestResult(result, "Platform", "hash_parents");

    return result;
}

//-----------------------------------------------------------------------------
// xof() and xof_xor()

static bool test_xof( const Blake3Platform & impl, const Blake3Platform & portable, flags_t flags ) {
    const size_t   test_lens[] = { 1, 63, 64, 65, 200, 512 };
    const size_t   maxlen      = 512;
    const size_t   pad         = 32;
    const uint64_t counter     = UINT64_C(0xFFFFFFFE);
    const uint8_t  xof_flags   = KEYED_HASH | CHUNK_START | CHUNK_END | ROOT;
    const uint8_t  block_len   = 37;
    uint8_t        block[BLAKE3_BLOCK_LEN];
    uint8_t        expected[maxlen];
    uint8_t        buf[maxlen + 2 * pad];
    uint8_t        orig[maxlen];
    uint32_t       key[8];
    bool           result      = true;
    Rand           r( 58210 );

    paint_test_input(block, sizeof(block));
    test_key_words(key);
    for (size_t b = 0; b < maxlen / BLAKE3_BLOCK_LEN; b++) {
        portable.compress_xof(key, block, block_len, counter + b, xof_flags, &expected[b * BLAKE3_BLOCK_LEN]);
    }

    for (size_t testlen: test_lens) {
        const size_t len = (testlen < sizeof(orig)) ? testlen : sizeof(orig);

        memset(buf, sentinel1, sizeof(buf));
        impl.xof(block, block_len, key, counter, xof_flags, &buf[pad], len);
        result &= verify_bytes(expected, &buf[pad], len, flags);
        result &= verify_sentinel(&buf[0], pad, sentinel1, flags);
        result &= verify_sentinel(&buf[pad + len], sizeof(buf) - pad - len, sentinel1, flags);

        r.rand_n(orig, len);
        memset(buf, sentinel2, sizeof(buf));
        memcpy(&buf[pad], orig, len);
        impl.xof_xor(block, block_len, key, counter, xof_flags, &buf[pad], len);
        for (size_t i = 0; i < len; i++) {
            if (buf[pad + i] != (orig[i] ^ expected[i])) {
                maybeprintf(" xof_xor byte %zu mismatch:", i);
                result = false;
                break;
            }
        }
        result &= verify_sentinel(&buf[0], pad, sentinel2, flags);
        result &= verify_sentinel(&buf[pad + len], sizeof(buf) - pad - len, sentinel2, flags);

        // XORing the same stream again undoes it
        impl.xof_xor(block, block_len, key, counter, xof_flags, &buf[pad], len);
        result &= verify_bytes(orig, &buf[pad], len, flags);
    }

    recordTestResult(result, "Platform", "xof");

    return result;
}

//-----------------------------------------------------------------------------

static bool test_universal_hash( const Blake3Platform & impl, const Blake3Platform & portable, flags_t flags ) {
    const size_t   test_lens[] = { 0, 1, 63, 64, 65, 1000 };
    uint8_t        input[1000];
    uint32_t       key[8];
    bool           result      = true;

    paint_test_input(input, sizeof(input));
    test_key_words(key);

    for (uint64_t counter: INITIAL_COUNTERS) {
        for (size_t len: test_lens) {
            uint8_t out_impl[BLAKE3_UNIVERSAL_HASH_LEN];
            uint8_t out_port[BLAKE3_UNIVERSAL_HASH_LEN];
            uint8_t out_ref[BLAKE3_UNIVERSAL_HASH_LEN];

            impl.universal_hash(input, len, key, counter, out_impl);
            portable.universal_hash(input, len, key, counter, out_port);
            ref_universal_hash(input, len, test_key_bytes(), counter, out_ref);
            result &= verify_bytes(out_ref, out_port, sizeof(out_ref), flags);
            result &= verify_bytes(out_port, out_impl, sizeof(out_port), flags);
        }
    }

    recordTestResult(result, "Platform", "universal_hash");

    return result;
}

//-----------------------------------------------------------------------------

bool PlatformTest( flags_t flags ) {
    const Blake3Platform portable = Blake3Platform::portable();
    bool result = true;

    printf("[[[ Platform Tests ]]]\n\n");

    result &= test_helpers(flags);

    for (const Blake3Impl * impl: test_impls()) {
        const Blake3Platform platform( impl );
        bool implresult = true;

        printf("%-12s", impl->name);
        implresult &= test_compress(platform, portable, flags);
        implresult &= test_hash_many(platform, portable, flags);
        implresult &= test_hash_chunks(platform, portable, flags);
        implresult &= test_hash_parents(platform, portable, flags);
        implresult &= test_xof(platform, portable, flags);
        implresult &= test_universal_hash(platform, portable, flags);
        printf(" %s\n", implresult ? "pass" : "FAIL");

        result &= implresult;
    }

    printf("\n%s", result ? "" : g_failstr);

    return result;
}
