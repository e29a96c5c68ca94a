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
#include "Impls.h"
#include "Intrinsics.h"

// Single-block compression and any leftover inputs are handled by the
// SSE4.1 code, which every AVX2 CPU also supports.

#define LOADU(p)     LOADU_256(p)
#define STOREU(p, r) STOREU_256(p, r)

static FORCE_INLINE __m256i addv( __m256i a, __m256i b ) { return _mm256_add_epi32(a, b); }

static FORCE_INLINE __m256i xorv( __m256i a, __m256i b ) { return _mm256_xor_si256(a, b); }

static FORCE_INLINE __m256i set1( uint32_t x ) { return _mm256_set1_epi32((int32_t)x); }

static FORCE_INLINE __m256i rot16( __m256i x ) {
    return _mm256_shuffle_epi8(x, _mm256_setr_epi8(ROT16_SHUFFLE_BYTES, ROT16_SHUFFLE_BYTES));
}

static FORCE_INLINE __m256i rot12( __m256i x ) {
    return _mm256_or_si256(_mm256_srli_epi32(x, 12), _mm256_slli_epi32(x, 32 - 12));
}

static FORCE_INLINE __m256i rot8( __m256i x ) {
    return _mm256_shuffle_epi8(x, _mm256_setr_epi8(ROT8_SHUFFLE_BYTES, ROT8_SHUFFLE_BYTES));
}

static FORCE_INLINE __m256i rot7( __m256i x ) {
    return _mm256_or_si256(_mm256_srli_epi32(x, 7), _mm256_slli_epi32(x, 32 - 7));
}

static FORCE_INLINE void g( __m256i & a, __m256i & b, __m256i & c, __m256i & d, __m256i mx, __m256i my ) {
    a = addv(addv(a, b), mx);
    d = rot16(xorv(d, a));
    c = addv(c, d);
    b = rot12(xorv(b, c));
    a = addv(addv(a, b), my);
    d = rot8(xorv(d, a));
    c = addv(c, d);
    b = rot7(xorv(b, c));
}

static FORCE_INLINE void transpose8( __m256i v[8] ) {
    __m256i ab_0145 = _mm256_unpacklo_epi32(v[0], v[1]);
    __m256i ab_2367 = _mm256_unpackhi_epi32(v[0], v[1]);
    __m256i cd_0145 = _mm256_unpacklo_epi32(v[2], v[3]);
    __m256i cd_2367 = _mm256_unpackhi_epi32(v[2], v[3]);
    __m256i ef_0145 = _mm256_unpacklo_epi32(v[4], v[5]);
    __m256i ef_2367 = _mm256_unpackhi_epi32(v[4], v[5]);
    __m256i gh_0145 = _mm256_unpacklo_epi32(v[6], v[7]);
    __m256i gh_2367 = _mm256_unpackhi_epi32(v[6], v[7]);

    __m256i abcd_04 = _mm256_unpacklo_epi64(ab_0145, cd_0145);
    __m256i abcd_15 = _mm256_unpackhi_epi64(ab_0145, cd_0145);
    __m256i abcd_26 = _mm256_unpacklo_epi64(ab_2367, cd_2367);
    __m256i abcd_37 = _mm256_unpackhi_epi64(ab_2367, cd_2367);
    __m256i efgh_04 = _mm256_unpacklo_epi64(ef_0145, gh_0145);
    __m256i efgh_15 = _mm256_unpackhi_epi64(ef_0145, gh_0145);
    __m256i efgh_26 = _mm256_unpacklo_epi64(ef_2367, gh_2367);
    __m256i efgh_37 = _mm256_unpackhi_epi64(ef_2367, gh_2367);

    v[0] = _mm256_permute2x128_si256(abcd_04, efgh_04, 0x20);
    v[1] = _mm256_permute2x128_si256(abcd_15, efgh_15, 0x20);
    v[2] = _mm256_permute2x128_si256(abcd_26, efgh_26, 0x20);
    v[3] = _mm256_permute2x128_si256(abcd_37, efgh_37, 0x20);
    v[4] = _mm256_permute2x128_si256(abcd_04, efgh_04, 0x31);
    v[5] = _mm256_permute2x128_si256(abcd_15, efgh_15, 0x31);
    v[6] = _mm256_permute2x128_si256(abcd_26, efgh_26, 0x31);
    v[7] = _mm256_permute2x128_si256(abcd_37, efgh_37, 0x31);
}

static FORCE_INLINE void compress8_transposed( __m256i h[8], const __m256i m[16], __m256i counter_lo,
        __m256i counter_hi, uint32_t block_len, uint32_t flags ) {
    __m256i v[16] = {
        h[0], h[1], h[2], h[3], h[4], h[5], h[6], h[7],
        set1(BLAKE3_IV[0]), set1(BLAKE3_IV[1]), set1(BLAKE3_IV[2]), set1(BLAKE3_IV[3]),
        counter_lo, counter_hi, set1(block_len), set1(flags),
    };

    for (size_t r = 0; r < 7; r++) {
        const uint8_t * s = BLAKE3_MSG_SCHEDULE[r];
        g(v[0], v[4], v[ 8], v[12], m[s[ 0]], m[s[ 1]]);
        g(v[1], v[5], v[ 9], v[13], m[s[ 2]], m[s[ 3]]);
        g(v[2], v[6], v[10], v[14], m[s[ 4]], m[s[ 5]]);
        g(v[3], v[7], v[11], v[15], m[s[ 6]], m[s[ 7]]);
        g(v[0], v[5], v[10], v[15], m[s[ 8]], m[s[ 9]]);
        g(v[1], v[6], v[11], v[12], m[s[10]], m[s[11]]);
        g(v[2], v[7], v[ 8], v[13], m[s[12]], m[s[13]]);
        g(v[3], v[4], v[ 9], v[14], m[s[14]], m[s[15]]);
    }

    for (size_t i = 0; i < 8; i++) {
        h[i] = xorv(v[i], v[i + 8]);
    }
}

static FORCE_INLINE void load_counters8( uint64_t counter, bool increment, __m256i & lo, __m256i & hi ) {
    const uint64_t mask = increment ? ~UINT64_C(0) : 0;
    uint32_t       l[8], h[8];

    for (size_t i = 0; i < 8; i++) {
        l[i] = counter_low(counter + (mask & i));
        h[i] = counter_high(counter + (mask & i));
    }
    lo = LOADU(l);
    hi = LOADU(h);
}

static FORCE_INLINE void hash8( const uint8_t * const * inputs, size_t blocks, const uint32_t key[8],
        uint64_t counter, bool increment_counter, uint8_t flags, uint8_t flags_start, uint8_t flags_end,
        __m256i h[8] ) {
    __m256i counter_lo, counter_hi;
    __m256i m[16];
    uint8_t block_flags = flags | flags_start;

    load_counters8(counter, increment_counter, counter_lo, counter_hi);
    for (size_t i = 0; i < 8; i++) {
        h[i] = set1(key[i]);
    }

    for (size_t b = 0; b < blocks; b++) {
        const size_t offset = b * BLAKE3_BLOCK_LEN;
        if (b + 1 == blocks) {
            block_flags |= flags_end;
        }
        for (size_t i = 0; i < 8; i++) {
            m[i + 0] = LOADU(&inputs[i][offset +  0]);
            m[i + 8] = LOADU(&inputs[i][offset + 32]);
        }
        transpose8(&m[0]);
        transpose8(&m[8]);
        compress8_transposed(h, m, counter_lo, counter_hi, BLAKE3_BLOCK_LEN, block_flags);
        block_flags = flags;
    }
}

void blake3_hash_many_avx2( const uint8_t * const * inputs, size_t num_inputs, size_t blocks,
        const uint32_t key[8], uint64_t counter, IncrementCounter increment_counter, uint8_t flags,
        uint8_t flags_start, uint8_t flags_end, uint8_t * out ) {
    const bool increment = (increment_counter == INCREMENT_COUNTER_YES);
    __m256i    h[8];

    while (num_inputs >= 8) {
        hash8(inputs, blocks, key, counter, increment, flags, flags_start, flags_end, h);
        transpose8(h);
        for (size_t i = 0; i < 8; i++) {
            STOREU(&out[i * BLAKE3_OUT_LEN], h[i]);
        }
        if (increment) {
            counter += 8;
        }
        inputs     += 8;
        num_inputs -= 8;
        out         = &out[8 * BLAKE3_OUT_LEN];
    }
    blake3_hash_many_sse41(inputs, num_inputs, blocks, key, counter, increment_counter,
            flags, flags_start, flags_end, out);
}

void blake3_hash_chunks_avx2( const uint8_t * input, size_t input_len, const uint32_t key[8],
        uint64_t counter, uint8_t flags, Blake3TransposedVectors & out, size_t output_column ) {
    const uint8_t * chunks[8];
    __m256i         h[8];

    while (input_len >= 8 * BLAKE3_CHUNK_LEN) {
        for (size_t i = 0; i < 8; i++) {
            chunks[i] = &input[i * BLAKE3_CHUNK_LEN];
        }
        hash8(chunks, BLAKE3_CHUNK_LEN / BLAKE3_BLOCK_LEN, key, counter, true, flags, CHUNK_START, CHUNK_END, h);
        for (size_t w = 0; w < 8; w++) {
            STOREU(&out[w][output_column], h[w]);
        }
        input          = &input[8 * BLAKE3_CHUNK_LEN];
        input_len     -= 8 * BLAKE3_CHUNK_LEN;
        counter       += 8;
        output_column += 8;
    }
    blake3_hash_chunks_sse41(input, input_len, key, counter, flags, out, output_column);
}

void blake3_hash_parents_avx2( const Blake3TransposedVectors & input, size_t first_parent,
        size_t num_parents, Blake3TransposedVectors & output, size_t output_column,
        const uint32_t key[8], uint8_t flags ) {
    const __m256i zero = _mm256_setzero_si256();
    __m256i       h[8];
    __m256i       m[16];
    size_t        p    = first_parent;

    for (; p + 8 <= first_parent + num_parents; p += 8) {
        for (size_t w = 0; w < 8; w++) {
            __m256 a     = _mm256_castsi256_ps(LOADU(&input[w][2 * p + 0]));
            __m256 b     = _mm256_castsi256_ps(LOADU(&input[w][2 * p + 8]));
            // Within each 128-bit lane, then across lanes
            __m256 evens = _mm256_shuffle_ps(a, b, _MM_SHUFFLE(2, 0, 2, 0));
            __m256 odds  = _mm256_shuffle_ps(a, b, _MM_SHUFFLE(3, 1, 3, 1));
            m[w + 0] = _mm256_permute4x64_epi64(_mm256_castps_si256(evens), _MM_SHUFFLE(3, 1, 2, 0));
            m[w + 8] = _mm256_permute4x64_epi64(_mm256_castps_si256(odds ), _MM_SHUFFLE(3, 1, 2, 0));
            h[w]     = set1(key[w]);
        }
        compress8_transposed(h, m, zero, zero, BLAKE3_BLOCK_LEN, flags | PARENT);
        for (size_t w = 0; w < 8; w++) {
            STOREU(&output[w][output_column + p], h[w]);
        }
    }
    blake3_hash_parents_sse41(input, p, first_parent + num_parents - p, output, output_column, key, flags);
}
