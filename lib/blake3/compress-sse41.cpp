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

#define LOADU(p)     LOADU_128(p)
#define STOREU(p, r) STOREU_128(p, r)

static FORCE_INLINE __m128i addv( __m128i a, __m128i b ) { return _mm_add_epi32(a, b); }

static FORCE_INLINE __m128i xorv( __m128i a, __m128i b ) { return _mm_xor_si128(a, b); }

static FORCE_INLINE __m128i set1( uint32_t x ) { return _mm_set1_epi32((int32_t)x); }

static FORCE_INLINE __m128i set4( uint32_t a, uint32_t b, uint32_t c, uint32_t d ) {
    return _mm_setr_epi32((int32_t)a, (int32_t)b, (int32_t)c, (int32_t)d);
}

static FORCE_INLINE __m128i rot16( __m128i x ) {
    return _mm_shuffle_epi8(x, _mm_setr_epi8(ROT16_SHUFFLE_BYTES));
}

static FORCE_INLINE __m128i rot12( __m128i x ) {
    return _mm_or_si128(_mm_srli_epi32(x, 12), _mm_slli_epi32(x, 32 - 12));
}

static FORCE_INLINE __m128i rot8( __m128i x ) {
    return _mm_shuffle_epi8(x, _mm_setr_epi8(ROT8_SHUFFLE_BYTES));
}

static FORCE_INLINE __m128i rot7( __m128i x ) {
    return _mm_or_si128(_mm_srli_epi32(x, 7), _mm_slli_epi32(x, 32 - 7));
}

static FORCE_INLINE void g( __m128i & a, __m128i & b, __m128i & c, __m128i & d, __m128i mx, __m128i my ) {
    a = addv(addv(a, b), mx);
    d = rot16(xorv(d, a));
    c = addv(c, d);
    b = rot12(xorv(b, c));
    a = addv(addv(a, b), my);
    d = rot8(xorv(d, a));
    c = addv(c, d);
    b = rot7(xorv(b, c));
}

//-----------------------------------------------------------------------------
// Single block, one row of the state per vector. Between the column
// and diagonal steps, rows 1-3 are rotated so that each diagonal
// lines up in one lane.

static FORCE_INLINE void compress_pre( __m128i rows[4], const uint32_t cv[8], const uint8_t block[BLAKE3_BLOCK_LEN],
        uint8_t block_len, uint64_t counter, uint8_t flags ) {
    uint32_t m[16];

    for (size_t i = 0; i < 16; i++) {
        m[i] = GET_U32_LE(block, 4 * i);
    }

    rows[0] = LOADU(&cv[0]);
    rows[1] = LOADU(&cv[4]);
    rows[2] = set4(BLAKE3_IV[0], BLAKE3_IV[1], BLAKE3_IV[2], BLAKE3_IV[3]);
    rows[3] = set4(counter_low(counter), counter_high(counter), (uint32_t)block_len, (uint32_t)flags);

    for (size_t r = 0; r < 7; r++) {
        const uint8_t * s = BLAKE3_MSG_SCHEDULE[r];

        g(rows[0], rows[1], rows[2], rows[3],
                set4(m[s[ 0]], m[s[ 2]], m[s[ 4]], m[s[ 6]]),
                set4(m[s[ 1]], m[s[ 3]], m[s[ 5]], m[s[ 7]]));

        rows[1] = _mm_shuffle_epi32(rows[1], _MM_SHUFFLE(0, 3, 2, 1));
        rows[2] = _mm_shuffle_epi32(rows[2], _MM_SHUFFLE(1, 0, 3, 2));
        rows[3] = _mm_shuffle_epi32(rows[3], _MM_SHUFFLE(2, 1, 0, 3));

        g(rows[0], rows[1], rows[2], rows[3],
                set4(m[s[ 8]], m[s[10]], m[s[12]], m[s[14]]),
                set4(m[s[ 9]], m[s[11]], m[s[13]], m[s[15]]));

        rows[1] = _mm_shuffle_epi32(rows[1], _MM_SHUFFLE(2, 1, 0, 3));
        rows[2] = _mm_shuffle_epi32(rows[2], _MM_SHUFFLE(1, 0, 3, 2));
        rows[3] = _mm_shuffle_epi32(rows[3], _MM_SHUFFLE(0, 3, 2, 1));
    }
}

void blake3_compress_in_place_sse41( uint32_t cv[8], const uint8_t block[BLAKE3_BLOCK_LEN],
        uint8_t block_len, uint64_t counter, uint8_t flags ) {
    __m128i rows[4];

    compress_pre(rows, cv, block, block_len, counter, flags);
    STOREU(&cv[0], xorv(rows[0], rows[2]));
    STOREU(&cv[4], xorv(rows[1], rows[3]));
}

void blake3_compress_xof_sse41( const uint32_t cv[8], const uint8_t block[BLAKE3_BLOCK_LEN],
        uint8_t block_len, uint64_t counter, uint8_t flags, uint8_t out[64] ) {
    __m128i rows[4];

    compress_pre(rows, cv, block, block_len, counter, flags);
    STOREU(&out[ 0], xorv(rows[0], rows[2]));
    STOREU(&out[16], xorv(rows[1], rows[3]));
    STOREU(&out[32], xorv(rows[2], LOADU(&cv[0])));
    STOREU(&out[48], xorv(rows[3], LOADU(&cv[4])));
}

//-----------------------------------------------------------------------------
// Four independent inputs, one word of each per vector lane

static FORCE_INLINE void transpose4( __m128i & a, __m128i & b, __m128i & c, __m128i & d ) {
    __m128i ab_01 = _mm_unpacklo_epi32(a, b);
    __m128i ab_23 = _mm_unpackhi_epi32(a, b);
    __m128i cd_01 = _mm_unpacklo_epi32(c, d);
    __m128i cd_23 = _mm_unpackhi_epi32(c, d);

    a = _mm_unpacklo_epi64(ab_01, cd_01);
    b = _mm_unpackhi_epi64(ab_01, cd_01);
    c = _mm_unpacklo_epi64(ab_23, cd_23);
    d = _mm_unpackhi_epi64(ab_23, cd_23);
}

static FORCE_INLINE void compress4_transposed( __m128i h[8], const __m128i m[16], __m128i counter_lo,
        __m128i counter_hi, uint32_t block_len, uint32_t flags ) {
    __m128i v[16] = {
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

static FORCE_INLINE void load_counters4( uint64_t counter, bool increment, __m128i & lo, __m128i & hi ) {
    const uint64_t mask = increment ? ~UINT64_C(0) : 0;
    uint64_t       c[4];

    for (size_t i = 0; i < 4; i++) {
        c[i] = counter + (mask & i);
    }
    lo = set4(counter_low(c[0]), counter_low(c[1]), counter_low(c[2]), counter_low(c[3]));
    hi = set4(counter_high(c[0]), counter_high(c[1]), counter_high(c[2]), counter_high(c[3]));
}

// The output is left transposed: h[w] holds CV word w of all 4 inputs.
static FORCE_INLINE void hash4( const uint8_t * const * inputs, size_t blocks, const uint32_t key[8],
        uint64_t counter, bool increment_counter, uint8_t flags, uint8_t flags_start, uint8_t flags_end,
        __m128i h[8] ) {
    __m128i counter_lo, counter_hi;
    __m128i m[16];
    uint8_t block_flags = flags | flags_start;

    load_counters4(counter, increment_counter, counter_lo, counter_hi);
    for (size_t i = 0; i < 8; i++) {
        h[i] = set1(key[i]);
    }

    for (size_t b = 0; b < blocks; b++) {
        const size_t offset = b * BLAKE3_BLOCK_LEN;
        if (b + 1 == blocks) {
            block_flags |= flags_end;
        }
        for (size_t q = 0; q < 4; q++) {
            m[4 * q + 0] = LOADU(&inputs[0][offset + 16 * q]);
            m[4 * q + 1] = LOADU(&inputs[1][offset + 16 * q]);
            m[4 * q + 2] = LOADU(&inputs[2][offset + 16 * q]);
            m[4 * q + 3] = LOADU(&inputs[3][offset + 16 * q]);
            transpose4(m[4 * q + 0], m[4 * q + 1], m[4 * q + 2], m[4 * q + 3]);
        }
        compress4_transposed(h, m, counter_lo, counter_hi, BLAKE3_BLOCK_LEN, block_flags);
        block_flags = flags;
    }
}

void blake3_hash_many_sse41( const uint8_t * const * inputs, size_t num_inputs, size_t blocks,
        const uint32_t key[8], uint64_t counter, IncrementCounter increment_counter, uint8_t flags,
        uint8_t flags_start, uint8_t flags_end, uint8_t * out ) {
    const bool increment = (increment_counter == INCREMENT_COUNTER_YES);
    __m128i    h[8];

    while (num_inputs >= 4) {
        hash4(inputs, blocks, key, counter, increment, flags, flags_start, flags_end, h);
        transpose4(h[0], h[1], h[2], h[3]);
        transpose4(h[4], h[5], h[6], h[7]);
        for (size_t i = 0; i < 4; i++) {
            STOREU(&out[i * BLAKE3_OUT_LEN +  0], h[i + 0]);
            STOREU(&out[i * BLAKE3_OUT_LEN + 16], h[i + 4]);
        }
        if (increment) {
            counter += 4;
        }
        inputs     += 4;
        num_inputs -= 4;
        out         = &out[4 * BLAKE3_OUT_LEN];
    }
    hash_many_generic<blake3_compress_in_place_sse41>(inputs, num_inputs, blocks, key,
            counter, increment_counter, flags, flags_start, flags_end, out);
}

void blake3_hash_chunks_sse41( const uint8_t * input, size_t input_len, const uint32_t key[8],
        uint64_t counter, uint8_t flags, Blake3TransposedVectors & out, size_t output_column ) {
    const uint8_t * chunks[4];
    __m128i         h[8];

    while (input_len >= 4 * BLAKE3_CHUNK_LEN) {
        for (size_t i = 0; i < 4; i++) {
            chunks[i] = &input[i * BLAKE3_CHUNK_LEN];
        }
        hash4(chunks, BLAKE3_CHUNK_LEN / BLAKE3_BLOCK_LEN, key, counter, true, flags, CHUNK_START, CHUNK_END, h);
        for (size_t w = 0; w < 8; w++) {
            STOREU(&out[w][output_column], h[w]);
        }
        input          = &input[4 * BLAKE3_CHUNK_LEN];
        input_len     -= 4 * BLAKE3_CHUNK_LEN;
        counter       += 4;
        output_column += 4;
    }
    hash_chunks_generic<blake3_compress_in_place_sse41>(input, input_len, key, counter,
            flags, out, output_column);
}

void blake3_hash_parents_sse41( const Blake3TransposedVectors & input, size_t first_parent,
        size_t num_parents, Blake3TransposedVectors & output, size_t output_column,
        const uint32_t key[8], uint8_t flags ) {
    const __m128i zero = _mm_setzero_si128();
    __m128i       h[8];
    __m128i       m[16];
    size_t        p    = first_parent;

    // All 16 message vectors are loaded before anything is stored, so
    // this is safe in place.
    for (; p + 4 <= first_parent + num_parents; p += 4) {
        for (size_t w = 0; w < 8; w++) {
            __m128 a = _mm_castsi128_ps(LOADU(&input[w][2 * p + 0]));
            __m128 b = _mm_castsi128_ps(LOADU(&input[w][2 * p + 4]));
            m[w + 0] = _mm_castps_si128(_mm_shuffle_ps(a, b, _MM_SHUFFLE(2, 0, 2, 0)));
            m[w + 8] = _mm_castps_si128(_mm_shuffle_ps(a, b, _MM_SHUFFLE(3, 1, 3, 1)));
            h[w]     = set1(key[w]);
        }
        compress4_transposed(h, m, zero, zero, BLAKE3_BLOCK_LEN, flags | PARENT);
        for (size_t w = 0; w < 8; w++) {
            STOREU(&output[w][output_column + p], h[w]);
        }
    }
    hash_parents_generic<blake3_compress_in_place_sse41>(input, p, first_parent + num_parents - p,
            output, output_column, key, flags);
}
