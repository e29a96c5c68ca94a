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

#define G(r,i,a,b,c,d)                            \
  do {                                            \
    a = a + b + m[BLAKE3_MSG_SCHEDULE[r][2*i+0]]; \
    d = ROTR32(d ^ a, 16);                        \
    c = c + d;                                    \
    b = ROTR32(b ^ c, 12);                        \
    a = a + b + m[BLAKE3_MSG_SCHEDULE[r][2*i+1]]; \
    d = ROTR32(d ^ a,  8);                        \
    c = c + d;                                    \
    b = ROTR32(b ^ c,  7);                        \
  } while(0)

#define ROUND(r)                    \
  do {                              \
    G(r,0,v[ 0],v[ 4],v[ 8],v[12]); \
    G(r,1,v[ 1],v[ 5],v[ 9],v[13]); \
    G(r,2,v[ 2],v[ 6],v[10],v[14]); \
    G(r,3,v[ 3],v[ 7],v[11],v[15]); \
    G(r,4,v[ 0],v[ 5],v[10],v[15]); \
    G(r,5,v[ 1],v[ 6],v[11],v[12]); \
    G(r,6,v[ 2],v[ 7],v[ 8],v[13]); \
    G(r,7,v[ 3],v[ 4],v[ 9],v[14]); \
  } while(0)

static FORCE_INLINE void compress_pre( uint32_t v[16], const uint32_t cv[8], const uint8_t block[BLAKE3_BLOCK_LEN],
        uint8_t block_len, uint64_t counter, uint8_t flags ) {
    uint32_t m[16];

    for (size_t i = 0; i < 16; i++) {
        m[i] = GET_U32_LE(block, 4 * i);
    }

    for (size_t i = 0; i < 8; i++) {
        v[i] = cv[i];
    }

    v[ 8] = BLAKE3_IV[0];
    v[ 9] = BLAKE3_IV[1];
    v[10] = BLAKE3_IV[2];
    v[11] = BLAKE3_IV[3];
    v[12] = counter_low(counter);
    v[13] = counter_high(counter);
    v[14] = (uint32_t)block_len;
    v[15] = (uint32_t)flags;

    ROUND(0);
    ROUND(1);
    ROUND(2);
    ROUND(3);
    ROUND(4);
    ROUND(5);
    ROUND(6);
}

#undef ROUND
#undef G

void blake3_compress_in_place_portable( uint32_t cv[8], const uint8_t block[BLAKE3_BLOCK_LEN],
        uint8_t block_len, uint64_t counter, uint8_t flags ) {
    uint32_t v[16];

    compress_pre(v, cv, block, block_len, counter, flags);
    for (size_t i = 0; i < 8; i++) {
        cv[i] = v[i] ^ v[i + 8];
    }
}

void blake3_compress_xof_portable( const uint32_t cv[8], const uint8_t block[BLAKE3_BLOCK_LEN],
        uint8_t block_len, uint64_t counter, uint8_t flags, uint8_t out[64] ) {
    uint32_t v[16];

    compress_pre(v, cv, block, block_len, counter, flags);
    for (size_t i = 0; i < 8; i++) {
        PUT_U32_LE(v[i] ^ v[i + 8], out, 4 * i);
        PUT_U32_LE(v[i + 8] ^ cv[i], out, 4 * (i + 8));
    }
}

void blake3_hash_many_portable( const uint8_t * const * inputs, size_t num_inputs, size_t blocks,
        const uint32_t key[8], uint64_t counter, IncrementCounter increment_counter, uint8_t flags,
        uint8_t flags_start, uint8_t flags_end, uint8_t * out ) {
    hash_many_generic<blake3_compress_in_place_portable>(inputs, num_inputs, blocks, key,
            counter, increment_counter, flags, flags_start, flags_end, out);
}

void blake3_hash_chunks_portable( const uint8_t * input, size_t input_len, const uint32_t key[8],
        uint64_t counter, uint8_t flags, Blake3TransposedVectors & out, size_t output_column ) {
    hash_chunks_generic<blake3_compress_in_place_portable>(input, input_len, key, counter,
            flags, out, output_column);
}

void blake3_hash_parents_portable( const Blake3TransposedVectors & input, size_t first_parent,
        size_t num_parents, Blake3TransposedVectors & output, size_t output_column,
        const uint32_t key[8], uint8_t flags ) {
    hash_parents_generic<blake3_compress_in_place_portable>(input, first_parent, num_parents,
            output, output_column, key, flags);
}
