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
//-----------------------------------------------------------------------------
// Entry points of each compression variant, and generic helpers they
// build on. Only the variant sources and the registry include this.
#pragma once

#include "Blake3Platform.h"

void blake3_compress_in_place_portable( uint32_t cv[8], const uint8_t block[BLAKE3_BLOCK_LEN],
        uint8_t block_len, uint64_t counter, uint8_t flags );
void blake3_compress_xof_portable( const uint32_t cv[8], const uint8_t block[BLAKE3_BLOCK_LEN],
        uint8_t block_len, uint64_t counter, uint8_t flags, uint8_t out[64] );
void blake3_hash_many_portable( const uint8_t * const * inputs, size_t num_inputs, size_t blocks,
        const uint32_t key[8], uint64_t counter, IncrementCounter increment_counter, uint8_t flags,
        uint8_t flags_start, uint8_t flags_end, uint8_t * out );
void blake3_hash_chunks_portable( const uint8_t * input, size_t input_len, const uint32_t key[8],
        uint64_t counter, uint8_t flags, Blake3TransposedVectors & out, size_t output_column );
void blake3_hash_parents_portable( const Blake3TransposedVectors & input, size_t first_parent,
        size_t num_parents, Blake3TransposedVectors & output, size_t output_column,
        const uint32_t key[8], uint8_t flags );

#if defined(HAVE_SSE_4_1)
void blake3_compress_in_place_sse41( uint32_t cv[8], const uint8_t block[BLAKE3_BLOCK_LEN],
        uint8_t block_len, uint64_t counter, uint8_t flags );
void blake3_compress_xof_sse41( const uint32_t cv[8], const uint8_t block[BLAKE3_BLOCK_LEN],
        uint8_t block_len, uint64_t counter, uint8_t flags, uint8_t out[64] );
void blake3_hash_many_sse41( const uint8_t * const * inputs, size_t num_inputs, size_t blocks,
        const uint32_t key[8], uint64_t counter, IncrementCounter increment_counter, uint8_t flags,
        uint8_t flags_start, uint8_t flags_end, uint8_t * out );
void blake3_hash_chunks_sse41( const uint8_t * input, size_t input_len, const uint32_t key[8],
        uint64_t counter, uint8_t flags, Blake3TransposedVectors & out, size_t output_column );
void blake3_hash_parents_sse41( const Blake3TransposedVectors & input, size_t first_parent,
        size_t num_parents, Blake3TransposedVectors & output, size_t output_column,
        const uint32_t key[8], uint8_t flags );
#endif

#if defined(HAVE_AVX2)
  #if !defined(HAVE_SSE_4_1)
    #error "The AVX2 variant is built on top of the SSE4.1 variant"
  #endif
void blake3_hash_many_avx2( const uint8_t * const * inputs, size_t num_inputs, size_t blocks,
        const uint32_t key[8], uint64_t counter, IncrementCounter increment_counter, uint8_t flags,
        uint8_t flags_start, uint8_t flags_end, uint8_t * out );
void blake3_hash_chunks_avx2( const uint8_t * input, size_t input_len, const uint32_t key[8],
        uint64_t counter, uint8_t flags, Blake3TransposedVectors & out, size_t output_column );
void blake3_hash_parents_avx2( const Blake3TransposedVectors & input, size_t first_parent,
        size_t num_parents, Blake3TransposedVectors & output, size_t output_column,
        const uint32_t key[8], uint8_t flags );
#endif

//-----------------------------------------------------------------------------
// Generic scalar building blocks, parameterized on the single-block
// compression function.

// Hashes one input of whole blocks, as a chunk or as a parent node.
template <Blake3CompressInPlaceFn compress>
static FORCE_INLINE void hash_one( const uint8_t * input, size_t blocks, const uint32_t key[8],
        uint64_t counter, uint8_t flags, uint8_t flags_start, uint8_t flags_end, uint8_t out[BLAKE3_OUT_LEN] ) {
    uint32_t cv[8];
    uint8_t  block_flags = flags | flags_start;

    memcpy(cv, key, BLAKE3_KEY_LEN);
    while (blocks > 0) {
        if (blocks == 1) {
            block_flags |= flags_end;
        }
        compress(cv, input, BLAKE3_BLOCK_LEN, counter, block_flags);
        input       = &input[BLAKE3_BLOCK_LEN];
        blocks     -= 1;
        block_flags = flags;
    }
    le_bytes_from_words_32(cv, out);
}

// Hashes a chunk of 1 to BLAKE3_CHUNK_LEN bytes. Only the final chunk
// of a message may be short.
template <Blake3CompressInPlaceFn compress>
static FORCE_INLINE void hash_chunk_cv( const uint8_t * input, size_t input_len, const uint32_t key[8],
        uint64_t counter, uint8_t flags, uint32_t cv[8] ) {
    uint8_t block_flags = flags | CHUNK_START;
    uint8_t block[BLAKE3_BLOCK_LEN];

    memcpy(cv, key, BLAKE3_KEY_LEN);
    while (input_len > BLAKE3_BLOCK_LEN) {
        compress(cv, input, BLAKE3_BLOCK_LEN, counter, block_flags);
        input       = &input[BLAKE3_BLOCK_LEN];
        input_len  -= BLAKE3_BLOCK_LEN;
        block_flags = flags;
    }
    memset(block, 0, sizeof(block));
    memcpy(block, input, input_len);
    compress(cv, block, (uint8_t)input_len, counter, block_flags | CHUNK_END);
}

template <Blake3CompressInPlaceFn compress>
static void hash_many_generic( const uint8_t * const * inputs, size_t num_inputs, size_t blocks,
        const uint32_t key[8], uint64_t counter, IncrementCounter increment_counter, uint8_t flags,
        uint8_t flags_start, uint8_t flags_end, uint8_t * out ) {
    while (num_inputs > 0) {
        hash_one<compress>(inputs[0], blocks, key, counter, flags, flags_start, flags_end, out);
        if (increment_counter == INCREMENT_COUNTER_YES) {
            counter += 1;
        }
        inputs     += 1;
        num_inputs -= 1;
        out         = &out[BLAKE3_OUT_LEN];
    }
}

template <Blake3CompressInPlaceFn compress>
static void hash_chunks_generic( const uint8_t * input, size_t input_len, const uint32_t key[8],
        uint64_t counter, uint8_t flags, Blake3TransposedVectors & out, size_t output_column ) {
    uint32_t cv[8];

    while (input_len > 0) {
        size_t take = (input_len > BLAKE3_CHUNK_LEN) ? BLAKE3_CHUNK_LEN : input_len;
        hash_chunk_cv<compress>(input, take, key, counter, flags, cv);
        out.setColumn(output_column, cv);
        input          = &input[take];
        input_len     -= take;
        counter       += 1;
        output_column += 1;
    }
}

// Each parent reads both of its children before writing its own
// column, and parent i never writes a column above i + output_column,
// so this is safe in place when output_column is 0.
template <Blake3CompressInPlaceFn compress>
static void hash_parents_generic( const Blake3TransposedVectors & input, size_t first_parent,
        size_t num_parents, Blake3TransposedVectors & output, size_t output_column,
        const uint32_t key[8], uint8_t flags ) {
    uint32_t cv[8];
    uint32_t children[16];
    uint8_t  block[BLAKE3_BLOCK_LEN];

    for (size_t i = first_parent; i < first_parent + num_parents; i++) {
        input.getColumn(2 * i + 0, &children[0]);
        input.getColumn(2 * i + 1, &children[8]);
        le_bytes_from_words_32(&children[0], &block[ 0]);
        le_bytes_from_words_32(&children[8], &block[32]);
        memcpy(cv, key, BLAKE3_KEY_LEN);
        compress(cv, block, BLAKE3_BLOCK_LEN, 0, flags | PARENT);
        output.setColumn(output_column + i, cv);
    }
}
