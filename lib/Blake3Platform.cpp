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
#include "Blake3Platform.h"

const uint32_t BLAKE3_IV[8] = {
    0x6A09E667, 0xBB67AE85, 0x3C6EF372,
    0xA54FF53A, 0x510E527F, 0x9B05688C,
    0x1F83D9AB, 0x5BE0CD19
};

const uint8_t BLAKE3_MSG_PERMUTATION[16] = {
    2, 6, 3, 10, 7, 0, 4, 13, 1, 11, 12, 5, 9, 14, 15, 8
};

// Row r is BLAKE3_MSG_PERMUTATION applied r times
const uint8_t BLAKE3_MSG_SCHEDULE[7][16] = {
    { 0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15 },
    { 2, 6, 3, 10, 7, 0, 4, 13, 1, 11, 12, 5, 9, 14, 15, 8 },
    { 3, 4, 10, 12, 13, 2, 7, 14, 6, 5, 9, 0, 11, 15, 8, 1 },
    { 10, 7, 12, 9, 14, 3, 13, 15, 4, 0, 11, 2, 5, 8, 1, 6 },
    { 12, 13, 9, 11, 15, 10, 14, 8, 7, 2, 5, 3, 0, 1, 6, 4 },
    { 9, 14, 11, 5, 8, 12, 15, 1, 13, 3, 0, 10, 2, 6, 4, 7 },
    { 11, 15, 5, 0, 1, 9, 8, 6, 14, 10, 2, 12, 3, 4, 7, 13 },
};

//-----------------------------------------------------------------------------
static const Blake3Impl * detectBestImpl( void ) {
    for (const Blake3Impl * impl: findAllImpls()) {
        if (impl->Supported()) {
            return impl;
        }
    }
    blake3_fatal("no supported BLAKE3 implementation was registered");
}

Blake3Platform Blake3Platform::detect( void ) {
    static const Blake3Impl * best = detectBestImpl();

    return Blake3Platform(best);
}

Blake3Platform Blake3Platform::portable( void ) {
    static const Blake3Impl * impl = findImpl("portable");

    return Blake3Platform(impl);
}

Blake3Platform::Blake3Platform( const Blake3Impl * impl ) : impl( impl ) {
    if (impl == NULL) {
        blake3_fatal("Blake3Platform given a NULL implementation");
    }
}

//-----------------------------------------------------------------------------
void Blake3Platform::hash_many( const uint8_t * const * inputs, size_t num_inputs, size_t blocks,
        const uint32_t key[8], uint64_t counter, IncrementCounter increment_counter, uint8_t flags,
        uint8_t flags_start, uint8_t flags_end, uint8_t * out ) const {
    if (num_inputs > BLAKE3_MAX_SIMD_DEGREE_OR_2) {
        blake3_fatal("hash_many() given %zu inputs, the limit is %d", num_inputs, BLAKE3_MAX_SIMD_DEGREE_OR_2);
    }
    impl->hash_many(inputs, num_inputs, blocks, key, counter, increment_counter,
            flags, flags_start, flags_end, out);
}

void Blake3Platform::hash_chunks( const uint8_t * input, size_t input_len, const uint32_t key[8],
        uint64_t counter, uint8_t flags, Blake3TransposedVectors & out, size_t output_column ) const {
    const size_t num_chunks = (input_len + BLAKE3_CHUNK_LEN - 1) / BLAKE3_CHUNK_LEN;

    if (num_chunks > BLAKE3_MAX_SIMD_DEGREE) {
        blake3_fatal("hash_chunks() given %zu chunks, the limit is %d", num_chunks, BLAKE3_MAX_SIMD_DEGREE);
    }
    if (output_column + num_chunks > BLAKE3_TRANSPOSED_COLUMNS) {
        blake3_fatal("hash_chunks() output columns [%zu, %zu) exceed the buffer width %d",
                output_column, output_column + num_chunks, BLAKE3_TRANSPOSED_COLUMNS);
    }
    impl->hash_chunks(input, input_len, key, counter, flags, out, output_column);
}

void Blake3Platform::hash_parents( const Blake3ParentInOut & io, const uint32_t key[8], uint8_t flags ) const {
    if ((io.input == NULL) || (io.output == NULL)) {
        blake3_fatal("hash_parents() given a NULL buffer");
    }
    if (io.num_parents > BLAKE3_MAX_SIMD_DEGREE) {
        blake3_fatal("hash_parents() given %zu parents, the limit is %d", io.num_parents, BLAKE3_MAX_SIMD_DEGREE);
    }
    if (io.mode == Blake3ParentInOut::IN_PLACE) {
        if ((io.input != io.output) || (io.output_column != 0)) {
            blake3_fatal("hash_parents() in-place mode must read and write the same columns");
        }
    } else {
        if (io.input == io.output) {
            blake3_fatal("hash_parents() separate mode given the same buffer twice");
        }
        if (io.output_column + io.num_parents > BLAKE3_TRANSPOSED_COLUMNS) {
            blake3_fatal("hash_parents() output columns [%zu, %zu) exceed the buffer width %d",
                    io.output_column, io.output_column + io.num_parents, BLAKE3_TRANSPOSED_COLUMNS);
        }
    }
    impl->hash_parents(*io.input, 0, io.num_parents, *io.output, io.output_column, key, flags);
}

//-----------------------------------------------------------------------------
template <bool xorout>
void Blake3Platform::xof_impl( const uint8_t block[BLAKE3_BLOCK_LEN], uint8_t block_len, const uint32_t cv[8],
        uint64_t counter, uint8_t flags, uint8_t * out, size_t out_len ) const {
    uint8_t wide_buf[64];

    while (out_len > 0) {
        const size_t take = (out_len > 64) ? 64 : out_len;
        impl->compress_xof(cv, block, block_len, counter, flags, wide_buf);
        if (xorout) {
            for (size_t i = 0; i < take; i++) {
                out[i] ^= wide_buf[i];
            }
        } else {
            memcpy(out, wide_buf, take);
        }
        out      = &out[take];
        out_len -= take;
        counter += 1;
    }
}

void Blake3Platform::xof( const uint8_t block[BLAKE3_BLOCK_LEN], uint8_t block_len, const uint32_t cv[8],
        uint64_t counter, uint8_t flags, uint8_t * out, size_t out_len ) const {
    xof_impl<false>(block, block_len, cv, counter, flags, out, out_len);
}

void Blake3Platform::xof_xor( const uint8_t block[BLAKE3_BLOCK_LEN], uint8_t block_len, const uint32_t cv[8],
        uint64_t counter, uint8_t flags, uint8_t * out, size_t out_len ) const {
    xof_impl<true>(block, block_len, cv, counter, flags, out, out_len);
}

// Every 64-byte block i of input is hashed as its own keyed root
// chunk with counter + i, and the first 16 bytes of each are XORed
// together. The empty input is hashed as one empty block.
void Blake3Platform::universal_hash( const uint8_t * input, size_t input_len, const uint32_t key[8],
        uint64_t counter, uint8_t out[BLAKE3_UNIVERSAL_HASH_LEN] ) const {
    const uint8_t flags = KEYED_HASH | CHUNK_START | CHUNK_END | ROOT;
    uint8_t       block[BLAKE3_BLOCK_LEN];
    uint8_t       wide_buf[64];
    size_t        offset = 0;

    memset(out, 0, BLAKE3_UNIVERSAL_HASH_LEN);
    do {
        const size_t take = (input_len - offset > BLAKE3_BLOCK_LEN) ? BLAKE3_BLOCK_LEN : input_len - offset;
        memset(block, 0, sizeof(block));
        if (take > 0) {
            memcpy(block, &input[offset], take);
        }
        impl->compress_xof(key, block, (uint8_t)take, counter, flags, wide_buf);
        for (size_t i = 0; i < BLAKE3_UNIVERSAL_HASH_LEN; i++) {
            out[i] ^= wide_buf[i];
        }
        offset  += take;
        counter += 1;
    } while (offset < input_len);
}
