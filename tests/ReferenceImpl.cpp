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
#include "ReferenceImpl.h"

//-----------------------------------------------------------------------------
// The compression function, one G at a time

static void g( uint32_t state[16], size_t a, size_t b, size_t c, size_t d, uint32_t mx, uint32_t my ) {
    state[a] = state[a] + state[b] + mx;
    state[d] = ROTR32(state[d] ^ state[a], 16);
    state[c] = state[c] + state[d];
    state[b] = ROTR32(state[b] ^ state[c], 12);
    state[a] = state[a] + state[b] + my;
    state[d] = ROTR32(state[d] ^ state[a],  8);
    state[c] = state[c] + state[d];
    state[b] = ROTR32(state[b] ^ state[c],  7);
}

static void round_fn( uint32_t state[16], const uint32_t m[16] ) {
    // Columns
    g(state, 0, 4,  8, 12, m[ 0], m[ 1]);
    g(state, 1, 5,  9, 13, m[ 2], m[ 3]);
    g(state, 2, 6, 10, 14, m[ 4], m[ 5]);
    g(state, 3, 7, 11, 15, m[ 6], m[ 7]);
    // Diagonals
    g(state, 0, 5, 10, 15, m[ 8], m[ 9]);
    g(state, 1, 6, 11, 12, m[10], m[11]);
    g(state, 2, 7,  8, 13, m[12], m[13]);
    g(state, 3, 4,  9, 14, m[14], m[15]);
}

static void permute( uint32_t m[16] ) {
    uint32_t permuted[16];

    for (size_t i = 0; i < 16; i++) {
        permuted[i] = m[BLAKE3_MSG_PERMUTATION[i]];
    }
    memcpy(m, permuted, sizeof(permuted));
}

void ref_compress( const uint32_t cv[8], const uint32_t block_words[16], uint64_t counter,
        uint32_t block_len, uint32_t flags, uint32_t out[16] ) {
    uint32_t state[16] = {
        cv[0], cv[1], cv[2], cv[3], cv[4], cv[5], cv[6], cv[7],
        BLAKE3_IV[0], BLAKE3_IV[1], BLAKE3_IV[2], BLAKE3_IV[3],
        (uint32_t)counter, (uint32_t)(counter >> 32), block_len, flags,
    };
    uint32_t m[16];

    memcpy(m, block_words, sizeof(m));
    for (int r = 0; r < 7; r++) {
        round_fn(state, m);
        if (r < 6) {
            permute(m);
        }
    }
    for (size_t i = 0; i < 8; i++) {
        state[i]     ^= state[i + 8];
        state[i + 8] ^= cv[i];
    }
    memcpy(out, state, sizeof(state));
}

static void words_from_block( const uint8_t block[BLAKE3_BLOCK_LEN], uint32_t words[16] ) {
    for (size_t i = 0; i < 16; i++) {
        words[i] = (uint32_t)block[4 * i] | ((uint32_t)block[4 * i + 1] << 8) |
                ((uint32_t)block[4 * i + 2] << 16) | ((uint32_t)block[4 * i + 3] << 24);
    }
}

//-----------------------------------------------------------------------------

void RefHasher::Node::chaining_value( uint32_t out[8] ) const {
    uint32_t full[16];

    ref_compress(input_cv, block_words, counter, block_len, flags, full);
    memcpy(out, full, 8 * sizeof(uint32_t));
}

void RefHasher::Node::root_output_bytes( uint8_t * out, size_t out_len, uint64_t position ) const {
    uint64_t output_block_counter = position / BLAKE3_BLOCK_LEN;
    size_t   skip = (size_t)(position % BLAKE3_BLOCK_LEN);

    while (out_len > 0) {
        uint32_t words[16];
        uint8_t  bytes[64];

        ref_compress(input_cv, block_words, output_block_counter, block_len, flags | ROOT, words);
        for (size_t i = 0; i < 16; i++) {
            bytes[4 * i + 0] = (uint8_t)(words[i]      );
            bytes[4 * i + 1] = (uint8_t)(words[i] >>  8);
            bytes[4 * i + 2] = (uint8_t)(words[i] >> 16);
            bytes[4 * i + 3] = (uint8_t)(words[i] >> 24);
        }
        for (size_t i = skip; (i < 64) && (out_len > 0); i++) {
            *out++ = bytes[i];
            out_len--;
        }
        skip = 0;
        output_block_counter++;
    }
}

//-----------------------------------------------------------------------------

RefHasher::RefHasher( const uint32_t key_words[8], uint32_t flags ) :
    flags( flags ), chunk_counter( 0 ), block_len( 0 ), blocks_compressed( 0 ), cv_stack_len( 0 ) {
    memcpy(key, key_words, sizeof(key));
    memcpy(chunk_cv, key_words, sizeof(chunk_cv));
    memset(block, 0, sizeof(block));
}

RefHasher::RefHasher() : RefHasher( BLAKE3_IV, 0 ) {}

RefHasher::RefHasher( const uint8_t key_bytes[BLAKE3_KEY_LEN] ) : RefHasher( BLAKE3_IV, KEYED_HASH ) {
    uint32_t key_words[16];
    uint8_t  padded[BLAKE3_BLOCK_LEN] = { 0 };

    memcpy(padded, key_bytes, BLAKE3_KEY_LEN);
    words_from_block(padded, key_words);
    memcpy(key, key_words, sizeof(key));
    memcpy(chunk_cv, key_words, sizeof(chunk_cv));
}

void RefHasher::context_key( const char * context, uint32_t key_words[8] ) {
    RefHasher context_hasher( BLAKE3_IV, DERIVE_KEY_CONTEXT );
    uint8_t   context_key[BLAKE3_BLOCK_LEN] = { 0 };
    uint32_t  context_key_words[16];

    context_hasher.update(context, strlen(context));
    context_hasher.finalize(context_key, BLAKE3_KEY_LEN);
    words_from_block(context_key, context_key_words);
    memcpy(key_words, context_key_words, 8 * sizeof(uint32_t));
}

RefHasher RefHasher::newDeriveKey( const char * context ) {
    uint32_t key_words[8];

    context_key(context, key_words);
    return RefHasher(key_words, DERIVE_KEY_MATERIAL);
}

RefHasher::Node RefHasher::chunk_output( void ) const {
    Node node;

    memcpy(node.input_cv, chunk_cv, sizeof(node.input_cv));
    words_from_block(block, node.block_words);
    node.counter   = chunk_counter;
    node.block_len = (uint32_t)block_len;
    node.flags     = flags | CHUNK_END | ((blocks_compressed == 0) ? CHUNK_START : 0);
    return node;
}

RefHasher::Node RefHasher::parent_output( const uint32_t left[8], const uint32_t right[8] ) const {
    Node node;

    memcpy(node.input_cv, key, sizeof(node.input_cv));
    memcpy(&node.block_words[0], left , 8 * sizeof(uint32_t));
    memcpy(&node.block_words[8], right, 8 * sizeof(uint32_t));
    node.counter   = 0;
    node.block_len = BLAKE3_BLOCK_LEN;
    node.flags     = flags | PARENT;
    return node;
}

// Each trailing 0 bit in total_chunks is one completed subtree to
// merge with.
void RefHasher::add_chunk_chaining_value( uint32_t new_cv[8], uint64_t total_chunks ) {
    while ((total_chunks & 1) == 0) {
        cv_stack_len--;
        parent_output(cv_stack[cv_stack_len], new_cv).chaining_value(new_cv);
        total_chunks >>= 1;
    }
    memcpy(cv_stack[cv_stack_len], new_cv, 8 * sizeof(uint32_t));
    cv_stack_len++;
}

void RefHasher::update( const void * input_v, size_t input_len ) {
    const uint8_t * input = (const uint8_t *)input_v;

    while (input_len > 0) {
        // A full chunk is only finished once more input shows up
        if ((blocks_compressed * BLAKE3_BLOCK_LEN + block_len) == BLAKE3_CHUNK_LEN) {
            uint32_t chunk_cv_out[8];
            chunk_output().chaining_value(chunk_cv_out);
            const uint64_t total_chunks = chunk_counter + 1;
            add_chunk_chaining_value(chunk_cv_out, total_chunks);
            memcpy(chunk_cv, key, sizeof(chunk_cv));
            chunk_counter     = total_chunks;
            blocks_compressed = 0;
            block_len         = 0;
            memset(block, 0, sizeof(block));
        }

        if (block_len == BLAKE3_BLOCK_LEN) {
            uint32_t words[16], out[16];
            words_from_block(block, words);
            ref_compress(chunk_cv, words, chunk_counter, BLAKE3_BLOCK_LEN,
                    flags | ((blocks_compressed == 0) ? CHUNK_START : 0), out);
            memcpy(chunk_cv, out, sizeof(chunk_cv));
            blocks_compressed++;
            block_len = 0;
            memset(block, 0, sizeof(block));
        }

        size_t want = BLAKE3_BLOCK_LEN - block_len;
        size_t take = (want < input_len) ? want : input_len;
        memcpy(&block[block_len], input, take);
        block_len += take;
        input     += take;
        input_len -= take;
    }
}

void RefHasher::finalize( uint8_t * out, size_t out_len, uint64_t position ) const {
    Node   output = chunk_output();
    size_t parent_nodes_remaining = cv_stack_len;

    while (parent_nodes_remaining > 0) {
        uint32_t right[8];
        parent_nodes_remaining--;
        output.chaining_value(right);
        output = parent_output(cv_stack[parent_nodes_remaining], right);
    }
    output.root_output_bytes(out, out_len, position);
}

//-----------------------------------------------------------------------------

void ref_universal_hash( const uint8_t * input, size_t input_len, const uint8_t key_bytes[BLAKE3_KEY_LEN],
        uint64_t counter, uint8_t out[BLAKE3_UNIVERSAL_HASH_LEN] ) {
    uint8_t  padded_key[BLAKE3_BLOCK_LEN] = { 0 };
    uint32_t key_words[16];
    size_t   offset = 0;

    memcpy(padded_key, key_bytes, BLAKE3_KEY_LEN);
    words_from_block(padded_key, key_words);
    memset(out, 0, BLAKE3_UNIVERSAL_HASH_LEN);

    do {
        uint8_t  block[BLAKE3_BLOCK_LEN] = { 0 };
        uint32_t words[16], result[16];
        size_t   take = input_len - offset;

        if (take > BLAKE3_BLOCK_LEN) {
            take = BLAKE3_BLOCK_LEN;
        }
        if (take > 0) {
            memcpy(block, input + offset, take);
        }
        words_from_block(block, words);
        ref_compress(key_words, words, counter, (uint32_t)take,
                KEYED_HASH | CHUNK_START | CHUNK_END | ROOT, result);
        for (size_t i = 0; i < BLAKE3_UNIVERSAL_HASH_LEN; i++) {
            out[i] ^= (uint8_t)(result[i / 4] >> (8 * (i % 4)));
        }
        offset += take;
        counter++;
    } while (offset < input_len);
}
