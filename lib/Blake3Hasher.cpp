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
#include "Blake3Parallel.h"

//-----------------------------------------------------------------------------
// Output nodes

Blake3Output::Blake3Output( const uint32_t input_cv[8], const uint8_t block[BLAKE3_BLOCK_LEN],
        uint8_t block_len, uint64_t counter, uint8_t flags, const Blake3Platform & platform ) :
    block_len( block_len ), counter( counter ), flags( flags ), platform( platform ) {
    memcpy(this->input_cv, input_cv, 32);
    memcpy(this->block   , block   , BLAKE3_BLOCK_LEN);
}

Blake3Output Blake3Output::parent( const uint8_t block[BLAKE3_BLOCK_LEN], const uint32_t key[8],
        uint8_t flags, const Blake3Platform & platform ) {
    return Blake3Output(key, block, BLAKE3_BLOCK_LEN, 0, flags | PARENT, platform);
}

void Blake3Output::chaining_value( uint8_t cv[BLAKE3_OUT_LEN] ) const {
    uint32_t cv_words[8];

    memcpy(cv_words, input_cv, 32);
    platform.compress_in_place(cv_words, block, block_len, counter, flags);
    le_bytes_from_words_32(cv_words, cv);
}

// The root node is always compressed with counter 0, which is also the
// first output block.
Blake3Hash Blake3Output::root_hash( void ) const {
    uint32_t cv_words[8];
    uint8_t  bytes[BLAKE3_OUT_LEN];

    memcpy(cv_words, input_cv, 32);
    platform.compress_in_place(cv_words, block, block_len, 0, flags | ROOT);
    le_bytes_from_words_32(cv_words, bytes);
    return Blake3Hash::fromBytes(bytes);
}

//-----------------------------------------------------------------------------
// The output stream. inner.counter is reused as the output block
// counter.

Blake3OutputReader::Blake3OutputReader( const Blake3Output & root ) :
    inner( root ), position_within_block( 0 ) {
    inner.counter = 0;
}

uint64_t Blake3OutputReader::position( void ) const {
    return inner.counter * BLAKE3_BLOCK_LEN + position_within_block;
}

void Blake3OutputReader::set_position( uint64_t position ) {
    inner.counter         = position / BLAKE3_BLOCK_LEN;
    position_within_block = (size_t)(position % BLAKE3_BLOCK_LEN);
}

bool Blake3OutputReader::seek( int64_t offset, int whence ) {
    uint64_t target;

    switch (whence) {
    case SEEK_SET:
        if (offset < 0) {
            return false;
        }
        target = (uint64_t)offset;
        break;
    case SEEK_CUR:
    {
        const uint64_t cur = position();
        if (offset < 0) {
            // Negating INT64_MIN directly would overflow
            const uint64_t back = (uint64_t)(-(offset + 1)) + 1;
            if (back > cur) {
                return false;
            }
            target = cur - back;
        } else {
            if ((uint64_t)offset > UINT64_MAX - cur) {
                return false;
            }
            target = cur + (uint64_t)offset;
        }
        break;
    }
    default:
        // The stream has no end
        return false;
    }
    set_position(target);
    return true;
}

template <bool xorout>
void Blake3OutputReader::fill_impl( uint8_t * buf, size_t len ) {
    uint8_t wide_buf[64];

    if (len == 0) {
        return;
    }
    if ((uint64_t)len > UINT64_MAX - position()) {
        blake3_fatal("output stream exhausted: reading %zu bytes at position %" PRIu64, len, position());
    }

    const uint8_t flags = inner.flags | ROOT;

    if (position_within_block > 0) {
        const size_t available = BLAKE3_BLOCK_LEN - position_within_block;
        const size_t take      = (len > available) ? available : len;
        inner.platform.compress_xof(inner.input_cv, inner.block, inner.block_len, inner.counter, flags, wide_buf);
        for (size_t i = 0; i < take; i++) {
            if (xorout) {
                buf[i] ^= wide_buf[position_within_block + i];
            } else {
                buf[i]  = wide_buf[position_within_block + i];
            }
        }
        buf  = &buf[take];
        len -= take;
        position_within_block += take;
        if (position_within_block == BLAKE3_BLOCK_LEN) {
            inner.counter        += 1;
            position_within_block = 0;
        }
    }

    const size_t whole = len - (len % BLAKE3_BLOCK_LEN);
    if (whole > 0) {
        if (xorout) {
            inner.platform.xof_xor(inner.block, inner.block_len, inner.input_cv, inner.counter, flags, buf, whole);
        } else {
            inner.platform.xof(inner.block, inner.block_len, inner.input_cv, inner.counter, flags, buf, whole);
        }
        inner.counter += whole / BLAKE3_BLOCK_LEN;
        buf  = &buf[whole];
        len -= whole;
    }

    if (len > 0) {
        inner.platform.compress_xof(inner.input_cv, inner.block, inner.block_len, inner.counter, flags, wide_buf);
        for (size_t i = 0; i < len; i++) {
            if (xorout) {
                buf[i] ^= wide_buf[i];
            } else {
                buf[i]  = wide_buf[i];
            }
        }
        position_within_block = len;
    }
}

void Blake3OutputReader::fill( uint8_t * buf, size_t len ) {
    fill_impl<false>(buf, len);
}

void Blake3OutputReader::fill_xor( uint8_t * buf, size_t len ) {
    fill_impl<true>(buf, len);
}

//-----------------------------------------------------------------------------
// Chunk state

Blake3ChunkState::Blake3ChunkState( const uint32_t key[8], uint8_t flags, const Blake3Platform & platform ) :
    chunk_counter( 0 ), buf_len( 0 ), blocks_compressed( 0 ), flags( flags ), platform( platform ) {
    memcpy(cv, key, BLAKE3_KEY_LEN);
    memset(buf, 0, BLAKE3_BLOCK_LEN);
}

void Blake3ChunkState::reset( const uint32_t key[8], uint64_t new_counter ) {
    memcpy(cv, key, BLAKE3_KEY_LEN);
    chunk_counter     = new_counter;
    blocks_compressed = 0;
    memset(buf, 0, BLAKE3_BLOCK_LEN);
    buf_len = 0;
}

size_t Blake3ChunkState::fill_buf( const uint8_t * input, size_t input_len ) {
    size_t take = BLAKE3_BLOCK_LEN - ((size_t)buf_len);

    if (take > input_len) {
        take = input_len;
    }
    if (take > 0) {
        memcpy(&buf[buf_len], input, take);
        buf_len += (uint8_t)take;
    }
    return take;
}

size_t Blake3ChunkState::update( const uint8_t * input, size_t input_len ) {
    size_t consumed = BLAKE3_CHUNK_LEN - len();

    if (consumed > input_len) {
        consumed = input_len;
    }
    input_len = consumed;

    if (buf_len > 0) {
        size_t take = fill_buf(input, input_len);
        input      = &input[take];
        input_len -= take;
        if (input_len > 0) {
            platform.compress_in_place(cv, buf, BLAKE3_BLOCK_LEN, chunk_counter, flags | start_flag());
            blocks_compressed += 1;
            buf_len = 0;
            memset(buf, 0, BLAKE3_BLOCK_LEN);
        }
    }

    while (input_len > BLAKE3_BLOCK_LEN) {
        platform.compress_in_place(cv, input, BLAKE3_BLOCK_LEN, chunk_counter, flags | start_flag());
        blocks_compressed += 1;
        input      = &input[BLAKE3_BLOCK_LEN];
        input_len -= BLAKE3_BLOCK_LEN;
    }

    fill_buf(input, input_len);
    return consumed;
}

Blake3Output Blake3ChunkState::output( void ) const {
    const uint8_t block_flags = flags | start_flag() | CHUNK_END;

    return Blake3Output(cv, buf, buf_len, chunk_counter, block_flags, platform);
}

void Blake3ChunkState::finalize( bool is_root, uint8_t out[BLAKE3_OUT_LEN] ) const {
    if (is_root) {
        memcpy(out, output().root_hash().as_bytes(), BLAKE3_OUT_LEN);
    } else {
        output().chaining_value(out);
    }
}

//-----------------------------------------------------------------------------
// CV stack

// As described in push(), the stack holds one entry per 1 bit in the
// number of chunks hashed so far, once pending merges are done. Merges
// are done lazily, so the top two entries may still be siblings until
// the next push or merge.
void Blake3CVStack::merge( uint64_t total_chunks, const uint32_t key[8], uint8_t flags,
        const Blake3Platform & platform ) {
    const size_t post_merge_stack_len = (size_t)popcount8(total_chunks);

    while (len > post_merge_stack_len) {
        uint8_t *          parent_node = &cvs[(len - 2) * BLAKE3_OUT_LEN];
        const Blake3Output output      = Blake3Output::parent(parent_node, key, flags, platform);
        output.chaining_value(parent_node);
        len -= 1;
    }
}

void Blake3CVStack::push( const uint8_t new_cv[BLAKE3_OUT_LEN], uint64_t chunk_counter, const uint32_t key[8],
        uint8_t flags, const Blake3Platform & platform ) {
    merge(chunk_counter, key, flags, platform);
    if (len >= BLAKE3_MAX_DEPTH + 1) {
        blake3_fatal("CV stack overflow: %zu entries already present", len);
    }
    memcpy(&cvs[len * BLAKE3_OUT_LEN], new_cv, BLAKE3_OUT_LEN);
    len += 1;
}

//-----------------------------------------------------------------------------
// The incremental hasher

Blake3Hasher::Blake3Hasher( const uint32_t key_words[8], uint8_t flags, const Blake3Platform & platform ) :
    chunk( key_words, flags, platform ), plat( platform ) {
    memcpy(key, key_words, BLAKE3_KEY_LEN);
}

Blake3Hasher::Blake3Hasher() :
    Blake3Hasher( BLAKE3_IV, 0, Blake3Platform::detect() ) {}

Blake3Hasher::Blake3Hasher( const Blake3Platform & platform ) :
    Blake3Hasher( BLAKE3_IV, 0, platform ) {}

Blake3Hasher::Blake3Hasher( const uint8_t key_bytes[BLAKE3_KEY_LEN] ) :
    Blake3Hasher( key_bytes, Blake3Platform::detect() ) {}

Blake3Hasher::Blake3Hasher( const uint8_t key_bytes[BLAKE3_KEY_LEN], const Blake3Platform & platform ) :
    chunk( BLAKE3_IV, KEYED_HASH, platform ), plat( platform ) {
    words_from_le_bytes_32(key_bytes, key);
    chunk.reset(key, 0);
}

Blake3Hasher Blake3Hasher::newDeriveKey( const char * context ) {
    return newDeriveKey(context, Blake3Platform::detect());
}

// The context string is hashed on its own first, and that hash is
// the key for the key material.
Blake3Hasher Blake3Hasher::newDeriveKey( const char * context, const Blake3Platform & platform ) {
    Blake3Hasher context_hasher( BLAKE3_IV, DERIVE_KEY_CONTEXT, platform );
    uint8_t      context_key[BLAKE3_KEY_LEN];
    uint32_t     context_key_words[8];

    context_hasher.update(context, strlen(context));
    context_hasher.finalize(context_key, BLAKE3_KEY_LEN);
    words_from_le_bytes_32(context_key, context_key_words);
    return Blake3Hasher(context_key_words, DERIVE_KEY_MATERIAL, platform);
}

void Blake3Hasher::reset( void ) {
    chunk.reset(key, 0);
    cv_stack.clear();
}

uint64_t Blake3Hasher::count( void ) const {
    return chunk.counter() * BLAKE3_CHUNK_LEN + chunk.len();
}

Blake3Hasher & Blake3Hasher::update( const void * input, size_t input_len ) {
    update_impl((const uint8_t *)input, input_len, NULL);
    return *this;
}

Blake3Hasher & Blake3Hasher::update_parallel( const void * input, size_t input_len, Blake3Joiner & joiner ) {
    update_impl((const uint8_t *)input, input_len, &joiner);
    return *this;
}

void Blake3Hasher::update_impl( const uint8_t * input_bytes, size_t input_len, Blake3Joiner * joiner ) {
    const uint8_t flags = chunk.mode_flags();

    // Explicitly checking for zero avoids passing a null pointer to memcpy
    if (input_len == 0) {
        return;
    }

    // If we have some partial chunk bytes in the internal chunk state, we
    // need to finish that chunk first.
    if (chunk.len() > 0) {
        size_t take = chunk.update(input_bytes, input_len);
        input_bytes = &input_bytes[take];
        input_len  -= take;
        // If we've filled the current chunk and there's more coming,
        // finalize this chunk and proceed. In this case we know it's not
        // the root.
        if (input_len > 0) {
            uint8_t chunk_cv[BLAKE3_OUT_LEN];
            chunk.finalize(false, chunk_cv);
            cv_stack.push(chunk_cv, chunk.counter(), key, flags, plat);
            chunk.reset(key, chunk.counter() + 1);
        } else {
            return;
        }
    }

    // Now the chunk state is clear, and we have more input. If there's
    // more than a single chunk (so, definitely not the root chunk), hash
    // the largest whole subtree we can. Two restrictions:
    // - The subtree has to be a power-of-2 number of chunks. Only
    //   subtrees along the right edge can be incomplete, and we don't
    //   know where the right edge is going to be until finalize().
    // - The subtree must evenly divide the total number of chunks up
    //   until this point (if total is not 0). If the current incomplete
    //   subtree is only waiting for 1 more chunk, we can't hash a
    //   subtree of 4 chunks. We have to complete the current subtree
    //   first.
    while (input_len > BLAKE3_CHUNK_LEN) {
        size_t   subtree_len  = (size_t)largest_power_of_two_leq(input_len);
        uint64_t count_so_far = chunk.counter() * BLAKE3_CHUNK_LEN;
        // Shrink subtree_len until it evenly divides the count so far.
        while ((((uint64_t)(subtree_len - 1)) & count_so_far) != 0) {
            subtree_len /= 2;
        }
        // The shrunken subtree_len might now be 1 chunk long. If so, hash
        // that one chunk by itself. Otherwise, compress the subtree into a
        // pair of CVs.
        uint64_t subtree_chunks = subtree_len / BLAKE3_CHUNK_LEN;
        if (subtree_len <= BLAKE3_CHUNK_LEN) {
            Blake3ChunkState chunk_state( key, flags, plat );
            uint8_t          cv[BLAKE3_OUT_LEN];
            chunk_state.set_counter(chunk.counter());
            chunk_state.update(input_bytes, subtree_len);
            chunk_state.finalize(false, cv);
            cv_stack.push(cv, chunk_state.counter(), key, flags, plat);
        } else {
            uint8_t cv_pair[2 * BLAKE3_OUT_LEN];
            blake3_compress_subtree_to_parent_node(plat, input_bytes, subtree_len, key,
                    chunk.counter(), flags, joiner, cv_pair);
            cv_stack.push(&cv_pair[0], chunk.counter(), key, flags, plat);
            cv_stack.push(&cv_pair[BLAKE3_OUT_LEN], chunk.counter() + (subtree_chunks / 2), key, flags, plat);
        }
        chunk.set_counter(chunk.counter() + subtree_chunks);
        input_bytes = &input_bytes[subtree_len];
        input_len  -= subtree_len;
    }

    // If there's any remaining input less than a full chunk, add it to
    // the chunk state. In that case, also do a final merge loop to make
    // sure the subtree stack doesn't contain any unmerged pairs. The
    // remaining input means we know these merges are non-root.
    if (input_len > 0) {
        chunk.update(input_bytes, input_len);
        cv_stack.merge(chunk.counter(), key, flags, plat);
    }
}

Blake3Output Blake3Hasher::final_output( void ) const {
    const uint8_t flags = chunk.mode_flags();

    // If the subtree stack is empty, then the current chunk is the root.
    if (cv_stack.size() == 0) {
        return chunk.output();
    }

    // If there are any bytes in the chunk state, finalize that chunk
    // and do a roll-up merge between that chunk hash and every subtree
    // in the stack. The merge loop at the end of update() guarantees
    // that none of the subtrees in the stack need to be merged with
    // each other first. Otherwise, if there are no bytes in the chunk
    // state, then the top of the stack is a chunk hash, and we start
    // the merge from that.
    size_t  cvs_remaining;
    uint8_t parent_block[BLAKE3_BLOCK_LEN];

    if (chunk.len() > 0) {
        cvs_remaining = cv_stack.size();
        Blake3Output output = chunk.output();
        output.chaining_value(&parent_block[32]);
    } else {
        // There are always at least 2 CVs in the stack in this case.
        cvs_remaining = cv_stack.size() - 2;
        Blake3Output output = Blake3Output::parent(cv_stack.entry(cvs_remaining), key, flags, plat);
        if (cvs_remaining == 0) {
            return output;
        }
        output.chaining_value(&parent_block[32]);
    }
    while (cvs_remaining > 1) {
        cvs_remaining -= 1;
        memcpy(parent_block, cv_stack.entry(cvs_remaining), BLAKE3_OUT_LEN);
        Blake3Output::parent(parent_block, key, flags, plat).chaining_value(&parent_block[32]);
    }
    memcpy(parent_block, cv_stack.entry(0), BLAKE3_OUT_LEN);
    return Blake3Output::parent(parent_block, key, flags, plat);
}

Blake3Hash Blake3Hasher::finalize( void ) const {
    return final_output().root_hash();
}

void Blake3Hasher::finalize( uint8_t * out, size_t out_len ) const {
    Blake3OutputReader reader( final_output() );

    reader.fill(out, out_len);
}

Blake3OutputReader Blake3Hasher::finalize_xof( void ) const {
    return Blake3OutputReader(final_output());
}

//-----------------------------------------------------------------------------
// One-shot helpers

Blake3Hash blake3_hash( const void * input, size_t input_len ) {
    Blake3Hasher hasher;

    hasher.update(input, input_len);
    return hasher.finalize();
}

Blake3Hash blake3_keyed_hash( const uint8_t key[BLAKE3_KEY_LEN], const void * input, size_t input_len ) {
    Blake3Hasher hasher( key );

    hasher.update(input, input_len);
    return hasher.finalize();
}

void blake3_derive_key( const char * context, const void * key_material, size_t key_material_len,
        uint8_t out[BLAKE3_KEY_LEN] ) {
    Blake3Hasher hasher = Blake3Hasher::newDeriveKey(context);

    hasher.update(key_material, key_material_len);
    hasher.finalize(out, BLAKE3_KEY_LEN);
}
