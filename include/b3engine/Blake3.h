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
#pragma once

#include "Blake3Platform.h"

#include <string>

class Blake3Joiner;

//-----------------------------------------------------------------------------
// A 32-byte digest. Comparisons run in constant time.

class Blake3Hash {
  public:
    Blake3Hash() { memset(bytes, 0, sizeof(bytes)); }

    static Blake3Hash fromBytes( const uint8_t in[BLAKE3_OUT_LEN] );

    // Accepts exactly 64 hex characters, in either case. On failure,
    // *err describes the problem and *out is left untouched.
    static bool fromHex( const char * hex, size_t len, Blake3Hash * out, std::string * err );

    std::string toHex( void ) const;

    const uint8_t * as_bytes( void ) const { return bytes; }

    bool operator == ( const Blake3Hash & other ) const;

    bool operator != ( const Blake3Hash & other ) const {
        return !(*this == other);
    }

  private:
    uint8_t  bytes[BLAKE3_OUT_LEN];
};

//-----------------------------------------------------------------------------
// One not-yet-compressed node of the tree. If it turns out to be the
// root, it can produce any amount of output; otherwise it produces a
// single chaining value.

class Blake3Output {
  public:
    Blake3Output( const uint32_t input_cv[8], const uint8_t block[BLAKE3_BLOCK_LEN], uint8_t block_len,
            uint64_t counter, uint8_t flags, const Blake3Platform & platform );

    static Blake3Output parent( const uint8_t block[BLAKE3_BLOCK_LEN], const uint32_t key[8],
            uint8_t flags, const Blake3Platform & platform );

    void chaining_value( uint8_t cv[BLAKE3_OUT_LEN] ) const;

    Blake3Hash root_hash( void ) const;

    uint32_t        input_cv[8];
    uint8_t         block[BLAKE3_BLOCK_LEN];
    uint8_t         block_len;
    uint64_t        counter;
    uint8_t         flags;
    Blake3Platform  platform;
};

//-----------------------------------------------------------------------------
// A cursor into the unbounded output stream of a root node. Bytes
// [64*i, 64*i+64) of the stream come from output block counter i.

class Blake3OutputReader {
  public:
    explicit Blake3OutputReader( const Blake3Output & root );

    void fill( uint8_t * buf, size_t len );

    // XORs the stream into buf. Doing this twice from the same
    // position restores the original contents.
    void fill_xor( uint8_t * buf, size_t len );

    uint64_t position( void ) const;

    void set_position( uint64_t position );

    // whence is SEEK_SET or SEEK_CUR. Returns false, leaving the
    // position unchanged, if the target is negative or unrepresentable.
    // SEEK_END always fails.
    bool seek( int64_t offset, int whence );

  private:
    template <bool xorout>
    void fill_impl( uint8_t * buf, size_t len );

    Blake3Output  inner;
    size_t        position_within_block;
};

//-----------------------------------------------------------------------------
// Incremental hashing of a single chunk.

class Blake3ChunkState {
  public:
    Blake3ChunkState( const uint32_t key[8], uint8_t flags, const Blake3Platform & platform );

    // Consumes at most enough bytes to fill this chunk, and returns
    // how many were taken. The last block is always held back until
    // more input arrives, since it needs CHUNK_END.
    size_t update( const uint8_t * input, size_t input_len );

    size_t len( void ) const {
        return (BLAKE3_BLOCK_LEN * (size_t)blocks_compressed) + ((size_t)buf_len);
    }

    uint64_t counter( void ) const { return chunk_counter; }

    void set_counter( uint64_t c ) { chunk_counter = c; }

    uint8_t mode_flags( void ) const { return flags; }

    Blake3Output output( void ) const;

    void finalize( bool is_root, uint8_t cv[BLAKE3_OUT_LEN] ) const;

    void reset( const uint32_t key[8], uint64_t new_counter );

  private:
    uint8_t start_flag( void ) const {
        return (blocks_compressed == 0) ? CHUNK_START : 0;
    }

    size_t fill_buf( const uint8_t * input, size_t input_len );

    uint32_t        cv[8];
    uint64_t        chunk_counter;
    uint8_t         buf[BLAKE3_BLOCK_LEN];
    uint8_t         buf_len;
    uint8_t         blocks_compressed;
    uint8_t         flags;
    Blake3Platform  platform;
};

//-----------------------------------------------------------------------------
// The stack of completed subtree CVs. After N completed chunks have
// been merged, it holds popcount(N) entries, largest subtree first.

class Blake3CVStack {
  public:
    Blake3CVStack() : len( 0 ) {}

    // Merges as many completed pairs as total_chunks allows, then
    // pushes new_cv. chunk_counter is the index of new_cv's first chunk.
    void push( const uint8_t new_cv[BLAKE3_OUT_LEN], uint64_t chunk_counter, const uint32_t key[8],
            uint8_t flags, const Blake3Platform & platform );

    void merge( uint64_t total_chunks, const uint32_t key[8], uint8_t flags, const Blake3Platform & platform );

    size_t size( void ) const { return len; }

    const uint8_t * entry( size_t i ) const { return &cvs[i * BLAKE3_OUT_LEN]; }

    void clear( void ) { len = 0; }

  private:
    uint8_t  cvs[(BLAKE3_MAX_DEPTH + 1) * BLAKE3_OUT_LEN];
    size_t   len;
};

//-----------------------------------------------------------------------------
// The incremental hasher

class Blake3Hasher {
  public:
    Blake3Hasher();
    explicit Blake3Hasher( const Blake3Platform & platform );
    explicit Blake3Hasher( const uint8_t key[BLAKE3_KEY_LEN] );
    Blake3Hasher( const uint8_t key[BLAKE3_KEY_LEN], const Blake3Platform & platform );

    static Blake3Hasher newDeriveKey( const char * context );
    static Blake3Hasher newDeriveKey( const char * context, const Blake3Platform & platform );

    Blake3Hasher & update( const void * input, size_t input_len );

    // Same result as update(), but large subtrees are hashed by the
    // wide driver, with joiner deciding what runs concurrently.
    Blake3Hasher & update_parallel( const void * input, size_t input_len, Blake3Joiner & joiner );

    // None of the finalize variants modify the hasher. More input may
    // be added afterwards.
    Blake3Hash finalize( void ) const;
    void finalize( uint8_t * out, size_t out_len ) const;
    Blake3OutputReader finalize_xof( void ) const;

    void reset( void );

    // Total number of input bytes so far
    uint64_t count( void ) const;

    const Blake3Platform & platform( void ) const { return plat; }

  private:
    Blake3Hasher( const uint32_t key[8], uint8_t flags, const Blake3Platform & platform );

    // joiner is NULL for purely sequential hashing
    void update_impl( const uint8_t * input, size_t input_len, Blake3Joiner * joiner );

    Blake3Output final_output( void ) const;

    uint32_t          key[8];
    Blake3ChunkState  chunk;
    Blake3CVStack     cv_stack;
    Blake3Platform    plat;
};

//-----------------------------------------------------------------------------
// One-shot helpers

Blake3Hash blake3_hash( const void * input, size_t input_len );
Blake3Hash blake3_keyed_hash( const uint8_t key[BLAKE3_KEY_LEN], const void * input, size_t input_len );
void blake3_derive_key( const char * context, const void * key_material, size_t key_material_len,
        uint8_t out[BLAKE3_KEY_LEN] );
