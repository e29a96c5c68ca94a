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

#include "Blake3.h"

#include <functional>
#if defined(HAVE_THREADS)
  #include <atomic>
#endif

//-----------------------------------------------------------------------------
// Fork-join capability used by the recursive drivers. join() returns
// only after both closures have completed. The closures never touch
// the same memory.

class Blake3Joiner {
  public:
    virtual ~Blake3Joiner() {}

    virtual void join( const std::function<void ()> & left, const std::function<void ()> & right ) = 0;
};

class Blake3SerialJoiner : public Blake3Joiner {
  public:
    void join( const std::function<void ()> & left, const std::function<void ()> & right ) {
        left();
        right();
    }
};

// Runs the left closure on a new thread while the caller runs the
// right one, as long as fewer than nthreads threads are busy on this
// joiner's behalf. Otherwise, or if no thread can be started, runs
// both on the calling thread. An exception from either closure is
// rethrown by join() once both have finished.
class Blake3ThreadJoiner : public Blake3Joiner {
  public:
    explicit Blake3ThreadJoiner( unsigned nthreads = g_NCPU );

    void join( const std::function<void ()> & left, const std::function<void ()> & right );

  private:
#if defined(HAVE_THREADS)
    std::atomic<int>  spare_threads;
#endif
};

//-----------------------------------------------------------------------------
// The wide transposed driver. degree must be a power of 2 no larger
// than BLAKE3_MAX_SIMD_DEGREE; it sets how many chunks are hashed per
// batch, but never changes the resulting tree.

// Hashes input into CVs written to columns [output_column, output_column + N)
// of out, and returns N. If input spans more than one chunk, N is at
// least 2; it is never more than max(degree, 2). Chunk-aligned except
// possibly at the end of the whole message.
size_t blake3_hash_subtree( const Blake3Platform & platform, const uint8_t * input, size_t input_len,
        const uint32_t key[8], uint64_t chunk_counter, uint8_t flags, size_t degree, Blake3Joiner & joiner,
        Blake3TransposedVectors & out, size_t output_column );

// The root node of the whole message. ROOT is not yet applied.
Blake3Output blake3_root_output_wide( const Blake3Platform & platform, const uint8_t * input, size_t input_len,
        const uint32_t key[8], uint8_t flags, size_t degree, Blake3Joiner & joiner );

Blake3Hash blake3_root_hash_wide( const Blake3Platform & platform, const uint8_t * input, size_t input_len,
        const uint32_t key[8], uint8_t flags, size_t degree, Blake3Joiner & joiner );

// Hashes a complete power-of-2-sized subtree of more than one chunk
// down to the two CVs of its root. Used by Blake3Hasher.
void blake3_compress_subtree_to_parent_node( const Blake3Platform & platform, const uint8_t * input,
        size_t input_len, const uint32_t key[8], uint64_t chunk_counter, uint8_t flags, Blake3Joiner * joiner,
        uint8_t out[2 * BLAKE3_OUT_LEN] );
