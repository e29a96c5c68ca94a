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
#include "Blake3Parallel.h"

#if defined(HAVE_THREADS)
  #include <thread>
  #include <exception>
  #include <system_error>
#endif

//-----------------------------------------------------------------------------
// Joiners

Blake3ThreadJoiner::Blake3ThreadJoiner( unsigned nthreads )
#if defined(HAVE_THREADS)
    : spare_threads( (nthreads > 1) ? (int)(nthreads - 1) : 0 )
#endif
{
#if !defined(HAVE_THREADS)
    (void)nthreads;
#endif
}

void Blake3ThreadJoiner::join( const std::function<void ()> & left, const std::function<void ()> & right ) {
#if defined(HAVE_THREADS)
    if (spare_threads.fetch_sub(1) > 0) {
        std::exception_ptr left_error;
        std::thread        t;

        try {
            t = std::thread([&left, &left_error]() {
                        try {
                            left();
                        } catch (...) {
                            left_error = std::current_exception();
                        }
                    });
        } catch (const std::system_error &) {
            // No thread could be started, so run both halves here
            spare_threads.fetch_add(1);
            left();
            right();
            return;
        }

        // The worker must be joined even if right() throws
        try {
            right();
        } catch (...) {
            t.join();
            spare_threads.fetch_add(1);
            throw;
        }
        t.join();
        spare_threads.fetch_add(1);
        if (left_error) {
            std::rethrow_exception(left_error);
        }
        return;
    }
    spare_threads.fetch_add(1);
#endif
    left();
    right();
}

//-----------------------------------------------------------------------------
// The byte-array driver, used by Blake3Hasher. CVs are kept as
// consecutive 32-byte strings and batches go through hash_many().

static size_t compress_parents_parallel( const Blake3Platform & platform, const uint8_t * child_chaining_values,
        size_t num_chaining_values, const uint32_t key[8], uint8_t flags, uint8_t * out ) {
    const uint8_t * parents_array[BLAKE3_MAX_SIMD_DEGREE_OR_2];
    size_t          parents_array_len = 0;

    while (num_chaining_values - (2 * parents_array_len) >= 2) {
        parents_array[parents_array_len] =
                &child_chaining_values[2 * parents_array_len * BLAKE3_OUT_LEN];
        parents_array_len += 1;
    }

    platform.hash_many(parents_array, parents_array_len, 1, key, 0, // Parents always use counter 0.
            INCREMENT_COUNTER_NO, flags | PARENT, 0,               // Parents have no start flags.
            0,                                                     // Parents have no end flags.
            out);

    // If there's an odd child left over, it becomes an output.
    if (num_chaining_values > 2 * parents_array_len) {
        memcpy(&out[parents_array_len * BLAKE3_OUT_LEN],
                &child_chaining_values[2 * parents_array_len * BLAKE3_OUT_LEN], BLAKE3_OUT_LEN);
        return parents_array_len + 1;
    } else {
        return parents_array_len;
    }
}

static size_t compress_chunks_parallel( const Blake3Platform & platform, const uint8_t * input, size_t input_len,
        const uint32_t key[8], uint64_t chunk_counter, uint8_t flags, uint8_t * out ) {
    const uint8_t * chunks_array[BLAKE3_MAX_SIMD_DEGREE];
    size_t          input_position   = 0;
    size_t          chunks_array_len = 0;

    while (input_len - input_position >= BLAKE3_CHUNK_LEN) {
        chunks_array[chunks_array_len] = &input[input_position];
        input_position   += BLAKE3_CHUNK_LEN;
        chunks_array_len += 1;
    }

    platform.hash_many(chunks_array, chunks_array_len, BLAKE3_CHUNK_LEN / BLAKE3_BLOCK_LEN, key,
            chunk_counter, INCREMENT_COUNTER_YES, flags, CHUNK_START, CHUNK_END, out);

    // Hash the remaining partial chunk, if there is one. Note that the
    // empty chunk (meaning the empty message) is a different codepath.
    if (input_len > input_position) {
        Blake3ChunkState chunk_state( key, flags, platform );
        chunk_state.set_counter(chunk_counter + (uint64_t)chunks_array_len);
        chunk_state.update(&input[input_position], input_len - input_position);
        chunk_state.finalize(false, &out[chunks_array_len * BLAKE3_OUT_LEN]);
        return chunks_array_len + 1;
    } else {
        return chunks_array_len;
    }
}

static size_t compress_subtree_wide( const Blake3Platform & platform, const uint8_t * input, size_t input_len,
        const uint32_t key[8], uint64_t chunk_counter, uint8_t flags, Blake3Joiner * joiner, uint8_t * out ) {
    // Note that the single chunk case does *not* bump the SIMD degree up
    // to 2 when it is 1. This gives the joiner the option of splitting
    // even the 2-chunk case.
    if (input_len <= platform.simd_degree() * BLAKE3_CHUNK_LEN) {
        return compress_chunks_parallel(platform, input, input_len, key, chunk_counter, flags, out);
    }

    // With more than simd_degree chunks, we need to recurse. Start by
    // dividing the input into left and right subtrees. (Note that this is
    // only optimal as long as the SIMD degree is a power of 2.)
    const size_t    left_input_len      = left_len(input_len);
    const size_t    right_input_len     = input_len - left_input_len;
    const uint8_t * right_input         = &input[left_input_len];
    const uint64_t  right_chunk_counter = chunk_counter + (uint64_t)(left_input_len / BLAKE3_CHUNK_LEN);

    uint8_t cv_array[2 * BLAKE3_MAX_SIMD_DEGREE_OR_2 * BLAKE3_OUT_LEN];
    size_t  degree = platform.simd_degree();
    if ((left_input_len > BLAKE3_CHUNK_LEN) && (degree == 1)) {
        // The special case: We always use a degree of at least two, to
        // make sure there are two outputs. Except, as noted above, at the
        // chunk level, where we allow degree=1.
        degree = 2;
    }
    uint8_t * right_cvs = &cv_array[degree * BLAKE3_OUT_LEN];

    size_t left_n = 0, right_n = 0;
    if (joiner == NULL) {
        left_n  = compress_subtree_wide(platform, input, left_input_len, key, chunk_counter, flags, NULL, cv_array);
        right_n = compress_subtree_wide(platform, right_input, right_input_len, key,
                right_chunk_counter, flags, NULL, right_cvs);
    } else {
        joiner->join([&]() {
                    left_n = compress_subtree_wide(platform, input, left_input_len, key,
                            chunk_counter, flags, joiner, cv_array);
                }, [&]() {
                    right_n = compress_subtree_wide(platform, right_input, right_input_len, key,
                            right_chunk_counter, flags, joiner, right_cvs);
                });
    }

    // The special case again. If simd_degree=1, then we'll have left_n=1
    // and right_n=1. Rather than compressing them into a single output,
    // return them directly, to make sure we always have at least two
    // outputs.
    if (left_n == 1) {
        memcpy(out, cv_array, 2 * BLAKE3_OUT_LEN);
        return 2;
    }

    // Otherwise, do one layer of parent node compression.
    const size_t num_chaining_values = left_n + right_n;
    return compress_parents_parallel(platform, cv_array, num_chaining_values, key, flags, out);
}

void blake3_compress_subtree_to_parent_node( const Blake3Platform & platform, const uint8_t * input,
        size_t input_len, const uint32_t key[8], uint64_t chunk_counter, uint8_t flags, Blake3Joiner * joiner,
        uint8_t out[2 * BLAKE3_OUT_LEN] ) {
    uint8_t cv_array[BLAKE3_MAX_SIMD_DEGREE_OR_2 * BLAKE3_OUT_LEN];
    size_t  num_cvs = compress_subtree_wide(platform, input, input_len, key, chunk_counter, flags, joiner, cv_array);
    // With a SIMD degree above 2 and enough input, compress_subtree_wide()
    // returns more than 2 chaining values. Condense them into 2 by
    // forming parent nodes repeatedly.
    uint8_t out_array[BLAKE3_MAX_SIMD_DEGREE_OR_2 * BLAKE3_OUT_LEN / 2];

    while (num_cvs > 2) {
        num_cvs = compress_parents_parallel(platform, cv_array, num_cvs, key, flags, out_array);
        memcpy(cv_array, out_array, num_cvs * BLAKE3_OUT_LEN);
    }
    memcpy(out, cv_array, 2 * BLAKE3_OUT_LEN);
}

//-----------------------------------------------------------------------------
// The transposed driver. Same tree as above, but CVs live in the
// columns of a Blake3TransposedVectors, and the batch width is a
// parameter instead of a property of the implementation.

static void check_degree( size_t degree ) {
    if ((degree == 0) || (degree > BLAKE3_MAX_SIMD_DEGREE) || ((degree & (degree - 1)) != 0)) {
        blake3_fatal("invalid batch degree %zu: must be a power of 2 no larger than %d",
                degree, BLAKE3_MAX_SIMD_DEGREE);
    }
}

static size_t hash_subtree_transposed( const Blake3Platform & platform, const uint8_t * input, size_t input_len,
        const uint32_t key[8], uint64_t chunk_counter, uint8_t flags, size_t degree, Blake3Joiner & joiner,
        Blake3TransposedVectors & out, size_t output_column ) {
    if (input_len <= degree * BLAKE3_CHUNK_LEN) {
        platform.hash_chunks(input, input_len, key, chunk_counter, flags, out, output_column);
        return (input_len + BLAKE3_CHUNK_LEN - 1) / BLAKE3_CHUNK_LEN;
    }

    const size_t    left_input_len      = left_len(input_len);
    const size_t    right_input_len     = input_len - left_input_len;
    const uint8_t * right_input         = &input[left_input_len];
    const uint64_t  right_chunk_counter = chunk_counter + (uint64_t)(left_input_len / BLAKE3_CHUNK_LEN);

    // The left side always fills exactly right_column columns, so the
    // right side's CVs follow on directly.
    Blake3TransposedVectors children;
    size_t right_column = degree;
    if ((left_input_len > BLAKE3_CHUNK_LEN) && (degree == 1)) {
        right_column = 2;
    }

    size_t left_n = 0, right_n = 0;
    joiner.join([&]() {
                left_n = hash_subtree_transposed(platform, input, left_input_len, key, chunk_counter,
                        flags, degree, joiner, children, 0);
            }, [&]() {
                right_n = hash_subtree_transposed(platform, right_input, right_input_len, key,
                        right_chunk_counter, flags, degree, joiner, children, right_column);
            });

    // Only possible with degree 1: return both chunk CVs as-is, so
    // there are always at least two outputs.
    if (left_n == 1) {
        out.copyColumn(output_column + 0, children, 0);
        out.copyColumn(output_column + 1, children, 1);
        return 2;
    }

    // One layer of parents. An odd CV left over is carried through.
    const size_t num_cvs     = left_n + right_n;
    const size_t num_parents = num_cvs / 2;
    platform.hash_parents(Blake3ParentInOut::Separate(children, num_parents, out, output_column), key, flags);
    if ((num_cvs & 1) != 0) {
        out.copyColumn(output_column + num_parents, children, num_cvs - 1);
        return num_parents + 1;
    }
    return num_parents;
}

size_t blake3_hash_subtree( const Blake3Platform & platform, const uint8_t * input, size_t input_len,
        const uint32_t key[8], uint64_t chunk_counter, uint8_t flags, size_t degree, Blake3Joiner & joiner,
        Blake3TransposedVectors & out, size_t output_column ) {
    check_degree(degree);
    return hash_subtree_transposed(platform, input, input_len, key, chunk_counter, flags,
            degree, joiner, out, output_column);
}

// Hashes more than one chunk of input down to exactly two CVs, in
// columns 0 and 1 of cvs.
static void reduce_to_two( const Blake3Platform & platform, const uint8_t * input, size_t input_len,
        const uint32_t key[8], uint8_t flags, size_t degree, Blake3Joiner & joiner,
        Blake3TransposedVectors & cvs ) {
    size_t num_cvs = hash_subtree_transposed(platform, input, input_len, key, 0, flags, degree, joiner, cvs, 0);

    while (num_cvs > 2) {
        size_t num_parents = num_cvs / 2;
        platform.hash_parents(Blake3ParentInOut::InPlace(cvs, num_parents), key, flags);
        if ((num_cvs & 1) != 0) {
            cvs.copyColumn(num_parents, num_cvs - 1);
            num_parents += 1;
        }
        num_cvs = num_parents;
    }
}

Blake3Output blake3_root_output_wide( const Blake3Platform & platform, const uint8_t * input, size_t input_len,
        const uint32_t key[8], uint8_t flags, size_t degree, Blake3Joiner & joiner ) {
    check_degree(degree);

    // A single chunk is its own root
    if (input_len <= BLAKE3_CHUNK_LEN) {
        Blake3ChunkState chunk( key, flags, platform );
        chunk.update(input, input_len);
        return chunk.output();
    }

    Blake3TransposedVectors cvs;
    uint32_t                children[16];
    uint8_t                 block[BLAKE3_BLOCK_LEN];

    reduce_to_two(platform, input, input_len, key, flags, degree, joiner, cvs);
    cvs.getColumn(0, &children[0]);
    cvs.getColumn(1, &children[8]);
    le_bytes_from_words_32(&children[0], &block[ 0]);
    le_bytes_from_words_32(&children[8], &block[32]);
    return Blake3Output::parent(block, key, flags, platform);
}

Blake3Hash blake3_root_hash_wide( const Blake3Platform & platform, const uint8_t * input, size_t input_len,
        const uint32_t key[8], uint8_t flags, size_t degree, Blake3Joiner & joiner ) {
    check_degree(degree);

    if (input_len <= BLAKE3_CHUNK_LEN) {
        return blake3_root_output_wide(platform, input, input_len, key, flags, degree, joiner).root_hash();
    }

    Blake3TransposedVectors cvs, root;
    uint32_t                root_words[8];
    uint8_t                 root_bytes[BLAKE3_OUT_LEN];

    reduce_to_two(platform, input, input_len, key, flags, degree, joiner, cvs);
    platform.hash_parents(Blake3ParentInOut::Separate(cvs, 1, root, 0), key, flags | ROOT);
    root.getColumn(0, root_words);
    le_bytes_from_words_32(root_words, root_bytes);
    return Blake3Hash::fromBytes(root_bytes);
}
