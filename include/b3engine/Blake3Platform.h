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

#include "Platform.h"

#include <vector>

//-----------------------------------------------------------------------------
// Sizes and constants

#define BLAKE3_KEY_LEN              32
#define BLAKE3_OUT_LEN              32
#define BLAKE3_BLOCK_LEN            64
#define BLAKE3_CHUNK_LEN          1024
#define BLAKE3_MAX_DEPTH            54
#define BLAKE3_UNIVERSAL_HASH_LEN   16

// The widest batch any implementation may process in one call. The
// transposed buffers are sized from this, not from whatever the
// running CPU supports.
#define BLAKE3_MAX_SIMD_DEGREE      16
#define BLAKE3_MAX_SIMD_DEGREE_OR_2 (BLAKE3_MAX_SIMD_DEGREE > 2 ? BLAKE3_MAX_SIMD_DEGREE : 2)
#define BLAKE3_TRANSPOSED_COLUMNS   (2 * BLAKE3_MAX_SIMD_DEGREE)

// internal flags
enum blake3_flags {
    CHUNK_START         = 1 << 0,
    CHUNK_END           = 1 << 1,
    PARENT              = 1 << 2,
    ROOT                = 1 << 3,
    KEYED_HASH          = 1 << 4,
    DERIVE_KEY_CONTEXT  = 1 << 5,
    DERIVE_KEY_MATERIAL = 1 << 6,
};

extern const uint32_t BLAKE3_IV[8];
extern const uint8_t  BLAKE3_MSG_PERMUTATION[16];
extern const uint8_t  BLAKE3_MSG_SCHEDULE[7][16];

//-----------------------------------------------------------------------------
// Small helpers shared by every implementation

static FORCE_INLINE uint32_t counter_low( uint64_t counter ) { return (uint32_t)counter; }

static FORCE_INLINE uint32_t counter_high( uint64_t counter ) {
    return (uint32_t)(counter >> 32);
}

// Returns 1 for an input of 0.
static FORCE_INLINE uint64_t largest_power_of_two_leq( uint64_t x ) {
    return UINT64_C(1) << (63 ^ clz8(x | 1));
}

static FORCE_INLINE size_t left_len( size_t content_len ) {
    // Subtract 1 to reserve at least one byte for the right side. content_len
    // should always be greater than BLAKE3_CHUNK_LEN.
    size_t full_chunks = (content_len - 1) / BLAKE3_CHUNK_LEN;

    return largest_power_of_two_leq(full_chunks) * BLAKE3_CHUNK_LEN;
}

static FORCE_INLINE void words_from_le_bytes_32( const uint8_t bytes[32], uint32_t words[8] ) {
    for (size_t i = 0; i < 8; i++) {
        words[i] = GET_U32_LE(bytes, 4 * i);
    }
}

static FORCE_INLINE void le_bytes_from_words_32( const uint32_t words[8], uint8_t bytes[32] ) {
    for (size_t i = 0; i < 8; i++) {
        PUT_U32_LE(words[i], bytes, 4 * i);
    }
}

//-----------------------------------------------------------------------------
// Batch data layouts

enum IncrementCounter {
    INCREMENT_COUNTER_NO  = 0,
    INCREMENT_COUNTER_YES = 1,
};

// 8 rows, one per CV word, by BLAKE3_TRANSPOSED_COLUMNS columns, one
// per in-flight chunk or parent. Column i holds the i'th CV.
struct Blake3TransposedVectors {
    uint32_t  words[8][BLAKE3_TRANSPOSED_COLUMNS];

    Blake3TransposedVectors() {
        memset(words, 0, sizeof(words));
    }

    uint32_t * operator [] ( size_t row ) { return words[row]; }

    const uint32_t * operator [] ( size_t row ) const { return words[row]; }

    void getColumn( size_t column, uint32_t cv[8] ) const {
        for (size_t row = 0; row < 8; row++) {
            cv[row] = words[row][column];
        }
    }

    void setColumn( size_t column, const uint32_t cv[8] ) {
        for (size_t row = 0; row < 8; row++) {
            words[row][column] = cv[row];
        }
    }

    void copyColumn( size_t to, size_t from ) {
        for (size_t row = 0; row < 8; row++) {
            words[row][to] = words[row][from];
        }
    }

    void copyColumn( size_t to, const Blake3TransposedVectors & src, size_t from ) {
        for (size_t row = 0; row < 8; row++) {
            words[row][to] = src.words[row][from];
        }
    }

    bool operator == ( const Blake3TransposedVectors & other ) const {
        return memcmp(words, other.words, sizeof(words)) == 0;
    }
};

// Where hash_parents() reads its CV pairs and writes its results.
// SEPARATE reads columns [0, 2*num_parents) of input and writes
// columns [output_column, output_column + num_parents) of output.
// IN_PLACE reads and writes the same buffer, starting at column 0.
struct Blake3ParentInOut {
    enum Mode {
        SEPARATE,
        IN_PLACE,
    };

    Mode                            mode;
    const Blake3TransposedVectors * input;
    Blake3TransposedVectors *       output;
    size_t                          num_parents;
    size_t                          output_column;

    static Blake3ParentInOut Separate( const Blake3TransposedVectors & input, size_t num_parents,
            Blake3TransposedVectors & output, size_t output_column ) {
        Blake3ParentInOut io = { SEPARATE, &input, &output, num_parents, output_column };

        return io;
    }

    static Blake3ParentInOut InPlace( Blake3TransposedVectors & in_out, size_t num_parents ) {
        Blake3ParentInOut io = { IN_PLACE, &in_out, &in_out, num_parents, 0 };

        return io;
    }
};

//-----------------------------------------------------------------------------
// Implementation variants
//
// Every variant provides the same set of functions. All of them must
// give bit-identical results to the portable variant.

typedef void (*Blake3CompressInPlaceFn)( uint32_t cv[8], const uint8_t block[BLAKE3_BLOCK_LEN],
        uint8_t block_len, uint64_t counter, uint8_t flags );
typedef void (*Blake3CompressXofFn)( const uint32_t cv[8], const uint8_t block[BLAKE3_BLOCK_LEN],
        uint8_t block_len, uint64_t counter, uint8_t flags, uint8_t out[64] );
typedef void (*Blake3HashManyFn)( const uint8_t * const * inputs, size_t num_inputs, size_t blocks,
        const uint32_t key[8], uint64_t counter, IncrementCounter increment_counter, uint8_t flags,
        uint8_t flags_start, uint8_t flags_end, uint8_t * out );
// Hashes whole chunks, plus an optional trailing partial chunk, into
// consecutive columns starting at output_column.
typedef void (*Blake3HashChunksFn)( const uint8_t * input, size_t input_len, const uint32_t key[8],
        uint64_t counter, uint8_t flags, Blake3TransposedVectors & out, size_t output_column );
// Hashes parents [first_parent, first_parent + num_parents). Parent i
// reads columns 2i and 2i+1 of input and writes column
// (output_column + i) of output. input and output may be the same
// buffer when output_column is 0.
typedef void (*Blake3HashParentsFn)( const Blake3TransposedVectors & input, size_t first_parent,
        size_t num_parents, Blake3TransposedVectors & output, size_t output_column,
        const uint32_t key[8], uint8_t flags );
typedef bool (*Blake3SupportedFn)( void );

class Blake3Impl {
  public:
    const char *             name;
    const char *             desc;
    uint32_t                 simd_degree;
    Blake3SupportedFn        is_supported;
    Blake3CompressInPlaceFn  compress_in_place;
    Blake3CompressXofFn      compress_xof;
    Blake3HashManyFn         hash_many;
    Blake3HashChunksFn       hash_chunks;
    Blake3HashParentsFn      hash_parents;

    Blake3Impl( const char * n ) :
        name( n ), desc( "" ), simd_degree( 1 ), is_supported( NULL ), compress_in_place( NULL ),
        compress_xof( NULL ), hash_many( NULL ), hash_chunks( NULL ), hash_parents( NULL ) {}

    bool Supported( void ) const {
        return (is_supported == NULL) || is_supported();
    }
};

// Interface for implementations
unsigned register_impl( const Blake3Impl * impl );

// Interface for consumers. findAllImpls() returns every compiled-in
// implementation, widest first, whether or not this CPU supports it.
const Blake3Impl * findImpl( const char * name );
std::vector<const Blake3Impl *> findAllImpls( void );
void listImpls( void );

#define CONCAT_INNER(x, y) x ## y
#define CONCAT(x, y) CONCAT_INNER(x, y)

#define REGISTER_IMPL(N, ...)                    \
  static_assert(sizeof(#N) > 1,                  \
      "REGISTER_IMPL() needs a non-empty name"); \
  static Blake3Impl CONCAT(Impl_,N) = []{        \
    Blake3Impl $(#N);                            \
    __VA_ARGS__;                                 \
    return $;                                    \
  }();                                           \
  static unsigned CONCAT(Reg_,N) =               \
      register_impl(&CONCAT(Impl_,N))

//-----------------------------------------------------------------------------
// The dispatcher. This is a thin, copyable handle on one registered
// implementation. All batch entry points are bounds-checked here, so
// the implementations themselves can assume valid arguments.

class Blake3Platform {
  public:
    // The widest implementation this CPU supports. Selected on first
    // call and fixed for the life of the process.
    static Blake3Platform detect( void );
    static Blake3Platform portable( void );

    explicit Blake3Platform( const Blake3Impl * impl );

    const Blake3Impl * implementation( void ) const { return impl; }

    const char * name( void ) const { return impl->name; }

    size_t simd_degree( void ) const { return impl->simd_degree; }

    void compress_in_place( uint32_t cv[8], const uint8_t block[BLAKE3_BLOCK_LEN], uint8_t block_len,
            uint64_t counter, uint8_t flags ) const {
        impl->compress_in_place(cv, block, block_len, counter, flags);
    }

    void compress_xof( const uint32_t cv[8], const uint8_t block[BLAKE3_BLOCK_LEN], uint8_t block_len,
            uint64_t counter, uint8_t flags, uint8_t out[64] ) const {
        impl->compress_xof(cv, block, block_len, counter, flags, out);
    }

    void hash_many( const uint8_t * const * inputs, size_t num_inputs, size_t blocks, const uint32_t key[8],
            uint64_t counter, IncrementCounter increment_counter, uint8_t flags, uint8_t flags_start,
            uint8_t flags_end, uint8_t * out ) const;

    void hash_chunks( const uint8_t * input, size_t input_len, const uint32_t key[8], uint64_t counter,
            uint8_t flags, Blake3TransposedVectors & out, size_t output_column ) const;

    void hash_parents( const Blake3ParentInOut & io, const uint32_t key[8], uint8_t flags ) const;

    void xof( const uint8_t block[BLAKE3_BLOCK_LEN], uint8_t block_len, const uint32_t cv[8],
            uint64_t counter, uint8_t flags, uint8_t * out, size_t out_len ) const;

    void xof_xor( const uint8_t block[BLAKE3_BLOCK_LEN], uint8_t block_len, const uint32_t cv[8],
            uint64_t counter, uint8_t flags, uint8_t * out, size_t out_len ) const;

    void universal_hash( const uint8_t * input, size_t input_len, const uint32_t key[8],
            uint64_t counter, uint8_t out[BLAKE3_UNIVERSAL_HASH_LEN] ) const;

  private:
    template <bool xorout>
    void xof_impl( const uint8_t block[BLAKE3_BLOCK_LEN], uint8_t block_len, const uint32_t cv[8],
            uint64_t counter, uint8_t flags, uint8_t * out, size_t out_len ) const;

    const Blake3Impl * impl;
};
