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
/*
 * Random number generation for the self-tests.
 *
 * The Rand object is a counter-based RNG built on the engine's own
 * extendable output. A 64-bit seed is mixed with Rand::GLOBAL_SEED and
 * used as key material in derive-key mode, and the resulting output
 * stream is read 8 bytes at a time as little-endian integers. Since
 * the output stream is seekable, so is Rand.
 *
 * Public Rand APIs:
 *
 *   seek(N) updates the state of the Rand object to be the same as it
 *   would be after N random numbers have been generated from the
 *   initial state. getoffset() returns the N such that the N'th random
 *   number is about to be generated.
 *
 *   rand_u64() returns the next random 64-bit integer.
 *
 *   rand_range(max) returns a random value in the range [0, max). The
 *   bias is negligible for the ranges the tests use.
 *
 *   rand_n(buf, len) fills buf[] with len random bytes. It always uses
 *   some multiple of 8 bytes of the stream, so two consecutive calls
 *   are equivalent to one larger call if the first call has a length
 *   evenly divisible by 8.
 */
#pragma once

#include "Blake3.h"

class Rand {
  public:
    constexpr static unsigned  RANDS_PER_ROUND = BLAKE3_BLOCK_LEN / sizeof(uint64_t);
    constexpr static unsigned  BUFLEN          = RANDS_PER_ROUND;
    static uint64_t            GLOBAL_SEED;

  private:
    uint8_t             rngbuf[BUFLEN * sizeof(uint64_t)];
    uint64_t            rseed;   // The actual seed value
    Blake3OutputReader  stream;
    uint64_t            counter; // The next output block to be read
    uint64_t            bufidx;  // The next rngbuf[] word to be given out

    void refill_buf( void );

    static Blake3OutputReader seeded_stream( uint64_t rseed );

    static inline uint64_t weakmix( uint64_t a, uint64_t b ) {
        const uint64_t K = UINT64_C(0x3C6EF372FE94F82B); // sqrt(5) - 1

        return (3 * a) + (5 * b) + (4 * a * b) + K;
    }

  public:
    Rand( uint64_t seed = 0 ) :
        rseed( weakmix(seed, GLOBAL_SEED) ), stream( seeded_stream(rseed) ) {
        seek(0);
    }

    inline void reseed( uint64_t seed ) {
        rseed  = weakmix(seed, GLOBAL_SEED);
        stream = seeded_stream(rseed);
        seek(0);
    }

    inline void seek( uint64_t offset ) {
        counter = offset / RANDS_PER_ROUND;
        bufidx  = BUFLEN + (offset % RANDS_PER_ROUND);
    }

    inline uint64_t getoffset( void ) const {
        return (counter * RANDS_PER_ROUND) + bufidx - BUFLEN;
    }

    inline uint64_t rand_u64( void ) {
        if (unlikely(bufidx >= BUFLEN)) {
            refill_buf();
            bufidx -= BUFLEN;
        }
        const uint8_t * p = &rngbuf[bufidx++ * sizeof(uint64_t)];
        return (uint64_t)GET_U32_LE(p, 0) | ((uint64_t)GET_U32_LE(p, 4) << 32);
    }

    inline uint32_t rand_range( uint32_t max ) {
        uint64_t r = rand_u64() >> 32;

        return (uint32_t)((r * max) >> 32);
    }

    void rand_n( void * buf, size_t bytes );
}; // class Rand
