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
#include "Random.h"

uint64_t Rand::GLOBAL_SEED = 0;

static const char * RAND_CONTEXT = "B3Engine 2022-06-01 self-test random number generator";

Blake3OutputReader Rand::seeded_stream( uint64_t rseed ) {
    Blake3Hasher hasher = Blake3Hasher::newDeriveKey(RAND_CONTEXT);
    uint8_t      material[8];

    PUT_U64_LE(rseed, material, 0);
    hasher.update(material, sizeof(material));
    return hasher.finalize_xof();
}

// Reading only ever happens on output block boundaries
void Rand::refill_buf( void ) {
    stream.set_position(counter * BLAKE3_BLOCK_LEN);
    stream.fill(rngbuf, sizeof(rngbuf));
    counter++;
}

void Rand::rand_n( void * buf, size_t bytes ) {
    uint8_t * out = (uint8_t *)buf;

    while (bytes > 0) {
        if (unlikely(bufidx >= BUFLEN)) {
            refill_buf();
            bufidx -= BUFLEN;
        }
        const size_t take = (bytes > sizeof(uint64_t)) ? sizeof(uint64_t) : bytes;
        memcpy(out, &rngbuf[bufidx * sizeof(uint64_t)], take);
        bufidx++;
        out   += take;
        bytes -= take;
    }
}
