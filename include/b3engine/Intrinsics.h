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

// Only the translation units built with wider ISA flags may include
// this, since anything inlined from it may use those instructions.

#if defined(HAVE_SSE_4_1) || defined(HAVE_AVX2)
  #if defined(_MSC_VER)
    #include <intrin.h>
  #else
    #include <immintrin.h>
  #endif
#endif

//-----------------------------------------------------------------------------
// Unaligned loads and stores

#if defined(HAVE_SSE_4_1)
  #define LOADU_128(p)     _mm_loadu_si128((const __m128i *)(p))
  #define STOREU_128(p, r) _mm_storeu_si128((__m128i *)(p), r)
#endif

#if defined(HAVE_AVX2)
  #define LOADU_256(p)     _mm256_loadu_si256((const __m256i *)(p))
  #define STOREU_256(p, r) _mm256_storeu_si256((__m256i *)(p), r)
#endif

//-----------------------------------------------------------------------------
// Byte shuffles that rotate every 32-bit lane right by 16 or by 8 bits

#define ROT16_SHUFFLE_BYTES 2, 3, 0, 1, 6, 7, 4, 5, 10, 11, 8, 9, 14, 15, 12, 13
#define ROT8_SHUFFLE_BYTES  1, 2, 3, 0, 5, 6, 7, 4, 9, 10, 11, 8, 13, 14, 15, 12
