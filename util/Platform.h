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
//-----------------------------------------------------------------------------
// Platform-specific functions and macros
#pragma once

#ifdef HAVE_THREADS
#include <thread>
extern unsigned g_NCPU;
#else
extern const unsigned g_NCPU;
#endif

// Report a programming error (broken invariant, capacity exceeded)
// and exit. Never returns.
#if defined(_MSC_VER)
__declspec(noreturn) void blake3_fatal( const char * fmt, ... );
#else
void blake3_fatal( const char * fmt, ... ) __attribute__((noreturn, format(printf, 1, 2)));
#endif

#if !defined(HAVE_X86_64)
  #if defined(__x86_64) || defined(_M_AMD64) || defined(_M_X64)
    #define HAVE_X86_64
  #elif defined(__i386__)
    #define HAVE_X86_32
  #endif
#endif

//-----------------------------------------------------------------------------
// Microsoft Visual Studio

#if defined(_MSC_VER)

#include <stdlib.h>
#include <stdint.h>
#include <intrin.h>

#define FORCE_INLINE	__forceinline
#define	NEVER_INLINE  __declspec(noinline)

#define ROTR32(x,y)	_rotr(x,y)

#define popcount8(x)  __popcnt64(x)

// Assumes x is not 0!!!
#define clz8(x) __lzcnt64(x)

#define likely(x) (x)
#define unlikely(x) (x)

#define strcasecmp  _stricmp
#define strncasecmp _strnicmp

//-----------------------------------------------------------------------------
// Other compilers

#else	//	!defined(_MSC_VER)

#include <cstdlib>
#include <cstdint>
#include <cstddef>

#define	FORCE_INLINE inline __attribute__((always_inline))
#define	NEVER_INLINE __attribute__((noinline))

#define popcount8(x) __builtin_popcountll(x)

// Assumes x is not 0!!!
#define clz8(x) __builtin_clzll(x)

// Deliberately unsafe! Assumes r is not 0 or >=8*sizeof(x)
inline uint32_t rotr32( uint32_t x, int8_t r ) {
    return (x >> r) | (x << (32 - r));
}

#define	ROTR32(x,y)	rotr32(x,y)

#define likely(x) __builtin_expect(!!(x), 1)
#define unlikely(x) __builtin_expect(!!(x), 0)

#include <strings.h>

#endif	//	!defined(_MSC_VER)

//-----------------------------------------------------------------------------
#include <cstdio>
#include <cstring>
#include <cinttypes>

static FORCE_INLINE bool isLE( void ) {
    const uint32_t   value = 0xb000000e;
    const void *      addr = static_cast<const void *>(&value);
    const uint8_t *   lsb  = static_cast<const uint8_t *>(addr);
    return ((*lsb) == 0x0e);
}

static FORCE_INLINE bool isBE( void ) {
    const uint32_t   value = 0xb000000e;
    const void *      addr = static_cast<const void *>(&value);
    const uint8_t *   lsb  = static_cast<const uint8_t *>(addr);
    return ((*lsb) == 0xb0);
}

//-----------------------------------------------------------------------------
// 32-bit integer manipulation functions. These move data in
// alignment-safe ways, always in little-endian byte order.

static FORCE_INLINE uint32_t GET_U32_LE( const uint8_t * b, const size_t i ) {
    return ((uint32_t)b[i + 0] <<  0) | ((uint32_t)b[i + 1] <<  8) |
           ((uint32_t)b[i + 2] << 16) | ((uint32_t)b[i + 3] << 24);
}

static FORCE_INLINE void PUT_U32_LE( uint32_t n, uint8_t * b, const size_t i ) {
    b[i + 0] = (uint8_t)(n >>  0);
    b[i + 1] = (uint8_t)(n >>  8);
    b[i + 2] = (uint8_t)(n >> 16);
    b[i + 3] = (uint8_t)(n >> 24);
}

static FORCE_INLINE void PUT_U64_LE( uint64_t n, uint8_t * b, const size_t i ) {
    PUT_U32_LE((uint32_t)n, b, i);
    PUT_U32_LE((uint32_t)(n >> 32), b, i + 4);
}
