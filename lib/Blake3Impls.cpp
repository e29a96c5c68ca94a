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
#include "Blake3Platform.h"
#include "blake3/Impls.h"

#include <cstdio>
#include <string>
#include <unordered_map>
#include <algorithm>

#if defined(HAVE_X86_64) && defined(_MSC_VER)
  #include <intrin.h>
#endif

//-----------------------------------------------------------------------------
typedef std::unordered_map<std::string, const Blake3Impl *>  ImplMap;
typedef std::vector<const Blake3Impl *>                      ImplMapOrder;

static ImplMap & implMap() {
    static ImplMap * map = new ImplMap;

    return *map;
}

//-----------------------------------------------------------------------------
// Add an implementation to the list of all implementations.
unsigned register_impl( const Blake3Impl * impl ) {
    std::string name = impl->name;

    // Allow users to lookup implementations by any case
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);

    if (implMap().find(name) != implMap().end()) {
        printf("Implementation names must be unique.\n");
        printf("\"%s\" (\"%s\") was added multiple times.\n", impl->name, name.c_str());
        printf("Note that implementation names are using a case-insensitive comparison.\n");
        exit(1);
    }

    if ((impl->simd_degree == 0) || (impl->simd_degree > BLAKE3_MAX_SIMD_DEGREE) ||
            ((impl->simd_degree & (impl->simd_degree - 1)) != 0)) {
        printf("ERROR: implementation %s has invalid SIMD degree %u\n", impl->name, impl->simd_degree);
        exit(1);
    }

    if ((impl->compress_in_place == NULL) || (impl->compress_xof == NULL) || (impl->hash_many == NULL) ||
            (impl->hash_chunks == NULL) || (impl->hash_parents == NULL)) {
        printf("ERROR: implementation %s is missing a function pointer\n", impl->name);
        exit(1);
    }

    implMap()[name] = impl;
    return implMap().size();
}

//-----------------------------------------------------------------------------
// Routines for querying/finding implementations that have been registered.

// Widest first, then by name (case-insensitive)
static ImplMapOrder defaultSort( ImplMap & map ) {
    ImplMapOrder impls;

    impls.reserve(map.size());
    for (auto kv: map) {
        impls.push_back(kv.second);
    }
    std::sort(impls.begin(), impls.end(), []( const Blake3Impl * a, const Blake3Impl * b ) {
            if (a->simd_degree != b->simd_degree) {
                return a->simd_degree > b->simd_degree;
            }
            return strcasecmp(a->name, b->name) < 0;
        });
    return impls;
}

std::vector<const Blake3Impl *> findAllImpls( void ) {
    return defaultSort(implMap());
}

const Blake3Impl * findImpl( const char * name ) {
    std::string n = name;

    // Search without regards to case
    std::transform(n.begin(), n.end(), n.begin(), ::tolower);

    const auto it = implMap().find(n);
    if (it == implMap().end()) {
        return NULL;
    }
    return it->second;
}

void listImpls( void ) {
    printf("Implementation names can be supplied using any case letters.\n\n");
    printf("%-12s %6s  %9s  %-50s\n", "Name", "Degree", "Supported", "Description");
    printf("%-12s %6s  %9s  %-50s\n", "----", "------", "---------", "-----------");
    for (const Blake3Impl * impl: defaultSort(implMap())) {
        printf("%-12s %6u  %9s  %-50s\n", impl->name, impl->simd_degree,
                impl->Supported() ? "yes" : "no", impl->desc);
    }
    printf("\n");
}

//-----------------------------------------------------------------------------
// Runtime CPU feature checks. These live here, and not in the variant
// sources, so that nothing compiled with wider ISA flags runs before
// the check has passed.

#if defined(HAVE_SSE_4_1) || defined(HAVE_AVX2)
  #if defined(_MSC_VER)
static bool cpuid_bit( int leaf, int reg, int bit ) {
    int regs[4];

    __cpuidex(regs, leaf, 0);
    return (regs[reg] >> bit) & 1;
}

static bool cpu_has_sse41( void ) {
    return cpuid_bit(1, 2, 19);
}

static bool cpu_has_avx2( void ) {
    // AVX2 also needs the OS to save YMM state
    if (!cpuid_bit(1, 2, 27) || !cpuid_bit(1, 2, 28)) {
        return false;
    }
    if ((_xgetbv(0) & 6) != 6) {
        return false;
    }
    return cpuid_bit(7, 1, 5);
}
  #else
static bool cpu_has_sse41( void ) {
    return __builtin_cpu_supports("sse4.1");
}

static bool cpu_has_avx2( void ) {
    return __builtin_cpu_supports("avx2");
}
  #endif
#endif

//-----------------------------------------------------------------------------
REGISTER_IMPL(portable,
   $.desc              = "Portable C++, one block at a time",
   $.simd_degree       = 1,
   $.is_supported      = NULL,
   $.compress_in_place = blake3_compress_in_place_portable,
   $.compress_xof      = blake3_compress_xof_portable,
   $.hash_many         = blake3_hash_many_portable,
   $.hash_chunks       = blake3_hash_chunks_portable,
   $.hash_parents      = blake3_hash_parents_portable
 );

#if defined(HAVE_SSE_4_1)
REGISTER_IMPL(sse41,
   $.desc              = "x86-64 SSE4.1, 4 inputs at a time",
   $.simd_degree       = 4,
   $.is_supported      = cpu_has_sse41,
   $.compress_in_place = blake3_compress_in_place_sse41,
   $.compress_xof      = blake3_compress_xof_sse41,
   $.hash_many         = blake3_hash_many_sse41,
   $.hash_chunks       = blake3_hash_chunks_sse41,
   $.hash_parents      = blake3_hash_parents_sse41
 );
#endif

#if defined(HAVE_AVX2)
static bool cpu_has_sse41_avx2( void ) {
    return cpu_has_sse41() && cpu_has_avx2();
}

REGISTER_IMPL(avx2,
   $.desc              = "x86-64 AVX2, 8 inputs at a time",
   $.simd_degree       = 8,
   $.is_supported      = cpu_has_sse41_avx2,
   $.compress_in_place = blake3_compress_in_place_sse41,
   $.compress_xof      = blake3_compress_xof_sse41,
   $.hash_many         = blake3_hash_many_avx2,
   $.hash_chunks       = blake3_hash_chunks_avx2,
   $.hash_parents      = blake3_hash_parents_avx2
 );
#endif
