#include <cstdint>
#include <immintrin.h>

void FOO(const uint8_t * input1, const uint8_t * input2, uint8_t * output) {
    const __m256i rot16 = _mm256_setr_epi8(
            2, 3, 0, 1, 6, 7, 4, 5, 10, 11, 8, 9, 14, 15, 12, 13,
            2, 3, 0, 1, 6, 7, 4, 5, 10, 11, 8, 9, 14, 15, 12, 13);
    __m256i a = _mm256_loadu_si256((const __m256i *)input1);
    __m256i b = _mm256_loadu_si256((const __m256i *)input2);
    a = _mm256_add_epi32(a, b);
    a = _mm256_shuffle_epi8(a, rot16);
    a = _mm256_unpacklo_epi32(a, _mm256_permute4x64_epi64(b, 0x4E));
    a = _mm256_permute2x128_si256(a, b, 0x20);
    _mm256_storeu_si256((__m256i *)output, a);
}

uint8_t buf1[32];
uint8_t buf2[32];
uint8_t buf3[32];

int main(void) {
    FOO(buf1, buf2, buf3);
}
