#include <cstdint>
#include <immintrin.h>

void FOO(const uint8_t * input1, const uint8_t * input2, uint8_t * output) {
    const __m128i rot8 = _mm_setr_epi8(1, 2, 3, 0, 5, 6, 7, 4, 9, 10, 11, 8, 13, 14, 15, 12);
    __m128i a = _mm_loadu_si128((const __m128i *)input1);
    __m128i b = _mm_loadu_si128((const __m128i *)input2);
    a = _mm_add_epi32(a, b);
    a = _mm_shuffle_epi8(a, rot8);
    a = _mm_blend_epi16(a, b, 0xCC);
    a = _mm_xor_si128(a, _mm_shuffle_epi32(b, 0x93));
    _mm_storeu_si128((__m128i *)output, a);
}

uint8_t buf1[16];
uint8_t buf2[16];
uint8_t buf3[16];

int main(void) {
    FOO(buf1, buf2, buf3);
}
