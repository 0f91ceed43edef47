/**
 * @file representation.cpp
 * @brief Fingerprint banding and Hamming similarity
 */

#include <core/representation.hpp>

namespace Twinscan {

uint64_t Fingerprint::band(uint32_t offset, uint32_t width) const {
    if (width == 0) return 0;
    const uint32_t word = offset >> 6;
    const uint32_t shift = offset & 63;

    uint64_t value = words[word] >> shift;
    // Band straddles the word boundary
    if (shift + width > 64 && word + 1 < words.size()) {
        value |= words[word + 1] << (64 - shift);
    }
    if (width < 64) value &= (1ULL << width) - 1;
    return value;
}

uint32_t hamming_distance(const Fingerprint& a, const Fingerprint& b) {
    return static_cast<uint32_t>(__builtin_popcountll(a.words[0] ^ b.words[0]) +
                                 __builtin_popcountll(a.words[1] ^ b.words[1]));
}

double fingerprint_similarity(const Fingerprint& a, const Fingerprint& b) {
    const uint32_t bits = a.bits > 0 ? a.bits : 64;
    return 1.0 - static_cast<double>(hamming_distance(a, b)) / static_cast<double>(bits);
}

} // namespace Twinscan
