#include "murmur_hash.hpp"

namespace {

constexpr uint64_t kC1 = 0x87c37b91114253d5ULL;
constexpr uint64_t kC2 = 0x4cf5ad432745937fULL;

inline uint64_t rotl64(uint64_t x, int r) {
    return (x << r) | (x >> (64 - r));
}

inline uint64_t fmix64(uint64_t k) {
    k ^= k >> 33;
    k *= 0xff51afd7ed558ccdULL;
    k ^= k >> 33;
    k *= 0xc4ceb9fe1a85ec53ULL;
    k ^= k >> 33;
    return k;
}

// little-endian load regardless of host byte order
inline uint64_t load64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

}  // namespace

uint64_t murmur3_64(const void* data, size_t size) {
    const auto* bytes = static_cast<const uint8_t*>(data);
    const size_t nblocks = size / 16;

    uint64_t h1 = 0;
    uint64_t h2 = 0;

    for (size_t i = 0; i < nblocks; ++i) {
        uint64_t k1 = load64(bytes + i * 16);
        uint64_t k2 = load64(bytes + i * 16 + 8);

        k1 *= kC1;
        k1 = rotl64(k1, 31);
        k1 *= kC2;
        h1 ^= k1;

        h1 = rotl64(h1, 27);
        h1 += h2;
        h1 = h1 * 5 + 0x52dce729;

        k2 *= kC2;
        k2 = rotl64(k2, 33);
        k2 *= kC1;
        h2 ^= k2;

        h2 = rotl64(h2, 31);
        h2 += h1;
        h2 = h2 * 5 + 0x38495ab5;
    }

    const uint8_t* tail = bytes + nblocks * 16;
    const size_t rest = size & 15;

    uint64_t k1 = 0;
    uint64_t k2 = 0;

    if (rest > 8) {
        for (size_t i = rest; i > 8; --i) {
            k2 ^= static_cast<uint64_t>(tail[i - 1]) << ((i - 9) * 8);
        }
        k2 *= kC2;
        k2 = rotl64(k2, 33);
        k2 *= kC1;
        h2 ^= k2;
    }

    if (rest > 0) {
        const size_t low = rest < 8 ? rest : 8;
        for (size_t i = low; i > 0; --i) {
            k1 ^= static_cast<uint64_t>(tail[i - 1]) << ((i - 1) * 8);
        }
        k1 *= kC1;
        k1 = rotl64(k1, 31);
        k1 *= kC2;
        h1 ^= k1;
    }

    h1 ^= static_cast<uint64_t>(size);
    h2 ^= static_cast<uint64_t>(size);

    h1 += h2;
    h2 += h1;

    h1 = fmix64(h1);
    h2 = fmix64(h2);

    h1 += h2;
    return h1;
}
