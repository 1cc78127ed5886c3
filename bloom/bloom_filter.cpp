#include "bloom_filter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

#include "murmur_hash.hpp"

namespace {

constexpr size_t kSaltSize = 4;

}  // namespace

BloomFilter::BloomFilter(size_t m, size_t k) : m_(m), k_(k) {
    if (m_ < 1 || k_ < 1) {
        spdlog::debug("BloomFilter: rejected m={} k={}", m, k);
        throw InvalidParameter(m_ < 1 ? "BloomFilter m < 1" : "BloomFilter k < 1");
    }
    bits_.resize(m_, false);
    spdlog::debug("BloomFilter created with {} bits and {} hash functions", m_, k_);
}

std::pair<size_t, size_t> BloomFilter::estimateParameters(size_t n, double p) {
    if (n == 0) {
        throw InvalidParameter("estimateParameters n < 1");
    }
    if (!(p > 0.0 && p < 1.0)) {
        throw InvalidParameter("estimateParameters p must be in (0, 1)");
    }
    const double ln2 = std::log(2.0);
    const double m = std::ceil(-static_cast<double>(n) * std::log(p) / (ln2 * ln2));
    const double k = std::ceil(ln2 * m / static_cast<double>(n));
    // casting a double at or above SIZE_MAX to size_t is undefined
    const double limit = static_cast<double>(std::numeric_limits<size_t>::max());
    if (!(m < limit) || !(k < limit)) {
        throw InvalidParameter("estimateParameters m or k does not fit in size_t");
    }
    return {std::max<size_t>(1, static_cast<size_t>(m)), std::max<size_t>(1, static_cast<size_t>(k))};
}

BloomFilter BloomFilter::withEstimates(size_t n, double p) {
    auto [m, k] = estimateParameters(n, p);
    spdlog::debug("BloomFilter estimates for n={} p={}: m={} k={}", n, p, m, k);
    return BloomFilter(m, k);
}

double BloomFilter::falsePositiveProbability(size_t m, size_t k, size_t n) {
    if (m == 0) {
        return 1.0;
    }
    double exponent = -static_cast<double>(k) * static_cast<double>(n) / static_cast<double>(m);
    double base = 1.0 - std::exp(exponent);
    return std::pow(base, static_cast<double>(k));
}

std::vector<uint8_t> BloomFilter::saltedBuffer(const void* data, size_t size) const {
    std::vector<uint8_t> buffer(size + kSaltSize);
    if (size > 0) {
        std::memcpy(buffer.data(), data, size);
    }
    return buffer;
}

size_t BloomFilter::location(std::vector<uint8_t>& buffer, uint32_t round) const {
    uint8_t* salt = buffer.data() + buffer.size() - kSaltSize;
    salt[0] = static_cast<uint8_t>(round);
    salt[1] = static_cast<uint8_t>(round >> 8);
    salt[2] = static_cast<uint8_t>(round >> 16);
    salt[3] = static_cast<uint8_t>(round >> 24);
    return static_cast<size_t>(murmur3_64(buffer.data(), buffer.size()) % m_);
}

void BloomFilter::add(const void* data, size_t size) {
    auto buffer = saltedBuffer(data, size);
    for (size_t i = 0; i < k_; ++i) {
        bits_.set(location(buffer, static_cast<uint32_t>(i)));
    }
}

void BloomFilter::add(const std::vector<uint8_t>& data) {
    add(data.data(), data.size());
}

void BloomFilter::addString(const std::string& data) {
    add(data.data(), data.size());
}

bool BloomFilter::test(const void* data, size_t size) const {
    auto buffer = saltedBuffer(data, size);
    for (size_t i = 0; i < k_; ++i) {
        if (!bits_.test(location(buffer, static_cast<uint32_t>(i)))) {
            return false;
        }
    }
    return true;
}

bool BloomFilter::test(const std::vector<uint8_t>& data) const {
    return test(data.data(), data.size());
}

bool BloomFilter::testString(const std::string& data) const {
    return test(data.data(), data.size());
}

bool BloomFilter::testAndAdd(const void* data, size_t size) {
    auto buffer = saltedBuffer(data, size);
    bool present = true;
    for (size_t i = 0; i < k_; ++i) {
        size_t loc = location(buffer, static_cast<uint32_t>(i));
        if (!bits_.test(loc)) {
            present = false;
        }
        bits_.set(loc);
    }
    return present;
}

bool BloomFilter::testAndAdd(const std::vector<uint8_t>& data) {
    return testAndAdd(data.data(), data.size());
}

bool BloomFilter::testAndAddString(const std::string& data) {
    return testAndAdd(data.data(), data.size());
}

std::vector<uint64_t> BloomFilter::locations(const void* data, size_t size) const {
    auto buffer = saltedBuffer(data, size);
    std::vector<uint64_t> locs;
    locs.reserve(k_);
    for (size_t i = 0; i < k_; ++i) {
        locs.push_back(location(buffer, static_cast<uint32_t>(i)));
    }
    return locs;
}

bool BloomFilter::testLocations(const std::vector<uint64_t>& locs) const {
    for (uint64_t loc : locs) {
        if (!bits_.test(static_cast<size_t>(loc % m_))) {
            return false;
        }
    }
    return true;
}

void BloomFilter::clearAll() {
    bits_.reset();
}

void BloomFilter::merge(const BloomFilter& other) {
    if (m_ != other.m_ || k_ != other.k_) {
        spdlog::debug("BloomFilter: cannot merge m={} k={} into m={} k={}", other.m_, other.k_, m_, k_);
        throw InvalidParameter("BloomFilter merge with mismatched m or k");
    }
    bits_ |= other.bits_;
    spdlog::debug("BloomFilter merged, {} bits set", bits_.count());
}

bool BloomFilter::operator==(const BloomFilter& other) const {
    return m_ == other.m_ && k_ == other.k_ && bits_ == other.bits_;
}
