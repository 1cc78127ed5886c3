#pragma once

#include <boost/dynamic_bitset.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Thrown for filter parameters that cannot produce a usable filter.
class InvalidParameter : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Bloom filter over m bits using k salted rounds of a single 64-bit hash.
 *
 * Round i hashes the item bytes followed by i as a 4-byte little-endian value.
 * Not synchronized; concurrent writers must lock externally.
 */
class BloomFilter {
   private:
    size_t m_;
    size_t k_;
    boost::dynamic_bitset<uint64_t> bits_;

    std::vector<uint8_t> saltedBuffer(const void* data, size_t size) const;
    size_t location(std::vector<uint8_t>& buffer, uint32_t round) const;

   public:
    BloomFilter(size_t m, size_t k);

    // (m, k) for n expected items at false positive probability p
    static std::pair<size_t, size_t> estimateParameters(size_t n, double p);
    static BloomFilter withEstimates(size_t n, double p);
    static double falsePositiveProbability(size_t m, size_t k, size_t n);

    void add(const void* data, size_t size);
    void add(const std::vector<uint8_t>& data);
    void addString(const std::string& data);

    // False means definitely absent, true means possibly present.
    bool test(const void* data, size_t size) const;
    bool test(const std::vector<uint8_t>& data) const;
    bool testString(const std::string& data) const;

    // Result of test() as it was before the call; the item is added either way.
    bool testAndAdd(const void* data, size_t size);
    bool testAndAdd(const std::vector<uint8_t>& data);
    bool testAndAddString(const std::string& data);

    // The k bit positions an item maps to, in round order.
    std::vector<uint64_t> locations(const void* data, size_t size) const;

    /**
     * @brief Checks that the bit at (loc % m) is set for every given location.
     *
     * Locations from another hashing scheme bypass the salted rounds used by add(),
     * so mixing them with items inserted through add() gives no false positive bound.
     */
    bool testLocations(const std::vector<uint64_t>& locs) const;

    size_t cap() const { return m_; }
    size_t hashFunctionNum() const { return k_; }
    size_t bitsSet() const { return bits_.count(); }

    void clearAll();

    // Bitwise OR of other into this filter; both must share m and k.
    void merge(const BloomFilter& other);

    bool operator==(const BloomFilter& other) const;
    bool operator!=(const BloomFilter& other) const { return !(*this == other); }
};
