#include <gtest/gtest.h>

#include <string>

#include "bloom_filter.hpp"

namespace {

struct RateCase {
    size_t bloomSize;
    size_t numHashFunctions;
    size_t numItems;
};

constexpr size_t kNumProbes = 10000;

class FalsePositiveRateTest : public ::testing::TestWithParam<RateCase> {};

}  // namespace

TEST_P(FalsePositiveRateTest, ObservedRateTracksTheory) {
    const RateCase& rc = GetParam();
    BloomFilter filter(rc.bloomSize, rc.numHashFunctions);

    for (size_t i = 0; i < rc.numItems; ++i) {
        filter.addString("in-" + std::to_string(i));
    }
    for (size_t i = 0; i < rc.numItems; ++i) {
        ASSERT_TRUE(filter.testString("in-" + std::to_string(i))) << i;
    }
    EXPECT_LE(filter.bitsSet(), rc.numItems * rc.numHashFunctions);

    size_t falsePositives = 0;
    for (size_t i = 0; i < kNumProbes; ++i) {
        if (filter.testString("out-" + std::to_string(i))) {
            ++falsePositives;
        }
    }
    double observed = static_cast<double>(falsePositives) / kNumProbes;
    double theoretical = BloomFilter::falsePositiveProbability(rc.bloomSize, rc.numHashFunctions, rc.numItems);
    EXPECT_LE(observed, 2 * theoretical + 0.001);
}

INSTANTIATE_TEST_SUITE_P(Sweep, FalsePositiveRateTest,
                         ::testing::Values(RateCase{1000, 1, 50}, RateCase{1000, 3, 100}, RateCase{10000, 5, 500},
                                           RateCase{10000, 7, 1000}, RateCase{100000, 4, 5000}));

TEST(FalsePositiveRate, SaturatedFilterAcceptsEverything) {
    BloomFilter filter(1, 1);
    filter.addString("only");
    for (size_t i = 0; i < 100; ++i) {
        EXPECT_TRUE(filter.testString("out-" + std::to_string(i)));
    }
}
