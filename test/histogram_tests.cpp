#include "errors.hpp"
#include "histogram.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(HistogramTests, AccumulatesCountsAndProbabilities) {
    Histogram histogram;
    histogram.add("01", 3);
    histogram.add("10");
    histogram.add("01");

    EXPECT_EQ(histogram.total(), 5u);
    EXPECT_EQ(histogram.count("01"), 4u);
    EXPECT_EQ(histogram.count("11"), 0u);

    const auto probs = histogram.probabilities();
    EXPECT_NEAR(probs.at("01"), 0.8, 1e-12);
    EXPECT_NEAR(probs.at("10"), 0.2, 1e-12);
}

TEST(HistogramTests, MostLikelyBreaksTiesTowardSmallestBitstring) {
    Histogram histogram;
    histogram.add("11", 4);
    histogram.add("01", 4);
    histogram.add("10", 2);
    EXPECT_EQ(histogram.most_likely(), "01");

    histogram.add("11");
    EXPECT_EQ(histogram.most_likely(), "11");
}

TEST(HistogramTests, MergeAddsCounts) {
    Histogram a;
    a.add("0", 2);
    Histogram b;
    b.add("0");
    b.add("1", 5);
    a.merge(b);

    EXPECT_EQ(a.total(), 8u);
    EXPECT_EQ(a.count("0"), 3u);
    EXPECT_EQ(a.count("1"), 5u);
}

TEST(HistogramTests, RejectsMalformedBitstrings) {
    Histogram histogram;
    EXPECT_THROW(histogram.add(""), quantum_lab::InvalidArgumentError);
    EXPECT_THROW(histogram.add("012"), quantum_lab::InvalidArgumentError);
    histogram.add("01");
    EXPECT_THROW(histogram.add("011"), quantum_lab::InvalidArgumentError);
    EXPECT_THROW(Histogram().most_likely(), quantum_lab::InvalidArgumentError);
}

TEST(BitstringTests, MostSignificantBitComesFirst) {
    EXPECT_EQ(to_bitstring(5, 4), "0101");
    EXPECT_EQ(to_bitstring(0, 3), "000");
    EXPECT_EQ(bitstring_value("0101"), 5u);
    EXPECT_EQ(bitstring_value("1"), 1u);
}

TEST(BitstringTests, RecordBitsAreReversedIntoBitstring) {
    MeasurementRecord record;
    record.targets = {0, 1, 2};
    record.bits = {1, 0, 0};
    EXPECT_EQ(bitstring_from_record(record), "001");

    record.bits = {0, 1, 1};
    EXPECT_EQ(bitstring_from_record(record), "110");
}
