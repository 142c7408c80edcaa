#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "../src/scoring/StreamlineGeometry.h"
#include "ScoringTestData.h"

using namespace tractoscore;
using namespace tractoscore::scoring;

class StreamlineGeometryTest : public ::testing::Test {
protected:
    void SetUp() override {
        bent = {{0.0f, 0.0f, 0.0f}, {3.0f, 0.0f, 0.0f}, {3.0f, 4.0f, 0.0f}};
        straight = testing_data::MakeLine({0.0f, 0.0f, 0.0f}, {10.0f, 0.0f, 0.0f});
    }

    io::Streamline bent;
    io::Streamline straight;
};

TEST_F(StreamlineGeometryTest, LengthSumsSegments) {
    EXPECT_DOUBLE_EQ(StreamlineLength(bent), 7.0);
    EXPECT_NEAR(StreamlineLength(straight), 10.0, 1e-5);
    EXPECT_DOUBLE_EQ(StreamlineLength(io::Streamline{{1.0f, 2.0f, 3.0f}}), 0.0);
}

TEST_F(StreamlineGeometryTest, ResamplePreservesEndpointsAndLength) {
    auto resampled = ResampleStreamline(bent, 15);

    ASSERT_EQ(resampled.size(), 15u);
    EXPECT_EQ(resampled.front(), bent.front());
    EXPECT_EQ(resampled.back(), bent.back());

    // Every point stays on the polyline, so the length can only shrink at the corner
    EXPECT_LE(StreamlineLength(resampled), 7.0 + 1e-5);
    EXPECT_GT(StreamlineLength(resampled), 6.5);
}

TEST_F(StreamlineGeometryTest, ResampleIsEquallySpacedOnStraightLines) {
    auto resampled = ResampleStreamline(straight, 6);

    ASSERT_EQ(resampled.size(), 6u);
    for (size_t i = 1; i < resampled.size(); ++i) {
        EXPECT_NEAR(PointDistance(resampled[i - 1], resampled[i]), 2.0, 1e-4);
    }
}

TEST_F(StreamlineGeometryTest, DegenerateStreamlinesRepeatFirstPoint) {
    io::Streamline single = {{4.0f, 5.0f, 6.0f}};
    auto resampled = ResampleStreamline(single, 12);

    ASSERT_EQ(resampled.size(), 12u);
    for (const auto &point : resampled) {
        EXPECT_EQ(point, single.front());
    }

    io::Streamline collapsed = {{1.0f, 1.0f, 1.0f}, {1.0f, 1.0f, 1.0f}};
    auto resampled_collapsed = ResampleStreamline(collapsed, 3);
    EXPECT_EQ(resampled_collapsed[1], collapsed.front());
}

TEST_F(StreamlineGeometryTest, ResampleRejectsInvalidInput) {
    EXPECT_THROW(ResampleStreamline(io::Streamline{}, 12), std::invalid_argument);
    EXPECT_THROW(ResampleStreamline(straight, 1), std::invalid_argument);
}

TEST_F(StreamlineGeometryTest, ParallelResampleMatchesSerial) {
    std::vector<io::Streamline> streamlines;
    for (size_t k = 0; k < 37; ++k) {
        streamlines.push_back(testing_data::InvalidBundleStreamline(k % 15));
    }

    auto serial = ResampleStreamlines(streamlines, 12, 1);
    auto parallel = ResampleStreamlines(streamlines, 12, 4);

    ASSERT_EQ(serial.size(), parallel.size());
    for (size_t i = 0; i < serial.size(); ++i) {
        EXPECT_EQ(serial[i], parallel[i]);
    }
}

TEST_F(StreamlineGeometryTest, MdfIsSymmetricAndFlipInvariant) {
    auto a = ResampleStreamline(straight, 12);
    auto b = ResampleStreamline(
        testing_data::MakeLine({0.0f, 3.0f, 0.0f}, {10.0f, 3.0f, 0.0f}), 12);
    io::Streamline b_reversed(b.rbegin(), b.rend());

    EXPECT_NEAR(AveragePointwiseDistance(a, b), 3.0, 1e-5);
    EXPECT_NEAR(MinimumAverageDirectFlip(a, b), MinimumAverageDirectFlip(b, a), 1e-9);
    EXPECT_NEAR(MinimumAverageDirectFlip(a, b), MinimumAverageDirectFlip(a, b_reversed), 1e-9);

    // Reversed copy: direct distance is large, flipped distance is 3
    EXPECT_GT(AveragePointwiseDistance(a, b_reversed), 3.0);
    EXPECT_NEAR(FlippedAveragePointwiseDistance(a, b_reversed), 3.0, 1e-5);
}

TEST_F(StreamlineGeometryTest, MdfOfIdenticalStreamlinesIsZero) {
    auto a = ResampleStreamline(bent, 12);
    EXPECT_DOUBLE_EQ(MinimumAverageDirectFlip(a, a), 0.0);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
