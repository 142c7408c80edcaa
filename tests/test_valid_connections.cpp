#include <gtest/gtest.h>
#include <cmath>
#include "../src/scoring/BundleMetrics.h"
#include "../src/scoring/ValidConnections.h"
#include "ScoringTestData.h"

using namespace tractoscore;
using namespace tractoscore::scoring;
using testing_data::MakeLine;

class ValidConnectionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        ground_truth = testing_data::MakeGroundTruth(config);
    }

    ScoringConfig config;
    GroundTruth ground_truth;
};

TEST_F(ValidConnectionsTest, OverlapMeasuresOnBoxes) {
    auto grid = testing_data::MakeGrid(20);
    auto gt = testing_data::MakeBoxMask(grid, {0, 0, 0}, {3, 3, 3});        // 64 voxels
    auto occupancy = testing_data::MakeBoxMask(grid, {2, 0, 0}, {5, 3, 3}); // 64 voxels, 32 shared

    BundleOverlapMetrics metrics = ComputeBundleOverlap(occupancy, gt);

    EXPECT_EQ(metrics.gt_voxels, 64u);
    EXPECT_EQ(metrics.occupied_voxels, 64u);
    EXPECT_EQ(metrics.overlap_voxels, 32u);
    EXPECT_DOUBLE_EQ(metrics.overlap, 0.5);
    EXPECT_DOUBLE_EQ(metrics.overreach, 0.5);
    EXPECT_DOUBLE_EQ(metrics.overreach_norm, 0.5);
    EXPECT_DOUBLE_EQ(metrics.f1_score, 0.5);
}

TEST_F(ValidConnectionsTest, F1PrecisionIsNormalizedByOccupancy) {
    auto grid = testing_data::MakeGrid(20);
    auto gt = testing_data::MakeBoxMask(grid, {0, 0, 0}, {3, 3, 3});        // 64 voxels
    auto occupancy = testing_data::MakeBoxMask(grid, {2, 0, 0}, {9, 3, 3}); // 128 voxels, 32 shared

    BundleOverlapMetrics metrics = ComputeBundleOverlap(occupancy, gt);

    EXPECT_DOUBLE_EQ(metrics.overlap, 0.5);
    EXPECT_DOUBLE_EQ(metrics.overreach, 1.5);
    EXPECT_DOUBLE_EQ(metrics.overreach_norm, 0.75);
    // P = 32 / 128, R = 32 / 64
    EXPECT_NEAR(metrics.f1_score, 1.0 / 3.0, 1e-12);
}

TEST_F(ValidConnectionsTest, EmptyGroundTruthMaskGivesZeroMetrics) {
    auto grid = testing_data::MakeGrid(10);
    auto gt = grid.CreateEmptyMask();
    auto occupancy = testing_data::MakeBoxMask(grid, {0, 0, 0}, {1, 1, 1});

    BundleOverlapMetrics metrics = ComputeBundleOverlap(occupancy, gt);
    EXPECT_EQ(metrics.gt_voxels, 0u);
    EXPECT_DOUBLE_EQ(metrics.overlap, 0.0);
    EXPECT_DOUBLE_EQ(metrics.overreach, 0.0);
    EXPECT_DOUBLE_EQ(metrics.overreach_norm, 0.0);
    EXPECT_DOUBLE_EQ(metrics.f1_score, 0.0);
}

TEST_F(ValidConnectionsTest, F1Score) {
    EXPECT_DOUBLE_EQ(ComputeF1Score(1.0, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(ComputeF1Score(0.0, 1.0), 0.0);
    EXPECT_NEAR(ComputeF1Score(0.5, 0.0), 2.0 / 3.0, 1e-12);
}

TEST_F(ValidConnectionsTest, RasterizeRoundsAndDropsOutsidePoints) {
    auto grid = testing_data::MakeGrid(10);
    io::Tractogram tractogram;
    tractogram.AddStreamline({{0.4f, 0.4f, 0.4f}, {1.6f, 0.0f, 0.0f}, {12.0f, 0.0f, 0.0f}, {-3.0f, 0.0f, 0.0f}});
    tractogram.AddStreamline({{5.0f, 5.0f, 5.0f}});

    auto occupancy = RasterizeStreamlines(tractogram, {0}, grid.GetImage());
    EXPECT_EQ(io::CountNonZero(occupancy), 2u);
    EXPECT_TRUE(io::IsMaskSet(occupancy, {0, 0, 0}));
    EXPECT_TRUE(io::IsMaskSet(occupancy, {2, 0, 0}));
    EXPECT_FALSE(io::IsMaskSet(occupancy, {5, 5, 5}));
}

TEST_F(ValidConnectionsTest, MatchesStreamlinesNearTheBundle) {
    io::Tractogram tractogram;
    tractogram.AddStreamline(testing_data::ValidCstStreamline(4));
    tractogram.AddStreamline(MakeLine({30.0f, 30.0f, 5.0f}, {30.0f, 30.0f, 50.0f}));
    tractogram.AddStreamline(testing_data::ValidCstStreamline(0));

    ValidConnectionExtractor extractor(config);
    ValidConnectionResult result = extractor.Extract(tractogram, ground_truth.bundles);

    EXPECT_EQ(result.vc_indices, (std::vector<size_t>{0, 2}));
    ASSERT_EQ(result.bundles.size(), 1u);
    EXPECT_EQ(result.bundles[0].name, "CST_L");
    EXPECT_EQ(result.bundles[0].nb_streamlines, 2u);
    EXPECT_EQ(result.NbFoundBundles(), 1u);
    EXPECT_FALSE(result.assignment[1].has_value());

    // All points fall on voxel (10, 10, z) inside the 4x4x46 mask
    const auto &metrics = result.bundles[0].metrics;
    EXPECT_EQ(metrics.gt_voxels, 736u);
    EXPECT_EQ(metrics.occupied_voxels, 46u);
    EXPECT_DOUBLE_EQ(metrics.overlap, 46.0 / 736.0);
    EXPECT_DOUBLE_EQ(metrics.overreach, 0.0);
    EXPECT_DOUBLE_EQ(metrics.overreach_norm, 0.0);
    EXPECT_NEAR(metrics.f1_score, 2.0 * 0.0625 / 1.0625, 1e-12);
}

TEST_F(ValidConnectionsTest, ReversedStreamlinesStillMatch) {
    io::Streamline forward = testing_data::ValidCstStreamline(1);
    io::Tractogram tractogram;
    tractogram.AddStreamline(io::Streamline(forward.rbegin(), forward.rend()));

    ValidConnectionResult result =
        ValidConnectionExtractor(config).Extract(tractogram, ground_truth.bundles);
    EXPECT_EQ(result.vc_indices.size(), 1u);
}

TEST_F(ValidConnectionsTest, AcceptanceThresholdIsInclusive) {
    // Centered query 1.0 away from the nearest reference line
    io::Streamline resampled = ResampleStreamline(
        MakeLine({9.0f, 10.0f, 5.0f}, {9.0f, 10.0f, 50.0f}), config.nb_points_resample);

    GroundTruth exact = testing_data::MakeGroundTruth(config, 1.0);
    GroundTruth tight = testing_data::MakeGroundTruth(config, 0.99);

    ValidConnectionExtractor extractor(config);
    auto match = extractor.MatchStreamline(resampled, exact.bundles);
    ASSERT_TRUE(match.has_value());
    EXPECT_NEAR(match->distance, 1.0, 1e-5);
    EXPECT_FALSE(extractor.MatchStreamline(resampled, tight.bundles).has_value());
}

TEST_F(ValidConnectionsTest, SmallestDistanceWinsAndTiesGoToLowestIndex) {
    GroundTruthLoader loader(config);
    std::vector<ReferenceBundle> bundles;
    auto line = [](float x) {
        return std::vector<io::Streamline>{MakeLine({x, 20.0f, 5.0f}, {x, 20.0f, 50.0f})};
    };
    auto grid = testing_data::MakeGrid();
    bundles.push_back(loader.BuildBundle("A", 5.0, line(20.0f), grid.CreateEmptyMask()));
    bundles.push_back(loader.BuildBundle("B", 5.0, line(22.0f), grid.CreateEmptyMask()));
    bundles.push_back(loader.BuildBundle("C", 5.0, line(18.0f), grid.CreateEmptyMask()));

    ValidConnectionExtractor extractor(config);

    auto closer_to_b = ResampleStreamline(line(21.5f).front(), config.nb_points_resample);
    EXPECT_EQ(extractor.MatchStreamline(closer_to_b, bundles)->bundle_index, 1u);

    // Equidistant from A and B
    auto between = ResampleStreamline(line(21.0f).front(), config.nb_points_resample);
    EXPECT_EQ(extractor.MatchStreamline(between, bundles)->bundle_index, 0u);

    // Equidistant from A and C
    auto other_side = ResampleStreamline(line(19.0f).front(), config.nb_points_resample);
    EXPECT_EQ(extractor.MatchStreamline(other_side, bundles)->bundle_index, 0u);
}

TEST_F(ValidConnectionsTest, BundlesWithoutStreamlinesHaveNoMetrics) {
    io::Tractogram tractogram;
    tractogram.AddStreamline(MakeLine({40.0f, 40.0f, 5.0f}, {40.0f, 40.0f, 50.0f}));

    ValidConnectionResult result =
        ValidConnectionExtractor(config).Extract(tractogram, ground_truth.bundles);
    EXPECT_TRUE(result.vc_indices.empty());
    EXPECT_FALSE(result.bundles[0].IsFound());
    EXPECT_EQ(result.bundles[0].metrics.gt_voxels, 0u);
    EXPECT_EQ(result.NbFoundBundles(), 0u);
}

TEST_F(ValidConnectionsTest, ParallelExtractionMatchesSerial) {
    io::Tractogram tractogram = testing_data::MakeScenarioSubmission();

    ScoringConfig parallel_config = config;
    parallel_config.num_threads = 4;

    auto serial = ValidConnectionExtractor(config).Extract(tractogram, ground_truth.bundles);
    auto parallel = ValidConnectionExtractor(parallel_config).Extract(tractogram, ground_truth.bundles);

    EXPECT_EQ(serial.vc_indices, parallel.vc_indices);
    EXPECT_EQ(serial.vc_indices.size(), 60u);
    EXPECT_EQ(serial.bundles[0].streamline_indices, parallel.bundles[0].streamline_indices);
    EXPECT_DOUBLE_EQ(serial.bundles[0].metrics.f1_score, parallel.bundles[0].metrics.f1_score);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
