/**
 * @file ScoringTestData.h
 * @brief Synthetic grids, masks and streamlines shared by the scoring tests
 */

#ifndef SCORING_TEST_DATA_H
#define SCORING_TEST_DATA_H

#include "../src/io/StreamlineIO.h"
#include "../src/io/VolumeIO.h"
#include "../src/scoring/GroundTruthLoader.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace tractoscore {
namespace testing_data {

/// Straight streamline from `from` to `to` with roughly unit steps
inline io::Streamline MakeLine(const io::Point3 &from, const io::Point3 &to) {
    const double dx = to[0] - from[0];
    const double dy = to[1] - from[1];
    const double dz = to[2] - from[2];
    const double length = std::sqrt(dx * dx + dy * dy + dz * dz);
    const size_t steps = std::max<size_t>(1, static_cast<size_t>(std::ceil(length)));

    io::Streamline line;
    for (size_t i = 0; i <= steps; ++i) {
        const double t = static_cast<double>(i) / steps;
        line.push_back({static_cast<float>(from[0] + t * dx),
                        static_cast<float>(from[1] + t * dy),
                        static_cast<float>(from[2] + t * dz)});
    }
    return line;
}

inline io::ReferenceSpace MakeGrid(size_t dim = 60) {
    return io::ReferenceSpace::FromGeometry({dim, dim, dim});
}

/// Box [lo, hi] (inclusive voxel indices) set to 1 on the grid
inline io::MaskPointer MakeBoxMask(const io::ReferenceSpace &grid,
                                   const io::VoxelIndex &lo,
                                   const io::VoxelIndex &hi) {
    io::MaskPointer mask = grid.CreateEmptyMask();
    for (long x = lo[0]; x <= hi[0]; ++x)
        for (long y = lo[1]; y <= hi[1]; ++y)
            for (long z = lo[2]; z <= hi[2]; ++z)
                io::SetMaskValue(mask, {x, y, z});
    return mask;
}

/// 3x3x3 cube centered on a voxel
inline scoring::RegionOfInterest MakeCubeRoi(const io::ReferenceSpace &grid,
                                             const std::string &name,
                                             const io::VoxelIndex &center) {
    scoring::RegionOfInterest roi;
    roi.name = name;
    roi.mask = MakeBoxMask(grid, {center[0] - 1, center[1] - 1, center[2] - 1},
                           {center[0] + 1, center[1] + 1, center[2] + 1});
    roi.mask_voxels = io::CountNonZero(roi.mask);
    return roi;
}

// Reference bundle CST_L: four lines along z at x, y in {10, 11}
inline std::vector<io::Streamline> CstReferenceStreamlines() {
    std::vector<io::Streamline> streamlines;
    for (float x : {10.0f, 11.0f})
        for (float y : {10.0f, 11.0f})
            streamlines.push_back(MakeLine({x, y, 5.0f}, {x, y, 50.0f}));
    return streamlines;
}

inline io::MaskPointer CstMask(const io::ReferenceSpace &grid) {
    return MakeBoxMask(grid, {9, 9, 5}, {12, 12, 50});
}

// ROI centers, in file order roi_0 .. roi_5
inline std::vector<io::VoxelIndex> RoiCenters() {
    return {{5, 30, 30}, {50, 30, 30}, {5, 50, 10},
            {50, 50, 10}, {30, 5, 50}, {30, 50, 50}};
}

inline std::vector<scoring::RegionOfInterest>
MakeRois(const io::ReferenceSpace &grid) {
    std::vector<scoring::RegionOfInterest> rois;
    const auto centers = RoiCenters();
    for (size_t i = 0; i < centers.size(); ++i)
        rois.push_back(MakeCubeRoi(grid, "roi_" + std::to_string(i), centers[i]));
    return rois;
}

inline scoring::GroundTruth
MakeGroundTruth(const scoring::ScoringConfig &config = scoring::ScoringConfig{},
                double acceptance_threshold = 3.0) {
    scoring::GroundTruth gt;
    gt.reference = MakeGrid();
    scoring::GroundTruthLoader loader(config);
    gt.bundles.push_back(loader.BuildBundle("CST_L", acceptance_threshold,
                                            CstReferenceStreamlines(),
                                            CstMask(gt.reference)));
    gt.rois = MakeRois(gt.reference);
    return gt;
}

/// Close to CST_L, all points round to voxel (10, 10, z)
inline io::Streamline ValidCstStreamline(size_t k) {
    const float dx = 0.2f * static_cast<float>(k % 3);
    const float dy = 0.2f * static_cast<float>((k / 3) % 3);
    return MakeLine({10.0f + dx, 10.0f + dy, 5.0f}, {10.0f + dx, 10.0f + dy, 50.0f});
}

/// Length 10, far from every bundle
inline io::Streamline ShortStreamline(size_t k) {
    const float dz = 0.3f * static_cast<float>(k % 5);
    return MakeLine({5.0f, 40.0f, 40.0f + dz}, {15.0f, 40.0f, 40.0f + dz});
}

/// Connects roi_0 and roi_1
inline io::Streamline InvalidBundleStreamline(size_t k) {
    const float dy = 0.4f * (static_cast<float>(k % 5) - 2.0f);
    const float dz = 0.5f * (static_cast<float>(k / 5) - 1.0f);
    return MakeLine({5.0f, 30.0f + dy, 30.0f + dz}, {50.0f, 30.0f + dy, 30.0f + dz});
}

/// Five long streamlines, each with its own ROI pair
inline std::vector<io::Streamline> LoneRoiPairStreamlines() {
    return {MakeLine({5, 50, 10}, {50, 50, 10}),  // 2_3
            MakeLine({30, 5, 50}, {30, 50, 50}),  // 4_5
            MakeLine({5, 30, 30}, {50, 50, 10}),  // 0_3
            MakeLine({50, 30, 30}, {5, 50, 10}),  // 1_2
            MakeLine({5, 50, 10}, {30, 50, 50})}; // 2_5
}

/**
 * @brief 100 streamlines: 60 on CST_L, 20 short, 15 between roi_0 and
 * roi_1 and 5 with unique ROI pairs, interleaved
 */
inline io::Tractogram MakeScenarioSubmission() {
    std::vector<io::Streamline> valid, shorts, invalid;
    for (size_t k = 0; k < 60; ++k)
        valid.push_back(ValidCstStreamline(k));
    for (size_t k = 0; k < 20; ++k)
        shorts.push_back(ShortStreamline(k));
    for (size_t k = 0; k < 15; ++k)
        invalid.push_back(InvalidBundleStreamline(k));
    const auto lone = LoneRoiPairStreamlines();

    io::Tractogram tractogram;
    size_t v = 0, s = 0, i = 0, l = 0;
    for (size_t n = 0; n < 100; ++n) {
        switch (n % 5) {
        case 0:
        case 1:
        case 2:
            tractogram.AddStreamline(valid[v++]);
            break;
        case 3:
            tractogram.AddStreamline(shorts[s++]);
            break;
        default:
            if (i < invalid.size())
                tractogram.AddStreamline(invalid[i++]);
            else
                tractogram.AddStreamline(lone[l++]);
            break;
        }
    }
    return tractogram;
}

} // namespace testing_data
} // namespace tractoscore

#endif // SCORING_TEST_DATA_H
