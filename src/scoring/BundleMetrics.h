/**
 * @file BundleMetrics.h
 * @brief Voxel-level agreement between a bundle's streamlines and its mask
 */

#ifndef BUNDLE_METRICS_H
#define BUNDLE_METRICS_H

#include "../io/StreamlineIO.h"

#include <vector>

namespace tractoscore {
namespace scoring {

/**
 * @brief Overlap measures of an occupancy mask against a ground-truth mask
 *
 * overlap = |occ & gt| / |gt|, overreach = |occ \ gt| / |gt|,
 * overreach_norm = |occ \ gt| / |occ|. An empty ground-truth mask gives 0.
 */
struct BundleOverlapMetrics {
  double overlap{0.0};
  double overreach{0.0};
  double overreach_norm{0.0};
  double f1_score{0.0};

  size_t gt_voxels{0};
  size_t occupied_voxels{0};
  size_t overlap_voxels{0};
};

/**
 * @brief Mark every voxel visited by the selected streamlines
 *
 * Points are rounded to the nearest voxel; points outside the grid of
 * `grid` are dropped. The result shares the geometry of `grid`.
 */
io::MaskPointer RasterizeStreamlines(const io::Tractogram &tractogram,
                                     const std::vector<size_t> &indices,
                                     const io::MaskImageType *grid);

BundleOverlapMetrics ComputeBundleOverlap(const io::MaskImageType *occupancy,
                                          const io::MaskImageType *gt_mask);

/// Harmonic mean of recall = overlap and precision = 1 - overreach_norm
double ComputeF1Score(double overlap, double overreach_norm);

} // namespace scoring
} // namespace tractoscore

#endif // BUNDLE_METRICS_H
