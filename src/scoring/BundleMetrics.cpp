/**
 * @file BundleMetrics.cpp
 * @brief Rasterization and overlap measures
 */

#include "BundleMetrics.h"

#include "../common/TractoScoreExceptions.h"

#include "itkImageRegionConstIterator.h"

#include <cmath>

namespace tractoscore {
namespace scoring {

io::MaskPointer RasterizeStreamlines(const io::Tractogram &tractogram,
                                     const std::vector<size_t> &indices,
                                     const io::MaskImageType *grid) {
  if (!grid) {
    throw ScoringException("Rasterize", "no reference grid for occupancy");
  }

  auto occupancy = io::MaskImageType::New();
  occupancy->CopyInformation(grid);
  occupancy->SetRegions(grid->GetLargestPossibleRegion());
  occupancy->Allocate();
  occupancy->FillBuffer(0);

  const auto region = occupancy->GetLargestPossibleRegion();
  io::MaskImageType::IndexType voxel;

  for (size_t index : indices) {
    for (const auto &point : tractogram.At(index)) {
      for (unsigned int d = 0; d < 3; ++d)
        voxel[d] = std::lround(point[d]);
      if (region.IsInside(voxel))
        occupancy->SetPixel(voxel, 1);
    }
  }

  return occupancy;
}

BundleOverlapMetrics ComputeBundleOverlap(const io::MaskImageType *occupancy,
                                          const io::MaskImageType *gt_mask) {
  if (!occupancy || !gt_mask) {
    throw ScoringException("ComputeBundleOverlap", "null mask");
  }
  if (occupancy->GetLargestPossibleRegion() !=
      gt_mask->GetLargestPossibleRegion()) {
    throw ScoringException("ComputeBundleOverlap",
                           "occupancy and bundle mask grids differ");
  }

  BundleOverlapMetrics metrics;

  itk::ImageRegionConstIterator<io::MaskImageType> occ_it(
      occupancy, occupancy->GetLargestPossibleRegion());
  itk::ImageRegionConstIterator<io::MaskImageType> gt_it(
      gt_mask, gt_mask->GetLargestPossibleRegion());

  for (occ_it.GoToBegin(), gt_it.GoToBegin(); !occ_it.IsAtEnd();
       ++occ_it, ++gt_it) {
    const bool occupied = occ_it.Get() != 0;
    const bool in_gt = gt_it.Get() != 0;
    if (occupied)
      ++metrics.occupied_voxels;
    if (in_gt)
      ++metrics.gt_voxels;
    if (occupied && in_gt)
      ++metrics.overlap_voxels;
  }

  const size_t overreach_voxels =
      metrics.occupied_voxels - metrics.overlap_voxels;

  if (metrics.gt_voxels == 0) {
    return metrics;
  }

  const double gt = static_cast<double>(metrics.gt_voxels);
  metrics.overlap = metrics.overlap_voxels / gt;
  metrics.overreach = overreach_voxels / gt;
  if (metrics.occupied_voxels > 0) {
    metrics.overreach_norm =
        overreach_voxels / static_cast<double>(metrics.occupied_voxels);
  }
  metrics.f1_score = ComputeF1Score(metrics.overlap, metrics.overreach_norm);

  return metrics;
}

double ComputeF1Score(double overlap, double overreach_norm) {
  const double recall = overlap;
  const double precision = 1.0 - overreach_norm;
  if (precision + recall <= 0.0)
    return 0.0;
  return 2.0 * precision * recall / (precision + recall);
}

} // namespace scoring
} // namespace tractoscore
