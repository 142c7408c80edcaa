/**
 * @file EndpointRoiLocator.cpp
 * @brief Endpoint-to-ROI policies
 */

#include "EndpointRoiLocator.h"

#include "../common/TractoScoreExceptions.h"

#include "itkSignedMaurerDistanceMapImageFilter.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tractoscore {
namespace scoring {

std::unique_ptr<EndpointRoiLocator>
EndpointRoiLocator::Create(EndpointRoiPolicy policy,
                           const std::vector<RegionOfInterest> &rois) {
  switch (policy) {
  case EndpointRoiPolicy::Containing:
    return std::make_unique<ContainingRoiLocator>(rois);
  case EndpointRoiPolicy::Nearest:
    return std::make_unique<NearestRoiLocator>(rois);
  default:
    throw ConfigurationException("endpoint_policy",
                                 EndpointRoiPolicyToString(policy),
                                 "nearest or containing");
  }
}

// ===== ContainingRoiLocator =====

ContainingRoiLocator::ContainingRoiLocator(
    const std::vector<RegionOfInterest> &rois)
    : m_rois(rois) {}

std::optional<size_t>
ContainingRoiLocator::Locate(const io::Point3 &endpoint) const {
  const io::VoxelIndex voxel = {std::lround(endpoint[0]),
                                std::lround(endpoint[1]),
                                std::lround(endpoint[2])};

  for (size_t r = 0; r < m_rois.size(); ++r) {
    if (io::IsMaskSet(m_rois[r].mask, voxel))
      return r;
  }
  return std::nullopt;
}

// ===== NearestRoiLocator =====

NearestRoiLocator::NearestRoiLocator(const std::vector<RegionOfInterest> &rois) {
  m_distance_maps.reserve(rois.size());

  for (const auto &roi : rois) {
    if (!roi.mask || io::CountNonZero(roi.mask) == 0) {
      m_distance_maps.push_back(nullptr);
      continue;
    }

    auto distance_filter =
        itk::SignedMaurerDistanceMapImageFilter<io::MaskImageType,
                                                DistanceImageType>::New();
    distance_filter->SetInput(roi.mask);
    distance_filter->SetBackgroundValue(0);
    distance_filter->SetSquaredDistance(false);
    distance_filter->SetUseImageSpacing(false);
    distance_filter->SetInsideIsPositive(false);

    try {
      distance_filter->Update();
    } catch (const itk::ExceptionObject &e) {
      throw ScoringException("NearestRoiLocator",
                             "distance map of ROI " + roi.name + ": " +
                                 e.GetDescription());
    }

    DistanceImageType::Pointer distance = distance_filter->GetOutput();
    distance->DisconnectPipeline();
    m_distance_maps.push_back(distance);
  }
}

std::optional<size_t>
NearestRoiLocator::Locate(const io::Point3 &endpoint) const {
  std::optional<size_t> best;
  float best_distance = std::numeric_limits<float>::infinity();

  for (size_t r = 0; r < m_distance_maps.size(); ++r) {
    const auto &distance_map = m_distance_maps[r];
    if (!distance_map)
      continue;

    const auto region = distance_map->GetLargestPossibleRegion();
    DistanceImageType::IndexType voxel;
    for (unsigned int d = 0; d < 3; ++d) {
      const long lower = region.GetIndex()[d];
      const long upper = lower + static_cast<long>(region.GetSize()[d]) - 1;
      voxel[d] = std::clamp(std::lround(endpoint[d]), lower, upper);
    }

    // Inside voxels are negative
    const float distance = std::max(0.0f, distance_map->GetPixel(voxel));
    if (distance < best_distance) {
      best_distance = distance;
      best = r;
    }
  }

  return best;
}

} // namespace scoring
} // namespace tractoscore
