/**
 * @file EndpointRoiLocator.h
 * @brief Attaching streamline endpoints to regions of interest
 */

#ifndef ENDPOINT_ROI_LOCATOR_H
#define ENDPOINT_ROI_LOCATOR_H

#include "GroundTruthLoader.h"
#include "ScoringConfig.h"

#include "itkImage.h"

#include <memory>
#include <optional>
#include <vector>

namespace tractoscore {
namespace scoring {

/**
 * @brief Abstract endpoint-to-ROI policy
 *
 * Locate() receives an endpoint in continuous voxel coordinates and returns
 * the index of its ROI in the sorted ROI list, or nothing.
 */
class EndpointRoiLocator {
public:
  virtual ~EndpointRoiLocator() = default;

  virtual std::optional<size_t> Locate(const io::Point3 &endpoint) const = 0;
  virtual std::string GetDescription() const = 0;

  static std::unique_ptr<EndpointRoiLocator>
  Create(EndpointRoiPolicy policy, const std::vector<RegionOfInterest> &rois);
};

/**
 * @brief First ROI, in sorted order, whose mask holds the endpoint voxel
 */
class ContainingRoiLocator : public EndpointRoiLocator {
private:
  const std::vector<RegionOfInterest> &m_rois;

public:
  explicit ContainingRoiLocator(const std::vector<RegionOfInterest> &rois);

  std::optional<size_t> Locate(const io::Point3 &endpoint) const override;
  std::string GetDescription() const override { return "containing"; }
};

/**
 * @brief ROI at the smallest Euclidean distance (voxel units) from the
 * endpoint voxel, 0 inside; ties go to the lower index
 *
 * Distances come from one Maurer distance map per ROI, computed once.
 * Endpoints outside the grid are clamped to the nearest border voxel.
 * Empty ROIs never match.
 */
class NearestRoiLocator : public EndpointRoiLocator {
public:
  using DistanceImageType = itk::Image<float, 3>;

private:
  std::vector<DistanceImageType::Pointer> m_distance_maps;

public:
  explicit NearestRoiLocator(const std::vector<RegionOfInterest> &rois);

  std::optional<size_t> Locate(const io::Point3 &endpoint) const override;
  std::string GetDescription() const override { return "nearest"; }
};

} // namespace scoring
} // namespace tractoscore

#endif // ENDPOINT_ROI_LOCATOR_H
