/**
 * @file ScoringConfig.h
 * @brief Parameters of a scoring run and of subset persistence
 */

#ifndef SCORING_CONFIG_H
#define SCORING_CONFIG_H

#include <cstddef>
#include <string>

namespace tractoscore {
namespace scoring {

/**
 * @brief How an endpoint is attached to a region of interest
 */
enum class EndpointRoiPolicy {
  Nearest,   // Closest ROI by Euclidean distance, 0 inside
  Containing // First ROI whose mask holds the endpoint voxel
};

/**
 * @brief Scoring parameters
 */
struct ScoringConfig {
  // Streamline comparison
  size_t nb_points_resample = 12; // Points per resampled streamline

  // Invalid-connection candidates
  double length_threshold = 35.0;      // Minimum length, voxel units
  double gt_cluster_threshold = 20.0;  // QuickBundles threshold, ground truth
  double ic_cluster_threshold = 20.0;  // QuickBundles threshold, candidates
  bool remove_isolated_clusters = true; // Reject single-member clusters
  size_t min_streamlines_per_ib = 2;    // Smallest accepted invalid bundle
  EndpointRoiPolicy endpoint_policy = EndpointRoiPolicy::Nearest;

  // Execution
  size_t num_threads = 1; // 0 = hardware concurrency
  bool verbose = false;

  /// Throws ConfigurationException on out-of-range values
  void Validate() const;

  /// Worker count after resolving 0 to the hardware concurrency
  size_t ResolvedThreadCount() const;
};

/**
 * @brief Which classified subsets are written after scoring, and where
 */
struct PersistenceOptions {
  bool save_full_vc = false;
  bool save_full_ic = false;
  bool save_full_nc = false;
  bool save_ibs = false;
  bool save_vbs = false;

  std::string out_dir = ".";
  std::string base_name = "submission";
  std::string out_tract_type = "tck"; // tck, trk or vtk

  bool AnyEnabled() const {
    return save_full_vc || save_full_ic || save_full_nc || save_ibs ||
           save_vbs;
  }

  /// Throws ConfigurationException on unknown output type or empty base name
  void Validate() const;
};

EndpointRoiPolicy ParseEndpointRoiPolicy(const std::string &name);
std::string EndpointRoiPolicyToString(EndpointRoiPolicy policy);

} // namespace scoring
} // namespace tractoscore

#endif // SCORING_CONFIG_H
