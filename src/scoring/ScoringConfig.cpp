/**
 * @file ScoringConfig.cpp
 * @brief Parameter validation
 */

#include "ScoringConfig.h"

#include "../common/CompatUtils.h"
#include "../common/TractoScoreExceptions.h"

#include <sstream>
#include <thread>

namespace tractoscore {
namespace scoring {

namespace {

template <typename T> std::string ToString(T value) {
  std::stringstream ss;
  ss << value;
  return ss.str();
}

} // namespace

void ScoringConfig::Validate() const {
  if (nb_points_resample < 2) {
    throw ConfigurationException("nb_points_resample",
                                 ToString(nb_points_resample), ">= 2");
  }
  if (!(length_threshold >= 0.0)) {
    throw ConfigurationException("length_threshold",
                                 ToString(length_threshold), ">= 0");
  }
  if (!(gt_cluster_threshold > 0.0)) {
    throw ConfigurationException("gt_cluster_threshold",
                                 ToString(gt_cluster_threshold), "> 0");
  }
  if (!(ic_cluster_threshold > 0.0)) {
    throw ConfigurationException("ic_cluster_threshold",
                                 ToString(ic_cluster_threshold), "> 0");
  }
  if (min_streamlines_per_ib < 2) {
    throw ConfigurationException("min_streamlines_per_ib",
                                 ToString(min_streamlines_per_ib), ">= 2");
  }
}

size_t ScoringConfig::ResolvedThreadCount() const {
  if (num_threads > 0)
    return num_threads;
  const size_t hardware = std::thread::hardware_concurrency();
  return hardware > 0 ? hardware : 1;
}

void PersistenceOptions::Validate() const {
  const std::string type = compat::to_lower(out_tract_type);
  if (type != "tck" && type != "trk" && type != "vtk") {
    throw ConfigurationException("out_tract_type", out_tract_type,
                                 "tck, trk or vtk");
  }
  if (base_name.empty()) {
    throw ConfigurationException("base_name", "", "non-empty file prefix");
  }
}

EndpointRoiPolicy ParseEndpointRoiPolicy(const std::string &name) {
  const std::string lower = compat::to_lower(name);
  if (lower == "nearest")
    return EndpointRoiPolicy::Nearest;
  if (lower == "containing")
    return EndpointRoiPolicy::Containing;
  throw ConfigurationException("endpoint_policy", name, "nearest or containing");
}

std::string EndpointRoiPolicyToString(EndpointRoiPolicy policy) {
  switch (policy) {
  case EndpointRoiPolicy::Nearest:
    return "nearest";
  case EndpointRoiPolicy::Containing:
    return "containing";
  default:
    return "unknown";
  }
}

} // namespace scoring
} // namespace tractoscore
