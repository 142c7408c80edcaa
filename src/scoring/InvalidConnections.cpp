/**
 * @file InvalidConnections.cpp
 * @brief Invalid-connection grouping
 */

#include "InvalidConnections.h"

#include "../common/ScoringLogger.h"
#include "../common/ThreadPool.h"
#include "QuickBundles.h"
#include "StreamlineGeometry.h"

#include <algorithm>
#include <map>

namespace tractoscore {
namespace scoring {

std::vector<size_t> InvalidConnectionResult::InvalidIndices() const {
  std::vector<size_t> indices;
  for (const auto &bundle : bundles) {
    indices.insert(indices.end(), bundle.indices.begin(), bundle.indices.end());
  }
  std::sort(indices.begin(), indices.end());
  return indices;
}

InvalidConnectionGrouper::InvalidConnectionGrouper(const ScoringConfig &config)
    : m_config(config) {
  m_config.Validate();
}

InvalidConnectionResult
InvalidConnectionGrouper::Group(const io::Tractogram &tractogram,
                                const std::vector<size_t> &candidates,
                                const std::vector<RegionOfInterest> &rois) const {
  const auto locator =
      EndpointRoiLocator::Create(m_config.endpoint_policy, rois);
  return Group(tractogram, candidates, *locator);
}

InvalidConnectionResult
InvalidConnectionGrouper::Group(const io::Tractogram &tractogram,
                                const std::vector<size_t> &candidates,
                                const EndpointRoiLocator &locator) const {
  ScoringLogger logger("InvalidConnections", m_config.verbose);
  InvalidConnectionResult result;

  // Step 1: isolated clusters
  std::vector<size_t> remaining;
  if (m_config.remove_isolated_clusters && !candidates.empty()) {
    std::vector<io::Streamline> subset;
    subset.reserve(candidates.size());
    for (size_t index : candidates)
      subset.push_back(tractogram.At(index));

    const auto resampled =
        ResampleStreamlines(subset, m_config.nb_points_resample,
                            m_config.ResolvedThreadCount());
    const ClusterMap clusters =
        QuickBundles(m_config.ic_cluster_threshold).Cluster(resampled);

    std::vector<bool> isolated(candidates.size(), false);
    for (size_t c : clusters.ClustersOfSize(1)) {
      isolated[clusters.GetCluster(c).indices.front()] = true;
    }

    for (size_t k = 0; k < candidates.size(); ++k) {
      if (isolated[k]) {
        result.rejected.push_back(
            {candidates[k], NoConnectionReason::IsolatedCluster});
      } else {
        remaining.push_back(candidates[k]);
      }
    }

    logger.Info(std::to_string(clusters.Size()) + " candidate clusters, " +
                std::to_string(candidates.size() - remaining.size()) +
                " isolated streamlines rejected");
  } else {
    remaining = candidates;
  }

  // Step 2: endpoint ROIs
  std::vector<std::optional<RoiPair>> pairs(remaining.size());
  ParallelFor(remaining.size(), m_config.ResolvedThreadCount(),
              [&](size_t begin, size_t end) {
                for (size_t k = begin; k < end; ++k) {
                  const io::Streamline &streamline =
                      tractogram.At(remaining[k]);
                  const auto head = locator.Locate(streamline.front());
                  const auto tail = locator.Locate(streamline.back());
                  if (head && tail)
                    pairs[k] = RoiPair(*head, *tail);
                }
              });

  // Step 3: group by unordered pair
  std::map<RoiPair, std::vector<size_t>> groups;
  for (size_t k = 0; k < remaining.size(); ++k) {
    if (!pairs[k]) {
      result.rejected.push_back(
          {remaining[k], NoConnectionReason::NoEndpointRoi});
      continue;
    }
    groups[*pairs[k]].push_back(remaining[k]);
  }

  // Step 4: small groups
  for (auto &group : groups) {
    if (group.second.size() < m_config.min_streamlines_per_ib) {
      for (size_t index : group.second) {
        result.rejected.push_back(
            {index, NoConnectionReason::SingletonRoiPair});
      }
      continue;
    }

    InvalidBundle bundle;
    bundle.pair = group.first;
    bundle.indices = std::move(group.second);
    result.ic_count += bundle.indices.size();
    result.bundles.push_back(std::move(bundle));
  }

  std::sort(result.rejected.begin(), result.rejected.end(),
            [](const RejectedStreamline &a, const RejectedStreamline &b) {
              return a.index < b.index;
            });

  logger.Info(std::to_string(result.ic_count) + " invalid connections in " +
              std::to_string(result.bundles.size()) + " invalid bundles, " +
              std::to_string(result.rejected.size()) + " rejected (" +
              locator.GetDescription() + " endpoint policy)");
  return result;
}

} // namespace scoring
} // namespace tractoscore
