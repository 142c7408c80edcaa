/**
 * @file QuickBundles.cpp
 * @brief QuickBundles clustering and ClusterMap queries
 */

#include "QuickBundles.h"
#include "StreamlineGeometry.h"

#include <array>
#include <sstream>
#include <stdexcept>

namespace tractoscore {
namespace scoring {

// ===== ClusterMap Implementation =====

std::vector<size_t> ClusterMap::ClustersOfSize(size_t size) const {
  std::vector<size_t> matching;
  for (size_t i = 0; i < m_clusters.size(); ++i) {
    if (m_clusters[i].Size() == size)
      matching.push_back(i);
  }
  return matching;
}

void ClusterMap::AddCluster(Cluster cluster) {
  cluster.id = m_clusters.size();
  m_clusters.push_back(std::move(cluster));
}

void ClusterMap::SetReferenceData(std::vector<io::Streamline> refdata) {
  for (const auto &cluster : m_clusters) {
    for (size_t index : cluster.indices) {
      if (index >= refdata.size()) {
        throw std::invalid_argument(
            "reference data does not cover every cluster member");
      }
    }
  }
  m_refdata = std::move(refdata);
}

ClusterMatch ClusterMap::NearestCluster(const io::Streamline &query) const {
  ClusterMatch best;
  for (size_t i = 0; i < m_clusters.size(); ++i) {
    const double distance =
        MinimumAverageDirectFlip(query, m_clusters[i].centroid);
    if (distance < best.distance) {
      best.cluster = i;
      best.distance = distance;
    }
  }
  return best;
}

ClusterMatch ClusterMap::QueryDistance(const io::Streamline &query) const {
  ClusterMatch nearest = NearestCluster(query);
  if (!nearest.IsValid() || m_refdata.empty())
    return nearest;

  ClusterMatch closest_member;
  closest_member.cluster = nearest.cluster;
  for (size_t index : m_clusters[nearest.cluster].indices) {
    const double distance = MinimumAverageDirectFlip(query, m_refdata[index]);
    if (distance < closest_member.distance)
      closest_member.distance = distance;
  }
  return closest_member;
}

// ===== QuickBundles Implementation =====

QuickBundles::QuickBundles(double threshold) : m_threshold(threshold) {
  if (!(threshold > 0.0)) {
    throw std::invalid_argument("QuickBundles threshold must be positive");
  }
}

ClusterMap
QuickBundles::Cluster(const std::vector<io::Streamline> &resampled) const {
  ClusterMap cluster_map;
  if (resampled.empty())
    return cluster_map;

  const size_t nb_points = resampled.front().size();
  for (const auto &streamline : resampled) {
    if (streamline.size() != nb_points || nb_points == 0) {
      throw std::invalid_argument(
          "QuickBundles needs streamlines with a common point count");
    }
  }

  std::vector<scoring::Cluster> clusters;
  // Running sums in double to keep centroids order-stable
  std::vector<std::vector<std::array<double, 3>>> sums;

  for (size_t s = 0; s < resampled.size(); ++s) {
    const auto &streamline = resampled[s];

    size_t best = clusters.size();
    double best_distance = m_threshold;
    for (size_t c = 0; c < clusters.size(); ++c) {
      const double distance =
          MinimumAverageDirectFlip(streamline, clusters[c].centroid);
      if (distance < best_distance) {
        best_distance = distance;
        best = c;
      }
    }

    if (best == clusters.size()) {
      scoring::Cluster cluster;
      cluster.centroid = streamline;
      clusters.push_back(std::move(cluster));
      sums.emplace_back(nb_points, std::array<double, 3>{0.0, 0.0, 0.0});
    }

    auto &cluster = clusters[best];
    auto &sum = sums[best];

    const bool flip =
        !cluster.indices.empty() &&
        FlippedAveragePointwiseDistance(streamline, cluster.centroid) <
            AveragePointwiseDistance(streamline, cluster.centroid);

    cluster.indices.push_back(s);
    const double count = static_cast<double>(cluster.indices.size());
    for (size_t p = 0; p < nb_points; ++p) {
      const auto &point = streamline[flip ? nb_points - 1 - p : p];
      for (int d = 0; d < 3; ++d) {
        sum[p][d] += point[d];
        cluster.centroid[p][d] = static_cast<float>(sum[p][d] / count);
      }
    }
  }

  for (auto &cluster : clusters) {
    cluster_map.AddCluster(std::move(cluster));
  }
  return cluster_map;
}

std::string QuickBundles::GetDescription() const {
  std::stringstream ss;
  ss << "QuickBundles(threshold=" << m_threshold << ", metric=MDF)";
  return ss.str();
}

} // namespace scoring
} // namespace tractoscore
