/**
 * @file QuickBundles.h
 * @brief Centroid-based streamline clustering and cluster queries
 *
 * All streamlines handed to a clusterer or a ClusterMap query must already
 * be resampled to a common number of points.
 */

#ifndef QUICK_BUNDLES_H
#define QUICK_BUNDLES_H

#include "../io/StreamlineIO.h"

#include <limits>
#include <string>
#include <vector>

namespace tractoscore {
namespace scoring {

/**
 * @brief One cluster: member indices into the clustered input and the
 * centroid
 */
struct Cluster {
  size_t id = 0;
  std::vector<size_t> indices;
  io::Streamline centroid;

  size_t Size() const { return indices.size(); }
};

/**
 * @brief Result of a cluster query
 */
struct ClusterMatch {
  size_t cluster = 0;
  double distance = std::numeric_limits<double>::infinity();

  bool IsValid() const { return distance < std::numeric_limits<double>::infinity(); }
};

/**
 * @brief Clusters of a streamline set, with the member streamlines kept as
 * reference data for distance queries
 */
class ClusterMap {
private:
  std::vector<Cluster> m_clusters;
  std::vector<io::Streamline> m_refdata;

public:
  ClusterMap() = default;

  size_t Size() const { return m_clusters.size(); }
  bool Empty() const { return m_clusters.empty(); }
  const Cluster &GetCluster(size_t index) const { return m_clusters.at(index); }
  const std::vector<Cluster> &GetClusters() const { return m_clusters; }

  /// Indices of the clusters with exactly `size` members
  std::vector<size_t> ClustersOfSize(size_t size) const;

  void AddCluster(Cluster cluster);
  void SetReferenceData(std::vector<io::Streamline> refdata);
  const std::vector<io::Streamline> &GetReferenceData() const {
    return m_refdata;
  }

  /// Cluster whose centroid is closest (MDF) to the query
  ClusterMatch NearestCluster(const io::Streamline &query) const;

  /**
   * @brief Nearest-centroid cluster and the MDF distance from the query to
   * that cluster's closest member
   *
   * Without reference data the centroid distance is returned.
   */
  ClusterMatch QueryDistance(const io::Streamline &query) const;
};

/**
 * @brief Abstract clustering policy
 */
class StreamlineClusterer {
public:
  virtual ~StreamlineClusterer() = default;

  virtual ClusterMap Cluster(const std::vector<io::Streamline> &resampled) const = 0;
  virtual std::string GetDescription() const = 0;
};

/**
 * @brief Single-pass QuickBundles with the MDF distance
 *
 * Streamlines are visited in input order. Each joins the cluster with the
 * closest centroid if that distance is below the threshold, otherwise it
 * starts a new cluster. Centroids are running means of the members, each
 * member added in the orientation closest to the centroid.
 */
class QuickBundles : public StreamlineClusterer {
private:
  double m_threshold;

public:
  explicit QuickBundles(double threshold);

  ClusterMap Cluster(const std::vector<io::Streamline> &resampled) const override;
  std::string GetDescription() const override;

  double GetThreshold() const { return m_threshold; }
};

} // namespace scoring
} // namespace tractoscore

#endif // QUICK_BUNDLES_H
