/**
 * @file ValidConnections.h
 * @brief Assignment of submitted streamlines to reference bundles
 */

#ifndef VALID_CONNECTIONS_H
#define VALID_CONNECTIONS_H

#include "BundleMetrics.h"
#include "GroundTruthLoader.h"
#include "ScoringConfig.h"

#include <optional>
#include <string>
#include <vector>

namespace tractoscore {
namespace scoring {

/**
 * @brief What the submission recovered of one reference bundle
 *
 * Metrics are only meaningful when nb_streamlines > 0.
 */
struct FoundBundleInfo {
  std::string name;
  size_t nb_streamlines = 0;
  std::vector<size_t> streamline_indices;
  BundleOverlapMetrics metrics;

  bool IsFound() const { return nb_streamlines > 0; }
};

struct BundleMatch {
  size_t bundle_index = 0;
  double distance = 0.0;
};

/**
 * @brief Valid-connection assignment of a submission
 *
 * assignment[i] holds the bundle of streamline i, or nothing for non-VC.
 * bundles follows the order of the reference bundle arena.
 */
struct ValidConnectionResult {
  std::vector<std::optional<size_t>> assignment;
  std::vector<size_t> vc_indices;
  std::vector<FoundBundleInfo> bundles;

  size_t NbFoundBundles() const;
};

class ValidConnectionExtractor {
private:
  ScoringConfig m_config;

public:
  explicit ValidConnectionExtractor(const ScoringConfig &config = ScoringConfig{});

  ValidConnectionResult Extract(const io::Tractogram &tractogram,
                                const std::vector<ReferenceBundle> &bundles) const;

  /**
   * @brief Best bundle for one resampled streamline
   *
   * A bundle qualifies when the query distance is at most its acceptance
   * threshold; the smallest distance wins, ties go to the lower index.
   */
  std::optional<BundleMatch>
  MatchStreamline(const io::Streamline &resampled,
                  const std::vector<ReferenceBundle> &bundles) const;

  /// Fills the overlap measures of every bundle with assigned streamlines
  void ComputeBundleMetrics(const io::Tractogram &tractogram,
                            const std::vector<ReferenceBundle> &bundles,
                            ValidConnectionResult &result) const;
};

} // namespace scoring
} // namespace tractoscore

#endif // VALID_CONNECTIONS_H
