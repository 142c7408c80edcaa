/**
 * @file ValidConnections.cpp
 * @brief Valid-connection extraction and per-bundle measures
 */

#include "ValidConnections.h"

#include "../common/ScoringLogger.h"
#include "../common/ThreadPool.h"
#include "../common/TractoScoreExceptions.h"
#include "StreamlineGeometry.h"

#include <iomanip>
#include <sstream>

namespace tractoscore {
namespace scoring {

size_t ValidConnectionResult::NbFoundBundles() const {
  size_t count = 0;
  for (const auto &bundle : bundles) {
    if (bundle.IsFound())
      ++count;
  }
  return count;
}

ValidConnectionExtractor::ValidConnectionExtractor(const ScoringConfig &config)
    : m_config(config) {
  m_config.Validate();
}

std::optional<BundleMatch> ValidConnectionExtractor::MatchStreamline(
    const io::Streamline &resampled,
    const std::vector<ReferenceBundle> &bundles) const {
  std::optional<BundleMatch> best;

  for (size_t b = 0; b < bundles.size(); ++b) {
    const ClusterMatch match = bundles[b].cluster_map.QueryDistance(resampled);
    if (!match.IsValid() || match.distance > bundles[b].acceptance_threshold)
      continue;

    // Strict comparison keeps the lowest index on ties
    if (!best || match.distance < best->distance) {
      best = BundleMatch{b, match.distance};
    }
  }

  return best;
}

ValidConnectionResult
ValidConnectionExtractor::Extract(const io::Tractogram &tractogram,
                                  const std::vector<ReferenceBundle> &bundles) const {
  ScoringLogger logger("ValidConnections", m_config.verbose);

  ValidConnectionResult result;
  result.assignment.assign(tractogram.Size(), std::nullopt);
  result.bundles.resize(bundles.size());
  for (size_t b = 0; b < bundles.size(); ++b) {
    result.bundles[b].name = bundles[b].name;
  }

  // Each chunk writes only its own slots of the assignment
  ParallelFor(tractogram.Size(), m_config.ResolvedThreadCount(),
              [&](size_t begin, size_t end) {
                for (size_t i = begin; i < end; ++i) {
                  const io::Streamline resampled = ResampleStreamline(
                      tractogram[i], m_config.nb_points_resample);
                  const auto match = MatchStreamline(resampled, bundles);
                  if (match)
                    result.assignment[i] = match->bundle_index;
                }
              });

  for (size_t i = 0; i < result.assignment.size(); ++i) {
    if (!result.assignment[i])
      continue;
    FoundBundleInfo &info = result.bundles[*result.assignment[i]];
    info.streamline_indices.push_back(i);
    ++info.nb_streamlines;
    result.vc_indices.push_back(i);
  }

  ComputeBundleMetrics(tractogram, bundles, result);

  logger.Info(std::to_string(result.vc_indices.size()) + " of " +
              std::to_string(tractogram.Size()) +
              " streamlines are valid connections in " +
              std::to_string(result.NbFoundBundles()) + " bundles");
  return result;
}

void ValidConnectionExtractor::ComputeBundleMetrics(
    const io::Tractogram &tractogram,
    const std::vector<ReferenceBundle> &bundles,
    ValidConnectionResult &result) const {
  ScoringLogger logger("BundleMetrics", m_config.verbose);

  for (size_t b = 0; b < bundles.size(); ++b) {
    FoundBundleInfo &info = result.bundles[b];
    if (!info.IsFound())
      continue;

    if (!bundles[b].mask) {
      throw ScoringException("ComputeBundleMetrics",
                             "bundle " + bundles[b].name + " has no mask");
    }

    io::MaskPointer occupancy = RasterizeStreamlines(
        tractogram, info.streamline_indices, bundles[b].mask);
    info.metrics = ComputeBundleOverlap(occupancy, bundles[b].mask);

    if (info.metrics.gt_voxels == 0) {
      logger.Warning("bundle mask " + bundles[b].name +
                     " is empty, metrics set to 0");
    }

    std::stringstream ss;
    ss << std::fixed << std::setprecision(4) << info.name
       << ": OL=" << info.metrics.overlap << " OR=" << info.metrics.overreach
       << " ORn=" << info.metrics.overreach_norm
       << " F1=" << info.metrics.f1_score;
    logger.Info(ss.str());
  }
}

} // namespace scoring
} // namespace tractoscore
