/**
 * @file InvalidConnections.h
 * @brief Grouping of non-valid candidate streamlines into invalid bundles
 */

#ifndef INVALID_CONNECTIONS_H
#define INVALID_CONNECTIONS_H

#include "Classification.h"
#include "EndpointRoiLocator.h"
#include "ScoringConfig.h"

#include <vector>

namespace tractoscore {
namespace scoring {

/**
 * @brief Streamlines whose endpoints connect the same ROI pair
 */
struct InvalidBundle {
  RoiPair pair;
  std::vector<size_t> indices;

  std::string PairId() const { return pair.Id(); }
};

struct RejectedStreamline {
  size_t index = 0;
  NoConnectionReason reason = NoConnectionReason::NoEndpointRoi;
};

/**
 * @brief Outcome of grouping a candidate set
 *
 * Candidates end either in `rejected` or in exactly one invalid bundle.
 * Invalid bundles are ordered by ROI pair.
 */
struct InvalidConnectionResult {
  std::vector<RejectedStreamline> rejected;
  std::vector<InvalidBundle> bundles;
  size_t ic_count = 0;

  size_t NbInvalidBundles() const { return bundles.size(); }
  std::vector<size_t> InvalidIndices() const;
};

/**
 * @brief Four steps over the candidates:
 *   1. QuickBundles clustering, single-member clusters rejected
 *      (IsolatedCluster) when enabled;
 *   2. both endpoints attached to an ROI (NoEndpointRoi when one fails);
 *   3. grouping by unordered ROI pair;
 *   4. groups below min_streamlines_per_ib rejected (SingletonRoiPair).
 */
class InvalidConnectionGrouper {
private:
  ScoringConfig m_config;

public:
  explicit InvalidConnectionGrouper(const ScoringConfig &config = ScoringConfig{});

  InvalidConnectionResult Group(const io::Tractogram &tractogram,
                                const std::vector<size_t> &candidates,
                                const std::vector<RegionOfInterest> &rois) const;

  InvalidConnectionResult Group(const io::Tractogram &tractogram,
                                const std::vector<size_t> &candidates,
                                const EndpointRoiLocator &locator) const;
};

} // namespace scoring
} // namespace tractoscore

#endif // INVALID_CONNECTIONS_H
