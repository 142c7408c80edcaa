/**
 * TractoScore Endpoint Policy Example
 *
 * Scores one submission twice, once per endpoint-to-ROI policy, and prints
 * how the invalid connections and their rejection reasons change.
 */

#include <iostream>
#include <string>

#include "../src/common/TractoScoreExceptions.h"
#include "../src/scoring/SubmissionScorer.h"

using namespace tractoscore;

namespace {

void PrintReasons(const scoring::ClassificationResult &classification) {
  for (auto reason : {scoring::NoConnectionReason::TooShort,
                      scoring::NoConnectionReason::IsolatedCluster,
                      scoring::NoConnectionReason::SingletonRoiPair,
                      scoring::NoConnectionReason::NoEndpointRoi}) {
    std::cout << "   " << scoring::NoConnectionReasonToString(reason) << ": "
              << classification.CountReason(reason) << std::endl;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  std::cout << "=== TractoScore Endpoint Policy Example ===" << std::endl;

  if (argc < 4) {
    std::cerr << "Usage: " << argv[0]
              << " <submission> <gt_dir> <bundle_attribs.json> [orientation]"
              << std::endl;
    std::cerr << "Example: " << argv[0]
              << " submission.trk scoring_data/ "
                 "scoring_data/bundles_attributes.json"
              << std::endl;
    return 1;
  }

  io::SubmissionAttributes attributes;
  if (argc > 4)
    attributes.orientation = argv[4];

  try {
    const auto bundle_attributes = scoring::LoadBundleAttributes(argv[3]);

    for (auto policy : {scoring::EndpointRoiPolicy::Nearest,
                        scoring::EndpointRoiPolicy::Containing}) {
      scoring::ScoringConfig config;
      config.endpoint_policy = policy;
      config.num_threads = 0;

      std::cout << "\n" << scoring::EndpointRoiPolicyToString(policy)
                << " policy" << std::endl;

      scoring::SubmissionScorer scorer(config);
      const auto result =
          scorer.ScoreSubmission(argv[1], attributes, argv[2], bundle_attributes);

      std::cout << "   IC: " << result.scorecard.ic
                << "  IB: " << result.scorecard.ib << std::endl;
      for (const auto &bundle : result.invalid_bundles) {
        std::cout << "   IB " << bundle.PairId() << ": "
                  << bundle.indices.size() << " streamlines" << std::endl;
      }
      std::cout << "   No-connection reasons:" << std::endl;
      PrintReasons(result.classification);
    }
  } catch (const TractoScoreException &e) {
    std::cerr << e.GetFormattedReport();
    return 2;
  }

  return 0;
}
