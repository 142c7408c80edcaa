/**
 * @file SubmissionScorer.h
 * @brief End-to-end scoring of a tractography submission
 *
 * Stages: LoadGroundTruth -> LoadSubmission -> ExtractValidConnections ->
 * FilterLength -> GroupInvalidConnections -> ValidatePartition ->
 * Aggregate -> Persist. A run either returns a complete result or throws
 * before any scorecard or subset file is produced.
 */

#ifndef SUBMISSION_SCORER_H
#define SUBMISSION_SCORER_H

#include "Classification.h"
#include "GroundTruthLoader.h"
#include "InvalidConnections.h"
#include "ScoringConfig.h"
#include "Scorecard.h"
#include "ValidConnections.h"

#include <string>
#include <vector>

namespace tractoscore {
namespace scoring {

enum class ScoringStage {
  LoadGroundTruth,
  LoadSubmission,
  ExtractValidConnections,
  FilterLength,
  GroupInvalidConnections,
  ValidatePartition,
  Aggregate,
  Persist,
  Done
};

std::string ScoringStageToString(ScoringStage stage);

struct ScoringResult {
  Scorecard scorecard;
  ClassificationResult classification;
  std::vector<FoundBundleInfo> bundles; // Arena order, found or not
  std::vector<InvalidBundle> invalid_bundles;
  std::vector<std::string> written_files;
};

class SubmissionScorer {
private:
  ScoringConfig m_config;
  PersistenceOptions m_persistence;

public:
  explicit SubmissionScorer(const ScoringConfig &config = ScoringConfig{},
                            const PersistenceOptions &persistence =
                                PersistenceOptions{});

  /// Loads the ground truth from its standard layout and the submission file
  ScoringResult ScoreSubmission(const std::string &streamlines_filename,
                                const io::SubmissionAttributes &attributes,
                                const std::string &ground_truth_dir,
                                const BundleAttributesMap &bundle_attributes) const;

  /// Scores already-loaded data
  ScoringResult ScoreSubmission(const io::Tractogram &tractogram,
                                const GroundTruth &ground_truth) const;

  const ScoringConfig &GetConfig() const { return m_config; }
  const PersistenceOptions &GetPersistenceOptions() const {
    return m_persistence;
  }

private:
  Scorecard Aggregate(const ClassificationResult &classification,
                      const ValidConnectionResult &valid,
                      const InvalidConnectionResult &invalid) const;

  std::vector<std::string> Persist(const io::Tractogram &tractogram,
                                   const io::ReferenceSpace &reference,
                                   const ClassificationResult &classification,
                                   const ValidConnectionResult &valid,
                                   const InvalidConnectionResult &invalid) const;
};

} // namespace scoring
} // namespace tractoscore

#endif // SUBMISSION_SCORER_H
