/**
 * @file SubmissionScorer.cpp
 * @brief Scoring orchestration
 */

#include "SubmissionScorer.h"

#include "../common/ScoringLogger.h"
#include "../common/TractoScoreExceptions.h"
#include "StreamlineGeometry.h"
#include "SubsetWriter.h"

#include <utility>

namespace tractoscore {
namespace scoring {

std::string ScoringStageToString(ScoringStage stage) {
  switch (stage) {
  case ScoringStage::LoadGroundTruth:
    return "LOAD_GT";
  case ScoringStage::LoadSubmission:
    return "LOAD_SUBMISSION";
  case ScoringStage::ExtractValidConnections:
    return "EXTRACT_VC";
  case ScoringStage::FilterLength:
    return "FILTER_LENGTH";
  case ScoringStage::GroupInvalidConnections:
    return "GROUP_IC";
  case ScoringStage::ValidatePartition:
    return "VALIDATE_PARTITION";
  case ScoringStage::Aggregate:
    return "AGGREGATE";
  case ScoringStage::Persist:
    return "PERSIST";
  case ScoringStage::Done:
    return "DONE";
  default:
    return "UNKNOWN";
  }
}

SubmissionScorer::SubmissionScorer(const ScoringConfig &config,
                                   const PersistenceOptions &persistence)
    : m_config(config), m_persistence(persistence) {
  m_config.Validate();
  if (m_persistence.AnyEnabled())
    m_persistence.Validate();
}

ScoringResult SubmissionScorer::ScoreSubmission(
    const std::string &streamlines_filename,
    const io::SubmissionAttributes &attributes,
    const std::string &ground_truth_dir,
    const BundleAttributesMap &bundle_attributes) const {
  ScoringLogger logger("SubmissionScorer", m_config.verbose);

  logger.Info("Stage " + ScoringStageToString(ScoringStage::LoadGroundTruth) +
              ": " + ground_truth_dir);
  GroundTruthLoader loader(m_config);
  const GroundTruth ground_truth = loader.Load(
      GroundTruthLayout::FromDirectory(ground_truth_dir), bundle_attributes);

  logger.Info("Stage " + ScoringStageToString(ScoringStage::LoadSubmission) +
              ": " + streamlines_filename);
  io::TractogramReader reader;
  if (!reader.Open(streamlines_filename)) {
    throw UnsupportedFormatException(streamlines_filename);
  }
  io::TractogramReader::ReadOptions options;
  options.attributes = attributes;
  options.verbose = m_config.verbose;
  const io::Tractogram tractogram = reader.Read(ground_truth.reference, options);

  return ScoreSubmission(tractogram, ground_truth);
}

ScoringResult
SubmissionScorer::ScoreSubmission(const io::Tractogram &tractogram,
                                  const GroundTruth &ground_truth) const {
  ScoringLogger logger("SubmissionScorer", m_config.verbose);
  const size_t total = tractogram.Size();

  if (total == 0) {
    throw ScoringException(ScoringStageToString(ScoringStage::LoadSubmission),
                           "submission contains no streamlines");
  }

  ScoringResult result;
  result.classification = ClassificationResult(total);

  // Valid connections
  logger.Info("Stage " +
              ScoringStageToString(ScoringStage::ExtractValidConnections));
  ValidConnectionExtractor extractor(m_config);
  ValidConnectionResult valid =
      extractor.Extract(tractogram, ground_truth.bundles);

  for (size_t index : valid.vc_indices) {
    result.classification.Assign(index,
                                 ValidConnection{*valid.assignment[index]});
  }

  // Length filter; valid connections are never filtered
  logger.Info("Stage " + ScoringStageToString(ScoringStage::FilterLength));
  std::vector<size_t> candidates;
  size_t non_vc = 0;
  for (size_t i = 0; i < total; ++i) {
    if (valid.assignment[i])
      continue;
    ++non_vc;
    if (StreamlineLength(tractogram[i]) >= m_config.length_threshold) {
      candidates.push_back(i);
    } else {
      result.classification.Assign(i,
                                   NoConnection{NoConnectionReason::TooShort});
    }
  }
  logger.Info(std::to_string(non_vc - candidates.size()) +
              " streamlines shorter than " +
              std::to_string(m_config.length_threshold));

  // Invalid connections
  logger.Info("Stage " +
              ScoringStageToString(ScoringStage::GroupInvalidConnections));
  InvalidConnectionGrouper grouper(m_config);
  InvalidConnectionResult invalid =
      grouper.Group(tractogram, candidates, ground_truth.rois);

  for (const auto &bundle : invalid.bundles) {
    for (size_t index : bundle.indices) {
      result.classification.Assign(index, InvalidConnection{bundle.pair});
    }
  }
  for (const auto &rejected : invalid.rejected) {
    result.classification.Assign(rejected.index,
                                 NoConnection{rejected.reason});
  }

  // Partition
  logger.Info("Stage " +
              ScoringStageToString(ScoringStage::ValidatePartition));
  if (invalid.ic_count != candidates.size() - invalid.rejected.size()) {
    throw PartitionConsistencyException(
        "invalid connection count " + std::to_string(invalid.ic_count) +
            " does not match " + std::to_string(candidates.size()) +
            " candidates minus " + std::to_string(invalid.rejected.size()) +
            " rejected",
        total);
  }
  result.classification.Validate();

  logger.Info("Stage " + ScoringStageToString(ScoringStage::Aggregate));
  result.scorecard = Aggregate(result.classification, valid, invalid);

  if (m_persistence.AnyEnabled()) {
    logger.Info("Stage " + ScoringStageToString(ScoringStage::Persist));
    result.written_files = Persist(tractogram, ground_truth.reference,
                                   result.classification, valid, invalid);
  }

  result.bundles = std::move(valid.bundles);
  result.invalid_bundles = std::move(invalid.bundles);

  logger.Info("Stage " + ScoringStageToString(ScoringStage::Done));
  return result;
}

Scorecard
SubmissionScorer::Aggregate(const ClassificationResult &classification,
                            const ValidConnectionResult &valid,
                            const InvalidConnectionResult &invalid) const {
  Scorecard scorecard;
  const double total = static_cast<double>(classification.Size());

  scorecard.total_streamlines_count = classification.Size();
  scorecard.vc = classification.CountValid() / total;
  scorecard.ic = classification.CountInvalid() / total;
  scorecard.nc = classification.CountNoConnection() / total;
  scorecard.vcwp = 0.0;
  scorecard.ib = invalid.NbInvalidBundles();

  for (const auto &bundle : valid.bundles) {
    if (!bundle.IsFound())
      continue;
    scorecard.streamlines_per_bundle[bundle.name] = bundle.nb_streamlines;
    scorecard.overlap_per_bundle[bundle.name] = bundle.metrics.overlap;
    scorecard.overreach_per_bundle[bundle.name] = bundle.metrics.overreach;
    scorecard.overreach_norm_gt_per_bundle[bundle.name] =
        bundle.metrics.overreach_norm;
    scorecard.f1_score_per_bundle[bundle.name] = bundle.metrics.f1_score;
  }
  scorecard.vb = scorecard.streamlines_per_bundle.size();

  scorecard.mean_ol = MeanOf(scorecard.overlap_per_bundle);
  scorecard.mean_or = MeanOf(scorecard.overreach_per_bundle);
  scorecard.mean_orn = MeanOf(scorecard.overreach_norm_gt_per_bundle);
  scorecard.mean_f1 = MeanOf(scorecard.f1_score_per_bundle);

  return scorecard;
}

std::vector<std::string> SubmissionScorer::Persist(
    const io::Tractogram &tractogram, const io::ReferenceSpace &reference,
    const ClassificationResult &classification,
    const ValidConnectionResult &valid,
    const InvalidConnectionResult &invalid) const {
  SubsetWriter writer(tractogram, reference, m_persistence);
  std::vector<std::string> written;

  auto record = [&written](const std::string &path) {
    if (!path.empty())
      written.push_back(path);
  };

  if (m_persistence.save_vbs) {
    for (const auto &bundle : valid.bundles) {
      if (bundle.IsFound())
        record(writer.WriteSubset("VB_" + bundle.name,
                                  bundle.streamline_indices));
    }
  }
  if (m_persistence.save_full_vc) {
    record(writer.WriteSubset("VC", classification.ValidIndices()));
  }
  if (m_persistence.save_ibs) {
    for (const auto &bundle : invalid.bundles) {
      record(writer.WriteSubset("IB_" + bundle.PairId(), bundle.indices));
    }
  }
  if (m_persistence.save_full_ic) {
    record(writer.WriteSubset("IC", classification.InvalidIndices()));
  }
  if (m_persistence.save_full_nc) {
    record(writer.WriteSubset("NC", classification.NoConnectionIndices()));
  }

  return written;
}

} // namespace scoring
} // namespace tractoscore
