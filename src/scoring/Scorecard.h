/**
 * @file Scorecard.h
 * @brief Final scores of a submission and their JSON form
 */

#ifndef SCORECARD_H
#define SCORECARD_H

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <string>

namespace tractoscore {
namespace scoring {

/**
 * @brief Scores of one submission
 *
 * VC, IC and NC are fractions of total_streamlines_count and sum to 1.
 * VCWP is always 0. Per-bundle maps list found bundles only. The mean_*
 * values are NaN when no bundle was found and serialize as null.
 */
struct Scorecard {
  int version = 2;
  int algo_version = 5;

  double vc = 0.0;
  double ic = 0.0;
  double nc = 0.0;
  double vcwp = 0.0;

  size_t vb = 0;
  size_t ib = 0;
  size_t total_streamlines_count = 0;

  std::map<std::string, size_t> streamlines_per_bundle;
  std::map<std::string, double> overlap_per_bundle;
  std::map<std::string, double> overreach_per_bundle;
  std::map<std::string, double> overreach_norm_gt_per_bundle;
  std::map<std::string, double> f1_score_per_bundle;

  double mean_ol = 0.0;
  double mean_or = 0.0;
  double mean_orn = 0.0;
  double mean_f1 = 0.0;

  nlohmann::json ToJson() const;
  std::string ToString(int indent = 2) const;
  void SaveToJSON(const std::string &filename) const;

  std::string GenerateSummaryReport() const;
};

/// Arithmetic mean of the values, NaN for an empty map
double MeanOf(const std::map<std::string, double> &values);

} // namespace scoring
} // namespace tractoscore

#endif // SCORECARD_H
