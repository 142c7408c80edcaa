/**
 * @file Scorecard.cpp
 * @brief Scorecard serialization and reporting
 */

#include "Scorecard.h"

#include "../common/TractoScoreExceptions.h"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace tractoscore {
namespace scoring {

double MeanOf(const std::map<std::string, double> &values) {
  if (values.empty())
    return std::numeric_limits<double>::quiet_NaN();

  double sum = 0.0;
  for (const auto &entry : values)
    sum += entry.second;
  return sum / values.size();
}

nlohmann::json Scorecard::ToJson() const {
  nlohmann::json j;
  j["version"] = version;
  j["algo_version"] = algo_version;
  j["VC"] = vc;
  j["IC"] = ic;
  j["NC"] = nc;
  j["VCWP"] = vcwp;
  j["VB"] = vb;
  j["IB"] = ib;
  j["streamlines_per_bundle"] = streamlines_per_bundle;
  j["total_streamlines_count"] = total_streamlines_count;
  j["overlap_per_bundle"] = overlap_per_bundle;
  j["overreach_per_bundle"] = overreach_per_bundle;
  j["overreach_norm_gt_per_bundle"] = overreach_norm_gt_per_bundle;
  j["f1_score_per_bundle"] = f1_score_per_bundle;

  // nlohmann writes NaN as null; be explicit about it
  auto number_or_null = [](double value) -> nlohmann::json {
    if (std::isnan(value))
      return nullptr;
    return value;
  };
  j["mean_OL"] = number_or_null(mean_ol);
  j["mean_OR"] = number_or_null(mean_or);
  j["mean_ORn"] = number_or_null(mean_orn);
  j["mean_F1"] = number_or_null(mean_f1);

  return j;
}

std::string Scorecard::ToString(int indent) const {
  return ToJson().dump(indent);
}

void Scorecard::SaveToJSON(const std::string &filename) const {
  std::ofstream file(filename);
  if (!file.is_open()) {
    throw TractoScoreException("Cannot open scores file '" + filename + "'",
                               "Scorecard", "SaveToJSON",
                               TractoScoreException::Severity::Error,
                               TractoScoreException::Category::InputOutput);
  }

  file << ToString(2) << std::endl;
  if (!file) {
    throw TractoScoreException("Cannot write scores file '" + filename + "'",
                               "Scorecard", "SaveToJSON",
                               TractoScoreException::Severity::Error,
                               TractoScoreException::Category::InputOutput);
  }
}

std::string Scorecard::GenerateSummaryReport() const {
  std::stringstream report;
  report << std::fixed << std::setprecision(4);

  report << "=== Tractogram Scorecard ===" << std::endl;
  report << "Streamlines: " << total_streamlines_count << std::endl;
  report << "VC: " << vc << "  IC: " << ic << "  NC: " << nc << std::endl;
  report << "Valid bundles: " << vb << "  Invalid bundles: " << ib
         << std::endl;

  if (!streamlines_per_bundle.empty()) {
    report << std::endl << "Per bundle:" << std::endl;
    for (const auto &entry : streamlines_per_bundle) {
      const std::string &name = entry.first;
      report << "  " << std::left << std::setw(16) << name << std::right
             << std::setw(8) << entry.second;
      if (overlap_per_bundle.count(name)) {
        report << "  OL " << overlap_per_bundle.at(name) << "  OR "
               << overreach_per_bundle.at(name) << "  F1 "
               << f1_score_per_bundle.at(name);
      }
      report << std::endl;
    }
    report << std::endl;
    report << "Mean OL: " << mean_ol << "  Mean OR: " << mean_or
           << "  Mean ORn: " << mean_orn << "  Mean F1: " << mean_f1
           << std::endl;
  }

  return report.str();
}

} // namespace scoring
} // namespace tractoscore
