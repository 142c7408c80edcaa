/**
 * @file main.cpp
 * @brief Command-line scoring of a tractography submission
 *
 * Scores one streamline file against a ground-truth directory and prints
 * the scorecard as JSON, optionally saving the classified subsets.
 */

#include "../common/TractoScoreExceptions.h"
#include "../io/StreamlineIO.h"
#include "../scoring/GroundTruthLoader.h"
#include "../scoring/SubmissionScorer.h"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using namespace tractoscore;

namespace {

struct CommandLine {
  std::string submission;
  std::string gt_dir;
  std::string attributes_file;
  std::string scores_file;
  io::SubmissionAttributes submission_attributes;
  scoring::ScoringConfig config;
  scoring::PersistenceOptions persistence;
};

void PrintUsage(const char *program) {
  std::cout << "Usage: " << program
            << " <submission> <gt_dir> <bundle_attribs.json> [options]"
            << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --orientation O       RAS or LPS, required for .vtk input"
            << std::endl;
  std::cout << "  --out-dir D           Directory for saved subsets (default .)"
            << std::endl;
  std::cout << "  --base-name B         Prefix of saved subsets (default: "
               "submission file name)"
            << std::endl;
  std::cout << "  --out-type T          tck, trk or vtk (default tck)"
            << std::endl;
  std::cout << "  --save-vb             Save each valid bundle" << std::endl;
  std::cout << "  --save-ib             Save each invalid bundle" << std::endl;
  std::cout << "  --save-vc             Save all valid connections" << std::endl;
  std::cout << "  --save-ic             Save all invalid connections"
            << std::endl;
  std::cout << "  --save-nc             Save all no connections" << std::endl;
  std::cout << "  --scores FILE         Write the scorecard JSON to FILE"
            << std::endl;
  std::cout << "  --threads N           Worker threads, 0 = all cores (default 1)"
            << std::endl;
  std::cout << "  --endpoint-policy P   nearest or containing (default nearest)"
            << std::endl;
  std::cout << "  --verbose             Print progress" << std::endl;
  std::cout << std::endl;
  std::cout << "Example: " << program
            << " submission.trk scoring_data/ scoring_data/bundles_attributes.json"
            << std::endl;
}

/// Returns false on a malformed command line
bool ParseCommandLine(int argc, char *argv[], CommandLine &cmd) {
  std::vector<std::string> positional;
  bool base_name_set = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    auto next_value = [&](std::string &value) {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << std::endl;
        return false;
      }
      value = argv[++i];
      return true;
    };

    std::string value;
    if (arg == "--orientation") {
      if (!next_value(value))
        return false;
      cmd.submission_attributes.orientation = value;
    } else if (arg == "--out-dir") {
      if (!next_value(cmd.persistence.out_dir))
        return false;
    } else if (arg == "--base-name") {
      if (!next_value(cmd.persistence.base_name))
        return false;
      base_name_set = true;
    } else if (arg == "--out-type") {
      if (!next_value(cmd.persistence.out_tract_type))
        return false;
    } else if (arg == "--save-vb") {
      cmd.persistence.save_vbs = true;
    } else if (arg == "--save-ib") {
      cmd.persistence.save_ibs = true;
    } else if (arg == "--save-vc") {
      cmd.persistence.save_full_vc = true;
    } else if (arg == "--save-ic") {
      cmd.persistence.save_full_ic = true;
    } else if (arg == "--save-nc") {
      cmd.persistence.save_full_nc = true;
    } else if (arg == "--scores") {
      if (!next_value(cmd.scores_file))
        return false;
    } else if (arg == "--threads") {
      if (!next_value(value))
        return false;
      try {
        size_t consumed = 0;
        const unsigned long threads = std::stoul(value, &consumed);
        if (consumed != value.size()) {
          std::cerr << "Invalid thread count: " << value << std::endl;
          return false;
        }
        cmd.config.num_threads = static_cast<size_t>(threads);
      } catch (const std::exception &) {
        std::cerr << "Invalid thread count: " << value << std::endl;
        return false;
      }
    } else if (arg == "--endpoint-policy") {
      if (!next_value(value))
        return false;
      try {
        cmd.config.endpoint_policy = scoring::ParseEndpointRoiPolicy(value);
      } catch (const ConfigurationException &e) {
        std::cerr << e.what() << std::endl;
        return false;
      }
    } else if (arg == "--verbose") {
      cmd.config.verbose = true;
    } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
      std::cerr << "Unknown option: " << arg << std::endl;
      return false;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() != 3) {
    return false;
  }

  cmd.submission = positional[0];
  cmd.gt_dir = positional[1];
  cmd.attributes_file = positional[2];

  if (!base_name_set) {
    cmd.persistence.base_name =
        io::StreamlineUtils::GetBaseName(cmd.submission);
  }
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  CommandLine cmd;
  if (!ParseCommandLine(argc, argv, cmd)) {
    PrintUsage(argv[0]);
    return 1;
  }

  auto start_time = std::chrono::high_resolution_clock::now();

  try {
    const scoring::BundleAttributesMap attributes =
        scoring::LoadBundleAttributes(cmd.attributes_file);

    scoring::SubmissionScorer scorer(cmd.config, cmd.persistence);
    const scoring::ScoringResult result = scorer.ScoreSubmission(
        cmd.submission, cmd.submission_attributes, cmd.gt_dir, attributes);

    if (cmd.scores_file.empty()) {
      std::cout << result.scorecard.ToString() << std::endl;
    } else {
      result.scorecard.SaveToJSON(cmd.scores_file);
    }

    if (cmd.config.verbose) {
      auto end_time = std::chrono::high_resolution_clock::now();
      auto duration = std::chrono::duration<double>(end_time - start_time);

      std::cout << std::endl;
      std::cout << result.scorecard.GenerateSummaryReport();
      for (const auto &path : result.written_files) {
        std::cout << "Saved: " << path << std::endl;
      }
      if (!cmd.scores_file.empty()) {
        std::cout << "Scores saved to: " << cmd.scores_file << std::endl;
      }
      std::cout << "Processing time: " << duration.count() << " seconds"
                << std::endl;
    }
  } catch (const TractoScoreException &e) {
    std::cerr << e.GetFormattedReport();
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Scoring failed: " << e.what() << std::endl;
    return 2;
  }

  return 0;
}
