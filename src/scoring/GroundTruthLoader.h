/**
 * @file GroundTruthLoader.h
 * @brief Reference bundles, ROIs and their on-disk layout
 */

#ifndef GROUND_TRUTH_LOADER_H
#define GROUND_TRUTH_LOADER_H

#include "../io/StreamlineIO.h"
#include "QuickBundles.h"
#include "ScoringConfig.h"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace tractoscore {
namespace scoring {

/**
 * @brief Per-bundle attributes, keyed by bundle file name
 */
struct BundleAttributes {
  double cluster_threshold = 0.0; // Acceptance threshold for VC queries
  std::string orientation;        // Only needed for .vtk bundle files
};

using BundleAttributesMap = std::map<std::string, BundleAttributes>;

/// Parses {"<file>": {"cluster_threshold": <number>}, ...}
BundleAttributesMap ParseBundleAttributes(const nlohmann::json &document);
BundleAttributesMap LoadBundleAttributes(const std::string &filename);

/**
 * @brief A ground-truth bundle prepared for queries
 */
struct ReferenceBundle {
  std::string name;     // File stem, also the mask name
  std::string filename; // File name used for the attribute lookup
  double acceptance_threshold = 0.0;
  ClusterMap cluster_map; // Reference data = resampled bundle streamlines
  io::MaskPointer mask;
  size_t mask_voxels = 0;
};

struct RegionOfInterest {
  std::string name;
  io::MaskPointer mask;
  size_t mask_voxels = 0;
};

/**
 * @brief Standard ground-truth directory layout
 */
struct GroundTruthLayout {
  std::string base_dir;
  std::string reference_anatomy; // masks/wm.nii.gz
  std::string rois_dir;          // masks/rois
  std::string bundle_masks_dir;  // masks/bundles
  std::string bundles_dir;       // bundles

  static GroundTruthLayout FromDirectory(const std::string &base_dir);

  /// Throws FileNotFoundException for the first missing entry
  void Validate() const;
};

/**
 * @brief Everything the scorer needs from the ground truth
 */
struct GroundTruth {
  io::ReferenceSpace reference;
  std::vector<ReferenceBundle> bundles;
  std::vector<RegionOfInterest> rois;
};

class GroundTruthLoader {
private:
  ScoringConfig m_config;

public:
  explicit GroundTruthLoader(const ScoringConfig &config = ScoringConfig{});

  GroundTruth Load(const GroundTruthLayout &layout,
                   const BundleAttributesMap &attributes) const;

  /**
   * @brief Load every bundle file in sorted order
   *
   * Every file must have an attribute entry; the check runs before any
   * bundle is read and throws MissingAttributeException.
   */
  std::vector<ReferenceBundle>
  LoadBundles(const std::string &bundles_dir,
              const std::string &bundle_masks_dir,
              const BundleAttributesMap &attributes,
              const io::ReferenceSpace &reference) const;

  std::vector<RegionOfInterest>
  LoadRois(const std::string &rois_dir,
           const io::ReferenceSpace &reference) const;

  /// Resamples and clusters in-memory bundle streamlines
  ReferenceBundle BuildBundle(const std::string &name,
                              double acceptance_threshold,
                              const std::vector<io::Streamline> &streamlines,
                              io::MaskPointer mask) const;

  /// Regular files of a directory, sorted by name
  static std::vector<std::string> ListSortedFiles(const std::string &dir);

  /// File name without directory and volume/streamline extension
  static std::string StemOf(const std::string &filename);
};

} // namespace scoring
} // namespace tractoscore

#endif // GROUND_TRUTH_LOADER_H
