/**
 * @file GroundTruthLoader.cpp
 * @brief Loading of ground-truth bundles, masks and ROIs
 */

#include "GroundTruthLoader.h"

#include "../common/CompatUtils.h"
#include "../common/ScoringLogger.h"
#include "../common/TractoScoreExceptions.h"
#include "StreamlineGeometry.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace tractoscore {
namespace scoring {

// ===== Bundle attributes =====

BundleAttributesMap ParseBundleAttributes(const nlohmann::json &document) {
  if (!document.is_object()) {
    throw ConfigurationException("bundle attributes", document.dump(),
                                 "JSON object keyed by bundle file name");
  }

  BundleAttributesMap attributes;
  for (auto it = document.begin(); it != document.end(); ++it) {
    const auto &entry = it.value();
    if (!entry.is_object() || !entry.contains("cluster_threshold") ||
        !entry["cluster_threshold"].is_number()) {
      throw ConfigurationException(it.key() + ".cluster_threshold",
                                   entry.dump(), "number");
    }

    BundleAttributes attribs;
    attribs.cluster_threshold = entry["cluster_threshold"].get<double>();
    if (!(attribs.cluster_threshold > 0.0)) {
      throw ConfigurationException(it.key() + ".cluster_threshold",
                                   entry["cluster_threshold"].dump(), "> 0");
    }
    attribs.orientation = entry.value("orientation", std::string());
    attributes[it.key()] = attribs;
  }
  return attributes;
}

BundleAttributesMap LoadBundleAttributes(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw ConfigurationException("bundle attributes file", filename,
                                 "readable JSON file");
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error &e) {
    throw ConfigurationException("bundle attributes file", filename,
                                 std::string("valid JSON (") + e.what() + ")");
  }
  return ParseBundleAttributes(document);
}

// ===== GroundTruthLayout =====

GroundTruthLayout GroundTruthLayout::FromDirectory(const std::string &base_dir) {
  const fs::path base(base_dir);

  GroundTruthLayout layout;
  layout.base_dir = base.string();
  layout.reference_anatomy = (base / "masks" / "wm.nii.gz").string();
  layout.rois_dir = (base / "masks" / "rois").string();
  layout.bundle_masks_dir = (base / "masks" / "bundles").string();
  layout.bundles_dir = (base / "bundles").string();
  return layout;
}

void GroundTruthLayout::Validate() const {
  std::error_code ec;
  if (!fs::is_regular_file(reference_anatomy, ec))
    throw FileNotFoundException(reference_anatomy);
  for (const auto &dir : {rois_dir, bundle_masks_dir, bundles_dir}) {
    if (!fs::is_directory(dir, ec))
      throw FileNotFoundException(dir);
  }
}

// ===== GroundTruthLoader =====

GroundTruthLoader::GroundTruthLoader(const ScoringConfig &config)
    : m_config(config) {
  m_config.Validate();
}

GroundTruth GroundTruthLoader::Load(const GroundTruthLayout &layout,
                                    const BundleAttributesMap &attributes) const {
  layout.Validate();

  GroundTruth ground_truth;
  ground_truth.reference =
      io::ReferenceSpace::FromFile(layout.reference_anatomy);
  ground_truth.bundles =
      LoadBundles(layout.bundles_dir, layout.bundle_masks_dir, attributes,
                  ground_truth.reference);
  ground_truth.rois = LoadRois(layout.rois_dir, ground_truth.reference);
  return ground_truth;
}

std::vector<ReferenceBundle> GroundTruthLoader::LoadBundles(
    const std::string &bundles_dir, const std::string &bundle_masks_dir,
    const BundleAttributesMap &attributes,
    const io::ReferenceSpace &reference) const {
  ScoringLogger logger("GroundTruthLoader", m_config.verbose);

  const auto files = ListSortedFiles(bundles_dir);

  // Fail before any classification work
  for (const auto &path : files) {
    const std::string filename = fs::path(path).filename().string();
    if (attributes.find(filename) == attributes.end()) {
      throw MissingAttributeException(filename);
    }
  }

  std::vector<ReferenceBundle> bundles;
  bundles.reserve(files.size());

  for (const auto &path : files) {
    const std::string filename = fs::path(path).filename().string();
    const BundleAttributes &attribs = attributes.at(filename);
    const std::string name = StemOf(filename);

    io::TractogramReader reader;
    if (!reader.Open(path)) {
      throw UnsupportedFormatException(path);
    }
    io::TractogramReader::ReadOptions options;
    options.attributes.orientation = attribs.orientation;
    const io::Tractogram tractogram = reader.Read(reference, options);

    fs::path mask_path = fs::path(bundle_masks_dir) / (name + ".nii.gz");
    std::error_code ec;
    if (!fs::is_regular_file(mask_path, ec)) {
      mask_path = fs::path(bundle_masks_dir) / (name + ".nii");
    }
    if (!fs::is_regular_file(mask_path, ec)) {
      throw FileNotFoundException(
          (fs::path(bundle_masks_dir) / (name + ".nii.gz")).string());
    }

    io::MaskPointer mask = io::ReadMask(mask_path.string());
    if (!reference.SameGrid(mask)) {
      throw VolumeIOException(mask_path.string(), "LoadBundles",
                              "mask grid differs from the reference anatomy");
    }

    ReferenceBundle bundle = BuildBundle(name, attribs.cluster_threshold,
                                         tractogram.GetStreamlines(), mask);
    bundle.filename = filename;

    logger.Info("Bundle " + name + ": " + std::to_string(tractogram.Size()) +
                " streamlines, " + std::to_string(bundle.cluster_map.Size()) +
                " clusters, " + std::to_string(bundle.mask_voxels) +
                " mask voxels");

    bundles.push_back(std::move(bundle));
  }

  logger.Info("Loaded " + std::to_string(bundles.size()) +
              " reference bundles");
  return bundles;
}

std::vector<RegionOfInterest>
GroundTruthLoader::LoadRois(const std::string &rois_dir,
                            const io::ReferenceSpace &reference) const {
  ScoringLogger logger("GroundTruthLoader", m_config.verbose);

  std::vector<RegionOfInterest> rois;
  for (const auto &path : ListSortedFiles(rois_dir)) {
    RegionOfInterest roi;
    roi.name = StemOf(path);
    roi.mask = io::ReadMask(path);
    if (!reference.SameGrid(roi.mask)) {
      throw VolumeIOException(path, "LoadRois",
                              "ROI grid differs from the reference anatomy");
    }
    roi.mask_voxels = io::CountNonZero(roi.mask);
    if (roi.mask_voxels == 0) {
      logger.Warning("ROI " + roi.name + " is empty");
    }
    rois.push_back(std::move(roi));
  }

  logger.Info("Loaded " + std::to_string(rois.size()) + " ROIs");
  return rois;
}

ReferenceBundle GroundTruthLoader::BuildBundle(
    const std::string &name, double acceptance_threshold,
    const std::vector<io::Streamline> &streamlines,
    io::MaskPointer mask) const {
  ReferenceBundle bundle;
  bundle.name = name;
  bundle.filename = name;
  bundle.acceptance_threshold = acceptance_threshold;

  std::vector<io::Streamline> resampled =
      ResampleStreamlines(streamlines, m_config.nb_points_resample,
                          m_config.ResolvedThreadCount());

  QuickBundles clusterer(m_config.gt_cluster_threshold);
  bundle.cluster_map = clusterer.Cluster(resampled);
  bundle.cluster_map.SetReferenceData(std::move(resampled));

  bundle.mask = mask;
  bundle.mask_voxels = io::CountNonZero(mask);
  return bundle;
}

std::vector<std::string>
GroundTruthLoader::ListSortedFiles(const std::string &dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw FileNotFoundException(dir);
  }

  std::vector<std::string> files;
  for (const auto &entry : fs::directory_iterator(dir)) {
    if (entry.is_regular_file())
      files.push_back(entry.path().string());
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::string GroundTruthLoader::StemOf(const std::string &filename) {
  std::string name = fs::path(filename).filename().string();
  const std::string lower = compat::to_lower(name);

  for (const std::string extension :
       {".nii.gz", ".trk.gz", ".nii", ".trk", ".tck", ".vtk"}) {
    if (compat::ends_with(lower, extension)) {
      return name.substr(0, name.size() - extension.size());
    }
  }
  return fs::path(name).stem().string();
}

} // namespace scoring
} // namespace tractoscore
