/**
 * @file StreamlineUtils.cpp
 * @brief File helpers and one-call load/save for streamline files
 */

#include "../common/CompatUtils.h"
#include "../common/TractoScoreExceptions.h"
#include "StreamlineIO.h"

#include <cmath>
#include <filesystem>

namespace tractoscore {
namespace io {
namespace StreamlineUtils {

bool FileExists(const std::string &filename) {
  std::error_code ec;
  return std::filesystem::is_regular_file(filename, ec);
}

std::string GetFileExtension(const std::string &filename) {
  const std::string lower_name = compat::to_lower(filename);
  if (compat::ends_with(lower_name, ".trk.gz")) {
    return ".trk.gz";
  }

  const auto extension = std::filesystem::path(filename).extension().string();
  return compat::to_lower(extension);
}

std::string RemoveExtension(const std::string &filename) {
  const std::string extension = GetFileExtension(filename);
  if (extension.empty())
    return filename;
  return filename.substr(0, filename.size() - extension.size());
}

std::string GetBaseName(const std::string &filename) {
  return RemoveExtension(std::filesystem::path(filename).filename().string());
}

std::string AxisCodes(const Matrix4 &affine) {
  static const char positive[3] = {'R', 'A', 'S'};
  static const char negative[3] = {'L', 'P', 'I'};

  std::string codes;
  for (int c = 0; c < 3; ++c) {
    int best_row = 0;
    for (int r = 1; r < 3; ++r) {
      if (std::abs(affine[r][c]) > std::abs(affine[best_row][c]))
        best_row = r;
    }
    codes.push_back(affine[best_row][c] >= 0.0 ? positive[best_row]
                                               : negative[best_row]);
  }
  return codes;
}

Tractogram LoadTractogram(const std::string &filename,
                          const ReferenceSpace &space,
                          const SubmissionAttributes &attributes) {
  TractogramReader reader;
  if (!reader.Open(filename)) {
    throw UnsupportedFormatException(filename);
  }

  TractogramReader::ReadOptions options;
  options.attributes = attributes;
  return reader.Read(space, options);
}

void SaveTractogram(const Tractogram &tractogram, const std::string &filename,
                    const ReferenceSpace &space) {
  TractogramWriter writer;
  if (!writer.Open(filename)) {
    throw UnsupportedFormatException(filename);
  }
  writer.Write(tractogram, space);
}

} // namespace StreamlineUtils
} // namespace io
} // namespace tractoscore
