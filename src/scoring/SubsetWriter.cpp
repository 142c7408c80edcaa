/**
 * @file SubsetWriter.cpp
 * @brief Subset persistence
 */

#include "SubsetWriter.h"

#include "../common/CompatUtils.h"
#include "../common/TractoScoreExceptions.h"

#include <filesystem>

namespace fs = std::filesystem;

namespace tractoscore {
namespace scoring {

SubsetWriter::SubsetWriter(const io::Tractogram &tractogram,
                           const io::ReferenceSpace &space,
                           const PersistenceOptions &options)
    : m_tractogram(tractogram), m_space(space), m_options(options) {
  m_options.Validate();
}

std::string SubsetWriter::PathFor(const std::string &tag) const {
  const std::string filename = m_options.base_name + "_" + tag + "." +
                               compat::to_lower(m_options.out_tract_type);
  return (fs::path(m_options.out_dir) / filename).string();
}

std::string SubsetWriter::WriteSubset(const std::string &tag,
                                      const std::vector<size_t> &indices) const {
  if (indices.empty())
    return "";

  std::error_code ec;
  fs::create_directories(m_options.out_dir, ec);
  if (ec) {
    throw StreamlineIOException(m_options.out_dir, "CreateDirectory",
                                ec.message());
  }

  const std::string path = PathFor(tag);
  io::TractogramWriter writer;
  if (!writer.Open(path)) {
    throw UnsupportedFormatException(path);
  }
  writer.Write(m_tractogram.Subset(indices), m_space);
  return path;
}

} // namespace scoring
} // namespace tractoscore
