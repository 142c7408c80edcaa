/**
 * @file SubsetWriter.h
 * @brief Writing classified subsets of a submission next to each other
 */

#ifndef SUBSET_WRITER_H
#define SUBSET_WRITER_H

#include "../io/StreamlineIO.h"
#include "ScoringConfig.h"

#include <string>
#include <vector>

namespace tractoscore {
namespace scoring {

/**
 * @brief Writes `{out_dir}/{base_name}_{tag}.{out_tract_type}` files
 */
class SubsetWriter {
private:
  const io::Tractogram &m_tractogram;
  const io::ReferenceSpace &m_space;
  PersistenceOptions m_options;

public:
  SubsetWriter(const io::Tractogram &tractogram,
               const io::ReferenceSpace &space,
               const PersistenceOptions &options);

  std::string PathFor(const std::string &tag) const;

  /// Returns the written path, or an empty string when indices is empty
  std::string WriteSubset(const std::string &tag,
                          const std::vector<size_t> &indices) const;
};

} // namespace scoring
} // namespace tractoscore

#endif // SUBSET_WRITER_H
