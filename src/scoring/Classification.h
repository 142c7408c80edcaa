/**
 * @file Classification.h
 * @brief Per-streamline outcome of a scoring run
 *
 * Every submitted streamline ends in exactly one of three classes: a valid
 * connection to a reference bundle, an invalid connection between two ROIs,
 * or no connection (with the reason it was rejected).
 */

#ifndef CLASSIFICATION_H
#define CLASSIFICATION_H

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tractoscore {
namespace scoring {

/**
 * @brief Unordered ROI pair stored as (min, max)
 */
struct RoiPair {
  size_t first = 0;
  size_t second = 0;

  RoiPair() = default;
  RoiPair(size_t a, size_t b)
      : first(a < b ? a : b), second(a < b ? b : a) {}

  /// "<first>_<second>"
  std::string Id() const {
    return std::to_string(first) + "_" + std::to_string(second);
  }

  bool operator==(const RoiPair &other) const {
    return first == other.first && second == other.second;
  }
  bool operator!=(const RoiPair &other) const { return !(*this == other); }
  bool operator<(const RoiPair &other) const {
    return first < other.first ||
           (first == other.first && second < other.second);
  }
};

enum class NoConnectionReason {
  TooShort,         // Shorter than the length threshold
  IsolatedCluster,  // Alone in its candidate cluster
  SingletonRoiPair, // ROI pair shared by too few streamlines
  NoEndpointRoi     // An endpoint lies in no ROI
};

std::string NoConnectionReasonToString(NoConnectionReason reason);

struct ValidConnection {
  size_t bundle_index = 0;
};

struct InvalidConnection {
  RoiPair pair;
};

struct NoConnection {
  NoConnectionReason reason = NoConnectionReason::TooShort;
};

using Classification =
    std::variant<ValidConnection, InvalidConnection, NoConnection>;

/**
 * @brief Classification of every streamline of a submission
 *
 * Assign() refuses a second classification of the same streamline and
 * Validate() refuses unclassified streamlines, both with
 * PartitionConsistencyException.
 */
class ClassificationResult {
private:
  std::vector<std::optional<Classification>> m_labels;

public:
  ClassificationResult() = default;
  explicit ClassificationResult(size_t count) : m_labels(count) {}

  size_t Size() const { return m_labels.size(); }

  void Assign(size_t index, const Classification &classification);
  bool IsAssigned(size_t index) const;
  const Classification &Get(size_t index) const;

  std::vector<size_t> ValidIndices() const;
  std::vector<size_t> InvalidIndices() const;
  std::vector<size_t> NoConnectionIndices() const;

  size_t CountValid() const;
  size_t CountInvalid() const;
  size_t CountNoConnection() const;
  size_t CountReason(NoConnectionReason reason) const;

  void Validate() const;
};

} // namespace scoring
} // namespace tractoscore

#endif // CLASSIFICATION_H
