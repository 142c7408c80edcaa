/**
 * @file Classification.cpp
 * @brief Partition bookkeeping for classified streamlines
 */

#include "Classification.h"

#include "../common/TractoScoreExceptions.h"

#include <stdexcept>

namespace tractoscore {
namespace scoring {

std::string NoConnectionReasonToString(NoConnectionReason reason) {
  switch (reason) {
  case NoConnectionReason::TooShort:
    return "TooShort";
  case NoConnectionReason::IsolatedCluster:
    return "IsolatedCluster";
  case NoConnectionReason::SingletonRoiPair:
    return "SingletonRoiPair";
  case NoConnectionReason::NoEndpointRoi:
    return "NoEndpointRoi";
  default:
    return "Unknown";
  }
}

void ClassificationResult::Assign(size_t index,
                                  const Classification &classification) {
  if (index >= m_labels.size()) {
    throw PartitionConsistencyException(
        "streamline index " + std::to_string(index) + " out of range",
        m_labels.size());
  }
  if (m_labels[index].has_value()) {
    throw PartitionConsistencyException(
        "streamline " + std::to_string(index) + " classified twice",
        m_labels.size());
  }
  m_labels[index] = classification;
}

bool ClassificationResult::IsAssigned(size_t index) const {
  return index < m_labels.size() && m_labels[index].has_value();
}

const Classification &ClassificationResult::Get(size_t index) const {
  if (!IsAssigned(index)) {
    throw std::out_of_range("streamline " + std::to_string(index) +
                            " has no classification");
  }
  return *m_labels[index];
}

namespace {

template <typename Tag>
std::vector<size_t>
IndicesOf(const std::vector<std::optional<Classification>> &labels) {
  std::vector<size_t> indices;
  for (size_t i = 0; i < labels.size(); ++i) {
    if (labels[i] && std::holds_alternative<Tag>(*labels[i]))
      indices.push_back(i);
  }
  return indices;
}

} // namespace

std::vector<size_t> ClassificationResult::ValidIndices() const {
  return IndicesOf<ValidConnection>(m_labels);
}

std::vector<size_t> ClassificationResult::InvalidIndices() const {
  return IndicesOf<InvalidConnection>(m_labels);
}

std::vector<size_t> ClassificationResult::NoConnectionIndices() const {
  return IndicesOf<NoConnection>(m_labels);
}

size_t ClassificationResult::CountValid() const { return ValidIndices().size(); }

size_t ClassificationResult::CountInvalid() const {
  return InvalidIndices().size();
}

size_t ClassificationResult::CountNoConnection() const {
  return NoConnectionIndices().size();
}

size_t ClassificationResult::CountReason(NoConnectionReason reason) const {
  size_t count = 0;
  for (const auto &label : m_labels) {
    if (!label)
      continue;
    if (const auto *nc = std::get_if<NoConnection>(&*label)) {
      if (nc->reason == reason)
        ++count;
    }
  }
  return count;
}

void ClassificationResult::Validate() const {
  size_t unassigned = 0;
  size_t first_unassigned = 0;
  for (size_t i = 0; i < m_labels.size(); ++i) {
    if (!m_labels[i]) {
      if (unassigned == 0)
        first_unassigned = i;
      ++unassigned;
    }
  }

  if (unassigned > 0) {
    throw PartitionConsistencyException(
        std::to_string(unassigned) +
            " streamlines unclassified (first: " +
            std::to_string(first_unassigned) + ")",
        m_labels.size());
  }

  if (CountValid() + CountInvalid() + CountNoConnection() != m_labels.size()) {
    throw PartitionConsistencyException("class counts do not sum to total",
                                        m_labels.size());
  }
}

} // namespace scoring
} // namespace tractoscore
