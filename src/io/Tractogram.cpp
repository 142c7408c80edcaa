/**
 * @file Tractogram.cpp
 * @brief Implementation of the Tractogram container
 */

#include "StreamlineIO.h"

#include <sstream>
#include <stdexcept>

namespace tractoscore {
namespace io {

namespace {
const std::vector<float> kNoValues;
}

Tractogram::Tractogram(std::vector<Streamline> streamlines) {
  m_streamlines.reserve(streamlines.size());
  for (auto &streamline : streamlines) {
    AddStreamline(std::move(streamline));
  }
}

const Streamline &Tractogram::At(size_t index) const {
  if (index >= m_streamlines.size()) {
    std::stringstream ss;
    ss << "streamline index " << index << " out of range (size "
       << m_streamlines.size() << ")";
    throw std::out_of_range(ss.str());
  }
  return m_streamlines[index];
}

size_t Tractogram::GetTotalPoints() const {
  size_t total = 0;
  for (const auto &streamline : m_streamlines)
    total += streamline.size();
  return total;
}

void Tractogram::SetPropertyNames(const std::vector<std::string> &names) {
  if (!m_streamlines.empty() && names.size() != m_property_names.size()) {
    throw std::logic_error(
        "property names must be set before adding streamlines");
  }
  m_property_names = names;
}

void Tractogram::SetScalarNames(const std::vector<std::string> &names) {
  if (!m_streamlines.empty() && names.size() != m_scalar_names.size()) {
    throw std::logic_error(
        "scalar names must be set before adding streamlines");
  }
  m_scalar_names = names;
}

const std::vector<float> &Tractogram::GetProperties(size_t index) const {
  if (m_property_names.empty())
    return kNoValues;
  return m_properties.at(index);
}

const std::vector<float> &Tractogram::GetScalars(size_t index) const {
  if (m_scalar_names.empty())
    return kNoValues;
  return m_scalars.at(index);
}

void Tractogram::AddStreamline(Streamline streamline,
                               std::vector<float> properties,
                               std::vector<float> scalars) {
  if (streamline.empty()) {
    throw std::invalid_argument("streamline must contain at least one point");
  }

  if (properties.size() != m_property_names.size()) {
    throw std::invalid_argument("expected " +
                                std::to_string(m_property_names.size()) +
                                " properties per streamline");
  }

  if (scalars.size() != streamline.size() * m_scalar_names.size()) {
    throw std::invalid_argument("expected " +
                                std::to_string(m_scalar_names.size()) +
                                " scalars per point");
  }

  if (!m_property_names.empty())
    m_properties.push_back(std::move(properties));
  if (!m_scalar_names.empty())
    m_scalars.push_back(std::move(scalars));
  m_streamlines.push_back(std::move(streamline));
}

void Tractogram::Reserve(size_t count) {
  m_streamlines.reserve(count);
  if (!m_property_names.empty())
    m_properties.reserve(count);
  if (!m_scalar_names.empty())
    m_scalars.reserve(count);
}

void Tractogram::Clear() {
  m_streamlines.clear();
  m_properties.clear();
  m_scalars.clear();
}

Tractogram Tractogram::Subset(const std::vector<size_t> &indices) const {
  Tractogram subset;
  subset.m_property_names = m_property_names;
  subset.m_scalar_names = m_scalar_names;
  subset.Reserve(indices.size());

  for (size_t index : indices) {
    subset.AddStreamline(At(index), GetProperties(index), GetScalars(index));
  }
  return subset;
}

} // namespace io
} // namespace tractoscore
