/**
 * @file TractogramReader.cpp
 * @brief Implementation of streamline file reading
 */

#include "../common/CompatUtils.h"
#include "../common/TractoScoreExceptions.h"
#include "ByteOrder.h"
#include "StreamlineIO.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <zlib.h>

namespace tractoscore {
namespace io {

namespace {

/**
 * @brief Sequential access to a text/binary mixed buffer (VTK and TCK
 * headers)
 */
class ByteCursor {
private:
  const std::vector<uint8_t> &m_data;
  size_t m_pos = 0;

public:
  explicit ByteCursor(const std::vector<uint8_t> &data) : m_data(data) {}

  bool AtEnd() const { return m_pos >= m_data.size(); }
  size_t Position() const { return m_pos; }
  size_t Remaining() const { return m_data.size() - m_pos; }
  const uint8_t *Current() const { return m_data.data() + m_pos; }
  void Skip(size_t count) { m_pos = std::min(m_data.size(), m_pos + count); }

  std::string ReadLine() {
    std::string line;
    while (m_pos < m_data.size() && m_data[m_pos] != '\n') {
      line.push_back(static_cast<char>(m_data[m_pos]));
      ++m_pos;
    }
    if (m_pos < m_data.size())
      ++m_pos; // consume '\n'
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    return line;
  }

  std::string NextToken() {
    while (m_pos < m_data.size() && std::isspace(m_data[m_pos]))
      ++m_pos;
    std::string token;
    while (m_pos < m_data.size() && !std::isspace(m_data[m_pos])) {
      token.push_back(static_cast<char>(m_data[m_pos]));
      ++m_pos;
    }
    return token;
  }

  // Binary payloads start right after the single newline ending the keyword
  // line
  void SkipLineEnd() {
    while (m_pos < m_data.size() &&
           (m_data[m_pos] == ' ' || m_data[m_pos] == '\r'))
      ++m_pos;
    if (m_pos < m_data.size() && m_data[m_pos] == '\n')
      ++m_pos;
  }
};

long ParseInteger(const std::string &token, const std::string &filename,
                  const std::string &what) {
  try {
    size_t consumed = 0;
    long value = std::stol(token, &consumed);
    if (consumed != token.size())
      throw std::invalid_argument(token);
    return value;
  } catch (const std::exception &) {
    throw CorruptedFileException(filename, "invalid " + what + " '" + token +
                                               "'");
  }
}

// Header counts only size reservations up to what the payload can hold
long ParseCount(const std::string &token, const std::string &filename,
                const std::string &what) {
  const long value = ParseInteger(token, filename, what);
  if (value < 0) {
    throw CorruptedFileException(filename, "negative " + what + " " + token);
  }
  return value;
}

size_t ReservationFor(long count, size_t remaining_bytes, size_t record_size) {
  return std::min(static_cast<size_t>(count), remaining_bytes / record_size);
}

double ParseReal(const std::string &token, const std::string &filename) {
  try {
    size_t consumed = 0;
    double value = std::stod(token, &consumed);
    if (consumed != token.size())
      throw std::invalid_argument(token);
    return value;
  } catch (const std::exception &) {
    throw CorruptedFileException(filename, "invalid coordinate '" + token +
                                               "'");
  }
}

std::string FixedString(const char *field, size_t length) {
  return std::string(field, strnlen(field, length));
}

} // namespace

// ===== TractogramReader Implementation =====

TractogramReader::TractogramReader(const std::string &filename)
    : m_filename(filename) {
  Open(filename);
}

bool TractogramReader::Open(const std::string &filename) {
  m_filename = filename;
  m_format = DetectFormat(filename);
  m_is_compressed = IsCompressed(filename);

  if (m_format == TractogramFormat::UNKNOWN) {
    return false;
  }

  // Only TrackVis files are read through gzip
  if (m_is_compressed && m_format != TractogramFormat::TRK) {
    m_format = TractogramFormat::UNKNOWN;
    return false;
  }

  return true;
}

void TractogramReader::Close() {
  m_filename.clear();
  m_format = TractogramFormat::UNKNOWN;
  m_is_compressed = false;
}

TractogramFormat TractogramReader::DetectFormat(const std::string &filename) {
  std::string lower_name = compat::to_lower(filename);

  if (compat::ends_with(lower_name, ".tck")) {
    return TractogramFormat::TCK;
  } else if (compat::ends_with(lower_name, ".trk") ||
             compat::ends_with(lower_name, ".trk.gz")) {
    return TractogramFormat::TRK;
  } else if (compat::ends_with(lower_name, ".vtk")) {
    return TractogramFormat::VTK;
  }

  return TractogramFormat::UNKNOWN;
}

bool TractogramReader::IsCompressed(const std::string &filename) {
  return compat::ends_with(compat::to_lower(filename), ".gz");
}

Tractogram TractogramReader::Read(const ReferenceSpace &space,
                                  const ReadOptions &options) const {
  if (m_format == TractogramFormat::UNKNOWN) {
    throw UnsupportedFormatException(
        m_filename, "expected one of .tck, .trk, .trk.gz, .vtk");
  }

  if (!StreamlineUtils::FileExists(m_filename)) {
    throw FileNotFoundException(m_filename);
  }

  if (!space.IsValid()) {
    throw StreamlineIOException(m_filename, "Read",
                                "reference space is not initialized");
  }

  std::vector<uint8_t> data = ReadFileBytes();

  Tractogram tractogram;
  switch (m_format) {
  case TractogramFormat::TCK:
    tractogram = ReadTck(data, space, options);
    break;
  case TractogramFormat::TRK:
    tractogram = ReadTrk(std::move(data), space, options);
    break;
  case TractogramFormat::VTK:
    tractogram = ReadVtk(data, space, options);
    break;
  default:
    throw UnsupportedFormatException(m_filename);
  }

  if (options.verbose) {
    std::cout << "[TractoScore] Loaded " << tractogram.Size()
              << " streamlines (" << tractogram.GetTotalPoints()
              << " points) from " << m_filename << std::endl;
  }

  return tractogram;
}

std::vector<uint8_t> TractogramReader::ReadFileBytes() const {
  if (m_is_compressed) {
    return DecompressGzip(m_filename);
  }

  std::ifstream file(m_filename, std::ios::binary);
  if (!file.is_open()) {
    throw StreamlineIOException(m_filename, "Open", "cannot open file");
  }

  file.seekg(0, std::ios::end);
  const std::streamoff file_size = file.tellg();
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> file_data(static_cast<size_t>(file_size));
  if (file_size > 0 &&
      !file.read(reinterpret_cast<char *>(file_data.data()), file_size)) {
    throw CorruptedFileException(m_filename, "short read");
  }

  return file_data;
}

std::vector<uint8_t>
TractogramReader::DecompressGzip(const std::string &filename) const {
  gzFile file = gzopen(filename.c_str(), "rb");
  if (!file) {
    throw StreamlineIOException(filename, "Open", "cannot open gzip stream");
  }

  std::vector<uint8_t> data;
  const unsigned int buffer_size = 1024 * 1024; // 1MB buffer
  std::vector<uint8_t> buffer(buffer_size);

  int bytes_read;
  while ((bytes_read = gzread(file, buffer.data(), buffer_size)) > 0) {
    data.insert(data.end(), buffer.begin(), buffer.begin() + bytes_read);
  }

  gzclose(file);

  if (bytes_read < 0) {
    throw CorruptedFileException(filename, "gzip decompression failed");
  }

  return data;
}

// ===== MRtrix .tck =====

Tractogram TractogramReader::ReadTck(const std::vector<uint8_t> &data,
                                     const ReferenceSpace &space,
                                     const ReadOptions &options) const {
  ByteCursor cursor(data);

  if (cursor.ReadLine() != "mrtrix tracks") {
    throw CorruptedFileException(m_filename, "missing 'mrtrix tracks' magic");
  }

  std::map<std::string, std::string> fields;
  bool found_end = false;
  while (!cursor.AtEnd()) {
    const std::string line = cursor.ReadLine();
    if (line == "END") {
      found_end = true;
      break;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    fields[compat::trim(line.substr(0, colon))] =
        compat::trim(line.substr(colon + 1));
  }

  if (!found_end) {
    throw CorruptedFileException(m_filename, "header has no END line");
  }

  // "file: . <offset>"
  auto file_field = fields.find("file");
  if (file_field == fields.end()) {
    throw CorruptedFileException(m_filename, "header has no 'file' entry");
  }
  std::istringstream file_spec(file_field->second);
  std::string dot;
  size_t offset = 0;
  if (!(file_spec >> dot >> offset) || dot != ".") {
    throw UnsupportedFormatException(m_filename,
                                     "only inline track data is supported");
  }

  const std::string datatype =
      fields.count("datatype") ? fields["datatype"] : std::string("Float32LE");
  size_t value_size = 0;
  bool little_endian = true;
  if (datatype == "Float32LE" || datatype == "Float32BE") {
    value_size = 4;
  } else if (datatype == "Float64LE" || datatype == "Float64BE") {
    value_size = 8;
  } else {
    throw UnsupportedFormatException(m_filename, "tck datatype " + datatype);
  }
  little_endian = compat::ends_with(datatype, "LE");

  if (offset > data.size()) {
    throw CorruptedFileException(m_filename, "data offset beyond end of file");
  }

  auto load = [&](size_t position) -> double {
    if (value_size == 4)
      return byteorder::Load<float>(data.data() + position, little_endian);
    return byteorder::Load<double>(data.data() + position, little_endian);
  };

  const size_t triplet_size = 3 * value_size;

  Tractogram tractogram;
  if (fields.count("count")) {
    // Each streamline needs at least one point and its NaN delimiter
    const long count = ParseCount(fields["count"], m_filename, "count");
    tractogram.Reserve(
        ReservationFor(count, data.size() - offset, 2 * triplet_size));
  }

  Streamline current;
  size_t skipped_empty = 0;
  size_t position = offset;
  bool terminated = false;

  while (position + triplet_size <= data.size()) {
    const double x = load(position);
    const double y = load(position + value_size);
    const double z = load(position + 2 * value_size);
    position += triplet_size;

    if (std::isinf(x) || std::isinf(y) || std::isinf(z)) {
      terminated = true;
      break;
    }

    if (std::isnan(x) || std::isnan(y) || std::isnan(z)) {
      if (current.empty()) {
        ++skipped_empty;
      } else {
        tractogram.AddStreamline(std::move(current));
        current = Streamline();
      }
      continue;
    }

    current.push_back(space.WorldToVoxel(
        {static_cast<float>(x), static_cast<float>(y), static_cast<float>(z)}));
  }

  if (!current.empty()) {
    tractogram.AddStreamline(std::move(current));
  }

  if (options.verbose) {
    if (!terminated)
      std::cerr << "[TractoScore] Warning: " << m_filename
                << " has no end-of-data marker" << std::endl;
    if (skipped_empty > 0)
      std::cerr << "[TractoScore] Warning: skipped " << skipped_empty
                << " empty streamlines in " << m_filename << std::endl;
  }

  return tractogram;
}

// ===== TrackVis .trk =====

Tractogram TractogramReader::ReadTrk(std::vector<uint8_t> data,
                                     const ReferenceSpace &space,
                                     const ReadOptions &options) const {
  if (data.size() < sizeof(TrackVisHeader)) {
    throw CorruptedFileException(m_filename, "file shorter than trk header");
  }

  TrackVisHeader header;
  std::memcpy(&header, data.data(), sizeof(TrackVisHeader));

  if (std::strncmp(header.id_string, "TRACK", 5) != 0) {
    throw CorruptedFileException(m_filename, "missing 'TRACK' magic");
  }

  // Check endianness
  bool little_endian = byteorder::IsLittleEndianHost();
  if (header.hdr_size != 1000) {
    int32_t swapped = header.hdr_size;
    byteorder::SwapEndianness(swapped);
    if (swapped != 1000) {
      throw CorruptedFileException(m_filename, "hdr_size is not 1000");
    }
    little_endian = !little_endian;

    for (int i = 0; i < 3; ++i) {
      byteorder::SwapEndianness(header.dim[i]);
      byteorder::SwapEndianness(header.voxel_size[i]);
      byteorder::SwapEndianness(header.origin[i]);
    }
    byteorder::SwapEndianness(header.n_scalars);
    byteorder::SwapEndianness(header.n_properties);
    for (auto &row : header.vox_to_ras)
      for (auto &value : row)
        byteorder::SwapEndianness(value);
    byteorder::SwapEndianness(header.n_count);
    byteorder::SwapEndianness(header.version);
    byteorder::SwapEndianness(header.hdr_size);
  }

  if (header.n_scalars < 0 || header.n_properties < 0) {
    throw CorruptedFileException(m_filename, "negative scalar/property count");
  }

  for (int i = 0; i < 3; ++i) {
    if (!(header.voxel_size[i] > 0.0f)) {
      throw CorruptedFileException(m_filename, "non-positive voxel size");
    }
  }

  std::vector<std::string> scalar_names;
  for (int i = 0; i < header.n_scalars; ++i) {
    scalar_names.push_back(i < 10 ? FixedString(header.scalar_name[i], 20)
                                  : "scalar_" + std::to_string(i));
  }
  std::vector<std::string> property_names;
  for (int i = 0; i < header.n_properties; ++i) {
    property_names.push_back(i < 10
                                 ? FixedString(header.property_name[i], 20)
                                 : "property_" + std::to_string(i));
  }

  // A zero vox_to_ras means the trk grid is the reference grid
  const bool has_affine = header.vox_to_ras[3][3] != 0.0f;

  auto to_reference_voxel = [&](float mx, float my, float mz) -> Point3 {
    // voxmm has its origin at the corner of voxel 0
    const double trk_voxel[3] = {mx / header.voxel_size[0] - 0.5,
                                 my / header.voxel_size[1] - 0.5,
                                 mz / header.voxel_size[2] - 0.5};
    if (!has_affine) {
      return {static_cast<float>(trk_voxel[0]),
              static_cast<float>(trk_voxel[1]),
              static_cast<float>(trk_voxel[2])};
    }

    Point3 ras;
    for (int r = 0; r < 3; ++r) {
      double value = header.vox_to_ras[r][3];
      for (int c = 0; c < 3; ++c)
        value += header.vox_to_ras[r][c] * trk_voxel[c];
      ras[r] = static_cast<float>(value);
    }
    return space.WorldToVoxel(ras);
  };

  Tractogram tractogram;
  tractogram.SetScalarNames(scalar_names);
  tractogram.SetPropertyNames(property_names);
  if (header.n_count < 0) {
    throw CorruptedFileException(m_filename,
                                 "negative streamline count " +
                                     std::to_string(header.n_count));
  }

  const size_t values_per_point = 3 + static_cast<size_t>(header.n_scalars);
  size_t position = sizeof(TrackVisHeader);

  if (header.n_count > 0 && data.size() > position) {
    const size_t min_record =
        sizeof(int32_t) +
        (values_per_point + static_cast<size_t>(header.n_properties)) *
            sizeof(float);
    tractogram.Reserve(
        ReservationFor(header.n_count, data.size() - position, min_record));
  }

  while (position + sizeof(int32_t) <= data.size()) {
    if (header.n_count > 0 &&
        tractogram.Size() >= static_cast<size_t>(header.n_count))
      break;

    const int32_t n_points =
        byteorder::Load<int32_t>(data.data() + position, little_endian);
    position += sizeof(int32_t);

    if (n_points <= 0) {
      throw CorruptedFileException(m_filename,
                                   "streamline with no points at streamline " +
                                       std::to_string(tractogram.Size()));
    }

    const size_t needed =
        (static_cast<size_t>(n_points) * values_per_point +
         static_cast<size_t>(header.n_properties)) *
        sizeof(float);
    if (position + needed > data.size()) {
      throw CorruptedFileException(m_filename,
                                   "truncated data at streamline " +
                                       std::to_string(tractogram.Size()));
    }

    Streamline streamline;
    streamline.reserve(n_points);
    std::vector<float> scalars;
    scalars.reserve(static_cast<size_t>(n_points) * header.n_scalars);

    for (int32_t p = 0; p < n_points; ++p) {
      const float mx =
          byteorder::Load<float>(data.data() + position, little_endian);
      const float my =
          byteorder::Load<float>(data.data() + position + 4, little_endian);
      const float mz =
          byteorder::Load<float>(data.data() + position + 8, little_endian);
      position += 3 * sizeof(float);
      streamline.push_back(to_reference_voxel(mx, my, mz));

      for (int s = 0; s < header.n_scalars; ++s) {
        scalars.push_back(
            byteorder::Load<float>(data.data() + position, little_endian));
        position += sizeof(float);
      }
    }

    std::vector<float> properties;
    properties.reserve(header.n_properties);
    for (int p = 0; p < header.n_properties; ++p) {
      properties.push_back(
          byteorder::Load<float>(data.data() + position, little_endian));
      position += sizeof(float);
    }

    tractogram.AddStreamline(std::move(streamline), std::move(properties),
                             std::move(scalars));
  }

  if (header.n_count > 0 &&
      tractogram.Size() != static_cast<size_t>(header.n_count)) {
    throw CorruptedFileException(m_filename,
                                 "header announces " +
                                     std::to_string(header.n_count) +
                                     " streamlines, found " +
                                     std::to_string(tractogram.Size()));
  }

  if (options.verbose && data.size() > position) {
    std::cerr << "[TractoScore] Warning: " << (data.size() - position)
              << " trailing bytes ignored in " << m_filename << std::endl;
  }

  return tractogram;
}

// ===== Legacy VTK polydata =====

Tractogram TractogramReader::ReadVtk(const std::vector<uint8_t> &data,
                                     const ReferenceSpace &space,
                                     const ReadOptions &options) const {
  const std::string orientation =
      compat::to_upper(compat::trim(options.attributes.orientation));
  if (orientation != "RAS" && orientation != "LPS") {
    throw ConfigurationException(
        "orientation",
        options.attributes.orientation.empty() ? "<missing>"
                                               : options.attributes.orientation,
        "RAS or LPS for .vtk submissions");
  }

  ByteCursor cursor(data);

  if (!compat::starts_with(cursor.ReadLine(), "# vtk DataFile")) {
    throw CorruptedFileException(m_filename, "missing vtk DataFile magic");
  }
  cursor.ReadLine(); // title

  const std::string encoding = compat::to_upper(compat::trim(cursor.ReadLine()));
  if (encoding != "ASCII" && encoding != "BINARY") {
    throw CorruptedFileException(m_filename, "unknown encoding " + encoding);
  }
  const bool binary = encoding == "BINARY";

  if (cursor.NextToken() != "DATASET" || cursor.NextToken() != "POLYDATA") {
    throw UnsupportedFormatException(m_filename,
                                     "only DATASET POLYDATA is supported");
  }

  std::vector<Point3> points;
  std::vector<std::vector<long>> lines;
  bool has_lines = false;

  while (!cursor.AtEnd()) {
    const std::string keyword = compat::to_upper(cursor.NextToken());
    if (keyword.empty())
      break;

    if (keyword == "POINTS") {
      const long count = ParseCount(cursor.NextToken(), m_filename, "count");
      const std::string type = compat::to_lower(cursor.NextToken());
      if (type != "float" && type != "double") {
        throw UnsupportedFormatException(m_filename, "point type " + type);
      }
      const size_t value_size = type == "float" ? 4 : 8;

      if (binary) {
        cursor.SkipLineEnd();
        if (static_cast<size_t>(count) > cursor.Remaining() / (3 * value_size)) {
          throw CorruptedFileException(m_filename, "truncated POINTS");
        }
        points.reserve(static_cast<size_t>(count));
      } else {
        // Three values with separators take at least six characters
        points.reserve(ReservationFor(count, cursor.Remaining(), 6));
      }

      for (long i = 0; i < count; ++i) {
        double xyz[3];
        for (int d = 0; d < 3; ++d) {
          if (binary) {
            // Legacy VTK binary data is big-endian
            xyz[d] = value_size == 4
                         ? byteorder::Load<float>(cursor.Current(), false)
                         : byteorder::Load<double>(cursor.Current(), false);
            cursor.Skip(value_size);
          } else {
            const std::string token = cursor.NextToken();
            if (token.empty())
              throw CorruptedFileException(m_filename, "truncated POINTS");
            xyz[d] = ParseReal(token, m_filename);
          }
        }
        if (orientation == "LPS") {
          xyz[0] = -xyz[0];
          xyz[1] = -xyz[1];
        }
        points.push_back(space.WorldToVoxel({static_cast<float>(xyz[0]),
                                             static_cast<float>(xyz[1]),
                                             static_cast<float>(xyz[2])}));
      }
    } else if (keyword == "LINES") {
      const long count = ParseCount(cursor.NextToken(), m_filename, "count");
      const long size = ParseCount(cursor.NextToken(), m_filename, "size");
      has_lines = true;

      // Binary entries are four bytes, ASCII entries at least two characters
      const size_t entry_size = binary ? 4 : 2;
      if (binary)
        cursor.SkipLineEnd();
      if (static_cast<size_t>(size) >
          (cursor.Remaining() + (binary ? 0 : 1)) / entry_size) {
        throw CorruptedFileException(m_filename, "truncated LINES");
      }
      lines.reserve(ReservationFor(count, cursor.Remaining(), entry_size));

      auto next_int = [&]() -> long {
        if (binary) {
          const long value = byteorder::Load<int32_t>(cursor.Current(), false);
          cursor.Skip(4);
          return value;
        }
        const std::string token = cursor.NextToken();
        if (token == "OFFSETS" || token == "offsets") {
          throw UnsupportedFormatException(
              m_filename, "VTK 5.1 OFFSETS/CONNECTIVITY layout");
        }
        return ParseInteger(token, m_filename, "line entry");
      };

      long consumed = 0;
      for (long l = 0; l < count; ++l) {
        const long n = next_int();
        ++consumed;
        if (n < 0 || consumed + n > size) {
          throw CorruptedFileException(m_filename, "inconsistent LINES size");
        }
        std::vector<long> line(static_cast<size_t>(n));
        for (long k = 0; k < n; ++k)
          line[k] = next_int();
        consumed += n;
        lines.push_back(std::move(line));
      }
      // Attribute sections after the cells are not streamline geometry
      break;
    } else {
      throw UnsupportedFormatException(m_filename,
                                       "unexpected section " + keyword);
    }
  }

  Tractogram tractogram;
  if (!has_lines)
    return tractogram;

  tractogram.Reserve(lines.size());
  for (const auto &line : lines) {
    if (line.empty())
      continue;
    Streamline streamline;
    streamline.reserve(line.size());
    for (long index : line) {
      if (index < 0 || static_cast<size_t>(index) >= points.size()) {
        throw CorruptedFileException(m_filename, "point index " +
                                                     std::to_string(index) +
                                                     " out of range");
      }
      streamline.push_back(points[index]);
    }
    tractogram.AddStreamline(std::move(streamline));
  }

  return tractogram;
}

} // namespace io
} // namespace tractoscore
