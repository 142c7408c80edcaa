/**
 * @file TractogramWriter.cpp
 * @brief Implementation of streamline file writing
 */

#include "../common/CompatUtils.h"
#include "../common/TractoScoreExceptions.h"
#include "ByteOrder.h"
#include "StreamlineIO.h"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <zlib.h>

namespace tractoscore {
namespace io {

namespace {

void AppendText(std::vector<uint8_t> &bytes, const std::string &text) {
  bytes.insert(bytes.end(), text.begin(), text.end());
}

void CopyName(char *field, const std::string &name) {
  std::strncpy(field, name.c_str(), 19);
  field[19] = '\0';
}

} // namespace

// ===== TractogramWriter Implementation =====

TractogramWriter::TractogramWriter(const std::string &filename)
    : m_filename(filename) {
  Open(filename);
}

bool TractogramWriter::Open(const std::string &filename) {
  m_filename = filename;
  m_format = TractogramReader::DetectFormat(filename);
  m_compress = TractogramReader::IsCompressed(filename);

  if (m_compress && m_format != TractogramFormat::TRK) {
    m_format = TractogramFormat::UNKNOWN;
  }

  return m_format != TractogramFormat::UNKNOWN;
}

void TractogramWriter::Close() {
  m_filename.clear();
  m_format = TractogramFormat::UNKNOWN;
  m_compress = false;
}

void TractogramWriter::Write(const Tractogram &tractogram,
                             const ReferenceSpace &space,
                             const WriteOptions &options) const {
  if (m_format == TractogramFormat::UNKNOWN) {
    throw UnsupportedFormatException(
        m_filename, "expected one of .tck, .trk, .trk.gz, .vtk");
  }

  if (!space.IsValid()) {
    throw StreamlineIOException(m_filename, "Write",
                                "reference space is not initialized");
  }

  std::vector<uint8_t> bytes;
  switch (m_format) {
  case TractogramFormat::TCK:
    bytes = EncodeTck(tractogram, space);
    break;
  case TractogramFormat::TRK:
    bytes = EncodeTrk(tractogram, space);
    break;
  case TractogramFormat::VTK:
    bytes = EncodeVtk(tractogram, space, options);
    break;
  default:
    throw UnsupportedFormatException(m_filename);
  }

  WriteBytes(bytes);

  if (options.verbose) {
    std::cout << "[TractoScore] Wrote " << tractogram.Size()
              << " streamlines to " << m_filename << std::endl;
  }
}

void TractogramWriter::WriteBytes(const std::vector<uint8_t> &bytes) const {
  if (m_compress) {
    gzFile output = gzopen(m_filename.c_str(), "wb6");
    if (!output) {
      throw StreamlineIOException(m_filename, "Write",
                                  "cannot open gzip stream");
    }

    const size_t chunk_size = 1024 * 1024; // 1MB chunks
    for (size_t offset = 0; offset < bytes.size(); offset += chunk_size) {
      const unsigned int length =
          static_cast<unsigned int>(std::min(chunk_size, bytes.size() - offset));
      if (gzwrite(output, bytes.data() + offset, length) !=
          static_cast<int>(length)) {
        gzclose(output);
        throw StreamlineIOException(m_filename, "Write", "gzip write failed");
      }
    }

    if (gzclose(output) != Z_OK) {
      throw StreamlineIOException(m_filename, "Write", "gzip close failed");
    }
    return;
  }

  std::ofstream file(m_filename, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw StreamlineIOException(m_filename, "Write", "cannot open file");
  }

  file.write(reinterpret_cast<const char *>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
  if (!file) {
    throw StreamlineIOException(m_filename, "Write", "write failed");
  }
}

// ===== MRtrix .tck =====

std::vector<uint8_t>
TractogramWriter::EncodeTck(const Tractogram &tractogram,
                            const ReferenceSpace &space) const {
  std::stringstream prefix;
  prefix << "mrtrix tracks\n";
  prefix << "count: " << std::setw(10) << std::setfill('0') << tractogram.Size()
         << "\n";
  prefix << "datatype: Float32LE\n";
  const std::string head = prefix.str() + "file: . ";
  const std::string tail = "\nEND\n";

  // The offset counts its own digits
  size_t offset = head.size() + tail.size() + 1;
  while (head.size() + std::to_string(offset).size() + tail.size() != offset) {
    offset = head.size() + std::to_string(offset).size() + tail.size();
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(offset + (tractogram.GetTotalPoints() + tractogram.Size() + 1) *
                             3 * sizeof(float));
  AppendText(bytes, head + std::to_string(offset) + tail);

  const float nan = std::numeric_limits<float>::quiet_NaN();
  const float inf = std::numeric_limits<float>::infinity();

  for (const auto &streamline : tractogram.GetStreamlines()) {
    for (const auto &voxel : streamline) {
      const Point3 ras = space.VoxelToWorld(voxel);
      for (float value : ras)
        byteorder::Append(bytes, value, true);
    }
    for (int d = 0; d < 3; ++d)
      byteorder::Append(bytes, nan, true);
  }
  for (int d = 0; d < 3; ++d)
    byteorder::Append(bytes, inf, true);

  return bytes;
}

// ===== TrackVis .trk =====

std::vector<uint8_t>
TractogramWriter::EncodeTrk(const Tractogram &tractogram,
                            const ReferenceSpace &space) const {
  const auto &scalar_names = tractogram.GetScalarNames();
  const auto &property_names = tractogram.GetPropertyNames();
  if (scalar_names.size() > 10 || property_names.size() > 10) {
    throw StreamlineIOException(m_filename, "Write",
                                "trk supports at most 10 scalars and 10 "
                                "properties");
  }

  TrackVisHeader header;
  const auto size = space.GetSize();
  const auto spacing = space.GetSpacing();
  for (int d = 0; d < 3; ++d) {
    header.dim[d] = static_cast<int16_t>(size[d]);
    header.voxel_size[d] = static_cast<float>(spacing[d]);
  }

  const Matrix4 vox_to_ras = space.GetVoxelToRasMatrix();
  for (int r = 0; r < 4; ++r)
    for (int c = 0; c < 4; ++c)
      header.vox_to_ras[r][c] = static_cast<float>(vox_to_ras[r][c]);

  const std::string order = StreamlineUtils::AxisCodes(vox_to_ras);
  std::memcpy(header.voxel_order, order.c_str(),
              std::min<size_t>(order.size(), 3));

  header.n_scalars = static_cast<int16_t>(scalar_names.size());
  for (size_t i = 0; i < scalar_names.size(); ++i)
    CopyName(header.scalar_name[i], scalar_names[i]);
  header.n_properties = static_cast<int16_t>(property_names.size());
  for (size_t i = 0; i < property_names.size(); ++i)
    CopyName(header.property_name[i], property_names[i]);
  header.n_count = static_cast<int32_t>(tractogram.Size());

  if (!byteorder::IsLittleEndianHost()) {
    throw StreamlineIOException(m_filename, "Write",
                                "trk output requires a little-endian host");
  }
  std::vector<uint8_t> bytes(sizeof(TrackVisHeader));
  std::memcpy(bytes.data(), &header, sizeof(TrackVisHeader));

  for (size_t i = 0; i < tractogram.Size(); ++i) {
    const auto &streamline = tractogram[i];
    const auto &scalars = tractogram.GetScalars(i);
    const auto &properties = tractogram.GetProperties(i);

    byteorder::Append(bytes, static_cast<int32_t>(streamline.size()), true);
    for (size_t p = 0; p < streamline.size(); ++p) {
      // voxmm: corner of voxel 0 at the origin
      for (int d = 0; d < 3; ++d) {
        const float voxmm =
            static_cast<float>((streamline[p][d] + 0.5) * spacing[d]);
        byteorder::Append(bytes, voxmm, true);
      }
      for (size_t s = 0; s < scalar_names.size(); ++s)
        byteorder::Append(bytes, scalars[p * scalar_names.size() + s], true);
    }
    for (float value : properties)
      byteorder::Append(bytes, value, true);
  }

  return bytes;
}

// ===== Legacy VTK polydata =====

std::vector<uint8_t>
TractogramWriter::EncodeVtk(const Tractogram &tractogram,
                            const ReferenceSpace &space,
                            const WriteOptions &options) const {
  const size_t total_points = tractogram.GetTotalPoints();

  std::vector<uint8_t> bytes;
  std::stringstream header;
  header << "# vtk DataFile Version 3.0\n";
  header << (options.description.empty() ? "TractoScore" : options.description)
         << "\n";
  header << (options.binary ? "BINARY" : "ASCII") << "\n";
  header << "DATASET POLYDATA\n";
  header << "POINTS " << total_points << " float\n";
  AppendText(bytes, header.str());

  std::stringstream ascii;
  ascii << std::setprecision(9);

  for (const auto &streamline : tractogram.GetStreamlines()) {
    for (const auto &voxel : streamline) {
      const Point3 ras = space.VoxelToWorld(voxel);
      if (options.binary) {
        for (float value : ras)
          byteorder::Append(bytes, value, false);
      } else {
        ascii << ras[0] << " " << ras[1] << " " << ras[2] << "\n";
      }
    }
  }

  if (!options.binary) {
    AppendText(bytes, ascii.str());
    ascii.str("");
  } else {
    AppendText(bytes, "\n");
  }

  std::stringstream lines_header;
  lines_header << "LINES " << tractogram.Size() << " "
               << (tractogram.Size() + total_points) << "\n";
  AppendText(bytes, lines_header.str());

  int32_t next_index = 0;
  for (const auto &streamline : tractogram.GetStreamlines()) {
    const int32_t n = static_cast<int32_t>(streamline.size());
    if (options.binary) {
      byteorder::Append(bytes, n, false);
      for (int32_t k = 0; k < n; ++k)
        byteorder::Append(bytes, next_index + k, false);
    } else {
      ascii << n;
      for (int32_t k = 0; k < n; ++k)
        ascii << " " << (next_index + k);
      ascii << "\n";
    }
    next_index += n;
  }

  if (options.binary) {
    AppendText(bytes, "\n");
  } else {
    AppendText(bytes, ascii.str());
  }

  return bytes;
}

} // namespace io
} // namespace tractoscore
