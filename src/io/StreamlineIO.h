/**
 * @file StreamlineIO.h
 * @brief Tractogram container and streamline file I/O
 *
 * Streamlines are held in voxel coordinates of a reference anatomy after
 * loading. Supported formats are MRtrix .tck, TrackVis .trk (optionally
 * gzip-compressed) and legacy VTK polydata (.vtk). Failures are reported
 * with the StreamlineIOException family.
 */

#ifndef STREAMLINE_IO_H
#define STREAMLINE_IO_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "VolumeIO.h"

namespace tractoscore {
namespace io {

using Streamline = std::vector<Point3>;

/**
 * @brief Ordered sequence of streamlines with optional per-streamline and
 * per-point values
 *
 * Indices are stable: position i always refers to the i-th streamline that
 * was read or added.
 */
class Tractogram {
private:
  std::vector<Streamline> m_streamlines;

  // data_per_streamline: one row of m_property_names.size() values each
  std::vector<std::string> m_property_names;
  std::vector<std::vector<float>> m_properties;

  // data_per_point: points * m_scalar_names.size() values each
  std::vector<std::string> m_scalar_names;
  std::vector<std::vector<float>> m_scalars;

public:
  Tractogram() = default;
  explicit Tractogram(std::vector<Streamline> streamlines);

  Tractogram(const Tractogram &other) = default;
  Tractogram &operator=(const Tractogram &other) = default;
  Tractogram(Tractogram &&other) noexcept = default;
  Tractogram &operator=(Tractogram &&other) noexcept = default;

  // Data access
  size_t Size() const { return m_streamlines.size(); }
  bool Empty() const { return m_streamlines.empty(); }
  const Streamline &operator[](size_t index) const {
    return m_streamlines[index];
  }
  const Streamline &At(size_t index) const;
  const std::vector<Streamline> &GetStreamlines() const {
    return m_streamlines;
  }
  size_t GetTotalPoints() const;

  // Attached values
  void SetPropertyNames(const std::vector<std::string> &names);
  void SetScalarNames(const std::vector<std::string> &names);
  const std::vector<std::string> &GetPropertyNames() const {
    return m_property_names;
  }
  const std::vector<std::string> &GetScalarNames() const {
    return m_scalar_names;
  }
  const std::vector<float> &GetProperties(size_t index) const;
  const std::vector<float> &GetScalars(size_t index) const;

  // Data manipulation
  void AddStreamline(Streamline streamline,
                     std::vector<float> properties = {},
                     std::vector<float> scalars = {});
  void Reserve(size_t count);
  void Clear();

  /// New tractogram with the given streamlines, in the given order
  Tractogram Subset(const std::vector<size_t> &indices) const;
};

/**
 * @brief Streamline file format enumeration
 */
enum class TractogramFormat {
  TCK,    // MRtrix (.tck)
  TRK,    // TrackVis (.trk, .trk.gz)
  VTK,    // Legacy VTK polydata (.vtk)
  UNKNOWN
};

/**
 * @brief Out-of-band information about a submission file
 *
 * The orientation ("RAS" or "LPS") is required for VTK files only, whose
 * points carry no frame of reference.
 */
struct SubmissionAttributes {
  std::string orientation;
};

/**
 * @brief TrackVis header (version 2), 1000 bytes on disk
 */
struct TrackVisHeader {
  char id_string[6] = {'T', 'R', 'A', 'C', 'K', '\0'};
  int16_t dim[3] = {0, 0, 0};
  float voxel_size[3] = {1.0f, 1.0f, 1.0f};
  float origin[3] = {0.0f, 0.0f, 0.0f};
  int16_t n_scalars = 0;
  char scalar_name[10][20] = {{0}};
  int16_t n_properties = 0;
  char property_name[10][20] = {{0}};
  float vox_to_ras[4][4] = {{0.0f}};
  char reserved[444] = {0};
  char voxel_order[4] = {0};
  char pad2[4] = {0};
  float image_orientation_patient[6] = {0.0f};
  char pad1[2] = {0};
  unsigned char invert_x = 0;
  unsigned char invert_y = 0;
  unsigned char invert_z = 0;
  unsigned char swap_xy = 0;
  unsigned char swap_yz = 0;
  unsigned char swap_zx = 0;
  int32_t n_count = 0;
  int32_t version = 2;
  int32_t hdr_size = 1000;
};

static_assert(sizeof(TrackVisHeader) == 1000,
              "TrackVis header must be 1000 bytes");

/**
 * @brief Read options for TractogramReader
 */
struct TractogramReadOptions {
  SubmissionAttributes attributes;
  bool verbose = false;
};

/**
 * @brief Loads streamline files into reference voxel space
 */
class TractogramReader {
public:
  using ReadOptions = TractogramReadOptions;

private:
  std::string m_filename;
  TractogramFormat m_format = TractogramFormat::UNKNOWN;
  bool m_is_compressed = false;

public:
  TractogramReader() = default;
  explicit TractogramReader(const std::string &filename);

  // File operations
  bool Open(const std::string &filename);
  void Close();

  // Format detection
  static TractogramFormat DetectFormat(const std::string &filename);
  static bool IsCompressed(const std::string &filename);
  TractogramFormat GetFormat() const { return m_format; }

  /// Throws StreamlineIOException subclasses or ConfigurationException
  Tractogram Read(const ReferenceSpace &space,
                  const ReadOptions &options = ReadOptions{}) const;

private:
  Tractogram ReadTck(const std::vector<uint8_t> &data,
                     const ReferenceSpace &space,
                     const ReadOptions &options) const;
  Tractogram ReadTrk(std::vector<uint8_t> data, const ReferenceSpace &space,
                     const ReadOptions &options) const;
  Tractogram ReadVtk(const std::vector<uint8_t> &data,
                     const ReferenceSpace &space,
                     const ReadOptions &options) const;

  std::vector<uint8_t> ReadFileBytes() const;
  std::vector<uint8_t> DecompressGzip(const std::string &filename) const;
};

/**
 * @brief Write options for TractogramWriter
 */
struct TractogramWriteOptions {
  bool binary = true; // VTK only
  std::string description = "TractoScore";
  bool verbose = false;
};

/**
 * @brief Writes voxel-space tractograms; output is RAS for tck and vtk
 */
class TractogramWriter {
public:
  using WriteOptions = TractogramWriteOptions;

private:
  std::string m_filename;
  TractogramFormat m_format = TractogramFormat::UNKNOWN;
  bool m_compress = false;

public:
  TractogramWriter() = default;
  explicit TractogramWriter(const std::string &filename);

  bool Open(const std::string &filename);
  void Close();

  /// Throws StreamlineIOException subclasses on failure
  void Write(const Tractogram &tractogram, const ReferenceSpace &space,
             const WriteOptions &options = WriteOptions{}) const;

private:
  std::vector<uint8_t> EncodeTck(const Tractogram &tractogram,
                                 const ReferenceSpace &space) const;
  std::vector<uint8_t> EncodeTrk(const Tractogram &tractogram,
                                 const ReferenceSpace &space) const;
  std::vector<uint8_t> EncodeVtk(const Tractogram &tractogram,
                                 const ReferenceSpace &space,
                                 const WriteOptions &options) const;

  void WriteBytes(const std::vector<uint8_t> &bytes) const;
};

/**
 * @brief Utility functions for streamline files
 */
namespace StreamlineUtils {
bool FileExists(const std::string &filename);
std::string GetFileExtension(const std::string &filename);
std::string RemoveExtension(const std::string &filename);
std::string GetBaseName(const std::string &filename);

/// Three-letter axis codes of the columns of an affine, e.g. "LPS"
std::string AxisCodes(const Matrix4 &affine);

// Quick I/O functions
Tractogram LoadTractogram(const std::string &filename,
                          const ReferenceSpace &space,
                          const SubmissionAttributes &attributes = {});
void SaveTractogram(const Tractogram &tractogram, const std::string &filename,
                    const ReferenceSpace &space);
} // namespace StreamlineUtils

} // namespace io
} // namespace tractoscore

#endif // STREAMLINE_IO_H
