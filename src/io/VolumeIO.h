/**
 * @file VolumeIO.h
 * @brief Reference anatomy grid and binary mask volumes
 *
 * Masks are ITK images of unsigned char holding 0 or 1. The reference
 * anatomy defines the voxel grid shared by every ground-truth mask and the
 * voxel space that streamlines are expressed in after loading.
 */

#ifndef VOLUME_IO_H
#define VOLUME_IO_H

#include <array>
#include <cstddef>
#include <string>

#include "itkImage.h"

namespace tractoscore {
namespace io {

using Point3 = std::array<float, 3>;
using VoxelIndex = std::array<long, 3>;
using Matrix4 = std::array<std::array<double, 4>, 4>;

using MaskPixelType = unsigned char;
using MaskImageType = itk::Image<MaskPixelType, 3>;
using MaskPointer = MaskImageType::Pointer;

/**
 * @brief Voxel grid of the reference anatomy
 *
 * Voxel coordinates are continuous indices with voxel centers on integers.
 * World coordinates are RAS millimeters; ITK stores LPS internally.
 */
class ReferenceSpace {
public:
  using SizeType = std::array<size_t, 3>;
  using SpacingType = std::array<double, 3>;
  using OriginType = std::array<double, 3>;

private:
  MaskPointer m_image;

public:
  ReferenceSpace() = default;
  explicit ReferenceSpace(const MaskImageType *image);

  /// Reads only the geometry of a volume (any pixel type on disk)
  static ReferenceSpace FromFile(const std::string &filename);

  /// Axis-aligned grid, LPS origin, identity direction
  static ReferenceSpace FromGeometry(const SizeType &size,
                                     const SpacingType &spacing = {1.0, 1.0,
                                                                   1.0},
                                     const OriginType &origin = {0.0, 0.0,
                                                                 0.0});

  bool IsValid() const { return m_image.IsNotNull(); }

  SizeType GetSize() const;
  SpacingType GetSpacing() const;

  Point3 WorldToVoxel(const Point3 &ras) const;
  Point3 VoxelToWorld(const Point3 &voxel) const;

  /// Voxel index to RAS affine (TrackVis vox_to_ras convention)
  Matrix4 GetVoxelToRasMatrix() const;

  VoxelIndex NearestVoxel(const Point3 &voxel) const;
  bool IsInside(const VoxelIndex &index) const;

  /// True if the mask has the same size, spacing, origin and direction
  bool SameGrid(const MaskImageType *mask, double tolerance = 1e-4) const;

  /// Zero-filled mask on this grid
  MaskPointer CreateEmptyMask() const;

  const MaskImageType *GetImage() const { return m_image.GetPointer(); }
};

// Mask volume access
MaskPointer ReadMask(const std::string &filename);
void WriteMask(const MaskImageType *mask, const std::string &filename);

size_t CountNonZero(const MaskImageType *mask);
bool IsMaskSet(const MaskImageType *mask, const VoxelIndex &index);
void SetMaskValue(MaskImageType *mask, const VoxelIndex &index,
                  MaskPixelType value = 1);

} // namespace io
} // namespace tractoscore

#endif // VOLUME_IO_H
