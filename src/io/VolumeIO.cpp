/**
 * @file VolumeIO.cpp
 * @brief ITK-backed reference grid and mask I/O
 */

#include "VolumeIO.h"

#include "../common/TractoScoreExceptions.h"

#include "itkBinaryThresholdImageFilter.h"
#include "itkImageFileReader.h"
#include "itkImageFileWriter.h"
#include "itkImageRegionConstIterator.h"

#include <cmath>
#include <limits>

namespace tractoscore {
namespace io {

namespace {

using FloatImageType = itk::Image<float, 3>;

// RAS <-> LPS only flips the first two axes
inline void FlipXY(double &x, double &y) {
  x = -x;
  y = -y;
}

} // namespace

// ===== ReferenceSpace Implementation =====

ReferenceSpace::ReferenceSpace(const MaskImageType *image) {
  if (!image) {
    return;
  }

  // Keep only the geometry
  m_image = MaskImageType::New();
  m_image->CopyInformation(image);
  MaskImageType::RegionType region;
  region.SetSize(image->GetLargestPossibleRegion().GetSize());
  region.SetIndex(image->GetLargestPossibleRegion().GetIndex());
  m_image->SetRegions(region);
}

ReferenceSpace ReferenceSpace::FromFile(const std::string &filename) {
  auto reader = itk::ImageFileReader<FloatImageType>::New();
  reader->SetFileName(filename);

  try {
    reader->UpdateOutputInformation();
  } catch (const itk::ExceptionObject &e) {
    throw VolumeIOException(filename, "ReadGeometry", e.GetDescription());
  }

  auto geometry = MaskImageType::New();
  geometry->CopyInformation(reader->GetOutput());
  geometry->SetRegions(reader->GetOutput()->GetLargestPossibleRegion());

  ReferenceSpace space;
  space.m_image = geometry;
  return space;
}

ReferenceSpace ReferenceSpace::FromGeometry(const SizeType &size,
                                            const SpacingType &spacing,
                                            const OriginType &origin) {
  auto geometry = MaskImageType::New();

  MaskImageType::SizeType itk_size;
  MaskImageType::SpacingType itk_spacing;
  MaskImageType::PointType itk_origin;
  for (unsigned int d = 0; d < 3; ++d) {
    itk_size[d] = size[d];
    itk_spacing[d] = spacing[d];
    itk_origin[d] = origin[d];
  }

  MaskImageType::RegionType region;
  region.SetSize(itk_size);
  geometry->SetRegions(region);
  geometry->SetSpacing(itk_spacing);
  geometry->SetOrigin(itk_origin);

  MaskImageType::DirectionType direction;
  direction.SetIdentity();
  geometry->SetDirection(direction);

  ReferenceSpace space;
  space.m_image = geometry;
  return space;
}

ReferenceSpace::SizeType ReferenceSpace::GetSize() const {
  SizeType size = {0, 0, 0};
  if (!IsValid())
    return size;

  const auto itk_size = m_image->GetLargestPossibleRegion().GetSize();
  for (unsigned int d = 0; d < 3; ++d)
    size[d] = itk_size[d];
  return size;
}

ReferenceSpace::SpacingType ReferenceSpace::GetSpacing() const {
  SpacingType spacing = {1.0, 1.0, 1.0};
  if (!IsValid())
    return spacing;

  for (unsigned int d = 0; d < 3; ++d)
    spacing[d] = m_image->GetSpacing()[d];
  return spacing;
}

Point3 ReferenceSpace::WorldToVoxel(const Point3 &ras) const {
  if (!IsValid()) {
    throw VolumeIOException("<reference>", "WorldToVoxel",
                            "reference space is not initialized");
  }

  double lps[3] = {ras[0], ras[1], ras[2]};
  FlipXY(lps[0], lps[1]);

  const auto &to_index = m_image->GetPhysicalPointToIndex();
  const auto &origin = m_image->GetOrigin();

  Point3 voxel;
  for (unsigned int r = 0; r < 3; ++r) {
    double value = 0.0;
    for (unsigned int c = 0; c < 3; ++c)
      value += to_index[r][c] * (lps[c] - origin[c]);
    voxel[r] = static_cast<float>(value);
  }
  return voxel;
}

Point3 ReferenceSpace::VoxelToWorld(const Point3 &voxel) const {
  if (!IsValid()) {
    throw VolumeIOException("<reference>", "VoxelToWorld",
                            "reference space is not initialized");
  }

  const auto &to_physical = m_image->GetIndexToPhysicalPoint();
  const auto &origin = m_image->GetOrigin();

  double lps[3];
  for (unsigned int r = 0; r < 3; ++r) {
    lps[r] = origin[r];
    for (unsigned int c = 0; c < 3; ++c)
      lps[r] += to_physical[r][c] * voxel[c];
  }
  FlipXY(lps[0], lps[1]);

  return {static_cast<float>(lps[0]), static_cast<float>(lps[1]),
          static_cast<float>(lps[2])};
}

Matrix4 ReferenceSpace::GetVoxelToRasMatrix() const {
  Matrix4 matrix = {{{0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 1}}};
  if (!IsValid())
    return matrix;

  const auto &to_physical = m_image->GetIndexToPhysicalPoint();
  const auto &origin = m_image->GetOrigin();

  for (unsigned int r = 0; r < 3; ++r) {
    const double sign = r < 2 ? -1.0 : 1.0;
    for (unsigned int c = 0; c < 3; ++c)
      matrix[r][c] = sign * to_physical[r][c];
    matrix[r][3] = sign * origin[r];
  }
  return matrix;
}

VoxelIndex ReferenceSpace::NearestVoxel(const Point3 &voxel) const {
  return {std::lround(voxel[0]), std::lround(voxel[1]), std::lround(voxel[2])};
}

bool ReferenceSpace::IsInside(const VoxelIndex &index) const {
  const auto size = GetSize();
  for (unsigned int d = 0; d < 3; ++d) {
    if (index[d] < 0 || index[d] >= static_cast<long>(size[d]))
      return false;
  }
  return true;
}

bool ReferenceSpace::SameGrid(const MaskImageType *mask,
                              double tolerance) const {
  if (!IsValid() || !mask)
    return false;

  if (mask->GetLargestPossibleRegion().GetSize() !=
      m_image->GetLargestPossibleRegion().GetSize())
    return false;

  for (unsigned int r = 0; r < 3; ++r) {
    if (std::abs(mask->GetSpacing()[r] - m_image->GetSpacing()[r]) > tolerance)
      return false;
    if (std::abs(mask->GetOrigin()[r] - m_image->GetOrigin()[r]) > tolerance)
      return false;
    for (unsigned int c = 0; c < 3; ++c) {
      if (std::abs(mask->GetDirection()[r][c] - m_image->GetDirection()[r][c]) >
          tolerance)
        return false;
    }
  }
  return true;
}

MaskPointer ReferenceSpace::CreateEmptyMask() const {
  if (!IsValid()) {
    throw VolumeIOException("<reference>", "CreateEmptyMask",
                            "reference space is not initialized");
  }

  auto mask = MaskImageType::New();
  mask->CopyInformation(m_image);
  mask->SetRegions(m_image->GetLargestPossibleRegion());
  mask->Allocate();
  mask->FillBuffer(0);
  return mask;
}

// ===== Mask Volume Functions =====

MaskPointer ReadMask(const std::string &filename) {
  auto reader = itk::ImageFileReader<FloatImageType>::New();
  reader->SetFileName(filename);

  // Any strictly positive value is part of the mask
  auto threshold =
      itk::BinaryThresholdImageFilter<FloatImageType, MaskImageType>::New();
  threshold->SetInput(reader->GetOutput());
  threshold->SetLowerThreshold(std::numeric_limits<float>::min());
  threshold->SetUpperThreshold(std::numeric_limits<float>::max());
  threshold->SetInsideValue(1);
  threshold->SetOutsideValue(0);

  try {
    threshold->Update();
  } catch (const itk::ExceptionObject &e) {
    throw VolumeIOException(filename, "ReadMask", e.GetDescription());
  }

  MaskPointer mask = threshold->GetOutput();
  mask->DisconnectPipeline();
  return mask;
}

void WriteMask(const MaskImageType *mask, const std::string &filename) {
  if (!mask) {
    throw VolumeIOException(filename, "WriteMask", "null mask");
  }

  auto writer = itk::ImageFileWriter<MaskImageType>::New();
  writer->SetFileName(filename);
  writer->SetInput(mask);
  writer->SetUseCompression(true);

  try {
    writer->Update();
  } catch (const itk::ExceptionObject &e) {
    throw VolumeIOException(filename, "WriteMask", e.GetDescription());
  }
}

size_t CountNonZero(const MaskImageType *mask) {
  if (!mask)
    return 0;

  size_t count = 0;
  itk::ImageRegionConstIterator<MaskImageType> it(
      mask, mask->GetLargestPossibleRegion());
  for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
    if (it.Get() != 0)
      ++count;
  }
  return count;
}

bool IsMaskSet(const MaskImageType *mask, const VoxelIndex &index) {
  if (!mask)
    return false;

  MaskImageType::IndexType itk_index;
  for (unsigned int d = 0; d < 3; ++d)
    itk_index[d] = index[d];

  if (!mask->GetLargestPossibleRegion().IsInside(itk_index))
    return false;

  return mask->GetPixel(itk_index) != 0;
}

void SetMaskValue(MaskImageType *mask, const VoxelIndex &index,
                  MaskPixelType value) {
  if (!mask)
    return;

  MaskImageType::IndexType itk_index;
  for (unsigned int d = 0; d < 3; ++d)
    itk_index[d] = index[d];

  if (mask->GetLargestPossibleRegion().IsInside(itk_index))
    mask->SetPixel(itk_index, value);
}

} // namespace io
} // namespace tractoscore
