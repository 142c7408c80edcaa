/**
 * @file StreamlineGeometry.h
 * @brief Length, resampling and pointwise distances of streamlines
 */

#ifndef STREAMLINE_GEOMETRY_H
#define STREAMLINE_GEOMETRY_H

#include "../io/StreamlineIO.h"

#include <cmath>
#include <vector>

namespace tractoscore {
namespace scoring {

/// Sum of segment lengths, in the units of the coordinates
double StreamlineLength(const io::Streamline &streamline);

/**
 * @brief Resample to nb_points points equally spaced in arc length
 *
 * Endpoints are preserved. A single-point or zero-length streamline
 * repeats its first point. Throws std::invalid_argument on an empty
 * streamline or nb_points < 2.
 */
io::Streamline ResampleStreamline(const io::Streamline &streamline,
                                  size_t nb_points);

std::vector<io::Streamline>
ResampleStreamlines(const std::vector<io::Streamline> &streamlines,
                    size_t nb_points, size_t num_threads = 1);

// Distances between streamlines with the same number of points
double AveragePointwiseDistance(const io::Streamline &a,
                                const io::Streamline &b);
double FlippedAveragePointwiseDistance(const io::Streamline &a,
                                       const io::Streamline &b);

/// MDF: min(direct, flipped) average pointwise Euclidean distance
double MinimumAverageDirectFlip(const io::Streamline &a,
                                const io::Streamline &b);

inline double PointDistance(const io::Point3 &a, const io::Point3 &b) {
  const double dx = static_cast<double>(a[0]) - b[0];
  const double dy = static_cast<double>(a[1]) - b[1];
  const double dz = static_cast<double>(a[2]) - b[2];
  return std::sqrt(dx * dx + dy * dy + dz * dz);
}

} // namespace scoring
} // namespace tractoscore

#endif // STREAMLINE_GEOMETRY_H
