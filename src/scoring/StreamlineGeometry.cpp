/**
 * @file StreamlineGeometry.cpp
 * @brief Implementation of streamline geometry helpers
 */

#include "StreamlineGeometry.h"

#include "../common/ThreadPool.h"

#include <algorithm>
#include <stdexcept>

namespace tractoscore {
namespace scoring {

double StreamlineLength(const io::Streamline &streamline) {
  double length = 0.0;
  for (size_t i = 1; i < streamline.size(); ++i) {
    length += PointDistance(streamline[i - 1], streamline[i]);
  }
  return length;
}

io::Streamline ResampleStreamline(const io::Streamline &streamline,
                                  size_t nb_points) {
  if (streamline.empty()) {
    throw std::invalid_argument("cannot resample an empty streamline");
  }
  if (nb_points < 2) {
    throw std::invalid_argument("resampling needs at least 2 points");
  }

  // Cumulative arc length at each input point
  std::vector<double> arc(streamline.size(), 0.0);
  for (size_t i = 1; i < streamline.size(); ++i) {
    arc[i] = arc[i - 1] + PointDistance(streamline[i - 1], streamline[i]);
  }

  const double total = arc.back();
  if (streamline.size() == 1 || total <= 0.0) {
    return io::Streamline(nb_points, streamline.front());
  }

  io::Streamline resampled;
  resampled.reserve(nb_points);

  size_t segment = 1;
  for (size_t k = 0; k < nb_points; ++k) {
    const double target = total * static_cast<double>(k) / (nb_points - 1);

    while (segment < streamline.size() - 1 && arc[segment] < target) {
      ++segment;
    }

    const double seg_length = arc[segment] - arc[segment - 1];
    const double t = seg_length > 0.0
                         ? std::clamp((target - arc[segment - 1]) / seg_length,
                                      0.0, 1.0)
                         : 0.0;

    const auto &p0 = streamline[segment - 1];
    const auto &p1 = streamline[segment];
    io::Point3 point;
    for (int d = 0; d < 3; ++d) {
      point[d] = static_cast<float>(p0[d] + t * (p1[d] - p0[d]));
    }
    resampled.push_back(point);
  }

  // Exact endpoints, free of accumulated rounding
  resampled.front() = streamline.front();
  resampled.back() = streamline.back();
  return resampled;
}

std::vector<io::Streamline>
ResampleStreamlines(const std::vector<io::Streamline> &streamlines,
                    size_t nb_points, size_t num_threads) {
  std::vector<io::Streamline> resampled(streamlines.size());
  ParallelFor(streamlines.size(), num_threads,
              [&](size_t begin, size_t end) {
                for (size_t i = begin; i < end; ++i)
                  resampled[i] = ResampleStreamline(streamlines[i], nb_points);
              });
  return resampled;
}

double AveragePointwiseDistance(const io::Streamline &a,
                                const io::Streamline &b) {
  if (a.size() != b.size() || a.empty()) {
    throw std::invalid_argument(
        "pointwise distance needs non-empty streamlines of equal size");
  }

  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    sum += PointDistance(a[i], b[i]);
  }
  return sum / a.size();
}

double FlippedAveragePointwiseDistance(const io::Streamline &a,
                                       const io::Streamline &b) {
  if (a.size() != b.size() || a.empty()) {
    throw std::invalid_argument(
        "pointwise distance needs non-empty streamlines of equal size");
  }

  const size_t n = a.size();
  double sum = 0.0;
  for (size_t i = 0; i < n; ++i) {
    sum += PointDistance(a[i], b[n - 1 - i]);
  }
  return sum / n;
}

double MinimumAverageDirectFlip(const io::Streamline &a,
                                const io::Streamline &b) {
  return std::min(AveragePointwiseDistance(a, b),
                  FlippedAveragePointwiseDistance(a, b));
}

} // namespace scoring
} // namespace tractoscore
