#pragma once

/** \file distance.hpp
 *  \brief Scalar distance kernels, metric dispatch and per-object aggregation.
 *
 * Preconditions
 * - a.size() == b.size() > 0
 * - All inputs are finite
 * Conventions: smaller distance is closer for every metric.
 * - cosine: 1 - cos(a, b); a zero-norm operand yields 1 (orthogonal)
 * - dot:    -(a . b)
 * - euclid: sqrt(sum((a - b)^2))
 * Determinism: pure functions, no allocations, no exceptions.
 */

#include <cmath>
#include <cstddef>
#include <expected>
#include <span>
#include <string>

#include "embdb/error.hpp"
#include "embdb/models.hpp"

namespace embdb::kernels {

/** \brief Sum of squared differences. O(d). */
inline float l2_sq(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4 independent accumulators
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    const float d0 = pa[i] - pb[i];
    const float d1 = pa[i + 1] - pb[i + 1];
    const float d2 = pa[i + 2] - pb[i + 2];
    const float d3 = pa[i + 3] - pb[i + 3];
    s0 += d0 * d0;
    s1 += d1 * d1;
    s2 += d2 * d2;
    s3 += d3 * d3;
  }
  float s = (s0 + s1) + (s2 + s3);
  for (; i < n; ++i) {
    const float d = pa[i] - pb[i];
    s += d * d;
  }
  return s;
}

/** \brief Inner product. O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    s0 += pa[i] * pb[i];
    s1 += pa[i + 1] * pb[i + 1];
    s2 += pa[i + 2] * pb[i + 2];
    s3 += pa[i + 3] * pb[i + 3];
  }
  float s = (s0 + s1) + (s2 + s3);
  for (; i < n; ++i) s += pa[i] * pb[i];
  return s;
}

/** \brief Cosine distance 1 - (a.b)/(|a||b|); 1 when either norm is zero. O(d). */
inline float cosine_distance(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  double dot = 0.0, na = 0.0, nb = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double av = a[i], bv = b[i];
    dot += av * bv;
    na += av * av;
    nb += bv * bv;
  }
  const double denom = std::sqrt(na) * std::sqrt(nb);
  if (denom == 0.0) return 1.0f;
  return static_cast<float>(1.0 - dot / denom);
}

/** \brief Distance under `metric`. */
inline double distance(MetricType metric, std::span<const float> a, std::span<const float> b) noexcept {
  switch (metric) {
  case MetricType::cosine: return cosine_distance(a, b);
  case MetricType::dot: return -static_cast<double>(inner_product(a, b));
  case MetricType::euclid: return std::sqrt(static_cast<double>(l2_sq(a, b)));
  }
  return 0.0;
}

/** \brief Aggregate part distances of one object: minimum or arithmetic mean. Empty input is 0. */
inline double aggregate(AggregationType agg, std::span<const double> part_distances) noexcept {
  if (part_distances.empty()) return 0.0;
  if (agg == AggregationType::min) {
    double m = part_distances[0];
    for (double d : part_distances) m = d < m ? d : m;
    return m;
  }
  double s = 0.0;
  for (double d : part_distances) s += d;
  return s / static_cast<double>(part_distances.size());
}

/** \brief dimension_mismatch unless v.size() == dimensions. */
inline auto validate_dimensions(std::span<const float> v, std::size_t dimensions, std::string_view what)
    -> std::expected<void, core::error> {
  if (v.size() == dimensions) return {};
  return core::make_error(core::error_code::dimension_mismatch,
                          std::string(what) + ": expected " + std::to_string(dimensions) + " dimensions, got " +
                              std::to_string(v.size()),
                          "kernels.distance");
}

/** \brief invalid_argument when any component is NaN or infinite. */
inline auto validate_finite(std::span<const float> v, std::string_view what) -> std::expected<void, core::error> {
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (std::isfinite(v[i])) continue;
    return core::make_error(core::error_code::invalid_argument,
                            std::string(what) + ": component " + std::to_string(i) + " is not finite",
                            "kernels.distance");
  }
  return {};
}

} // namespace embdb::kernels
