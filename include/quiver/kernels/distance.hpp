#pragma once

/** \file distance.hpp
 *  \brief Scalar distance kernels (L2^2, dot, cosine) and the metric enum.
 *
 * Operands must have equal length. All kernels are allocation-free and
 * accumulate in float.
 *
 * Distance conventions (smaller is closer for every metric):
 * - L2:     sum((a[i] - b[i])^2)
 * - Cosine: 1 - cos(a, b); a zero-norm operand yields 1
 * - Dot:    1 - a.b
 */

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace quiver::kernels {

/** \brief Distance metric an index is trained and queried with. */
enum class DistanceType : std::uint8_t { L2 = 0, Cosine = 1, Dot = 2 };

constexpr auto to_string(DistanceType t) noexcept -> std::string_view {
  switch (t) {
    case DistanceType::L2: return "l2";
    case DistanceType::Cosine: return "cosine";
    case DistanceType::Dot: return "dot";
  }
  return "l2";
}

constexpr auto distance_type_from_u8(std::uint8_t v) noexcept -> std::optional<DistanceType> {
  if (v > static_cast<std::uint8_t>(DistanceType::Dot)) return std::nullopt;
  return static_cast<DistanceType>(v);
}

/** \brief Squared Euclidean distance. O(d). */
inline float l2_sq(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const std::size_t pairs = n / 2 * 2;
  // Two independent accumulators; the tail element is folded into the first.
  float even = 0.0f;
  float odd = 0.0f;
  for (std::size_t i = 0; i < pairs; i += 2) {
    const float x = a[i] - b[i];
    const float y = a[i + 1] - b[i + 1];
    even += x * x;
    odd += y * y;
  }
  if (pairs < n) {
    const float x = a[pairs] - b[pairs];
    even += x * x;
  }
  return even + odd;
}

/** \brief Dot product. O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const std::size_t pairs = n / 2 * 2;
  float even = 0.0f;
  float odd = 0.0f;
  for (std::size_t i = 0; i < pairs; i += 2) {
    even += a[i] * b[i];
    odd += a[i + 1] * b[i + 1];
  }
  if (pairs < n) even += a[pairs] * b[pairs];
  return even + odd;
}

/** \brief Cosine similarity: (a.b) / (||a|| * ||b||); 0 when either norm is 0. O(d). */
inline float cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float dot = 0.0f, na = 0.0f, nb = 0.0f;
  for (std::size_t i = 0; i < n; ++i) {
    dot += pa[i] * pb[i];
    na += pa[i] * pa[i];
    nb += pb[i] * pb[i];
  }

  const float denom = std::sqrt(na) * std::sqrt(nb);
  if (!(denom > 0.0f)) return 0.0f;
  return dot / denom;
}

/** \brief Scale v to unit L2 norm in place; zero vectors are left unchanged. */
inline void normalize_inplace(std::span<float> v) noexcept {
  float norm = 0.0f;
  for (float x : v) norm += x * x;
  if (!(norm > 0.0f)) return;
  const float inv = 1.0f / std::sqrt(norm);
  for (float& x : v) x *= inv;
}

/** \brief Metric-dispatched distance (see file comment for conventions). */
inline float distance(DistanceType metric, std::span<const float> a, std::span<const float> b) noexcept {
  switch (metric) {
    case DistanceType::L2: return l2_sq(a, b);
    case DistanceType::Cosine: return 1.0f - cosine_similarity(a, b);
    case DistanceType::Dot: return 1.0f - inner_product(a, b);
  }
  return l2_sq(a, b);
}

} // namespace quiver::kernels
