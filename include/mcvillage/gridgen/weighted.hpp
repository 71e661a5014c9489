/// @file weighted.hpp
/// @brief Weighted selection among candidates

#pragma once

#include <mcvillage/core/fwd.hpp>

#include <cstddef>
#include <vector>

namespace mcv_gridgen {

/// @brief Total of the positive weights
[[nodiscard]] float total_weight(const std::vector<float>& weights);

/// @brief Pick the first candidate whose cumulative weight reaches `r`
///
/// Walks candidates in order accumulating positive weights and selects the
/// first with `r <= cumulative`. Non-positive weights never win the walk.
/// Falls back to index 0 when nothing qualifies.
[[nodiscard]] std::size_t select_weighted_at(const std::vector<float>& weights, float r);

/// @brief Draw `r` uniformly in [0, total) and select
///
/// A single candidate is returned without consuming a draw; two or more
/// consume exactly one draw. An empty list returns 0.
[[nodiscard]] std::size_t select_weighted(const std::vector<float>& weights, mcv_core::IRandomSource& rng);

} // namespace mcv_gridgen
