/// @file weighted.cpp
/// @brief Weighted selection implementation for mcv_gridgen module

#include <mcvillage/gridgen/weighted.hpp>

#include <mcvillage/core/random.hpp>

namespace mcv_gridgen {

float total_weight(const std::vector<float>& weights) {
    float total = 0.0f;
    for (float w : weights) {
        if (w > 0.0f) {
            total += w;
        }
    }
    return total;
}

std::size_t select_weighted_at(const std::vector<float>& weights, float r) {
    float cumulative = 0.0f;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        if (weights[i] <= 0.0f) {
            continue;
        }
        cumulative += weights[i];
        if (r <= cumulative) {
            return i;
        }
    }
    return 0;
}

std::size_t select_weighted(const std::vector<float>& weights, mcv_core::IRandomSource& rng) {
    if (weights.size() <= 1) {
        return 0;
    }
    float r = rng.range(0.0f, total_weight(weights));
    return select_weighted_at(weights, r);
}

} // namespace mcv_gridgen
