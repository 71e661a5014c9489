/// @file transform_randomizer.hpp
/// @brief Per-axis scale and rotation randomization

#pragma once

#include "types.hpp"

#include <mcvillage/core/fwd.hpp>

namespace mcv_gridgen {

/// @brief Independent uniform draws per axis for scale and Euler rotation
///
/// Draw order: scale X, Y, Z (when enabled), then rotation X, Y, Z (when
/// enabled). Disabled groups keep the template's own values.
struct TransformRandomizer {
    bool randomize_scale{false};
    Vec3 min_scale{0.8f, 0.8f, 0.8f};
    Vec3 max_scale{1.2f, 1.2f, 1.2f};

    bool randomize_rotation{false};
    Vec3 min_rotation{0.0f, 0.0f, 0.0f};      ///< Euler degrees
    Vec3 max_rotation{0.0f, 360.0f, 0.0f};    ///< Euler degrees

    /// @brief Randomize a node's local scale/rotation
    void apply(mcv_scene::SceneGraph& scene, NodeId node, mcv_core::IRandomSource& rng) const;

    /// @brief Number of draws apply() consumes
    [[nodiscard]] int draw_count() const {
        return (randomize_scale ? 3 : 0) + (randomize_rotation ? 3 : 0);
    }
};

} // namespace mcv_gridgen
