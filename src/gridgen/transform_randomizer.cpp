/// @file transform_randomizer.cpp
/// @brief TransformRandomizer implementation for mcv_gridgen module

#include <mcvillage/gridgen/transform_randomizer.hpp>

#include <mcvillage/core/random.hpp>
#include <mcvillage/scene/scene_graph.hpp>

namespace mcv_gridgen {

void TransformRandomizer::apply(mcv_scene::SceneGraph& scene, NodeId node, mcv_core::IRandomSource& rng) const {
    if (randomize_scale) {
        float x = rng.range(min_scale.x, max_scale.x);
        float y = rng.range(min_scale.y, max_scale.y);
        float z = rng.range(min_scale.z, max_scale.z);
        scene.set_local_scale(node, Vec3(x, y, z));
    }

    if (randomize_rotation) {
        float x = rng.range(min_rotation.x, max_rotation.x);
        float y = rng.range(min_rotation.y, max_rotation.y);
        float z = rng.range(min_rotation.z, max_rotation.z);
        scene.set_local_rotation(node, mcv_math::quat_from_euler_degrees(Vec3(x, y, z)));
    }
}

} // namespace mcv_gridgen
