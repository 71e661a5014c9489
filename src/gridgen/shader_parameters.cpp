/// @file shader_parameters.cpp
/// @brief ShaderParameterManager implementation for mcv_gridgen module

#include <mcvillage/gridgen/shader_parameters.hpp>

#include <mcvillage/core/log.hpp>
#include <mcvillage/core/random.hpp>
#include <mcvillage/scene/scene_graph.hpp>

namespace mcv_gridgen {

ShaderParameterManager::ShaderParameterManager(std::vector<ShaderFloatParameter> parameters)
    : m_parameters(std::move(parameters)) {
}

std::vector<ShaderFloatParameter> ShaderParameterManager::default_parameters() {
    return {
        ShaderFloatParameter("_Stage", 0.0f, 1.0f),
        ShaderFloatParameter("_WaveSpeed", 0.5f, 2.0f),
    };
}

std::size_t ShaderParameterManager::randomize(mcv_scene::SceneGraph& scene, NodeId node,
                                              mcv_core::IRandomSource& rng,
                                              const std::string& skip_property) const {
    auto renderers = scene.collect_renderers(node);
    if (renderers.empty()) {
        mcv_core::gridgen_logger()->warn("No renderer found on '{}' to modify shader properties",
                                         scene.name(node));
        return 0;
    }

    std::size_t writes = 0;
    for (const auto& param : m_parameters) {
        if (!param.enabled || (!skip_property.empty() && param.name == skip_property)) {
            continue;
        }

        float value = rng.range(param.min_value, param.max_value);

        std::size_t written = 0;
        for (mcv_scene::Renderer* renderer : renderers) {
            written += renderer->set_float_on_declaring(param.name, value);
        }

        if (written == 0) {
            mcv_core::gridgen_logger()->debug("'{}' has no material declaring {}", scene.name(node), param.name);
        } else {
            mcv_core::gridgen_logger()->trace("Set {} to {} on {} slot(s) of '{}'",
                                              param.name, value, written, scene.name(node));
        }
        writes += written;
    }

    return writes;
}

} // namespace mcv_gridgen
