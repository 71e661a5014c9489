/// @file plant_grid_generator.cpp
/// @brief PlantGridGenerator implementation for mcv_gridgen module

#include <mcvillage/gridgen/plant_grid_generator.hpp>
#include <mcvillage/gridgen/weighted.hpp>

#include <mcvillage/core/log.hpp>
#include <mcvillage/core/random.hpp>
#include <mcvillage/scene/scene_graph.hpp>

namespace mcv_gridgen {

PlantTypeConfig& PlantGridGenerator::add_plant_type(const std::string& name, TemplateId template_id,
                                                    PlantPrefabType type) {
    PlantTypeConfig config;
    config.name = name;
    config.template_id = template_id;
    config.plant_type = type;
    m_plants.push_back(std::move(config));
    return m_plants.back();
}

bool PlantGridGenerator::is_usable(const PlantTypeConfig& config) const {
    return config.enabled && m_scene.is_valid_template(config.template_id);
}

Result<void> PlantGridGenerator::validate() const {
    auto spec_result = validate_spec();
    if (!spec_result) {
        return spec_result;
    }

    for (const auto& config : m_plants) {
        if (is_usable(config)) {
            return mcv_core::Ok();
        }
    }

    if (!m_scene.is_valid_template(default_template)) {
        return mcv_core::Err(mcv_core::GridError::missing_template(name()));
    }
    return mcv_core::Ok();
}

void PlantGridGenerator::begin_generation() {
    m_usable.clear();
    m_weights.clear();
    for (std::size_t i = 0; i < m_plants.size(); ++i) {
        if (is_usable(m_plants[i])) {
            m_usable.push_back(i);
            m_weights.push_back(m_plants[i].spawn_weight);
        }
    }

    if (m_usable.empty()) {
        mcv_core::gridgen_logger()->warn("'{}' has no valid plant configs, using default template", name());
    }
}

std::optional<Placement> PlantGridGenerator::place_cell(const IVec3& cell, const Vec3& position, NodeId container) {
    std::string plant_name = "Default";
    TemplateId template_id = default_template;
    PlantPrefabType plant_type = default_plant_type;

    if (!m_usable.empty()) {
        const PlantTypeConfig& config = m_plants[m_usable[select_weighted(m_weights, *m_rng)]];
        plant_name = config.name;
        template_id = config.template_id;
        plant_type = config.plant_type;
    }

    mcv_core::gridgen_logger()->trace("Selected plant: {}, Type: {}", plant_name, plant_prefab_type_name(plant_type));

    NodeId node = spawn(template_id, plant_name + "_Plant_" + cell_suffix(cell), position, container);
    if (!node) {
        return std::nullopt;
    }

    transform.apply(m_scene, node, *m_rng);

    Placement placement = make_placement(node, plant_name, cell);
    if (sprites.is_active()) {
        placement.sprite = sprites.apply(m_scene, node, shader, *m_rng, plant_type, &placement.shader_writes);
    } else {
        placement.shader_writes = shader.randomize(m_scene, node, *m_rng);
    }
    return placement;
}

} // namespace mcv_gridgen
