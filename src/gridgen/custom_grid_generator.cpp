/// @file custom_grid_generator.cpp
/// @brief CustomGridGenerator implementation for mcv_gridgen module

#include <mcvillage/gridgen/custom_grid_generator.hpp>
#include <mcvillage/gridgen/weighted.hpp>

#include <mcvillage/core/log.hpp>
#include <mcvillage/core/random.hpp>
#include <mcvillage/scene/scene_graph.hpp>

#include <algorithm>

namespace mcv_gridgen {

ObjectTypeEntry& CustomGridGenerator::add_object_type(const std::string& name, TemplateId template_id) {
    ObjectTypeEntry entry;
    entry.name = name;
    entry.template_id = template_id;
    m_types.push_back(std::move(entry));
    return m_types.back();
}

bool CustomGridGenerator::is_usable(const ObjectTypeEntry& entry) const {
    return entry.enabled && m_scene.is_valid_template(entry.template_id);
}

Result<void> CustomGridGenerator::validate() const {
    auto spec_result = validate_spec();
    if (!spec_result) {
        return spec_result;
    }

    bool any = std::any_of(m_types.begin(), m_types.end(),
                           [this](const ObjectTypeEntry& entry) { return is_usable(entry); });
    if (!any) {
        return mcv_core::Err(mcv_core::GridError::no_enabled_types(name()));
    }
    return mcv_core::Ok();
}

std::optional<Placement> CustomGridGenerator::place_cell(const IVec3& cell, const Vec3& position, NodeId container) {
    std::vector<std::size_t> survivors;
    std::vector<float> weights;

    for (std::size_t i = 0; i < m_types.size(); ++i) {
        const auto& entry = m_types[i];
        if (!is_usable(entry)) {
            continue;
        }
        if (entry.uses_spawn_probability() && !(m_rng->value() < entry.spawn_probability)) {
            continue;
        }
        survivors.push_back(i);
        weights.push_back(entry.spawn_weight);
    }

    if (survivors.empty()) {
        mcv_core::gridgen_logger()->debug("'{}' skipped cell {}: every type gated out", name(), cell_suffix(cell));
        return std::nullopt;
    }

    const ObjectTypeEntry& entry = m_types[survivors[select_weighted(weights, *m_rng)]];

    NodeId node = spawn(entry.template_id, entry.name + "_" + cell_suffix(cell), position, container);
    if (!node) {
        return std::nullopt;
    }

    entry.transform.apply(m_scene, node, *m_rng);

    Placement placement = make_placement(node, entry.name, cell);
    if (entry.sprites.is_active()) {
        placement.sprite = entry.sprites.apply(m_scene, node, entry.shader, *m_rng, PlantPrefabType::Any,
                                               &placement.shader_writes);
    } else {
        placement.shader_writes = entry.shader.randomize(m_scene, node, *m_rng);
    }
    return placement;
}

} // namespace mcv_gridgen
