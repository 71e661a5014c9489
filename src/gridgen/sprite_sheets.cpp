/// @file sprite_sheets.cpp
/// @brief SpriteSheetManager implementation for mcv_gridgen module

#include <mcvillage/gridgen/sprite_sheets.hpp>
#include <mcvillage/gridgen/shader_parameters.hpp>

#include <mcvillage/core/log.hpp>
#include <mcvillage/core/random.hpp>
#include <mcvillage/scene/scene_graph.hpp>

#include <algorithm>
#include <cmath>

namespace mcv_gridgen {

int SpriteSheet::total_frames() const {
    int cells = std::max(columns, 0) * std::max(rows, 0);
    return std::max(std::min(frame_count, cells), 0);
}

std::vector<std::size_t> SpriteSheetManager::compatible_sheets(PlantPrefabType filter) const {
    std::vector<std::size_t> result;
    for (std::size_t i = 0; i < sheets.size(); ++i) {
        if (prefab_types_compatible(sheets[i].prefab_type, filter)) {
            result.push_back(i);
        }
    }
    return result;
}

std::optional<SpriteSelection> SpriteSheetManager::apply(mcv_scene::SceneGraph& scene, NodeId node,
                                                         const ShaderParameterManager& shader,
                                                         mcv_core::IRandomSource& rng,
                                                         PlantPrefabType filter,
                                                         std::size_t* shader_writes) const {
    auto candidates = compatible_sheets(filter);
    if (candidates.empty()) {
        mcv_core::gridgen_logger()->debug("No sprite sheet compatible with {} for '{}'",
                                          plant_prefab_type_name(filter), scene.name(node));
        std::size_t writes = shader.randomize(scene, node, rng);
        if (shader_writes) {
            *shader_writes = writes;
        }
        return std::nullopt;
    }

    int pick = rng.range_int(0, static_cast<int>(candidates.size()));
    std::size_t sheet_index = candidates[static_cast<std::size_t>(pick)];
    const SpriteSheet& sheet = sheets[sheet_index];

    int total = sheet.total_frames();
    int frame = rng.range_int(0, total);

    for (mcv_scene::Renderer* renderer : scene.collect_renderers(node)) {
        if (sheet.texture) {
            renderer->set_texture_on_declaring(properties.main_texture, sheet.texture);
        }
        renderer->set_float_on_declaring(properties.columns, static_cast<float>(sheet.columns));
        renderer->set_float_on_declaring(properties.rows, static_cast<float>(sheet.rows));
        renderer->set_float_on_declaring(properties.stage_count, static_cast<float>(total));
        renderer->set_float_on_declaring(properties.stage, static_cast<float>(frame));
        if (sheet.use_color_tint) {
            renderer->set_color_on_declaring(properties.color, sheet.color_tint);
        }
    }

    mcv_core::gridgen_logger()->trace("'{}' uses sheet '{}' frame {}/{}", scene.name(node), sheet.name, frame, total);

    std::size_t writes = shader.randomize(scene, node, rng, properties.stage);
    if (shader_writes) {
        *shader_writes = writes;
    }

    return SpriteSelection{sheet_index, frame, total};
}

GridLayout SpriteSheetManager::detect_grid_size(int width, int height) {
    if (width <= 0 || height <= 0) {
        return {1, 1};
    }

    if (width > height * 2) {
        int frames = static_cast<int>(std::lround(static_cast<double>(width) / height));
        return {std::max(frames, 1), 1};
    }

    if (height > width * 2) {
        int frames = static_cast<int>(std::lround(static_cast<double>(height) / width));
        return {1, std::max(frames, 1)};
    }

    double area = static_cast<double>(width) * height;
    int side = static_cast<int>(std::lround(std::sqrt(area / (width * 0.25))));
    return {std::max(side, 1), std::max(side, 1)};
}

} // namespace mcv_gridgen
