/// @file assets.cpp
/// @brief JSON asset loading for mcv_scene module

#include <mcvillage/scene/assets.hpp>
#include <mcvillage/scene/scene_graph.hpp>

#include <mcvillage/core/config.hpp>
#include <mcvillage/core/log.hpp>
#include <mcvillage/math/json.hpp>

#include <nlohmann/json.hpp>

namespace mcv_scene {

using mcv_core::ConfigError;
using mcv_core::Err;
using mcv_core::Error;
using mcv_core::Ok;
using mcv_core::Result;

// =============================================================================
// AssetLookup
// =============================================================================

TextureId AssetLookup::add_texture(const std::string& name) {
    auto it = textures.find(name);
    if (it != textures.end()) {
        return it->second;
    }
    TextureId id{m_next_texture++};
    textures[name] = id;
    return id;
}

Result<TextureId> AssetLookup::find_texture(const std::string& name, const std::string& key) const {
    auto it = textures.find(name);
    if (it == textures.end()) {
        return Err<TextureId>(ConfigError::unknown_reference(key, name));
    }
    return Ok(it->second);
}

Result<std::shared_ptr<const Material>> AssetLookup::find_material(const std::string& name,
                                                                   const std::string& key) const {
    auto it = materials.find(name);
    if (it == materials.end()) {
        return Err<std::shared_ptr<const Material>>(ConfigError::unknown_reference(key, name));
    }
    return Ok(it->second);
}

Result<TemplateId> AssetLookup::find_template(const std::string& name, const std::string& key) const {
    auto it = templates.find(name);
    if (it == templates.end()) {
        return Err<TemplateId>(ConfigError::unknown_reference(key, name));
    }
    return Ok(it->second);
}

std::string AssetLookup::texture_name(TextureId id) const {
    for (const auto& [name, tex] : textures) {
        if (tex == id) {
            return name;
        }
    }
    return {};
}

// =============================================================================
// Materials
// =============================================================================

Result<std::shared_ptr<Material>> material_from_json(const nlohmann::json& j, AssetLookup& assets) {
    using MaterialResult = Result<std::shared_ptr<Material>>;

    if (auto r = mcv_core::expect_object(j, "material"); !r) {
        return MaterialResult(r.error());
    }

    auto material = std::make_shared<Material>();
    if (auto r = mcv_core::read_required(j, "name", material->name); !r) {
        return MaterialResult(r.error());
    }

    auto props = j.find("properties");
    if (props == j.end()) {
        return MaterialResult(material);
    }
    if (!props->is_object()) {
        return MaterialResult(Error(ConfigError::wrong_type("material.properties", "an object")));
    }

    for (const auto& [property, value] : props->items()) {
        const std::string key = "material." + material->name + "." + property;
        if (value.is_number()) {
            material->declare(property, value.get<float>());
        } else if (value.is_string()) {
            // Texture properties name a texture; unknown names are registered
            material->declare(property, assets.add_texture(value.get<std::string>()));
        } else if (value.is_array()) {
            auto color = mcv_math::color_from_json(value, key);
            if (!color) {
                return MaterialResult(color.error());
            }
            material->declare(property, *color);
        } else {
            return MaterialResult(Error(ConfigError::wrong_type(key, "a number, texture name or color")));
        }
    }

    return MaterialResult(material);
}

// =============================================================================
// Nodes
// =============================================================================

Result<NodeId> node_from_json(const nlohmann::json& j, SceneGraph& scene,
                              const AssetLookup& assets, NodeId parent) {
    if (auto r = mcv_core::expect_object(j, "node"); !r) {
        return Err<NodeId>(r.error());
    }

    std::string name = "Node";
    std::string tag;
    if (auto r = mcv_core::read_optional(j, "name", name); !r) {
        return Err<NodeId>(r.error());
    }
    if (auto r = mcv_core::read_optional(j, "tag", tag); !r) {
        return Err<NodeId>(r.error());
    }

    NodeId node = scene.create_node(name, parent);
    scene.set_tag(node, tag);

    // Any failure below removes the partially built subtree
    auto fail = [&scene, node](Error error) {
        scene.destroy(node);
        return Err<NodeId>(std::move(error));
    };

    if (j.contains("transform")) {
        auto t = mcv_math::transform_from_json(j["transform"], name + ".transform");
        if (!t) {
            return fail(t.error());
        }
        scene.set_local_transform(node, *t);
    }

    if (j.contains("renderers")) {
        const auto& list = j["renderers"];
        if (!list.is_array()) {
            return fail(ConfigError::wrong_type(name + ".renderers", "an array of material lists"));
        }
        for (const auto& slots : list) {
            if (!slots.is_array()) {
                return fail(ConfigError::wrong_type(name + ".renderers", "an array of material lists"));
            }
            std::vector<std::shared_ptr<const Material>> materials;
            for (const auto& slot : slots) {
                if (!slot.is_string()) {
                    return fail(ConfigError::wrong_type(name + ".renderers", "material names"));
                }
                auto material = assets.find_material(slot.get<std::string>(), name + ".renderers");
                if (!material) {
                    return fail(material.error());
                }
                materials.push_back(*material);
            }
            scene.add_renderer(node, Renderer(std::move(materials)));
        }
    }

    if (j.contains("volume")) {
        auto volume = VolumeFactory::from_json(j["volume"]);
        if (!volume) {
            return fail(volume.error());
        }
        scene.set_volume(node, std::move(*volume));
    }

    if (j.contains("children")) {
        const auto& kids = j["children"];
        if (!kids.is_array()) {
            return fail(ConfigError::wrong_type(name + ".children", "an array"));
        }
        for (const auto& child : kids) {
            auto c = node_from_json(child, scene, assets, node);
            if (!c) {
                return fail(c.error());
            }
        }
    }

    return Ok(node);
}

// =============================================================================
// Asset Sections
// =============================================================================

Result<void> load_assets(const nlohmann::json& j, SceneGraph& scene, AssetLookup& assets) {
    if (auto it = j.find("textures"); it != j.end()) {
        if (!it->is_array()) {
            return Err(ConfigError::wrong_type("textures", "an array of names"));
        }
        for (const auto& tex : *it) {
            if (!tex.is_string()) {
                return Err(ConfigError::wrong_type("textures", "an array of names"));
            }
            assets.add_texture(tex.get<std::string>());
        }
    }

    if (auto it = j.find("materials"); it != j.end()) {
        if (!it->is_array()) {
            return Err(ConfigError::wrong_type("materials", "an array"));
        }
        for (const auto& entry : *it) {
            auto material = material_from_json(entry, assets);
            if (!material) {
                return Err(material.error());
            }
            assets.materials[(*material)->name] = *material;
        }
    }

    if (auto it = j.find("templates"); it != j.end()) {
        if (!it->is_array()) {
            return Err(ConfigError::wrong_type("templates", "an array"));
        }
        for (const auto& entry : *it) {
            std::string name;
            if (auto r = mcv_core::read_required(entry, "name", name); !r) {
                return r;
            }
            if (!entry.contains("node")) {
                return Err(Error(mcv_core::ErrorCode::ParseError, "Template '" + name + "' has no node"));
            }
            auto root = node_from_json(entry["node"], scene, assets);
            if (!root) {
                return Err(root.error());
            }
            assets.templates[name] = scene.make_template(*root);
        }
    }

    mcv_core::scene_logger()->debug("Loaded {} textures, {} materials, {} templates",
                                    assets.textures.size(), assets.materials.size(), assets.templates.size());
    return Ok();
}

} // namespace mcv_scene
