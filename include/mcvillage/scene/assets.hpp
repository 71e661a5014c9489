/// @file assets.hpp
/// @brief Named textures, materials and templates loaded from JSON
///
/// World files refer to assets by name. AssetLookup maps those names to the
/// handles the scene graph understands.
///
/// Format:
/// ```json
/// {
///   "textures": ["wheat_sheet", "eye_open"],
///   "materials": [
///     {"name": "crop", "properties": {"_Stage": 0, "_MainTex": "wheat_sheet", "_Color": [1, 1, 1, 1]}}
///   ],
///   "templates": [
///     {"name": "Wheat", "node": {"name": "Wheat", "renderers": [["crop"]], "children": []}}
///   ]
/// }
/// ```

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <mcvillage/core/error.hpp>

#include <nlohmann/json_fwd.hpp>

#include <map>
#include <memory>
#include <string>

namespace mcv_scene {

// =============================================================================
// AssetLookup
// =============================================================================

struct AssetLookup {
    std::map<std::string, TextureId> textures;
    std::map<std::string, std::shared_ptr<const Material>> materials;
    std::map<std::string, TemplateId> templates;

    /// @brief Register a texture name, returning its (possibly existing) handle
    TextureId add_texture(const std::string& name);

    /// @brief Resolve names, reporting UnknownReference under `key`
    [[nodiscard]] mcv_core::Result<TextureId> find_texture(const std::string& name, const std::string& key) const;
    [[nodiscard]] mcv_core::Result<std::shared_ptr<const Material>> find_material(const std::string& name,
                                                                                 const std::string& key) const;
    [[nodiscard]] mcv_core::Result<TemplateId> find_template(const std::string& name, const std::string& key) const;

    /// @brief Reverse lookup for logs (empty if unknown)
    [[nodiscard]] std::string texture_name(TextureId id) const;

private:
    std::uint64_t m_next_texture{1};
};

// =============================================================================
// Loading
// =============================================================================

/// @brief Load "textures", "materials" and "templates" sections
mcv_core::Result<void> load_assets(const nlohmann::json& j, SceneGraph& scene, AssetLookup& assets);

/// @brief Parse a material definition
mcv_core::Result<std::shared_ptr<Material>> material_from_json(const nlohmann::json& j, AssetLookup& assets);

/// @brief Build a node subtree
///
/// Node keys: "name", "tag", "transform", "renderers" (list of material-name
/// lists), "volume" (see VolumeFactory::from_json), "children".
mcv_core::Result<NodeId> node_from_json(const nlohmann::json& j, SceneGraph& scene,
                                        const AssetLookup& assets, NodeId parent = {});

} // namespace mcv_scene
