/// @file serialization.hpp
/// @brief JSON loading for doors, trigger animations and chains
///
/// ```json
/// {"doors": [{"node": "Door", "rotation_angle": 90, "open_speed": 3.0, "detection_radius": 3.0,
///             "door_width": 1.0, "pivot": "", "animator": "DoorAnim"}],
///  "trigger_animations": [{"volume": "GateTrigger", "animator": "Gate",
///                          "enter_trigger": "PlayerEntered", "exit_trigger": "PlayerExited"}],
///  "chains": [{"owner": "Lamp", "mount": "LampMount", "lantern": "Lantern", "link_template": "ChainLink",
///              "spacing": 0.1, "thickness": 1.0, "last_link_rotation": [0, 0, 0]}]}
/// ```

#pragma once

#include "chain_generator.hpp"
#include "door_set.hpp"

#include <mcvillage/core/error.hpp>
#include <mcvillage/scene/assets.hpp>

#include <nlohmann/json_fwd.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mcv_props {

/// @brief Supplies the animator named by an entry's "animator" key
///
/// Entries without the key pass their node name.
using AnimatorFactory = std::function<std::shared_ptr<mcv_teleport::IChestAnimator>(const std::string& label)>;

mcv_core::Result<DoorSettings> door_settings_from_json(const nlohmann::json& j);

mcv_core::Result<TriggerAnimationSettings> trigger_animation_settings_from_json(const nlohmann::json& j);

/// @brief Parse ChainSettings; the link template is resolved through `assets`
mcv_core::Result<ChainSettings> chain_settings_from_json(const nlohmann::json& j,
                                                         const mcv_scene::AssetLookup& assets);

/// @brief Add every "doors" and "trigger_animations" entry of a world to `doors`
///
/// Named nodes must exist. A missing array is not an error.
mcv_core::Result<void> doors_from_json(const nlohmann::json& world, mcv_scene::SceneGraph& scene, DoorSet& doors,
                                       const AnimatorFactory& animators);

/// @brief Build one ChainGenerator per "chains" entry; owners are created when missing
mcv_core::Result<std::vector<std::unique_ptr<ChainGenerator>>> chains_from_json(
    const nlohmann::json& world, mcv_scene::SceneGraph& scene, const mcv_scene::AssetLookup& assets);

} // namespace mcv_props
