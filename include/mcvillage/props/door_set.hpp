/// @file door_set.hpp
/// @brief Owner of a scene's doors and trigger animations

#pragma once

#include "proximity_door.hpp"
#include "trigger_animation.hpp"

#include <mcvillage/scene/volume_monitor.hpp>

#include <memory>
#include <string>
#include <vector>

namespace mcv_props {

/// @brief Ticks doors and routes volume events to trigger animations
///
/// Trigger animations are driven by one VolumeMonitor filtering on the
/// set's actor tag; doors poll their own radius.
class DoorSet {
public:
    explicit DoorSet(mcv_scene::SceneGraph& scene, std::string actor_tag = "Player");

    /// @brief Set up and adopt a door; nothing is kept on failure
    mcv_core::Result<void> add_door(NodeId door, DoorSettings settings,
                                    std::shared_ptr<mcv_teleport::IChestAnimator> animator = nullptr);

    /// @brief Watch a node's volume for the given animator
    ///
    /// Fails with NotFound when the node is invalid or carries no volume and
    /// with InvalidArgument when `animator` is null.
    mcv_core::Result<void> add_trigger_animation(NodeId volume_node,
                                                 std::shared_ptr<mcv_teleport::IChestAnimator> animator,
                                                 TriggerAnimationSettings settings = {});

    /// @brief Dispatch volume events, then tick every door
    void tick(float dt);

    [[nodiscard]] const std::vector<std::unique_ptr<ProximityDoor>>& doors() const noexcept { return m_doors; }
    [[nodiscard]] const std::vector<std::unique_ptr<TriggerAnimation>>& trigger_animations() const noexcept {
        return m_triggers;
    }
    [[nodiscard]] const mcv_scene::VolumeMonitor& monitor() const noexcept { return m_monitor; }

private:
    mcv_scene::SceneGraph& m_scene;
    mcv_scene::VolumeMonitor m_monitor;
    std::vector<std::unique_ptr<ProximityDoor>> m_doors;
    std::vector<std::unique_ptr<TriggerAnimation>> m_triggers;
};

} // namespace mcv_props
