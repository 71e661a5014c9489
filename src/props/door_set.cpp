/// @file door_set.cpp
/// @brief DoorSet implementation for mcv_props module

#include <mcvillage/props/door_set.hpp>

#include <mcvillage/core/log.hpp>
#include <mcvillage/scene/scene_graph.hpp>

namespace mcv_props {

using mcv_core::Err;
using mcv_core::Error;
using mcv_core::ErrorCode;
using mcv_core::Result;

DoorSet::DoorSet(mcv_scene::SceneGraph& scene, std::string actor_tag)
    : m_scene(scene)
    , m_monitor(std::move(actor_tag)) {
}

Result<void> DoorSet::add_door(NodeId door, DoorSettings settings,
                               std::shared_ptr<mcv_teleport::IChestAnimator> animator) {
    auto entry = std::make_unique<ProximityDoor>(m_scene, door, std::move(settings), std::move(animator));
    if (auto r = entry->setup(); !r) {
        return r;
    }
    m_doors.push_back(std::move(entry));
    return mcv_core::Ok();
}

Result<void> DoorSet::add_trigger_animation(NodeId volume_node,
                                            std::shared_ptr<mcv_teleport::IChestAnimator> animator,
                                            TriggerAnimationSettings settings) {
    if (!m_scene.is_valid(volume_node)) {
        return Err(Error(ErrorCode::NotFound, "Trigger volume node is not valid"));
    }
    const std::string& name = m_scene.name(volume_node);
    if (!m_scene.volume(volume_node)) {
        Error error(ErrorCode::NotFound, "Trigger volume not assigned");
        error.with_context("node", name);
        return Err(std::move(error));
    }
    if (!animator) {
        Error error(ErrorCode::InvalidArgument, "Target animator not assigned");
        error.with_context("node", name);
        return Err(std::move(error));
    }

    auto entry = std::make_unique<TriggerAnimation>(volume_node, std::move(animator), std::move(settings));
    TriggerAnimation* trigger = entry.get();
    m_monitor.watch(
        volume_node,
        [trigger](NodeId actor) { trigger->on_actor_enter(actor); },
        [trigger](NodeId actor) { trigger->on_actor_exit(actor); });
    m_triggers.push_back(std::move(entry));

    mcv_core::props_logger()->debug("Watching {} for '{}' actors", name, m_monitor.actor_tag());
    return mcv_core::Ok();
}

void DoorSet::tick(float dt) {
    m_monitor.update(m_scene);
    for (auto& door : m_doors) {
        door->tick(dt);
    }
}

} // namespace mcv_props
