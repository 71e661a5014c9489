/// @file proximity_door.cpp
/// @brief ProximityDoor implementation for mcv_props module

#include <mcvillage/props/proximity_door.hpp>

#include <mcvillage/core/log.hpp>
#include <mcvillage/scene/scene_graph.hpp>

#include <algorithm>

namespace mcv_props {

using mcv_core::Err;
using mcv_core::Error;
using mcv_core::ErrorCode;
using mcv_core::Result;

namespace {

/// Below this the swing snaps onto its target
constexpr float k_snap_angle_degrees = 0.1f;

} // anonymous namespace

ProximityDoor::ProximityDoor(mcv_scene::SceneGraph& scene, NodeId door, DoorSettings settings,
                             std::shared_ptr<mcv_teleport::IChestAnimator> animator)
    : m_scene(scene)
    , m_door(door)
    , m_settings(std::move(settings))
    , m_animator(std::move(animator)) {
}

Result<void> ProximityDoor::setup() {
    if (!m_scene.is_valid(m_door)) {
        return Err(Error(ErrorCode::NotFound, "Door node is not valid"));
    }
    m_name = m_scene.name(m_door);

    const Vec3 door_position = m_scene.world_position(m_door);
    const Quat door_rotation = m_scene.world_rotation(m_door);

    if (!m_settings.pivot_name.empty()) {
        m_pivot = m_scene.find_by_name(m_settings.pivot_name);
        if (!m_pivot) {
            Error error(ErrorCode::NotFound, "Door pivot not found");
            error.with_context("door", m_name).with_context("pivot", m_settings.pivot_name);
            return Err(std::move(error));
        }
        if (m_scene.is_ancestor_or_self(m_door, m_pivot)) {
            Error error(ErrorCode::InvalidArgument, "Door pivot must not be the door or one of its children");
            error.with_context("door", m_name).with_context("pivot", m_settings.pivot_name);
            return Err(std::move(error));
        }
    } else {
        // Hinge on the door's left edge
        const Vec3 right = mcv_math::rotate(door_rotation, Vec3(1.0f, 0.0f, 0.0f));
        const Vec3 pivot_position = door_position - right * (m_settings.door_width * 0.5f);

        m_pivot = m_scene.create_node(m_name + "_Pivot", m_scene.parent(m_door));
        m_scene.set_world_pose(m_pivot, pivot_position, door_rotation);
    }

    if (!m_scene.is_ancestor_or_self(m_pivot, m_door)) {
        m_scene.set_parent(m_door, m_pivot);
        m_scene.set_world_pose(m_door, door_position, door_rotation);
    }

    m_closed_rotation = m_scene.local_transform(m_pivot).rotation;
    m_target_rotation = m_closed_rotation;
    m_target_angle = 0.0f;
    m_open = false;
    m_ready = true;

    if (m_settings.debug_logs) {
        mcv_core::props_logger()->info("[{}] Door initialized with pivot at {}", m_name,
                                       glm::to_string(m_scene.world_position(m_pivot)));
    }
    return mcv_core::Ok();
}

NodeId ProximityDoor::detect_actor() const {
    const Vec3 center = m_scene.world_position(m_door);
    const float radius_sq = m_settings.detection_radius * m_settings.detection_radius;
    for (NodeId actor : m_scene.find_with_tag(m_settings.actor_tag)) {
        if (glm::length2(m_scene.world_position(actor) - center) <= radius_sq) {
            return actor;
        }
    }
    return {};
}

void ProximityDoor::tick(float dt) {
    if (!m_ready) {
        return;
    }
    if (!m_scene.is_valid(m_door) || !m_scene.is_valid(m_pivot)) {
        mcv_core::props_logger()->warn("[{}] Door or pivot destroyed, door disabled", m_name);
        m_ready = false;
        return;
    }

    NodeId actor = detect_actor();
    m_actor_in_range = static_cast<bool>(actor);

    if (m_actor_in_range && !m_open) {
        open(m_scene.world_position(actor));
    } else if (!m_actor_in_range && m_open) {
        close();
    }

    swing(dt);
}

void ProximityDoor::open(const Vec3& actor_position) {
    if (m_open || !m_ready) {
        return;
    }

    Vec3 to_actor = actor_position - m_scene.world_position(m_door);
    to_actor.y = 0.0f;
    const Vec3 forward = mcv_math::rotate(m_scene.world_rotation(m_door), Vec3(0.0f, 0.0f, 1.0f));
    const float facing = glm::length2(to_actor) > 0.0f ? glm::dot(forward, glm::normalize(to_actor)) : 0.0f;
    m_actor_behind = facing < 0.0f;

    m_target_angle = m_actor_behind ? m_settings.rotation_angle : -m_settings.rotation_angle;
    m_target_rotation = m_closed_rotation * mcv_math::quat_from_euler_degrees(Vec3(0.0f, m_target_angle, 0.0f));
    m_open = true;

    if (m_settings.debug_logs) {
        mcv_core::props_logger()->info("[{}] Opening door {}", m_name, m_actor_behind ? "NORTH" : "SOUTH");
    }
    if (m_animator) {
        m_animator->set_intent(mcv_teleport::AnimationIntent::Open);
    }
    if (m_settings.open_speed <= 0.0f) {
        m_scene.set_local_rotation(m_pivot, m_target_rotation);
    }
}

void ProximityDoor::close() {
    if (!m_open || !m_ready) {
        return;
    }

    m_target_rotation = m_closed_rotation;
    m_target_angle = 0.0f;
    m_open = false;

    if (m_settings.debug_logs) {
        mcv_core::props_logger()->info("[{}] Closing door", m_name);
    }
    if (m_animator) {
        m_animator->set_intent(mcv_teleport::AnimationIntent::Close);
    }
    if (m_settings.open_speed <= 0.0f) {
        m_scene.set_local_rotation(m_pivot, m_target_rotation);
    }
}

void ProximityDoor::swing(float dt) {
    const Quat current = m_scene.local_transform(m_pivot).rotation;
    if (current == m_target_rotation) {
        return;
    }

    const float t = std::clamp(m_settings.open_speed * dt, 0.0f, 1.0f);
    Quat next = glm::normalize(glm::slerp(current, m_target_rotation, t));
    if (mcv_math::angle_degrees(next, m_target_rotation) < k_snap_angle_degrees) {
        next = m_target_rotation;
    }
    m_scene.set_local_rotation(m_pivot, next);
}

bool ProximityDoor::is_moving() const {
    if (!m_ready || !m_scene.is_valid(m_pivot)) {
        return false;
    }
    return m_scene.local_transform(m_pivot).rotation != m_target_rotation;
}

} // namespace mcv_props
