/// @file proximity_door.hpp
/// @brief Doors that swing away from a nearby actor

#pragma once

#include <mcvillage/core/error.hpp>
#include <mcvillage/math/types.hpp>
#include <mcvillage/scene/fwd.hpp>
#include <mcvillage/teleport/animator.hpp>

#include <memory>
#include <string>

namespace mcv_props {

using mcv_math::Quat;
using mcv_math::Vec3;
using mcv_scene::NodeId;

struct DoorSettings {
    std::string actor_tag{"Player"};
    float rotation_angle{90.0f};     ///< Degrees about the pivot's Y axis
    float open_speed{3.0f};          ///< Slerp rate per second; <= 0 snaps
    float detection_radius{3.0f};    ///< Around the door's world position
    float door_width{0.0f};          ///< Hinge offset along the door's -X when a pivot is created
    std::string pivot_name;          ///< Existing pivot node; empty creates `<door>_Pivot`
    bool debug_logs{false};
};

// =============================================================================
// ProximityDoor
// =============================================================================

/// @brief Opens while a tagged actor is within range, closes when none is
///
/// The door is parented under a pivot node whose local rotation is slerped
/// toward the target each tick and snapped once within 0.1 degrees. The
/// opening direction is chosen from the side the actor stands on relative to
/// the door's +Z, measured in the XZ plane: an actor behind the door swings it
/// by +rotation_angle, otherwise by -rotation_angle.
///
/// @code
/// ProximityDoor door(scene, scene.find_by_name("Door"));
/// if (auto r = door.setup(); !r) { ... }
/// door.tick(dt);
/// @endcode
class ProximityDoor {
public:
    ProximityDoor(mcv_scene::SceneGraph& scene, NodeId door, DoorSettings settings = {},
                  std::shared_ptr<mcv_teleport::IChestAnimator> animator = nullptr);

    /// @brief Resolve or create the pivot and reparent the door under it
    ///
    /// Fails with NotFound when the door or a named pivot is missing.
    mcv_core::Result<void> setup();

    /// @brief Detect actors, open or close, then advance the swing
    void tick(float dt);

    /// @brief Start opening away from `actor_position`
    void open(const Vec3& actor_position);

    /// @brief Start closing
    void close();

    [[nodiscard]] bool is_open() const noexcept { return m_open; }
    [[nodiscard]] bool is_moving() const;
    [[nodiscard]] bool actor_in_range() const noexcept { return m_actor_in_range; }
    [[nodiscard]] bool is_ready() const noexcept { return m_ready; }

    [[nodiscard]] NodeId door() const noexcept { return m_door; }
    [[nodiscard]] NodeId pivot() const noexcept { return m_pivot; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const DoorSettings& settings() const noexcept { return m_settings; }

    /// @brief Pivot local rotation when closed
    [[nodiscard]] const Quat& closed_rotation() const noexcept { return m_closed_rotation; }
    [[nodiscard]] const Quat& target_rotation() const noexcept { return m_target_rotation; }

    /// @brief Signed swing of the current target from the closed rotation
    [[nodiscard]] float target_angle() const noexcept { return m_target_angle; }

private:
    /// First tagged actor within detection_radius, or an invalid id
    NodeId detect_actor() const;
    void swing(float dt);

    mcv_scene::SceneGraph& m_scene;
    NodeId m_door;
    NodeId m_pivot;
    DoorSettings m_settings;
    std::shared_ptr<mcv_teleport::IChestAnimator> m_animator;
    std::string m_name;

    Quat m_closed_rotation{mcv_math::quat::IDENTITY};
    Quat m_target_rotation{mcv_math::quat::IDENTITY};
    float m_target_angle{0.0f};

    bool m_ready{false};
    bool m_open{false};
    bool m_actor_in_range{false};
    bool m_actor_behind{false};
};

} // namespace mcv_props
