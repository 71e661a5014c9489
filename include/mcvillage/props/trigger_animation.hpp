/// @file trigger_animation.hpp
/// @brief Animator intents fired by actors crossing a volume

#pragma once

#include <mcvillage/scene/fwd.hpp>
#include <mcvillage/teleport/animator.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace mcv_props {

using mcv_scene::NodeId;

struct TriggerAnimationSettings {
    std::string enter_trigger{"PlayerEntered"};  ///< Empty disables the enter intent
    std::string exit_trigger{"PlayerExited"};    ///< Empty disables the exit intent
    bool debug_logs{false};
};

/// @brief Sends Open on every actor entry and Close on every exit
///
/// Unlike ProximityDoor there is no occupancy count: two actors entering
/// fire two Open intents.
class TriggerAnimation {
public:
    TriggerAnimation(NodeId volume_node, std::shared_ptr<mcv_teleport::IChestAnimator> animator,
                     TriggerAnimationSettings settings = {});

    void on_actor_enter(NodeId actor);
    void on_actor_exit(NodeId actor);

    [[nodiscard]] NodeId volume_node() const noexcept { return m_volume_node; }
    [[nodiscard]] const TriggerAnimationSettings& settings() const noexcept { return m_settings; }
    [[nodiscard]] std::size_t enter_count() const noexcept { return m_enter_count; }
    [[nodiscard]] std::size_t exit_count() const noexcept { return m_exit_count; }

private:
    NodeId m_volume_node;
    std::shared_ptr<mcv_teleport::IChestAnimator> m_animator;
    TriggerAnimationSettings m_settings;
    std::size_t m_enter_count{0};
    std::size_t m_exit_count{0};
};

} // namespace mcv_props
