/// @file trigger_animation.cpp
/// @brief TriggerAnimation implementation for mcv_props module

#include <mcvillage/props/trigger_animation.hpp>

#include <mcvillage/core/log.hpp>

namespace mcv_props {

using mcv_teleport::AnimationIntent;

TriggerAnimation::TriggerAnimation(NodeId volume_node, std::shared_ptr<mcv_teleport::IChestAnimator> animator,
                                   TriggerAnimationSettings settings)
    : m_volume_node(volume_node)
    , m_animator(std::move(animator))
    , m_settings(std::move(settings)) {
}

void TriggerAnimation::on_actor_enter(NodeId actor) {
    if (!m_animator || m_settings.enter_trigger.empty()) {
        return;
    }
    ++m_enter_count;
    if (m_settings.debug_logs) {
        mcv_core::props_logger()->info("Actor {} entered, firing {}", actor.value, m_settings.enter_trigger);
    }
    m_animator->set_intent(AnimationIntent::Open);
}

void TriggerAnimation::on_actor_exit(NodeId actor) {
    if (!m_animator || m_settings.exit_trigger.empty()) {
        return;
    }
    ++m_exit_count;
    if (m_settings.debug_logs) {
        mcv_core::props_logger()->info("Actor {} left, firing {}", actor.value, m_settings.exit_trigger);
    }
    m_animator->set_intent(AnimationIntent::Close);
}

} // namespace mcv_props
