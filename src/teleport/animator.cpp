/// @file animator.cpp
/// @brief Animator helpers for mcv_teleport module

#include <mcvillage/teleport/animator.hpp>

#include <mcvillage/core/log.hpp>

#include <algorithm>

namespace mcv_teleport {

const char* animation_intent_name(AnimationIntent intent) {
    switch (intent) {
        case AnimationIntent::Open: return "Open";
        case AnimationIntent::Close: return "Close";
    }
    return "Unknown";
}

RecordingChestAnimator::RecordingChestAnimator(std::string label)
    : m_label(std::move(label)) {
}

void RecordingChestAnimator::set_intent(AnimationIntent intent) {
    m_history.push_back(intent);
    m_open = intent == AnimationIntent::Open;
    mcv_core::teleport_logger()->trace("[{}] animator -> {}", m_label, animation_intent_name(intent));
}

std::size_t RecordingChestAnimator::count(AnimationIntent intent) const {
    return static_cast<std::size_t>(std::count(m_history.begin(), m_history.end(), intent));
}

} // namespace mcv_teleport
