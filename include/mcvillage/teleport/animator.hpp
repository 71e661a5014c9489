/// @file animator.hpp
/// @brief Chest door animation driver interface

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mcv_teleport {

/// @brief Door animation request
enum class AnimationIntent : std::uint8_t {
    Open,
    Close
};

[[nodiscard]] const char* animation_intent_name(AnimationIntent intent);

/// @brief Host-side animation controller for a chest door
class IChestAnimator {
public:
    virtual ~IChestAnimator() = default;

    virtual void set_intent(AnimationIntent intent) = 0;
};

/// @brief Animator that only remembers what it was asked to do
///
/// Used when the host supplies no animation system (the simulation CLI) and
/// by tests.
class RecordingChestAnimator : public IChestAnimator {
public:
    explicit RecordingChestAnimator(std::string label = "Chest");

    void set_intent(AnimationIntent intent) override;

    [[nodiscard]] bool is_open() const noexcept { return m_open; }
    [[nodiscard]] const std::vector<AnimationIntent>& history() const noexcept { return m_history; }
    [[nodiscard]] std::size_t count(AnimationIntent intent) const;
    void clear_history() { m_history.clear(); }

private:
    std::string m_label;
    std::vector<AnimationIntent> m_history;
    bool m_open{false};
};

} // namespace mcv_teleport
