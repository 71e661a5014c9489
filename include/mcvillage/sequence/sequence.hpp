/// @file sequence.hpp
/// @brief Cooperative timed sequences for mcv_sequence module
///
/// A Sequence is an ordered list of steps advanced by tick(dt) from the host
/// loop. Waiting steps consume simulated time; time left over after a step
/// completes flows into the next step within the same tick. Callback steps
/// take no time and may abort the sequence by returning StepStatus::Failed.

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mcv_sequence {

/// @brief Step / sequence status
enum class StepStatus : std::uint8_t {
    Running,
    Success,
    Failed,
    Cancelled
};

/// @brief Easing curve
enum class EaseType : std::uint8_t {
    Linear,
    EaseIn,
    EaseOut,
    EaseInOut,
    SmoothStep,
    Bounce
};

/// @brief Apply an easing curve to t in [0, 1]
[[nodiscard]] float ease_value(EaseType type, float t);

/// @brief Name of an easing curve
[[nodiscard]] const char* ease_type_name(EaseType type);

// =============================================================================
// ISequenceStep Interface
// =============================================================================

/// @brief Interface for sequence steps
class ISequenceStep {
public:
    virtual ~ISequenceStep() = default;

    /// @brief Advance the step
    /// @param dt Time available this tick; the step subtracts what it consumes
    virtual StepStatus update(float& dt) = 0;

    /// @brief Reset the step state
    virtual void reset() = 0;

    /// @brief Get step description
    virtual std::string description() const = 0;
};

// =============================================================================
// WaitStep
// =============================================================================

/// @brief Step that completes after a delay
class WaitStep : public ISequenceStep {
public:
    explicit WaitStep(float delay);

    StepStatus update(float& dt) override;
    void reset() override { m_elapsed = 0; }
    std::string description() const override;

    float delay() const { return m_delay; }
    float elapsed() const { return m_elapsed; }

private:
    float m_delay{0};
    float m_elapsed{0};
};

// =============================================================================
// CallbackStep
// =============================================================================

/// @brief Step that runs a callback once
class CallbackStep : public ISequenceStep {
public:
    using Callback = std::function<StepStatus()>;

    explicit CallbackStep(Callback callback, std::string desc = "Callback");

    StepStatus update(float& dt) override;
    void reset() override {}
    std::string description() const override { return m_description; }

private:
    Callback m_callback;
    std::string m_description;
};

// =============================================================================
// InterpolateStep
// =============================================================================

/// @brief Step that reports eased progress over a duration
///
/// The callback receives the eased value every tick, ending with exactly
/// ease_value(type, 1). A zero duration completes immediately.
class InterpolateStep : public ISequenceStep {
public:
    using Callback = std::function<void(float eased)>;

    InterpolateStep(float duration, Callback callback, EaseType ease = EaseType::Linear);

    StepStatus update(float& dt) override;
    void reset() override { m_elapsed = 0; }
    std::string description() const override;

    float progress() const;

private:
    float m_duration{1.0f};
    float m_elapsed{0};
    Callback m_callback;
    EaseType m_ease{EaseType::Linear};
};

// =============================================================================
// Sequence
// =============================================================================

/// @brief Ordered list of steps executed one after another
class Sequence {
public:
    explicit Sequence(std::string name = "Sequence");
    ~Sequence();

    Sequence(const Sequence&) = delete;
    Sequence& operator=(const Sequence&) = delete;
    Sequence(Sequence&&) noexcept;
    Sequence& operator=(Sequence&&) noexcept;

    // Fluent builder
    Sequence& then(std::unique_ptr<ISequenceStep> step);
    Sequence& wait(float seconds);
    Sequence& call(std::function<void()> callback, const std::string& desc = "Callback");
    Sequence& call_checked(CallbackStep::Callback callback, const std::string& desc = "Callback");
    Sequence& interpolate(float duration, InterpolateStep::Callback callback,
                          EaseType ease = EaseType::Linear);

    /// @brief Advance by dt
    /// @return Running until every step finished, then the final status
    StepStatus tick(float dt);

    /// @brief Stop without running remaining steps
    void cancel();

    /// @brief Rewind to the first step
    void reset();

    [[nodiscard]] StepStatus status() const noexcept { return m_status; }
    [[nodiscard]] bool is_running() const noexcept { return m_status == StepStatus::Running; }
    [[nodiscard]] bool is_finished() const noexcept { return m_status != StepStatus::Running; }
    [[nodiscard]] std::size_t step_count() const noexcept { return m_steps.size(); }
    [[nodiscard]] std::size_t current_index() const noexcept { return m_current; }
    [[nodiscard]] float elapsed() const noexcept { return m_elapsed; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

private:
    std::string m_name;
    std::vector<std::unique_ptr<ISequenceStep>> m_steps;
    std::size_t m_current{0};
    float m_elapsed{0};
    StepStatus m_status{StepStatus::Running};
};

// =============================================================================
// SequenceSlot
// =============================================================================

/// @brief Holds at most one running sequence of a kind
///
/// Starting a sequence cancels the one already running. A step callback may
/// start or cancel sequences in the same slot while it is being ticked.
class SequenceSlot {
public:
    SequenceSlot() = default;

    /// @brief Cancel the running sequence (if any) and start `sequence`
    void start(Sequence sequence);

    /// @brief Cancel the running sequence
    /// @return True if a sequence was running
    bool cancel();

    /// @brief Advance the running sequence; the slot empties when it finishes
    void tick(float dt);

    [[nodiscard]] bool is_active() const noexcept { return m_active != nullptr; }

    /// @brief Name of the running sequence, or empty
    [[nodiscard]] std::string active_name() const;

    /// @brief Status of the last sequence that finished in this slot
    [[nodiscard]] StepStatus last_status() const noexcept { return m_last_status; }

private:
    std::shared_ptr<Sequence> m_active;
    StepStatus m_last_status{StepStatus::Success};
};

} // namespace mcv_sequence
