/// @file sequence.cpp
/// @brief Sequence implementation for mcv_sequence module

#include <mcvillage/sequence/sequence.hpp>

#include <algorithm>
#include <cmath>

namespace mcv_sequence {

// =============================================================================
// Easing
// =============================================================================

float ease_value(EaseType type, float t) {
    t = std::clamp(t, 0.0f, 1.0f);

    switch (type) {
        case EaseType::Linear:
            return t;

        case EaseType::EaseIn:
            return t * t;

        case EaseType::EaseOut:
            return t * (2.0f - t);

        case EaseType::EaseInOut:
            return t < 0.5f ? 2.0f * t * t : -1.0f + (4.0f - 2.0f * t) * t;

        case EaseType::SmoothStep:
            return t * t * (3.0f - 2.0f * t);

        case EaseType::Bounce: {
            if (t < 1.0f / 2.75f) {
                return 7.5625f * t * t;
            } else if (t < 2.0f / 2.75f) {
                t -= 1.5f / 2.75f;
                return 7.5625f * t * t + 0.75f;
            } else if (t < 2.5f / 2.75f) {
                t -= 2.25f / 2.75f;
                return 7.5625f * t * t + 0.9375f;
            } else {
                t -= 2.625f / 2.75f;
                return 7.5625f * t * t + 0.984375f;
            }
        }
    }

    return t;
}

const char* ease_type_name(EaseType type) {
    switch (type) {
        case EaseType::Linear: return "linear";
        case EaseType::EaseIn: return "ease_in";
        case EaseType::EaseOut: return "ease_out";
        case EaseType::EaseInOut: return "ease_in_out";
        case EaseType::SmoothStep: return "smooth_step";
        case EaseType::Bounce: return "bounce";
    }
    return "unknown";
}

// =============================================================================
// WaitStep Implementation
// =============================================================================

WaitStep::WaitStep(float delay)
    : m_delay(std::max(delay, 0.0f)) {
}

StepStatus WaitStep::update(float& dt) {
    float needed = m_delay - m_elapsed;
    if (dt >= needed) {
        dt -= needed;
        m_elapsed = m_delay;
        return StepStatus::Success;
    }

    m_elapsed += dt;
    dt = 0;
    return StepStatus::Running;
}

std::string WaitStep::description() const {
    return "Wait(" + std::to_string(m_delay) + "s)";
}

// =============================================================================
// CallbackStep Implementation
// =============================================================================

CallbackStep::CallbackStep(Callback callback, std::string desc)
    : m_callback(std::move(callback))
    , m_description(std::move(desc)) {
}

StepStatus CallbackStep::update(float& /*dt*/) {
    if (m_callback) {
        return m_callback();
    }
    return StepStatus::Success;
}

// =============================================================================
// InterpolateStep Implementation
// =============================================================================

InterpolateStep::InterpolateStep(float duration, Callback callback, EaseType ease)
    : m_duration(std::max(duration, 0.0f))
    , m_callback(std::move(callback))
    , m_ease(ease) {
}

float InterpolateStep::progress() const {
    if (m_duration <= 0.0f) {
        return 1.0f;
    }
    return std::min(m_elapsed / m_duration, 1.0f);
}

StepStatus InterpolateStep::update(float& dt) {
    float needed = m_duration - m_elapsed;
    bool done = dt >= needed;

    if (done) {
        dt -= needed;
        m_elapsed = m_duration;
    } else {
        m_elapsed += dt;
        dt = 0;
    }

    if (m_callback) {
        m_callback(ease_value(m_ease, done ? 1.0f : progress()));
    }

    return done ? StepStatus::Success : StepStatus::Running;
}

std::string InterpolateStep::description() const {
    return "Interpolate(" + std::to_string(m_duration) + "s, " + ease_type_name(m_ease) + ")";
}

// =============================================================================
// Sequence Implementation
// =============================================================================

Sequence::Sequence(std::string name)
    : m_name(std::move(name)) {
}

Sequence::~Sequence() = default;
Sequence::Sequence(Sequence&&) noexcept = default;
Sequence& Sequence::operator=(Sequence&&) noexcept = default;

Sequence& Sequence::then(std::unique_ptr<ISequenceStep> step) {
    m_steps.push_back(std::move(step));
    return *this;
}

Sequence& Sequence::wait(float seconds) {
    return then(std::make_unique<WaitStep>(seconds));
}

Sequence& Sequence::call(std::function<void()> callback, const std::string& desc) {
    return then(std::make_unique<CallbackStep>(
        [cb = std::move(callback)]() {
            if (cb) {
                cb();
            }
            return StepStatus::Success;
        },
        desc));
}

Sequence& Sequence::call_checked(CallbackStep::Callback callback, const std::string& desc) {
    return then(std::make_unique<CallbackStep>(std::move(callback), desc));
}

Sequence& Sequence::interpolate(float duration, InterpolateStep::Callback callback, EaseType ease) {
    return then(std::make_unique<InterpolateStep>(duration, std::move(callback), ease));
}

StepStatus Sequence::tick(float dt) {
    if (m_status != StepStatus::Running) {
        return m_status;
    }

    m_elapsed += dt;
    float remaining = dt;

    while (m_current < m_steps.size()) {
        StepStatus result = m_steps[m_current]->update(remaining);
        if (m_status == StepStatus::Cancelled) {
            // A callback cancelled us mid-step
            return m_status;
        }
        if (result == StepStatus::Running) {
            return StepStatus::Running;
        }
        if (result == StepStatus::Failed || result == StepStatus::Cancelled) {
            m_status = result;
            return m_status;
        }
        ++m_current;
    }

    m_status = StepStatus::Success;
    return m_status;
}

void Sequence::cancel() {
    if (m_status == StepStatus::Running) {
        m_status = StepStatus::Cancelled;
    }
}

void Sequence::reset() {
    m_current = 0;
    m_elapsed = 0;
    m_status = StepStatus::Running;
    for (auto& step : m_steps) {
        step->reset();
    }
}

// =============================================================================
// SequenceSlot Implementation
// =============================================================================

void SequenceSlot::start(Sequence sequence) {
    cancel();
    m_active = std::make_shared<Sequence>(std::move(sequence));
}

bool SequenceSlot::cancel() {
    if (!m_active) {
        return false;
    }
    m_active->cancel();
    m_last_status = StepStatus::Cancelled;
    m_active.reset();
    return true;
}

void SequenceSlot::tick(float dt) {
    if (!m_active) {
        return;
    }

    // Keep the sequence alive even if a step replaces or cancels it
    std::shared_ptr<Sequence> running = m_active;
    StepStatus status = running->tick(dt);

    if (status != StepStatus::Running && m_active == running) {
        m_last_status = status;
        m_active.reset();
    }
}

std::string SequenceSlot::active_name() const {
    return m_active ? m_active->name() : std::string{};
}

} // namespace mcv_sequence
