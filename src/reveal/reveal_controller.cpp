/// @file reveal_controller.cpp
/// @brief MaterialRevealController implementation for mcv_reveal module

#include <mcvillage/reveal/reveal_controller.hpp>

#include <mcvillage/core/log.hpp>
#include <mcvillage/math/types.hpp>
#include <mcvillage/scene/scene_graph.hpp>

#include <algorithm>

namespace mcv_reveal {

using mcv_sequence::EaseType;
using mcv_sequence::Sequence;

MaterialRevealController::MaterialRevealController(mcv_scene::SceneGraph& scene, NodeId root,
                                                   RevealSettings settings)
    : m_scene(scene)
    , m_root(root)
    , m_settings(std::move(settings))
    , m_eye_texture_index(std::clamp(m_settings.eye_texture_index, 0, 1))
    , m_eye_emissive_index(std::clamp(m_settings.eye_emissive_index, 0, 1)) {
}

void MaterialRevealController::start() {
    m_original_eye_texture_index = m_eye_texture_index;
    m_original_eye_emissive_index = m_eye_emissive_index;

    mcv_core::fx_logger()->debug("Found {} renderers with controllable properties", renderer_count());

    set_reveal_value(m_settings.initial_value);
    set_eye_texture(m_eye_texture_index);
    set_eye_emissive(m_eye_emissive_index);

    if (m_settings.play_on_start) {
        play_reveal();
    }
}

void MaterialRevealController::tick(float dt) {
    m_animation.tick(dt);
}

std::size_t MaterialRevealController::renderer_count() const {
    std::size_t count = 0;
    for (const mcv_scene::Renderer* renderer : m_scene.collect_renderers(m_root)) {
        if (renderer->declares(m_settings.reveal_property) || renderer->declares(m_settings.eye_texture_property) ||
            renderer->declares(m_settings.eye_emissive_property)) {
            ++count;
        }
    }
    return count;
}

// =============================================================================
// Reveal Amount
// =============================================================================

void MaterialRevealController::set_reveal_value(float value) {
    m_value = std::clamp(value, 0.0f, 1.0f);
    apply_reveal();
}

void MaterialRevealController::apply_reveal() {
    for (mcv_scene::Renderer* renderer : m_scene.collect_renderers(m_root)) {
        renderer->set_float_on_declaring(m_settings.reveal_property, m_value);
    }
}

void MaterialRevealController::play_reveal() {
    const float start = m_value;
    const float duration = m_settings.duration;
    const EaseType curve = m_settings.curve;

    // Resume from the current progress: only the remaining share of the duration plays
    Sequence reveal("reveal");
    reveal.interpolate(
              std::max(duration * (1.0f - start), 0.0f),
              [this, start, curve](float t) {
                  float progress = start + (1.0f - start) * t;
                  set_reveal_value(mcv_sequence::ease_value(curve, progress));
              })
          .call([this]() { complete_reveal(); }, "RevealComplete");
    m_animation.start(std::move(reveal));
}

void MaterialRevealController::play_reveal_from_start() {
    set_reveal_value(0.0f);
    play_reveal();
}

void MaterialRevealController::complete_reveal() {
    mcv_core::fx_logger()->debug("Reveal finished at {}", m_value);
    if (m_settings.auto_toggle_on_complete) {
        toggle_eye_texture_and_emissive();
    }
}

void MaterialRevealController::play_hide() {
    if (m_settings.auto_toggle_on_hide) {
        reset_to_original_textures();
    }

    const float start = m_value;
    Sequence hide("hide");
    hide.interpolate(
        m_settings.duration,
        [this, start](float eased) { set_reveal_value(mcv_math::lerp(start, 0.0f, eased)); },
        m_settings.curve);
    m_animation.start(std::move(hide));
}

void MaterialRevealController::stop() {
    m_animation.cancel();
}

// =============================================================================
// Eye Textures
// =============================================================================

void MaterialRevealController::apply_texture(const std::string& property, TextureId texture) {
    for (mcv_scene::Renderer* renderer : m_scene.collect_renderers(m_root)) {
        renderer->set_texture_on_declaring(property, texture);
    }
}

void MaterialRevealController::set_eye_texture(int index) {
    index = std::clamp(index, 0, 1);
    TextureId texture = m_settings.eye_textures.at(index);
    if (!texture) {
        mcv_core::fx_logger()->warn("Eye texture {} is not assigned", index + 1);
        return;
    }
    apply_texture(m_settings.eye_texture_property, texture);
    m_eye_texture_index = index;
}

void MaterialRevealController::toggle_eye_texture() {
    set_eye_texture(m_eye_texture_index == 0 ? 1 : 0);
}

void MaterialRevealController::set_eye_emissive(int index) {
    index = std::clamp(index, 0, 1);
    TextureId texture = m_settings.eye_emissives.at(index);
    if (!texture) {
        mcv_core::fx_logger()->warn("Eye emissive map {} is not assigned", index + 1);
        return;
    }
    apply_texture(m_settings.eye_emissive_property, texture);
    m_eye_emissive_index = index;
}

void MaterialRevealController::toggle_eye_emissive() {
    set_eye_emissive(m_eye_emissive_index == 0 ? 1 : 0);
}

void MaterialRevealController::set_eye_texture_and_emissive(int index) {
    set_eye_texture(index);
    set_eye_emissive(index);
}

void MaterialRevealController::toggle_eye_texture_and_emissive() {
    toggle_eye_texture();
    toggle_eye_emissive();
}

void MaterialRevealController::reset_to_original_textures() {
    set_eye_texture(m_original_eye_texture_index);
    set_eye_emissive(m_original_eye_emissive_index);
}

} // namespace mcv_reveal
