/// @file reveal_controller.hpp
/// @brief Eased reveal/hide of a shader float across a node subtree

#pragma once

#include <mcvillage/scene/fwd.hpp>
#include <mcvillage/sequence/sequence.hpp>

#include <string>

namespace mcv_reveal {

using mcv_scene::NodeId;
using mcv_scene::TextureId;

/// @brief Two textures a property alternates between
struct TexturePair {
    TextureId first;
    TextureId second;

    [[nodiscard]] TextureId at(int index) const { return index == 0 ? first : second; }
};

struct RevealSettings {
    std::string reveal_property{"_Reveal_Amount"};
    mcv_sequence::EaseType curve{mcv_sequence::EaseType::EaseInOut};
    float duration{1.0f};
    float initial_value{-0.1f};             ///< Clamped like every other value
    bool play_on_start{false};
    bool auto_toggle_on_complete{true};     ///< Toggle eye texture and emissive after a reveal
    bool auto_toggle_on_hide{true};         ///< Restore original textures when a hide starts

    std::string eye_texture_property{"_enderEyeTexture"};
    TexturePair eye_textures;
    int eye_texture_index{0};

    std::string eye_emissive_property{"_enderEyeEmissive"};
    TexturePair eye_emissives;
    int eye_emissive_index{0};
};

// =============================================================================
// MaterialRevealController
// =============================================================================

/// @brief Animates a reveal amount in [0, 1] through per-renderer property blocks
///
/// Only renderers with a material declaring one of the controlled properties
/// are touched. Reveal and hide share one animation slot, so starting one
/// cancels the other.
class MaterialRevealController {
public:
    MaterialRevealController(mcv_scene::SceneGraph& scene, NodeId root, RevealSettings settings = {});

    /// @brief Apply initial values; plays the reveal when `play_on_start`
    void start();

    /// @brief Advance a running animation
    void tick(float dt);

    /// @brief Animate from the current value to 1 (remaining time only)
    void play_reveal();

    /// @brief Reset to 0 then animate to 1 over the full duration
    void play_reveal_from_start();

    /// @brief Animate from the current value to 0 over the full duration
    void play_hide();

    /// @brief Stop a running animation, keeping the current value
    void stop();

    /// @brief Write the reveal amount (clamped to [0, 1])
    void set_reveal_value(float value);

    void set_eye_texture(int index);
    void toggle_eye_texture();
    void set_eye_emissive(int index);
    void toggle_eye_emissive();
    void set_eye_texture_and_emissive(int index);
    void toggle_eye_texture_and_emissive();
    void reset_to_original_textures();

    [[nodiscard]] float reveal_value() const noexcept { return m_value; }
    [[nodiscard]] int eye_texture_index() const noexcept { return m_eye_texture_index; }
    [[nodiscard]] int eye_emissive_index() const noexcept { return m_eye_emissive_index; }
    [[nodiscard]] bool is_playing() const noexcept { return m_animation.is_active(); }
    [[nodiscard]] const RevealSettings& settings() const noexcept { return m_settings; }

    /// @brief Renderers carrying at least one controlled property
    [[nodiscard]] std::size_t renderer_count() const;

private:
    void apply_reveal();
    void apply_texture(const std::string& property, TextureId texture);
    void complete_reveal();

    mcv_scene::SceneGraph& m_scene;
    NodeId m_root;
    RevealSettings m_settings;

    float m_value{0.0f};
    int m_eye_texture_index{0};
    int m_eye_emissive_index{0};
    int m_original_eye_texture_index{0};
    int m_original_eye_emissive_index{0};

    mcv_sequence::SequenceSlot m_animation;
};

} // namespace mcv_reveal
