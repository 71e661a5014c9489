/// @file serialization.hpp
/// @brief JSON loading for reveal settings
///
/// ```json
/// {"property": "_Reveal_Amount", "duration": 1.0, "curve": "ease_in_out",
///  "eye_textures": ["eye_closed", "eye_open"], "eye_emissives": ["glow_off", "glow_on"]}
/// ```

#pragma once

#include "reveal_controller.hpp"

#include <mcvillage/core/error.hpp>
#include <mcvillage/scene/assets.hpp>

#include <nlohmann/json_fwd.hpp>

#include <optional>

namespace mcv_reveal {

/// @brief Parse an ease name as printed by ease_type_name()
[[nodiscard]] std::optional<mcv_sequence::EaseType> parse_ease_type(const std::string& name);

/// @brief Parse RevealSettings. Texture names are registered with `assets`.
mcv_core::Result<RevealSettings> reveal_settings_from_json(const nlohmann::json& j, mcv_scene::AssetLookup& assets);

} // namespace mcv_reveal
