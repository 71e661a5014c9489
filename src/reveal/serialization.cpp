/// @file serialization.cpp
/// @brief JSON loading for mcv_reveal module

#include <mcvillage/reveal/serialization.hpp>

#include <mcvillage/core/config.hpp>

#include <nlohmann/json.hpp>

#include <array>

namespace mcv_reveal {

using mcv_core::ConfigError;
using mcv_core::Err;
using mcv_core::Result;
using mcv_sequence::EaseType;

namespace {

Result<void> read_texture_pair(const nlohmann::json& j, const std::string& key, TexturePair& out,
                               mcv_scene::AssetLookup& assets) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return mcv_core::Ok();
    }
    if (!it->is_array() || it->size() != 2 || !(*it)[0].is_string() || !(*it)[1].is_string()) {
        return Err(ConfigError::wrong_type(key, "an array of two texture names"));
    }
    out.first = assets.add_texture((*it)[0].get<std::string>());
    out.second = assets.add_texture((*it)[1].get<std::string>());
    return mcv_core::Ok();
}

} // anonymous namespace

std::optional<EaseType> parse_ease_type(const std::string& name) {
    static constexpr std::array<EaseType, 6> k_types = {
        EaseType::Linear, EaseType::EaseIn, EaseType::EaseOut,
        EaseType::EaseInOut, EaseType::SmoothStep, EaseType::Bounce,
    };
    for (EaseType type : k_types) {
        if (name == mcv_sequence::ease_type_name(type)) {
            return type;
        }
    }
    return std::nullopt;
}

Result<RevealSettings> reveal_settings_from_json(const nlohmann::json& j, mcv_scene::AssetLookup& assets) {
    if (auto r = mcv_core::expect_object(j, "reveal"); !r) {
        return Err<RevealSettings>(r.error());
    }

    RevealSettings settings;
    std::string curve;

    for (auto r : {mcv_core::read_optional(j, "property", settings.reveal_property),
                   mcv_core::read_optional(j, "curve", curve),
                   mcv_core::read_optional(j, "duration", settings.duration),
                   mcv_core::read_optional(j, "initial_value", settings.initial_value),
                   mcv_core::read_optional(j, "play_on_start", settings.play_on_start),
                   mcv_core::read_optional(j, "auto_toggle_on_complete", settings.auto_toggle_on_complete),
                   mcv_core::read_optional(j, "auto_toggle_on_hide", settings.auto_toggle_on_hide),
                   mcv_core::read_optional(j, "eye_texture_property", settings.eye_texture_property),
                   mcv_core::read_optional(j, "eye_texture_index", settings.eye_texture_index),
                   mcv_core::read_optional(j, "eye_emissive_property", settings.eye_emissive_property),
                   mcv_core::read_optional(j, "eye_emissive_index", settings.eye_emissive_index),
                   read_texture_pair(j, "eye_textures", settings.eye_textures, assets),
                   read_texture_pair(j, "eye_emissives", settings.eye_emissives, assets)}) {
        if (!r) {
            return Err<RevealSettings>(r.error());
        }
    }

    if (!curve.empty()) {
        auto parsed = parse_ease_type(curve);
        if (!parsed) {
            return Err<RevealSettings>(ConfigError::wrong_type("curve", "an ease name such as ease_in_out"));
        }
        settings.curve = *parsed;
    }

    if (settings.duration < 0.0f) {
        return Err<RevealSettings>(ConfigError::wrong_type("duration", "a non-negative number of seconds"));
    }

    return mcv_core::Ok(std::move(settings));
}

} // namespace mcv_reveal
