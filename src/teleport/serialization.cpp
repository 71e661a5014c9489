/// @file serialization.cpp
/// @brief JSON loading for mcv_teleport module

#include <mcvillage/teleport/serialization.hpp>

#include <mcvillage/core/config.hpp>
#include <mcvillage/math/json.hpp>

#include <nlohmann/json.hpp>

#include <utility>

namespace mcv_teleport {

using mcv_core::ConfigError;
using mcv_core::Err;
using mcv_core::Result;

namespace {

Result<void> read_vec3(const nlohmann::json& j, const std::string& key, Vec3& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return mcv_core::Ok();
    }
    auto value = mcv_math::vec3_from_json(*it, key);
    if (!value) {
        return Err(value.error());
    }
    out = *value;
    return mcv_core::Ok();
}

} // anonymous namespace

Result<TeleportConfig> teleport_config_from_json(const nlohmann::json& j) {
    if (auto r = mcv_core::expect_object(j, "teleport"); !r) {
        return Err<TeleportConfig>(r.error());
    }

    TeleportConfig config;
    for (auto r : {mcv_core::read_optional(j, "network_tag", config.network_tag),
                   mcv_core::read_optional(j, "actor_tag", config.actor_tag),
                   mcv_core::read_optional(j, "controller_name", config.controller_name),
                   mcv_core::read_optional(j, "teleport_delay", config.teleport_delay),
                   mcv_core::read_optional(j, "post_teleport_cooldown", config.post_teleport_cooldown),
                   mcv_core::read_optional(j, "destination_lockout_duration", config.destination_lockout_duration),
                   mcv_core::read_optional(j, "chest_reopen_cooldown", config.chest_reopen_cooldown),
                   mcv_core::read_optional(j, "close_settle_delay", config.close_settle_delay),
                   mcv_core::read_optional(j, "teleport_volume_name", config.teleport_volume_name),
                   mcv_core::read_optional(j, "teleport_target_name", config.teleport_target_name),
                   mcv_core::read_optional(j, "detect_volume_name", config.detect_volume_name),
                   read_vec3(j, "default_teleport_volume_size", config.default_teleport_volume_size),
                   read_vec3(j, "default_detect_volume_size", config.default_detect_volume_size),
                   read_vec3(j, "default_target_offset", config.default_target_offset),
                   mcv_core::read_optional(j, "debug_logs", config.debug_logs)}) {
        if (!r) {
            return Err<TeleportConfig>(r.error());
        }
    }

    for (auto [key, value] : {std::pair<const char*, float>{"teleport_delay", config.teleport_delay},
                              {"post_teleport_cooldown", config.post_teleport_cooldown},
                              {"destination_lockout_duration", config.destination_lockout_duration},
                              {"chest_reopen_cooldown", config.chest_reopen_cooldown},
                              {"close_settle_delay", config.close_settle_delay}}) {
        if (value < 0.0f) {
            return Err<TeleportConfig>(ConfigError::wrong_type(key, "a non-negative number of seconds"));
        }
    }

    if (config.network_tag.empty()) {
        return Err<TeleportConfig>(ConfigError::malformed("teleport", "network_tag must not be empty"));
    }

    return mcv_core::Ok(std::move(config));
}

} // namespace mcv_teleport
