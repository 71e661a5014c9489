/// @file serialization.hpp
/// @brief JSON loading for teleport settings
///
/// ```json
/// {"network_tag": "teleChest", "teleport_delay": 0.5, "post_teleport_cooldown": 2.0,
///  "destination_lockout_duration": 5.0, "chest_reopen_cooldown": 1.5, "debug_logs": false}
/// ```

#pragma once

#include "types.hpp"

#include <nlohmann/json_fwd.hpp>

namespace mcv_teleport {

/// @brief Parse a TeleportConfig; missing keys keep their defaults
mcv_core::Result<TeleportConfig> teleport_config_from_json(const nlohmann::json& j);

} // namespace mcv_teleport
