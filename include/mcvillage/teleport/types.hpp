/// @file types.hpp
/// @brief Core types for mcv_teleport module

#pragma once

#include <mcvillage/core/error.hpp>
#include <mcvillage/math/types.hpp>
#include <mcvillage/scene/fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mcv_teleport {

using mcv_math::Quat;
using mcv_math::Vec3;
using mcv_scene::NodeId;

// =============================================================================
// Configuration
// =============================================================================

/// @brief Timing and lookup settings shared by every chest of a network
struct TeleportConfig {
    std::string network_tag{"teleChest"};
    std::string actor_tag{"Player"};
    std::string controller_name{"Controller"};

    float teleport_delay{0.5f};                 ///< Seconds between entering the volume and the transfer
    float post_teleport_cooldown{2.0f};         ///< Seconds before the source chest may teleport again
    float destination_lockout_duration{5.0f};   ///< Seconds a destination refuses to teleport
    float chest_reopen_cooldown{1.5f};          ///< Seconds the door stays shut after closing
    float close_settle_delay{0.1f};             ///< Seconds between closing the door and relocating

    std::string teleport_volume_name{"TeleportVolume"};
    std::string teleport_target_name{"TeleportTarget"};
    std::string detect_volume_name{"PlayerDetectVolume"};

    Vec3 default_teleport_volume_size{1.5f, 1.5f, 1.5f};
    Vec3 default_detect_volume_size{3.0f, 2.0f, 3.0f};
    Vec3 default_target_offset{0.0f, 0.0f, 2.0f};

    bool debug_logs{true};  ///< Errors are logged regardless
};

// =============================================================================
// Chest State
// =============================================================================

/// @brief Observable chest state derived from the door and transfer flags
enum class ChestState : std::uint8_t {
    Closed,
    Open,
    CooldownClosed,     ///< Closed and not yet allowed to reopen
    Teleporting         ///< Source of a transfer in flight
};

[[nodiscard]] const char* chest_state_name(ChestState state);

/// @brief Which of a chest's volumes produced an event
enum class VolumeKind : std::uint8_t {
    Teleport,
    PlayerDetect
};

[[nodiscard]] const char* volume_kind_name(VolumeKind kind);

// =============================================================================
// Teleport Outcome
// =============================================================================

enum class TeleportResult : std::uint8_t {
    None,           ///< No attempt finished yet
    Teleported,
    NoDestination,
    NoActor,
    MissingTarget   ///< Destination target vanished before relocation
};

[[nodiscard]] const char* teleport_result_name(TeleportResult result);

/// @brief Record of the last finished teleport attempt of a chest
struct TeleportOutcome {
    TeleportResult result{TeleportResult::None};
    NodeId source;
    NodeId destination;
    NodeId actor;
    Vec3 arrival{0.0f};
    std::optional<mcv_core::Error> error;

    [[nodiscard]] bool succeeded() const { return result == TeleportResult::Teleported; }
};

} // namespace mcv_teleport
