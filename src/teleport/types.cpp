/// @file types.cpp
/// @brief Type helpers for mcv_teleport module

#include <mcvillage/teleport/types.hpp>

namespace mcv_teleport {

const char* chest_state_name(ChestState state) {
    switch (state) {
        case ChestState::Closed: return "Closed";
        case ChestState::Open: return "Open";
        case ChestState::CooldownClosed: return "CooldownClosed";
        case ChestState::Teleporting: return "Teleporting";
    }
    return "Unknown";
}

const char* volume_kind_name(VolumeKind kind) {
    switch (kind) {
        case VolumeKind::Teleport: return "TeleportVolume";
        case VolumeKind::PlayerDetect: return "PlayerDetectVolume";
    }
    return "Unknown";
}

const char* teleport_result_name(TeleportResult result) {
    switch (result) {
        case TeleportResult::None: return "None";
        case TeleportResult::Teleported: return "Teleported";
        case TeleportResult::NoDestination: return "NoDestination";
        case TeleportResult::NoActor: return "NoActor";
        case TeleportResult::MissingTarget: return "MissingTarget";
    }
    return "Unknown";
}

} // namespace mcv_teleport
