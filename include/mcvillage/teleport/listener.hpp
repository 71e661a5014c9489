/// @file listener.hpp
/// @brief Host tick and volume event interface

#pragma once

#include "types.hpp"

namespace mcv_teleport {

/// @brief Receives the host's simulation tick and volume events
class ISimulationListener {
public:
    virtual ~ISimulationListener() = default;

    virtual void on_tick(float dt) = 0;
    virtual void on_volume_enter(VolumeKind kind, NodeId actor) = 0;
    virtual void on_volume_exit(VolumeKind kind, NodeId actor) = 0;
};

} // namespace mcv_teleport
