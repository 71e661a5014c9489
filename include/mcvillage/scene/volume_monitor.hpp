/// @file volume_monitor.hpp
/// @brief Enter/exit tracking of tagged actors against node volumes

#pragma once

#include "fwd.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace mcv_scene {

/// @brief Callback receiving the actor that entered or left a watched volume
using VolumeCallback = std::function<void(NodeId actor)>;

// =============================================================================
// VolumeMonitor
// =============================================================================

/// @brief Tracks which tagged actors are inside which watched volumes
///
/// update() compares every live actor carrying `actor_tag` against every
/// watched node's volume, then dispatches the collected enter/exit events in
/// watch order. Actors destroyed while inside produce an exit; a watched node
/// that disappears produces exits for everything it contained and is dropped.
class VolumeMonitor {
public:
    explicit VolumeMonitor(std::string actor_tag = "Player");

    /// @brief Start watching a node's volume
    WatchId watch(NodeId volume_node, VolumeCallback on_enter, VolumeCallback on_exit);

    /// @brief Stop watching (no exit events are emitted)
    void unwatch(WatchId id);

    /// @brief Re-evaluate containment and dispatch events
    void update(const SceneGraph& scene);

    /// @brief Whether an actor was inside a watched volume at the last update
    [[nodiscard]] bool is_inside(WatchId id, NodeId actor) const;

    /// @brief Actors inside a watched volume at the last update
    [[nodiscard]] std::vector<NodeId> occupants(WatchId id) const;

    [[nodiscard]] const std::string& actor_tag() const noexcept { return m_actor_tag; }
    [[nodiscard]] std::size_t watch_count() const noexcept { return m_watches.size(); }

private:
    struct Watch {
        NodeId volume_node;
        VolumeCallback on_enter;
        VolumeCallback on_exit;
        std::set<NodeId> inside;
    };

    std::string m_actor_tag;
    std::map<std::uint64_t, Watch> m_watches;
    std::uint64_t m_next_id{1};
};

} // namespace mcv_scene
