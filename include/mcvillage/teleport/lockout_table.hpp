/// @file lockout_table.hpp
/// @brief Per-destination teleport lockout timers

#pragma once

#include "types.hpp"

#include <map>
#include <optional>

namespace mcv_teleport {

/// @brief Remaining lockout seconds per chest
///
/// Owned by the network and shared by reference with its chests. tick()
/// decrements every entry once, removing entries that reach zero or whose
/// chest no longer exists.
class LockoutTable {
public:
    /// @brief Insert or overwrite a chest's lockout
    void lock(NodeId chest, float seconds);

    /// @brief Drop a chest's lockout early
    bool unlock(NodeId chest);

    [[nodiscard]] bool is_locked(NodeId chest) const;

    /// @brief Remaining seconds, nullopt when not locked
    [[nodiscard]] std::optional<float> remaining(NodeId chest) const;

    /// @brief Advance every timer by dt
    /// @return Number of entries removed
    std::size_t tick(float dt, const mcv_scene::SceneGraph& scene);

    void clear() { m_timers.clear(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_timers.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_timers.empty(); }

private:
    std::map<NodeId, float> m_timers;
};

} // namespace mcv_teleport
