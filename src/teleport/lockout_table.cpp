/// @file lockout_table.cpp
/// @brief LockoutTable implementation for mcv_teleport module

#include <mcvillage/teleport/lockout_table.hpp>

#include <mcvillage/core/log.hpp>
#include <mcvillage/scene/scene_graph.hpp>

#include <vector>

namespace mcv_teleport {

void LockoutTable::lock(NodeId chest, float seconds) {
    if (!chest || seconds <= 0.0f) {
        return;
    }
    m_timers[chest] = seconds;
}

bool LockoutTable::unlock(NodeId chest) {
    return m_timers.erase(chest) > 0;
}

bool LockoutTable::is_locked(NodeId chest) const {
    return m_timers.find(chest) != m_timers.end();
}

std::optional<float> LockoutTable::remaining(NodeId chest) const {
    auto it = m_timers.find(chest);
    if (it == m_timers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t LockoutTable::tick(float dt, const mcv_scene::SceneGraph& scene) {
    std::vector<NodeId> keys;
    keys.reserve(m_timers.size());
    for (const auto& [chest, seconds] : m_timers) {
        keys.push_back(chest);
    }

    std::size_t removed = 0;
    for (NodeId chest : keys) {
        if (!scene.is_valid(chest)) {
            m_timers.erase(chest);
            ++removed;
            continue;
        }

        float left = m_timers[chest] - dt;
        if (left <= 0.0f) {
            m_timers.erase(chest);
            ++removed;
            mcv_core::teleport_logger()->debug("Lockout expired for chest: {}", scene.name(chest));
        } else {
            m_timers[chest] = left;
        }
    }
    return removed;
}

} // namespace mcv_teleport
