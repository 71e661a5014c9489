/// @file volume_monitor.cpp
/// @brief VolumeMonitor implementation for mcv_scene module

#include <mcvillage/scene/volume_monitor.hpp>
#include <mcvillage/scene/scene_graph.hpp>

#include <mcvillage/core/log.hpp>

namespace mcv_scene {

VolumeMonitor::VolumeMonitor(std::string actor_tag)
    : m_actor_tag(std::move(actor_tag)) {
}

WatchId VolumeMonitor::watch(NodeId volume_node, VolumeCallback on_enter, VolumeCallback on_exit) {
    WatchId id{m_next_id++};
    Watch w;
    w.volume_node = volume_node;
    w.on_enter = std::move(on_enter);
    w.on_exit = std::move(on_exit);
    m_watches.emplace(id.value, std::move(w));
    return id;
}

void VolumeMonitor::unwatch(WatchId id) {
    m_watches.erase(id.value);
}

void VolumeMonitor::update(const SceneGraph& scene) {
    struct Event {
        std::uint64_t watch;
        NodeId actor;
        bool entered;
    };

    std::vector<NodeId> actors = scene.find_with_tag(m_actor_tag);
    std::vector<Event> events;
    std::vector<std::uint64_t> dropped;

    for (auto& [id, w] : m_watches) {
        if (!scene.is_valid(w.volume_node)) {
            for (NodeId actor : w.inside) {
                events.push_back({id, actor, false});
            }
            w.inside.clear();
            dropped.push_back(id);
            continue;
        }

        std::set<NodeId> now_inside;
        for (NodeId actor : actors) {
            if (scene.volume_contains(w.volume_node, scene.world_position(actor))) {
                now_inside.insert(actor);
            }
        }

        for (NodeId actor : w.inside) {
            if (now_inside.count(actor) == 0) {
                events.push_back({id, actor, false});
            }
        }
        for (NodeId actor : now_inside) {
            if (w.inside.count(actor) == 0) {
                events.push_back({id, actor, true});
            }
        }

        w.inside = std::move(now_inside);
    }

    // Callbacks may watch/unwatch, so look each watch up again
    for (const auto& event : events) {
        auto it = m_watches.find(event.watch);
        if (it == m_watches.end()) {
            continue;
        }
        VolumeCallback callback = event.entered ? it->second.on_enter : it->second.on_exit;
        if (callback) {
            callback(event.actor);
        }
    }

    for (std::uint64_t id : dropped) {
        mcv_core::scene_logger()->debug("Dropping watch {}: volume node destroyed", id);
        m_watches.erase(id);
    }
}

bool VolumeMonitor::is_inside(WatchId id, NodeId actor) const {
    auto it = m_watches.find(id.value);
    return it != m_watches.end() && it->second.inside.count(actor) > 0;
}

std::vector<NodeId> VolumeMonitor::occupants(WatchId id) const {
    auto it = m_watches.find(id.value);
    if (it == m_watches.end()) {
        return {};
    }
    return {it->second.inside.begin(), it->second.inside.end()};
}

} // namespace mcv_scene
