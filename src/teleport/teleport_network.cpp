/// @file teleport_network.cpp
/// @brief TeleportNetwork implementation for mcv_teleport module

#include <mcvillage/teleport/teleport_network.hpp>

#include <mcvillage/core/log.hpp>
#include <mcvillage/core/random.hpp>
#include <mcvillage/scene/scene_graph.hpp>

namespace mcv_teleport {

TeleportNetwork::TeleportNetwork(mcv_scene::SceneGraph& scene, TeleportConfig config,
                                 std::shared_ptr<mcv_core::IRandomSource> rng)
    : m_scene(scene)
    , m_config(std::move(config))
    , m_rng(rng ? std::move(rng) : std::make_shared<mcv_core::SeededRandom>())
    , m_monitor(m_config.actor_tag) {
    m_animator_factory = [this](NodeId chest) -> std::shared_ptr<IChestAnimator> {
        return std::make_shared<RecordingChestAnimator>(m_scene.name(chest));
    };
}

TeleportNetwork::~TeleportNetwork() = default;

void TeleportNetwork::set_animator_factory(AnimatorFactory factory) {
    m_animator_factory = std::move(factory);
}

void TeleportNetwork::set_outcome_callback(ChestTeleporter::OutcomeCallback callback) {
    m_on_outcome = std::move(callback);
    for (auto& chest : m_chests) {
        chest->set_outcome_callback(m_on_outcome);
    }
}

std::size_t TeleportNetwork::discover() {
    auto tagged = m_scene.find_with_tag(m_config.network_tag);
    mcv_core::teleport_logger()->info("Found {} chest(s) tagged '{}'", tagged.size(), m_config.network_tag);

    std::size_t added = 0;
    for (NodeId chest : tagged) {
        if (find_chest(chest)) {
            continue;
        }
        if (add_chest(chest)) {
            ++added;
        }
    }
    return added;
}

mcv_core::Result<ChestTeleporter*> TeleportNetwork::add_chest(NodeId chest) {
    if (!m_scene.is_valid(chest)) {
        return mcv_core::Err<ChestTeleporter*>(mcv_core::TeleportError::missing_node("<invalid>", "chest node"));
    }
    if (auto* existing = find_chest(chest)) {
        return mcv_core::Ok(existing);
    }

    std::shared_ptr<IChestAnimator> animator;
    if (m_animator_factory) {
        animator = m_animator_factory(chest);
    }
    auto teleporter = std::make_unique<ChestTeleporter>(m_scene, chest, m_lockouts, m_config,
                                                        std::move(animator), m_rng);

    // A chest without teleport volume still receives actors
    if (auto setup = teleporter->setup(); !setup) {
        mcv_core::teleport_logger()->warn("{}", mcv_core::build_error_chain(setup.error()));
    }

    if (m_on_outcome) {
        teleporter->set_outcome_callback(m_on_outcome);
    }

    wire_volumes(*teleporter);
    m_chests.push_back(std::move(teleporter));
    return mcv_core::Ok(m_chests.back().get());
}

void TeleportNetwork::wire_volumes(ChestTeleporter& chest) {
    ChestTeleporter* target = &chest;

    if (NodeId volume = chest.teleport_volume()) {
        m_monitor.watch(
            volume,
            [target](NodeId actor) { target->on_volume_enter(VolumeKind::Teleport, actor); },
            [target](NodeId actor) { target->on_volume_exit(VolumeKind::Teleport, actor); });
    }

    if (NodeId volume = chest.detect_volume()) {
        m_monitor.watch(
            volume,
            [target](NodeId actor) { target->on_volume_enter(VolumeKind::PlayerDetect, actor); },
            [target](NodeId actor) { target->on_volume_exit(VolumeKind::PlayerDetect, actor); });
    }
}

void TeleportNetwork::tick(float dt) {
    m_time += dt;

    m_lockouts.tick(dt, m_scene);

    for (auto& chest : m_chests) {
        chest->on_tick(dt);
    }

    m_monitor.update(m_scene);
}

void TeleportNetwork::reset_all() {
    for (auto& chest : m_chests) {
        chest->reset();
    }
}

ChestTeleporter* TeleportNetwork::find_chest(NodeId chest) {
    for (auto& teleporter : m_chests) {
        if (teleporter->chest() == chest) {
            return teleporter.get();
        }
    }
    return nullptr;
}

const ChestTeleporter* TeleportNetwork::find_chest(NodeId chest) const {
    for (const auto& teleporter : m_chests) {
        if (teleporter->chest() == chest) {
            return teleporter.get();
        }
    }
    return nullptr;
}

ChestTeleporter* TeleportNetwork::find_chest(const std::string& name) {
    for (auto& teleporter : m_chests) {
        if (teleporter->name() == name) {
            return teleporter.get();
        }
    }
    return nullptr;
}

} // namespace mcv_teleport
