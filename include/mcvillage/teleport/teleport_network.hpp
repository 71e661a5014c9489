/// @file teleport_network.hpp
/// @brief Set of chests sharing a tag, a lockout table and a volume monitor

#pragma once

#include "chest_teleporter.hpp"
#include "lockout_table.hpp"

#include <mcvillage/scene/volume_monitor.hpp>

#include <functional>
#include <memory>
#include <vector>

namespace mcv_teleport {

// =============================================================================
// TeleportNetwork
// =============================================================================

/// @brief Drives every chest of a scene from one host tick
///
/// tick(dt) runs in a fixed order: lockout timers, chest sequences, then
/// volume events for the actors' current positions.
class TeleportNetwork {
public:
    using AnimatorFactory = std::function<std::shared_ptr<IChestAnimator>(NodeId chest)>;

    TeleportNetwork(mcv_scene::SceneGraph& scene, TeleportConfig config = {},
                    std::shared_ptr<mcv_core::IRandomSource> rng = nullptr);
    ~TeleportNetwork();

    TeleportNetwork(const TeleportNetwork&) = delete;
    TeleportNetwork& operator=(const TeleportNetwork&) = delete;

    /// @brief Animator used for chests registered afterwards
    ///
    /// Defaults to a RecordingChestAnimator per chest.
    void set_animator_factory(AnimatorFactory factory);

    /// @brief Register every tagged chest not yet known
    /// @return Number of chests added
    std::size_t discover();

    /// @brief Register a single chest node
    mcv_core::Result<ChestTeleporter*> add_chest(NodeId chest);

    /// @brief Advance the whole network
    void tick(float dt);

    /// @brief Reset every chest
    void reset_all();

    /// @brief Called for every finished teleport attempt of any chest
    void set_outcome_callback(ChestTeleporter::OutcomeCallback callback);

    [[nodiscard]] ChestTeleporter* find_chest(NodeId chest);
    [[nodiscard]] const ChestTeleporter* find_chest(NodeId chest) const;
    [[nodiscard]] ChestTeleporter* find_chest(const std::string& name);

    [[nodiscard]] const std::vector<std::unique_ptr<ChestTeleporter>>& chests() const noexcept { return m_chests; }
    [[nodiscard]] std::size_t chest_count() const noexcept { return m_chests.size(); }

    [[nodiscard]] LockoutTable& lockouts() noexcept { return m_lockouts; }
    [[nodiscard]] const LockoutTable& lockouts() const noexcept { return m_lockouts; }
    [[nodiscard]] mcv_scene::VolumeMonitor& monitor() noexcept { return m_monitor; }
    [[nodiscard]] const TeleportConfig& config() const noexcept { return m_config; }

    /// @brief Simulated seconds since construction
    [[nodiscard]] double time() const noexcept { return m_time; }

private:
    void wire_volumes(ChestTeleporter& chest);

    mcv_scene::SceneGraph& m_scene;
    TeleportConfig m_config;
    std::shared_ptr<mcv_core::IRandomSource> m_rng;
    AnimatorFactory m_animator_factory;
    ChestTeleporter::OutcomeCallback m_on_outcome;

    LockoutTable m_lockouts;
    mcv_scene::VolumeMonitor m_monitor;
    std::vector<std::unique_ptr<ChestTeleporter>> m_chests;
    double m_time{0.0};
};

} // namespace mcv_teleport
