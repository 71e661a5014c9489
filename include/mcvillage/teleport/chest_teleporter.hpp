/// @file chest_teleporter.hpp
/// @brief Per-chest door and teleport state machine

#pragma once

#include "animator.hpp"
#include "listener.hpp"
#include "types.hpp"

#include <mcvillage/core/error.hpp>
#include <mcvillage/core/fwd.hpp>
#include <mcvillage/sequence/sequence.hpp>

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace mcv_teleport {

class LockoutTable;

// =============================================================================
// ChestTeleporter
// =============================================================================

/// @brief One endpoint of a teleport network
///
/// Door handling: an actor entering the detect volume opens the door unless a
/// reopen cooldown or a transfer is running; the last actor leaving closes it.
/// Every close starts the reopen cooldown (cancelling a running one); when the
/// cooldown ends the door reopens if an actor is still in range.
///
/// Transfers: an actor entering the teleport volume of a chest that is not
/// locked out starts the transfer sequence: wait `teleport_delay`, pick a
/// destination, close the door, wait `close_settle_delay`, relocate the actor
/// and lock the destination out, wait `post_teleport_cooldown`, then allow
/// teleports again. Failures abort the sequence and reset the transfer flags.
class ChestTeleporter : public ISimulationListener {
public:
    using OutcomeCallback = std::function<void(const TeleportOutcome&)>;

    ChestTeleporter(mcv_scene::SceneGraph& scene, NodeId chest, LockoutTable& lockouts,
                    const TeleportConfig& config, std::shared_ptr<IChestAnimator> animator,
                    std::shared_ptr<mcv_core::IRandomSource> rng);
    ~ChestTeleporter() override;

    ChestTeleporter(const ChestTeleporter&) = delete;
    ChestTeleporter& operator=(const ChestTeleporter&) = delete;

    /// @brief Resolve child nodes, synthesizing missing volumes and target
    ///
    /// Returns an error when no teleport volume node exists at all; the chest
    /// then only serves as a destination.
    mcv_core::Result<void> setup();

    // =========================================================================
    // ISimulationListener
    // =========================================================================

    void on_tick(float dt) override;
    void on_volume_enter(VolumeKind kind, NodeId actor) override;
    void on_volume_exit(VolumeKind kind, NodeId actor) override;

    // =========================================================================
    // Control
    // =========================================================================

    /// @brief Request the door open (refused during cooldown or transfer)
    void open_chest();

    /// @brief Close the door and start the reopen cooldown
    void close_chest();

    /// @brief Cancel cooldown and transfer, clear flags, match door to actor presence
    void reset();

    /// @brief Chests that could receive an actor from this one right now
    [[nodiscard]] std::vector<NodeId> eligible_destinations() const;

    /// @brief Target node of any chest (direct child, else a descendant whose name contains it)
    [[nodiscard]] NodeId find_target(NodeId chest) const;

    void set_outcome_callback(OutcomeCallback callback) { m_on_outcome = std::move(callback); }

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] ChestState state() const;
    [[nodiscard]] bool is_door_open() const noexcept { return m_door_open; }
    [[nodiscard]] bool is_on_cooldown() const noexcept { return m_on_cooldown; }
    [[nodiscard]] bool is_teleporting() const noexcept { return m_is_teleporting; }
    [[nodiscard]] bool can_teleport() const noexcept { return m_can_teleport; }
    [[nodiscard]] bool actor_in_range() const noexcept { return !m_in_range.empty(); }
    [[nodiscard]] bool is_locked_out() const;

    [[nodiscard]] NodeId chest() const noexcept { return m_chest; }
    [[nodiscard]] NodeId teleport_volume() const noexcept { return m_teleport_volume; }
    [[nodiscard]] NodeId teleport_target() const noexcept { return m_teleport_target; }
    [[nodiscard]] NodeId detect_volume() const noexcept { return m_detect_volume; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const TeleportOutcome& last_outcome() const noexcept { return m_last_outcome; }
    [[nodiscard]] const TeleportConfig& config() const noexcept { return m_config; }

private:
    void start_cooldown();
    void finish_cooldown();
    void start_teleport(NodeId actor);

    mcv_sequence::StepStatus select_destination();
    mcv_sequence::StepStatus relocate();
    void move_actor_onto(const Vec3& position, const Quat& rotation);
    void finish_teleport();
    void fail_teleport(TeleportResult result, mcv_core::Error error);
    void record(TeleportOutcome outcome);

    [[nodiscard]] NodeId resolve_actor(NodeId detected) const;
    [[nodiscard]] NodeId find_named(NodeId root, const std::string& name) const;
    [[nodiscard]] bool verbose() const noexcept { return m_config.debug_logs; }

    mcv_scene::SceneGraph& m_scene;
    NodeId m_chest;
    LockoutTable& m_lockouts;
    TeleportConfig m_config;
    std::shared_ptr<IChestAnimator> m_animator;
    std::shared_ptr<mcv_core::IRandomSource> m_rng;
    std::string m_name;

    NodeId m_teleport_volume;
    NodeId m_teleport_target;
    NodeId m_detect_volume;

    bool m_door_open{false};
    bool m_on_cooldown{false};
    bool m_can_teleport{true};
    bool m_teleport_initiated{false};
    bool m_is_teleporting{false};
    std::set<NodeId> m_in_range;

    mcv_sequence::SequenceSlot m_cooldown;
    mcv_sequence::SequenceSlot m_teleport;

    // In-flight transfer
    NodeId m_pending_actor;          ///< Tagged node the volumes detected
    NodeId m_pending_controller;     ///< Node that must land on the target
    NodeId m_pending_destination;
    NodeId m_pending_target;

    TeleportOutcome m_last_outcome;
    OutcomeCallback m_on_outcome;
};

} // namespace mcv_teleport
