/// @file chest_teleporter.cpp
/// @brief ChestTeleporter implementation for mcv_teleport module

#include <mcvillage/teleport/chest_teleporter.hpp>
#include <mcvillage/teleport/lockout_table.hpp>

#include <mcvillage/core/log.hpp>
#include <mcvillage/core/random.hpp>
#include <mcvillage/scene/scene_graph.hpp>
#include <mcvillage/scene/volumes.hpp>

#include <map>
#include <string>

namespace mcv_teleport {

using mcv_sequence::Sequence;
using mcv_sequence::StepStatus;

ChestTeleporter::ChestTeleporter(mcv_scene::SceneGraph& scene, NodeId chest, LockoutTable& lockouts,
                                 const TeleportConfig& config, std::shared_ptr<IChestAnimator> animator,
                                 std::shared_ptr<mcv_core::IRandomSource> rng)
    : m_scene(scene)
    , m_chest(chest)
    , m_lockouts(lockouts)
    , m_config(config)
    , m_animator(std::move(animator))
    , m_rng(rng ? std::move(rng) : std::make_shared<mcv_core::SeededRandom>())
    , m_name(scene.is_valid(chest) ? scene.name(chest) : std::string("<invalid>")) {
}

ChestTeleporter::~ChestTeleporter() = default;

// =============================================================================
// Setup
// =============================================================================

NodeId ChestTeleporter::find_named(NodeId root, const std::string& name) const {
    if (NodeId direct = m_scene.find_child(root, name)) {
        return direct;
    }
    return m_scene.find_descendant_containing(root, name);
}

NodeId ChestTeleporter::find_target(NodeId chest) const {
    if (!m_scene.is_valid(chest)) {
        return {};
    }
    return find_named(chest, m_config.teleport_target_name);
}

mcv_core::Result<void> ChestTeleporter::setup() {
    auto log = mcv_core::teleport_logger();

    if (!m_scene.is_valid(m_chest)) {
        return mcv_core::Err(mcv_core::TeleportError::missing_node(m_name, "chest node"));
    }

    // Teleport volume: named child, named descendant, then the chest itself
    m_teleport_volume = find_named(m_chest, m_config.teleport_volume_name);
    if (!m_teleport_volume && m_scene.volume(m_chest)) {
        m_teleport_volume = m_chest;
        if (verbose()) {
            log->debug("[{}] Using the chest itself as {}", m_name, m_config.teleport_volume_name);
        }
    }

    if (m_teleport_volume && !m_scene.volume(m_teleport_volume)) {
        if (verbose()) {
            log->warn("[{}] No volume found on {}, adding a box", m_name, m_scene.name(m_teleport_volume));
        }
        m_scene.set_volume(m_teleport_volume,
                           mcv_scene::VolumeFactory::create_box(Vec3(0.0f), m_config.default_teleport_volume_size));
    }

    // Teleport target: created in front of the chest when missing
    m_teleport_target = find_target(m_chest);
    if (!m_teleport_target) {
        if (verbose()) {
            log->warn("[{}] {} not found, creating one", m_name, m_config.teleport_target_name);
        }
        m_teleport_target = m_scene.create_node(m_config.teleport_target_name, m_chest);
        m_scene.set_local_position(m_teleport_target, m_config.default_target_offset);
    }

    // Detect volume: direct child only
    m_detect_volume = m_scene.find_child(m_chest, m_config.detect_volume_name);
    if (m_detect_volume) {
        if (!m_scene.volume(m_detect_volume)) {
            if (verbose()) {
                log->warn("[{}] {} has no volume, adding a box", m_name, m_config.detect_volume_name);
            }
            m_scene.set_volume(m_detect_volume,
                               mcv_scene::VolumeFactory::create_box(Vec3(0.0f), m_config.default_detect_volume_size));
        }
    } else if (verbose()) {
        log->warn("[{}] No {} found as child, proximity detection disabled", m_name, m_config.detect_volume_name);
    }

    if (!m_animator && verbose()) {
        log->warn("[{}] No animator assigned, chest animations will not play", m_name);
    }

    // Start closed
    if (m_animator) {
        m_animator->set_intent(AnimationIntent::Close);
    }
    m_door_open = false;

    if (!m_teleport_volume) {
        log->error("[{}] No {} found, teleportation from this chest is disabled", m_name,
                   m_config.teleport_volume_name);
        return mcv_core::Err(mcv_core::TeleportError::missing_node(m_name, m_config.teleport_volume_name));
    }

    if (verbose()) {
        log->debug("[{}] Ready: volume '{}', target '{}' at {}", m_name, m_scene.name(m_teleport_volume),
                   m_scene.name(m_teleport_target), glm::to_string(m_scene.world_position(m_teleport_target)));
    }
    return mcv_core::Ok();
}

// =============================================================================
// Events
// =============================================================================

void ChestTeleporter::on_tick(float dt) {
    m_cooldown.tick(dt);
    m_teleport.tick(dt);
}

void ChestTeleporter::on_volume_enter(VolumeKind kind, NodeId actor) {
    auto log = mcv_core::teleport_logger();

    if (kind == VolumeKind::PlayerDetect) {
        m_in_range.insert(actor);
        if (!m_on_cooldown && !m_is_teleporting) {
            open_chest();
        } else if (verbose()) {
            log->debug("[{}] Actor in range but chest is {}", m_name,
                       m_is_teleporting ? "teleporting" : "on cooldown");
        }
        return;
    }

    if (auto left = m_lockouts.remaining(m_chest)) {
        if (verbose()) {
            log->debug("[{}] Chest is locked out for {:.1f} more seconds", m_name, *left);
        }
        return;
    }

    if (m_can_teleport && !m_teleport_initiated) {
        if (verbose()) {
            log->info("[{}] '{}' entered the teleport volume, starting transfer", m_name, m_scene.name(actor));
        }
        start_teleport(actor);
    }
}

void ChestTeleporter::on_volume_exit(VolumeKind kind, NodeId actor) {
    if (kind != VolumeKind::PlayerDetect) {
        return;
    }

    m_in_range.erase(actor);
    if (!m_in_range.empty()) {
        return;
    }

    if (!m_is_teleporting) {
        close_chest();
    } else if (verbose()) {
        mcv_core::teleport_logger()->debug("[{}] Actor left range during transfer, door untouched", m_name);
    }
}

// =============================================================================
// Door
// =============================================================================

void ChestTeleporter::open_chest() {
    auto log = mcv_core::teleport_logger();

    if (m_on_cooldown) {
        if (verbose()) {
            log->debug("[{}] Cannot open chest - cooldown active", m_name);
        }
        return;
    }
    if (m_is_teleporting) {
        if (verbose()) {
            log->debug("[{}] Cannot open chest - teleportation in progress", m_name);
        }
        return;
    }
    if (!m_animator) {
        if (verbose()) {
            log->warn("[{}] Cannot open chest - no animator assigned", m_name);
        }
        return;
    }

    m_animator->set_intent(AnimationIntent::Open);
    m_door_open = true;
}

void ChestTeleporter::close_chest() {
    if (!m_animator) {
        if (verbose()) {
            mcv_core::teleport_logger()->warn("[{}] Cannot close chest - no animator assigned", m_name);
        }
        return;
    }

    m_animator->set_intent(AnimationIntent::Close);
    m_door_open = false;
    start_cooldown();
}

void ChestTeleporter::start_cooldown() {
    m_on_cooldown = true;

    Sequence cooldown("reopen_cooldown");
    cooldown.wait(m_config.chest_reopen_cooldown)
            .call([this]() { finish_cooldown(); }, "EndCooldown");
    m_cooldown.start(std::move(cooldown));

    if (verbose()) {
        mcv_core::teleport_logger()->debug("[{}] Starting chest cooldown for {} seconds", m_name,
                                           m_config.chest_reopen_cooldown);
    }
}

void ChestTeleporter::finish_cooldown() {
    m_on_cooldown = false;
    if (verbose()) {
        mcv_core::teleport_logger()->debug("[{}] Chest cooldown finished", m_name);
    }

    if (actor_in_range() && !m_is_teleporting) {
        open_chest();
    }
}

void ChestTeleporter::reset() {
    m_cooldown.cancel();
    m_teleport.cancel();

    m_on_cooldown = false;
    m_is_teleporting = false;
    m_teleport_initiated = false;
    m_can_teleport = true;
    m_pending_actor = {};
    m_pending_controller = {};
    m_pending_destination = {};
    m_pending_target = {};

    if (m_animator) {
        m_door_open = actor_in_range();
        m_animator->set_intent(m_door_open ? AnimationIntent::Open : AnimationIntent::Close);
    }

    if (verbose()) {
        mcv_core::teleport_logger()->info("[{}] Teleporter state has been reset", m_name);
    }
}

// =============================================================================
// Transfer
// =============================================================================

void ChestTeleporter::start_teleport(NodeId actor) {
    m_teleport_initiated = true;
    m_can_teleport = false;
    m_is_teleporting = true;
    m_pending_actor = actor;

    Sequence transfer("teleport");
    transfer.wait(m_config.teleport_delay)
            .call_checked([this]() { return select_destination(); }, "SelectDestination")
            .wait(m_config.close_settle_delay)
            .call_checked([this]() { return relocate(); }, "Relocate")
            .wait(m_config.post_teleport_cooldown)
            .call([this]() { finish_teleport(); }, "RestoreTeleport");
    m_teleport.start(std::move(transfer));
}

std::vector<NodeId> ChestTeleporter::eligible_destinations() const {
    std::vector<NodeId> result;
    for (NodeId candidate : m_scene.find_with_tag(m_config.network_tag)) {
        if (m_scene.is_ancestor_or_self(candidate, m_chest) || m_scene.is_ancestor_or_self(m_chest, candidate)) {
            continue;
        }
        if (!find_target(candidate)) {
            continue;
        }
        result.push_back(candidate);
    }
    return result;
}

NodeId ChestTeleporter::resolve_actor(NodeId detected) const {
    if (!m_scene.is_valid(detected)) {
        return {};
    }
    if (NodeId controller = m_scene.find_child(detected, m_config.controller_name)) {
        return controller;
    }
    if (NodeId controller = m_scene.find_descendant_containing(detected, m_config.controller_name)) {
        return controller;
    }
    return detected;
}

StepStatus ChestTeleporter::select_destination() {
    auto destinations = eligible_destinations();
    if (destinations.empty()) {
        fail_teleport(TeleportResult::NoDestination,
                      mcv_core::TeleportError::no_destination(m_name, m_config.network_tag));
        return StepStatus::Failed;
    }

    int index = m_rng->range_int(0, static_cast<int>(destinations.size()));
    m_pending_destination = destinations[static_cast<std::size_t>(index)];
    m_pending_target = find_target(m_pending_destination);

    NodeId controller = resolve_actor(m_pending_actor);
    if (!controller) {
        fail_teleport(TeleportResult::NoActor, mcv_core::TeleportError::no_actor(m_name));
        return StepStatus::Failed;
    }
    m_pending_controller = controller;

    if (verbose()) {
        mcv_core::teleport_logger()->debug("[{}] Selected target chest '{}'", m_name,
                                           m_scene.name(m_pending_destination));
    }

    close_chest();
    return StepStatus::Success;
}

StepStatus ChestTeleporter::relocate() {
    if (!m_scene.is_valid(m_pending_actor) || !m_scene.is_valid(m_pending_controller)) {
        fail_teleport(TeleportResult::NoActor, mcv_core::TeleportError::no_actor(m_name));
        return StepStatus::Failed;
    }
    if (!m_scene.is_valid(m_pending_target)) {
        fail_teleport(TeleportResult::MissingTarget,
                      mcv_core::TeleportError::missing_node(m_name, m_config.teleport_target_name));
        return StepStatus::Failed;
    }

    Vec3 from = m_scene.world_position(m_pending_controller);
    Vec3 to = m_scene.world_position(m_pending_target);
    move_actor_onto(to, m_scene.world_rotation(m_pending_target));
    m_lockouts.lock(m_pending_destination, m_config.destination_lockout_duration);

    if (verbose()) {
        mcv_core::teleport_logger()->info("[{}] Teleported '{}' from {} to '{}' at {}, destination locked for {}s",
                                          m_name, m_scene.name(m_pending_controller), glm::to_string(from),
                                          m_scene.name(m_pending_destination), glm::to_string(to),
                                          m_config.destination_lockout_duration);
    }

    TeleportOutcome outcome;
    outcome.result = TeleportResult::Teleported;
    outcome.source = m_chest;
    outcome.destination = m_pending_destination;
    outcome.actor = m_pending_controller;
    outcome.arrival = to;
    record(std::move(outcome));
    return StepStatus::Success;
}

void ChestTeleporter::move_actor_onto(const Vec3& position, const Quat& rotation) {
    if (m_pending_controller == m_pending_actor) {
        m_scene.set_world_pose(m_pending_actor, position, rotation);
        return;
    }

    // Move the detected root so the controller lands on the pose while keeping
    // its offset from the root. Volumes track the root, not the controller.
    const Quat root_rotation = m_scene.world_rotation(m_pending_actor);
    const Quat inverse_root = glm::inverse(root_rotation);
    const Quat relative_rotation = inverse_root * m_scene.world_rotation(m_pending_controller);
    const Vec3 local_offset =
        inverse_root * (m_scene.world_position(m_pending_controller) - m_scene.world_position(m_pending_actor));

    const Quat new_root_rotation = rotation * glm::inverse(relative_rotation);
    m_scene.set_world_pose(m_pending_actor, position - new_root_rotation * local_offset, new_root_rotation);
}

void ChestTeleporter::finish_teleport() {
    m_teleport_initiated = false;
    m_can_teleport = true;
    m_is_teleporting = false;
    m_pending_actor = {};
    m_pending_controller = {};
    m_pending_destination = {};
    m_pending_target = {};

    if (verbose()) {
        mcv_core::teleport_logger()->debug("[{}] Local teleport cooldown finished", m_name);
    }
}

void ChestTeleporter::fail_teleport(TeleportResult result, mcv_core::Error error) {
    mcv_core::teleport_logger()->error("[{}] {}", m_name, error.message());

    TeleportOutcome outcome;
    outcome.result = result;
    outcome.source = m_chest;
    outcome.destination = m_pending_destination;
    outcome.actor = m_pending_controller ? m_pending_controller : m_pending_actor;
    outcome.error = std::move(error);

    m_teleport_initiated = false;
    m_can_teleport = true;
    m_is_teleporting = false;
    m_pending_actor = {};
    m_pending_controller = {};
    m_pending_destination = {};
    m_pending_target = {};

    record(std::move(outcome));
}

void ChestTeleporter::record(TeleportOutcome outcome) {
    m_last_outcome = std::move(outcome);
    if (verbose()) {
        std::map<std::string, std::string> fields{
            {"result", teleport_result_name(m_last_outcome.result)},
            {"source", m_name},
        };
        if (m_scene.is_valid(m_last_outcome.destination)) {
            fields["destination"] = m_scene.name(m_last_outcome.destination);
        }
        if (m_last_outcome.succeeded()) {
            fields["arrival"] = glm::to_string(m_last_outcome.arrival);
        }
        mcv_core::log_structured(spdlog::level::debug, "mcv_teleport", "Teleport outcome", fields);
    }
    if (m_on_outcome) {
        auto callback = m_on_outcome;
        callback(m_last_outcome);
    }
}

// =============================================================================
// State
// =============================================================================

ChestState ChestTeleporter::state() const {
    if (m_is_teleporting) {
        return ChestState::Teleporting;
    }
    if (m_on_cooldown) {
        return ChestState::CooldownClosed;
    }
    return m_door_open ? ChestState::Open : ChestState::Closed;
}

bool ChestTeleporter::is_locked_out() const {
    return m_lockouts.is_locked(m_chest);
}

} // namespace mcv_teleport
