/// @file main.cpp
/// @brief mcvillage simulation CLI
///
/// Loads a JSON world description, runs every grid generator and lantern chain
/// once and then drives the teleport network, the doors and an optional reveal
/// effect tick by tick while an actor follows scripted waypoints.

#include <mcvillage/core/config.hpp>
#include <mcvillage/core/log.hpp>
#include <mcvillage/core/random.hpp>
#include <mcvillage/gridgen/serialization.hpp>
#include <mcvillage/math/json.hpp>
#include <mcvillage/props/serialization.hpp>
#include <mcvillage/reveal/serialization.hpp>
#include <mcvillage/scene/assets.hpp>
#include <mcvillage/scene/scene_graph.hpp>
#include <mcvillage/teleport/serialization.hpp>
#include <mcvillage/teleport/teleport_network.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

/// Seed stream for the teleport network; generators take streams 0..n-1
constexpr std::uint32_t kTeleportSeedStream = 0xFFFFFFFFu;

// =============================================================================
// Command Line
// =============================================================================

struct Options {
    fs::path world_path;
    std::optional<std::uint32_t> seed;
    std::optional<int> ticks;
    std::optional<float> dt;
    std::optional<spdlog::level::level_enum> log_level;
    bool clear_after{false};
    bool skip_scenario{false};
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] WORLD_PATH\n"
              << "\n"
              << "Arguments:\n"
              << "  WORLD_PATH          Path to a world JSON file or a directory holding world.json\n"
              << "\n"
              << "Options:\n"
              << "  --seed N            Base seed; each generator and the teleport network derive their own\n"
              << "  --ticks N           Override the scenario tick count\n"
              << "  --dt SECONDS        Override the scenario tick length\n"
              << "  --log-level LEVEL   trace, debug, info, warn, error, critical or off\n"
              << "  --clear             Clear every generator after reporting\n"
              << "  --no-scenario       Only run the generators\n"
              << "  --help, -h          Show this help message\n"
              << "  --version, -v       Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " examples/mcv_sim/world.json\n"
              << "  " << program_name << " --seed 42 --log-level debug examples/mcv_sim\n";
}

void print_version() {
    std::cout << "mcv_sim 0.1.0\n"
              << "mcvillage village simulation\n";
}

/// Fetch the value following an option, reporting a missing one
std::optional<std::string> option_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) {
        std::cerr << "Missing value for " << argv[i] << "\n";
        return std::nullopt;
    }
    return std::string(argv[++i]);
}

// =============================================================================
// Scenario
// =============================================================================

struct Waypoint {
    float time{0.0f};
    mcv_math::Vec3 position{0.0f};
};

struct Scenario {
    std::string actor{"Player"};
    float dt{0.1f};
    int ticks{100};
    std::vector<Waypoint> waypoints;
};

mcv_core::Result<Scenario> scenario_from_json(const nlohmann::json& j) {
    Scenario scenario;
    if (auto r = mcv_core::expect_object(j, "scenario"); !r) {
        return mcv_core::Err<Scenario>(r.error());
    }
    for (auto r : {mcv_core::read_optional(j, "actor", scenario.actor),
                   mcv_core::read_optional(j, "dt", scenario.dt),
                   mcv_core::read_optional(j, "ticks", scenario.ticks)}) {
        if (!r) {
            return mcv_core::Err<Scenario>(r.error());
        }
    }

    if (auto it = j.find("waypoints"); it != j.end()) {
        if (!it->is_array()) {
            return mcv_core::Err<Scenario>(mcv_core::ConfigError::wrong_type("waypoints", "an array"));
        }
        for (const auto& entry : *it) {
            Waypoint waypoint;
            if (auto r = mcv_core::read_required(entry, "time", waypoint.time); !r) {
                return mcv_core::Err<Scenario>(r.error());
            }
            if (!entry.contains("position")) {
                return mcv_core::Err<Scenario>(mcv_core::ConfigError::malformed("waypoints", "waypoint without position"));
            }
            auto position = mcv_math::vec3_from_json(entry["position"], "waypoints.position");
            if (!position) {
                return mcv_core::Err<Scenario>(position.error());
            }
            waypoint.position = *position;
            scenario.waypoints.push_back(waypoint);
        }
    }

    if (scenario.dt <= 0.0f) {
        return mcv_core::Err<Scenario>(mcv_core::ConfigError::wrong_type("dt", "a positive number of seconds"));
    }
    return mcv_core::Ok(std::move(scenario));
}

// =============================================================================
// World Loading
// =============================================================================

mcv_core::LogConfig log_config_from_json(const nlohmann::json& world) {
    mcv_core::LogConfig config;
    auto it = world.find("logging");
    if (it == world.end() || !it->is_object()) {
        return config;
    }

    std::string level;
    for (auto r : {mcv_core::read_optional(*it, "level", level),
                   mcv_core::read_optional(*it, "console", config.console_enabled),
                   mcv_core::read_optional(*it, "file", config.file_enabled),
                   mcv_core::read_optional(*it, "directory", config.log_directory)}) {
        if (!r) {
            std::cerr << "Ignoring logging section: " << r.error().message() << "\n";
            return mcv_core::LogConfig{};
        }
    }
    if (!level.empty()) {
        if (auto parsed = mcv_core::parse_log_level(level)) {
            config.level = *parsed;
        }
    }
    return config;
}

mcv_core::Result<void> load_nodes(const nlohmann::json& world, mcv_scene::SceneGraph& scene,
                                  const mcv_scene::AssetLookup& assets) {
    auto it = world.find("nodes");
    if (it == world.end()) {
        return mcv_core::Ok();
    }
    if (!it->is_array()) {
        return mcv_core::Err(mcv_core::ConfigError::wrong_type("nodes", "an array"));
    }
    for (const auto& entry : *it) {
        auto node = mcv_scene::node_from_json(entry, scene, assets);
        if (!node) {
            return mcv_core::Err(node.error());
        }
    }
    return mcv_core::Ok();
}

// =============================================================================
// Reporting
// =============================================================================

void report_generation(const mcv_gridgen::LoadedGenerator& loaded, const mcv_gridgen::GenerationReport& report) {
    spdlog::info("=== Generator '{}' ({}) ===", loaded.owner_name, loaded.generator->kind());
    spdlog::info("Cells: {}  placed: {}  skipped: {}", report.cell_count, report.placements.size(),
                 report.skipped_cells);
    if (report.seed) {
        spdlog::info("Seed: {}", *report.seed);
    }

    for (const auto& placement : report.placements) {
        std::string sprite = "-";
        if (placement.sprite) {
            sprite = "sheet " + std::to_string(placement.sprite->sheet_index) + " frame " +
                     std::to_string(placement.sprite->frame) + "/" + std::to_string(placement.sprite->total_frames);
        }
        spdlog::info("  [{},{},{}] {:<16} pos {} scale {} rot {} sprite {} shader writes {}",
                     placement.cell.x, placement.cell.y, placement.cell.z, placement.type_name,
                     glm::to_string(placement.position), glm::to_string(placement.scale),
                     glm::to_string(mcv_math::euler_degrees(placement.rotation)), sprite,
                     placement.shader_writes);
    }
}

void report_outcome(const mcv_scene::SceneGraph& scene, const mcv_teleport::TeleportOutcome& outcome,
                    double time) {
    const std::string source = scene.is_valid(outcome.source) ? scene.name(outcome.source) : "<gone>";
    if (outcome.succeeded()) {
        spdlog::info("[t={:.2f}] {} -> {} arrived at {}", time, source, scene.name(outcome.destination),
                     glm::to_string(outcome.arrival));
    } else {
        spdlog::warn("[t={:.2f}] {} teleport failed: {}", time, source,
                     mcv_teleport::teleport_result_name(outcome.result));
    }
}

// =============================================================================
// Simulation
// =============================================================================

int run_scenario(mcv_scene::SceneGraph& scene, mcv_teleport::TeleportNetwork& network, mcv_props::DoorSet& doors,
                 mcv_reveal::MaterialRevealController* reveal, const Scenario& scenario) {
    mcv_scene::NodeId actor = scene.find_by_name(scenario.actor);
    if (!actor) {
        spdlog::error("Scenario actor '{}' not found", scenario.actor);
        return 1;
    }
    if (scene.tag(actor) != network.config().actor_tag) {
        spdlog::warn("Actor '{}' is not tagged '{}'; volumes will ignore it", scenario.actor,
                     network.config().actor_tag);
    }

    std::size_t teleports = 0;
    network.set_outcome_callback([&scene, &network, &teleports](const mcv_teleport::TeleportOutcome& outcome) {
        if (outcome.succeeded()) {
            ++teleports;
        }
        report_outcome(scene, outcome, network.time());
    });

    spdlog::info("=== Scenario: {} ticks of {:.3f}s, {} waypoint(s) ===", scenario.ticks, scenario.dt,
                 scenario.waypoints.size());

    std::size_t next_waypoint = 0;
    std::vector<mcv_teleport::ChestState> states;
    for (const auto& chest : network.chests()) {
        states.push_back(chest->state());
    }
    std::vector<bool> doors_open(doors.doors().size(), false);

    for (int tick = 0; tick < scenario.ticks; ++tick) {
        const double now = network.time();
        while (next_waypoint < scenario.waypoints.size() &&
               scenario.waypoints[next_waypoint].time <= now + 1e-6) {
            const auto& waypoint = scenario.waypoints[next_waypoint++];
            scene.set_world_pose(actor, waypoint.position, scene.world_rotation(actor));
            spdlog::debug("[t={:.2f}] {} moved to {}", now, scenario.actor, glm::to_string(waypoint.position));
        }

        network.tick(scenario.dt);
        doors.tick(scenario.dt);
        if (reveal) {
            reveal->tick(scenario.dt);
        }

        for (std::size_t i = 0; i < network.chests().size(); ++i) {
            const auto& chest = network.chests()[i];
            if (chest->state() != states[i]) {
                spdlog::info("[t={:.2f}] {} is now {}", network.time(), chest->name(),
                             mcv_teleport::chest_state_name(chest->state()));
                states[i] = chest->state();
            }
        }
        for (std::size_t i = 0; i < doors.doors().size(); ++i) {
            const auto& door = doors.doors()[i];
            if (door->is_open() != doors_open[i]) {
                spdlog::info("[t={:.2f}] {} is now {}", network.time(), door->name(),
                             door->is_open() ? "open" : "closed");
                doors_open[i] = door->is_open();
            }
        }
    }

    spdlog::info("Scenario finished at t={:.2f}: {} teleport(s), actor at {}", network.time(), teleports,
                 glm::to_string(scene.world_position(actor)));
    if (reveal) {
        spdlog::info("Reveal amount {:.3f}, eye texture {}, eye emissive {}", reveal->reveal_value(),
                     reveal->eye_texture_index(), reveal->eye_emissive_index());
    }
    return 0;
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    Options options;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (arg == "--clear") {
            options.clear_after = true;
        } else if (arg == "--no-scenario") {
            options.skip_scenario = true;
        } else if (arg == "--seed" || arg == "--ticks" || arg == "--dt" || arg == "--log-level") {
            auto value = option_value(i, argc, argv);
            if (!value) {
                return 1;
            }
            try {
                if (arg == "--seed") {
                    options.seed = static_cast<std::uint32_t>(std::stoul(*value));
                } else if (arg == "--ticks") {
                    options.ticks = std::stoi(*value);
                } else if (arg == "--dt") {
                    options.dt = std::stof(*value);
                } else {
                    options.log_level = mcv_core::parse_log_level(*value);
                    if (!options.log_level) {
                        std::cerr << "Unknown log level: " << *value << "\n";
                        return 1;
                    }
                }
            } catch (const std::exception&) {
                std::cerr << "Invalid value for " << arg << ": " << *value << "\n";
                return 1;
            }
        } else if (arg[0] != '-') {
            options.world_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (options.world_path.empty()) {
        std::cerr << "Error: No world specified.\n\n";
        print_usage(argv[0]);
        return 1;
    }

    // Resolve world path
    fs::path world_path;
    if (fs::is_directory(options.world_path)) {
        world_path = options.world_path / "world.json";
    } else if (fs::is_regular_file(options.world_path)) {
        world_path = options.world_path;
    } else {
        std::cerr << "World path does not exist: " << options.world_path << "\n";
        return 1;
    }

    mcv_core::init_logging();
    auto world = mcv_core::load_json_file(world_path);
    if (!world) {
        spdlog::error("Failed to load world: {}", mcv_core::build_error_chain(world.error()));
        return 1;
    }

    mcv_core::LogConfig log_config = log_config_from_json(*world);
    if (options.log_level) {
        log_config.level = *options.log_level;
    }
    mcv_core::configure_logging(log_config);

    spdlog::info("Loading world: {}", world_path.string());

    if (options.seed) {
        spdlog::info("Using seed {}", *options.seed);
    }

    // ==========================================================================
    // Scene
    // ==========================================================================
    mcv_scene::SceneGraph scene;
    mcv_scene::AssetLookup assets;

    if (auto r = mcv_scene::load_assets(*world, scene, assets); !r) {
        spdlog::error("Failed to load assets: {}", mcv_core::build_error_chain(r.error()));
        return 1;
    }
    if (auto r = load_nodes(*world, scene, assets); !r) {
        spdlog::error("Failed to load nodes: {}", mcv_core::build_error_chain(r.error()));
        return 1;
    }

    // ==========================================================================
    // Grid Generators
    // ==========================================================================
    auto generators = mcv_gridgen::generators_from_json(*world, scene, assets, options.seed);
    if (!generators) {
        spdlog::error("Failed to load generators: {}", mcv_core::build_error_chain(generators.error()));
        return 1;
    }

    int exit_code = 0;
    for (const auto& loaded : *generators) {
        auto report = loaded.generator->generate();
        if (!report) {
            spdlog::error("Generator '{}' failed: {}", loaded.owner_name,
                          mcv_core::build_error_chain(report.error()));
            exit_code = 1;
            continue;
        }
        report_generation(loaded, *report);
    }

    // ==========================================================================
    // Lantern Chains
    // ==========================================================================
    auto chains = mcv_props::chains_from_json(*world, scene, assets);
    if (!chains) {
        spdlog::error("Failed to load chains: {}", mcv_core::build_error_chain(chains.error()));
        return 1;
    }
    for (const auto& chain : *chains) {
        auto report = chain->generate();
        if (!report) {
            exit_code = 1;
            continue;
        }
        spdlog::info("Chain under '{}': {} link(s) over {:.2f}", scene.name(scene.parent(report->container)),
                     report->link_count(), report->distance);
    }

    // ==========================================================================
    // Teleport Network
    // ==========================================================================
    mcv_teleport::TeleportConfig teleport_config;
    if (auto it = world->find("teleport"); it != world->end()) {
        auto parsed = mcv_teleport::teleport_config_from_json(*it);
        if (!parsed) {
            spdlog::error("Failed to load teleport config: {}", mcv_core::build_error_chain(parsed.error()));
            return 1;
        }
        teleport_config = std::move(*parsed);
    }

    // The network draws from its own stream so generator reseeds cannot reach it
    std::shared_ptr<mcv_core::IRandomSource> network_rng;
    if (options.seed) {
        network_rng = std::make_shared<mcv_core::SeededRandom>(
            mcv_core::derive_seed(*options.seed, kTeleportSeedStream));
    } else {
        network_rng = std::make_shared<mcv_core::SeededRandom>();
    }
    mcv_teleport::TeleportNetwork network(scene, teleport_config, network_rng);
    std::size_t chests = network.discover();
    spdlog::info("Teleport network: {} chest(s)", chests);

    // ==========================================================================
    // Doors
    // ==========================================================================
    mcv_props::DoorSet doors(scene, teleport_config.actor_tag);
    auto door_animator = [](const std::string& label) -> std::shared_ptr<mcv_teleport::IChestAnimator> {
        return std::make_shared<mcv_teleport::RecordingChestAnimator>(label);
    };
    if (auto r = mcv_props::doors_from_json(*world, scene, doors, door_animator); !r) {
        spdlog::error("Failed to load doors: {}", mcv_core::build_error_chain(r.error()));
        return 1;
    }
    if (!doors.doors().empty() || !doors.trigger_animations().empty()) {
        spdlog::info("Doors: {} door(s), {} trigger animation(s)", doors.doors().size(),
                     doors.trigger_animations().size());
    }

    // ==========================================================================
    // Reveal Effect
    // ==========================================================================
    std::unique_ptr<mcv_reveal::MaterialRevealController> reveal;
    if (auto it = world->find("reveal"); it != world->end()) {
        std::string root_name;
        if (auto r = mcv_core::read_required(*it, "root", root_name); !r) {
            spdlog::error("Failed to load reveal: {}", mcv_core::build_error_chain(r.error()));
            return 1;
        }
        mcv_scene::NodeId root = scene.find_by_name(root_name);
        if (!root) {
            spdlog::error("Reveal root '{}' not found", root_name);
            return 1;
        }
        auto settings = mcv_reveal::reveal_settings_from_json(*it, assets);
        if (!settings) {
            spdlog::error("Failed to load reveal: {}", mcv_core::build_error_chain(settings.error()));
            return 1;
        }
        reveal = std::make_unique<mcv_reveal::MaterialRevealController>(scene, root, std::move(*settings));
        reveal->start();
        if (!reveal->is_playing()) {
            reveal->play_reveal();
        }
    }

    // ==========================================================================
    // Scenario
    // ==========================================================================
    if (!options.skip_scenario) {
        if (auto it = world->find("scenario"); it != world->end()) {
            auto scenario = scenario_from_json(*it);
            if (!scenario) {
                spdlog::error("Failed to load scenario: {}", mcv_core::build_error_chain(scenario.error()));
                return 1;
            }
            if (options.ticks) {
                scenario->ticks = *options.ticks;
            }
            if (options.dt) {
                scenario->dt = *options.dt;
            }
            if (run_scenario(scene, network, doors, reveal.get(), *scenario) != 0) {
                exit_code = 1;
            }
        }
    }

    if (options.clear_after) {
        for (const auto& loaded : *generators) {
            std::size_t removed = loaded.generator->clear();
            spdlog::info("Cleared {} instance(s) from '{}'", removed, loaded.owner_name);
        }
        for (const auto& chain : *chains) {
            std::size_t removed = chain->clear();
            spdlog::info("Cleared {} chain link(s)", removed);
        }
    }

    mcv_core::shutdown_logging();
    return exit_code;
}
