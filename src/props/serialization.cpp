/// @file serialization.cpp
/// @brief JSON loading for mcv_props module

#include <mcvillage/props/serialization.hpp>

#include <mcvillage/core/config.hpp>
#include <mcvillage/math/json.hpp>
#include <mcvillage/scene/scene_graph.hpp>

#include <nlohmann/json.hpp>

#include <utility>

namespace mcv_props {

using mcv_core::ConfigError;
using mcv_core::Err;
using mcv_core::Error;
using mcv_core::Result;

namespace {

Result<void> read_vec3(const nlohmann::json& j, const std::string& key, Vec3& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return mcv_core::Ok();
    }
    auto value = mcv_math::vec3_from_json(*it, key);
    if (!value) {
        return Err(value.error());
    }
    out = *value;
    return mcv_core::Ok();
}

/// Read a required node name and resolve it in the scene
Result<NodeId> read_node(const nlohmann::json& j, const std::string& key, const mcv_scene::SceneGraph& scene) {
    std::string name;
    if (auto r = mcv_core::read_required(j, key, name); !r) {
        return Err<NodeId>(r.error());
    }
    NodeId node = scene.find_by_name(name);
    if (!node) {
        return Err<NodeId>(ConfigError::unknown_reference(key, name));
    }
    return mcv_core::Ok(node);
}

/// The animator for an entry: its "animator" label, else the node's name
Result<std::shared_ptr<mcv_teleport::IChestAnimator>> animator_for(const nlohmann::json& j,
                                                                   const std::string& fallback,
                                                                   const AnimatorFactory& animators) {
    std::string label = fallback;
    if (auto r = mcv_core::read_optional(j, "animator", label); !r) {
        return Err<std::shared_ptr<mcv_teleport::IChestAnimator>>(r.error());
    }
    return mcv_core::Ok(animators ? animators(label) : nullptr);
}

Result<const nlohmann::json*> find_array(const nlohmann::json& world, const std::string& key) {
    auto it = world.find(key);
    if (it == world.end() || it->is_null()) {
        return mcv_core::Ok<const nlohmann::json*>(nullptr);
    }
    if (!it->is_array()) {
        return Err<const nlohmann::json*>(ConfigError::wrong_type(key, "an array"));
    }
    return mcv_core::Ok<const nlohmann::json*>(&*it);
}

} // anonymous namespace

Result<DoorSettings> door_settings_from_json(const nlohmann::json& j) {
    if (auto r = mcv_core::expect_object(j, "door"); !r) {
        return Err<DoorSettings>(r.error());
    }

    DoorSettings settings;
    for (auto r : {mcv_core::read_optional(j, "actor_tag", settings.actor_tag),
                   mcv_core::read_optional(j, "rotation_angle", settings.rotation_angle),
                   mcv_core::read_optional(j, "open_speed", settings.open_speed),
                   mcv_core::read_optional(j, "detection_radius", settings.detection_radius),
                   mcv_core::read_optional(j, "door_width", settings.door_width),
                   mcv_core::read_optional(j, "pivot", settings.pivot_name),
                   mcv_core::read_optional(j, "debug_logs", settings.debug_logs)}) {
        if (!r) {
            return Err<DoorSettings>(r.error());
        }
    }

    if (settings.detection_radius < 0.0f) {
        return Err<DoorSettings>(ConfigError::wrong_type("detection_radius", "a non-negative distance"));
    }
    if (settings.door_width < 0.0f) {
        return Err<DoorSettings>(ConfigError::wrong_type("door_width", "a non-negative width"));
    }
    return mcv_core::Ok(std::move(settings));
}

Result<TriggerAnimationSettings> trigger_animation_settings_from_json(const nlohmann::json& j) {
    if (auto r = mcv_core::expect_object(j, "trigger_animation"); !r) {
        return Err<TriggerAnimationSettings>(r.error());
    }

    TriggerAnimationSettings settings;
    for (auto r : {mcv_core::read_optional(j, "enter_trigger", settings.enter_trigger),
                   mcv_core::read_optional(j, "exit_trigger", settings.exit_trigger),
                   mcv_core::read_optional(j, "debug_logs", settings.debug_logs)}) {
        if (!r) {
            return Err<TriggerAnimationSettings>(r.error());
        }
    }
    return mcv_core::Ok(std::move(settings));
}

Result<ChainSettings> chain_settings_from_json(const nlohmann::json& j, const mcv_scene::AssetLookup& assets) {
    if (auto r = mcv_core::expect_object(j, "chain"); !r) {
        return Err<ChainSettings>(r.error());
    }

    ChainSettings settings;
    std::string link_template;
    for (auto r : {mcv_core::read_required(j, "link_template", link_template),
                   mcv_core::read_optional(j, "spacing", settings.spacing),
                   mcv_core::read_optional(j, "thickness", settings.thickness),
                   mcv_core::read_optional(j, "auto_update", settings.auto_update),
                   mcv_core::read_optional(j, "customize_last_link", settings.customize_last_link),
                   read_vec3(j, "last_link_rotation", settings.last_link_rotation),
                   mcv_core::read_optional(j, "container", settings.container_name)}) {
        if (!r) {
            return Err<ChainSettings>(r.error());
        }
    }

    auto tmpl = assets.find_template(link_template, "link_template");
    if (!tmpl) {
        return Err<ChainSettings>(tmpl.error());
    }
    settings.link_template = *tmpl;

    if (!(settings.spacing > 0.0f)) {
        return Err<ChainSettings>(ConfigError::wrong_type("spacing", "a positive distance"));
    }
    if (settings.container_name.empty()) {
        return Err<ChainSettings>(ConfigError::malformed("chain", "container must not be empty"));
    }
    return mcv_core::Ok(std::move(settings));
}

Result<void> doors_from_json(const nlohmann::json& world, mcv_scene::SceneGraph& scene, DoorSet& doors,
                             const AnimatorFactory& animators) {
    auto door_entries = find_array(world, "doors");
    if (!door_entries) {
        return Err(door_entries.error());
    }
    if (*door_entries) {
        for (const auto& entry : **door_entries) {
            auto node = read_node(entry, "node", scene);
            if (!node) {
                return Err(node.error());
            }
            const std::string& name = scene.name(*node);

            auto settings = door_settings_from_json(entry);
            if (!settings) {
                return Err(settings.error().with_context("door", name));
            }
            auto animator = animator_for(entry, name, animators);
            if (!animator) {
                return Err(animator.error().with_context("door", name));
            }
            if (auto r = doors.add_door(*node, std::move(*settings), std::move(*animator)); !r) {
                return r;
            }
        }
    }

    auto trigger_entries = find_array(world, "trigger_animations");
    if (!trigger_entries) {
        return Err(trigger_entries.error());
    }
    if (*trigger_entries) {
        for (const auto& entry : **trigger_entries) {
            auto node = read_node(entry, "volume", scene);
            if (!node) {
                return Err(node.error());
            }
            const std::string& name = scene.name(*node);

            auto settings = trigger_animation_settings_from_json(entry);
            if (!settings) {
                return Err(settings.error().with_context("volume", name));
            }
            auto animator = animator_for(entry, name, animators);
            if (!animator) {
                return Err(animator.error().with_context("volume", name));
            }
            if (auto r = doors.add_trigger_animation(*node, std::move(*animator), std::move(*settings)); !r) {
                return r;
            }
        }
    }
    return mcv_core::Ok();
}

Result<std::vector<std::unique_ptr<ChainGenerator>>> chains_from_json(const nlohmann::json& world,
                                                                      mcv_scene::SceneGraph& scene,
                                                                      const mcv_scene::AssetLookup& assets) {
    using ChainsResult = Result<std::vector<std::unique_ptr<ChainGenerator>>>;

    std::vector<std::unique_ptr<ChainGenerator>> chains;
    auto entries = find_array(world, "chains");
    if (!entries) {
        return ChainsResult(entries.error());
    }
    if (!*entries) {
        return ChainsResult(std::move(chains));
    }

    for (const auto& entry : **entries) {
        std::string owner_name;
        if (auto r = mcv_core::read_required(entry, "owner", owner_name); !r) {
            return ChainsResult(r.error());
        }
        NodeId owner = scene.find_by_name(owner_name);
        if (!owner) {
            owner = scene.create_node(owner_name);
        }

        auto mount = read_node(entry, "mount", scene);
        if (!mount) {
            return ChainsResult(mount.error().with_context("owner", owner_name));
        }
        auto lantern = read_node(entry, "lantern", scene);
        if (!lantern) {
            return ChainsResult(lantern.error().with_context("owner", owner_name));
        }
        auto settings = chain_settings_from_json(entry, assets);
        if (!settings) {
            return ChainsResult(settings.error().with_context("owner", owner_name));
        }
        chains.push_back(std::make_unique<ChainGenerator>(scene, owner, *mount, *lantern, std::move(*settings)));
    }
    return ChainsResult(std::move(chains));
}

} // namespace mcv_props
