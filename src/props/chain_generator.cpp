/// @file chain_generator.cpp
/// @brief ChainGenerator implementation for mcv_props module

#include <mcvillage/props/chain_generator.hpp>

#include <mcvillage/core/log.hpp>
#include <mcvillage/scene/scene_graph.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace mcv_props {

using mcv_core::Err;
using mcv_core::Error;
using mcv_core::ErrorCode;
using mcv_core::Result;
using mcv_math::Quat;

namespace {

bool has_nan(const Vec3& v) {
    return std::isnan(v.x) || std::isnan(v.y) || std::isnan(v.z);
}

int link_count_for(float distance, float spacing) {
    return std::max(2, static_cast<int>(std::floor(distance / spacing)));
}

} // anonymous namespace

ChainGenerator::ChainGenerator(mcv_scene::SceneGraph& scene, NodeId owner, NodeId mount, NodeId lantern,
                               ChainSettings settings)
    : m_scene(scene)
    , m_owner(owner)
    , m_mount(mount)
    , m_lantern(lantern)
    , m_settings(std::move(settings)) {
}

Result<void> ChainGenerator::validate() const {
    if (!m_scene.is_valid(m_owner)) {
        return Err(Error(ErrorCode::NotFound, "Chain owner node is not valid"));
    }
    const std::string& owner = m_scene.name(m_owner);

    if (!m_scene.is_valid(m_mount) || !m_scene.is_valid(m_lantern)) {
        Error error(ErrorCode::NotFound, "Lantern or mount node is not assigned");
        error.with_context("owner", owner);
        return Err(std::move(error));
    }
    if (!m_scene.is_valid_template(m_settings.link_template)) {
        Error error(ErrorCode::MissingTemplate, "Chain link template is not assigned");
        error.with_context("owner", owner);
        return Err(std::move(error));
    }
    if (!(m_settings.spacing > 0.0f)) {
        Error error(ErrorCode::InvalidArgument, "Chain link spacing must be positive");
        error.with_context("owner", owner).with_context("spacing", std::to_string(m_settings.spacing));
        return Err(std::move(error));
    }
    if (has_nan(m_scene.world_position(m_mount)) || has_nan(m_scene.world_position(m_lantern))) {
        Error error(ErrorCode::InvalidArgument, "Invalid position detected (NaN) on lantern or mount");
        error.with_context("owner", owner);
        return Err(std::move(error));
    }
    return mcv_core::Ok();
}

NodeId ChainGenerator::ensure_container() {
    if (m_scene.is_valid(m_container)) {
        return m_container;
    }
    m_container = m_scene.find_child(m_owner, m_settings.container_name);
    if (!m_container) {
        m_container = m_scene.create_node(m_settings.container_name, m_owner);
    }
    return m_container;
}

int ChainGenerator::expected_link_count() const {
    if (!m_scene.is_valid(m_mount) || !m_scene.is_valid(m_lantern) || !(m_settings.spacing > 0.0f)) {
        return 0;
    }
    const float distance = glm::length(m_scene.world_position(m_lantern) - m_scene.world_position(m_mount));
    return link_count_for(distance, m_settings.spacing);
}

std::size_t ChainGenerator::clear() {
    if (!m_scene.is_valid(m_container)) {
        return 0;
    }
    return m_scene.destroy_children(m_container);
}

Result<ChainReport> ChainGenerator::generate() {
    if (auto r = validate(); !r) {
        mcv_core::props_logger()->error("Chain generation failed: {}", mcv_core::build_error_chain(r.error()));
        return Err<ChainReport>(r.error());
    }

    const Vec3 start = m_scene.world_position(m_mount);
    const Vec3 end = m_scene.world_position(m_lantern);
    mcv_core::props_logger()->debug("Lantern position: {}", glm::to_string(end));
    mcv_core::props_logger()->debug("Mount position: {}", glm::to_string(start));

    ChainReport report;
    report.container = ensure_container();
    clear();

    report.distance = glm::length(end - start);
    const int count = link_count_for(report.distance, m_settings.spacing);
    m_previous_link_count = count;

    const Quat base_turn = mcv_math::quat_from_euler_degrees(Vec3(90.0f, 0.0f, 0.0f));
    const Quat even_turn = mcv_math::quat_from_euler_degrees(Vec3(0.0f, 90.0f, 0.0f));
    const auto at = [&](int i) { return glm::mix(start, end, static_cast<float>(i) / static_cast<float>(count - 1)); };

    report.links.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        const Vec3 position = at(i);

        NodeId link = m_scene.instantiate(m_settings.link_template, report.container);
        m_scene.set_name(link, "ChainLink_" + std::to_string(i));

        Quat rotation;
        if (i < count - 1) {
            rotation = mcv_math::look_rotation(at(i + 1) - position);
        } else {
            rotation = mcv_math::look_rotation(end - position);
            if (m_settings.customize_last_link) {
                rotation = mcv_math::quat_from_euler_degrees(mcv_math::euler_degrees(rotation) +
                                                             m_settings.last_link_rotation);
            }
        }

        rotation = rotation * base_turn;
        if (i % 2 == 0) {
            rotation = rotation * even_turn;
        }

        m_scene.set_world_pose(link, position, glm::normalize(rotation));
        m_scene.set_local_scale(link, m_scene.local_transform(link).scale_ * m_settings.thickness);
        report.links.push_back(link);
    }

    mcv_core::props_logger()->info("Generated chain with {} links between lantern and mount.", count);
    return mcv_core::Ok(std::move(report));
}

Result<bool> ChainGenerator::update() {
    if (!m_settings.auto_update) {
        return mcv_core::Ok(false);
    }
    if (!m_scene.is_valid(m_mount) || !m_scene.is_valid(m_lantern)) {
        return mcv_core::Ok(false);
    }
    if (expected_link_count() == m_previous_link_count) {
        return mcv_core::Ok(false);
    }
    auto generated = generate();
    if (!generated) {
        return Err<bool>(generated.error());
    }
    return mcv_core::Ok(true);
}

} // namespace mcv_props
