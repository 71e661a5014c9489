/// @file chain_generator.hpp
/// @brief Chain of link instances hung between a mount and a lantern

#pragma once

#include <mcvillage/core/error.hpp>
#include <mcvillage/math/types.hpp>
#include <mcvillage/scene/fwd.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace mcv_props {

using mcv_math::Vec3;
using mcv_scene::NodeId;
using mcv_scene::TemplateId;

struct ChainSettings {
    TemplateId link_template;
    float spacing{0.1f};                   ///< Distance per link, > 0
    float thickness{1.0f};                 ///< Multiplies the template's scale
    bool auto_update{false};               ///< update() regenerates when the link count changes
    bool customize_last_link{true};
    Vec3 last_link_rotation{0.0f};         ///< Euler degrees added to the last link
    std::string container_name{"Chain_Parent"};
};

struct ChainReport {
    NodeId container;
    std::vector<NodeId> links;
    float distance{0.0f};

    [[nodiscard]] std::size_t link_count() const noexcept { return links.size(); }
};

// =============================================================================
// ChainGenerator
// =============================================================================

/// @brief Lays links from the mount's world position to the lantern's
///
/// Link i of n sits at lerp(mount, lantern, i / (n - 1)) with
/// n = max(2, floor(distance / spacing)). Each link faces the next one (+Z
/// forward, +Y up); the last faces the lantern, which it sits on, so it keeps
/// identity before the optional last-link Euler offset. Every link is then
/// turned 90 degrees about its own X and even links a further 90 about Y.
/// Links are named `ChainLink_<i>` and live under a container child of the
/// owner, which is reused across generations.
class ChainGenerator {
public:
    ChainGenerator(mcv_scene::SceneGraph& scene, NodeId owner, NodeId mount, NodeId lantern,
                   ChainSettings settings = {});

    /// @brief Replace the chain
    ///
    /// Nothing is touched when a node or the template is missing, the spacing
    /// is not positive, or an endpoint is NaN.
    mcv_core::Result<ChainReport> generate();

    /// @brief Destroy the links; returns how many were removed
    std::size_t clear();

    /// @brief Regenerate when auto_update is on and the link count would change
    ///
    /// Returns true when a new chain was generated.
    mcv_core::Result<bool> update();

    /// @brief Link count for the current endpoint positions
    [[nodiscard]] int expected_link_count() const;

    [[nodiscard]] int previous_link_count() const noexcept { return m_previous_link_count; }
    [[nodiscard]] NodeId container() const noexcept { return m_container; }
    [[nodiscard]] const ChainSettings& settings() const noexcept { return m_settings; }

private:
    mcv_core::Result<void> validate() const;
    NodeId ensure_container();

    mcv_scene::SceneGraph& m_scene;
    NodeId m_owner;
    NodeId m_mount;
    NodeId m_lantern;
    ChainSettings m_settings;

    NodeId m_container;
    int m_previous_link_count{0};
};

} // namespace mcv_props
