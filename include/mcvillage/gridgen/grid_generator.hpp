/// @file grid_generator.hpp
/// @brief Lattice instancing of scene templates

#pragma once

#include "types.hpp"

#include <mcvillage/core/error.hpp>
#include <mcvillage/core/fwd.hpp>
#include <mcvillage/scene/types.hpp>

#include <memory>
#include <optional>
#include <string>

namespace mcv_gridgen {

using mcv_core::Result;

// =============================================================================
// GridGenerator
// =============================================================================

/// @brief Instantiates one template per cell of a GridSpec lattice
///
/// Instances live under a "GridContainer" child of the owner node, created on
/// first use. Cells are visited X (outer), Y, Z (inner). Subclasses choose what
/// to place per cell by overriding place_cell().
class GridGenerator {
public:
    /// @param rng Random source shared with the host; a SeededRandom is created when null
    GridGenerator(mcv_scene::SceneGraph& scene, NodeId owner,
                  std::shared_ptr<mcv_core::IRandomSource> rng = nullptr);
    virtual ~GridGenerator();

    GridGenerator(const GridGenerator&) = delete;
    GridGenerator& operator=(const GridGenerator&) = delete;

    GridSpec spec;
    TemplateId default_template;

    /// @brief Populate the grid
    ///
    /// Applies the fixed seed when `spec.use_random_seed` is false and reseeds
    /// from entropy afterwards. Existing instances are cleared first when
    /// `spec.clear_on_generate` is set.
    Result<GenerationReport> generate();

    /// @brief Destroy every instance under the container
    /// @return Number of instances destroyed
    std::size_t clear();

    /// @brief Per-axis offset applied to every cell (zero unless centered)
    [[nodiscard]] Vec3 grid_offset() const;

    /// @brief Local-space position of a cell
    [[nodiscard]] Vec3 cell_position(int x, int y, int z) const;

    /// @brief Box spanning the cell centers, in the owner's local space
    [[nodiscard]] mcv_scene::AABB bounds() const;

    /// @brief Generator kind as used in config files
    [[nodiscard]] virtual const char* kind() const { return "base"; }

    [[nodiscard]] NodeId owner() const noexcept { return m_owner; }

    /// @brief Container node, invalid until the first generate()
    [[nodiscard]] NodeId container() const;

    /// @brief Owner node name, used in diagnostics
    [[nodiscard]] const std::string& name() const;

    [[nodiscard]] mcv_core::IRandomSource& random() { return *m_rng; }
    void set_random(std::shared_ptr<mcv_core::IRandomSource> rng);

protected:
    /// @brief Fatal configuration checks run before anything is touched
    [[nodiscard]] virtual Result<void> validate() const;

    /// @brief Called once per generate() after validation
    virtual void begin_generation() {}

    /// @brief Place the instance for one cell
    /// @return nullopt when the cell is skipped
    virtual std::optional<Placement> place_cell(const IVec3& cell, const Vec3& position, NodeId container);

    /// @brief Instantiate a template under the container and position it
    NodeId spawn(TemplateId id, const std::string& instance_name, const Vec3& position, NodeId container);

    /// @brief Build a Placement from the node's current local transform
    [[nodiscard]] Placement make_placement(NodeId node, const std::string& type_name, const IVec3& cell) const;

    /// @brief Validate lattice dimensions
    [[nodiscard]] Result<void> validate_spec() const;

    [[nodiscard]] static std::string cell_suffix(const IVec3& cell);

    mcv_scene::SceneGraph& m_scene;
    NodeId m_owner;
    std::shared_ptr<mcv_core::IRandomSource> m_rng;

private:
    NodeId ensure_container();

    NodeId m_container;
};

} // namespace mcv_gridgen
