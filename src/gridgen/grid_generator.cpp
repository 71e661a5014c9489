/// @file grid_generator.cpp
/// @brief GridGenerator implementation for mcv_gridgen module

#include <mcvillage/gridgen/grid_generator.hpp>

#include <mcvillage/core/log.hpp>
#include <mcvillage/core/random.hpp>
#include <mcvillage/scene/scene_graph.hpp>

#include <algorithm>

namespace mcv_gridgen {

namespace {

const std::string k_container_name = "GridContainer";
const std::string k_unnamed = "<unnamed>";

} // anonymous namespace

GridGenerator::GridGenerator(mcv_scene::SceneGraph& scene, NodeId owner,
                             std::shared_ptr<mcv_core::IRandomSource> rng)
    : m_scene(scene)
    , m_owner(owner)
    , m_rng(rng ? std::move(rng) : std::make_shared<mcv_core::SeededRandom>()) {
}

GridGenerator::~GridGenerator() = default;

void GridGenerator::set_random(std::shared_ptr<mcv_core::IRandomSource> rng) {
    if (rng) {
        m_rng = std::move(rng);
    }
}

const std::string& GridGenerator::name() const {
    return m_scene.is_valid(m_owner) ? m_scene.name(m_owner) : k_unnamed;
}

NodeId GridGenerator::container() const {
    return m_scene.is_valid(m_container) ? m_container : NodeId{};
}

NodeId GridGenerator::ensure_container() {
    if (m_scene.is_valid(m_container)) {
        return m_container;
    }

    m_container = m_scene.find_child(m_owner, k_container_name);
    if (!m_container) {
        m_container = m_scene.create_node(k_container_name, m_owner);
    }
    return m_container;
}

// =============================================================================
// Generation
// =============================================================================

Result<void> GridGenerator::validate_spec() const {
    if (!m_scene.is_valid(m_owner)) {
        return mcv_core::Err(mcv_core::GridError::invalid_spec(name(), "owner node does not exist"));
    }
    if (spec.size_x < 0 || spec.size_y < 0 || spec.size_z < 0) {
        return mcv_core::Err(mcv_core::GridError::invalid_spec(name(), "grid sizes must not be negative"));
    }
    if (!(spec.spacing > 0.0f)) {
        return mcv_core::Err(mcv_core::GridError::invalid_spec(name(), "spacing must be positive"));
    }
    return mcv_core::Ok();
}

Result<void> GridGenerator::validate() const {
    auto spec_result = validate_spec();
    if (!spec_result) {
        return spec_result;
    }
    if (!m_scene.is_valid_template(default_template)) {
        return mcv_core::Err(mcv_core::GridError::missing_template(name()));
    }
    return mcv_core::Ok();
}

Result<GenerationReport> GridGenerator::generate() {
    auto valid = validate();
    if (!valid) {
        mcv_core::gridgen_logger()->error("{}", valid.error().message());
        return mcv_core::Err<GenerationReport>(valid.error());
    }

    MCV_LOG_SCOPE("generate '" + name() + "'", "mcv_gridgen");
    begin_generation();

    GenerationReport report;
    report.cell_count = spec.cell_count();

    if (!spec.use_random_seed) {
        m_rng->reseed(static_cast<std::uint32_t>(spec.seed));
        report.seed = spec.seed;
    }

    if (spec.clear_on_generate) {
        clear();
    }

    NodeId parent = ensure_container();
    report.placements.reserve(report.cell_count);

    for (int x = 0; x < spec.size_x; ++x) {
        for (int y = 0; y < spec.size_y; ++y) {
            for (int z = 0; z < spec.size_z; ++z) {
                IVec3 cell(x, y, z);
                auto placement = place_cell(cell, cell_position(x, y, z), parent);
                if (placement) {
                    report.placements.push_back(std::move(*placement));
                } else {
                    ++report.skipped_cells;
                }
            }
        }
    }

    if (!spec.use_random_seed) {
        m_rng->reseed_from_entropy();
    }

    mcv_core::gridgen_logger()->info("'{}' generated {} instance(s) over {} cell(s), {} skipped",
                                     name(), report.placements.size(), report.cell_count, report.skipped_cells);
    return mcv_core::Ok(std::move(report));
}

std::size_t GridGenerator::clear() {
    if (!m_scene.is_valid(m_container)) {
        return 0;
    }
    std::size_t removed = m_scene.destroy_children(m_container);
    if (removed > 0) {
        mcv_core::gridgen_logger()->debug("'{}' cleared {} instance(s)", name(), removed);
    }
    return removed;
}

std::optional<Placement> GridGenerator::place_cell(const IVec3& cell, const Vec3& position, NodeId container) {
    NodeId node = spawn(default_template, "GridObject_" + cell_suffix(cell), position, container);
    if (!node) {
        return std::nullopt;
    }
    return make_placement(node, "GridObject", cell);
}

NodeId GridGenerator::spawn(TemplateId id, const std::string& instance_name, const Vec3& position,
                            NodeId container) {
    NodeId node = m_scene.instantiate(id, container);
    if (!node) {
        mcv_core::gridgen_logger()->warn("'{}' failed to instantiate template for {}", name(), instance_name);
        return {};
    }
    m_scene.set_name(node, instance_name);
    m_scene.set_local_position(node, position);
    return node;
}

Placement GridGenerator::make_placement(NodeId node, const std::string& type_name, const IVec3& cell) const {
    const auto& local = m_scene.local_transform(node);

    Placement placement;
    placement.node = node;
    placement.type_name = type_name;
    placement.cell = cell;
    placement.position = local.position;
    placement.scale = local.scale_;
    placement.rotation = local.rotation;
    return placement;
}

std::string GridGenerator::cell_suffix(const IVec3& cell) {
    return std::to_string(cell.x) + "_" + std::to_string(cell.y) + "_" + std::to_string(cell.z);
}

// =============================================================================
// Layout
// =============================================================================

Vec3 GridGenerator::grid_offset() const {
    if (!spec.align_to_center) {
        return Vec3(0.0f);
    }
    return Vec3(-(static_cast<float>(spec.size_x - 1) * spec.spacing) / 2.0f,
                -(static_cast<float>(spec.size_y - 1) * spec.spacing) / 2.0f,
                -(static_cast<float>(spec.size_z - 1) * spec.spacing) / 2.0f);
}

Vec3 GridGenerator::cell_position(int x, int y, int z) const {
    Vec3 offset = grid_offset();
    return Vec3(static_cast<float>(x) * spec.spacing + offset.x,
                static_cast<float>(y) * spec.spacing + offset.y,
                static_cast<float>(z) * spec.spacing + offset.z);
}

mcv_scene::AABB GridGenerator::bounds() const {
    Vec3 extent(static_cast<float>(std::max(spec.size_x - 1, 0)) * spec.spacing,
                static_cast<float>(std::max(spec.size_y - 1, 0)) * spec.spacing,
                static_cast<float>(std::max(spec.size_z - 1, 0)) * spec.spacing);

    Vec3 center = spec.align_to_center ? Vec3(0.0f) : extent * 0.5f;
    return mcv_scene::AABB{center - extent * 0.5f, center + extent * 0.5f};
}

} // namespace mcv_gridgen
