/// @file scene_graph.hpp
/// @brief Node hierarchy, templates and per-node components
///
/// The scene graph owns every node the runtime touches: chests, actors,
/// generator containers and generated instances. Nodes carry a name, an
/// optional tag, a local transform, renderers and at most one trigger volume.
///
/// Templates are detached subtrees. They never appear in queries and are only
/// reachable through instantiate(), which deep-copies the subtree (renderers
/// keep pointing at the same shared materials, property blocks are copied).
///
/// Usage:
/// ```cpp
/// SceneGraph scene;
/// NodeId proto = scene.create_node("Crop");
/// scene.add_renderer(proto, Renderer({crop_material}));
/// TemplateId crop = scene.make_template(proto);
///
/// NodeId grid = scene.create_node("Field");
/// NodeId instance = scene.instantiate(crop, grid);
/// ```

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "volumes.hpp"

#include <mcvillage/math/transform.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcv_scene {

using mcv_math::Transform;

// =============================================================================
// SceneGraph
// =============================================================================

class SceneGraph {
public:
    SceneGraph();
    ~SceneGraph();

    SceneGraph(const SceneGraph&) = delete;
    SceneGraph& operator=(const SceneGraph&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Create a node, optionally parented
    NodeId create_node(const std::string& name, NodeId parent = {});

    /// @brief Destroy a node and its whole subtree
    void destroy(NodeId node);

    /// @brief Destroy every child of a node (the node itself survives)
    /// @return Number of direct children destroyed
    std::size_t destroy_children(NodeId node);

    /// @brief Check a node exists
    [[nodiscard]] bool is_valid(NodeId node) const;

    /// @brief Number of live nodes (templates included)
    [[nodiscard]] std::size_t node_count() const noexcept { return m_nodes.size(); }

    // =========================================================================
    // Templates
    // =========================================================================

    /// @brief Turn a root node into an instantiable template
    /// The node is detached from its parent and hidden from queries.
    TemplateId make_template(NodeId root);

    /// @brief Check a template handle still refers to a live template
    [[nodiscard]] bool is_valid_template(TemplateId id) const;

    /// @brief Root node backing a template
    [[nodiscard]] NodeId template_root(TemplateId id) const;

    /// @brief Deep-copy a template under `parent`
    /// @return Invalid id if the template is unknown
    NodeId instantiate(TemplateId id, NodeId parent = {});

    /// @brief Check whether a node belongs to a template subtree
    [[nodiscard]] bool is_template_node(NodeId node) const;

    // =========================================================================
    // Naming and Tags
    // =========================================================================

    [[nodiscard]] const std::string& name(NodeId node) const;
    void set_name(NodeId node, const std::string& name);

    [[nodiscard]] const std::string& tag(NodeId node) const;
    void set_tag(NodeId node, const std::string& tag);

    /// @brief Live, non-template nodes carrying `tag`, in creation order
    [[nodiscard]] std::vector<NodeId> find_with_tag(const std::string& tag) const;

    /// @brief First non-template node with exactly this name
    [[nodiscard]] NodeId find_by_name(const std::string& name) const;

    // =========================================================================
    // Hierarchy
    // =========================================================================

    [[nodiscard]] NodeId parent(NodeId node) const;
    [[nodiscard]] const std::vector<NodeId>& children(NodeId node) const;

    /// @brief Reparent a node, keeping its local transform
    void set_parent(NodeId node, NodeId parent);

    /// @brief Direct child with exactly this name
    [[nodiscard]] NodeId find_child(NodeId node, const std::string& name) const;

    /// @brief Depth-first descendant whose name contains `fragment`
    [[nodiscard]] NodeId find_descendant_containing(NodeId node, const std::string& fragment) const;

    /// @brief True if `ancestor` is `node` itself or one of its parents
    [[nodiscard]] bool is_ancestor_or_self(NodeId ancestor, NodeId node) const;

    /// @brief Visit `root` and all descendants, pre-order
    void visit_subtree(NodeId root, const std::function<void(NodeId)>& visitor) const;

    // =========================================================================
    // Transforms
    // =========================================================================

    [[nodiscard]] const Transform& local_transform(NodeId node) const;
    void set_local_transform(NodeId node, const Transform& transform);
    void set_local_position(NodeId node, const Vec3& position);
    void set_local_rotation(NodeId node, const Quat& rotation);
    void set_local_scale(NodeId node, const Vec3& scale);

    /// @brief Parent-composed transform
    [[nodiscard]] Transform world_transform(NodeId node) const;
    [[nodiscard]] Vec3 world_position(NodeId node) const;
    [[nodiscard]] Quat world_rotation(NodeId node) const;

    /// @brief Place a node at a world position/orientation, keeping its scale
    void set_world_pose(NodeId node, const Vec3& position, const Quat& rotation);

    // =========================================================================
    // Renderers
    // =========================================================================

    /// @brief Attach a renderer. Ignored (with a warning) for an invalid node.
    void add_renderer(NodeId node, Renderer renderer);

    /// @brief Renderers attached directly to a node
    ///
    /// An invalid node yields an empty scratch list; edits to it are dropped.
    [[nodiscard]] std::vector<Renderer>& renderers(NodeId node);
    [[nodiscard]] const std::vector<Renderer>& renderers(NodeId node) const;

    /// @brief All renderers in a subtree, pre-order
    [[nodiscard]] std::vector<Renderer*> collect_renderers(NodeId root);
    [[nodiscard]] std::vector<const Renderer*> collect_renderers(NodeId root) const;

    // =========================================================================
    // Volumes
    // =========================================================================

    /// @brief Attach (or replace) the node's trigger volume
    void set_volume(NodeId node, std::unique_ptr<ITriggerVolume> volume);

    /// @brief The node's trigger volume, or nullptr
    [[nodiscard]] const ITriggerVolume* volume(NodeId node) const;

    /// @brief Test a world-space point against the node's volume
    [[nodiscard]] bool volume_contains(NodeId node, const Vec3& world_point) const;

private:
    struct Node {
        std::string name;
        std::string tag;
        NodeId parent;
        std::vector<NodeId> children;
        Transform local;
        std::vector<Renderer> renderers;
        std::unique_ptr<ITriggerVolume> volume;
        bool is_template{false};
    };

    Node* find(NodeId node);
    const Node* find(NodeId node) const;
    Node& get(NodeId node);
    const Node& get(NodeId node) const;

    NodeId allocate(const std::string& name);
    void detach(NodeId node);
    NodeId clone_subtree(NodeId source, NodeId parent);

    std::map<NodeId, Node> m_nodes;
    std::map<std::uint64_t, NodeId> m_templates;
    std::uint64_t m_next_node{1};
    std::uint64_t m_next_template{1};
    std::vector<Renderer> m_detached_renderers;
};

} // namespace mcv_scene
