/// @file scene_graph.cpp
/// @brief SceneGraph implementation for mcv_scene module

#include <mcvillage/scene/scene_graph.hpp>

#include <mcvillage/core/log.hpp>

#include <algorithm>
#include <stdexcept>

namespace mcv_scene {

namespace {

const std::string k_empty_string;
const std::vector<NodeId> k_no_children;
const std::vector<Renderer> k_no_renderers;
const Transform k_identity;

} // anonymous namespace

SceneGraph::SceneGraph() = default;
SceneGraph::~SceneGraph() = default;

// =============================================================================
// Node Access
// =============================================================================

SceneGraph::Node* SceneGraph::find(NodeId node) {
    auto it = m_nodes.find(node);
    return it != m_nodes.end() ? &it->second : nullptr;
}

const SceneGraph::Node* SceneGraph::find(NodeId node) const {
    auto it = m_nodes.find(node);
    return it != m_nodes.end() ? &it->second : nullptr;
}

SceneGraph::Node& SceneGraph::get(NodeId node) {
    Node* n = find(node);
    if (!n) {
        throw std::out_of_range("SceneGraph: invalid node " + std::to_string(node.value));
    }
    return *n;
}

const SceneGraph::Node& SceneGraph::get(NodeId node) const {
    const Node* n = find(node);
    if (!n) {
        throw std::out_of_range("SceneGraph: invalid node " + std::to_string(node.value));
    }
    return *n;
}

// =============================================================================
// Lifecycle
// =============================================================================

NodeId SceneGraph::allocate(const std::string& name) {
    NodeId id{m_next_node++};
    Node node;
    node.name = name;
    m_nodes.emplace(id, std::move(node));
    return id;
}

NodeId SceneGraph::create_node(const std::string& name, NodeId parent) {
    NodeId id = allocate(name);
    if (parent) {
        set_parent(id, parent);
    }
    return id;
}

void SceneGraph::detach(NodeId node) {
    Node* n = find(node);
    if (!n || !n->parent) {
        return;
    }
    if (Node* p = find(n->parent)) {
        auto& siblings = p->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), node), siblings.end());
    }
    n->parent = NodeId{};
}

void SceneGraph::destroy(NodeId node) {
    if (!is_valid(node)) {
        return;
    }

    detach(node);

    std::vector<NodeId> doomed;
    visit_subtree(node, [&doomed](NodeId id) { doomed.push_back(id); });

    for (NodeId id : doomed) {
        m_nodes.erase(id);
    }

    for (auto it = m_templates.begin(); it != m_templates.end();) {
        if (!is_valid(it->second)) {
            it = m_templates.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t SceneGraph::destroy_children(NodeId node) {
    const Node* n = find(node);
    if (!n) {
        return 0;
    }
    // Copy: destroy() edits the child list
    std::vector<NodeId> kids = n->children;
    for (NodeId child : kids) {
        destroy(child);
    }
    return kids.size();
}

bool SceneGraph::is_valid(NodeId node) const {
    return node && m_nodes.count(node) > 0;
}

// =============================================================================
// Templates
// =============================================================================

TemplateId SceneGraph::make_template(NodeId root) {
    if (!is_valid(root)) {
        return TemplateId{};
    }

    detach(root);
    visit_subtree(root, [this](NodeId id) { get(id).is_template = true; });

    TemplateId id{m_next_template++};
    m_templates[id.value] = root;
    return id;
}

bool SceneGraph::is_valid_template(TemplateId id) const {
    auto it = m_templates.find(id.value);
    return it != m_templates.end() && is_valid(it->second);
}

NodeId SceneGraph::template_root(TemplateId id) const {
    auto it = m_templates.find(id.value);
    return it != m_templates.end() ? it->second : NodeId{};
}

NodeId SceneGraph::clone_subtree(NodeId source, NodeId parent) {
    const Node& src = get(source);

    NodeId copy = allocate(src.name);
    {
        Node& dst = get(copy);
        dst.tag = src.tag;
        dst.local = src.local;
        dst.renderers = src.renderers;
        if (src.volume) {
            dst.volume = src.volume->clone();
        }
    }

    if (parent) {
        set_parent(copy, parent);
    }

    std::vector<NodeId> kids = src.children;
    for (NodeId child : kids) {
        clone_subtree(child, copy);
    }
    return copy;
}

NodeId SceneGraph::instantiate(TemplateId id, NodeId parent) {
    NodeId root = template_root(id);
    if (!is_valid(root)) {
        mcv_core::scene_logger()->warn("instantiate: unknown template {}", id.value);
        return NodeId{};
    }
    return clone_subtree(root, parent);
}

bool SceneGraph::is_template_node(NodeId node) const {
    const Node* n = find(node);
    return n && n->is_template;
}

// =============================================================================
// Naming and Tags
// =============================================================================

const std::string& SceneGraph::name(NodeId node) const {
    const Node* n = find(node);
    return n ? n->name : k_empty_string;
}

void SceneGraph::set_name(NodeId node, const std::string& name) {
    if (Node* n = find(node)) {
        n->name = name;
    }
}

const std::string& SceneGraph::tag(NodeId node) const {
    const Node* n = find(node);
    return n ? n->tag : k_empty_string;
}

void SceneGraph::set_tag(NodeId node, const std::string& tag) {
    if (Node* n = find(node)) {
        n->tag = tag;
    }
}

std::vector<NodeId> SceneGraph::find_with_tag(const std::string& tag) const {
    std::vector<NodeId> result;
    for (const auto& [id, node] : m_nodes) {
        if (!node.is_template && node.tag == tag) {
            result.push_back(id);
        }
    }
    return result;
}

NodeId SceneGraph::find_by_name(const std::string& name) const {
    for (const auto& [id, node] : m_nodes) {
        if (!node.is_template && node.name == name) {
            return id;
        }
    }
    return NodeId{};
}

// =============================================================================
// Hierarchy
// =============================================================================

NodeId SceneGraph::parent(NodeId node) const {
    const Node* n = find(node);
    return n ? n->parent : NodeId{};
}

const std::vector<NodeId>& SceneGraph::children(NodeId node) const {
    const Node* n = find(node);
    return n ? n->children : k_no_children;
}

void SceneGraph::set_parent(NodeId node, NodeId parent) {
    if (!is_valid(node) || node == parent) {
        return;
    }
    if (parent && (!is_valid(parent) || is_ancestor_or_self(node, parent))) {
        mcv_core::scene_logger()->warn("set_parent: refusing to parent '{}' under '{}'",
                                       name(node), name(parent));
        return;
    }

    detach(node);
    if (parent) {
        get(node).parent = parent;
        get(parent).children.push_back(node);
    }
}

NodeId SceneGraph::find_child(NodeId node, const std::string& name) const {
    for (NodeId child : children(node)) {
        if (this->name(child) == name) {
            return child;
        }
    }
    return NodeId{};
}

NodeId SceneGraph::find_descendant_containing(NodeId node, const std::string& fragment) const {
    for (NodeId child : children(node)) {
        if (name(child).find(fragment) != std::string::npos) {
            return child;
        }
        if (NodeId found = find_descendant_containing(child, fragment)) {
            return found;
        }
    }
    return NodeId{};
}

bool SceneGraph::is_ancestor_or_self(NodeId ancestor, NodeId node) const {
    NodeId current = node;
    while (current) {
        if (current == ancestor) {
            return true;
        }
        current = parent(current);
    }
    return false;
}

void SceneGraph::visit_subtree(NodeId root, const std::function<void(NodeId)>& visitor) const {
    if (!is_valid(root)) {
        return;
    }
    visitor(root);
    for (NodeId child : children(root)) {
        visit_subtree(child, visitor);
    }
}

// =============================================================================
// Transforms
// =============================================================================

const Transform& SceneGraph::local_transform(NodeId node) const {
    const Node* n = find(node);
    return n ? n->local : k_identity;
}

void SceneGraph::set_local_transform(NodeId node, const Transform& transform) {
    if (Node* n = find(node)) {
        n->local = transform;
    }
}

void SceneGraph::set_local_position(NodeId node, const Vec3& position) {
    if (Node* n = find(node)) {
        n->local.position = position;
    }
}

void SceneGraph::set_local_rotation(NodeId node, const Quat& rotation) {
    if (Node* n = find(node)) {
        n->local.rotation = rotation;
    }
}

void SceneGraph::set_local_scale(NodeId node, const Vec3& scale) {
    if (Node* n = find(node)) {
        n->local.scale_ = scale;
    }
}

Transform SceneGraph::world_transform(NodeId node) const {
    const Node* n = find(node);
    if (!n) {
        return Transform{};
    }
    if (!n->parent) {
        return n->local;
    }
    return world_transform(n->parent).combine(n->local);
}

Vec3 SceneGraph::world_position(NodeId node) const {
    return world_transform(node).position;
}

Quat SceneGraph::world_rotation(NodeId node) const {
    return world_transform(node).rotation;
}

void SceneGraph::set_world_pose(NodeId node, const Vec3& position, const Quat& rotation) {
    Node* n = find(node);
    if (!n) {
        return;
    }

    if (!n->parent) {
        n->local.position = position;
        n->local.rotation = rotation;
        return;
    }

    Transform parent_world = world_transform(n->parent);
    Quat inv_rot = glm::inverse(parent_world.rotation);
    n->local.position = mcv_math::rotate(inv_rot, position - parent_world.position) / parent_world.scale_;
    n->local.rotation = inv_rot * rotation;
}

// =============================================================================
// Renderers
// =============================================================================

void SceneGraph::add_renderer(NodeId node, Renderer renderer) {
    Node* n = find(node);
    if (!n) {
        mcv_core::scene_logger()->warn("add_renderer: invalid node {}", node.value);
        return;
    }
    renderer.sync_blocks();
    n->renderers.push_back(std::move(renderer));
}

std::vector<Renderer>& SceneGraph::renderers(NodeId node) {
    Node* n = find(node);
    if (!n) {
        mcv_core::scene_logger()->warn("renderers: invalid node {}", node.value);
        m_detached_renderers.clear();
        return m_detached_renderers;
    }
    return n->renderers;
}

const std::vector<Renderer>& SceneGraph::renderers(NodeId node) const {
    const Node* n = find(node);
    return n ? n->renderers : k_no_renderers;
}

std::vector<Renderer*> SceneGraph::collect_renderers(NodeId root) {
    std::vector<Renderer*> result;
    visit_subtree(root, [this, &result](NodeId id) {
        for (auto& renderer : get(id).renderers) {
            result.push_back(&renderer);
        }
    });
    return result;
}

std::vector<const Renderer*> SceneGraph::collect_renderers(NodeId root) const {
    std::vector<const Renderer*> result;
    visit_subtree(root, [this, &result](NodeId id) {
        for (const auto& renderer : get(id).renderers) {
            result.push_back(&renderer);
        }
    });
    return result;
}

// =============================================================================
// Volumes
// =============================================================================

void SceneGraph::set_volume(NodeId node, std::unique_ptr<ITriggerVolume> volume) {
    if (Node* n = find(node)) {
        n->volume = std::move(volume);
    }
}

const ITriggerVolume* SceneGraph::volume(NodeId node) const {
    const Node* n = find(node);
    return n ? n->volume.get() : nullptr;
}

bool SceneGraph::volume_contains(NodeId node, const Vec3& world_point) const {
    const ITriggerVolume* vol = volume(node);
    if (!vol) {
        return false;
    }
    return vol->contains(world_point - world_position(node));
}

} // namespace mcv_scene
