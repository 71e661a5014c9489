/// @file fwd.hpp
/// @brief Forward declarations for mcv_scene module

#pragma once

#include <cstdint>
#include <functional>

namespace mcv_scene {

// =============================================================================
// Handle Types
// =============================================================================

/// @brief Scene node identifier (0 is invalid)
struct NodeId {
    std::uint64_t value{0};

    bool operator==(const NodeId&) const = default;
    bool operator!=(const NodeId&) const = default;
    bool operator<(const NodeId& other) const { return value < other.value; }
    explicit operator bool() const { return value != 0; }
};

/// @brief Instantiable template identifier (0 is invalid)
struct TemplateId {
    std::uint64_t value{0};

    bool operator==(const TemplateId&) const = default;
    bool operator!=(const TemplateId&) const = default;
    explicit operator bool() const { return value != 0; }
};

/// @brief Opaque texture handle owned by the host (0 is "no texture")
struct TextureId {
    std::uint64_t value{0};

    bool operator==(const TextureId&) const = default;
    bool operator!=(const TextureId&) const = default;
    explicit operator bool() const { return value != 0; }
};

/// @brief Volume watch registration identifier
struct WatchId {
    std::uint64_t value{0};

    bool operator==(const WatchId&) const = default;
    bool operator!=(const WatchId&) const = default;
    explicit operator bool() const { return value != 0; }
};

// =============================================================================
// Forward Declarations
// =============================================================================

struct Material;
struct PropertyBlock;
struct Renderer;
struct AABB;

class ITriggerVolume;
class BoxVolume;
class SphereVolume;
class VolumeFactory;

class SceneGraph;
class VolumeMonitor;

} // namespace mcv_scene

// =============================================================================
// Hash Specializations
// =============================================================================

namespace std {

template<>
struct hash<mcv_scene::NodeId> {
    std::size_t operator()(const mcv_scene::NodeId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};

template<>
struct hash<mcv_scene::TemplateId> {
    std::size_t operator()(const mcv_scene::TemplateId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};

template<>
struct hash<mcv_scene::TextureId> {
    std::size_t operator()(const mcv_scene::TextureId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};

} // namespace std
