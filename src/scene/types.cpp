/// @file types.cpp
/// @brief Material and renderer implementation for mcv_scene module

#include <mcvillage/scene/types.hpp>

namespace mcv_scene {

namespace {

template<typename T>
std::optional<T> lookup(const std::map<std::string, MaterialValue>& values, const std::string& property) {
    auto it = values.find(property);
    if (it == values.end()) {
        return std::nullopt;
    }
    if (const T* value = std::get_if<T>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

template<typename T>
std::optional<T> effective(const Renderer& renderer, std::size_t slot, const std::string& property) {
    if (slot >= renderer.materials.size() || !renderer.materials[slot]) {
        return std::nullopt;
    }
    if (slot < renderer.blocks.size()) {
        if (auto overridden = lookup<T>(renderer.blocks[slot].values, property)) {
            return overridden;
        }
    }
    return lookup<T>(renderer.materials[slot]->properties, property);
}

template<typename T>
std::size_t write_declaring(Renderer& renderer, const std::string& property, const T& value) {
    renderer.sync_blocks();
    std::size_t written = 0;
    for (std::size_t slot = 0; slot < renderer.materials.size(); ++slot) {
        const auto& material = renderer.materials[slot];
        if (material && material->has_property(property)) {
            renderer.blocks[slot].values[property] = value;
            ++written;
        }
    }
    return written;
}

} // anonymous namespace

// =============================================================================
// Material
// =============================================================================

std::optional<float> Material::get_float(const std::string& property) const {
    return lookup<float>(properties, property);
}

std::optional<Color> Material::get_color(const std::string& property) const {
    return lookup<Color>(properties, property);
}

std::optional<TextureId> Material::get_texture(const std::string& property) const {
    return lookup<TextureId>(properties, property);
}

// =============================================================================
// PropertyBlock
// =============================================================================

std::optional<float> PropertyBlock::get_float(const std::string& property) const {
    return lookup<float>(values, property);
}

std::optional<Color> PropertyBlock::get_color(const std::string& property) const {
    return lookup<Color>(values, property);
}

std::optional<TextureId> PropertyBlock::get_texture(const std::string& property) const {
    return lookup<TextureId>(values, property);
}

// =============================================================================
// Renderer
// =============================================================================

bool Renderer::declares(const std::string& property) const {
    for (const auto& material : materials) {
        if (material && material->has_property(property)) {
            return true;
        }
    }
    return false;
}

std::optional<float> Renderer::effective_float(std::size_t slot, const std::string& property) const {
    return effective<float>(*this, slot, property);
}

std::optional<Color> Renderer::effective_color(std::size_t slot, const std::string& property) const {
    return effective<Color>(*this, slot, property);
}

std::optional<TextureId> Renderer::effective_texture(std::size_t slot, const std::string& property) const {
    return effective<TextureId>(*this, slot, property);
}

std::size_t Renderer::set_float_on_declaring(const std::string& property, float value) {
    return write_declaring(*this, property, value);
}

std::size_t Renderer::set_color_on_declaring(const std::string& property, const Color& value) {
    return write_declaring(*this, property, value);
}

std::size_t Renderer::set_texture_on_declaring(const std::string& property, TextureId value) {
    return write_declaring(*this, property, value);
}

} // namespace mcv_scene
