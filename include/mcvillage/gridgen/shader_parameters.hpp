/// @file shader_parameters.hpp
/// @brief Randomized float shader parameters

#pragma once

#include "types.hpp"

#include <mcvillage/core/fwd.hpp>

#include <string>
#include <vector>

namespace mcv_gridgen {

/// @brief Named float range drawn per instance
struct ShaderFloatParameter {
    std::string name;
    bool enabled{true};
    float min_value{0.0f};
    float max_value{1.0f};

    ShaderFloatParameter() = default;
    ShaderFloatParameter(std::string param_name, float min, float max, bool is_enabled = true)
        : name(std::move(param_name)), enabled(is_enabled), min_value(min), max_value(max) {}
};

// =============================================================================
// ShaderParameterManager
// =============================================================================

/// @brief Writes randomized floats into an instance's property blocks
///
/// For every enabled parameter (in list order, except `skip_property`) one
/// value is drawn and written into the per-slot property block of every
/// material that declares it. Shared materials are never touched. Nothing is
/// drawn for a subtree without renderers.
class ShaderParameterManager {
public:
    ShaderParameterManager() = default;
    explicit ShaderParameterManager(std::vector<ShaderFloatParameter> parameters);

    /// @brief Stock parameter list for crop shaders (_Stage, _WaveSpeed)
    [[nodiscard]] static std::vector<ShaderFloatParameter> default_parameters();

    /// @brief Randomize the subtree rooted at `node`
    /// @return Number of slot writes
    std::size_t randomize(mcv_scene::SceneGraph& scene, NodeId node, mcv_core::IRandomSource& rng,
                          const std::string& skip_property = {}) const;

    void add_parameter(ShaderFloatParameter parameter) { m_parameters.push_back(std::move(parameter)); }
    [[nodiscard]] const std::vector<ShaderFloatParameter>& parameters() const noexcept { return m_parameters; }
    [[nodiscard]] std::vector<ShaderFloatParameter>& parameters() noexcept { return m_parameters; }

private:
    std::vector<ShaderFloatParameter> m_parameters;
};

} // namespace mcv_gridgen
