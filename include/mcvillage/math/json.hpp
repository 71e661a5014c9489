#pragma once

/// @file json.hpp
/// @brief JSON readers for mcv_math types

#include "transform.hpp"

#include <mcvillage/core/error.hpp>

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace mcv_math {

/// Parse `[x, y, z]` or `{"x":..,"y":..,"z":..}`
mcv_core::Result<Vec3> vec3_from_json(const nlohmann::json& j, const std::string& key);

/// Parse `[r, g, b]` or `[r, g, b, a]` (alpha defaults to 1)
mcv_core::Result<Color> color_from_json(const nlohmann::json& j, const std::string& key);

/// Parse `{"position": [..], "rotation": [euler degrees], "scale": [..]}`.
/// Missing fields keep their identity values.
mcv_core::Result<Transform> transform_from_json(const nlohmann::json& j, const std::string& key);

} // namespace mcv_math
