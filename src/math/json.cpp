/// @file json.cpp
/// @brief JSON readers for mcv_math types

#include <mcvillage/math/json.hpp>

#include <nlohmann/json.hpp>

namespace mcv_math {

using mcv_core::ConfigError;
using mcv_core::Err;
using mcv_core::Ok;
using mcv_core::Result;

namespace {

bool all_numbers(const nlohmann::json& arr, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        if (!arr[i].is_number()) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

Result<Vec3> vec3_from_json(const nlohmann::json& j, const std::string& key) {
    if (j.is_array() && j.size() == 3 && all_numbers(j, 3)) {
        return Ok(Vec3(j[0].get<float>(), j[1].get<float>(), j[2].get<float>()));
    }

    if (j.is_object()) {
        Vec3 v = vec3::ZERO;
        const char* axes[] = {"x", "y", "z"};
        for (int i = 0; i < 3; ++i) {
            auto it = j.find(axes[i]);
            if (it == j.end()) {
                continue;
            }
            if (!it->is_number()) {
                return Err<Vec3>(ConfigError::wrong_type(key + "." + axes[i], "a number"));
            }
            v[i] = it->get<float>();
        }
        return Ok(v);
    }

    return Err<Vec3>(ConfigError::wrong_type(key, "a 3-component vector"));
}

Result<Color> color_from_json(const nlohmann::json& j, const std::string& key) {
    if (j.is_array() && (j.size() == 3 || j.size() == 4) && all_numbers(j, j.size())) {
        float a = j.size() == 4 ? j[3].get<float>() : 1.0f;
        return Ok(Color(j[0].get<float>(), j[1].get<float>(), j[2].get<float>(), a));
    }
    return Err<Color>(ConfigError::wrong_type(key, "an RGB or RGBA array"));
}

Result<Transform> transform_from_json(const nlohmann::json& j, const std::string& key) {
    if (!j.is_object()) {
        return Err<Transform>(ConfigError::wrong_type(key, "an object"));
    }

    Transform t;

    if (j.contains("position")) {
        auto pos = vec3_from_json(j["position"], key + ".position");
        if (!pos) {
            return Err<Transform>(pos.error());
        }
        t.position = *pos;
    }

    if (j.contains("rotation")) {
        auto rot = vec3_from_json(j["rotation"], key + ".rotation");
        if (!rot) {
            return Err<Transform>(rot.error());
        }
        t.rotation = quat_from_euler_degrees(*rot);
    }

    if (j.contains("scale")) {
        const auto& s = j["scale"];
        if (s.is_number()) {
            float u = s.get<float>();
            t.scale_ = Vec3(u, u, u);
        } else {
            auto scl = vec3_from_json(s, key + ".scale");
            if (!scl) {
                return Err<Transform>(scl.error());
            }
            t.scale_ = *scl;
        }
    }

    return Ok(t);
}

} // namespace mcv_math
