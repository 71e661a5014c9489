#pragma once

/// @file config.hpp
/// @brief JSON configuration helpers for mcv_core

#include "error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <type_traits>

namespace mcv_core {

// =============================================================================
// Loading
// =============================================================================

/// Read and parse a JSON document from disk
Result<nlohmann::json> load_json_file(const std::filesystem::path& path);

/// Parse a JSON document from a string. `source` names the origin in errors.
Result<nlohmann::json> parse_json_string(const std::string& text, const std::string& source = "<string>");

// =============================================================================
// Field Readers
// =============================================================================

namespace detail {

template<typename T>
[[nodiscard]] const char* json_type_name() {
    if constexpr (std::is_same_v<T, bool>) {
        return "a boolean";
    } else if constexpr (std::is_integral_v<T>) {
        return "an integer";
    } else if constexpr (std::is_floating_point_v<T>) {
        return "a number";
    } else if constexpr (std::is_same_v<T, std::string>) {
        return "a string";
    } else {
        return "a value of the expected type";
    }
}

template<typename T>
[[nodiscard]] bool json_has_type(const nlohmann::json& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value.is_boolean();
    } else if constexpr (std::is_integral_v<T>) {
        return value.is_number_integer();
    } else if constexpr (std::is_floating_point_v<T>) {
        return value.is_number();
    } else if constexpr (std::is_same_v<T, std::string>) {
        return value.is_string();
    } else {
        return true;
    }
}

} // namespace detail

/// Read `key` into `out` if present. Missing keys leave `out` untouched.
/// A present key of the wrong JSON type is a ParseError.
template<typename T>
Result<void> read_optional(const nlohmann::json& j, const std::string& key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return Ok();
    }
    if (!detail::json_has_type<T>(*it)) {
        return Err(ConfigError::wrong_type(key, detail::json_type_name<T>()));
    }
    out = it->template get<T>();
    return Ok();
}

/// Read a required key. Missing keys are a ParseError.
template<typename T>
Result<void> read_required(const nlohmann::json& j, const std::string& key, T& out) {
    if (!j.contains(key)) {
        return Err(Error(ErrorCode::ParseError, "Missing required key '" + key + "'"));
    }
    return read_optional(j, key, out);
}

/// Require `j` to be a JSON object
Result<void> expect_object(const nlohmann::json& j, const std::string& what);

} // namespace mcv_core
