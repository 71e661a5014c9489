/// @file config.cpp
/// @brief JSON configuration loading for mcv_core

#include <mcvillage/core/config.hpp>
#include <mcvillage/core/log.hpp>

#include <fstream>
#include <sstream>

namespace mcv_core {

Result<nlohmann::json> load_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<nlohmann::json>(ConfigError::file_not_found(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    MCV_LOG_DEBUG("Loaded config file '{}' ({} bytes)", path.string(), buffer.str().size());
    return parse_json_string(buffer.str(), path.string());
}

Result<nlohmann::json> parse_json_string(const std::string& text, const std::string& source) {
    try {
        return Ok(nlohmann::json::parse(text));
    } catch (const nlohmann::json::parse_error& e) {
        return Err<nlohmann::json>(ConfigError::malformed(source, e.what()));
    }
}

Result<void> expect_object(const nlohmann::json& j, const std::string& what) {
    if (!j.is_object()) {
        return Err(ConfigError::wrong_type(what, "an object"));
    }
    return Ok();
}

} // namespace mcv_core
