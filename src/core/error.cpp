/// @file error.cpp
/// @brief Error formatting for mcv_core

#include <mcvillage/core/error.hpp>

#include <sstream>

namespace mcv_core {

namespace detail {

std::string format_grid_error(const GridError& err) {
    std::ostringstream oss;
    oss << "[GridError] " << err.message;
    if (!err.generator.empty()) {
        oss << " (generator: " << err.generator << ")";
    }
    return oss.str();
}

std::string format_teleport_error(const TeleportError& err) {
    std::ostringstream oss;
    oss << "[TeleportError] " << err.message;
    if (!err.chest.empty()) {
        oss << " (chest: " << err.chest << ")";
    }
    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }
    return oss.str();
}

} // namespace detail

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, GridError>) {
            oss << detail::format_grid_error(err);
        } else if constexpr (std::is_same_v<T, TeleportError>) {
            oss << detail::format_teleport_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// Common Result types used across modules
template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<float, Error>;
template class Result<std::string, Error>;

} // namespace mcv_core
