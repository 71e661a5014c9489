#pragma once

/// @file error.hpp
/// @brief Error handling types for mcv_core

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace mcv_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    MissingTemplate,
    NoEnabledTypes,
    NoDestination,
    NoActor,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::MissingTemplate: return "MissingTemplate";
        case ErrorCode::NoEnabledTypes: return "NoEnabledTypes";
        case ErrorCode::NoDestination: return "NoDestination";
        case ErrorCode::NoActor: return "NoActor";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Grid generation configuration errors (fatal for the generate call)
struct GridError {
    enum class Kind : std::uint8_t {
        MissingTemplate,    // No template assigned to the generator
        NoEnabledTypes,     // No enabled type with a valid template
        InvalidSpec,        // Negative size or non-positive spacing
    };

    Kind kind;
    std::string message;
    std::string generator;

    [[nodiscard]] static GridError missing_template(const std::string& generator) {
        return GridError{Kind::MissingTemplate, "No template assigned to generator '" + generator + "'", generator};
    }

    [[nodiscard]] static GridError no_enabled_types(const std::string& generator) {
        return GridError{Kind::NoEnabledTypes,
            "Generator '" + generator + "' has no enabled object types with a valid template", generator};
    }

    [[nodiscard]] static GridError invalid_spec(const std::string& generator, const std::string& reason) {
        return GridError{Kind::InvalidSpec, "Invalid grid spec for '" + generator + "': " + reason, generator};
    }
};

/// Teleport lookup failures (recoverable, abort the current sequence)
struct TeleportError {
    enum class Kind : std::uint8_t {
        NoDestination,      // No other eligible chest in the network
        NoActor,            // The detected actor no longer resolves to a node
        MissingNode,        // Expected child node could not be found or synthesized
    };

    Kind kind;
    std::string message;
    std::string chest;

    [[nodiscard]] static TeleportError no_destination(const std::string& chest, const std::string& tag) {
        return TeleportError{Kind::NoDestination,
            "No valid teleport targets for '" + chest + "'; other chests need the '" + tag +
            "' tag and a 'TeleportTarget' child", chest};
    }

    [[nodiscard]] static TeleportError no_actor(const std::string& chest) {
        return TeleportError{Kind::NoActor, "Could not find an actor to teleport from '" + chest + "'", chest};
    }

    [[nodiscard]] static TeleportError missing_node(const std::string& chest, const std::string& node) {
        return TeleportError{Kind::MissingNode, "Chest '" + chest + "' is missing '" + node + "'", chest};
    }
};

/// Configuration loading errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,
        Malformed,
        WrongType,
        UnknownReference,
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Config file not found: " + path, path};
    }

    [[nodiscard]] static ConfigError malformed(const std::string& path, const std::string& reason) {
        return ConfigError{Kind::Malformed, "Malformed config '" + path + "': " + reason, path};
    }

    [[nodiscard]] static ConfigError wrong_type(const std::string& key, const std::string& expected) {
        return ConfigError{Kind::WrongType, "Config key '" + key + "' must be " + expected, key};
    }

    [[nodiscard]] static ConfigError unknown_reference(const std::string& key, const std::string& name) {
        return ConfigError{Kind::UnknownReference, "Config key '" + key + "' references unknown '" + name + "'", key};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        GridError,
        TeleportError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(GridError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(TeleportError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(GridError::Kind kind) {
        switch (kind) {
            case GridError::Kind::MissingTemplate: return ErrorCode::MissingTemplate;
            case GridError::Kind::NoEnabledTypes: return ErrorCode::NoEnabledTypes;
            case GridError::Kind::InvalidSpec: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(TeleportError::Kind kind) {
        switch (kind) {
            case TeleportError::Kind::NoDestination: return ErrorCode::NoDestination;
            case TeleportError::Kind::NoActor: return ErrorCode::NoActor;
            case TeleportError::Kind::MissingNode: return ErrorCode::NotFound;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::FileNotFound: return ErrorCode::IOError;
            case ConfigError::Kind::Malformed: return ErrorCode::ParseError;
            case ConfigError::Kind::WrongType: return ErrorCode::ParseError;
            case ConfigError::Kind::UnknownReference: return ErrorCode::NotFound;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Value-or-error return type
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_value(std::move(value)) {}
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + message_of(m_error));
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + message_of(m_error));
        }
        return std::move(*m_value);
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    static std::string message_of(const E& err) {
        if constexpr (std::is_same_v<E, Error>) {
            return err.message();
        } else {
            return "unknown";
        }
    }

    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with kind prefix and context
std::string build_error_chain(const Error& error);

} // namespace mcv_core
