#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for mcv_core module

#include <cstdint>

namespace mcv_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

// =============================================================================
// Random
// =============================================================================

class IRandomSource;
class SeededRandom;

} // namespace mcv_core
