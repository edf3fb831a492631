#pragma once

#include <cstdint>
#include <string>

namespace voxrelay {

// ============================================================================
// Core Types
// ============================================================================

/// Transport-level handle, assigned when a connection is accepted.
using ConnectionId = std::uint32_t;

/// Player identifier (UUID text), assigned at login.
using PlayerId = std::string;

using Tick = std::uint64_t;

static constexpr ConnectionId kInvalidConnectionId = 0;

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel : std::uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

// ============================================================================
// Geometry
// ============================================================================

struct Vec3 {
    double x{0.0};
    double y{0.0};
    double z{0.0};
};

inline bool operator==(const Vec3& a, const Vec3& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

} // namespace voxrelay
