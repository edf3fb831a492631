#pragma once

// ENet common utilities for the relay transport layer.
// Forward declarations keep <enet/enet.h> out of public headers.

#include <cstddef>
#include <cstdint>

// Forward declarations for ENet types (opaque pointers)
struct _ENetHost;
struct _ENetPeer;
typedef struct _ENetHost ENetHost;
typedef struct _ENetPeer ENetPeer;

namespace voxrelay::transport {

// ============================================================================
// ENetInitializer - RAII wrapper for enet_initialize/enet_deinitialize
// ============================================================================

/// Owned by each ENetServerTransport; start() fails if initialization did.

class ENetInitializer {
public:
    ENetInitializer();
    ~ENetInitializer();

    ENetInitializer(const ENetInitializer&) = delete;
    ENetInitializer& operator=(const ENetInitializer&) = delete;

    bool is_initialized() const { return initialized_; }

private:
    bool initialized_{false};
};

// ============================================================================
// Configuration
// ============================================================================

namespace config {
    constexpr std::uint16_t kDefaultPort = 3001;
    constexpr std::size_t kDefaultMaxClients = 64;
    constexpr std::size_t kChannelCount = 1;  // Reliable, ordered JSON messages
    constexpr int kFlushIterations = 10;
    constexpr std::uint32_t kFlushWaitMs = 10;
}

enum class Channel : std::uint8_t {
    Reliable = 0,
};

} // namespace voxrelay::transport
