#pragma once

#include "messages.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace voxrelay::proto {

// ============================================================================
// Serialization (JSON text, UTF-8 bytes)
// ============================================================================

/// Serialize a message to the bytes of its JSON text.
std::vector<std::uint8_t> serialize(const ServerMessage& msg);
std::vector<std::uint8_t> serialize(const ClientMessage& msg);

/// Deserialize bytes to a message.
/// Returns std::nullopt if the payload is not a JSON object, the type is
/// unknown, or a required field is missing or has the wrong JSON type.
/// @param error Receives a short reason on failure (optional).
std::optional<ClientMessage> parse_client_message(std::span<const std::uint8_t> data,
                                                  std::string* error = nullptr);
std::optional<ServerMessage> parse_server_message(std::span<const std::uint8_t> data,
                                                  std::string* error = nullptr);

/// Wire type name of a message ("login", "player_move", ...).
std::string_view type_name(const ClientMessage& msg);
std::string_view type_name(const ServerMessage& msg);

/// JSON text of a status report: {"status":..,"playerCount":..,"uptimeSeconds":..}
std::string to_json(const StatusReport& status);

} // namespace voxrelay::proto
