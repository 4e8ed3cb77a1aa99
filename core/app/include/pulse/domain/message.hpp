#pragma once

#include "pulse/domain/cursor.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace pulse {
namespace domain {

// -----------------------------------------------------------------------------
// MessageType: the `e` field of a subscribe envelope
// -----------------------------------------------------------------------------
enum class MessageType {
  Message = 0,
  Signal = 1,
  Object = 2,
  MessageAction = 3,
  File = 4,
};

// -----------------------------------------------------------------------------
// Message: one update delivered by the subscribe loop
// -----------------------------------------------------------------------------
//
// @brief  Decoded envelope from a receive response, before deduplication.
//
// @details
// The payload is kept as raw JSON text. The core never interprets it; the
// application parses it in its listener.
//
// `subscription` is the group or wildcard pattern the message arrived
// through. It is empty when the message was addressed to a directly
// subscribed channel.
//
// Thread model:
//   Value type. Published by value through the NotificationBus.
// -----------------------------------------------------------------------------
struct Message {
  std::string channel;
  std::string subscription;
  Cursor published;                        // publish timetoken and region
  std::string publisher;
  std::string payload;                     // raw JSON text
  std::optional<std::int64_t> sequence;    // publish sequence when present
  MessageType type{MessageType::Message};
};

const char* toString(MessageType type);

}  // namespace domain
}  // namespace pulse
