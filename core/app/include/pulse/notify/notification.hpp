#pragma once

#include "pulse/domain/message.hpp"
#include "pulse/domain/status.hpp"

#include <variant>

namespace pulse {

// -----------------------------------------------------------------------------
// Notification: everything the engines surface to the application
// -----------------------------------------------------------------------------
// Status          connectivity milestones from the subscription engine
// Message         deduplicated updates from the subscribe loop
// HeartbeatStatus heartbeat outcomes from the presence engine (when announced)
// -----------------------------------------------------------------------------
using Notification =
    std::variant<domain::Status, domain::Message, domain::HeartbeatStatus>;

}  // namespace pulse
