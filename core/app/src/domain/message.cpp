#include "pulse/domain/message.hpp"

namespace pulse {
namespace domain {

const char* toString(MessageType type) {
  switch (type) {
    case MessageType::Message:       return "Message";
    case MessageType::Signal:        return "Signal";
    case MessageType::Object:        return "Object";
    case MessageType::MessageAction: return "MessageAction";
    case MessageType::File:          return "File";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace pulse
