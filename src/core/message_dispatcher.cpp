#include "intentional/message_dispatcher.hpp"
#include "intentional/logger.hpp"

namespace intentional {

std::vector<nlohmann::json>
MessageDispatcher::dispatch(const nlohmann::json &message) {
  std::vector<nlohmann::json> replies;

  if (!message.is_object()) {
    LOG_WARN("Ignoring non-object message");
    return replies;
  }

  auto typeIt = message.find("type");
  if (typeIt == message.end() || !typeIt->is_string()) {
    LOG_WARN("Message missing type");
    return replies;
  }

  const std::string typeName = typeIt->get<std::string>();
  auto type = parseMessageType(typeName);
  if (!type) {
    LOG_WARN("Unknown message type: " + typeName);
    return replies;
  }

  switch (*type) {
  case MessageType::PING:
    replies.push_back(makePong(epochSeconds()));
    break;

  case MessageType::TIME_UPDATE:
  case MessageType::USAGE_HEARTBEAT: {
    auto update =
        parseTimeUpdate(message, *type == MessageType::TIME_UPDATE);
    if (!update) {
      LOG_WARN("Invalid " + typeName + " message");
      break;
    }
    handler_.recordUsage(*update);
    if (auto over = handler_.exceeded(update->platform)) {
      replies.push_back(makeBudgetExceeded(*over));
    }
    break;
  }

  case MessageType::SESSION_START:
  case MessageType::SESSION_END: {
    auto event = parseSessionEvent(message);
    if (!event) {
      LOG_WARN("Invalid " + typeName + " message");
      break;
    }
    if (*type == MessageType::SESSION_START)
      handler_.sessionStarted(*event);
    else
      handler_.sessionEnded(*event);
    break;
  }

  case MessageType::GET_STATUS:
    replies.push_back(makeStatus(handler_.status(), epochSeconds()));
    break;

  case MessageType::GET_USAGE:
    replies.push_back(makeUsageResponse(handler_.usage()));
    break;

  default:
    // Outbound types arriving inbound
    LOG_WARN("Unexpected inbound message type: " + typeName);
    break;
  }

  return replies;
}

} // namespace intentional
