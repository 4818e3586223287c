#include "intentional/messages.hpp"

#include <chrono>

namespace intentional {

namespace {

const std::map<std::string, MessageType> &typeTable() {
  static const std::map<std::string, MessageType> table = {
      {"PING", MessageType::PING},
      {"TIME_UPDATE", MessageType::TIME_UPDATE},
      {"USAGE_HEARTBEAT", MessageType::USAGE_HEARTBEAT},
      {"SESSION_START", MessageType::SESSION_START},
      {"SESSION_END", MessageType::SESSION_END},
      {"GET_STATUS", MessageType::GET_STATUS},
      {"GET_USAGE", MessageType::GET_USAGE},
      {"PONG", MessageType::PONG},
      {"STATUS", MessageType::STATUS},
      {"BUDGET_EXCEEDED", MessageType::BUDGET_EXCEEDED},
      {"USAGE_RESPONSE", MessageType::USAGE_RESPONSE}};
  return table;
}

bool stringField(const nlohmann::json &j, const char *key, std::string &out) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string())
    return false;
  out = it->get<std::string>();
  return true;
}

} // namespace

std::optional<MessageType> parseMessageType(const std::string &type) {
  auto it = typeTable().find(type);
  if (it == typeTable().end())
    return std::nullopt;
  return it->second;
}

std::string toString(MessageType type) {
  for (const auto &[name, value] : typeTable()) {
    if (value == type)
      return name;
  }
  return "UNKNOWN";
}

std::optional<TimeUpdate> parseTimeUpdate(const nlohmann::json &j,
                                          bool browserRequired) {
  TimeUpdate update;
  if (!stringField(j, "platform", update.platform))
    return std::nullopt;
  if (!stringField(j, "browser", update.browser)) {
    if (browserRequired)
      return std::nullopt;
    update.browser = "Unknown";
  }

  auto seconds = j.find("seconds");
  if (seconds == j.end() || !seconds->is_number())
    return std::nullopt;
  update.seconds = seconds->get<double>();

  auto playing = j.find("isVideoPlaying");
  if (playing != j.end() && playing->is_boolean())
    update.isVideoPlaying = playing->get<bool>();
  stringField(j, "url", update.url);
  return update;
}

std::optional<SessionEvent> parseSessionEvent(const nlohmann::json &j) {
  SessionEvent event;
  if (!stringField(j, "platform", event.platform) ||
      !stringField(j, "browser", event.browser))
    return std::nullopt;
  stringField(j, "intent", event.intent);
  return event;
}

nlohmann::json makePong(double timestamp) {
  return {{"type", toString(MessageType::PONG)}, {"timestamp", timestamp}};
}

nlohmann::json makeStatus(const std::map<std::string, PlatformUsage> &usage,
                          double timestamp) {
  nlohmann::json j;
  j["type"] = toString(MessageType::STATUS);
  for (const auto &[platform, u] : usage) {
    j[platform] = {{"minutesUsed", u.minutesUsed},
                   {"budgetMinutes", u.budgetMinutes},
                   {"isExceeded", u.isExceeded}};
  }
  j["timestamp"] = timestamp;
  return j;
}

nlohmann::json makeBudgetExceeded(const BudgetExceeded &event) {
  return {{"type", toString(MessageType::BUDGET_EXCEEDED)},
          {"platform", event.platform},
          {"minutesUsed", event.minutesUsed},
          {"budgetMinutes", event.budgetMinutes}};
}

nlohmann::json makeUsageResponse(const nlohmann::json &usage) {
  return {{"type", toString(MessageType::USAGE_RESPONSE)}, {"usage", usage}};
}

double epochSeconds() {
  using namespace std::chrono;
  return duration<double>(system_clock::now().time_since_epoch()).count();
}

} // namespace intentional
