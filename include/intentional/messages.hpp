#ifndef INTENTIONAL_MESSAGES_HPP
#define INTENTIONAL_MESSAGES_HPP

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace intentional {

enum class MessageType {
  // Extension -> primary
  PING,
  TIME_UPDATE,
  USAGE_HEARTBEAT,
  SESSION_START,
  SESSION_END,
  GET_STATUS,
  GET_USAGE,
  // Primary -> extension
  PONG,
  STATUS,
  BUDGET_EXCEEDED,
  USAGE_RESPONSE
};

std::optional<MessageType> parseMessageType(const std::string &type);
std::string toString(MessageType type);

struct TimeUpdate {
  std::string platform;
  std::string browser;
  double seconds = 0;
  bool isVideoPlaying = false;
  std::string url;
};

struct SessionEvent {
  std::string platform;
  std::string browser;
  std::string intent;
};

struct PlatformUsage {
  double minutesUsed = 0;
  int budgetMinutes = 0;
  bool isExceeded = false;
};

struct BudgetExceeded {
  std::string platform;
  double minutesUsed = 0;
  int budgetMinutes = 0;
};

// Field extraction. nullopt when a required field is missing or mistyped.
// TIME_UPDATE requires platform, browser and seconds; USAGE_HEARTBEAT only
// platform and seconds (browser defaults to "Unknown").
std::optional<TimeUpdate> parseTimeUpdate(const nlohmann::json &j,
                                          bool browserRequired);
std::optional<SessionEvent> parseSessionEvent(const nlohmann::json &j);

nlohmann::json makePong(double timestamp);
nlohmann::json makeStatus(const std::map<std::string, PlatformUsage> &usage,
                          double timestamp);
nlohmann::json makeBudgetExceeded(const BudgetExceeded &event);
nlohmann::json makeUsageResponse(const nlohmann::json &usage);

// Seconds since the epoch, fractional
double epochSeconds();

} // namespace intentional

#endif // INTENTIONAL_MESSAGES_HPP
