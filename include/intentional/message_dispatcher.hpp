#ifndef INTENTIONAL_MESSAGE_DISPATCHER_HPP
#define INTENTIONAL_MESSAGE_DISPATCHER_HPP

#include "intentional/messages.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace intentional {

// Consumer of decoded extension messages. Always invoked from the primary's
// serialized execution context.
class MessageHandler {
public:
  virtual ~MessageHandler() = default;

  virtual void recordUsage(const TimeUpdate &update) = 0;
  virtual void sessionStarted(const SessionEvent &event) = 0;
  virtual void sessionEnded(const SessionEvent &event) = 0;

  virtual std::map<std::string, PlatformUsage> status() = 0;
  virtual std::optional<BudgetExceeded> exceeded(const std::string &platform) = 0;

  // Body of a USAGE_RESPONSE
  virtual nlohmann::json usage() = 0;
};

// Routes a decoded JSON object by its "type" field and returns the replies
// destined for the sending connection.
class MessageDispatcher {
public:
  explicit MessageDispatcher(MessageHandler &handler) : handler_(handler) {}

  std::vector<nlohmann::json> dispatch(const nlohmann::json &message);

private:
  MessageHandler &handler_;
};

} // namespace intentional

#endif // INTENTIONAL_MESSAGE_DISPATCHER_HPP
