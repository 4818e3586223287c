#ifndef INTENTIONAL_USAGE_LEDGER_HPP
#define INTENTIONAL_USAGE_LEDGER_HPP

#include "intentional/message_dispatcher.hpp"

#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace intentional {

// Per-platform usage for the current local date. Platforms without a budget
// are tracked but never reported as exceeded.
class UsageLedger : public MessageHandler {
public:
  static constexpr double kMaxSecondsPerUpdate = 60.0;

  using DateSource = std::function<std::string()>;

  explicit UsageLedger(std::map<std::string, int> budgets,
                       DateSource today = &UsageLedger::localDate);

  void recordUsage(const TimeUpdate &update) override;
  void sessionStarted(const SessionEvent &event) override;
  void sessionEnded(const SessionEvent &event) override;
  std::map<std::string, PlatformUsage> status() override;
  std::optional<BudgetExceeded> exceeded(const std::string &platform) override;
  nlohmann::json usage() override;

  double minutesUsed(const std::string &platform);
  int budget(const std::string &platform) const;
  size_t openSessions() const { return sessions_.size(); }
  const std::string &date() const { return date_; }

  // YYYY-mm-dd in local time
  static std::string localDate();

private:
  std::map<std::string, int> budgets_;
  DateSource today_;
  std::string date_;
  std::map<std::string, double> secondsUsed_;
  // (platform, browser) -> intent
  std::map<std::pair<std::string, std::string>, std::string> sessions_;

  void rollDate();
};

} // namespace intentional

#endif // INTENTIONAL_USAGE_LEDGER_HPP
