#include "intentional/usage_ledger.hpp"
#include "intentional/logger.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace intentional {

UsageLedger::UsageLedger(std::map<std::string, int> budgets, DateSource today)
    : budgets_(std::move(budgets)), today_(std::move(today)) {
  date_ = today_();
}

std::string UsageLedger::localDate() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%d");
  return ss.str();
}

void UsageLedger::rollDate() {
  std::string today = today_();
  if (today == date_)
    return;
  LOG_INFO("New day " + today + ", resetting usage from " + date_);
  date_ = today;
  secondsUsed_.clear();
}

void UsageLedger::recordUsage(const TimeUpdate &update) {
  rollDate();
  if (update.seconds <= 0)
    return;

  double seconds = std::min(update.seconds, kMaxSecondsPerUpdate);
  secondsUsed_[update.platform] += seconds;
  LOG_DEBUG("Usage +" + std::to_string(seconds) + "s " + update.platform +
            " (" + update.browser + ")");
}

void UsageLedger::sessionStarted(const SessionEvent &event) {
  rollDate();
  sessions_[{event.platform, event.browser}] = event.intent;
  LOG_INFO("Session started: " + event.platform + " on " + event.browser +
           (event.intent.empty() ? "" : " (" + event.intent + ")"));
}

void UsageLedger::sessionEnded(const SessionEvent &event) {
  if (sessions_.erase({event.platform, event.browser}) == 0) {
    LOG_DEBUG("Session end without start: " + event.platform + " on " +
              event.browser);
    return;
  }
  LOG_INFO("Session ended: " + event.platform + " on " + event.browser);
}

double UsageLedger::minutesUsed(const std::string &platform) {
  rollDate();
  auto it = secondsUsed_.find(platform);
  return it == secondsUsed_.end() ? 0.0 : it->second / 60.0;
}

int UsageLedger::budget(const std::string &platform) const {
  auto it = budgets_.find(platform);
  return it == budgets_.end() ? 0 : it->second;
}

std::map<std::string, PlatformUsage> UsageLedger::status() {
  rollDate();
  std::map<std::string, PlatformUsage> out;
  for (const auto &[platform, minutes] : budgets_) {
    out[platform].budgetMinutes = minutes;
  }
  for (const auto &[platform, seconds] : secondsUsed_) {
    out[platform].minutesUsed = seconds / 60.0;
  }
  for (auto &[platform, u] : out) {
    u.isExceeded = u.budgetMinutes > 0 && u.minutesUsed >= u.budgetMinutes;
  }
  return out;
}

std::optional<BudgetExceeded> UsageLedger::exceeded(const std::string &platform) {
  int limit = budget(platform);
  if (limit <= 0)
    return std::nullopt;

  double used = minutesUsed(platform);
  if (used < limit)
    return std::nullopt;

  return BudgetExceeded{platform, used, limit};
}

nlohmann::json UsageLedger::usage() {
  rollDate();
  nlohmann::json j;
  j["date"] = date_;
  double total = 0;
  for (const auto &[platform, seconds] : secondsUsed_) {
    j[platform] = seconds / 60.0;
    total += seconds / 60.0;
  }
  j["minutesUsed"] = total;
  return j;
}

} // namespace intentional
