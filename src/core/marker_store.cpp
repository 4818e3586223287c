#include "intentional/marker_store.hpp"
#include "intentional/logger.hpp"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace intentional {

MarkerStore::MarkerStore(const std::filesystem::path &markerPath,
                         const std::filesystem::path &strictPath)
    : markerPath_(markerPath), strictPath_(strictPath) {}

bool MarkerStore::writeNoRelaunch() {
  int fd = ::open(markerPath_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) {
    LOG_ERROR("Failed to write no-relaunch marker " + markerPath_.string() +
              " (" + strerror(errno) + ")");
    return false;
  }
  // An existing marker keeps its inode; only the timestamp matters
  bool ok = ::futimens(fd, nullptr) == 0;
  ::close(fd);
  if (!ok) {
    LOG_ERROR("Failed to touch no-relaunch marker: " +
              std::string(strerror(errno)));
  }
  return ok;
}

std::optional<std::chrono::seconds> MarkerStore::markerAge() const {
  struct stat st {};
  if (::stat(markerPath_.c_str(), &st) != 0)
    return std::nullopt;

  std::time_t now = std::time(nullptr);
  if (st.st_mtime >= now)
    return std::chrono::seconds(0);
  return std::chrono::seconds(now - st.st_mtime);
}

bool MarkerStore::markerFresh() const {
  auto age = markerAge();
  return age && *age < kMarkerFreshness;
}

bool MarkerStore::removeMarker() {
  std::error_code ec;
  bool removed = std::filesystem::remove(markerPath_, ec);
  if (ec) {
    LOG_WARN("Failed to remove no-relaunch marker: " + ec.message());
  }
  return removed;
}

bool MarkerStore::strictMode() const {
  return ::access(strictPath_.c_str(), F_OK) == 0;
}

bool MarkerStore::setStrictMode(bool enabled) {
  std::error_code ec;
  if (!enabled) {
    std::filesystem::remove(strictPath_, ec);
    return !ec;
  }

  int fd = ::open(strictPath_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) {
    LOG_ERROR("Failed to create strict-mode flag " + strictPath_.string() +
              " (" + strerror(errno) + ")");
    return false;
  }
  ::close(fd);
  return true;
}

} // namespace intentional
