#include "intentional/socket_server.hpp"
#include "intentional/logger.hpp"
#include "intentional/process.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace intentional {

namespace {

constexpr int kAcceptPollMs = 200;

bool makeAddress(const std::filesystem::path &socketPath, sockaddr_un &addr) {
  const std::string s = socketPath.string();
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (s.size() >= sizeof(addr.sun_path)) {
    LOG_ERROR("Socket path too long: " + s);
    return false;
  }
  std::memcpy(addr.sun_path, s.c_str(), s.size() + 1);
  return true;
}

} // namespace

int connectEndpoint(const std::filesystem::path &socketPath) {
  sockaddr_un addr;
  if (!makeAddress(socketPath, addr))
    return -1;

  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    LOG_ERROR("socket() failed: " + std::string(strerror(errno)));
    return -1;
  }

  if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    ::close(fd);
    return -1;
  }
  return fd;
}

SocketServer::SocketServer(std::filesystem::path socketPath,
                           NativeHostSession::MessageSink sink)
    : socketPath_(std::move(socketPath)), sink_(std::move(sink)) {}

SocketServer::~SocketServer() { stop(); }

bool SocketServer::start() {
  if (running())
    return true;

  std::error_code ec;
  if (std::filesystem::exists(socketPath_, ec)) {
    int probe = connectEndpoint(socketPath_);
    if (probe >= 0) {
      ::close(probe);
      LOG_ERROR("Another process is serving " + socketPath_.string());
      return false;
    }
    LOG_INFO("Removing stale socket " + socketPath_.string());
    std::filesystem::remove(socketPath_, ec);
    if (ec) {
      LOG_ERROR("Failed to remove stale socket: " + ec.message());
      return false;
    }
  }

  sockaddr_un addr;
  if (!makeAddress(socketPath_, addr))
    return false;

  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    LOG_ERROR("socket() failed: " + std::string(strerror(errno)));
    return false;
  }

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    LOG_ERROR("bind(" + socketPath_.string() +
              ") failed: " + std::string(strerror(errno)));
    ::close(fd);
    return false;
  }

  if (::chmod(socketPath_.c_str(), 0600) != 0) {
    LOG_WARN("chmod 0600 on socket failed: " + std::string(strerror(errno)));
  }

  if (::listen(fd, kBacklog) != 0) {
    LOG_ERROR("listen() failed: " + std::string(strerror(errno)));
    ::close(fd);
    std::filesystem::remove(socketPath_, ec);
    return false;
  }

  listenFd_ = fd;
  acceptThread_ = std::jthread([this](std::stop_token st) { acceptLoop(st); });
  LOG_INFO("Socket server listening on " + socketPath_.string());
  return true;
}

void SocketServer::acceptLoop(std::stop_token st) {
  while (!st.stop_requested()) {
    pollfd pfd{listenFd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, kAcceptPollMs);
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("poll() on listener failed: " + std::string(strerror(errno)));
      break;
    }
    if (ready == 0)
      continue;

    int client = ::accept4(listenFd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED)
        continue;
      LOG_ERROR("accept() failed: " + std::string(strerror(errno)));
      break;
    }

    std::string label;
    std::shared_ptr<NativeHostSession> session;
    {
      std::lock_guard<std::mutex> lock(sessionsMutex_);
      label = "relay-" + std::to_string(nextId_++);
      session = std::make_shared<NativeHostSession>(client, label);
    }
    logPeer(client, label);

    reap();
    session->start(sink_);
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    sessions_.push_back(std::move(session));
  }
}

void SocketServer::logPeer(int fd, const std::string &label) {
  ucred cred{};
  socklen_t len = sizeof(cred);
  if (::getsockopt(fd, SOL_SOCKET, SO_PEERCRED, &cred, &len) != 0) {
    LOG_DEBUG("SO_PEERCRED failed for " + label);
    return;
  }

  std::string browser = "unknown";
  if (auto ppid = Process::parentPid(cred.pid)) {
    if (auto name = Process::commandName(*ppid))
      browser = *name;
  }
  LOG_INFO("Accepted " + label + " from pid " + std::to_string(cred.pid) +
           " (parent: " + browser + ")");
}

void SocketServer::reap() {
  std::vector<std::shared_ptr<NativeHostSession>> ended;
  {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = std::stable_partition(
        sessions_.begin(), sessions_.end(),
        [](const std::shared_ptr<NativeHostSession> &s) { return s->active(); });
    ended.assign(std::make_move_iterator(it),
                 std::make_move_iterator(sessions_.end()));
    sessions_.erase(it, sessions_.end());
  }
  // Ended sessions join their reader outside the lock
  for (auto &session : ended) {
    session->stop();
    session->join();
  }
}

size_t SocketServer::connectionCount() {
  reap();
  std::lock_guard<std::mutex> lock(sessionsMutex_);
  return sessions_.size();
}

size_t SocketServer::broadcast(const nlohmann::json &message) {
  std::vector<std::shared_ptr<NativeHostSession>> targets;
  {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    targets = sessions_;
  }

  size_t delivered = 0;
  for (auto &session : targets) {
    if (session->send(message))
      ++delivered;
  }
  return delivered;
}

void SocketServer::stop() {
  if (!running())
    return;

  acceptThread_.request_stop();
  if (acceptThread_.joinable())
    acceptThread_.join();

  ::close(listenFd_);
  listenFd_ = -1;

  std::vector<std::shared_ptr<NativeHostSession>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    sessions.swap(sessions_);
  }
  for (auto &session : sessions)
    session->stop();
  for (auto &session : sessions)
    session->join();
  sessions.clear();

  std::error_code ec;
  std::filesystem::remove(socketPath_, ec);
  LOG_INFO("Socket server stopped");
}

} // namespace intentional
