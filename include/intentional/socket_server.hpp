#ifndef INTENTIONAL_SOCKET_SERVER_HPP
#define INTENTIONAL_SOCKET_SERVER_HPP

#include "intentional/native_host.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

namespace intentional {

// Connects to a Unix stream socket. Returns the fd or -1.
int connectEndpoint(const std::filesystem::path &socketPath);

// The primary's local endpoint. Every relay connection becomes a
// NativeHostSession whose decoded messages go to the sink.
class SocketServer {
public:
  static constexpr int kBacklog = 5;

  SocketServer(std::filesystem::path socketPath,
               NativeHostSession::MessageSink sink);
  ~SocketServer();

  SocketServer(const SocketServer &) = delete;
  SocketServer &operator=(const SocketServer &) = delete;

  // Binds and starts accepting. Fails if another process answers on the
  // endpoint.
  bool start();

  // Closes the listener, stops every session and unlinks the socket file
  void stop();

  bool running() const { return listenFd_ != -1; }

  // Active sessions. Ended sessions are reaped here and on accept.
  size_t connectionCount();

  // Sends a message to every active session, returns how many accepted it
  size_t broadcast(const nlohmann::json &message);

  const std::filesystem::path &path() const { return socketPath_; }

private:
  void acceptLoop(std::stop_token st);
  void reap();
  void logPeer(int fd, const std::string &label);

  std::filesystem::path socketPath_;
  NativeHostSession::MessageSink sink_;
  int listenFd_ = -1;
  uint64_t nextId_ = 1;
  std::jthread acceptThread_;
  std::mutex sessionsMutex_;
  std::vector<std::shared_ptr<NativeHostSession>> sessions_;
};

} // namespace intentional

#endif // INTENTIONAL_SOCKET_SERVER_HPP
