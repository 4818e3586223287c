#ifndef INTENTIONAL_NATIVE_HOST_HPP
#define INTENTIONAL_NATIVE_HOST_HPP

#include "intentional/frame_codec.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

namespace intentional {

// One native messaging conversation over a relay connection accepted by the
// socket server. The session owns the connected socket.
class NativeHostSession
    : public std::enable_shared_from_this<NativeHostSession> {
public:
  // Receives every decoded message on the session's reader thread
  using MessageSink = std::function<void(std::shared_ptr<NativeHostSession>,
                                         nlohmann::json)>;

  NativeHostSession(int fd, std::string label);
  ~NativeHostSession();

  NativeHostSession(const NativeHostSession &) = delete;
  NativeHostSession &operator=(const NativeHostSession &) = delete;

  void start(MessageSink sink);

  // Writes one frame. Length prefix and body are written under the session
  // write lock. A failed write marks the session inactive.
  bool send(const nlohmann::json &message);

  // Unblocks the reader and marks the session inactive
  void stop();

  // Waits for the reader to finish; no sink call happens afterwards
  void join();

  bool active() const { return active_; }
  const std::string &label() const { return label_; }

private:
  void readLoop(MessageSink sink);

  int fd_;
  std::string label_;
  std::atomic<bool> active_{false};
  std::mutex writeMutex_;
  std::jthread reader_;
};

} // namespace intentional

#endif // INTENTIONAL_NATIVE_HOST_HPP
