#include "intentional/native_host.hpp"
#include "intentional/logger.hpp"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace intentional {

NativeHostSession::NativeHostSession(int fd, std::string label)
    : fd_(fd), label_(std::move(label)) {}

NativeHostSession::~NativeHostSession() {
  stop();
  if (reader_.joinable()) {
    // The last reference can be dropped by the reader itself
    if (reader_.get_id() == std::this_thread::get_id())
      reader_.detach();
    else
      reader_.join();
  }

  ::close(fd_);
}

void NativeHostSession::join() {
  if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id())
    reader_.join();
}

void NativeHostSession::start(MessageSink sink) {
  active_ = true;
  reader_ = std::jthread([this, sink = std::move(sink)] { readLoop(sink); });
  LOG_INFO("Native messaging session " + label_ + " started");
}

void NativeHostSession::readLoop(MessageSink sink) {
  // The session outlives its reader even after the server forgets it
  auto self = shared_from_this();
  FrameReader reader(fd_);
  nlohmann::json message;

  while (active_) {
    FrameStatus status = reader.next(message);
    if (status == FrameStatus::END)
      break;
    if (status == FrameStatus::MALFORMED)
      continue;

    sink(self, std::move(message));
    message = nlohmann::json();
  }

  active_ = false;
  LOG_INFO("Native messaging session " + label_ + " ended (" +
           std::to_string(reader.framesDecoded()) + " frames, " +
           std::to_string(reader.framesDropped()) + " dropped)");
}

bool NativeHostSession::send(const nlohmann::json &message) {
  if (!active_)
    return false;

  std::string payload = message.dump();
  if (payload.size() > kMaxFrameBytes) {
    LOG_ERROR("Refusing to send oversized message (" +
              std::to_string(payload.size()) + " bytes) to " + label_);
    return false;
  }

  std::vector<uint8_t> frame = encodeFrame(payload);
  std::lock_guard<std::mutex> lock(writeMutex_);
  if (!writeAll(fd_, frame.data(), frame.size())) {
    LOG_WARN("Write to " + label_ + " failed: " + std::string(strerror(errno)));
    active_ = false;
    return false;
  }
  return true;
}

void NativeHostSession::stop() {
  active_ = false;

  // Wakes a reader blocked in read()
  if (::shutdown(fd_, SHUT_RDWR) != 0 && errno != ENOTCONN) {
    LOG_DEBUG("shutdown(" + label_ + "): " + std::string(strerror(errno)));
  }
}

} // namespace intentional
