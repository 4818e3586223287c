#include "intentional/frame_codec.hpp"
#include "intentional/logger.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace intentional {

std::string toString(FrameStatus status) {
  switch (status) {
  case FrameStatus::OK:
    return "Ok";
  case FrameStatus::MALFORMED:
    return "Malformed";
  case FrameStatus::END:
    return "End";
  default:
    return "Unknown";
  }
}

std::vector<uint8_t> encodeFrame(const std::string &payload) {
  const uint32_t len = static_cast<uint32_t>(payload.size());
  std::vector<uint8_t> frame;
  frame.reserve(kFrameHeaderBytes + payload.size());
  frame.push_back(static_cast<uint8_t>(len & 0xff));
  frame.push_back(static_cast<uint8_t>((len >> 8) & 0xff));
  frame.push_back(static_cast<uint8_t>((len >> 16) & 0xff));
  frame.push_back(static_cast<uint8_t>((len >> 24) & 0xff));
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

std::vector<uint8_t> encodeFrame(const nlohmann::json &message) {
  return encodeFrame(message.dump());
}

uint32_t decodeLength(const uint8_t *header) {
  return static_cast<uint32_t>(header[0]) |
         (static_cast<uint32_t>(header[1]) << 8) |
         (static_cast<uint32_t>(header[2]) << 16) |
         (static_cast<uint32_t>(header[3]) << 24);
}

bool validLength(uint32_t length) {
  return length > 0 && length <= kMaxFrameBytes;
}

bool readExact(int fd, void *buf, size_t n) {
  auto *p = static_cast<uint8_t *>(buf);
  size_t got = 0;
  while (got < n) {
    ssize_t r = ::read(fd, p + got, n - got);
    if (r > 0) {
      got += static_cast<size_t>(r);
    } else if (r == 0) {
      return false;
    } else if (errno != EINTR) {
      return false;
    }
  }
  return true;
}

bool writeAll(int fd, const void *buf, size_t n) {
  const auto *p = static_cast<const uint8_t *>(buf);
  size_t sent = 0;
  while (sent < n) {
    ssize_t w = ::write(fd, p + sent, n - sent);
    if (w > 0) {
      sent += static_cast<size_t>(w);
    } else if (w < 0 && errno == EINTR) {
      continue;
    } else {
      return false;
    }
  }
  return true;
}

FrameStatus FrameReader::next(nlohmann::json &out) {
  uint8_t header[kFrameHeaderBytes];
  if (!readExact(fd_, header, sizeof(header)))
    return FrameStatus::END;

  const uint32_t length = decodeLength(header);
  if (!validLength(length)) {
    // Desynchronized stream: nothing past the header is consumed
    LOG_WARN("Rejected frame with invalid length " + std::to_string(length));
    ++dropped_;
    return FrameStatus::MALFORMED;
  }

  payload_.resize(length);
  if (!readExact(fd_, payload_.data(), length))
    return FrameStatus::END;

  try {
    out = nlohmann::json::parse(payload_);
  } catch (const nlohmann::json::parse_error &e) {
    LOG_WARN("Dropped undecodable frame (" + std::to_string(length) +
             " bytes): " + e.what());
    ++dropped_;
    return FrameStatus::MALFORMED;
  }

  ++decoded_;
  return FrameStatus::OK;
}

} // namespace intentional
