#ifndef INTENTIONAL_FRAME_CODEC_HPP
#define INTENTIONAL_FRAME_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace intentional {

// Native messaging wire format:
//   [uint32 little-endian length][length bytes of UTF-8 JSON]
constexpr uint32_t kMaxFrameBytes = 1000000;
constexpr size_t kFrameHeaderBytes = 4;

enum class FrameStatus {
  OK,        // one JSON value decoded
  MALFORMED, // bad length (header consumed only) or bad JSON (frame dropped)
  END        // end of stream or read error
};

std::string toString(FrameStatus status);

std::vector<uint8_t> encodeFrame(const std::string &payload);
std::vector<uint8_t> encodeFrame(const nlohmann::json &message);

uint32_t decodeLength(const uint8_t *header);
bool validLength(uint32_t length);

// Reads whole buffers, retrying on EINTR and short reads. Returns false on
// EOF before n bytes or on error.
bool readExact(int fd, void *buf, size_t n);

// Writes the whole buffer. EPIPE surfaces as false.
bool writeAll(int fd, const void *buf, size_t n);

// Blocking frame decoder over a file descriptor.
class FrameReader {
public:
  explicit FrameReader(int fd) : fd_(fd) {}

  FrameStatus next(nlohmann::json &out);

  uint64_t framesDecoded() const { return decoded_; }
  uint64_t framesDropped() const { return dropped_; }

private:
  int fd_;
  uint64_t decoded_ = 0;
  uint64_t dropped_ = 0;
  std::string payload_;
};

} // namespace intentional

#endif // INTENTIONAL_FRAME_CODEC_HPP
