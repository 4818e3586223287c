#include <gtest/gtest.h>

#include "intentional/frame_codec.hpp"

#include <fcntl.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace intentional;
using json = nlohmann::json;

namespace {

struct Pipe {
  int fds[2] = {-1, -1};
  Pipe() { EXPECT_EQ(::pipe2(fds, O_CLOEXEC), 0); }
  ~Pipe() {
    closeWrite();
    if (fds[0] >= 0)
      ::close(fds[0]);
  }
  int readFd() const { return fds[0]; }
  int writeFd() const { return fds[1]; }
  void closeWrite() {
    if (fds[1] >= 0)
      ::close(fds[1]);
    fds[1] = -1;
  }
  void write(const std::vector<uint8_t> &bytes) {
    ASSERT_TRUE(writeAll(fds[1], bytes.data(), bytes.size()));
  }
};

std::vector<uint8_t> header(uint32_t length) {
  return {static_cast<uint8_t>(length & 0xff),
          static_cast<uint8_t>((length >> 8) & 0xff),
          static_cast<uint8_t>((length >> 16) & 0xff),
          static_cast<uint8_t>((length >> 24) & 0xff)};
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Encoding
// ═══════════════════════════════════════════════════════════════════════════════

TEST(FrameCodec, HeaderIsLittleEndianLength) {
  auto frame = encodeFrame(std::string("{}"));
  ASSERT_EQ(frame.size(), 6u);
  EXPECT_EQ(frame[0], 2);
  EXPECT_EQ(frame[1], 0);
  EXPECT_EQ(frame[2], 0);
  EXPECT_EQ(frame[3], 0);
  EXPECT_EQ(frame[4], '{');
  EXPECT_EQ(frame[5], '}');
}

TEST(FrameCodec, DecodeLengthMultiByte) {
  std::vector<uint8_t> h = header(0x00030201);
  EXPECT_EQ(decodeLength(h.data()), 0x00030201u);
}

TEST(FrameCodec, LengthBounds) {
  EXPECT_FALSE(validLength(0));
  EXPECT_TRUE(validLength(1));
  EXPECT_TRUE(validLength(kMaxFrameBytes));
  EXPECT_FALSE(validLength(kMaxFrameBytes + 1));
  EXPECT_FALSE(validLength(0xffffffffu));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Decoding
// ═══════════════════════════════════════════════════════════════════════════════

TEST(FrameCodec, DecodesWhatWasEncoded) {
  Pipe p;
  json msg = {{"type", "TIME_UPDATE"},
              {"platform", "youtube"},
              {"seconds", 15},
              {"url", "https://www.youtube.com/watch?v=é"}};
  p.write(encodeFrame(msg));
  p.closeWrite();

  FrameReader reader(p.readFd());
  json out;
  ASSERT_EQ(reader.next(out), FrameStatus::OK);
  EXPECT_EQ(out, msg);
  EXPECT_EQ(reader.next(out), FrameStatus::END);
  EXPECT_EQ(reader.framesDecoded(), 1u);
}

TEST(FrameCodec, ZeroLengthRejectedAfterHeaderOnly) {
  Pipe p;
  p.write(header(0));
  p.write(encodeFrame(json{{"type", "PING"}}));
  p.closeWrite();

  FrameReader reader(p.readFd());
  json out;
  EXPECT_EQ(reader.next(out), FrameStatus::MALFORMED);
  // The frame behind the bad header is intact
  ASSERT_EQ(reader.next(out), FrameStatus::OK);
  EXPECT_EQ(out["type"], "PING");
}

TEST(FrameCodec, OversizeLengthRejectedAfterHeaderOnly) {
  Pipe p;
  p.write(header(kMaxFrameBytes + 1));
  p.write(encodeFrame(json{{"type", "GET_STATUS"}}));
  p.closeWrite();

  FrameReader reader(p.readFd());
  json out;
  EXPECT_EQ(reader.next(out), FrameStatus::MALFORMED);
  ASSERT_EQ(reader.next(out), FrameStatus::OK);
  EXPECT_EQ(out["type"], "GET_STATUS");
  EXPECT_EQ(reader.framesDropped(), 1u);
}

TEST(FrameCodec, UndecodableJsonIsDropped) {
  Pipe p;
  p.write(encodeFrame(std::string("{not json")));
  p.write(encodeFrame(json{{"type", "PING"}}));
  p.closeWrite();

  FrameReader reader(p.readFd());
  json out;
  EXPECT_EQ(reader.next(out), FrameStatus::MALFORMED);
  ASSERT_EQ(reader.next(out), FrameStatus::OK);
  EXPECT_EQ(out["type"], "PING");
  EXPECT_EQ(reader.framesDecoded(), 1u);
  EXPECT_EQ(reader.framesDropped(), 1u);
}

TEST(FrameCodec, InvalidUtf8IsDropped) {
  Pipe p;
  p.write(encodeFrame(std::string("\"\xff\xfe\"")));
  p.closeWrite();

  FrameReader reader(p.readFd());
  json out;
  EXPECT_EQ(reader.next(out), FrameStatus::MALFORMED);
  EXPECT_EQ(reader.next(out), FrameStatus::END);
}

TEST(FrameCodec, TruncatedPayloadEndsStream) {
  Pipe p;
  auto frame = encodeFrame(json{{"type", "PING"}});
  frame.resize(frame.size() - 3);
  p.write(frame);
  p.closeWrite();

  FrameReader reader(p.readFd());
  json out;
  EXPECT_EQ(reader.next(out), FrameStatus::END);
}

TEST(FrameCodec, PartialHeaderEndsStream) {
  Pipe p;
  p.write({0x05, 0x00});
  p.closeWrite();

  FrameReader reader(p.readFd());
  json out;
  EXPECT_EQ(reader.next(out), FrameStatus::END);
}

TEST(FrameCodec, ReassemblesFramesSplitAcrossWrites) {
  int sv[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv), 0);

  json msg = {{"type", "SESSION_START"},
              {"platform", "instagram"},
              {"browser", "Firefox"}};
  auto frame = encodeFrame(msg);

  std::thread writer([&] {
    for (uint8_t byte : frame) {
      EXPECT_TRUE(writeAll(sv[1], &byte, 1));
      std::this_thread::sleep_for(std::chrono::microseconds(200));
    }
    ::close(sv[1]);
  });

  FrameReader reader(sv[0]);
  json out;
  EXPECT_EQ(reader.next(out), FrameStatus::OK);
  EXPECT_EQ(out, msg);
  EXPECT_EQ(reader.next(out), FrameStatus::END);

  writer.join();
  ::close(sv[0]);
}

TEST(FrameCodec, LargestFrameIsAccepted) {
  int sv[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv), 0);

  // A JSON string whose encoding is exactly kMaxFrameBytes long
  std::string payload = "\"" + std::string(kMaxFrameBytes - 2, 'a') + "\"";
  auto frame = encodeFrame(payload);
  ASSERT_EQ(frame.size(), kFrameHeaderBytes + kMaxFrameBytes);

  std::thread writer([&] {
    EXPECT_TRUE(writeAll(sv[1], frame.data(), frame.size()));
    ::close(sv[1]);
  });

  FrameReader reader(sv[0]);
  json out;
  ASSERT_EQ(reader.next(out), FrameStatus::OK);
  ASSERT_TRUE(out.is_string());
  EXPECT_EQ(out.get<std::string>().size(), kMaxFrameBytes - 2);

  writer.join();
  ::close(sv[0]);
}
