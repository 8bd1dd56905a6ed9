#include <stdio.h>

#include <string>

#include "protocol/ws_frame.h"
#include "protocol/ws_handshake.h"
#include "test_support.h"

using namespace rpc::ws;

static void test_rfc6455_accept_key() {
  // Sample from RFC 6455 section 1.3.
  TEST_ASSERT_EQ_STR(computeAcceptKey("dGhlIHNhbXBsZSBub25jZQ=="), "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
  TEST_ASSERT_EQ_UINT(generateClientKey().size(), 24);
  TEST_CASE_OK("rfc6455_accept_key");
}

static void test_upgrade_request_round_trip() {
  const std::string wire = buildUpgradeRequest("127.0.0.1", 4567, "/abc", "dGhlIHNhbXBsZSBub25jZQ==");
  const size_t end = findHeaderEnd(wire);
  TEST_ASSERT_EQ_UINT(end, wire.size());
  HttpRequest request;
  TEST_ASSERT(parseRequestHead(wire.substr(0, end), request));
  TEST_ASSERT_EQ_STR(request.method, "GET");
  TEST_ASSERT_EQ_STR(request.path, "/abc");
  TEST_ASSERT(isUpgradeRequest(request));
  TEST_ASSERT_EQ_STR(request.header("Sec-WebSocket-Key"), "dGhlIHNhbXBsZSBub25jZQ==");

  HttpRequest plain;
  TEST_ASSERT(parseRequestHead("GET / HTTP/1.1\r\nHost: x\r\n\r\n", plain));
  TEST_ASSERT(!isUpgradeRequest(plain));
  TEST_ASSERT_EQ_UINT(findHeaderEnd("GET / HTTP/1.1\r\nHost: x\r\n"), 0);
  TEST_CASE_OK("upgrade_request_round_trip");
}

static void test_upgrade_response_validation() {
  const std::string key = "dGhlIHNhbXBsZSBub25jZQ==";
  HttpResponse response;
  TEST_ASSERT(parseResponseHead(buildUpgradeResponse(computeAcceptKey(key)), response));
  TEST_ASSERT(validateUpgradeResponse(response, key));
  TEST_ASSERT(!validateUpgradeResponse(response, "b3RoZXIga2V5IGhlcmUhIQ=="));

  HttpResponse conflict;
  TEST_ASSERT(parseResponseHead(buildConflictResponse(), conflict));
  TEST_ASSERT_EQ_UINT(conflict.status, 409);
  TEST_ASSERT(!validateUpgradeResponse(conflict, key));

  HttpResponse health;
  const std::string text = buildHealthResponse("1.0");
  TEST_ASSERT(parseResponseHead(text.substr(0, findHeaderEnd(text)), health));
  TEST_ASSERT_EQ_UINT(health.status, 200);
  TEST_ASSERT(text.find("\"status\":\"ok\"") != std::string::npos);
  TEST_CASE_OK("upgrade_response_validation");
}

static void test_channel_path() {
  TEST_ASSERT_EQ_STR(channelPath(""), "/");
  TEST_ASSERT_EQ_STR(channelPath("abc"), "/abc");
  TEST_ASSERT_EQ_STR(channelPath("/abc"), "/abc");
  TEST_CASE_OK("channel_path");
}

static void test_masked_frame_parses_back() {
  const std::string payload = "{\"id\":\"1\"}";
  const std::string wire = FrameBuilder::buildText(payload, true);
  TEST_ASSERT((static_cast<uint8_t>(wire[1]) & kMaskBit) != 0);
  FrameParser parser;
  parser.feed(wire.data(), wire.size());
  Frame frame;
  TEST_ASSERT(parser.next(frame));
  TEST_ASSERT(frame.opcode == Opcode::TEXT);
  TEST_ASSERT_EQ_STR(frame.payload, payload);
  TEST_ASSERT(!parser.next(frame));
  TEST_CASE_OK("masked_frame_parses_back");
}

static void test_extended_lengths_and_byte_feeding() {
  const std::string medium(300, 'm');
  const std::string large(70000, 'L');
  std::string wire = FrameBuilder::buildText(medium, false) + FrameBuilder::buildText(large, true);
  FrameParser parser;
  Frame frame;
  size_t frames = 0;
  for (size_t i = 0; i < wire.size(); ++i) {
    parser.feed(&wire[i], 1);
    while (parser.next(frame)) {
      ++frames;
      TEST_ASSERT_EQ_UINT(frame.payload.size(), frames == 1 ? medium.size() : large.size());
    }
  }
  TEST_ASSERT_EQ_UINT(frames, 2);
  TEST_ASSERT(!parser.hasError());
  TEST_CASE_OK("extended_lengths_and_byte_feeding");
}

static void test_fragments_reassemble_around_control_frames() {
  // "Hel" (TEXT, !FIN) + PING + "lo" (CONTINUATION, FIN)
  std::string wire;
  wire.push_back(static_cast<char>(0x01));
  wire.push_back(static_cast<char>(0x03));
  wire += "Hel";
  wire += FrameBuilder::build(Opcode::PING, "p", false);
  wire.push_back(static_cast<char>(0x80));
  wire.push_back(static_cast<char>(0x02));
  wire += "lo";

  FrameParser parser;
  parser.feed(wire.data(), wire.size());
  Frame frame;
  TEST_ASSERT(parser.next(frame));
  TEST_ASSERT(frame.opcode == Opcode::PING);
  TEST_ASSERT(parser.next(frame));
  TEST_ASSERT(frame.opcode == Opcode::TEXT);
  TEST_ASSERT_EQ_STR(frame.payload, "Hello");
  TEST_CASE_OK("fragments_reassemble_around_control_frames");
}

static void test_protocol_violations() {
  FrameParser reserved;
  const char rsv[] = {static_cast<char>(0xC1), 0x00};
  reserved.feed(rsv, sizeof(rsv));
  Frame frame;
  TEST_ASSERT(!reserved.next(frame));
  TEST_ASSERT(reserved.error() == FrameError::RESERVED_BITS);

  FrameParser continuation;
  const char cont[] = {static_cast<char>(0x80), 0x00};
  continuation.feed(cont, sizeof(cont));
  TEST_ASSERT(!continuation.next(frame));
  TEST_ASSERT(continuation.error() == FrameError::UNEXPECTED_CONTINUATION);

  FrameParser small(16);
  const std::string big = FrameBuilder::buildText(std::string(17, 'x'), false);
  small.feed(big.data(), big.size());
  TEST_ASSERT(!small.next(frame));
  TEST_ASSERT(small.error() == FrameError::OVERSIZED);
  small.reset();
  TEST_ASSERT(!small.hasError());

  FrameParser control;
  const std::string long_ping = FrameBuilder::build(Opcode::PING, std::string(126, 'p'), false);
  control.feed(long_ping.data(), long_ping.size());
  TEST_ASSERT(!control.next(frame));
  TEST_ASSERT(control.error() == FrameError::BAD_CONTROL_FRAME);
  TEST_CASE_OK("protocol_violations");
}

static void test_close_frame_code() {
  const std::string wire = FrameBuilder::buildClose(1000, false);
  FrameParser parser;
  parser.feed(wire.data(), wire.size());
  Frame frame;
  TEST_ASSERT(parser.next(frame));
  TEST_ASSERT(frame.opcode == Opcode::CLOSE);
  TEST_ASSERT_EQ_UINT(closeCode(frame.payload), 1000);
  TEST_ASSERT_EQ_UINT(closeCode(""), 0);
  TEST_CASE_OK("close_frame_code");
}

int main() {
  test_rfc6455_accept_key();
  test_upgrade_request_round_trip();
  test_upgrade_response_validation();
  test_channel_path();
  test_masked_frame_parses_back();
  test_extended_lengths_and_byte_feeding();
  test_fragments_reassemble_around_control_frames();
  test_protocol_violations();
  test_close_frame_code();
  return 0;
}
