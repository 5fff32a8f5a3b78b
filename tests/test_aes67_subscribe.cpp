// Tests for the AES67 subscribe frame and its request/response exchange.
#include "dante/protocol.h"

#include "fake_device.h"

#include <gtest/gtest.h>

namespace {

dante::Aes67Stream StudioStream() {
  dante::Aes67Stream stream;
  stream.session_name = "Studio1";
  stream.session_id = "821074694";
  stream.origin_ip = "10.11.7.75";
  stream.multicast_addr = "239.69.85.220";
  stream.port = 5004;
  stream.codec = "L24/48000/2";
  stream.channels = 2;
  stream.channel_names = {"Tx Left", "Tx Right"};
  return stream;
}

uint16_t Be16(const std::vector<uint8_t>& frame, size_t offset) {
  return static_cast<uint16_t>((frame[offset] << 8) | frame[offset + 1]);
}

uint32_t Be32(const std::vector<uint8_t>& frame, size_t offset) {
  return (static_cast<uint32_t>(frame[offset]) << 24) |
         (static_cast<uint32_t>(frame[offset + 1]) << 16) |
         (static_cast<uint32_t>(frame[offset + 2]) << 8) | frame[offset + 3];
}

}  // namespace

TEST(Aes67FrameTest, BuildsStudioSubscribeFrame) {
  std::vector<uint8_t> frame;
  dante::Error error;
  ASSERT_TRUE(dante::Aes67SubscriptionClient::BuildSubscribeFrame(0x0042, 3, 2, StudioStream(),
                                                                  &frame, &error))
      << error.message;
  ASSERT_EQ(frame.size(), 112u);
  EXPECT_EQ(Be16(frame, 0), 0x2809);
  EXPECT_EQ(Be16(frame, 2), 112);
  EXPECT_EQ(Be16(frame, 4), 0x0042);
  EXPECT_EQ(Be16(frame, 6), 0x3201);
  EXPECT_EQ(Be16(frame, 18), 0x4202);
  EXPECT_EQ(frame[44], 10);
  EXPECT_EQ(frame[45], 11);
  EXPECT_EQ(frame[46], 7);
  EXPECT_EQ(frame[47], 75);
  EXPECT_EQ(Be32(frame, 76), 821074694u);
  EXPECT_EQ(Be16(frame, 96), 0x0003);
  EXPECT_EQ(Be16(frame, 98), 2);
  EXPECT_EQ(frame[102], 0x02);
  EXPECT_EQ(frame[104], 0x08);
  EXPECT_EQ(frame[105], 2);
  EXPECT_EQ(Be16(frame, 106), 5004);
  EXPECT_EQ(frame[108], 239);
  EXPECT_EQ(frame[109], 69);
  EXPECT_EQ(frame[110], 85);
  EXPECT_EQ(frame[111], 220);

  // Everything outside the listed fields is zero.
  const std::vector<std::pair<size_t, size_t>> fields = {
      {0, 8}, {18, 20}, {44, 48}, {76, 80}, {96, 100}, {102, 103}, {104, 112}};
  for (size_t i = 0; i < frame.size(); ++i) {
    bool in_field = false;
    for (const auto& field : fields) {
      in_field = in_field || (i >= field.first && i < field.second);
    }
    if (!in_field) {
      EXPECT_EQ(frame[i], 0) << "byte " << i;
    }
  }
}

TEST(Aes67FrameTest, FlowIdKeepsLow32Bits) {
  auto stream = StudioStream();
  stream.session_id = "4294967297";
  std::vector<uint8_t> frame;
  ASSERT_TRUE(dante::Aes67SubscriptionClient::BuildSubscribeFrame(1, 1, 1, stream, &frame));
  EXPECT_EQ(Be32(frame, 76), 1u);
}

TEST(Aes67FrameTest, EncodingFollowsCodecPrefix) {
  using dante::Aes67Encoding;
  using dante::Aes67SubscriptionClient;
  EXPECT_EQ(Aes67SubscriptionClient::EncodingForCodec("L16/48000/2"), Aes67Encoding::kL16);
  EXPECT_EQ(Aes67SubscriptionClient::EncodingForCodec("L24/96000/8"), Aes67Encoding::kL24);
  EXPECT_EQ(Aes67SubscriptionClient::EncodingForCodec("L32/48000/2"), Aes67Encoding::kL32);
  EXPECT_EQ(Aes67SubscriptionClient::EncodingForCodec("AM824/48000/2"), Aes67Encoding::kL24);
  EXPECT_EQ(Aes67SubscriptionClient::EncodingForCodec(""), Aes67Encoding::kL24);
}

TEST(Aes67FrameTest, RejectsUnencodableInput) {
  std::vector<uint8_t> frame;
  dante::Error error;
  EXPECT_FALSE(dante::Aes67SubscriptionClient::BuildSubscribeFrame(1, 1, 3, StudioStream(),
                                                                   &frame, &error));
  EXPECT_EQ(error.code, dante::ErrorCode::kInvalidArgument);

  auto ipv6 = StudioStream();
  ipv6.multicast_addr = "ff02::1";
  EXPECT_FALSE(dante::Aes67SubscriptionClient::BuildSubscribeFrame(1, 1, 1, ipv6, &frame));

  auto text_id = StudioStream();
  text_id.session_id = "abc";
  EXPECT_FALSE(dante::Aes67SubscriptionClient::BuildSubscribeFrame(1, 1, 1, text_id, &frame));

  EXPECT_FALSE(dante::Aes67SubscriptionClient::BuildSubscribeFrame(1, 0, 1, StudioStream(),
                                                                   &frame));
}

TEST(Aes67SubscribeTest, EchoedResponseSucceeds) {
  dante_test::FakeDevice device(dante_test::FakeDeviceState{});
  dante::ClientOptions options;
  options.request_timeout = std::chrono::milliseconds(200);
  dante::Aes67SubscriptionClient client(options, device.port());

  dante::Error error;
  ASSERT_TRUE(client.Subscribe(device.endpoint("rx"), 3, StudioStream(), 2, &error))
      << error.message;
  const auto sent = device.last_aes67_frame();
  ASSERT_EQ(sent.size(), 112u);
  EXPECT_EQ(Be16(sent, 96), 3);
  EXPECT_EQ(sent[102], 2);
}

TEST(Aes67SubscribeTest, SequenceIncrementsPerRequest) {
  dante_test::FakeDevice device(dante_test::FakeDeviceState{});
  dante::ClientOptions options;
  options.request_timeout = std::chrono::milliseconds(200);
  dante::Aes67SubscriptionClient client(options, device.port());
  ASSERT_TRUE(client.Subscribe(device.endpoint("rx"), 1, StudioStream(), 1));
  ASSERT_TRUE(client.Subscribe(device.endpoint("rx"), 2, StudioStream(), 2));
  const auto sequences = device.sequences();
  ASSERT_EQ(sequences.size(), 2u);
  EXPECT_EQ(static_cast<uint16_t>(sequences[0] + 1), sequences[1]);
}

TEST(Aes67SubscribeTest, WrongEchoIsCommandFailure) {
  dante_test::FakeDevice device(dante_test::FakeDeviceState{});
  device.SetMode(dante_test::FakeMode::kReject);
  dante::ClientOptions options;
  options.request_timeout = std::chrono::milliseconds(200);
  dante::Aes67SubscriptionClient client(options, device.port());

  dante::Error error;
  EXPECT_FALSE(client.Subscribe(device.endpoint("rx"), 3, StudioStream(), 2, &error));
  EXPECT_EQ(error.code, dante::ErrorCode::kCommandFailure);
}

TEST(Aes67SubscribeTest, SilenceIsTimeoutAfterRetry) {
  dante_test::FakeDevice device(dante_test::FakeDeviceState{});
  device.SetMode(dante_test::FakeMode::kSilent);
  dante::ClientOptions options;
  options.request_timeout = std::chrono::milliseconds(50);
  dante::Aes67SubscriptionClient client(options, device.port());

  dante::Error error;
  EXPECT_FALSE(client.Subscribe(device.endpoint("rx"), 3, StudioStream(), 2, &error));
  EXPECT_EQ(error.code, dante::ErrorCode::kTimeout);
  // Wait for the fake to record the retry.
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(device.CountCommand(dante::Command::kAes67Subscribe), 2u);
}
