#include "gtest/gtest.h"

#include "test_utils.hpp"

#include "vox/vox_osc.h"

#include <cstring>

namespace {

using vox_test::frame_collector;
using vox_test::make_payload;

class OscTest : public ::testing::Test {
 protected:
  VoxByte buffer_[1024];
};

// ============================================================================
// Serialization
// ============================================================================

TEST_F(OscTest, WriteThenParse) {
  auto payload = make_payload(1, 33);
  VoxInt32 size = sizeof(buffer_);
  ASSERT_EQ(kVoxOk, vox_oscWriteFrame(buffer_, &size, 12, 2, 300, 17,
                                      kVoxFrameKeyFrame | kVoxFrameFragNotEnd,
                                      payload.data(), (VoxInt32)payload.size()));
  EXPECT_EQ(0, std::strncmp((const char *)buffer_, "/vox/12/frame", 13));

  VoxOscFrame frame;
  ASSERT_EQ(kVoxOk, vox_oscParseFrame(buffer_, size, &frame));
  EXPECT_EQ(12, frame.voiceId);
  EXPECT_EQ(2, frame.channelId);
  EXPECT_EQ(300, frame.eventNumber);
  EXPECT_EQ(17, frame.frameNumber);
  EXPECT_EQ((VoxFlag)(kVoxFrameKeyFrame | kVoxFrameFragNotEnd), frame.flags);
  ASSERT_EQ(33, frame.size);
  EXPECT_EQ(0, std::memcmp(payload.data(), frame.data, 33));
}

TEST_F(OscTest, EmptyPayload) {
  VoxInt32 size = sizeof(buffer_);
  ASSERT_EQ(kVoxOk, vox_oscWriteFrame(buffer_, &size, 1, 0, 0, 0, 0, nullptr, 0));
  VoxOscFrame frame;
  ASSERT_EQ(kVoxOk, vox_oscParseFrame(buffer_, size, &frame));
  EXPECT_EQ(0, frame.size);
}

TEST_F(OscTest, BufferTooSmall) {
  auto payload = make_payload(0, 100);
  VoxInt32 size = 64;
  EXPECT_EQ(kVoxErrorInsufficientBuffer,
            vox_oscWriteFrame(buffer_, &size, 1, 0, 0, 0, 0,
                              payload.data(), (VoxInt32)payload.size()));
}

TEST_F(OscTest, RejectsForeignMessage) {
  // "/foo" ",i" 1
  const VoxByte msg[] = { '/', 'f', 'o', 'o', 0, 0, 0, 0,
                          ',', 'i', 0, 0, 0, 0, 0, 1 };
  VoxOscFrame frame;
  EXPECT_EQ(kVoxErrorBadArgument, vox_oscParseFrame(msg, sizeof(msg), &frame));
}

TEST_F(OscTest, RejectsGarbage) {
  const VoxByte msg[] = { 1, 2, 3 };
  VoxOscFrame frame;
  EXPECT_EQ(kVoxErrorBadArgument, vox_oscParseFrame(msg, sizeof(msg), &frame));
}

// ============================================================================
// Receiver binding
// ============================================================================

TEST_F(OscTest, HandleMessageFeedsReceiver) {
  frame_collector decoder;
  VoxReceiverSettings settings;
  VoxReceiverSettings_init(&settings);
  settings.voiceId = 5;
  settings.decoder = &decoder;
  VoxError err;
  auto receiver = VoxReceiver::create(settings, &err);
  ASSERT_TRUE(receiver);

  auto payload = make_payload(2, 10);
  VoxInt32 size = sizeof(buffer_);
  vox_oscWriteFrame(buffer_, &size, 5, 0, 0, 0, 0, payload.data(), 10);
  ASSERT_EQ(kVoxOk, vox_oscHandleMessage(receiver.get(), buffer_, size));
  ASSERT_EQ(1u, decoder.frames.size());
  EXPECT_EQ(payload, decoder.frames[0].data);

  // wrong voice
  size = sizeof(buffer_);
  vox_oscWriteFrame(buffer_, &size, 6, 0, 1, 1, 0, payload.data(), 10);
  EXPECT_EQ(kVoxErrorNotFound, vox_oscHandleMessage(receiver.get(), buffer_, size));
  EXPECT_EQ(1u, decoder.frames.size());

  receiver.reset();
}

}  // namespace
