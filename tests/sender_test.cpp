#include "gtest/gtest.h"

#include "test_utils.hpp"

#include <algorithm>

namespace {

using vox_test::captured_event;
using vox_test::event_capture;
using vox_test::make_payload;

class SenderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    vox_initialize();
    VoxSenderSettings_init(&settings_);
    settings_.voiceId = 7;
    settings_.channelId = 1;
  }

  void Create() {
    VoxError err;
    sender_ = VoxSender::create(settings_, &err);
    ASSERT_TRUE(sender_);
    ASSERT_EQ(kVoxOk, err);
  }

  VoxError Send(const std::vector<VoxByte>& data, VoxFlag flags = 0) {
    return sender_->sendFrame(data.data(), (VoxInt32)data.size(), flags,
                              event_capture::send, &capture_);
  }

  VoxSenderSettings settings_;
  VoxSender::Ptr sender_;
  event_capture capture_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(SenderTest, DefaultEventBufferSize) {
  Create();
  int32_t size = 0;
  ASSERT_EQ(kVoxOk, sender_->getEventBufferSize(size));
  EXPECT_EQ(VOX_EVENT_BUFFER_SIZE, size);
}

TEST_F(SenderTest, RejectsBadEventBufferSize) {
  VoxError err = kVoxOk;
  settings_.eventBufferSize = VOX_MAX_EVENT_BUFFER_SIZE + 1;
  EXPECT_EQ(nullptr, VoxSender_new(&settings_, &err));
  EXPECT_EQ(kVoxErrorBadArgument, err);

  settings_.eventBufferSize = -1;
  EXPECT_EQ(nullptr, VoxSender_new(&settings_, &err));
  EXPECT_EQ(kVoxErrorBadArgument, err);
}

TEST_F(SenderTest, AcceptsBufferSizeLimits) {
  settings_.eventBufferSize = 1;
  Create();
  settings_.eventBufferSize = VOX_MAX_EVENT_BUFFER_SIZE;
  Create();
}

TEST_F(SenderTest, ClampsFecGroupSize) {
  settings_.eventBufferSize = 4;
  Create();
  ASSERT_EQ(kVoxOk, sender_->setFec(10));
  int32_t fec = 0;
  sender_->getFec(fec);
  EXPECT_EQ(3, fec);
}

// ============================================================================
// Numbering
// ============================================================================

TEST_F(SenderTest, EventNumbersWrapAroundRing) {
  settings_.eventBufferSize = 4;
  Create();
  for (int i = 0; i < 10; ++i) {
    ASSERT_EQ(kVoxOk, Send(make_payload(i, 8)));
  }

  ASSERT_EQ(10u, capture_.events.size());
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(i % 4, capture_.events[i].event);
    EXPECT_EQ(i, capture_.events[i].frame);
    EXPECT_EQ(7, capture_.events[i].voice);
    EXPECT_EQ(1, capture_.events[i].channel);
  }
}

TEST_F(SenderTest, FrameNumberWrapsAt256) {
  Create();
  for (int i = 0; i < 258; ++i) {
    Send(make_payload(i, 1));
  }
  EXPECT_EQ(255, capture_.events[255].frame);
  EXPECT_EQ(0, capture_.events[256].frame);
  EXPECT_EQ(1, capture_.events[257].frame);
}

TEST_F(SenderTest, StripsTransportFlags) {
  Create();
  Send(make_payload(0, 4), kVoxFrameFEC | kVoxFrameFragNotBeg | kVoxFrameKeyFrame);
  ASSERT_EQ(1u, capture_.events.size());
  EXPECT_EQ(kVoxFrameKeyFrame, capture_.events[0].flags);
}

TEST_F(SenderTest, RejectsBadArguments) {
  Create();
  EXPECT_EQ(kVoxErrorBadArgument,
            sender_->sendFrame(nullptr, 4, 0, event_capture::send, &capture_));
  auto data = make_payload(0, 4);
  EXPECT_EQ(kVoxErrorBadArgument,
            sender_->sendFrame(data.data(), 4, 0, nullptr, nullptr));
  EXPECT_TRUE(capture_.events.empty());
}

// ============================================================================
// Fragmentation
// ============================================================================

TEST_F(SenderTest, FragmentLayoutOneByteCount) {
  settings_.fragment = kVoxTrue;
  settings_.maxPayloadSize = 100;
  Create();
  auto data = make_payload(3, 250);
  ASSERT_EQ(kVoxOk, Send(data, kVoxFrameKeyFrame));

  ASSERT_EQ(3u, capture_.events.size());
  auto& first = capture_.events[0];
  auto& second = capture_.events[1];
  auto& last = capture_.events[2];

  EXPECT_EQ(100u, first.data.size());
  EXPECT_EQ(99u, second.data.size());
  EXPECT_EQ(52u, last.data.size());

  EXPECT_EQ(kVoxFrameKeyFrame | kVoxFrameFragNotEnd, first.flags);
  EXPECT_EQ(kVoxFrameKeyFrame | kVoxFrameFragNotBeg | kVoxFrameFragNotEnd, second.flags);
  EXPECT_EQ(kVoxFrameKeyFrame | kVoxFrameFragNotBeg, last.flags);

  // fragment count after the payload of the first fragment
  EXPECT_EQ(3, first.data[99]);
  EXPECT_TRUE(std::equal(data.begin(), data.begin() + 99, first.data.begin()));
  EXPECT_TRUE(std::equal(data.begin() + 99, data.begin() + 198, second.data.begin()));
  EXPECT_TRUE(std::equal(data.begin() + 198, data.end(), last.data.begin()));

  for (auto& e : capture_.events) {
    EXPECT_EQ(0, e.frame);
  }
  EXPECT_EQ(0, first.event);
  EXPECT_EQ(1, second.event);
  EXPECT_EQ(2, last.event);

  VoxSenderStats stats;
  sender_->getStats(stats);
  EXPECT_EQ(1, stats.framesSent);
  EXPECT_EQ(1, stats.framesSentFragmented);
  EXPECT_EQ(3, stats.framesSentFragments);
  EXPECT_EQ(3, stats.eventsSent);
}

TEST_F(SenderTest, FragmentLayoutTwoByteCount) {
  settings_.eventBufferSize = 512;
  settings_.fragment = kVoxTrue;
  settings_.maxPayloadSize = 100;
  Create();
  ASSERT_EQ(kVoxOk, Send(make_payload(0, 250)));

  ASSERT_EQ(3u, capture_.events.size());
  auto& first = capture_.events[0];
  ASSERT_EQ(100u, first.data.size());
  EXPECT_EQ(3, first.data[98]);  // lsb
  EXPECT_EQ(0, first.data[99]);  // msb
  EXPECT_EQ(98u, capture_.events[1].data.size());
  EXPECT_EQ(54u, capture_.events[2].data.size());
}

TEST_F(SenderTest, EndOfStreamOnlyOnLastFragment) {
  settings_.fragment = kVoxTrue;
  settings_.maxPayloadSize = 50;
  Create();
  Send(make_payload(0, 120), kVoxFrameEndOfStream);

  ASSERT_EQ(3u, capture_.events.size());
  EXPECT_FALSE(capture_.events[0].flags & kVoxFrameEndOfStream);
  EXPECT_FALSE(capture_.events[1].flags & kVoxFrameEndOfStream);
  EXPECT_TRUE(capture_.events[2].flags & kVoxFrameEndOfStream);
}

TEST_F(SenderTest, NoFragmentationWhenDisabled) {
  settings_.maxPayloadSize = 100;
  Create();
  Send(make_payload(0, 250));
  ASSERT_EQ(1u, capture_.events.size());
  EXPECT_EQ(250u, capture_.events[0].data.size());
}

TEST_F(SenderTest, SmallFrameIsNotFragmented) {
  settings_.fragment = kVoxTrue;
  settings_.maxPayloadSize = 100;
  Create();
  Send(make_payload(0, 100));
  ASSERT_EQ(1u, capture_.events.size());
  EXPECT_EQ(0u, capture_.events[0].flags & kVoxFrameMaskFrag);
}

TEST_F(SenderTest, RejectsTooManyFragments) {
  settings_.eventBufferSize = 4;
  settings_.fragment = kVoxTrue;
  settings_.maxPayloadSize = 11;
  Create();
  EXPECT_EQ(kVoxErrorOverflow, Send(make_payload(0, 100)));
  EXPECT_TRUE(capture_.events.empty());
}

TEST_F(SenderTest, ConfigFrameIsNeverFragmented) {
  settings_.fragment = kVoxTrue;
  settings_.maxPayloadSize = 10;
  Create();
  Send(make_payload(0, 50), kVoxFrameConfig);
  ASSERT_EQ(1u, capture_.events.size());
  EXPECT_EQ(kVoxFrameConfig, capture_.events[0].flags);
}

// ============================================================================
// FEC
// ============================================================================

TEST_F(SenderTest, FecTrailerLayout) {
  settings_.fec = 2;
  Create();
  std::vector<VoxByte> a(10, 0x11);
  std::vector<VoxByte> b(20, 0x22);
  Send(a);
  Send(b, kVoxFrameKeyFrame);

  ASSERT_EQ(3u, capture_.events.size());
  auto& fec = capture_.events[2];
  EXPECT_EQ(kVoxFrameFEC, fec.flags);
  // uses the next event number without advancing it
  EXPECT_EQ(2, fec.event);
  EXPECT_EQ(2, fec.frame);
  ASSERT_EQ(25u, fec.data.size());

  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(0x33, fec.data[i]);
  }
  for (int i = 10; i < 20; ++i) {
    EXPECT_EQ(0x22, fec.data[i]);
  }
  EXPECT_EQ(0 ^ 1, fec.data[20]);              // frame numbers
  EXPECT_EQ(kVoxFrameKeyFrame, fec.data[21]);  // flags
  EXPECT_EQ(30, fec.data[22]);                 // size lsb
  EXPECT_EQ(0, fec.data[23]);                  // size msb
  EXPECT_EQ(0, fec.data[24]);                  // start event

  // the next regular event gets the number of the FEC event
  Send(a);
  EXPECT_EQ(2, capture_.events[3].event);

  VoxSenderStats stats;
  sender_->getStats(stats);
  EXPECT_EQ(1, stats.fecEventsSent);
}

TEST_F(SenderTest, FecStartEventWrapsAround) {
  settings_.eventBufferSize = 512;
  settings_.fec = 3;
  Create();
  for (int i = 0; i < 510; ++i) {
    Send(make_payload(i, 4));
  }
  capture_.events.clear();
  // events 510, 511 and 0 form a group
  Send(make_payload(0, 4));
  Send(make_payload(1, 4));
  Send(make_payload(2, 4));

  auto it = std::find_if(capture_.events.begin(), capture_.events.end(),
                         [](const captured_event& e) { return e.flags & kVoxFrameFEC; });
  ASSERT_NE(capture_.events.end(), it);
  ASSERT_EQ(4u + 6u, it->data.size());
  EXPECT_EQ(1, it->event);
  EXPECT_EQ(510 & 0xff, it->data[8]);
  EXPECT_EQ(510 >> 8, it->data[9]);
}

TEST_F(SenderTest, FecDisabledMidGroup) {
  settings_.fec = 3;
  Create();
  Send(make_payload(0, 4));
  sender_->setFec(0);
  Send(make_payload(1, 4));
  sender_->setFec(2);
  Send(make_payload(2, 4));
  Send(make_payload(3, 4));

  ASSERT_EQ(5u, capture_.events.size());
  auto& fec = capture_.events[4];
  ASSERT_EQ(kVoxFrameFEC, fec.flags);
  // covers only the last two frames
  EXPECT_EQ(2, fec.data[8]);
  EXPECT_EQ(2 ^ 3, fec.data[4]);
}

// ============================================================================
// Config frames
// ============================================================================

TEST_F(SenderTest, IdenticalConfigIsSuppressed) {
  Create();
  auto config = make_payload(9, 12);
  EXPECT_EQ(kVoxOk, Send(config, kVoxFrameConfig));
  EXPECT_EQ(kVoxOk, Send(config, kVoxFrameConfig));
  EXPECT_EQ(1u, capture_.events.size());

  auto other = make_payload(10, 12);
  Send(other, kVoxFrameConfig);
  EXPECT_EQ(2u, capture_.events.size());
}

TEST_F(SenderTest, SendConfigResendsStoredConfig) {
  Create();
  EXPECT_EQ(kVoxErrorNotFound, sender_->sendConfig(event_capture::send, &capture_));

  auto config = make_payload(1, 5);
  Send(config, kVoxFrameConfig);
  ASSERT_EQ(kVoxOk, sender_->sendConfig(event_capture::send, &capture_));

  ASSERT_EQ(2u, capture_.events.size());
  EXPECT_EQ(config, capture_.events[1].data);
  EXPECT_EQ(kVoxFrameConfig, capture_.events[1].flags);
  EXPECT_EQ(1, capture_.events[1].frame);
}

// ============================================================================
// Parts
// ============================================================================

TEST_F(SenderTest, PartFlags) {
  settings_.partSize = 100;
  Create();
  auto data = make_payload(0, 250);
  Send(data, kVoxFrameEndOfStream);

  ASSERT_EQ(3u, capture_.events.size());
  EXPECT_EQ(kVoxFramePartNotEnd, capture_.events[0].flags);
  EXPECT_EQ(kVoxFramePartNotBeg | kVoxFramePartNotEnd, capture_.events[1].flags);
  EXPECT_EQ(kVoxFramePartNotBeg | kVoxFrameEndOfStream, capture_.events[2].flags);
  EXPECT_EQ(0, capture_.events[0].frame);
  EXPECT_EQ(1, capture_.events[1].frame);
  EXPECT_EQ(2, capture_.events[2].frame);
  EXPECT_EQ(50u, capture_.events[2].data.size());
}

// ============================================================================
// Transmission state
// ============================================================================

TEST_F(SenderTest, ZeroLengthFrameDoesNotCountAsTransmitting) {
  Create();
  ASSERT_EQ(kVoxOk, sender_->sendFrame(nullptr, 0, 0, event_capture::send, &capture_));
  ASSERT_EQ(1u, capture_.events.size());
  EXPECT_TRUE(capture_.events[0].data.empty());

  VoxBool transmitting = kVoxTrue;
  sender_->isTransmitting(transmitting);
  EXPECT_FALSE(transmitting);

  Send(make_payload(0, 4));
  sender_->isTransmitting(transmitting);
  EXPECT_TRUE(transmitting);
}

TEST_F(SenderTest, TransmitDisabledSkipsFrames) {
  Create();
  sender_->setTransmitEnabled(false);
  EXPECT_EQ(kVoxErrorIdle, Send(make_payload(0, 4)));
  EXPECT_EQ(kVoxErrorIdle, Send(make_payload(1, 4), kVoxFrameConfig));
  EXPECT_TRUE(capture_.events.empty());

  VoxSenderStats stats;
  sender_->getStats(stats);
  EXPECT_EQ(2, stats.framesSkipped);

  // the config frame has been stored anyway
  sender_->setTransmitEnabled(true);
  ASSERT_EQ(kVoxOk, sender_->sendConfig(event_capture::send, &capture_));
  ASSERT_EQ(1u, capture_.events.size());
  EXPECT_EQ(make_payload(1, 4), capture_.events[0].data);
}

TEST_F(SenderTest, SendParamsArePassedThrough) {
  Create();
  VoxSendParams params;
  params.reliable = kVoxTrue;
  params.encrypt = kVoxFalse;
  params.interestGroup = 5;
  sender_->setSendParams(params);
  Send(make_payload(0, 4));

  ASSERT_EQ(1u, capture_.events.size());
  EXPECT_EQ(kVoxTrue, capture_.events[0].params.reliable);
  EXPECT_EQ(5, capture_.events[0].params.interestGroup);
}

}  // namespace
