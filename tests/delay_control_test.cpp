#include "gtest/gtest.h"

#include "vox/src/delay_control.hpp"
#include "vox/src/spacing_profile.hpp"

#include <thread>

namespace {

using vox::delay_control;

// ============================================================================
// delay_control
// ============================================================================

class DelayControlTest : public ::testing::Test {
 protected:
  delay_control delay_;
};

TEST_F(DelayControlTest, DefaultsToZero) {
  EXPECT_EQ(0, delay_.delay());
  EXPECT_EQ(0, delay_.frames());
  EXPECT_FALSE(delay_.flushing());
}

TEST_F(DelayControlTest, FragmentedStreamWaitsOneFrame) {
  delay_.set_fragmented();
  EXPECT_TRUE(delay_.fragmented());
  EXPECT_EQ(1, delay_.frames());
}

TEST_F(DelayControlTest, ExplicitDelayWins) {
  delay_.set_fragmented();
  delay_.set_delay(4);
  EXPECT_EQ(4, delay_.frames());
}

TEST_F(DelayControlTest, DelayIsClamped) {
  delay_.set_delay(1000);
  EXPECT_EQ(VOX_MAX_DELAY_FRAMES, delay_.delay());

  delay_.set_delay(-3);
  EXPECT_EQ(0, delay_.delay());
}

TEST_F(DelayControlTest, FlushDisablesDelayUntilReached) {
  delay_.set_delay(3);
  delay_.begin_flush(10);
  EXPECT_TRUE(delay_.flushing());
  EXPECT_EQ(0, delay_.frames());

  // reader has not reached the last frame yet
  delay_.check_flush(9);
  EXPECT_TRUE(delay_.flushing());

  delay_.check_flush(10);
  EXPECT_FALSE(delay_.flushing());
  EXPECT_EQ(3, delay_.frames());
}

TEST_F(DelayControlTest, ConstructorDelay) {
  delay_control d(2);
  EXPECT_EQ(2, d.frames());
}

// ============================================================================
// spacing_profile
// ============================================================================

TEST(SpacingProfileTest, IgnoresUpdatesBeforeStart) {
  vox::spacing_profile profile(10);
  profile.update();
  profile.update();
  EXPECT_FALSE(profile.started());
  EXPECT_EQ(0, profile.max());
  EXPECT_EQ("", profile.dump());
}

TEST(SpacingProfileTest, RecordsIntervals) {
  vox::spacing_profile profile(10);
  profile.start();
  profile.update();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  profile.update();

  EXPECT_TRUE(profile.started());
  EXPECT_GE(profile.max(), 15);
  EXPECT_FALSE(profile.dump().empty());
}

}  // namespace
