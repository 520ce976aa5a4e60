#include "gtest/gtest.h"

#include "vox/vox.h"
#include "common/utils.hpp"

#include <string>
#include <vector>

namespace {

struct logged_message {
  VoxLogLevel level;
  std::string text;
};

std::vector<logged_message> g_messages;

void VOX_CALL capture_log(VoxLogLevel level, const VoxChar *msg) {
  g_messages.push_back({ level, msg });
}

// ============================================================================
// Logging
// ============================================================================

class LogTest : public ::testing::Test {
 protected:
  void SetUp() override {
    vox_initializeEx(capture_log, nullptr);
    g_messages.clear();
  }
};

TEST_F(LogTest, MessageReachesLogFunction) {
  vox::Log(kVoxLogLevelWarning) << "ring " << 3 << " full";
  ASSERT_EQ(1u, g_messages.size());
  EXPECT_EQ(kVoxLogLevelWarning, g_messages[0].level);
  EXPECT_EQ("ring 3 full", g_messages[0].text);
}

TEST_F(LogTest, LevelsAboveThresholdAreCompiledOut) {
  int evaluated = 0;
  LOG_DEBUG("debug " << ++evaluated);
  LOG_VERBOSE("verbose " << ++evaluated);
  LOG_WARNING("warning " << ++evaluated);
  LOG_ERROR("error " << ++evaluated);

  int expected = 0;
#if VOX_LOG_LEVEL >= 4
  expected++;
#endif
#if VOX_LOG_LEVEL >= 3
  expected++;
#endif
#if VOX_LOG_LEVEL >= 2
  expected++;
#endif
#if VOX_LOG_LEVEL >= 1
  expected++;
#endif
  EXPECT_EQ(expected, evaluated);
  EXPECT_EQ((size_t)expected, g_messages.size());
  for (auto& m : g_messages) {
    EXPECT_LE(m.level, VOX_LOG_LEVEL);
  }
}

// ============================================================================
// Sequence numbers and byte order
// ============================================================================

TEST(SeqDiffTest, WrapsAround) {
  EXPECT_EQ(1, vox::seq_diff(0, 255));
  EXPECT_EQ(-1, vox::seq_diff(255, 0));
  EXPECT_EQ(127, vox::seq_diff(127, 0));
  EXPECT_EQ(-128, vox::seq_diff(128, 0));
  EXPECT_EQ(0, vox::seq_diff(42, 42));
}

TEST(ByteOrderTest, LittleEndian16) {
  VoxByte buf[2];
  vox::write_le16((uint16_t)0x1234, buf);
  EXPECT_EQ(0x34, buf[0]);
  EXPECT_EQ(0x12, buf[1]);
  EXPECT_EQ(0x1234, vox::read_le16(buf));
}

}  // namespace
