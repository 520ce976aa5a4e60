#include "gtest/gtest.h"

#include "vox/src/event_ring.hpp"
#include "vox/src/frame_buffer.hpp"

#include <atomic>
#include <cstring>
#include <thread>
#include <vector>

namespace {

using vox::assembly_pool;
using vox::buffer_pool;
using vox::event_ring;
using vox::frame_buffer;

// ============================================================================
// buffer_pool
// ============================================================================

class BufferPoolTest : public ::testing::Test {
 protected:
  buffer_pool pool_;
};

TEST_F(BufferPoolTest, AcquireSetsMetadata) {
  auto buf = pool_.acquire(16, kVoxFrameKeyFrame, 42);

  ASSERT_FALSE(buf.empty());
  EXPECT_EQ(16, buf.size());
  EXPECT_EQ(kVoxFrameKeyFrame, buf.flags());
  EXPECT_EQ(42, buf.frame_number());
  EXPECT_EQ(1, buf.block()->refcount.load());

  buf.release();
  EXPECT_TRUE(buf.empty());
}

TEST_F(BufferPoolTest, RetainKeepsBlockAlive) {
  auto buf = pool_.acquire(4, 0, 0);
  std::memcpy(buf.data(), "abcd", 4);

  auto copy = buf;  // plain handle, no retain
  copy.retain();
  EXPECT_EQ(2, buf.block()->refcount.load());

  buf.release();
  EXPECT_EQ(1, copy.block()->refcount.load());
  EXPECT_EQ(0, std::memcmp(copy.data(), "abcd", 4));

  copy.release();
}

TEST_F(BufferPoolTest, RebindSharesBlock) {
  auto buf = pool_.acquire(8, kVoxFrameFEC, 1);
  auto other = buf.rebind(3, kVoxFrameKeyFrame, 7);

  EXPECT_EQ(buf.block(), other.block());
  EXPECT_EQ(buf.data(), other.data());
  EXPECT_EQ(3, other.size());
  EXPECT_FALSE(other.is_fec());
  EXPECT_EQ(7, other.frame_number());

  other.release();  // one reference only
}

// several I/O threads share one pool; recycled blocks of a different size
// are freed by whichever thread pops them
TEST_F(BufferPoolTest, ConcurrentAcquireAndRelease) {
  const int kThreads = 6;
  const int kRounds = 5000;
  std::atomic<int> corrupted{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < kRounds; ++i) {
        int32_t size = 1 + (i * 37 + t * 101) % 4000;
        auto buf = pool_.acquire(size, 0, (uint8_t)t);
        std::memset(buf.data(), t, size);
        for (int32_t k = 0; k < size; k += 97) {
          if (buf.data()[k] != (VoxByte)t) {
            corrupted++;
            break;
          }
        }
        buf.release();
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  EXPECT_EQ(0, corrupted.load());
}

TEST_F(BufferPoolTest, ToFrameExposesHandle) {
  auto buf = pool_.acquire(2, kVoxFrameConfig, 5);
  VoxFrame frame;
  buf.to_frame(frame);

  EXPECT_EQ(buf.data(), frame.data);
  EXPECT_EQ(2, frame.size);
  EXPECT_EQ(kVoxFrameConfig, frame.flags);
  EXPECT_EQ(5, frame.frameNumber);
  ASSERT_NE(nullptr, frame.handle);

  vox_frameRetain(&frame);
  EXPECT_EQ(2, buf.block()->refcount.load());
  vox_frameRelease(&frame);
  EXPECT_EQ(1, buf.block()->refcount.load());

  buf.release();
}

TEST_F(BufferPoolTest, EmptyBufferHasNoData) {
  frame_buffer buf;
  VoxFrame frame;
  buf.to_frame(frame);

  EXPECT_EQ(nullptr, frame.data);
  EXPECT_EQ(nullptr, frame.handle);
  // releasing an empty handle is a no-op
  buf.release();
  vox_frameRelease(&frame);
}

// ============================================================================
// assembly_pool
// ============================================================================

class AssemblyPoolTest : public ::testing::Test {
 protected:
  assembly_pool pool_{"test pool", 2};
};

TEST_F(AssemblyPoolTest, SlotBusyUntilReleased) {
  auto buf = pool_.get(100);
  EXPECT_EQ(100, buf.size());
  EXPECT_EQ(1, pool_.slots_in_use());

  auto copy = buf;
  copy.retain();
  buf.release();
  EXPECT_EQ(1, pool_.slots_in_use());

  copy.release();
  EXPECT_EQ(0, pool_.slots_in_use());
}

TEST_F(AssemblyPoolTest, ReusesBlock) {
  auto buf = pool_.get(100);
  auto block = buf.block();
  buf.release();

  // smaller request fits into the existing block
  auto again = pool_.get(50);
  EXPECT_EQ(block, again.block());
  EXPECT_EQ(50, again.size());
  again.release();
}

TEST_F(AssemblyPoolTest, GrowsBlock) {
  auto buf = pool_.get(10);
  buf.release();

  auto bigger = pool_.get(1000);
  EXPECT_GE(bigger.block()->capacity, 1000);
  bigger.release();
}

TEST_F(AssemblyPoolTest, FallsBackWhenExhausted) {
  auto a = pool_.get(10);
  auto b = pool_.get(10);
  auto c = pool_.get(10);

  EXPECT_EQ(2, pool_.slots_in_use());
  EXPECT_EQ(nullptr, c.block()->owner);

  a.release();
  b.release();
  c.release();
  EXPECT_EQ(0, pool_.slots_in_use());
}

// ============================================================================
// event_ring
// ============================================================================

class EventRingTest : public ::testing::Test {
 protected:
  buffer_pool pool_;
  event_ring ring_{8};
};

TEST_F(EventRingTest, SwapReleasesPreviousBuffer) {
  auto first = pool_.acquire(4, 0, 0);
  first.retain();  // keep an extra reference to observe the count
  ring_.swap(3, first, 17);

  ring_.lock(3);
  EXPECT_EQ(first.block(), ring_.slot(3).block());
  EXPECT_EQ(17u, ring_.tag(3));
  ring_.unlock(3);

  ring_.swap(3, pool_.acquire(4, 0, 1));
  EXPECT_EQ(1, first.block()->refcount.load());
  first.release();
}

TEST_F(EventRingTest, ClearEmptiesSlot) {
  ring_.swap(0, pool_.acquire(4, 0, 0));
  ring_.clear(0);

  ring_.lock(0);
  EXPECT_TRUE(ring_.slot(0).empty());
  ring_.unlock(0);
}

}  // namespace
