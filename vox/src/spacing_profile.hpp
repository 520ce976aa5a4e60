/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#pragma once

#include "imp.hpp"

#include "common/sync.hpp"

#include <stdint.h>
#include <chrono>
#include <string>

namespace vox {

// records the intervals (in ms) between consecutive events
// in a ring buffer; used to diagnose bursty send/receive patterns.
// update() may be called concurrently.
class spacing_profile {
public:
    using clock = std::chrono::steady_clock;

    spacing_profile(int32_t capacity);

    void start();

    bool started() const {
        return started_.load(std::memory_order_relaxed);
    }

    // 'flush' marks the end of a stream; the following
    // interval is not recorded.
    void update(bool flush = false);

    // largest recorded interval
    int32_t max() const;

    // recorded intervals, oldest first
    std::string dump() const;
private:
    vox::vector<int32_t> intervals_;
    int32_t head_ = 0;
    int32_t count_ = 0;
    clock::time_point last_;
    bool have_last_ = false;
    std::atomic<bool> started_{false};
    mutable sync::spinlock lock_;
};

} // vox
