/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#pragma once

#include "vox/vox_config.h"

#include "common/utils.hpp"

#include <stdint.h>
#include <atomic>

namespace vox {

// decides how many frames the reader trails the writer.
//
// an explicit delay always wins; otherwise we wait 1 frame once
// the stream has been fragmented, so that all fragments of a frame
// have a chance to arrive. while a flush is pending (end of stream
// received but not yet read) the delay is 0.
class delay_control {
public:
    static constexpr int32_t max_delay = VOX_MAX_DELAY_FRAMES;

    delay_control(int32_t delay = 0) {
        set_delay(delay);
    }

    void set_delay(int32_t frames) {
        delay_.store(vox::clamp<int32_t>(frames, 0, max_delay));
    }

    int32_t delay() const {
        return delay_.load();
    }

    // sticky for the lifetime of the stream
    void set_fragmented() {
        fragmented_.store(true);
    }

    bool fragmented() const {
        return fragmented_.load();
    }

    // called by the writer on end of stream
    void begin_flush(uint8_t frame) {
        flush_frame_.store(frame);
    }

    bool flushing() const {
        return flush_frame_.load() >= 0;
    }

    // called by the reader before each frame;
    // the flush ends when the reader reaches the last frame.
    void check_flush(uint8_t read_pos) {
        int32_t expected = read_pos;
        flush_frame_.compare_exchange_strong(expected, -1);
    }

    int32_t frames() const {
        if (flushing()){
            return 0;
        }
        auto d = delay_.load();
        if (d > 0){
            return d;
        }
        return fragmented() ? 1 : 0;
    }
private:
    std::atomic<int32_t> delay_{0};
    std::atomic<int32_t> flush_frame_{-1};
    std::atomic<bool> fragmented_{false};
};

} // vox
