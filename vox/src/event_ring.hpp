/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#pragma once

#include "frame_buffer.hpp"

#include "common/sync.hpp"

#include <memory>

namespace vox {

// fixed-size ring of frame buffers indexed by event number.
// every slot has its own spinlock; a slot owns one reference
// to the buffer it holds. each slot also carries a tag which
// is written together with the buffer (used for FEC generations).
class event_ring {
public:
    event_ring(int32_t size)
        : size_(size), slots_(new frame_buffer[size]),
          tags_(new uint32_t[size]()), locks_(new sync::spinlock[size]) {}

    ~event_ring() {
        release_all();
    }

    event_ring(const event_ring&) = delete;
    event_ring& operator=(const event_ring&) = delete;

    int32_t size() const { return size_; }

    void lock(int32_t i) { locks_[i].lock(); }

    void unlock(int32_t i) { locks_[i].unlock(); }

    // the following two methods require the slot lock

    frame_buffer& slot(int32_t i) { return slots_[i]; }

    uint32_t tag(int32_t i) const { return tags_[i]; }

    // store a buffer (and take over its reference),
    // releasing the previous one.
    void swap(int32_t i, const frame_buffer& buf, uint32_t tag = 0) {
        lock(i);
        auto old = slots_[i];
        slots_[i] = buf;
        tags_[i] = tag;
        unlock(i);
        old.release(); // outside the lock

    }

    void clear(int32_t i) {
        lock(i);
        auto old = slots_[i];
        slots_[i] = frame_buffer();
        unlock(i);
        old.release();
    }

    // only used during disposal to unblock a stuck reader/writer
    void force_unlock_all() {
        for (int32_t i = 0; i < size_; ++i){
            locks_[i].unlock();
        }
    }

    // not threadsafe!
    void release_all() {
        for (int32_t i = 0; i < size_; ++i){
            slots_[i].release();
        }
    }
private:
    int32_t size_;
    std::unique_ptr<frame_buffer[]> slots_;
    std::unique_ptr<uint32_t[]> tags_;
    std::unique_ptr<sync::spinlock[]> locks_;
};

} // vox
