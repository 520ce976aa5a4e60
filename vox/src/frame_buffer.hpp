/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#pragma once

#include "vox/vox_types.h"

#include "imp.hpp"

#include <stdint.h>
#include <atomic>
#include <memory>

namespace vox {

class block_owner;

//------------------------ byte_block ---------------------------//

// reference counted memory block; the data follows the header.
// when the last reference is released, the block is handed back
// to its owner (or freed if it doesn't have one).
struct byte_block {
    byte_block(int32_t _capacity, block_owner *_owner)
        : capacity(_capacity), owner(_owner) {}

    std::atomic<int32_t> refcount{1};
    int32_t capacity;
    block_owner *owner;

    VoxByte * data() {
        return reinterpret_cast<VoxByte *>(this + 1);
    }

    static size_t total_size(int32_t capacity) {
        return sizeof(byte_block) + capacity;
    }

    // allocate a new block with a reference count of 1
    static byte_block * make(int32_t capacity, block_owner *owner = nullptr);
    // destroy and deallocate the block (the reference count is ignored)
    static void free(byte_block *b);
};

class block_owner {
public:
    virtual ~block_owner() {}
    virtual void reclaim(byte_block *b) = 0;
};

//------------------------ frame_buffer ---------------------------//

// a view on a byte_block plus frame meta data.
//
// frame_buffer is a plain handle: copying does *not* retain
// the block, so every owner must call retain() resp. release()
// explicitly. release() also resets the handle.
class frame_buffer {
public:
    frame_buffer() = default;

    frame_buffer(byte_block *b, int32_t offset, int32_t size,
                 VoxFlag flags, uint8_t frame)
        : block_(b), offset_(offset), size_(size),
          flags_(flags), frame_(frame) {}

    bool empty() const { return block_ == nullptr; }

    byte_block * block() const { return block_; }

    VoxByte * data() { return block_->data() + offset_; }
    const VoxByte * data() const { return block_->data() + offset_; }

    int32_t size() const { return size_; }

    VoxFlag flags() const { return flags_; }

    uint8_t frame_number() const { return frame_; }

    bool is_config() const { return flags_ & kVoxFrameConfig; }

    bool is_fec() const { return flags_ & kVoxFrameFEC; }

    // same block and offset, new meta data
    frame_buffer rebind(int32_t size, VoxFlag flags, uint8_t frame) const {
        return frame_buffer(block_, offset_, size, flags, frame);
    }

    void retain();

    void release();

    // build a VoxFrame that refers to this buffer
    void to_frame(VoxFrame& f) const;
private:
    byte_block *block_ = nullptr;
    int32_t offset_ = 0;
    int32_t size_ = 0;
    VoxFlag flags_ = 0;
    uint8_t frame_ = 0;
};

//------------------------ buffer_pool ---------------------------//

// thread-safe pool for received events.
// blocks are recycled through a lock-free memory_list.
class buffer_pool final : public block_owner {
public:
    buffer_pool() = default;

    // returns a frame_buffer with a reference count of 1
    frame_buffer acquire(int32_t size, VoxFlag flags, uint8_t frame);

    void reclaim(byte_block *b) override;
private:
    memory_list memory_;
};

//------------------------ assembly_pool ---------------------------//

// a fixed number of reusable buffers for fragment and part assembly.
// a slot becomes available again when the last reference to its
// buffer is released, possibly by the decoder on another thread.
// if all slots are in use, get() falls back to a plain allocation.
//
// get() must only be called from a single thread.
class assembly_pool {
public:
    assembly_pool(const char *name, int32_t count);
    ~assembly_pool();

    assembly_pool(const assembly_pool&) = delete;
    assembly_pool& operator=(const assembly_pool&) = delete;

    // returns a frame_buffer with a reference count of 1
    frame_buffer get(int32_t size);

    int32_t slots_in_use() const;
private:
    class slot final : public block_owner {
    public:
        ~slot();
        void reclaim(byte_block *b) override {
            free_.store(true, std::memory_order_release);
        }
        bool is_free() const {
            return free_.load(std::memory_order_acquire);
        }
        byte_block * take(int32_t size);
    private:
        byte_block *block_ = nullptr;
        std::atomic<bool> free_{true};
    };

    const char *name_;
    int32_t count_;
    std::unique_ptr<slot[]> slots_;
};

} // vox
