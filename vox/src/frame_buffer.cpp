/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#include "frame_buffer.hpp"

#include "common/utils.hpp"

namespace vox {

//------------------------ byte_block ---------------------------//

byte_block * byte_block::make(int32_t capacity, block_owner *owner){
    auto mem = vox::allocate(total_size(capacity));
    return new (mem) byte_block(capacity, owner);
}

void byte_block::free(byte_block *b){
    auto size = total_size(b->capacity);
    b->~byte_block();
    vox::deallocate(b, size);
}

static void release_block(byte_block *b){
    if (b->refcount.fetch_sub(1, std::memory_order_acq_rel) == 1){
        if (b->owner){
            b->owner->reclaim(b);
        } else {
            byte_block::free(b);
        }
    }
}

//------------------------ frame_buffer ---------------------------//

void frame_buffer::retain(){
    if (block_){
        block_->refcount.fetch_add(1, std::memory_order_relaxed);
    }
}

void frame_buffer::release(){
    if (block_){
        release_block(block_);
        block_ = nullptr;
    }
}

void frame_buffer::to_frame(VoxFrame& f) const {
    f.data = block_ ? data() : nullptr;
    f.size = size_;
    f.flags = flags_;
    f.frameNumber = frame_;
    f.handle = reinterpret_cast<VoxFrameHandle *>(block_);
}

//------------------------ buffer_pool ---------------------------//

frame_buffer buffer_pool::acquire(int32_t size, VoxFlag flags, uint8_t frame){
    auto mem = memory_.allocate(byte_block::total_size(size));
    auto b = new (mem) byte_block(size, this);
    return frame_buffer(b, 0, size, flags, frame);
}

void buffer_pool::reclaim(byte_block *b){
    b->~byte_block();
    memory_.deallocate(b);
}

//------------------------ assembly_pool ---------------------------//

assembly_pool::slot::~slot(){
    if (block_){
        byte_block::free(block_);
    }
}

byte_block * assembly_pool::slot::take(int32_t size){
    if (!block_ || block_->capacity < size){
        if (block_){
            byte_block::free(block_);
        }
        block_ = byte_block::make(size, this);
    } else {
        block_->refcount.store(1, std::memory_order_relaxed);
    }
    free_.store(false, std::memory_order_relaxed);
    return block_;
}

assembly_pool::assembly_pool(const char *name, int32_t count)
    : name_(name), count_(count), slots_(new slot[count]) {}

assembly_pool::~assembly_pool(){
    if (slots_in_use() > 0){
        LOG_WARNING(name_ << ": " << slots_in_use()
                    << " buffer(s) still in use on destruction");
    }
}

frame_buffer assembly_pool::get(int32_t size){
    for (int32_t i = 0; i < count_; ++i){
        auto& s = slots_[i];
        if (s.is_free()){
            return frame_buffer(s.take(size), 0, size, 0, 0);
        }
    }
    LOG_WARNING(name_ << ": all " << count_ << " buffers in use, "
                << "allocating " << size << " bytes");
    return frame_buffer(byte_block::make(size), 0, size, 0, 0);
}

int32_t assembly_pool::slots_in_use() const {
    int32_t n = 0;
    for (int32_t i = 0; i < count_; ++i){
        if (!slots_[i].is_free()){
            n++;
        }
    }
    return n;
}

} // vox

//------------------------ public API ---------------------------//

void VOX_CALL vox_frameRetain(const VoxFrame *frame){
    if (frame && frame->handle){
        auto b = reinterpret_cast<vox::byte_block *>(frame->handle);
        b->refcount.fetch_add(1, std::memory_order_relaxed);
    }
}

void VOX_CALL vox_frameRelease(const VoxFrame *frame){
    if (frame && frame->handle){
        vox::release_block(reinterpret_cast<vox::byte_block *>(frame->handle));
    }
}
