/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#pragma once

#include "vox/vox.h"
#include "vox/vox_decoder.hpp"
#include "vox/vox_receiver.hpp"
#include "vox/vox_sender.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace vox_test {

// one transport send, as seen by the send function
struct captured_event {
    std::vector<VoxByte> data;
    VoxFlag flags;
    VoxUInt16 event;
    VoxUInt8 frame;
    VoxId voice;
    VoxInt32 channel;
    VoxSendParams params;
};

class event_capture {
public:
    static VoxInt32 VOX_CALL send(void *user, const VoxByte *data, VoxInt32 size,
                                  VoxFlag flags, VoxUInt16 eventNumber,
                                  VoxUInt8 frameNumber, VoxId voiceId,
                                  VoxInt32 channelId, const VoxSendParams *params) {
        auto self = static_cast<event_capture *>(user);
        captured_event e;
        e.data.assign(data, data + size);
        e.flags = flags;
        e.event = eventNumber;
        e.frame = frameNumber;
        e.voice = voiceId;
        e.channel = channelId;
        e.params = *params;
        self->events.push_back(std::move(e));
        return size;
    }

    // pass all captured events to the receiver, optionally skipping some
    template<typename Pred>
    void deliver_if(VoxReceiver& receiver, Pred pred) {
        for (auto& e : events) {
            if (pred(e)) {
                receiver.receiveEvent(e.data.data(), (VoxInt32)e.data.size(),
                                      e.event, e.flags, e.frame);
            }
        }
        events.clear();
    }

    void deliver(VoxReceiver& receiver) {
        deliver_if(receiver, [](const captured_event&) { return true; });
    }

    std::vector<captured_event> events;
};

// a frame as seen by the decoder
struct collected_frame {
    bool missing;
    std::vector<VoxByte> data;
    VoxFlag flags;
    VoxUInt8 frame;
};

// decoder that records everything; safe to use with a threaded receiver
class frame_collector : public VoxDecoderBase {
public:
    VoxError open(const VoxStreamInfo& info) override {
        std::lock_guard<std::mutex> lock(mutex_);
        opened++;
        if (info.codec) {
            codec = info.codec;
        }
        return open_result;
    }

    VoxError input(const VoxFrame& f) override {
        collected_frame c;
        c.missing = f.data == nullptr;
        if (f.data) {
            c.data.assign(f.data, f.data + f.size);
        }
        c.flags = f.flags;
        c.frame = f.frameNumber;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            frames.push_back(std::move(c));
        }
        cond_.notify_all();
        return kVoxOk;
    }

    void dispose() override {
        std::lock_guard<std::mutex> lock(mutex_);
        disposed++;
    }

    // wait until at least 'count' frames have arrived
    bool wait_for(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cond_.wait_for(lock, timeout, [&]() { return frames.size() >= count; });
    }

    std::vector<collected_frame> data_frames() const {
        std::vector<collected_frame> result;
        for (auto& f : frames) {
            if (!f.missing) {
                result.push_back(f);
            }
        }
        return result;
    }

    size_t missing_count() const {
        size_t n = 0;
        for (auto& f : frames) {
            if (f.missing) {
                n++;
            }
        }
        return n;
    }

    VoxError open_result = kVoxOk;
    int opened = 0;
    int disposed = 0;
    std::string codec;
    std::vector<collected_frame> frames;
private:
    std::mutex mutex_;
    std::condition_variable cond_;
};

// payload where every byte is derived from the frame index
inline std::vector<VoxByte> make_payload(int index, int size) {
    std::vector<VoxByte> v(size);
    for (int i = 0; i < size; ++i) {
        v[i] = (VoxByte)(index * 31 + i);
    }
    return v;
}

} // namespace vox_test
