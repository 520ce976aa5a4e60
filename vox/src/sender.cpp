/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#include "sender.hpp"

#include <algorithm>
#include <chrono>
#include <climits>

namespace vox {

template<typename T>
T& as(void *p){
    return *reinterpret_cast<T *>(p);
}

#define CHECKARG(type) if (size != sizeof(type)) return kVoxErrorBadArgument

static int64_t time_ms(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()).count();
}

} // vox

//------------------------- sender_imp ------------------------------//

void VOX_CALL VoxSenderSettings_init(VoxSenderSettings *settings){
    settings->voiceId = 0;
    settings->channelId = 0;
    settings->eventBufferSize = 0;
    settings->fec = 0;
    settings->fragment = kVoxFalse;
    settings->maxPayloadSize = 0;
    settings->partSize = VOX_PART_SIZE;
    settings->params.reliable = kVoxFalse;
    settings->params.encrypt = kVoxFalse;
    settings->params.interestGroup = 0;
}

VOX_API VoxSender * VOX_CALL VoxSender_new(
        const VoxSenderSettings *settings, VoxError *err) {
    if (!settings){
        if (err) *err = kVoxErrorBadArgument;
        return nullptr;
    }
    auto size = settings->eventBufferSize;
    if (size < 0 || size > VOX_MAX_EVENT_BUFFER_SIZE){
        LOG_ERROR("VoxSender: event buffer size " << size
                  << " out of range [0, " << VOX_MAX_EVENT_BUFFER_SIZE << "]");
        if (err) *err = kVoxErrorBadArgument;
        return nullptr;
    }
    if (settings->fec < 0 || settings->maxPayloadSize < 0 || settings->partSize < 0){
        LOG_ERROR("VoxSender: negative setting");
        if (err) *err = kVoxErrorBadArgument;
        return nullptr;
    }
    if (err) *err = kVoxOk;
    return vox::construct<vox::sender_imp>(*settings);
}

vox::sender_imp::sender_imp(const VoxSenderSettings& settings)
    : id_(settings.voiceId), channel_(settings.channelId),
      ev_buf_size_(settings.eventBufferSize > 0 ?
                       settings.eventBufferSize : VOX_EVENT_BUFFER_SIZE),
      params_(settings.params), spacing_(VOX_SPACING_PROFILE_SIZE)
{
    control(kVoxCtlSetFec, 0, (void *)&settings.fec, sizeof(settings.fec));
    fragment_.store(settings.fragment != kVoxFalse);
    max_payload_size_.store(settings.maxPayloadSize);
    part_size_.store(settings.partSize);
    LOG_VERBOSE("VoxSender(" << id_ << "/" << channel_ << "): event buffer size "
                << ev_buf_size_ << ", fec " << fec_.load()
                << ", fragment " << fragment_.load());
}

VOX_API void VOX_CALL VoxSender_free(VoxSender *sender){
    // cast to correct type because base class
    // has no virtual destructor!
    vox::destroy(static_cast<vox::sender_imp *>(sender));
}

vox::sender_imp::~sender_imp() {
    if (spacing_.started()){
        LOG_VERBOSE("VoxSender(" << id_ << "/" << channel_
                    << "): send spacing " << spacing_.dump());
    }
}

VOX_API VoxError VOX_CALL VoxSender_control(
        VoxSender *sender, VoxCtl ctl, VoxIntPtr index, void *ptr, VoxSize size)
{
    return sender->control(ctl, index, ptr, size);
}

VoxError VOX_CALL vox::sender_imp::control(
        VoxCtl ctl, VoxIntPtr index, void *ptr, VoxSize size)
{
    switch (ctl){
    case kVoxCtlGetId:
        CHECKARG(VoxId);
        as<VoxId>(ptr) = id_;
        break;
    case kVoxCtlGetEventBufferSize:
        CHECKARG(int32_t);
        as<int32_t>(ptr) = ev_buf_size_;
        break;
    // FEC
    case kVoxCtlSetFec:
    {
        CHECKARG(int32_t);
        auto n = as<int32_t>(ptr);
        if (n < 0){
            return kVoxErrorBadArgument;
        }
        // a group must not cover the whole ring
        if (n >= ev_buf_size_){
            LOG_WARNING("VoxSender: FEC group size " << n
                        << " too large for event buffer size " << ev_buf_size_);
            n = ev_buf_size_ - 1;
        }
        fec_.store(n);
        break;
    }
    case kVoxCtlGetFec:
        CHECKARG(int32_t);
        as<int32_t>(ptr) = fec_.load();
        break;
    // fragmentation
    case kVoxCtlSetFragment:
        CHECKARG(VoxBool);
        fragment_.store(as<VoxBool>(ptr) != kVoxFalse);
        break;
    case kVoxCtlGetFragment:
        CHECKARG(VoxBool);
        as<VoxBool>(ptr) = fragment_.load();
        break;
    case kVoxCtlSetMaxPayloadSize:
    {
        CHECKARG(int32_t);
        auto n = as<int32_t>(ptr);
        if (n < 0){
            return kVoxErrorBadArgument;
        }
        max_payload_size_.store(n);
        break;
    }
    case kVoxCtlGetMaxPayloadSize:
        CHECKARG(int32_t);
        as<int32_t>(ptr) = max_payload_size_.load();
        break;
    // parts
    case kVoxCtlSetPartSize:
    {
        CHECKARG(int32_t);
        auto n = as<int32_t>(ptr);
        if (n < 0){
            return kVoxErrorBadArgument;
        }
        part_size_.store(n);
        break;
    }
    case kVoxCtlGetPartSize:
        CHECKARG(int32_t);
        as<int32_t>(ptr) = part_size_.load();
        break;
    // transmission
    case kVoxCtlSetTransmitEnabled:
        CHECKARG(VoxBool);
        transmit_enabled_.store(as<VoxBool>(ptr) != kVoxFalse);
        break;
    case kVoxCtlGetTransmitEnabled:
        CHECKARG(VoxBool);
        as<VoxBool>(ptr) = transmit_enabled_.load();
        break;
    case kVoxCtlIsTransmitting:
    {
        CHECKARG(VoxBool);
        auto last = last_transmit_.load();
        as<VoxBool>(ptr) = last >= 0 && (time_ms() - last) < VOX_TRANSMIT_TIMEOUT;
        break;
    }
    case kVoxCtlSetSendParams:
    {
        CHECKARG(VoxSendParams);
        sync::scoped_lock<sync::spinlock> lock(params_lock_);
        params_ = as<VoxSendParams>(ptr);
        break;
    }
    case kVoxCtlGetSendParams:
        CHECKARG(VoxSendParams);
        as<VoxSendParams>(ptr) = send_params();
        break;
    // statistics
    case kVoxCtlGetStats:
    {
        CHECKARG(VoxSenderStats);
        auto& stats = as<VoxSenderStats>(ptr);
        stats.framesSent = frames_sent_.load();
        stats.framesSentBytes = frames_sent_bytes_.load();
        stats.framesSentFragmented = frames_sent_fragmented_.load();
        stats.framesSentFragments = frames_sent_fragments_.load();
        stats.framesSkipped = frames_skipped_.load();
        stats.eventsSent = events_sent_.load();
        stats.fecEventsSent = fec_events_sent_.load();
        break;
    }
    case kVoxCtlResetStats:
        frames_sent_.store(0);
        frames_sent_bytes_.store(0);
        frames_sent_fragmented_.store(0);
        frames_sent_fragments_.store(0);
        frames_skipped_.store(0);
        events_sent_.store(0);
        fec_events_sent_.store(0);
        break;
    case kVoxCtlStartSpacingProfile:
        spacing_.start();
        break;
    case kVoxCtlGetSpacingProfileMax:
        CHECKARG(int32_t);
        as<int32_t>(ptr) = spacing_.max();
        break;
    default:
        LOG_WARNING("VoxSender: unsupported control " << ctl);
        return kVoxErrorNotImplemented;
    }
    return kVoxOk;
}

VOX_API VoxError VOX_CALL VoxSender_sendFrame(
        VoxSender *sender, const VoxByte *data, VoxInt32 size,
        VoxFlag flags, VoxSendFunc fn, void *user) {
    return sender->sendFrame(data, size, flags, fn, user);
}

VoxError VOX_CALL vox::sender_imp::sendFrame(
        const VoxByte *data, VoxInt32 size, VoxFlag flags,
        VoxSendFunc fn, void *user)
{
    if (size < 0 || (size > 0 && !data) || !fn){
        return kVoxErrorBadArgument;
    }
    // FEC and fragment flags are reserved for the transport
    flags &= ~(kVoxFrameFEC | kVoxFrameMaskFrag);

    if (flags & kVoxFrameConfig){
        if (have_config_ && (int32_t)config_.size() == size &&
                std::equal(data, data + size, config_.begin())){
            LOG_DEBUG("VoxSender(" << id_ << "/" << channel_
                      << "): config frame unchanged");
            return kVoxOk;
        }
        // reuses the capacity of the previous config frame
        config_.assign(data, data + size);
        config_flags_ = flags;
        have_config_ = true;
    }

    if (!transmit_enabled_.load()){
        frames_skipped_++;
        return kVoxErrorIdle;
    }

    return send_parts(data, size, flags, sendfn(fn, user));
}

VOX_API VoxError VOX_CALL VoxSender_sendConfig(
        VoxSender *sender, VoxSendFunc fn, void *user) {
    return sender->sendConfig(fn, user);
}

VoxError VOX_CALL vox::sender_imp::sendConfig(VoxSendFunc fn, void *user){
    if (!fn){
        return kVoxErrorBadArgument;
    }
    if (!have_config_){
        return kVoxErrorNotFound;
    }
    if (!transmit_enabled_.load()){
        return kVoxErrorIdle;
    }
    LOG_DEBUG("VoxSender(" << id_ << "/" << channel_ << "): resend config frame");
    return send_frame(config_.data(), (int32_t)config_.size(),
                      config_flags_, sendfn(fn, user));
}

namespace vox {

// split oversized frames into parts; the receiver concatenates them again
// after fragment reassembly. config frames are never split.
VoxError sender_imp::send_parts(const VoxByte *data, int32_t size,
                                VoxFlag flags, const sendfn& fn)
{
    auto partsize = part_size_.load();
    if (partsize <= 0 || size <= partsize || (flags & kVoxFrameConfig)){
        return send_frame(data, size, flags, fn);
    }
    flags &= ~kVoxFrameMaskPart;
    for (int32_t pos = 0; pos < size; pos += partsize){
        auto n = std::min(partsize, size - pos);
        auto last = pos + n >= size;
        auto f = flags;
        if (pos > 0){
            f |= kVoxFramePartNotBeg;
        }
        if (!last){
            // only the last part may end the stream
            f |= kVoxFramePartNotEnd;
            f &= ~kVoxFrameEndOfStream;
        }
        auto err = send_frame(data + pos, n, f, fn);
        if (err != kVoxOk){
            return err;
        }
    }
    return kVoxOk;
}

VoxError sender_imp::send_frame(const VoxByte *data, int32_t size,
                                VoxFlag flags, const sendfn& fn)
{
    auto frame = frame_number_;
    auto maxsize = max_payload_size_.load();

    if (fragment_.load() && !(flags & kVoxFrameConfig)
            && maxsize > 0 && size > maxsize)
    {
        auto countsize = count_size();
        auto fragsize = maxsize - countsize;
        if (fragsize <= 0){
            LOG_ERROR("VoxSender(" << id_ << "/" << channel_
                      << "): max. payload size " << maxsize << " too small");
            return kVoxErrorBadArgument;
        }
        auto count = (size + fragsize - 1) / fragsize;
        auto maxcount = countsize == 1 ? 255 : 65535;
        if (count > maxcount || count > ev_buf_size_){
            LOG_ERROR("VoxSender(" << id_ << "/" << channel_
                      << "): frame too large (" << size << " bytes, "
                      << count << " fragments)");
            return kVoxErrorOverflow;
        }
        // the first fragment carries the fragment count in its last byte(s)
        sendbuffer_.resize(maxsize);
        std::copy(data, data + fragsize, sendbuffer_.begin());
        if (countsize == 2){
            write_le16((uint16_t)count, sendbuffer_.data() + fragsize);
        } else {
            sendbuffer_[fragsize] = (VoxByte)count;
        }
        // only the last fragment may start a flush on the receiver
        send_event(sendbuffer_.data(), maxsize,
                   (flags & ~kVoxFrameEndOfStream) | kVoxFrameFragNotEnd, frame, fn);

        for (int32_t i = 1; i < count; ++i){
            auto offset = i * fragsize;
            auto n = std::min(fragsize, size - offset);
            auto f = flags | kVoxFrameFragNotBeg;
            if (i < count - 1){
                f |= kVoxFrameFragNotEnd;
                f &= ~kVoxFrameEndOfStream;
            }
            send_event(data + offset, n, f, frame, fn);
        }
        frames_sent_fragmented_++;
        frames_sent_fragments_ += count;
    #if VOX_DEBUG_EVENTS
        LOG_DEBUG("VoxSender(" << id_ << "/" << channel_ << "): frame "
                  << (int)frame << " (" << size << " bytes) sent in "
                  << count << " fragments");
    #endif
    } else {
        send_event(data, size, flags, frame, fn);
    }

    frame_number_++;
    frames_sent_++;
    frames_sent_bytes_ += size;
    if (size > 0 && !(flags & kVoxFrameConfig)){
        last_transmit_.store(time_ms());
    }
    return kVoxOk;
}

void sender_imp::send_event(const VoxByte *data, int32_t size, VoxFlag flags,
                            uint8_t frame, const sendfn& fn)
{
    auto params = send_params();
    fn(data, size, flags, event_number_, frame, id_, channel_, params);
    events_sent_++;
    spacing_.update(flags & kVoxFrameEndOfStream);
#if VOX_DEBUG_EVENTS
    LOG_DEBUG("VoxSender(" << id_ << "/" << channel_ << "): ev#" << event_number_
              << " fr#" << (int)frame << " flags " << flags << " size " << size);
#endif
    event_number_ = (event_number_ + 1) % ev_buf_size_;

    auto fec = fec_.load();
    if (fec > 0){
        fec_accumulate(data, size, flags, frame);
        if (fec_count_ >= fec){
            send_fec(fn);
        }
    } else if (fec_count_ > 0){
        // FEC has been disabled in the middle of a group
        fec_reset();
    }
}

void sender_imp::fec_accumulate(const VoxByte *data, int32_t size,
                                VoxFlag flags, uint8_t frame)
{
    // leave room for the trailer
    auto needed = (size_t)(size + fec_info_size());
    if (fec_buffer_.size() < needed){
        fec_buffer_.resize(needed, 0);
    }
    for (int32_t i = 0; i < size; ++i){
        fec_buffer_[i] ^= data[i];
    }
    fec_max_size_ = std::max(fec_max_size_, size);
    fec_flags_ ^= (uint8_t)flags;
    fec_frame_ ^= frame;
    fec_total_size_ += size;
    fec_count_++;
}

// the FEC event uses the *next* event number without advancing it,
// so it never shares an event number with a regular event.
void sender_imp::send_fec(const sendfn& fn)
{
    auto info = fec_info_size();
    auto p = fec_buffer_.data() + fec_max_size_;
    uint16_t start = (uint16_t)(((event_number_ - fec_count_) % ev_buf_size_
                                 + ev_buf_size_) % ev_buf_size_);
    p[0] = fec_frame_;
    p[1] = fec_flags_;
    write_le16((uint16_t)fec_total_size_, p + 2);
    if (info == 6){
        write_le16(start, p + 4);
    } else {
        p[4] = (VoxByte)start;
    }
    if (fec_total_size_ > 0xffff){
        // the size field wraps around; the receiver will reject the recovery.
        LOG_DEBUG("VoxSender(" << id_ << "/" << channel_
                  << "): FEC group too large (" << fec_total_size_ << " bytes)");
    }
#if VOX_DEBUG_FEC
    LOG_DEBUG("VoxSender(" << id_ << "/" << channel_ << "): FEC ev#"
              << event_number_ << " covers [" << start << ", "
              << event_number_ << ")");
#endif
    auto params = send_params();
    fn(fec_buffer_.data(), fec_max_size_ + info, kVoxFrameFEC,
       event_number_, (uint8_t)event_number_, id_, channel_, params);
    fec_events_sent_++;

    fec_reset();
}

void sender_imp::fec_reset()
{
    auto n = std::min(fec_buffer_.size(), (size_t)(fec_max_size_ + fec_info_size()));
    std::fill(fec_buffer_.begin(), fec_buffer_.begin() + n, 0);
    fec_count_ = 0;
    fec_max_size_ = 0;
    fec_total_size_ = 0;
    fec_flags_ = 0;
    fec_frame_ = 0;
}

} // vox
