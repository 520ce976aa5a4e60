/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#include "receiver.hpp"

#include <algorithm>
#include <cstring>
#include <exception>
#include <system_error>

namespace vox {

template<typename T>
T& as(void *p){
    return *reinterpret_cast<T *>(p);
}

#define CHECKARG(type) if (size != sizeof(type)) return kVoxErrorBadArgument

#define LOG_PREFIX "VoxReceiver(" << id_ << "/" << channel_ << "): "

// frame advance window; outside of it we assume a new stream
const int32_t max_frames_behind = 10;
const int32_t max_frames_ahead = 5;

} // vox

//------------------------- receiver_imp ------------------------------//

void VOX_CALL VoxReceiverSettings_init(VoxReceiverSettings *settings){
    settings->voiceId = 0;
    settings->channelId = 0;
    settings->eventBufferSize = 0;
    settings->delayFrames = 0;
    settings->flags = 0;
    settings->decoder = nullptr;
    settings->info = nullptr;
}

VOX_API VoxReceiver * VOX_CALL VoxReceiver_new(
        const VoxReceiverSettings *settings, VoxError *err) {
    if (!settings){
        if (err) *err = kVoxErrorBadArgument;
        return nullptr;
    }
    auto size = settings->eventBufferSize;
    if (size < 0 || size > VOX_MAX_EVENT_BUFFER_SIZE){
        LOG_ERROR("VoxReceiver: event buffer size " << size
                  << " out of range [0, " << VOX_MAX_EVENT_BUFFER_SIZE << "]");
        if (err) *err = kVoxErrorBadArgument;
        return nullptr;
    }
    if (settings->delayFrames < 0){
        LOG_ERROR("VoxReceiver: negative delay");
        if (err) *err = kVoxErrorBadArgument;
        return nullptr;
    }
    if (!settings->decoder || !settings->decoder->interface){
        LOG_ERROR("VoxReceiver: missing decoder");
        if (err) *err = kVoxErrorBadArgument;
        return nullptr;
    }
    auto receiver = vox::construct<vox::receiver_imp>(*settings);
    auto result = receiver->init();
    if (result != kVoxOk){
        vox::destroy(receiver);
        if (err) *err = result;
        return nullptr;
    }
    if (err) *err = kVoxOk;
    return receiver;
}

vox::receiver_imp::receiver_imp(const VoxReceiverSettings& settings)
    : id_(settings.voiceId), channel_(settings.channelId),
      ev_buf_size_(settings.eventBufferSize > 0 ?
                       settings.eventBufferSize : VOX_EVENT_BUFFER_SIZE),
      clear_lag_(std::min<int32_t>(VOX_QUEUE_CLEAR_LAG, ev_buf_size_)),
      threaded_(settings.flags & kVoxReceiverThreaded),
      events_(ev_buf_size_), fec_events_(ev_buf_size_),
      fec_xored_events_(new std::atomic<fec_ref>[ev_buf_size_]),
      delay_(settings.delayFrames),
      fragment_pool_("fragment pool", VOX_ASSEMBLY_POOL_SIZE),
      part_pool_("part pool", VOX_ASSEMBLY_POOL_SIZE),
      decoder_(settings.decoder, settings.info),
      spacing_(VOX_SPACING_PROFILE_SIZE)
{
    for (int32_t i = 0; i < ev_buf_size_; ++i){
        fec_xored_events_[i].store(fec_ref_none, std::memory_order_relaxed);
    }
    LOG_VERBOSE(LOG_PREFIX "event buffer size " << ev_buf_size_
                << ", delay " << delay_.delay()
                << (threaded_ ? ", threaded" : ""));
}

VoxError vox::receiver_imp::init(){
    if (threaded_){
        try {
            thread_ = std::thread([this](){
                run_decode_thread();
            });
        } catch (const std::system_error& e){
            LOG_ERROR(LOG_PREFIX "could not start decode thread: " << e.what());
            return kVoxErrorUnknown;
        }
        return kVoxOk;
    } else {
        auto err = decoder_.open();
        if (err != kVoxOk){
            LOG_ERROR(LOG_PREFIX "could not open decoder: " << vox_strerror(err));
        }
        return err;
    }
}

VOX_API void VOX_CALL VoxReceiver_free(VoxReceiver *receiver){
    // cast to correct type because base class
    // has no virtual destructor!
    vox::destroy(static_cast<vox::receiver_imp *>(receiver));
}

vox::receiver_imp::~receiver_imp(){
    dispose();
    // the decode thread might still be disposing
    if (thread_.joinable()){
        thread_.join();
    }
}

VOX_API VoxError VOX_CALL VoxReceiver_control(
        VoxReceiver *receiver, VoxCtl ctl, VoxIntPtr index, void *ptr, VoxSize size)
{
    return receiver->control(ctl, index, ptr, size);
}

VoxError VOX_CALL vox::receiver_imp::control(
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
    case kVoxCtlSetDelayFrames:
    {
        CHECKARG(int32_t);
        auto n = as<int32_t>(ptr);
        if (n < 0){
            return kVoxErrorBadArgument;
        }
        if (n > delay_control::max_delay){
            LOG_WARNING(LOG_PREFIX "delay " << n << " clipped to "
                        << delay_control::max_delay);
        }
        delay_.set_delay(n);
        break;
    }
    case kVoxCtlGetDelayFrames:
        CHECKARG(int32_t);
        as<int32_t>(ptr) = delay_.delay();
        break;
    case kVoxCtlGetStats:
    {
        CHECKARG(VoxReceiverStats);
        auto& stats = as<VoxReceiverStats>(ptr);
        stats.eventsReceived = events_received_.load();
        stats.fecEventsReceived = fec_events_received_.load();
        stats.eventsLost = events_lost_.load();
        stats.framesLost = frames_lost_.load();
        stats.framesLate = frames_late_.load();
        stats.framesRecovered = frames_recovered_.load();
        stats.framesTryFec = frames_try_fec_.load();
        stats.framesReceivedFragmented = frames_received_fragmented_.load();
        stats.framesReceivedFragments = frames_received_fragments_.load();
        stats.framesFragPart = frames_frag_part_.load();
        stats.framesDecoded = frames_decoded_.load();
        stats.discontinuities = discontinuities_.load();
        stats.configFramesDropped = config_frames_dropped_.load();
        break;
    }
    case kVoxCtlResetStats:
        events_received_.store(0);
        fec_events_received_.store(0);
        events_lost_.store(0);
        frames_lost_.store(0);
        frames_late_.store(0);
        frames_recovered_.store(0);
        frames_try_fec_.store(0);
        frames_received_fragmented_.store(0);
        frames_received_fragments_.store(0);
        frames_frag_part_.store(0);
        frames_decoded_.store(0);
        discontinuities_.store(0);
        config_frames_dropped_.store(0);
        break;
    case kVoxCtlStartSpacingProfile:
        spacing_.start();
        break;
    case kVoxCtlGetSpacingProfileMax:
        CHECKARG(int32_t);
        as<int32_t>(ptr) = spacing_.max();
        break;
    default:
        LOG_WARNING(LOG_PREFIX "unsupported control " << ctl);
        return kVoxErrorNotImplemented;
    }
    return kVoxOk;
}

//------------------------- disposal ------------------------------//

VOX_API VoxError VOX_CALL VoxReceiver_dispose(VoxReceiver *receiver){
    return receiver->dispose();
}

// NOTE: must not be called from within a decoder callback.
VoxError VOX_CALL vox::receiver_imp::dispose(){
    {
        sync::scoped_lock<sync::mutex> lock(dispose_mutex_);
        if (disposed_.load()){
            return kVoxOk;
        }
        disposed_.store(true);
    }
    // wake up the decode thread
    event_.set();
    // wait until all readers and writers have left; stuck slot locks
    // are cleared so that nobody can spin forever.
    while (receiving_.load() > 0 || decoding_.load()){
        events_.force_unlock_all();
        fec_events_.force_unlock_all();
        std::this_thread::yield();
    }
    // from now on, nobody else touches the rings
    events_.release_all();
    fec_events_.release_all();
    frame_buffer buf;
    while (config_queue_.try_pop(buf)){
        buf.release();
    }
    part_buffer_.release();
    part_size_ = 0;

    decoder_.dispose();

    if (spacing_.started()){
        LOG_VERBOSE(LOG_PREFIX "receive spacing " << spacing_.dump());
    }
    LOG_VERBOSE(LOG_PREFIX "disposed");
    return kVoxOk;
}

void vox::receiver_imp::run_decode_thread(){
    {
        sync::scoped_lock<sync::mutex> lock(dispose_mutex_);
        if (disposed_.load()){
            return;
        }
        decoding_.store(true);
    }
    try {
        auto err = decoder_.open();
        if (err != kVoxOk){
            LOG_ERROR(LOG_PREFIX "could not open decoder: " << vox_strerror(err));
            decoding_.store(false);
            dispose();
            return;
        }
        while (!disposed_.load()){
            event_.wait();
            decode_queue();
        }
    } catch (const std::exception& e){
        LOG_ERROR(LOG_PREFIX "exception in decode thread: " << e.what());
        decoding_.store(false);
        dispose();
        return;
    }
    decoding_.store(false);
}

//------------------------- writer ------------------------------//

VOX_API VoxError VOX_CALL VoxReceiver_receiveEvent(
        VoxReceiver *receiver, const VoxByte *data, VoxInt32 size,
        VoxUInt16 eventNumber, VoxFlag flags, VoxUInt8 frameNumber) {
    return receiver->receiveEvent(data, size, eventNumber, flags, frameNumber);
}

VoxError VOX_CALL vox::receiver_imp::receiveEvent(
        const VoxByte *data, VoxInt32 size, VoxUInt16 eventNumber,
        VoxFlag flags, VoxUInt8 frameNumber)
{
    receiving_++;
    if (disposed_.load()){
        receiving_--;
        return kVoxErrorIdle;
    }
    if (eventNumber >= ev_buf_size_ || size < 0 || (size > 0 && !data)){
        LOG_WARNING(LOG_PREFIX "bad event (ev#" << eventNumber
                    << ", size " << size << ")");
        receiving_--;
        return kVoxErrorBadArgument;
    }
    events_received_++;
    spacing_.update(flags & kVoxFrameEndOfStream);
#if VOX_DEBUG_EVENTS
    LOG_DEBUG(LOG_PREFIX "received ev#" << eventNumber << " fr#"
              << (int)frameNumber << " flags " << flags << " size " << size);
#endif

    auto buf = receive_pool_.acquire(size, flags, frameNumber);
    if (size > 0){
        memcpy(buf.data(), data, size);
    }

    if (flags & kVoxFrameFEC){
        receive_fec(buf, eventNumber);
    } else {
        if (flags & kVoxFrameConfig){
            receive_config(buf, eventNumber);
        }
        receive_regular(buf, eventNumber);

        if (!threaded_){
            // if another writer is currently decoding, it picks up our
            // event because it keeps draining while a request is pending.
            decode_pending_.store(true);
            while (decode_pending_.load() && decode_lock_.try_lock()){
                try {
                    while (decode_pending_.exchange(false)){
                        decode_queue();
                    }
                } catch (const std::exception& e){
                    decode_lock_.unlock();
                    LOG_ERROR(LOG_PREFIX "exception in decoder: " << e.what());
                    receiving_--;
                    dispose();
                    return kVoxErrorUnknown;
                }
                decode_lock_.unlock();
                // a request might have come in before we unlocked
                std::atomic_thread_fence(std::memory_order_seq_cst);
            }
        }
    }

    receiving_--;
    return kVoxOk;
}

void vox::receiver_imp::receive_config(const frame_buffer& buf, uint16_t ev){
    if (buf.flags() & kVoxFrameMaskFrag){
        LOG_ERROR(LOG_PREFIX "fragmented config frame (ev#" << ev << ")");
        return;
    }
    // the queue holds its own reference; the payload is delivered
    // from there, the ring only keeps a placeholder.
    auto copy = buf;
    copy.retain();
    auto count = config_queue_.push(copy);
    if (count > VOX_CONFIG_QUEUE_SIZE){
        // drop the oldest ones
        sync::scoped_lock<sync::spinlock> lock(config_lock_);
        frame_buffer old;
        while (config_queue_.size() > VOX_CONFIG_QUEUE_SIZE
               && config_queue_.try_pop(old)){
            LOG_WARNING(LOG_PREFIX "config queue overflow; drop fr#"
                        << (int)old.frame_number());
            old.release();
            config_frames_dropped_++;
        }
    }
}

void vox::receiver_imp::receive_fec(const frame_buffer& buf, uint16_t ev){
    fec_events_received_++;

    auto info = ev_buf_size_ > 256 ? 6 : 5;
    auto len = buf.size();
    if (len < info){
        LOG_WARNING(LOG_PREFIX "FEC event ev#" << ev << " too short ("
                    << len << " bytes)");
        auto tmp = buf;
        tmp.release();
        return;
    }
    // the start event number is the last field (msb last)
    auto p = buf.data();
    uint16_t start = info == 6 ? read_le16(p + len - 2) : p[len - 1];
    if (start >= ev_buf_size_){
        LOG_WARNING(LOG_PREFIX "FEC event ev#" << ev
                    << ": bad start event " << start);
        auto tmp = buf;
        tmp.release();
        return;
    }

    uint16_t gen = fec_generation_.fetch_add(1) + 1;
    fec_events_.swap(ev, buf, gen);

    // publish after the buffer has been stored
    fec_ref ref = ((fec_ref)gen << 16) | ev;
    for (auto i = start; i != ev; i = (i + 1) % ev_buf_size_){
        fec_xored_events_[i].store(ref);
    }
    fec_event_timeout_.store(0);
#if VOX_DEBUG_FEC
    LOG_DEBUG(LOG_PREFIX "FEC ev#" << ev << " (gen " << gen << ") covers ["
              << start << ", " << ev << ")");
#endif
}

void vox::receiver_imp::receive_regular(const frame_buffer& buf, uint16_t ev){
    auto frame = buf.frame_number();
    auto flags = buf.flags();

    // switch on the fragment delay before the reader can see the
    // frame, otherwise the very first fragmented frame is read early.
    if (flags & kVoxFrameMaskFrag){
        delay_.set_fragmented();
    }

    auto first = false;
    if (!started_.load(std::memory_order_acquire)){
        sync::scoped_lock<sync::mutex> lock(dispose_mutex_);
        if (!started_.load(std::memory_order_relaxed)){
            frame_read_pos_.store(frame);
            frame_write_pos_.store(frame);
            event_read_pos_.store(ev);
            started_.store(true, std::memory_order_release);
            first = true;
            LOG_VERBOSE(LOG_PREFIX "stream started at ev#" << ev
                        << " fr#" << (int)frame);
        }
    }

    events_.swap(ev, buf);

    if (first){
        event_.set();
    }

    if (flags & kVoxFrameEndOfStream){
        delay_.begin_flush(frame);
    }

    auto timeout = fec_event_timeout_.load();
    if (timeout < fec_timeout_inf){
        fec_event_timeout_.store(timeout + 1);
    }

    auto advance = seq_diff(frame, frame_write_pos_.load());
    if (advance < -max_frames_behind || advance > max_frames_ahead){
        // most likely a new stream (e.g. after an interest group change)
        LOG_VERBOSE(LOG_PREFIX "discontinuity: fr#" << (int)frame
                    << " vs. write pos " << (int)frame_write_pos_.load()
                    << "; reset to ev#" << ev);
        frame_read_pos_.store(frame);
        frame_write_pos_.store(frame);
        event_read_pos_.store(ev);
        discontinuities_++;
        event_.set();
    } else if (advance > 0){
        frame_write_pos_.store(frame);
        event_.set();
    } else if (advance < 0){
        frames_late_++;
    }
}

//------------------------- reader ------------------------------//

void vox::receiver_imp::decode_queue(){
    if (!started_.load(std::memory_order_acquire)){
        return;
    }
    uint8_t max_frame_read_pos = frame_write_pos_.load() - delay_.frames();
    int32_t null_frames = 0;
    while (!disposed_.load() && null_frames++ < VOX_STALL_LIMIT
           && (uint8_t)(max_frame_read_pos - frame_read_pos_.load()) < 127)
    {
        // configs precede the frames they apply to
        flush_config_queue();

        auto read_pos = frame_read_pos_.load();
        delay_.check_flush(read_pos);

        auto ev = event_read_pos_.load();
        auto n = process_frame(ev, max_frame_read_pos);
        event_read_pos_.store((ev + n) % ev_buf_size_);

        if (frame_read_pos_.load() != read_pos){
            null_frames = 0;
        }

        // keep some history for FEC recovery
        for (int32_t i = 0; i < n; ++i){
            auto slot = (ev + i + ev_buf_size_ - clear_lag_) % ev_buf_size_;
            events_.clear(slot);
            fec_events_.clear(slot);
        }
    }
}

// returns the number of consumed events
int32_t vox::receiver_imp::process_frame(uint16_t ev, uint8_t max_frame_read_pos){
    events_.lock(ev);
    auto& slot = events_.slot(ev);
    if (slot.empty() && fec_event_timeout_.load() < fec_timeout_inf){
        process_lost_event(ev);
    }
    auto beg = slot;

    if (beg.empty()){
        events_.unlock(ev);
        events_lost_++;
    #if VOX_DEBUG_EVENTS
        LOG_DEBUG(LOG_PREFIX "ev#" << ev << " lost");
    #endif
        return 1;
    }

    if (beg.is_config()){
        // already delivered from the config queue
        events_.unlock(ev);
        frame_read_pos_++;
        return 1;
    }

    auto frame = beg.frame_number();
    auto read_pos = frame_read_pos_.load();
    auto diff = seq_diff(frame, read_pos);
    if (diff < 0){
        // leftover from a frame that has already been read
        events_.unlock(ev);
        LOG_DEBUG(LOG_PREFIX "skip stale ev#" << ev << " fr#" << (int)frame);
        return 1;
    }
    if (diff > 0){
        // frames in between are missing; keep the frame cadence with null
        // frames. the event itself is processed in the next iteration.
        events_.unlock(ev);
        do {
            decoder_input_null();
            frames_lost_++;
            read_pos++;
            frame_read_pos_.store(read_pos);
            if ((uint8_t)(max_frame_read_pos - read_pos) >= 127){
                return 0; // wait for more data
            }
        } while (read_pos != frame);
        return 0;
    }

    auto frag = beg.flags() & kVoxFrameMaskFrag;
    if (frag == kVoxFrameFragNotEnd){
        // unlocks the slot
        return process_fragments(ev, beg, max_frame_read_pos);
    } else if (frag == 0){
        beg.retain();
        events_.unlock(ev);
        frame_read_pos_++;
        decoder_input_partial(beg);
        beg.release();
        return 1;
    } else {
        // the first fragment is lost
        events_.unlock(ev);
        events_lost_++;
    #if VOX_DEBUG_EVENTS
        LOG_DEBUG(LOG_PREFIX "unexpected fragment ev#" << ev << " fr#" << (int)frame);
    #endif
        return 1;
    }
}

// called with 'ev' locked; returns the number of consumed events
int32_t vox::receiver_imp::process_fragments(uint16_t ev, const frame_buffer& first,
                                             uint8_t max_frame_read_pos)
{
    frame_read_pos_++;
    delay_.set_fragmented();

    auto countsize = count_size();
    auto len = first.size();
    int32_t count = 0;
    if (len > countsize){
        auto p = first.data();
        count = countsize == 2 ? read_le16(p + len - 2) : p[len - 1];
    }
    if (count <= 0 || count > ev_buf_size_){
        events_.unlock(ev);
        events_lost_++;
        LOG_WARNING(LOG_PREFIX "bad fragment count " << count << " (ev#" << ev
                    << ", size " << len << ")");
        return 1;
    }

    auto frame = first.frame_number();
    auto flags = first.flags() & ~kVoxFrameMaskFrag;
    auto fragsize = len - countsize;

    // never allocate while holding a slot lock
    auto tmp = first;
    tmp.retain();
    events_.unlock(ev);

    auto buf = fragment_pool_.get(fragsize * count);
    memcpy(buf.data(), tmp.data(), fragsize);
    tmp.release();

    auto size = fragsize;
    auto complete = true;
    for (int32_t i = 1; i < count; ++i){
        auto fev = (ev + i) % ev_buf_size_;
        frames_received_fragments_++;

        events_.lock(fev);
        auto& slot = events_.slot(fev);
        if (slot.empty() && fec_event_timeout_.load() < fec_timeout_inf){
            process_lost_event(fev);
        }
        if (!slot.empty() && slot.frame_number() == frame
                && (slot.flags() & kVoxFrameFragNotBeg)){
            auto n = std::min(slot.size(), fragsize);
            memcpy(buf.data() + size, slot.data(), n);
            size += n;
            // only the last fragment carries the end of stream
            flags |= slot.flags() & kVoxFrameEndOfStream;
        } else {
            // best effort: keep the position of the following fragments
            memset(buf.data() + size, 0, fragsize);
            size += fragsize;
            complete = false;
        }
        events_.unlock(fev);
    }

    frames_received_fragmented_++;
    if (!complete){
        frames_frag_part_++;
    #if VOX_DEBUG_EVENTS
        LOG_DEBUG(LOG_PREFIX "incomplete fragmented frame fr#" << (int)frame);
    #endif
    }

    auto out = buf.rebind(size, flags, frame);
    decoder_input_partial(out);
    out.release();

    return count;
}

//------------------------- FEC ------------------------------//

// called with 'ev' locked
bool vox::receiver_imp::process_lost_event(uint16_t ev){
    auto ref = fec_xored_events_[ev].load();
    if (ref == fec_ref_none){
        return false;
    }
    uint16_t fec_ev = ref & 0xffff;
    uint16_t gen = ref >> 16;

    auto ok = false;
    fec_events_.lock(fec_ev);
    auto& fec = fec_events_.slot(fec_ev);
    // the slot might have been cleared or reused by another FEC event
    if (!fec.empty() && fec.is_fec() && fec_events_.tag(fec_ev) == gen){
        ok = recover_lost_event(ev, fec_ev);
    }
    fec_events_.unlock(fec_ev);

    if (ok){
        frames_recovered_++;
    #if VOX_DEBUG_FEC
        LOG_DEBUG(LOG_PREFIX "ev#" << ev << " recovered from FEC ev#" << fec_ev);
    #endif
    } else {
        LOG_DEBUG(LOG_PREFIX "could not recover ev#" << ev
                  << " from FEC ev#" << fec_ev);
    }
    return ok;
}

// called with 'ev' and 'fec_ev' locked
bool vox::receiver_imp::recover_lost_event(uint16_t ev, uint16_t fec_ev){
    frames_try_fec_++;

    auto& fec = fec_events_.slot(fec_ev);
    auto info = ev_buf_size_ > 256 ? 6 : 5;
    auto datasize = fec.size() - info;
    auto p = fec.data();
    // trailer: frame, flags, size (lsb, msb), start (lsb, [msb])
    uint8_t frame = p[datasize];
    uint8_t flags = p[datasize + 1];
    int32_t size = read_le16(p + datasize + 2);
    uint16_t start = info == 6 ? read_le16(p + datasize + 4) : p[datasize + 4];

    auto count = (fec_ev - start + ev_buf_size_) % ev_buf_size_;
    if ((ev - start + ev_buf_size_) % ev_buf_size_ >= count){
        LOG_DEBUG(LOG_PREFIX "ev#" << ev << " not covered by FEC ev#" << fec_ev);
        return false;
    }

    // lock all other events of the group
    int32_t k = 0;
    for (; k < count; ++k){
        auto i = (start + k) % ev_buf_size_;
        if (i == ev){
            continue;
        }
        events_.lock(i);
        if (events_.slot(i).empty()){
            // two or more losses in one group
            events_.unlock(i);
            break;
        }
    }
    if (k < count){
        for (int32_t j = 0; j < k; ++j){
            auto i = (start + j) % ev_buf_size_;
            if (i != ev){
                events_.unlock(i);
            }
        }
        return false;
    }

    // XOR the known events into the FEC buffer
    auto valid = true;
    for (k = 0; k < count; ++k){
        auto i = (start + k) % ev_buf_size_;
        if (i == ev){
            continue;
        }
        auto& x = events_.slot(i);
        if (x.size() <= datasize){
            auto xp = x.data();
            for (int32_t j = 0; j < x.size(); ++j){
                p[j] ^= xp[j];
            }
            frame ^= x.frame_number();
            flags ^= (uint8_t)x.flags();
            size -= x.size();
        } else {
            valid = false;
        }
        events_.unlock(i);
    }

    if (valid && size >= 0 && size <= datasize){
        // move the FEC buffer to the lost event
        events_.slot(ev) = fec.rebind(size, flags, frame);
        fec = frame_buffer();
        return true;
    } else {
        LOG_DEBUG(LOG_PREFIX "FEC ev#" << fec_ev << ": bad recovered size "
                  << size << " (max. " << datasize << ")");
        // the buffer has been modified, so it is useless now
        fec.release();
        return false;
    }
}

//------------------------- decoder ------------------------------//

void vox::receiver_imp::flush_config_queue(){
    frame_buffer buf;
    for (;;){
        {
            // writers may pop as well (see receive_config())
            sync::scoped_lock<sync::spinlock> lock(config_lock_);
            if (!config_queue_.try_pop(buf)){
                break;
            }
        }
        decoder_input_partial(buf);
        buf.release();
    }
}

void vox::receiver_imp::decoder_input_partial(const frame_buffer& buf){
    auto part = buf.flags() & kVoxFrameMaskPart;
    if (part == 0){
        decoder_input(buf);
        return;
    }

    if (part == kVoxFramePartNotEnd){
        // first part
        if (!part_buffer_.empty()){
            LOG_ERROR(LOG_PREFIX "discard unfinished part frame ("
                      << part_size_ << " bytes)");
            part_buffer_.release();
        }
        part_buffer_ = part_pool_.get(std::max<int32_t>(buf.size() * 2, 64));
        part_size_ = 0;
    } else if (part_buffer_.empty()){
        LOG_ERROR(LOG_PREFIX "missing first part (fr#"
                  << (int)buf.frame_number() << ")");
        return;
    }

    // append
    auto needed = part_size_ + buf.size();
    if (needed > part_buffer_.block()->capacity){
        auto newbuf = part_pool_.get(std::max(needed, part_buffer_.block()->capacity * 2));
        memcpy(newbuf.data(), part_buffer_.data(), part_size_);
        part_buffer_.release();
        part_buffer_ = newbuf;
    }
    if (buf.size() > 0){
        memcpy(part_buffer_.data() + part_size_, buf.data(), buf.size());
    }
    part_size_ = needed;

    if (part == kVoxFramePartNotBeg){
        // last part
        auto out = part_buffer_.rebind(part_size_, buf.flags() & ~kVoxFrameMaskPart,
                                       buf.frame_number());
        part_buffer_ = frame_buffer(); // 'out' owns the reference
        part_size_ = 0;
        decoder_input(out);
        out.release();
    }
}

void vox::receiver_imp::decoder_input(const frame_buffer& buf){
    VoxError err;
    try {
        err = decoder_.input(buf);
    } catch (const std::exception& e){
        LOG_ERROR(LOG_PREFIX "decoder exception: " << e.what());
        return;
    }
    frames_decoded_++;
    if (err != kVoxOk){
        LOG_ERROR(LOG_PREFIX "decoder error: " << vox_strerror(err));
    }
}

void vox::receiver_imp::decoder_input_null(){
    if (!part_buffer_.empty()){
        // a part is missing, so the frame can't be completed
        LOG_DEBUG(LOG_PREFIX "discard incomplete part frame");
        part_buffer_.release();
        part_size_ = 0;
    }
    VoxError err;
    try {
        err = decoder_.input_null();
    } catch (const std::exception& e){
        LOG_ERROR(LOG_PREFIX "decoder exception: " << e.what());
        return;
    }
    if (err != kVoxOk){
        LOG_ERROR(LOG_PREFIX "decoder error: " << vox_strerror(err));
    }
}
