/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#pragma once

#include "vox/vox_receiver.hpp"

#include "common/lockfree.hpp"
#include "common/sync.hpp"
#include "common/utils.hpp"

#include "decoder.hpp"
#include "delay_control.hpp"
#include "event_ring.hpp"
#include "frame_buffer.hpp"
#include "imp.hpp"
#include "spacing_profile.hpp"

#include <atomic>
#include <thread>

namespace vox {

// FEC cross reference entry: (generation << 16) | FEC event number
using fec_ref = uint32_t;

class receiver_imp final : public VoxReceiver {
public:
    receiver_imp(const VoxReceiverSettings& settings);

    ~receiver_imp();

    // open the decoder resp. start the decode thread
    VoxError init();

    //------------------ API --------------------//

    VoxError VOX_CALL receiveEvent(
            const VoxByte *data, VoxInt32 size, VoxUInt16 eventNumber,
            VoxFlag flags, VoxUInt8 frameNumber) override;

    VoxError VOX_CALL dispose() override;

    VoxError VOX_CALL control(VoxCtl ctl, VoxIntPtr index,
                              void *ptr, VoxSize size) override;

    //----------------------------------------------//

    int32_t event_buffer_size() const { return ev_buf_size_; }

    bool disposed() const { return disposed_.load(); }

    // drain the ring buffer; only called by the reader
    void decode_queue();
private:
    static constexpr uint8_t fec_timeout_inf = 127;
    static constexpr uint32_t fec_ref_none = 0xffffffff;

    // the number of trailing bytes for the fragment count
    int32_t count_size() const {
        return ev_buf_size_ > 256 ? 2 : 1;
    }

    //------------------ writer --------------------//

    void receive_config(const frame_buffer& buf, uint16_t ev);

    void receive_fec(const frame_buffer& buf, uint16_t ev);

    void receive_regular(const frame_buffer& buf, uint16_t ev);

    //------------------ reader --------------------//

    int32_t process_frame(uint16_t ev, uint8_t max_frame_read_pos);

    int32_t process_fragments(uint16_t ev, const frame_buffer& first,
                              uint8_t max_frame_read_pos);

    bool process_lost_event(uint16_t ev);

    bool recover_lost_event(uint16_t ev, uint16_t fec_ev);

    void decoder_input_partial(const frame_buffer& buf);

    void decoder_input(const frame_buffer& buf);

    void decoder_input_null();

    void flush_config_queue();

    void run_decode_thread();

    //------------------ data --------------------//

    const VoxId id_;
    const int32_t channel_;
    const int32_t ev_buf_size_;
    const int32_t clear_lag_;
    const bool threaded_;
    // rings
    event_ring events_;
    event_ring fec_events_;
    std::unique_ptr<std::atomic<fec_ref>[]> fec_xored_events_;
    std::atomic<uint16_t> fec_generation_{0};
    std::atomic<uint8_t> fec_event_timeout_{fec_timeout_inf};
    // cursors
    std::atomic<bool> started_{false};
    std::atomic<uint8_t> frame_write_pos_{0};
    std::atomic<uint8_t> frame_read_pos_{0};
    std::atomic<uint16_t> event_read_pos_{0};
    delay_control delay_;
    // config frames
    lockfree::unbounded_mpsc_queue<frame_buffer> config_queue_;
    sync::spinlock config_lock_; // serializes consumers
    // buffers
    buffer_pool receive_pool_;
    assembly_pool fragment_pool_;
    assembly_pool part_pool_;
    frame_buffer part_buffer_;
    int32_t part_size_ = 0;
    // decoder
    vox::decoder decoder_;
    std::thread thread_;
    sync::event event_;
    sync::padded_spinlock decode_lock_; // synchronous mode
    std::atomic<bool> decode_pending_{false};
    sync::mutex dispose_mutex_;
    std::atomic<bool> disposed_{false};
    std::atomic<bool> decoding_{false};
    std::atomic<int32_t> receiving_{0};
    spacing_profile spacing_;
    // statistics
    std::atomic<int64_t> events_received_{0};
    std::atomic<int64_t> fec_events_received_{0};
    std::atomic<int64_t> events_lost_{0};
    std::atomic<int64_t> frames_lost_{0};
    std::atomic<int64_t> frames_late_{0};
    std::atomic<int64_t> frames_recovered_{0};
    std::atomic<int64_t> frames_try_fec_{0};
    std::atomic<int64_t> frames_received_fragmented_{0};
    std::atomic<int64_t> frames_received_fragments_{0};
    std::atomic<int64_t> frames_frag_part_{0};
    std::atomic<int64_t> frames_decoded_{0};
    std::atomic<int64_t> discontinuities_{0};
    std::atomic<int64_t> config_frames_dropped_{0};
};

} // vox
