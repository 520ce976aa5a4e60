/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#pragma once

#include "vox/vox_sender.hpp"

#include "common/sync.hpp"
#include "common/utils.hpp"

#include "imp.hpp"
#include "spacing_profile.hpp"

#include <atomic>

namespace vox {

struct sendfn {
    sendfn(VoxSendFunc fn = nullptr, void *user = nullptr)
        : fn_(fn), user_(user) {}

    void operator() (const VoxByte *data, VoxInt32 size, VoxFlag flags,
                     uint16_t event, uint8_t frame, VoxId id, int32_t channel,
                     const VoxSendParams& params) const {
        fn_(user_, data, size, flags, event, frame, id, channel, &params);
    }
private:
    VoxSendFunc fn_;
    void *user_;
};

class sender_imp final : public VoxSender {
public:
    sender_imp(const VoxSenderSettings& settings);

    ~sender_imp();

    //------------------ API --------------------//

    VoxError VOX_CALL sendFrame(
            const VoxByte *data, VoxInt32 size, VoxFlag flags,
            VoxSendFunc fn, void *user) override;

    VoxError VOX_CALL sendConfig(VoxSendFunc fn, void *user) override;

    VoxError VOX_CALL control(VoxCtl ctl, VoxIntPtr index,
                              void *ptr, VoxSize size) override;

    //----------------------------------------------//

    VoxId id() const { return id_; }

    int32_t event_buffer_size() const { return ev_buf_size_; }

    // the next event number
    uint16_t event_number() const { return event_number_; }
private:
    // the number of trailing bytes for the fragment count
    int32_t count_size() const {
        return ev_buf_size_ > 256 ? 2 : 1;
    }
    // the size of the FEC trailer
    int32_t fec_info_size() const {
        return ev_buf_size_ > 256 ? 6 : 5;
    }

    VoxError send_parts(const VoxByte *data, int32_t size,
                        VoxFlag flags, const sendfn& fn);

    VoxError send_frame(const VoxByte *data, int32_t size,
                        VoxFlag flags, const sendfn& fn);

    void send_event(const VoxByte *data, int32_t size, VoxFlag flags,
                    uint8_t frame, const sendfn& fn);

    void fec_accumulate(const VoxByte *data, int32_t size,
                        VoxFlag flags, uint8_t frame);

    void send_fec(const sendfn& fn);

    void fec_reset();

    VoxSendParams send_params() const {
        sync::scoped_lock<sync::spinlock> lock(params_lock_);
        return params_;
    }

    const VoxId id_;
    const int32_t channel_;
    const int32_t ev_buf_size_;
    uint16_t event_number_ = 0;
    uint8_t frame_number_ = 0;
    // settings
    std::atomic<int32_t> fec_{0};
    std::atomic<bool> fragment_{false};
    std::atomic<int32_t> max_payload_size_{0};
    std::atomic<int32_t> part_size_{VOX_PART_SIZE};
    std::atomic<bool> transmit_enabled_{true};
    VoxSendParams params_;
    mutable sync::spinlock params_lock_;
    // last config frame
    vox::vector<VoxByte> config_;
    VoxFlag config_flags_ = 0;
    bool have_config_ = false;
    // first fragment + fragment count
    vox::vector<VoxByte> sendbuffer_;
    // FEC accumulator
    vox::vector<VoxByte> fec_buffer_;
    int32_t fec_count_ = 0;
    int32_t fec_max_size_ = 0;
    int32_t fec_total_size_ = 0;
    uint8_t fec_flags_ = 0;
    uint8_t fec_frame_ = 0;
    // timing
    std::atomic<int64_t> last_transmit_{-1}; // ms
    spacing_profile spacing_;
    // statistics
    std::atomic<int64_t> frames_sent_{0};
    std::atomic<int64_t> frames_sent_bytes_{0};
    std::atomic<int64_t> frames_sent_fragmented_{0};
    std::atomic<int64_t> frames_sent_fragments_{0};
    std::atomic<int64_t> frames_skipped_{0};
    std::atomic<int64_t> events_sent_{0};
    std::atomic<int64_t> fec_events_sent_{0};
};

} // vox
