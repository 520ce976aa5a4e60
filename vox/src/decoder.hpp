/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#pragma once

#include "vox/vox_decoder.h"

#include "frame_buffer.hpp"

#include <string>

namespace vox {

// wraps the decoder interface of the application
class decoder {
public:
    decoder(VoxDecoder *dec, const VoxStreamInfo *info)
        : decoder_(dec) {
        if (info){
            info_ = *info;
            if (info->codec){
                codec_ = info->codec;
            }
        } else {
            info_ = VoxStreamInfo {};
        }
        info_.codec = codec_.empty() ? nullptr : codec_.c_str();
    }

    decoder(const decoder&) = delete;
    decoder& operator=(const decoder&) = delete;

    const VoxStreamInfo& info() const { return info_; }

    VoxError open() {
        return decoder_->interface->open(decoder_, &info_);
    }

    VoxError input(const frame_buffer& buf) {
        VoxFrame frame;
        buf.to_frame(frame);
        return decoder_->interface->input(decoder_, &frame);
    }

    // a missing frame
    VoxError input_null() {
        VoxFrame frame { nullptr, 0, 0, 0, nullptr };
        return decoder_->interface->input(decoder_, &frame);
    }

    void dispose() {
        if (decoder_){
            decoder_->interface->dispose(decoder_);
            decoder_ = nullptr;
        }
    }
private:
    VoxDecoder *decoder_;
    VoxStreamInfo info_;
    std::string codec_;
};

} // vox
