/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief C++ helpers for decoder sinks
 */

#pragma once

#include "vox_decoder.h"

#include <functional>

/** \brief base class for C++ decoders
 *
 * Derive from this class and override the virtual methods.
 * An instance can be passed directly to VoxReceiverSettings::decoder.
 */
class VoxDecoderBase : public VoxDecoder {
public:
    VoxDecoderBase() {
        static const VoxDecoderInterface table = {
            doOpen, doInput, doDispose
        };
        interface = &table;
    }

    VoxDecoderBase(const VoxDecoderBase&) = delete;
    VoxDecoderBase& operator=(const VoxDecoderBase&) = delete;

    virtual ~VoxDecoderBase() {}

    virtual VoxError open(const VoxStreamInfo& info) = 0;

    virtual VoxError input(const VoxFrame& frame) = 0;

    virtual void dispose() {}
private:
    static VoxError VOX_CALL doOpen(VoxDecoder *dec, const VoxStreamInfo *info) {
        return static_cast<VoxDecoderBase *>(dec)->open(*info);
    }

    static VoxError VOX_CALL doInput(VoxDecoder *dec, const VoxFrame *frame) {
        return static_cast<VoxDecoderBase *>(dec)->input(*frame);
    }

    static void VOX_CALL doDispose(VoxDecoder *dec) {
        static_cast<VoxDecoderBase *>(dec)->dispose();
    }
};

/** \brief passthrough decoder for raw byte streams
 *
 * Forwards every frame to the output function and
 * reports missing (null) frames separately.
 */
class VoxByteStreamDecoder : public VoxDecoderBase {
public:
    using OutputFunc = std::function<void(const VoxFrame&)>;
    using MissingFunc = std::function<void()>;

    VoxByteStreamDecoder(OutputFunc output, MissingFunc missing = nullptr)
        : output_(std::move(output)), missing_(std::move(missing)) {}

    VoxError open(const VoxStreamInfo& info) override {
        return kVoxOk;
    }

    VoxError input(const VoxFrame& frame) override {
        if (frame.data == nullptr || frame.size == 0) {
            if (missing_) {
                missing_();
            }
        } else if (output_) {
            output_(frame);
        }
        return kVoxOk;
    }
private:
    OutputFunc output_;
    MissingFunc missing_;
};
