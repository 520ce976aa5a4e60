/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief C++ interface for the frame receiver
 */

#pragma once

#include "vox_receiver.h"

#include <memory>

/** \brief frame receiver interface */
struct VoxReceiver {
public:
    /** \brief custom deleter for VoxReceiver */
    class Deleter {
    public:
        void operator()(VoxReceiver *obj){
            VoxReceiver_free(obj);
        }
    };

    /** \brief smart pointer for receiver instance */
    using Ptr = std::unique_ptr<VoxReceiver, Deleter>;

    /** \brief create a new managed receiver instance
     *
     * \copydetails VoxReceiver_new()
     */
    static Ptr create(const VoxReceiverSettings& settings, VoxError *err) {
        return Ptr(VoxReceiver_new(&settings, err));
    }

    /*-------------------- methods -----------------------------*/

    /** \copydoc VoxReceiver_receiveEvent() */
    virtual VoxError VOX_CALL receiveEvent(
            const VoxByte *data, VoxInt32 size, VoxUInt16 eventNumber,
            VoxFlag flags, VoxUInt8 frameNumber) = 0;

    /** \copydoc VoxReceiver_dispose() */
    virtual VoxError VOX_CALL dispose() = 0;

    /** \copydoc VoxReceiver_control() */
    virtual VoxError VOX_CALL control(
            VoxCtl ctl, VoxIntPtr index, void *data, VoxSize size) = 0;

    /*--------------------------------------------*/
    /*         type-safe control functions        */
    /*--------------------------------------------*/

    VoxError getId(VoxId& id) {
        return control(kVoxCtlGetId, 0, VOX_ARG(id));
    }

    VoxError getEventBufferSize(VoxInt32& n) {
        return control(kVoxCtlGetEventBufferSize, 0, VOX_ARG(n));
    }

    VoxError setDelayFrames(VoxInt32 n) {
        return control(kVoxCtlSetDelayFrames, 0, VOX_ARG(n));
    }

    VoxError getDelayFrames(VoxInt32& n) {
        return control(kVoxCtlGetDelayFrames, 0, VOX_ARG(n));
    }

    VoxError getStats(VoxReceiverStats& stats) {
        return control(kVoxCtlGetStats, 0, VOX_ARG(stats));
    }

    VoxError resetStats() {
        return control(kVoxCtlResetStats, 0, nullptr, 0);
    }

    VoxError startSpacingProfile() {
        return control(kVoxCtlStartSpacingProfile, 0, nullptr, 0);
    }

    VoxError getSpacingProfileMax(VoxInt32& ms) {
        return control(kVoxCtlGetSpacingProfileMax, 0, VOX_ARG(ms));
    }
protected:
    ~VoxReceiver(){} // non-virtual!
};
