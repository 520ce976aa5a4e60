/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief C++ interface for the frame sender
 */

#pragma once

#include "vox_sender.h"

#include <memory>

/** \brief frame sender interface */
struct VoxSender {
public:
    /** \brief custom deleter for VoxSender */
    class Deleter {
    public:
        void operator()(VoxSender *obj){
            VoxSender_free(obj);
        }
    };

    /** \brief smart pointer for sender instance */
    using Ptr = std::unique_ptr<VoxSender, Deleter>;

    /** \brief create a new managed sender instance
     *
     * \copydetails VoxSender_new()
     */
    static Ptr create(const VoxSenderSettings& settings, VoxError *err) {
        return Ptr(VoxSender_new(&settings, err));
    }

    /*-------------------- methods -----------------------------*/

    /** \copydoc VoxSender_sendFrame() */
    virtual VoxError VOX_CALL sendFrame(
            const VoxByte *data, VoxInt32 size, VoxFlag flags,
            VoxSendFunc fn, void *user) = 0;

    /** \copydoc VoxSender_sendConfig() */
    virtual VoxError VOX_CALL sendConfig(VoxSendFunc fn, void *user) = 0;

    /** \copydoc VoxSender_control() */
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

    VoxError setFec(VoxInt32 n) {
        return control(kVoxCtlSetFec, 0, VOX_ARG(n));
    }

    VoxError getFec(VoxInt32& n) {
        return control(kVoxCtlGetFec, 0, VOX_ARG(n));
    }

    VoxError setFragment(VoxBool b) {
        return control(kVoxCtlSetFragment, 0, VOX_ARG(b));
    }

    VoxError getFragment(VoxBool& b) {
        return control(kVoxCtlGetFragment, 0, VOX_ARG(b));
    }

    VoxError setMaxPayloadSize(VoxInt32 n) {
        return control(kVoxCtlSetMaxPayloadSize, 0, VOX_ARG(n));
    }

    VoxError getMaxPayloadSize(VoxInt32& n) {
        return control(kVoxCtlGetMaxPayloadSize, 0, VOX_ARG(n));
    }

    VoxError setPartSize(VoxInt32 n) {
        return control(kVoxCtlSetPartSize, 0, VOX_ARG(n));
    }

    VoxError getPartSize(VoxInt32& n) {
        return control(kVoxCtlGetPartSize, 0, VOX_ARG(n));
    }

    VoxError setTransmitEnabled(VoxBool b) {
        return control(kVoxCtlSetTransmitEnabled, 0, VOX_ARG(b));
    }

    VoxError getTransmitEnabled(VoxBool& b) {
        return control(kVoxCtlGetTransmitEnabled, 0, VOX_ARG(b));
    }

    VoxError isTransmitting(VoxBool& b) {
        return control(kVoxCtlIsTransmitting, 0, VOX_ARG(b));
    }

    VoxError setSendParams(const VoxSendParams& p) {
        return control(kVoxCtlSetSendParams, 0, (void *)&p, sizeof(p));
    }

    VoxError getSendParams(VoxSendParams& p) {
        return control(kVoxCtlGetSendParams, 0, VOX_ARG(p));
    }

    VoxError getStats(VoxSenderStats& stats) {
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
    ~VoxSender(){} // non-virtual!
};
