/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief C interface for the frame receiver
 *
 * The receiver stores incoming events in a ring buffer, recovers lost
 * events with FEC, reassembles fragmented and multi-part frames and
 * passes the frames in order to a decoder.
 */

#pragma once

#include "vox.h"
#include "vox_controls.h"
#include "vox_decoder.h"

VOX_PACK_BEGIN

/** \brief receiver settings */
typedef struct VoxReceiverSettings
{
    /** the voice ID */
    VoxId voiceId;
    /** the channel ID */
    VoxInt32 channelId;
    /** event buffer (ring) size; 0: default (256); max. 2048
     * \note must match the sender's event buffer size */
    VoxInt32 eventBufferSize;
    /** delay in frames; 0: automatic */
    VoxInt32 delayFrames;
    /** receiver flags (e.g. #kVoxReceiverThreaded) */
    VoxFlag flags;
    /** the decoder (required) */
    VoxDecoder *decoder;
    /** the stream info passed to the decoder (optional) */
    const VoxStreamInfo *info;
} VoxReceiverSettings;

VOX_PACK_END

/** \brief initialize receiver settings with default values */
VOX_API void VOX_CALL VoxReceiverSettings_init(VoxReceiverSettings *settings);

typedef struct VoxReceiver VoxReceiver;

/** \brief create a new receiver
 *
 * Opens the decoder, either immediately or on the decode thread.
 *
 * \param settings the receiver settings
 * \param[out] err error code on failure
 * \return new VoxReceiver instance on success; `NULL` on failure
 */
VOX_API VoxReceiver * VOX_CALL VoxReceiver_new(
        const VoxReceiverSettings *settings, VoxError *err);

/** \brief dispose and destroy the receiver */
VOX_API void VOX_CALL VoxReceiver_free(VoxReceiver *receiver);

/** \brief receive a network event
 *
 * \note Threadsafe; can be called concurrently from several network threads.
 *
 * \param receiver the receiver
 * \param data the event payload
 * \param size the payload size
 * \param eventNumber the (modular) event number
 * \param flags frame flags
 * \param frameNumber the (modular) frame number
 * \return #kVoxErrorIdle if the receiver has been disposed
 */
VOX_API VoxError VOX_CALL VoxReceiver_receiveEvent(
        VoxReceiver *receiver, const VoxByte *data, VoxInt32 size,
        VoxUInt16 eventNumber, VoxFlag flags, VoxUInt8 frameNumber);

/** \brief dispose the receiver
 *
 * Stops the decode thread, releases all frames and disposes the decoder.
 * Subsequent calls to VoxReceiver_receiveEvent() return #kVoxErrorIdle.
 */
VOX_API VoxError VOX_CALL VoxReceiver_dispose(VoxReceiver *receiver);

/** \brief control interface
 *
 * used internally by helper functions for specific controls
 */
VOX_API VoxError VOX_CALL VoxReceiver_control(
        VoxReceiver *receiver, VoxCtl ctl, VoxIntPtr index, void *data, VoxSize size);

/*--------------------------------------------*/
/*         type-safe control functions        */
/*--------------------------------------------*/

/** \brief set delay in frames (0: automatic) */
VOX_INLINE VoxError VoxReceiver_setDelayFrames(VoxReceiver *receiver, VoxInt32 n)
{
    return VoxReceiver_control(receiver, kVoxCtlSetDelayFrames, 0, VOX_ARG(n));
}

/** \brief get statistics */
VOX_INLINE VoxError VoxReceiver_getStats(VoxReceiver *receiver, VoxReceiverStats *stats)
{
    return VoxReceiver_control(receiver, kVoxCtlGetStats, 0, VOX_ARG(*stats));
}
