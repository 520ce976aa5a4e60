/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief C interface for the frame sender
 *
 * The sender turns encoded frames into one or more network events.
 * It is not threadsafe with respect to VoxSender_sendFrame();
 * controls may be called from any thread.
 */

#pragma once

#include "vox.h"
#include "vox_controls.h"

VOX_PACK_BEGIN

/** \brief sender settings */
typedef struct VoxSenderSettings
{
    /** the voice ID */
    VoxId voiceId;
    /** the channel ID */
    VoxInt32 channelId;
    /** event buffer (ring) size; 0: default (256) */
    VoxInt32 eventBufferSize;
    /** FEC group size; 0: disabled */
    VoxInt32 fec;
    /** enable fragmentation */
    VoxBool fragment;
    /** max. event payload size of the transport; 0: unlimited */
    VoxInt32 maxPayloadSize;
    /** part size; 0: no parts */
    VoxInt32 partSize;
    /** send parameters */
    VoxSendParams params;
} VoxSenderSettings;

VOX_PACK_END

/** \brief initialize sender settings with default values */
VOX_API void VOX_CALL VoxSenderSettings_init(VoxSenderSettings *settings);

typedef struct VoxSender VoxSender;

/** \brief create a new sender
 *
 * \param settings the sender settings
 * \param[out] err error code on failure
 * \return new VoxSender instance on success; `NULL` on failure
 */
VOX_API VoxSender * VOX_CALL VoxSender_new(
        const VoxSenderSettings *settings, VoxError *err);

/** \brief destroy the sender */
VOX_API void VOX_CALL VoxSender_free(VoxSender *sender);

/** \brief send an encoded frame
 *
 * \param sender the sender
 * \param data the frame data
 * \param size the frame size in bytes
 * \param flags frame flags (e.g. #kVoxFrameConfig)
 * \param fn the send function; called once per network event
 * \param user user data passed to the send function
 */
VOX_API VoxError VOX_CALL VoxSender_sendFrame(
        VoxSender *sender, const VoxByte *data, VoxInt32 size,
        VoxFlag flags, VoxSendFunc fn, void *user);

/** \brief resend the last config frame (e.g. to a new peer)
 *
 * \return #kVoxErrorNotFound if no config frame has been sent yet
 */
VOX_API VoxError VOX_CALL VoxSender_sendConfig(
        VoxSender *sender, VoxSendFunc fn, void *user);

/** \brief control interface
 *
 * used internally by helper functions for specific controls
 */
VOX_API VoxError VOX_CALL VoxSender_control(
        VoxSender *sender, VoxCtl ctl, VoxIntPtr index, void *data, VoxSize size);

/*--------------------------------------------*/
/*         type-safe control functions        */
/*--------------------------------------------*/

/** \brief set FEC group size (0: disabled) */
VOX_INLINE VoxError VoxSender_setFec(VoxSender *sender, VoxInt32 n)
{
    return VoxSender_control(sender, kVoxCtlSetFec, 0, VOX_ARG(n));
}

/** \brief enable/disable fragmentation */
VOX_INLINE VoxError VoxSender_setFragment(VoxSender *sender, VoxBool b)
{
    return VoxSender_control(sender, kVoxCtlSetFragment, 0, VOX_ARG(b));
}

/** \brief set max. event payload size */
VOX_INLINE VoxError VoxSender_setMaxPayloadSize(VoxSender *sender, VoxInt32 n)
{
    return VoxSender_control(sender, kVoxCtlSetMaxPayloadSize, 0, VOX_ARG(n));
}

/** \brief get statistics */
VOX_INLINE VoxError VoxSender_getStats(VoxSender *sender, VoxSenderStats *stats)
{
    return VoxSender_control(sender, kVoxCtlGetStats, 0, VOX_ARG(*stats));
}
