/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief OSC binding for transport events
 *
 * Every event is sent as a single OSC message:
 *
 *     /vox/<voiceId>/frame ,iiiib <channel> <event> <frame> <flags> <payload>
 *
 * This is an optional library (`vox_osc`); the core library does not
 * depend on it.
 */

#pragma once

#include "vox_receiver.h"

/** \brief address prefix */
#define kVoxMsgDomain "/vox"
/** \brief frame message suffix */
#define kVoxMsgFrame "/frame"
/** \brief max. length of the address pattern (including the null terminator) */
#define kVoxMsgMaxAddressSize 32
/** \brief OSC overhead in addition to the payload */
#define kVoxMsgMaxOverhead 80

VOX_PACK_BEGIN

/** \brief a parsed frame message
 * \note `data` points into the message buffer */
typedef struct VoxOscFrame
{
    VoxId voiceId;
    VoxInt32 channelId;
    VoxUInt16 eventNumber;
    VoxUInt8 frameNumber;
    VoxFlag flags;
    const VoxByte *data;
    VoxInt32 size;
} VoxOscFrame;

VOX_PACK_END

/** \brief serialize an event as OSC message
 *
 * \param buffer the output buffer
 * \param[in,out] size in: buffer size; out: message size
 * \return #kVoxErrorInsufficientBuffer if the buffer is too small
 */
VOX_API VoxError VOX_CALL vox_oscWriteFrame(
        VoxByte *buffer, VoxInt32 *size,
        VoxId voiceId, VoxInt32 channelId, VoxUInt16 eventNumber,
        VoxUInt8 frameNumber, VoxFlag flags,
        const VoxByte *data, VoxInt32 dataSize);

/** \brief parse an OSC frame message
 * \return #kVoxErrorBadArgument if the message is malformed or
 * not a frame message
 */
VOX_API VoxError VOX_CALL vox_oscParseFrame(
        const VoxByte *msg, VoxInt32 size, VoxOscFrame *frame);

/** \brief parse an OSC frame message and pass it to a receiver
 * \return #kVoxErrorNotFound if the voice ID does not match
 */
VOX_API VoxError VOX_CALL vox_oscHandleMessage(
        VoxReceiver *receiver, const VoxByte *msg, VoxInt32 size);
