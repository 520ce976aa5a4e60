/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief typedefs and structs
 */

#pragma once

#include "vox_defines.h"

#include <stdint.h>
#include <stddef.h>

VOX_PACK_BEGIN

/*----------------- general data types -----------------*/

/** \brief boolean type */
typedef int32_t VoxBool;

/** \brief 'true' boolean constant */
#define kVoxTrue ((VoxBool)1)
/** \brief 'false' boolean constant */
#define kVoxFalse ((VoxBool)0)

/** \brief character type */
typedef char VoxChar;

/** \brief byte type */
typedef uint8_t VoxByte;

/** \brief 8-bit unsigned integer */
typedef uint8_t VoxUInt8;

/** \brief 16-bit signed integer */
typedef int16_t VoxInt16;
/** \brief 16-bit unsigned integer */
typedef uint16_t VoxUInt16;

/** \brief 32-bit signed integer */
typedef int32_t VoxInt32;
/** \brief 32-bit unsigned integer */
typedef uint32_t VoxUInt32;

/** \brief 64-bit signed integer */
typedef int64_t VoxInt64;
/** \brief 64-bit unsigned integer */
typedef uint64_t VoxUInt64;

/** \brief size type */
typedef size_t VoxSize;

/** \brief pointer-sized signed integer */
typedef intptr_t VoxIntPtr;

/*---------------- semantic data types -----------------*/

/** \brief error code */
typedef VoxInt32 VoxError;

/** \brief flags */
typedef VoxUInt32 VoxFlag;

/** \brief voice ID */
typedef VoxInt32 VoxId;

/** \brief log level */
typedef VoxInt32 VoxLogLevel;

/** \brief control code */
typedef VoxInt32 VoxCtl;

/*------------------ frames ----------------------------*/

/** \brief opaque frame handle (reference counted) */
typedef struct VoxFrameHandle VoxFrameHandle;

/** \brief a frame passed to the decoder
 *
 * A "null frame" (`data == NULL`, `size == 0`) marks a missing frame.
 * The data is only valid for the duration of the decoder call;
 * use vox_frameRetain() resp. vox_frameRelease() to keep it longer.
 */
typedef struct VoxFrame
{
    /** frame data */
    const VoxByte *data;
    /** frame size in bytes */
    VoxInt32 size;
    /** frame flags */
    VoxFlag flags;
    /** the (modular) frame number */
    VoxUInt8 frameNumber;
    /** internal handle */
    VoxFrameHandle *handle;
} VoxFrame;

/** \brief stream description passed to the decoder */
typedef struct VoxStreamInfo
{
    /** codec name (may be NULL) */
    const VoxChar *codec;
    /** audio sample rate (0 for video) */
    VoxInt32 sampleRate;
    /** number of audio channels */
    VoxInt32 channels;
    /** frame duration in microseconds */
    VoxInt32 frameDurationUs;
    /** bitrate in bits per second */
    VoxInt32 bitrate;
    /** video width */
    VoxInt32 width;
    /** video height */
    VoxInt32 height;
    /** video frames per second */
    VoxInt32 fps;
    /** video key frame interval */
    VoxInt32 keyFrameInterval;
} VoxStreamInfo;

/*------------------ transport ---------------------------*/

/** \brief per-event send parameters */
typedef struct VoxSendParams
{
    /** send reliably */
    VoxBool reliable;
    /** encrypt the event */
    VoxBool encrypt;
    /** interest group (0: default) */
    VoxUInt8 interestGroup;
} VoxSendParams;

/** \brief send function used by the sender
 *
 * Called once per network event; the transport serializes
 * the arguments into its own message envelope.
 */
typedef VoxInt32 (VOX_CALL *VoxSendFunc)(
        /** the user data */
        void *user,
        /** the event payload */
        const VoxByte *data,
        /** the payload size in bytes */
        VoxInt32 size,
        /** frame flags */
        VoxFlag flags,
        /** the (modular) event number */
        VoxUInt16 eventNumber,
        /** the (modular) frame number */
        VoxUInt8 frameNumber,
        /** the voice ID */
        VoxId voiceId,
        /** the channel ID */
        VoxInt32 channelId,
        /** send parameters */
        const VoxSendParams *params
);

/*------------------ statistics ---------------------------*/

/** \brief sender statistics */
typedef struct VoxSenderStats
{
    /** frames passed to the transport (parts count individually) */
    VoxInt64 framesSent;
    /** total payload bytes */
    VoxInt64 framesSentBytes;
    /** frames that have been fragmented */
    VoxInt64 framesSentFragmented;
    /** number of fragments of all fragmented frames */
    VoxInt64 framesSentFragments;
    /** frames dropped because transmission was disabled */
    VoxInt64 framesSkipped;
    /** regular events sent */
    VoxInt64 eventsSent;
    /** FEC events sent */
    VoxInt64 fecEventsSent;
} VoxSenderStats;

/** \brief receiver statistics */
typedef struct VoxReceiverStats
{
    /** events received (including FEC) */
    VoxInt64 eventsReceived;
    /** FEC events received */
    VoxInt64 fecEventsReceived;
    /** events that could not be recovered */
    VoxInt64 eventsLost;
    /** frames replaced by a null frame */
    VoxInt64 framesLost;
    /** frames that arrived after they were superseded */
    VoxInt64 framesLate;
    /** events recovered with FEC */
    VoxInt64 framesRecovered;
    /** FEC recovery attempts */
    VoxInt64 framesTryFec;
    /** reassembled fragmented frames */
    VoxInt64 framesReceivedFragmented;
    /** continuation fragments consumed */
    VoxInt64 framesReceivedFragments;
    /** fragmented frames with missing fragments */
    VoxInt64 framesFragPart;
    /** frames passed to the decoder (excluding null frames) */
    VoxInt64 framesDecoded;
    /** stream discontinuities */
    VoxInt64 discontinuities;
    /** config frames dropped because the queue was full */
    VoxInt64 configFramesDropped;
} VoxReceiverStats;

/*------------------ library ---------------------------*/

/** \brief custom allocator */
typedef struct VoxAllocator
{
    /** allocate memory */
    void *(VOX_CALL *alloc)(VoxSize size, void *context);
    /** free memory */
    void (VOX_CALL *free)(void *ptr, VoxSize size, void *context);
    /** user context */
    void *context;
} VoxAllocator;

/** \brief custom log function */
typedef void (VOX_CALL *VoxLogFunc)(VoxLogLevel level, const VoxChar *msg);

/*------------------------------------------------------*/

VOX_PACK_END
