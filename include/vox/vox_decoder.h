/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief decoder sink interface
 *
 * The receiver hands reassembled frames to a decoder. The decoder
 * is owned by the application; the receiver calls `dispose` exactly
 * once when it is disposed.
 */

#pragma once

#include "vox_types.h"

VOX_PACK_BEGIN

typedef struct VoxDecoder
{
    const struct VoxDecoderInterface *interface;
} VoxDecoder;

/** \brief open the decoder
 *
 * Called once before the first frame, either on the thread
 * that creates the receiver or on the decode thread.
 */
typedef VoxError (VOX_CALL *VoxDecoderOpenFunc)(
        VoxDecoder *decoder,        // the decoder instance
        const VoxStreamInfo *info   // the stream description
);

/** \brief pass a frame to the decoder
 *
 * A null frame (`data == NULL`) signals a missing frame.
 * Errors are logged by the receiver; the stream continues.
 */
typedef VoxError (VOX_CALL *VoxDecoderInputFunc)(
        VoxDecoder *decoder,        // the decoder instance
        const VoxFrame *frame       // the frame
);

/** \brief dispose the decoder */
typedef void (VOX_CALL *VoxDecoderDisposeFunc)(VoxDecoder *decoder);

typedef struct VoxDecoderInterface
{
    VoxDecoderOpenFunc open;
    VoxDecoderInputFunc input;
    VoxDecoderDisposeFunc dispose;
} VoxDecoderInterface;

VOX_PACK_END
