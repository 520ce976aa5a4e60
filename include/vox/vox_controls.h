/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#pragma once

#include "vox_types.h"

#define VOX_ARG(x) ((void *)&x), sizeof(x)

// controls that can be passed to the *_control() functions.
// arguments:
// VoxCtl 'ctl': control code
// VoxIntPtr 'index': special index (currently unused)
// void * 'data': argument data
// VoxSize 'size': argument size

enum VoxControls
{
    // Get the voice ID (arg: VoxId)
    kVoxCtlGetId = 0,
    // Get the event buffer (ring) size (arg: VoxInt32)
    kVoxCtlGetEventBufferSize,
    // Get statistics (arg: VoxSenderStats resp. VoxReceiverStats)
    kVoxCtlGetStats,
    // Reset statistics (none)
    kVoxCtlResetStats,
    // Start the spacing profile (none)
    // ---
    // Records the intervals between sent resp. received events.
    kVoxCtlStartSpacingProfile,
    // Get the max. interval of the spacing profile in ms (arg: VoxInt32)
    kVoxCtlGetSpacingProfileMax,
    // Set/get FEC group size; 0: disabled (arg: VoxInt32)
    // ---
    // After every N events, the sender emits an additional event
    // that contains the XOR of the previous N events. The receiver
    // can recover one lost event per group.
    kVoxCtlSetFec = 100,
    kVoxCtlGetFec,
    // Enable/disable fragmentation (arg: VoxBool)
    kVoxCtlSetFragment,
    kVoxCtlGetFragment,
    // Set/get the max. event payload size of the transport (arg: VoxInt32)
    // ---
    // Frames that exceed this size are fragmented; 0 means unlimited.
    kVoxCtlSetMaxPayloadSize,
    kVoxCtlGetMaxPayloadSize,
    // Set/get the part size; 0: no parts (arg: VoxInt32)
    kVoxCtlSetPartSize,
    kVoxCtlGetPartSize,
    // Enable/disable transmission (arg: VoxBool)
    kVoxCtlSetTransmitEnabled,
    kVoxCtlGetTransmitEnabled,
    // Check if the sender is currently transmitting (arg: VoxBool)
    kVoxCtlIsTransmitting,
    // Set/get send parameters (arg: VoxSendParams)
    kVoxCtlSetSendParams,
    kVoxCtlGetSendParams,
    // Set/get receiver delay in frames; 0: automatic (arg: VoxInt32)
    // ---
    // The reader trails the latest received frame by this amount.
    // Larger values help with reordering and FEC recovery at the
    // expense of latency. The value is clipped to 127.
    kVoxCtlSetDelayFrames = 200,
    kVoxCtlGetDelayFrames
};
