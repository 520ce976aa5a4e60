/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#include "vox/vox_osc.h"
#include "vox/vox_receiver.hpp"

#include "common/utils.hpp"

#include "oscpack/osc/OscOutboundPacketStream.h"
#include "oscpack/osc/OscReceivedElements.h"

#include <cstdio>
#include <cstring>

namespace vox {
namespace osc_binding {

const int32_t frame_nargs = 5;

// "/vox/<id>/frame"; returns the voice ID or -1
static int32_t parse_address(const char *address){
    const auto domain_len = sizeof(kVoxMsgDomain) - 1;
    if (strncmp(address, kVoxMsgDomain "/", domain_len + 1) != 0){
        return -1;
    }
    auto p = address + domain_len + 1;
    int32_t id = 0;
    auto start = p;
    while (*p >= '0' && *p <= '9'){
        id = id * 10 + (*p - '0');
        if (id > 99999999){
            return -1;
        }
        p++;
    }
    if (p == start || strcmp(p, kVoxMsgFrame) != 0){
        return -1;
    }
    return id;
}

} // osc_binding
} // vox

VOX_API VoxError VOX_CALL vox_oscWriteFrame(
        VoxByte *buffer, VoxInt32 *size,
        VoxId voiceId, VoxInt32 channelId, VoxUInt16 eventNumber,
        VoxUInt8 frameNumber, VoxFlag flags,
        const VoxByte *data, VoxInt32 dataSize)
{
    if (!buffer || !size || dataSize < 0 || (dataSize > 0 && !data)){
        return kVoxErrorBadArgument;
    }
    char address[kVoxMsgMaxAddressSize];
    snprintf(address, sizeof(address), "%s/%d%s",
             kVoxMsgDomain, (int)voiceId, kVoxMsgFrame);
    try {
        osc::OutboundPacketStream msg((char *)buffer, *size);
        msg << osc::BeginMessage(address) << (osc::int32)channelId
            << (osc::int32)eventNumber << (osc::int32)frameNumber
            << (osc::int32)flags << osc::Blob(data, dataSize)
            << osc::EndMessage;
        *size = msg.Size();
        return kVoxOk;
    } catch (const osc::OutOfBufferMemoryException& e){
        LOG_ERROR("vox_oscWriteFrame: buffer too small (" << *size
                  << " bytes) for " << dataSize << " bytes payload");
        return kVoxErrorInsufficientBuffer;
    }
}

VOX_API VoxError VOX_CALL vox_oscParseFrame(
        const VoxByte *data, VoxInt32 size, VoxOscFrame *frame)
{
    if (!data || size <= 0 || !frame){
        return kVoxErrorBadArgument;
    }
    try {
        osc::ReceivedPacket packet((const char *)data, size);
        if (!packet.IsMessage()){
            LOG_WARNING("vox_oscParseFrame: not an OSC message");
            return kVoxErrorBadArgument;
        }
        osc::ReceivedMessage msg(packet);

        auto id = vox::osc_binding::parse_address(msg.AddressPattern());
        if (id < 0){
            LOG_WARNING("vox_oscParseFrame: unknown message '"
                        << msg.AddressPattern() << "'");
            return kVoxErrorBadArgument;
        }
        if (msg.ArgumentCount() != vox::osc_binding::frame_nargs){
            LOG_ERROR("vox_oscParseFrame: wrong number of arguments ("
                      << msg.ArgumentCount() << ")");
            return kVoxErrorBadArgument;
        }

        auto it = msg.ArgumentsBegin();
        frame->voiceId = id;
        frame->channelId = (it++)->AsInt32();
        auto event = (it++)->AsInt32();
        auto framenum = (it++)->AsInt32();
        frame->flags = (VoxFlag)(it++)->AsInt32();
        const void *blobdata;
        osc::osc_bundle_element_size_t blobsize;
        (it++)->AsBlob(blobdata, blobsize);

        if (event < 0 || event > 0xffff || framenum < 0 || framenum > 0xff){
            LOG_ERROR("vox_oscParseFrame: bad event/frame number ("
                      << event << "/" << framenum << ")");
            return kVoxErrorBadArgument;
        }
        frame->eventNumber = (VoxUInt16)event;
        frame->frameNumber = (VoxUInt8)framenum;
        frame->data = (const VoxByte *)blobdata;
        frame->size = blobsize;
        return kVoxOk;
    } catch (const osc::Exception& e){
        LOG_ERROR("vox_oscParseFrame: " << e.what());
        return kVoxErrorBadArgument;
    }
}

VOX_API VoxError VOX_CALL vox_oscHandleMessage(
        VoxReceiver *receiver, const VoxByte *data, VoxInt32 size)
{
    VoxOscFrame frame;
    auto err = vox_oscParseFrame(data, size, &frame);
    if (err != kVoxOk){
        return err;
    }
    VoxId id = 0;
    err = receiver->getId(id);
    if (err != kVoxOk){
        return err;
    }
    if (frame.voiceId != id){
        LOG_WARNING("vox_oscHandleMessage: wrong voice ID " << frame.voiceId
                    << " (expected " << id << ")");
        return kVoxErrorNotFound;
    }
    return receiver->receiveEvent(frame.data, frame.size, frame.eventNumber,
                                  frame.flags, frame.frameNumber);
}
