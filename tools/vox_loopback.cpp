/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

// pushes frames through a sender, the OSC binding, a lossy channel
// and a receiver, then prints the statistics of both ends.

#include "vox/vox.h"
#include "vox/vox_decoder.hpp"
#include "vox/vox_osc.h"
#include "vox/vox_receiver.hpp"
#include "vox/vox_sender.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <random>
#include <vector>

namespace {

struct options {
    int frames = 500;
    int size = 200;
    int fec = 0;
    int loss = 0; // percent
    int reorder = 0; // percent
    int ringsize = 256;
    int maxpayload = 0;
    int delay = 0;
    int seed = 1;
    bool threaded = false;
    bool verbose = false;
};

void usage(){
    fprintf(stderr,
            "usage: vox_loopback [options]\n"
            "  -n <frames>      number of frames (500)\n"
            "  -s <bytes>       frame size (200)\n"
            "  -f <k>           FEC group size, 0 = off (0)\n"
            "  -l <percent>     event loss (0)\n"
            "  -r <percent>     swap adjacent events (0)\n"
            "  -b <events>      event buffer size (256)\n"
            "  -m <bytes>       max. payload size; enables fragmentation (0)\n"
            "  -d <frames>      receiver delay (0)\n"
            "  -x <seed>        random seed (1)\n"
            "  -t               threaded receiver\n"
            "  -v               verbose logging\n");
}

bool parse_options(int argc, char *argv[], options& opts){
    for (int i = 1; i < argc; ++i){
        const char *arg = argv[i];
        if (arg[0] != '-' || arg[1] == 0 || arg[2] != 0){
            return false;
        }
        switch (arg[1]){
        case 't':
            opts.threaded = true;
            continue;
        case 'v':
            opts.verbose = true;
            continue;
        default:
            break;
        }
        if (i + 1 >= argc){
            return false;
        }
        int value = atoi(argv[++i]);
        switch (arg[1]){
        case 'n': opts.frames = value; break;
        case 's': opts.size = value; break;
        case 'f': opts.fec = value; break;
        case 'l': opts.loss = value; break;
        case 'r': opts.reorder = value; break;
        case 'b': opts.ringsize = value; break;
        case 'm': opts.maxpayload = value; break;
        case 'd': opts.delay = value; break;
        case 'x': opts.seed = value; break;
        default:
            return false;
        }
    }
    return opts.frames > 0 && opts.size > 0;
}

// collects serialized events until the next flush
class lossy_channel {
public:
    lossy_channel(const options& opts)
        : loss_(opts.loss), reorder_(opts.reorder), rng_(opts.seed) {}

    static VoxInt32 VOX_CALL send(void *user, const VoxByte *data, VoxInt32 size,
                                  VoxFlag flags, VoxUInt16 eventNumber,
                                  VoxUInt8 frameNumber, VoxId voiceId,
                                  VoxInt32 channelId, const VoxSendParams *params)
    {
        auto self = static_cast<lossy_channel *>(user);
        std::vector<VoxByte> msg(size + kVoxMsgMaxOverhead);
        VoxInt32 msgsize = (VoxInt32)msg.size();
        auto err = vox_oscWriteFrame(msg.data(), &msgsize, voiceId, channelId,
                                     eventNumber, frameNumber, flags, data, size);
        if (err != kVoxOk){
            fprintf(stderr, "could not serialize event: %s\n", vox_strerror(err));
            return 0;
        }
        msg.resize(msgsize);
        self->pending_.push_back(std::move(msg));
        return size;
    }

    // deliver (or drop) all pending events
    void flush(VoxReceiver& receiver){
        std::uniform_int_distribution<int> dist(0, 99);
        for (size_t i = 0; i + 1 < pending_.size(); ++i){
            if (dist(rng_) < reorder_){
                std::swap(pending_[i], pending_[i + 1]);
                i++;
            }
        }
        for (auto& msg : pending_){
            if (dist(rng_) < loss_){
                dropped_++;
                continue;
            }
            auto err = vox_oscHandleMessage(&receiver, msg.data(), (VoxInt32)msg.size());
            if (err != kVoxOk){
                fprintf(stderr, "could not handle message: %s\n", vox_strerror(err));
            }
            delivered_++;
        }
        pending_.clear();
    }

    int dropped() const { return dropped_; }

    int delivered() const { return delivered_; }
private:
    int loss_;
    int reorder_;
    std::mt19937 rng_;
    std::vector<std::vector<VoxByte>> pending_;
    int dropped_ = 0;
    int delivered_ = 0;
};

bool g_verbose = false;

void VOX_CALL log_function(VoxLogLevel level, const VoxChar *msg){
    if (g_verbose || level <= kVoxLogLevelWarning){
        fprintf(stderr, "%s\n", msg);
    }
}

} // namespace

int main(int argc, char *argv[]){
    options opts;
    if (!parse_options(argc, argv, opts)){
        usage();
        return EXIT_FAILURE;
    }

    g_verbose = opts.verbose;
    vox_initializeEx(log_function, nullptr);

    VoxSenderSettings ss;
    VoxSenderSettings_init(&ss);
    ss.voiceId = 1;
    ss.eventBufferSize = opts.ringsize;
    ss.fec = opts.fec;
    ss.fragment = opts.maxpayload > 0;
    ss.maxPayloadSize = opts.maxpayload;

    VoxError err;
    VoxSender::Ptr sender(VoxSender::create(ss, &err));
    if (!sender){
        fprintf(stderr, "could not create sender: %s\n", vox_strerror(err));
        return EXIT_FAILURE;
    }

    int received = 0, missing = 0, corrupted = 0;
    int64_t bytes = 0;
    VoxByteStreamDecoder decoder(
        [&](const VoxFrame& frame){
            received++;
            bytes += frame.size;
            // the first byte repeats in the whole payload
            for (int i = 1; i < frame.size; ++i){
                if (frame.data[i] != frame.data[0]){
                    corrupted++;
                    break;
                }
            }
        },
        [&](){ missing++; });

    VoxStreamInfo info {};
    info.codec = "bytes";

    VoxReceiverSettings rs;
    VoxReceiverSettings_init(&rs);
    rs.voiceId = 1;
    rs.eventBufferSize = opts.ringsize;
    rs.delayFrames = opts.delay;
    rs.flags = opts.threaded ? kVoxReceiverThreaded : 0;
    rs.decoder = &decoder;
    rs.info = &info;

    VoxReceiver::Ptr receiver(VoxReceiver::create(rs, &err));
    if (!receiver){
        fprintf(stderr, "could not create receiver: %s\n", vox_strerror(err));
        return EXIT_FAILURE;
    }

    lossy_channel channel(opts);
    std::vector<VoxByte> frame(opts.size);
    for (int i = 0; i < opts.frames; ++i){
        std::fill(frame.begin(), frame.end(), (VoxByte)i);
        VoxFlag flags = (i == opts.frames - 1) ? kVoxFrameEndOfStream : 0;
        err = sender->sendFrame(frame.data(), (VoxInt32)frame.size(), flags,
                                lossy_channel::send, &channel);
        if (err != kVoxOk){
            fprintf(stderr, "could not send frame %d: %s\n", i, vox_strerror(err));
            return EXIT_FAILURE;
        }
        channel.flush(*receiver);
    }
    receiver->dispose();

    VoxSenderStats sst;
    sender->getStats(sst);
    VoxReceiverStats rst;
    receiver->getStats(rst);

    printf("sender:   frames %lld, events %lld, FEC events %lld, fragmented %lld\n",
           (long long)sst.framesSent, (long long)sst.eventsSent,
           (long long)sst.fecEventsSent, (long long)sst.framesSentFragmented);
    printf("channel:  delivered %d, dropped %d\n",
           channel.delivered(), channel.dropped());
    printf("receiver: events %lld, lost %lld, late %lld, recovered %lld/%lld, "
           "partial %lld, discontinuities %lld\n",
           (long long)rst.eventsReceived, (long long)rst.eventsLost,
           (long long)rst.framesLate, (long long)rst.framesRecovered,
           (long long)rst.framesTryFec, (long long)rst.framesFragPart,
           (long long)rst.discontinuities);
    printf("decoder:  frames %d (%lld bytes), missing %d, corrupted %d\n",
           received, (long long)bytes, missing, corrupted);

    receiver.reset();
    sender.reset();
    vox_terminate();
    return EXIT_SUCCESS;
}
