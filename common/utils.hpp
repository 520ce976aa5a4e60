/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#pragma once

#include "vox/vox_types.h"

#include <stdint.h>
#include <cstring>
#include <sstream>
#include <string>
#include <utility>

#define DO_LOG(level, msg) do { vox::Log(level) << msg; } while (false)
#define DO_LOG_ERROR(msg) DO_LOG(kVoxLogLevelError, msg)
#define DO_LOG_WARNING(msg) DO_LOG(kVoxLogLevelWarning, msg)
#define DO_LOG_VERBOSE(msg) DO_LOG(kVoxLogLevelVerbose, msg)
#define DO_LOG_DEBUG(msg) DO_LOG(kVoxLogLevelDebug, msg)

// NB: the preprocessor can't see the enum constants, so the levels
// below are compared as plain numbers.

#if VOX_LOG_LEVEL >= 1 /* kVoxLogLevelError */
 #define LOG_ERROR(x) DO_LOG_ERROR(x)
#else
 #define LOG_ERROR(x)
#endif

#if VOX_LOG_LEVEL >= 2 /* kVoxLogLevelWarning */
 #define LOG_WARNING(x) DO_LOG_WARNING(x)
#else
 #define LOG_WARNING(x)
#endif

#if VOX_LOG_LEVEL >= 3 /* kVoxLogLevelVerbose */
 #define LOG_VERBOSE(x) DO_LOG_VERBOSE(x)
#else
 #define LOG_VERBOSE(x)
#endif

#if VOX_LOG_LEVEL >= 4 /* kVoxLogLevelDebug */
 #define LOG_DEBUG(x) DO_LOG_DEBUG(x)
#else
 #define LOG_DEBUG(x)
#endif

namespace vox {

void log_message(VoxLogLevel level, const std::string& msg);

class Log {
public:
    Log(VoxLogLevel level = kVoxLogLevelDebug)
        : level_(level){}
    ~Log() {
        log_message(level_, stream_.str());
    }
    template<typename T>
    Log& operator<<(T&& t) {
        stream_ << std::forward<T>(t);
        return *this;
    }
private:
    std::ostringstream stream_;
    VoxLogLevel level_;
};

// signed distance between two modular 8-bit sequence numbers
inline int32_t seq_diff(uint8_t a, uint8_t b){
    return (int8_t)(uint8_t)(a - b);
}

// little endian helpers for the wire trailers
// (count/size/event fields are written lsb first)

template<typename B>
uint16_t read_le16(const B *b){
    static_assert(sizeof(B) == 1, "read_le16() expects byte argument");
    return (uint16_t)((uint8_t)b[0] | ((uint16_t)(uint8_t)b[1] << 8));
}

template<typename B>
void write_le16(uint16_t v, B *b){
    static_assert(sizeof(B) == 1, "write_le16() expects byte argument");
    b[0] = (B)(v & 0xff);
    b[1] = (B)(v >> 8);
}

template<typename T>
T clamp(T in, T low, T high){
    if (in > high) return high;
    else if (in < low) return low;
    else return in;
}

} // vox
