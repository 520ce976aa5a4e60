/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#include "vox/vox.h"

#include "imp.hpp"

#include "common/sync.hpp"
#include "common/utils.hpp"

#define CERR_LOG_FUNCTION 1
#if CERR_LOG_FUNCTION
# include <iostream>
#endif
#define CERR_LOG_MUTEX 1

//------------------- allocator ------------------//

#if VOX_CUSTOM_ALLOCATOR || VOX_DEBUG_MEMORY

namespace vox {

#if VOX_DEBUG_MEMORY
std::atomic<ptrdiff_t> total_memory{0};
#endif

static VoxAllocator g_allocator {
    [](VoxSize n, void *){
    #if VOX_DEBUG_MEMORY
        auto total = total_memory.fetch_add(n, std::memory_order_relaxed) + (ptrdiff_t)n;
        LOG_DEBUG("allocate " << n << " bytes (total: " << total << ")");
    #endif
        return operator new(n);
    },
    [](void *ptr, VoxSize n, void *){
    #if VOX_DEBUG_MEMORY
        auto total = total_memory.fetch_sub(n, std::memory_order_relaxed) - (ptrdiff_t)n;
        LOG_DEBUG("deallocate " << n << " bytes (total: " << total << ")");
    #endif
        operator delete(ptr);
    },
    nullptr
};

void * allocate(size_t size){
    return g_allocator.alloc(size, g_allocator.context);
}

void deallocate(void *ptr, size_t size){
    g_allocator.free(ptr, size, g_allocator.context);
}

} // vox

#endif

//----------------------- logging --------------------------//

namespace vox {

#if CERR_LOG_FUNCTION

#if CERR_LOG_MUTEX
static vox::sync::mutex g_log_mutex;
#endif

static void VOX_CALL cerr_logfunction(VoxLogLevel level, const VoxChar *msg){
    const char *label = nullptr;
    switch (level){
    case kVoxLogLevelError:
        label = "error";
        break;
    case kVoxLogLevelWarning:
        label = "warning";
        break;
    case kVoxLogLevelVerbose:
        label = "verbose";
        break;
    case kVoxLogLevelDebug:
        label = "debug";
        break;
    default:
        break;
    }
#if CERR_LOG_MUTEX
    vox::sync::scoped_lock<vox::sync::mutex> lock(g_log_mutex);
#endif
    if (label){
        std::cerr << "[vox] " << label << ": " << msg << std::endl;
    } else {
        std::cerr << "[vox] " << msg << std::endl;
    }
}

static VoxLogFunc g_logfunction = cerr_logfunction;

#else // CERR_LOG_FUNCTION

static VoxLogFunc g_logfunction = nullptr;

#endif // CERR_LOG_FUNCTION

void log_message(VoxLogLevel level, const std::string &msg){
    if (g_logfunction) {
        g_logfunction(level, msg.c_str());
    }
}

} // vox

const VoxChar * VOX_CALL vox_strerror(VoxError e){
    switch (e){
    case kVoxErrorUnknown:
        return "unspecified error";
    case kVoxErrorNone:
        return "no error";
    case kVoxErrorNotImplemented:
        return "not implemented";
    case kVoxErrorBadArgument:
        return "bad argument";
    case kVoxErrorIdle:
        return "idle";
    case kVoxErrorOverflow:
        return "overflow";
    case kVoxErrorOutOfMemory:
        return "out of memory";
    case kVoxErrorNotFound:
        return "not found";
    case kVoxErrorInsufficientBuffer:
        return "insufficient buffer";
    default:
        return "unknown error code";
    }
}

//---------------------- version -------------------------//

void VOX_CALL vox_getVersion(VoxInt32 *major, VoxInt32 *minor,
                             VoxInt32 *patch, VoxInt32 *test){
    if (major) *major = kVoxVersionMajor;
    if (minor) *minor = kVoxVersionMinor;
    if (patch) *patch = kVoxVersionPatch;
    if (test) *test = kVoxVersionTest;
}

#define STR_HELPER(x) #x
#define STR(x) STR_HELPER(x)

const VoxChar * VOX_CALL vox_getVersionString(void) {
    return STR(kVoxVersionMajor) "." STR(kVoxVersionMinor)
    #if kVoxVersionPatch > 0
        "." STR(kVoxVersionPatch)
    #endif
    #if kVoxVersionTest > 0
       "-test" STR(kVoxVersionTest)
    #endif
        ;
}

//---------------------- memory -----------------------------//

namespace vox {

#define DEBUG_MEMORY_LIST 0

memory_list::block * memory_list::block::alloc(size_t size){
    auto fullsize = offsetof(block, data) + size;
    auto b = (block *)vox::allocate(fullsize);
    b->header.next = nullptr;
    b->header.size = size;
#if DEBUG_MEMORY_LIST
    LOG_DEBUG("allocate memory block (" << size << " bytes)");
#endif
    return b;
}

void memory_list::block::free(memory_list::block *b){
#if DEBUG_MEMORY_LIST
    LOG_DEBUG("deallocate memory block (" << b->header.size << " bytes)");
#endif
    auto fullsize = offsetof(block, data) + b->header.size;
    vox::deallocate(b, fullsize);
}

memory_list::~memory_list(){
    // free memory blocks
    auto b = list_.load(std::memory_order_relaxed);
    while (b){
        auto next = b->header.next;
        block::free(b);
        b = next;
    }
}

void* memory_list::allocate(size_t size) {
    block *head;
    {
        // pushers never unlink blocks, so with a single popper the head
        // can't be freed or recycled while we read its 'next' pointer.
        sync::scoped_lock<sync::spinlock> lock(pop_lock_);
        head = list_.load(std::memory_order_acquire);
        // (if the CAS fails, 'head' is updated to the current head)
        while (head && !list_.compare_exchange_weak(head, head->header.next,
                                                    std::memory_order_acq_rel)) ;
    }
    if (head){
        if (head->header.size >= size){
        #if DEBUG_MEMORY_LIST
            LOG_DEBUG("reuse memory block (" << head->header.size << " bytes)");
        #endif
            return head->data;
        }
        // too small; nobody else can see it anymore
        block::free(head);
    }
    // allocate new block
    return block::alloc(size)->data;
}

void memory_list::deallocate(void* ptr) {
    auto b = block::from_bytes(ptr);
    b->header.next = list_.load(std::memory_order_relaxed);
    // check if the head has changed and update it atomically.
    // (if the CAS fails, 'next' is updated to the current head)
    while (!list_.compare_exchange_weak(b->header.next, b, std::memory_order_acq_rel)) ;
#if DEBUG_MEMORY_LIST
    LOG_DEBUG("return memory block (" << b->header.size << " bytes)");
#endif
}

} // vox

//--------------------------- (de)initialize -----------------------------------//

void VOX_CALL vox_initialize(void){
    static bool initialized = false;
    if (!initialized){
        LOG_VERBOSE("vox " << vox_getVersionString());
        initialized = true;
    }
}

void VOX_CALL vox_initializeEx(VoxLogFunc log, const VoxAllocator *alloc) {
    if (log) {
        vox::g_logfunction = log;
    }
#if VOX_CUSTOM_ALLOCATOR
    if (alloc) {
        vox::g_allocator = *alloc;
    }
#endif
    vox_initialize();
}

void VOX_CALL vox_terminate(void) {}
