/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#pragma once

#include "vox/vox.h"

#include "common/sync.hpp"

#include <stdint.h>
#include <cstddef>
#include <cstring>
#include <utility>
#include <memory>
#include <atomic>
#include <vector>

namespace vox {

//---------------- allocator -----------------------//

#if VOX_CUSTOM_ALLOCATOR || VOX_DEBUG_MEMORY

void * allocate(size_t size);

template<class T, class... U>
T * construct(U&&... args){
    auto ptr = allocate(sizeof(T));
    new (ptr) T(std::forward<U>(args)...);
    return (T *)ptr;
}

void deallocate(void *ptr, size_t size);

template<typename T>
void destroy(T *x){
    x->~T();
    deallocate(x, sizeof(T));
}

template<class T>
class allocator {
public:
    using value_type = T;

    allocator() noexcept = default;

    template<typename U>
    allocator(const allocator<U>&) noexcept {}

    template<class U>
    struct rebind {
        typedef allocator<U> other;
    };

    value_type* allocate(size_t n) {
        return (value_type *)vox::allocate(sizeof(T) * n);
    }

    void deallocate(value_type* p, size_t n) noexcept {
        vox::deallocate(p, sizeof(T) * n);
    }
};

template <class T, class U>
bool operator==(allocator<T> const&, allocator<U> const&) noexcept
{
    return true;
}

template <class T, class U>
bool operator!=(allocator<T> const& x, allocator<U> const& y) noexcept
{
    return !(x == y);
}

#else

inline void * allocate(size_t size){
    return operator new(size);
}

template<class T, class... U>
T * construct(U&&... args){
    return new T(std::forward<U>(args)...);
}

inline void deallocate(void *ptr, size_t size){
    operator delete(ptr);
}

template<typename T>
void destroy(T *x){
    delete x;
}

template<typename T>
using allocator = std::allocator<T>;

#endif

template<typename T>
using vector = std::vector<T, allocator<T>>;

//------------------ memory --------------------//

// list of reusable memory blocks, safe for any number of threads.
// deallocate() pushes lock-free; allocate() pops the most recently
// returned block under a spinlock, so a popped block can be freed
// (if too small) without racing another popper.
class memory_list {
public:
    memory_list() = default;
    ~memory_list();
    memory_list(const memory_list&) = delete;
    memory_list& operator=(const memory_list&) = delete;

    void* allocate(size_t size);

    void deallocate(void* b);
private:
    struct block {
        struct {
            block *next;
            size_t size;
        } header;
        alignas(8) char data[1];

        static block * alloc(size_t size);

        static void free(block *mem);

        static block * from_bytes(void *bytes){
            return (block *)((char *)bytes - offsetof(block, data));
        }
    };
    std::atomic<block *> list_{nullptr};
    sync::spinlock pop_lock_; // deallocate() stays lock-free
};

} // vox
