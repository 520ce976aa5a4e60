/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#pragma once

#include <inttypes.h>
#include <stddef.h>
#include <atomic>

#ifndef _WIN32
  #include <pthread.h>
#endif

#ifdef __APPLE__
// macOS doesn't support unnamed pthread semaphores,
// so we use Mach semaphores instead
#include <mach/mach.h>
#endif

#if defined(__linux__) || defined(__FreeBSD__) || \
    defined(__NetBSD__) || defined(__OpenBSD__)
  #define HAVE_POSIX_SEMAPHORE
  #include <semaphore.h>
#endif

#if defined(_WIN32) || defined(__APPLE__) || defined(HAVE_POSIX_SEMAPHORE)
  #define HAVE_SEMAPHORE
#endif

namespace vox {
namespace sync {

//----------------- spinlock ----------------------//

class spinlock {
public:
    spinlock() = default;
    spinlock(const spinlock&) = delete;
    spinlock& operator=(const spinlock&) = delete;
    void lock();
    bool try_lock();
    void unlock();
protected:
    std::atomic<uint32_t> locked_{false};
};

//--------------- padded spin locks --------------------//

template<typename T, size_t N>
class alignas(N) padded_class : public T {
    // pad and align to prevent false sharing
    char pad_[N - sizeof(T)];
};

static const size_t CACHELINE_SIZE = 64;

using padded_spinlock = padded_class<spinlock, CACHELINE_SIZE>;

//------------------------------ mutex ------------------------------------//

// we use the platform primitives directly (SRWLOCK resp. pthread_mutex_t)
// because std::mutex has additional overhead on some platforms.

class mutex {
public:
    mutex();
    ~mutex();
    mutex(const mutex&) = delete;
    mutex& operator=(const mutex&) = delete;
    void lock();
    bool try_lock();
    void unlock();
private:
#ifdef _WIN32
    void* mutex_; // avoid including windows headers (SWRLOCK is pointer sized)
#else
    pthread_mutex_t mutex_;
#endif
};

template<typename T>
class scoped_lock {
public:
    scoped_lock(T& lock)
        : lock_(lock){ lock_.lock(); }
    scoped_lock(const scoped_lock& lock) = delete;
    scoped_lock& operator=(const scoped_lock& lock) = delete;
    ~scoped_lock() { lock_.unlock(); }
private:
    T& lock_;
};

//----------------------- semaphore --------------------------//

#ifdef HAVE_SEMAPHORE

namespace detail {

class native_semaphore {
 public:
    native_semaphore();
    ~native_semaphore();
    native_semaphore(const native_semaphore&) = delete;
    native_semaphore& operator=(const native_semaphore&) = delete;
    void post();
    void wait();
 private:
#if defined(_WIN32)
    void *sem_;
#elif defined(__APPLE__)
    semaphore_t sem_;
#else // posix
    sem_t sem_;
#endif
};

} // detail

#endif // HAVE_SEMAPHORE

//------------------------- event ------------------------------//

// auto-reset event: set() wakes up a single waiting thread;
// if nobody is waiting, the next call to wait() returns immediately.
// multiple calls to set() before wait() only count once.

class event {
 public:
    event();
    ~event();
    event(const event&) = delete;
    event& operator=(const event&) = delete;
    void set();
    void wait();
 private:
#ifdef HAVE_SEMAPHORE
    // thanks to https://preshing.com/20150316/semaphores-are-surprisingly-versatile/
    detail::native_semaphore sem_;
    std::atomic<int32_t> count_{0};
#else
    // fallback using mutex + condition variable
    pthread_mutex_t mutex_;
    pthread_cond_t condition_;
    bool state_{false};
#endif // HAVE_SEMAPHORE
};

} // sync
} // vox
