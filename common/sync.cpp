/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#include "sync.hpp"

#ifdef _WIN32
# ifndef NOMINMAX
#  define NOMINMAX
# endif
# include <windows.h>
#endif

#if defined(__i386__) || defined(_M_IX86) || \
    defined(__x86_64__) || defined(_M_X64)
# include <immintrin.h>
# define CPU_PAUSE() _mm_pause()
#elif defined(__aarch64__) || defined(__arm__)
# define CPU_PAUSE() __asm__ __volatile__("yield")
#else
# define CPU_PAUSE()
#endif

#include <cerrno>
#include <climits>

namespace vox {
namespace sync {

//----------------------- spinlock ------------------------//

void spinlock::lock(){
    // only try to modify the shared state if the lock seems to be available.
    // this should prevent unnecessary cache invalidation.
    do {
        while (locked_.load(std::memory_order_relaxed)){
            CPU_PAUSE();
        }
    } while (locked_.exchange(true, std::memory_order_acquire));
}

bool spinlock::try_lock(){
    return !locked_.exchange(true, std::memory_order_acquire);
}

void spinlock::unlock(){
    locked_.store(false, std::memory_order_release);
}

//------------------------ mutex ---------------------------//

#ifdef _WIN32
mutex::mutex() {
    InitializeSRWLock((PSRWLOCK)&mutex_);
}
mutex::~mutex() {}
void mutex::lock() {
    AcquireSRWLockExclusive((PSRWLOCK)&mutex_);
}
bool mutex::try_lock() {
    return TryAcquireSRWLockExclusive((PSRWLOCK)&mutex_);
}
void mutex::unlock() {
    ReleaseSRWLockExclusive((PSRWLOCK)&mutex_);
}
#else
mutex::mutex() {
    pthread_mutex_init(&mutex_, nullptr);
}
mutex::~mutex() {
    pthread_mutex_destroy(&mutex_);
}
void mutex::lock() {
    pthread_mutex_lock(&mutex_);
}
bool mutex::try_lock() {
    return pthread_mutex_trylock(&mutex_) == 0;
}
void mutex::unlock() {
    pthread_mutex_unlock(&mutex_);
}
#endif

//------------------------ semaphore -----------------------//

#ifdef HAVE_SEMAPHORE

namespace detail {

native_semaphore::native_semaphore(){
#if defined(_WIN32)
    sem_ = CreateSemaphoreA(0, 0, LONG_MAX, 0);
#elif defined(__APPLE__)
    semaphore_create(mach_task_self(), &sem_, SYNC_POLICY_FIFO, 0);
#else // posix
    sem_init(&sem_, 0, 0);
#endif
}

native_semaphore::~native_semaphore(){
#if defined(_WIN32)
    CloseHandle(sem_);
#elif defined(__APPLE__)
    semaphore_destroy(mach_task_self(), sem_);
#else // posix
    sem_destroy(&sem_);
#endif
}

void native_semaphore::post(){
#if defined(_WIN32)
    ReleaseSemaphore(sem_, 1, 0);
#elif defined(__APPLE__)
    semaphore_signal(sem_);
#else
    sem_post(&sem_);
#endif
}

void native_semaphore::wait(){
#if defined(_WIN32)
    WaitForSingleObject(sem_, INFINITE);
#elif defined(__APPLE__)
    semaphore_wait(sem_);
#else
    // retry if interrupted by a signal
    while (sem_wait(&sem_) == -1 && errno == EINTR) continue;
#endif
}

} // detail

#endif // HAVE_SEMAPHORE

//------------------------ event ----------------------------//

#ifdef HAVE_SEMAPHORE

event::event() {}

event::~event() {}

void event::set(){
    // only post if the count is negative (= somebody is waiting)
    // or zero (= nobody is waiting, but the event is not set yet).
    auto oldcount = count_.load(std::memory_order_relaxed);
    for (;;){
        if (oldcount > 0){
            return; // already set
        }
        if (count_.compare_exchange_weak(oldcount, oldcount + 1,
                                         std::memory_order_release,
                                         std::memory_order_relaxed)){
            break;
        }
    }
    if (oldcount < 0){
        sem_.post(); // wake up waiting thread
    }
}

void event::wait(){
    auto oldcount = count_.fetch_sub(1, std::memory_order_acquire);
    if (oldcount <= 0){
        sem_.wait();
    }
}

#else

event::event(){
    pthread_mutex_init(&mutex_, nullptr);
    pthread_cond_init(&condition_, nullptr);
}

event::~event(){
    pthread_mutex_destroy(&mutex_);
    pthread_cond_destroy(&condition_);
}

void event::set(){
    pthread_mutex_lock(&mutex_);
    state_ = true;
    pthread_mutex_unlock(&mutex_);
    pthread_cond_signal(&condition_);
}

void event::wait(){
    pthread_mutex_lock(&mutex_);
    while (!state_){
        pthread_cond_wait(&condition_, &mutex_);
    }
    state_ = false;
    pthread_mutex_unlock(&mutex_);
}

#endif // HAVE_SEMAPHORE

} // sync
} // vox
