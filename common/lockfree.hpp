/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#pragma once

#include <stdint.h>
#include <atomic>

namespace vox {
namespace lockfree {

/*///////////////////////// unbounded_mpsc_queue ///////////////*/

// based on https://www.drdobbs.com/parallel/writing-lock-free-code-a-corrected-queue/210604448
//
// consumed nodes are recycled by the producers, so the queue
// only allocates when it grows beyond its previous max. size.

template<typename T>
class unbounded_mpsc_queue {
 public:
    unbounded_mpsc_queue(){
        // add dummy node
        first_ = devider_ = last_ = new node();
    }

    unbounded_mpsc_queue(const unbounded_mpsc_queue&) = delete;
    unbounded_mpsc_queue& operator=(const unbounded_mpsc_queue&) = delete;

    ~unbounded_mpsc_queue(){
        auto it = first_.load();
        while (it){
            auto tmp = it;
            it = it->next_;
            delete tmp;
        }
    }

    // can be called by several threads.
    // returns the new number of items (approximately)
    template<typename... U>
    int32_t push(U&&... args){
        node *tmp;
        while (true){
            auto first = first_.load(std::memory_order_relaxed);
            if (first != devider_.load(std::memory_order_relaxed)){
                // try to reuse existing node
                if (first_.compare_exchange_weak(first, first->next_,
                                                 std::memory_order_acq_rel))
                {
                    first->data_ = T(std::forward<U>(args)...);
                    first->next_ = nullptr;
                    tmp = first;
                    break; // success
                }
            } else {
                // make new node
                tmp = new node(std::forward<U>(args)...);
                break;
            }
        }
        while (lock_.exchange(1, std::memory_order_acquire)) ; // lock
        auto last = last_.load(std::memory_order_relaxed);
        last->next_ = tmp;
        last_.store(tmp, std::memory_order_release); // publish
        lock_.store(0, std::memory_order_release); // unlock
        return count_.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    // must be called from a single thread!
    void pop(T& result){
        // use node *after* devider, because devider is always a dummy!
        auto next = devider_.load(std::memory_order_acquire)->next_;
        result = std::move(next->data_);
        devider_.store(next, std::memory_order_release); // publish
        count_.fetch_sub(1, std::memory_order_relaxed);
    }

    bool try_pop(T& result){
        if (!empty()){
            pop(result);
            return true;
        } else {
            return false;
        }
    }

    bool empty() const {
        return devider_.load(std::memory_order_acquire)
                == last_.load(std::memory_order_acquire);
    }

    int32_t size() const {
        return count_.load(std::memory_order_relaxed);
    }
 private:
    struct node {
        template<typename... U>
        node(U&&... args)
            : data_(std::forward<U>(args)...), next_(nullptr) {}
        T data_;
        node * next_;
    };
    std::atomic<node *> first_;
    std::atomic<node *> devider_;
    std::atomic<node *> last_;
    std::atomic<int32_t> lock_{0};
    std::atomic<int32_t> count_{0};
};

} // lockfree
} // vox
