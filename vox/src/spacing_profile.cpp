/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#include "spacing_profile.hpp"

#include <sstream>

namespace vox {

spacing_profile::spacing_profile(int32_t capacity)
    : intervals_(capacity > 0 ? capacity : 1, 0) {}

void spacing_profile::start(){
    sync::scoped_lock<sync::spinlock> lock(lock_);
    head_ = 0;
    count_ = 0;
    have_last_ = false;
    started_.store(true, std::memory_order_relaxed);
}

void spacing_profile::update(bool flush){
    if (!started()){
        return;
    }
    auto now = clock::now();
    sync::scoped_lock<sync::spinlock> lock(lock_);
    if (have_last_){
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now - last_).count();
        intervals_[head_] = (int32_t)ms;
        head_ = (head_ + 1) % (int32_t)intervals_.size();
        if (count_ < (int32_t)intervals_.size()){
            count_++;
        }
    }
    last_ = now;
    have_last_ = !flush;
}

int32_t spacing_profile::max() const {
    sync::scoped_lock<sync::spinlock> lock(lock_);
    int32_t result = 0;
    for (int32_t i = 0; i < count_; ++i){
        if (intervals_[i] > result){
            result = intervals_[i];
        }
    }
    return result;
}

std::string spacing_profile::dump() const {
    std::stringstream ss;
    sync::scoped_lock<sync::spinlock> lock(lock_);
    auto size = (int32_t)intervals_.size();
    auto start = count_ < size ? 0 : head_;
    for (int32_t i = 0; i < count_; ++i){
        if (i > 0){
            ss << ",";
        }
        ss << intervals_[(start + i) % size];
    }
    return ss.str();
}

} // vox
