#include "sync/ProgressTracker.hpp"

using namespace sl::sync;

void ProgressTracker::subscribe(Listener listener) {
    std::scoped_lock lock(listenersMutex_);
    listeners_.push_back(std::move(listener));
}

void ProgressTracker::reset(const unsigned int total) {
    completed_.store(0);
    total_.store(total);
    running_.store(true);
    notify();
}

void ProgressTracker::increment() {
    ++completed_;
    notify();
}

void ProgressTracker::finish() {
    running_.store(false);
    notify();
}

model::SyncProgress ProgressTracker::snapshot() const {
    return {completed_.load(), total_.load(), running_.load()};
}

void ProgressTracker::notify() const {
    const auto current = snapshot();
    std::scoped_lock lock(listenersMutex_);
    for (const auto& l : listeners_) l(current);
}
