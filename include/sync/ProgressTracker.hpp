#pragma once

#include "sync/model/SyncProgress.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

namespace sl::sync {

// Live upload progress. Counters are atomic so package uploads may report from worker threads.
class ProgressTracker {
public:
    using Listener = std::function<void(const model::SyncProgress&)>;

    void subscribe(Listener listener);

    void reset(unsigned int total);
    void increment();
    void finish();

    [[nodiscard]] model::SyncProgress snapshot() const;

private:
    void notify() const;

    std::atomic<unsigned int> completed_{0}, total_{0};
    std::atomic<bool> running_{false};

    mutable std::mutex listenersMutex_;
    std::vector<Listener> listeners_;
};

}
