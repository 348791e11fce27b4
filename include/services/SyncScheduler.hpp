#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <memory>

namespace sl::services {

class SyncService;

// Periodic background sync followed by a storage sweep.
class SyncScheduler final : public concurrency::AsyncService {
public:
    SyncScheduler(std::shared_ptr<SyncService> service, std::chrono::milliseconds interval);
    ~SyncScheduler() override;

    [[nodiscard]] unsigned int passes() const { return passes_.load(); }

protected:
    void runLoop() override;

private:
    std::shared_ptr<SyncService> service_;
    std::chrono::milliseconds interval_;
    std::atomic<unsigned int> passes_{0};
};

}
