#pragma once

#include "sync/ProgressTracker.hpp"
#include "sync/model/Result.hpp"
#include "sync/model/Upload.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <chrono>
#include <fmt/format.h>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace sl::sync::upload {

struct RetryPolicy {
    unsigned int max_attempts = 5;
    std::chrono::milliseconds delay{3000};
};

// Wraps a batch attempt (vector<string> eventUids -> BatchResult) with bounded retries.
// Progress is reset at the start of every attempt; later attempts only carry events that are
// neither synced nor missing locally.
template <class Attempt>
class Retry {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using SyncedCheck = std::function<bool(const std::string&)>;

    Retry(Attempt attempt, RetryPolicy policy, std::shared_ptr<ProgressTracker> progress,
          SyncedCheck isSynced, Sleeper sleeper = {})
        : attempt_(std::move(attempt)), policy_(policy), progress_(std::move(progress)),
          isSynced_(std::move(isSynced)), sleeper_(std::move(sleeper)) {
        if (policy_.max_attempts == 0) policy_.max_attempts = 1;
        if (!sleeper_) sleeper_ = [](const std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }

    model::OpResult operator()(std::vector<std::string> eventUids) {
        if (eventUids.empty()) return model::OpResult::fail("no events to upload");

        model::BatchResult last;
        unsigned int n = 0;

        while (n < policy_.max_attempts) {
            ++n;
            if (progress_) progress_->reset(0);

            if (n > 1) eventUids = remaining(eventUids, last);
            if (eventUids.empty()) {
                if (progress_) progress_->finish();
                return model::OpResult::ok(fmt::format("Event sync succeeded on attempt {}", n - 1));
            }

            last = attempt_(eventUids);

            if (last.ok())
                return model::OpResult::ok(fmt::format("Event sync succeeded on attempt {}\n{}", n, last.report()));

            if (!last.retryable()) break;

            log::Registry::upload()->warn("[Retry] Attempt {}/{} failed: {}", n, policy_.max_attempts, last.message);
            if (n < policy_.max_attempts) sleeper_(policy_.delay);
        }

        return model::OpResult::fail(fmt::format("Event sync failed after {} attempts: {}", n, last.report()));
    }

private:
    Attempt attempt_;
    RetryPolicy policy_;
    std::shared_ptr<ProgressTracker> progress_;
    SyncedCheck isSynced_;
    Sleeper sleeper_;

    std::vector<std::string> remaining(const std::vector<std::string>& eventUids, const model::BatchResult& last) const {
        std::set<std::string> missing;
        for (const auto& item : last.items)
            if (item.kind == model::ItemResult::Kind::NotFound) missing.insert(item.event_uid);

        std::vector<std::string> out;
        for (const auto& uid : eventUids) {
            if (missing.contains(uid)) continue;
            if (isSynced_ && isSynced_(uid)) continue;
            out.push_back(uid);
        }
        return out;
    }
};

}
