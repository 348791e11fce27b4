#include "sync/SyncState.hpp"
#include "log/Registry.hpp"

using namespace sl::sync;

SyncState::Guard::~Guard() {
    if (state_) state_->end();
}

std::optional<SyncState::Guard> SyncState::tryBegin(const std::string& operation) {
    auto expected = Phase::Idle;
    if (!phase_.compare_exchange_strong(expected, Phase::Running)) return std::nullopt;

    {
        std::scoped_lock lock(mutex_);
        operation_ = operation;
    }
    notify(Phase::Running, operation);
    return Guard(this);
}

std::string SyncState::currentOperation() const {
    std::scoped_lock lock(mutex_);
    return operation_;
}

void SyncState::subscribe(Listener listener) {
    std::scoped_lock lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void SyncState::end() {
    std::string finished;
    {
        std::scoped_lock lock(mutex_);
        finished.swap(operation_);
    }
    phase_.store(Phase::Idle);
    notify(Phase::Idle, finished);
}

void SyncState::notify(const Phase phase, const std::string& operation) const {
    std::vector<Listener> listeners;
    {
        std::scoped_lock lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& l : listeners) {
        try {
            l(phase, operation);
        } catch (const std::exception& e) {
            log::Registry::sync()->error("[SyncState] Listener failed on {} ({}): {}", to_string(phase), operation, e.what());
        }
    }
}

std::string sl::sync::to_string(const SyncState::Phase phase) {
    return phase == SyncState::Phase::Running ? "running" : "idle";
}
