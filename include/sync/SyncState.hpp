#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sl::sync {

// Single-writer sync status: idle -> running -> idle. Observers may read it from any thread.
class SyncState {
public:
    enum class Phase { Idle, Running };
    using Listener = std::function<void(Phase, const std::string& operation)>;

    class Guard {
    public:
        Guard(Guard&& other) noexcept : state_(other.state_) { other.state_ = nullptr; }
        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

    private:
        friend class SyncState;
        explicit Guard(SyncState* state) : state_(state) {}

        SyncState* state_;
    };

    // Returns a guard holding the running state, or nullopt when another job is running.
    [[nodiscard]] std::optional<Guard> tryBegin(const std::string& operation);

    [[nodiscard]] Phase phase() const { return phase_.load(); }
    [[nodiscard]] bool isRunning() const { return phase() == Phase::Running; }
    [[nodiscard]] std::string currentOperation() const;

    void subscribe(Listener listener);

private:
    void end();
    void notify(Phase phase, const std::string& operation) const;

    std::atomic<Phase> phase_{Phase::Idle};

    mutable std::mutex mutex_;
    std::string operation_;
    std::vector<Listener> listeners_;
};

std::string to_string(SyncState::Phase phase);

}
