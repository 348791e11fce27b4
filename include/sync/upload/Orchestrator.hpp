#pragma once

#include "config/Config.hpp"
#include "sync/model/Upload.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sl::remote { class Api; }
namespace sl::concurrency { class ThreadPool; }
namespace sl::sync { class ProgressTracker; }
namespace sl::sync::store { class EventStore; }

namespace sl::sync::upload {

class EventPackager;
class TicketClient;

// One upload attempt: CREATED -> PACKAGING -> TICKETING -> UPLOADING -> POLLING -> terminal.
class Orchestrator {
public:
    enum class State { Created, Packaging, Ticketing, Uploading, Polling, Succeeded, TimedOut, Failed };

    // Selects the poll budget: Single for the one-event operation, Batch otherwise.
    enum class Mode { Batch, Single };

    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using StateListener = std::function<void(State)>;

    struct Options {
        config::PollConfig batch_poll{std::chrono::milliseconds(3000), 15};
        config::PollConfig single_poll{std::chrono::milliseconds(2000), 30};
    };

    struct Deps {
        std::shared_ptr<remote::Api> api;
        std::shared_ptr<store::EventStore> events;
        std::shared_ptr<EventPackager> packager;
        std::shared_ptr<TicketClient> tickets;
        std::shared_ptr<ProgressTracker> progress;
        std::shared_ptr<concurrency::ThreadPool> pool;  // optional; uploads run inline without it
    };

    Orchestrator(Deps deps, Options options, Sleeper sleeper = {});

    // Never throws; every failure is reflected in the result.
    model::BatchResult run(const std::vector<std::string>& eventUids, const std::string& targetProjectUid,
                           Mode mode = Mode::Batch);

    [[nodiscard]] State state() const { return state_.load(); }

    void onStateChange(StateListener listener);

private:
    Deps deps_;
    Options options_;
    Sleeper sleeper_;

    std::atomic<State> state_{State::Created};
    std::mutex listenersMutex_;
    std::vector<StateListener> listeners_;

    void transition(State next);

    model::BatchResult execute(const std::vector<std::string>& eventUids, const std::string& targetProjectUid, Mode mode);

    std::vector<model::ItemResult> uploadAll(model::UploadTask& task);

    bool pollUntilComplete(const std::string& taskUid, const config::PollConfig& poll);

    model::BatchResult finish(model::BatchResult result, State terminal);
};

std::string to_string(Orchestrator::State state);

}
