#include "sync/upload/Orchestrator.hpp"
#include "sync/upload/EventPackager.hpp"
#include "sync/upload/TicketClient.hpp"
#include "sync/store/EventStore.hpp"
#include "sync/ProgressTracker.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/upload/PackageUploadTask.hpp"
#include "crypto/IdGenerator.hpp"
#include "remote/Api.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <future>
#include <set>
#include <thread>

using namespace sl::sync::upload;
using namespace sl::sync::model;
using namespace sl::log;

std::string sl::sync::upload::to_string(const Orchestrator::State state) {
    switch (state) {
        case Orchestrator::State::Created: return "created";
        case Orchestrator::State::Packaging: return "packaging";
        case Orchestrator::State::Ticketing: return "ticketing";
        case Orchestrator::State::Uploading: return "uploading";
        case Orchestrator::State::Polling: return "polling";
        case Orchestrator::State::Succeeded: return "succeeded";
        case Orchestrator::State::TimedOut: return "timed_out";
        case Orchestrator::State::Failed: return "failed";
        default: throw std::invalid_argument("Unknown orchestrator state");
    }
}

Orchestrator::Orchestrator(Deps deps, Options options, Sleeper sleeper)
    : deps_(std::move(deps)), options_(std::move(options)), sleeper_(std::move(sleeper)) {
    if (!deps_.api || !deps_.events || !deps_.packager || !deps_.tickets || !deps_.progress)
        throw std::invalid_argument("Orchestrator is missing a dependency");
    if (!sleeper_) sleeper_ = [](const std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

void Orchestrator::onStateChange(StateListener listener) {
    std::scoped_lock lock(listenersMutex_);
    listeners_.push_back(std::move(listener));
}

void Orchestrator::transition(const State next) {
    state_.store(next);
    Registry::upload()->debug("[Orchestrator] -> {}", to_string(next));

    std::scoped_lock lock(listenersMutex_);
    for (const auto& l : listeners_) l(next);
}

BatchResult Orchestrator::finish(BatchResult result, const State terminal) {
    transition(terminal);
    deps_.progress->finish();
    Registry::upload()->info("[Orchestrator] Task {} {}: {}", result.task_uid, to_string(terminal), result.message);
    return result;
}

BatchResult Orchestrator::run(const std::vector<std::string>& eventUids, const std::string& targetProjectUid,
                              const Mode mode) {
    try {
        return execute(eventUids, targetProjectUid, mode);
    } catch (const std::exception& e) {
        BatchResult result;
        result.outcome = BatchResult::Outcome::Failed;
        result.message = fmt::format("upload failed: {}", e.what());
        for (const auto& uid : eventUids)
            result.items.push_back({uid, ItemResult::Kind::UploadFailed, e.what()});
        return finish(std::move(result), State::Failed);
    }
}

BatchResult Orchestrator::execute(const std::vector<std::string>& eventUids, const std::string& targetProjectUid,
                                  const Mode mode) {
    UploadTask task;
    task.task_uid = crypto::generateTaskUid();
    task.target_project_uid = targetProjectUid;

    BatchResult result;
    result.task_uid = task.task_uid;
    transition(State::Created);

    transition(State::Packaging);
    std::set<std::string> seen;
    for (const auto& uid : eventUids) {
        if (!seen.insert(uid).second) continue;

        auto packed = deps_.packager->pack(uid);
        if (packed.ok()) {
            try {
                deps_.events->track(uid, targetProjectUid);
            } catch (const std::exception& e) {
                Registry::upload()->warn("[Orchestrator] Could not record {} as pending: {}", uid, e.what());
            }
            task.packages.push_back(std::move(*packed.package));
        }
        else result.items.push_back({uid, packed.failure, packed.message});
    }

    if (task.packages.empty()) {
        result.outcome = BatchResult::Outcome::Failed;
        result.message = "upload failed: no event could be packaged";
        return finish(std::move(result), State::Failed);
    }

    deps_.progress->reset(static_cast<unsigned int>(task.packages.size()));

    transition(State::Ticketing);
    try {
        task.tickets_by_digest = deps_.tickets->requestTickets(task);
    } catch (const std::exception& e) {
        Registry::upload()->error("[Orchestrator] Ticket request for {} failed: {}", task.task_uid, e.what());
        for (const auto& pkg : task.packages) {
            util::removeQuietly(pkg.archive_path);
            result.items.push_back({pkg.event_uid, ItemResult::Kind::UploadFailed,
                                    fmt::format("ticket request failed: {}", e.what())});
        }
        result.outcome = BatchResult::Outcome::Failed;
        result.message = fmt::format("upload failed: ticket request failed: {}", e.what());
        return finish(std::move(result), State::Failed);
    }

    transition(State::Uploading);
    const auto uploaded = uploadAll(task);

    std::vector<std::string> uploadedEvents;
    for (const auto& item : uploaded) {
        if (item.ok()) uploadedEvents.push_back(item.event_uid);
        result.items.push_back(item);
    }

    const auto attempted = static_cast<unsigned int>(seen.size());

    if (task.completed_digests.empty()) {
        result.outcome = BatchResult::Outcome::Failed;
        result.message = fmt::format("upload failed: 0/{} events uploaded", attempted);
        return finish(std::move(result), State::Failed);
    }

    transition(State::Polling);
    const auto& poll = mode == Mode::Single ? options_.single_poll : options_.batch_poll;

    if (!pollUntilComplete(task.task_uid, poll)) {
        result.outcome = BatchResult::Outcome::TimedOut;
        result.message = fmt::format("timeout - server did not confirm task {} after {} polls; "
                                     "{}/{} events uploaded, check status later",
                                     task.task_uid, poll.max_attempts, uploadedEvents.size(), attempted);
        return finish(std::move(result), State::TimedOut);
    }

    for (auto& item : result.items) {
        if (!item.ok()) continue;
        const auto pkg = std::ranges::find_if(task.packages, [&](const UploadPackage& p) { return p.event_uid == item.event_uid; });
        try {
            deps_.events->markSynced(item.event_uid, targetProjectUid, task.task_uid,
                                     pkg != task.packages.end() ? pkg->package_digest : "");
        } catch (const std::exception& e) {
            Registry::upload()->error("[Orchestrator] Failed to mark {} synced: {}", item.event_uid, e.what());
            item.kind = ItemResult::Kind::UploadFailed;
            item.message = fmt::format("uploaded but local sync flag not saved: {}", e.what());
        }
    }

    result.outcome = BatchResult::Outcome::Succeeded;
    result.message = fmt::format("uploaded {}/{} events", result.uploadedCount(), attempted);
    return finish(std::move(result), State::Succeeded);
}

std::vector<ItemResult> Orchestrator::uploadAll(UploadTask& task) {
    std::vector<ItemResult> items;
    std::vector<std::pair<const UploadPackage*, std::future<ExpectedFuture>>> futures;

    for (const auto& pkg : task.packages) {
        const auto ticket = task.tickets_by_digest.find(pkg.package_digest);
        if (ticket == task.tickets_by_digest.end()) {
            Registry::upload()->warn("[Orchestrator] No ticket matched digest {} of event {}",
                                     pkg.package_digest, pkg.event_uid);
            util::removeQuietly(pkg.archive_path);
            items.push_back({pkg.event_uid, ItemResult::Kind::Unmatched, "no ticket matched package digest"});
            continue;
        }

        auto job = std::make_shared<concurrency::PackageUploadTask>(deps_.tickets, pkg, ticket->second, deps_.progress);
        auto future = job->getFuture().value();

        if (deps_.pool) deps_.pool->submit(job);
        else (*job)();

        futures.emplace_back(&pkg, std::move(future));
    }

    for (auto& [pkg, future] : futures) {
        const auto value = future.get();
        ItemResult item;
        if (const auto* r = std::get_if<ItemResult>(&value)) item = *r;
        else item = {pkg->event_uid, std::get<bool>(value) ? ItemResult::Kind::Uploaded : ItemResult::Kind::UploadFailed, ""};

        if (item.ok()) task.completed_digests.insert(pkg->package_digest);
        items.push_back(std::move(item));
    }

    return items;
}

bool Orchestrator::pollUntilComplete(const std::string& taskUid, const config::PollConfig& poll) {
    for (unsigned int attempt = 1; attempt <= poll.max_attempts; ++attempt) {
        sleeper_(poll.interval);
        try {
            if (deps_.api->pollTaskStatus(taskUid)) {
                Registry::upload()->debug("[Orchestrator] Task {} confirmed on poll {}", taskUid, attempt);
                return true;
            }
        } catch (const std::exception& e) {
            Registry::upload()->debug("[Orchestrator] Poll {} for {} failed, treating as incomplete: {}",
                                      attempt, taskUid, e.what());
        }
    }
    return false;
}
