#include <gtest/gtest.h>
#include "sync/upload/Orchestrator.hpp"
#include "sync/upload/EventPackager.hpp"
#include "sync/upload/TicketClient.hpp"
#include "sync/ProgressTracker.hpp"
#include "concurrency/ThreadPool.hpp"
#include "util/files.hpp"
#include "fakes/FakeApi.hpp"
#include "fakes/InMemoryStores.hpp"

#include <algorithm>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace sl::sync;
using namespace sl::sync::model;
using namespace sl::sync::upload;
using sl::test::FakeApi;

class OrchestratorTest : public ::testing::Test {
protected:
    fs::path root;
    std::shared_ptr<FakeApi> api;
    std::shared_ptr<sl::test::InMemoryEventStore> events;
    std::shared_ptr<ProgressTracker> progress;
    Orchestrator::Deps deps;
    Orchestrator::Options options;
    std::vector<std::chrono::milliseconds> sleeps;

    void SetUp() override {
        root = fs::temp_directory_path() / ("siteline_orch_" + std::to_string(::getpid()) + "_" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root);
        fs::create_directories(root / "events");

        api = std::make_shared<FakeApi>();
        events = std::make_shared<sl::test::InMemoryEventStore>();
        progress = std::make_shared<ProgressTracker>();

        deps.api = api;
        deps.events = events;
        deps.packager = std::make_shared<EventPackager>(root / "events", root / "sync_zip");
        deps.tickets = std::make_shared<TicketClient>(api);
        deps.progress = progress;

        options.batch_poll = {std::chrono::milliseconds(30), 3};
        options.single_poll = {std::chrono::milliseconds(20), 4};
    }

    void TearDown() override { fs::remove_all(root); }

    void makeEvent(const std::string& uid) const {
        fs::create_directories(root / "events" / uid);
        sl::util::writeFile(root / "events" / uid / "report.txt", "inspection notes for " + uid);
    }

    Orchestrator make() {
        return Orchestrator(deps, options, [this](const std::chrono::milliseconds d) { sleeps.push_back(d); });
    }

    static const ItemResult* item(const BatchResult& r, const std::string& uid) {
        const auto it = std::ranges::find_if(r.items, [&](const ItemResult& i) { return i.event_uid == uid; });
        return it == r.items.end() ? nullptr : &*it;
    }
};

TEST_F(OrchestratorTest, MissingEventIsReportedAndOnlyPackagedOnesProceed) {
    makeEvent("A");

    auto orchestrator = make();
    const auto result = orchestrator.run({"A", "B"}, "P");

    ASSERT_EQ(api->createdTasks.size(), 1u);
    ASSERT_EQ(api->createdTasks[0].packages.size(), 1u);
    EXPECT_EQ(api->createdTasks[0].packages[0].event_uid, "A");
    EXPECT_EQ(api->createdTasks[0].target_project_uid, "P");

    ASSERT_NE(item(result, "B"), nullptr);
    EXPECT_EQ(item(result, "B")->kind, ItemResult::Kind::NotFound);
    EXPECT_EQ(item(result, "B")->message, "event not found locally");
    ASSERT_NE(item(result, "A"), nullptr);
    EXPECT_TRUE(item(result, "A")->ok());

    EXPECT_EQ(result.outcome, BatchResult::Outcome::Succeeded);
    EXPECT_EQ(result.message, "uploaded 1/2 events");
    EXPECT_NE(result.report().find("event=B | FAIL | event not found locally"), std::string::npos);

    EXPECT_TRUE(events->isSynced("A"));
    EXPECT_FALSE(events->isSynced("B"));
    EXPECT_EQ(orchestrator.state(), Orchestrator::State::Succeeded);
}

TEST_F(OrchestratorTest, DuplicateEventUidsArePackagedOnce) {
    makeEvent("A");
    auto orchestrator = make();
    const auto result = orchestrator.run({"A", "A"}, "P");

    EXPECT_EQ(api->createdTasks[0].packages.size(), 1u);
    EXPECT_EQ(result.items.size(), 1u);
    EXPECT_EQ(result.message, "uploaded 1/1 events");
}

TEST_F(OrchestratorTest, TicketsAreMatchedByDigestNotPosition) {
    makeEvent("A");
    makeEvent("B");
    api->onCreateUploadTask = [](const UploadTask& task) {
        std::vector<sl::remote::TicketEntry> entries;
        for (const auto& pkg : task.packages) entries.push_back(FakeApi::ticketFor(pkg));
        std::ranges::reverse(entries);
        sl::remote::TicketEntry stray;
        stray.digest = "not-a-digest";
        stray.ticket.object_id = "stray";
        entries.insert(entries.begin(), stray);
        return entries;
    };

    auto orchestrator = make();
    const auto result = orchestrator.run({"A", "B"}, "P");

    EXPECT_TRUE(result.ok()) << result.report();
    EXPECT_EQ(api->uploadsByEvent["A"], "events/A.zip");
    EXPECT_EQ(api->uploadsByEvent["B"], "events/B.zip");
}

TEST_F(OrchestratorTest, OmittedTicketMarksPackageUnmatched) {
    makeEvent("A");
    makeEvent("B");
    api->onCreateUploadTask = [](const UploadTask& task) {
        std::vector<sl::remote::TicketEntry> entries;
        for (const auto& pkg : task.packages)
            if (pkg.event_uid == "A") entries.push_back(FakeApi::ticketFor(pkg));
        return entries;
    };

    auto orchestrator = make();
    const auto result = orchestrator.run({"A", "B"}, "P");

    EXPECT_EQ(item(result, "A")->kind, ItemResult::Kind::Uploaded);
    EXPECT_EQ(item(result, "B")->kind, ItemResult::Kind::Unmatched);
    EXPECT_FALSE(api->uploadsByEvent.contains("B"));
    EXPECT_FALSE(fs::exists(root / "sync_zip" / "B.zip"));
    EXPECT_TRUE(events->isSynced("A"));
    EXPECT_FALSE(events->isSynced("B"));
    EXPECT_EQ(progress->snapshot().completed, 1u);
    EXPECT_EQ(progress->snapshot().total, 2u);
}

TEST_F(OrchestratorTest, PartialUploadFailureIsIsolated) {
    makeEvent("A");
    makeEvent("B");
    api->failingUploads.insert("B");

    auto orchestrator = make();
    const auto result = orchestrator.run({"A", "B"}, "P");

    EXPECT_EQ(result.outcome, BatchResult::Outcome::Succeeded);
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.retryable());
    EXPECT_EQ(item(result, "B")->kind, ItemResult::Kind::UploadFailed);
    EXPECT_TRUE(events->isSynced("A"));
    EXPECT_FALSE(events->isSynced("B"));
    EXPECT_FALSE(fs::exists(root / "sync_zip" / "A.zip"));
    EXPECT_FALSE(fs::exists(root / "sync_zip" / "B.zip"));
}

TEST_F(OrchestratorTest, NoSuccessfulUploadSkipsPolling) {
    makeEvent("A");
    api->failingUploads.insert("A");

    auto orchestrator = make();
    const auto result = orchestrator.run({"A"}, "P");

    EXPECT_EQ(result.outcome, BatchResult::Outcome::Failed);
    EXPECT_EQ(result.message, "upload failed: 0/1 events uploaded");
    EXPECT_EQ(api->pollCalls.load(), 0);
}

TEST_F(OrchestratorTest, NothingPackagedFailsWithoutTicketing) {
    auto orchestrator = make();
    const auto result = orchestrator.run({"ghost"}, "P");

    EXPECT_EQ(result.outcome, BatchResult::Outcome::Failed);
    EXPECT_FALSE(result.retryable());
    EXPECT_EQ(api->createTaskCalls.load(), 0);
}

TEST_F(OrchestratorTest, TicketRequestFailureFailsTheBatch) {
    makeEvent("A");
    api->onCreateUploadTask = [](const UploadTask&) -> std::vector<sl::remote::TicketEntry> {
        throw sl::remote::ApiError("ticket service down", 503);
    };

    auto orchestrator = make();
    const auto result = orchestrator.run({"A"}, "P");

    EXPECT_EQ(result.outcome, BatchResult::Outcome::Failed);
    EXPECT_NE(result.message.find("ticket request failed"), std::string::npos);
    EXPECT_TRUE(result.retryable());
    EXPECT_FALSE(fs::exists(root / "sync_zip" / "A.zip"));
}

TEST_F(OrchestratorTest, PollTimeoutLeavesUploadedEventsUnsynced) {
    makeEvent("A");
    makeEvent("B");
    api->onPoll = [](const std::string&) { return false; };

    auto orchestrator = make();
    const auto result = orchestrator.run({"A", "B"}, "P");

    EXPECT_EQ(result.outcome, BatchResult::Outcome::TimedOut);
    EXPECT_TRUE(result.message.starts_with("timeout"));
    EXPECT_TRUE(result.retryable());
    EXPECT_EQ(api->pollCalls.load(), 3);
    EXPECT_EQ(sleeps, std::vector<std::chrono::milliseconds>(3, std::chrono::milliseconds(30)));
    EXPECT_FALSE(events->isSynced("A"));
    EXPECT_FALSE(events->isSynced("B"));
    EXPECT_EQ(orchestrator.state(), Orchestrator::State::TimedOut);
}

TEST_F(OrchestratorTest, SingleModeUsesSinglePollBudget) {
    makeEvent("A");
    api->onPoll = [](const std::string&) { return false; };

    auto orchestrator = make();
    orchestrator.run({"A"}, "P", Orchestrator::Mode::Single);

    EXPECT_EQ(api->pollCalls.load(), 4);
    EXPECT_EQ(sleeps.front(), std::chrono::milliseconds(20));
}

TEST_F(OrchestratorTest, BatchOfOneKeepsBatchPollBudget) {
    makeEvent("A");
    api->onPoll = [](const std::string&) { return false; };

    auto orchestrator = make();
    orchestrator.run({"A"}, "P");

    EXPECT_EQ(api->pollCalls.load(), 3);
    EXPECT_EQ(sleeps.front(), std::chrono::milliseconds(30));
}

TEST_F(OrchestratorTest, PollTransportErrorsCountAsIncomplete) {
    makeEvent("A");
    int calls = 0;
    api->onPoll = [&calls](const std::string&) -> bool {
        if (++calls < 3) throw sl::remote::ApiError("gateway timeout", 504);
        return true;
    };

    auto orchestrator = make();
    const auto result = orchestrator.run({"A"}, "P");

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(api->pollCalls.load(), 3);
    EXPECT_TRUE(events->isSynced("A"));
}

TEST_F(OrchestratorTest, StatesAreReportedInOrder) {
    makeEvent("A");
    std::vector<Orchestrator::State> seen;

    auto orchestrator = make();
    orchestrator.onStateChange([&](const Orchestrator::State s) { seen.push_back(s); });
    orchestrator.run({"A"}, "P");

    using S = Orchestrator::State;
    EXPECT_EQ(seen, (std::vector<S>{S::Created, S::Packaging, S::Ticketing, S::Uploading, S::Polling, S::Succeeded}));
}

TEST_F(OrchestratorTest, ProgressCountsOnlySuccessfulUploads) {
    makeEvent("A");
    makeEvent("B");
    makeEvent("C");
    api->failingUploads.insert("C");

    auto orchestrator = make();
    orchestrator.run({"A", "B", "C"}, "P");

    const auto snap = progress->snapshot();
    EXPECT_EQ(snap.total, 3u);
    EXPECT_EQ(snap.completed, 2u);
    EXPECT_FALSE(snap.running);
}

TEST_F(OrchestratorTest, UploadsRunOnWorkerPool) {
    for (const auto* uid : {"A", "B", "C", "D"}) makeEvent(uid);
    deps.pool = std::make_shared<sl::concurrency::ThreadPool>(3);

    auto orchestrator = make();
    const auto result = orchestrator.run({"A", "B", "C", "D"}, "P");

    EXPECT_TRUE(result.ok()) << result.report();
    EXPECT_EQ(api->uploadsByEvent.size(), 4u);
    EXPECT_EQ(progress->snapshot().completed, 4u);
    deps.pool->stop();
}

TEST_F(OrchestratorTest, TaskUidsAreUniquePerAttempt) {
    makeEvent("A");
    auto first = make();
    const auto a = first.run({"A"}, "P");
    auto second = make();
    const auto b = second.run({"A"}, "P");

    EXPECT_TRUE(a.task_uid.starts_with("task_"));
    EXPECT_NE(a.task_uid, b.task_uid);
}
