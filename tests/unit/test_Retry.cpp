#include <gtest/gtest.h>
#include "sync/upload/Retry.hpp"

using namespace sl::sync;
using namespace sl::sync::model;
using namespace sl::sync::upload;

namespace {

ItemResult uploaded(const std::string& uid) { return {uid, ItemResult::Kind::Uploaded, "uploaded"}; }
ItemResult failed(const std::string& uid) { return {uid, ItemResult::Kind::UploadFailed, "upload failed: 503"}; }
ItemResult missing(const std::string& uid) { return {uid, ItemResult::Kind::NotFound, "event not found locally"}; }

BatchResult batch(const BatchResult::Outcome outcome, std::vector<ItemResult> items, std::string message = "") {
    BatchResult r;
    r.outcome = outcome;
    r.task_uid = "task_1";
    r.message = std::move(message);
    r.items = std::move(items);
    return r;
}

}

class RetryTest : public ::testing::Test {
protected:
    std::shared_ptr<ProgressTracker> progress = std::make_shared<ProgressTracker>();
    std::vector<std::vector<std::string>> attempts;
    std::vector<std::chrono::milliseconds> sleeps;
    std::set<std::string> synced;

    template <class F>
    auto make(F attempt, const unsigned int maxAttempts = 5) {
        auto recording = [this, attempt](const std::vector<std::string>& uids) {
            attempts.push_back(uids);
            return attempt(uids);
        };
        return Retry(std::move(recording), RetryPolicy{maxAttempts, std::chrono::milliseconds(7)}, progress,
                     [this](const std::string& uid) { return synced.contains(uid); },
                     [this](const std::chrono::milliseconds d) { sleeps.push_back(d); });
    }
};

TEST_F(RetryTest, FirstAttemptSuccess) {
    auto retry = make([](const std::vector<std::string>& uids) {
        std::vector<ItemResult> items;
        for (const auto& u : uids) items.push_back(uploaded(u));
        return batch(BatchResult::Outcome::Succeeded, items, "uploaded 2/2 events");
    });

    const auto res = retry({"A", "B"});

    EXPECT_TRUE(res.success);
    EXPECT_TRUE(res.message.starts_with("Event sync succeeded on attempt 1"));
    EXPECT_NE(res.message.find("event=A | SUCCESS"), std::string::npos);
    EXPECT_EQ(attempts.size(), 1u);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(RetryTest, SucceedsOnThirdAttempt) {
    int calls = 0;
    auto retry = make([&calls](const std::vector<std::string>& uids) {
        if (++calls < 3) return batch(BatchResult::Outcome::TimedOut, {}, "timeout - server did not confirm task");
        return batch(BatchResult::Outcome::Succeeded, {uploaded(uids.front())}, "uploaded 1/1 events");
    });

    const auto res = retry({"A"});

    EXPECT_TRUE(res.success);
    EXPECT_TRUE(res.message.starts_with("Event sync succeeded on attempt 3"));
    EXPECT_EQ(sleeps, std::vector<std::chrono::milliseconds>(2, std::chrono::milliseconds(7)));
}

TEST_F(RetryTest, ExhaustionReportsLastFailure) {
    auto retry = make([](const std::vector<std::string>& uids) {
        return batch(BatchResult::Outcome::Failed, {failed(uids.front())}, "upload failed: 0/1 events uploaded");
    }, 3);

    const auto res = retry({"A"});

    EXPECT_FALSE(res.success);
    EXPECT_TRUE(res.message.starts_with("Event sync failed after 3 attempts: upload failed: 0/1 events uploaded"));
    EXPECT_NE(res.message.find("event=A | FAIL"), std::string::npos);
    EXPECT_EQ(attempts.size(), 3u);
    EXPECT_EQ(sleeps.size(), 2u);
}

TEST_F(RetryTest, MissingEventsAreNotRetried) {
    auto retry = make([](const std::vector<std::string>& uids) {
        std::vector<ItemResult> items;
        for (const auto& u : uids) items.push_back(missing(u));
        return batch(BatchResult::Outcome::Failed, items, "upload failed: no event could be packaged");
    });

    const auto res = retry({"A", "B"});

    EXPECT_FALSE(res.success);
    EXPECT_TRUE(res.message.starts_with("Event sync failed after 1 attempts"));
    EXPECT_EQ(attempts.size(), 1u);
}

TEST_F(RetryTest, LaterAttemptsDropMissingAndSyncedEvents) {
    int calls = 0;
    auto retry = make([&](const std::vector<std::string>& uids) {
        if (++calls == 1) {
            synced.insert("A");
            return batch(BatchResult::Outcome::Succeeded, {uploaded("A"), missing("B"), failed("C")},
                         "uploaded 1/3 events");
        }
        std::vector<ItemResult> items;
        for (const auto& u : uids) items.push_back(uploaded(u));
        return batch(BatchResult::Outcome::Succeeded, items, "uploaded 1/1 events");
    });

    const auto res = retry({"A", "B", "C"});

    ASSERT_EQ(attempts.size(), 2u);
    EXPECT_EQ(attempts[1], std::vector<std::string>{"C"});
    EXPECT_TRUE(res.success);
    EXPECT_TRUE(res.message.starts_with("Event sync succeeded on attempt 2"));
}

TEST_F(RetryTest, NothingLeftAfterFilteringCountsAsSuccess) {
    auto retry = make([&](const std::vector<std::string>&) {
        synced.insert("A");
        return batch(BatchResult::Outcome::TimedOut, {}, "timeout - server did not confirm task");
    });

    const auto res = retry({"A"});

    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.message, "Event sync succeeded on attempt 1");
    EXPECT_EQ(attempts.size(), 1u);
    EXPECT_FALSE(progress->snapshot().running);
}

TEST_F(RetryTest, ProgressIsResetEveryAttempt) {
    std::vector<SyncProgress> seenAtStart;
    auto retry = make([&](const std::vector<std::string>& uids) {
        seenAtStart.push_back(progress->snapshot());
        progress->reset(static_cast<unsigned int>(uids.size()));
        progress->increment();
        return batch(BatchResult::Outcome::TimedOut, {}, "timeout");
    }, 2);

    retry({"A"});

    ASSERT_EQ(seenAtStart.size(), 2u);
    for (const auto& p : seenAtStart) {
        EXPECT_EQ(p.total, 0u);
        EXPECT_EQ(p.completed, 0u);
    }
}

TEST_F(RetryTest, EmptyInputFailsImmediately) {
    auto retry = make([](const std::vector<std::string>&) { return BatchResult{}; });

    const auto res = retry({});

    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.message, "no events to upload");
    EXPECT_TRUE(attempts.empty());
}
