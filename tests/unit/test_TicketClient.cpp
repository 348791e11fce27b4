#include <gtest/gtest.h>
#include "sync/upload/TicketClient.hpp"
#include "sync/ProgressTracker.hpp"
#include "concurrency/upload/PackageUploadTask.hpp"
#include "crypto/Hash.hpp"
#include "util/files.hpp"
#include "fakes/FakeApi.hpp"

#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace sl::sync::model;
using namespace sl::sync::upload;
using sl::test::FakeApi;

class TicketClientTest : public ::testing::Test {
protected:
    fs::path dir;
    std::shared_ptr<FakeApi> api = std::make_shared<FakeApi>();
    TicketClient client{api};

    void SetUp() override {
        dir = fs::temp_directory_path() / ("siteline_tickets_" + std::to_string(::getpid()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override { fs::remove_all(dir); }

    UploadPackage archive(const std::string& eventUid, const std::string& contents) const {
        UploadPackage pkg;
        pkg.event_uid = eventUid;
        pkg.archive_name = eventUid + ".zip";
        pkg.archive_path = dir / pkg.archive_name;
        sl::util::writeFile(pkg.archive_path, contents);
        pkg.package_digest = sl::crypto::hash::sha256(pkg.archive_path);
        return pkg;
    }
};

TEST_F(TicketClientTest, SingleTicketUsesDigestAsObjectKey) {
    const auto ticket = client.requestTicket("E1.zip", "abc123");
    EXPECT_EQ(ticket.host, "bucket.example.com");
    EXPECT_EQ(ticket.objectKey(), "events/abc123");
}

TEST_F(TicketClientTest, TicketWithoutHostIsRejected) {
    EXPECT_THROW(client.requestTicket("", "abc123"), std::runtime_error);
}

TEST_F(TicketClientTest, UploadRemovesArchiveOnSuccess) {
    const auto pkg = archive("E1", "zip bytes one");
    const auto res = client.upload(pkg, FakeApi::ticketFor(pkg).ticket);

    EXPECT_TRUE(res.success) << res.message;
    EXPECT_EQ(res.message, "uploaded as events/E1.zip");
    EXPECT_FALSE(fs::exists(pkg.archive_path));
    EXPECT_EQ(api->uploadsByEvent["E1"], "events/E1.zip");
}

TEST_F(TicketClientTest, UploadRemovesArchiveOnFailure) {
    api->failingUploads.insert("E1");
    const auto pkg = archive("E1", "zip bytes one");
    const auto res = client.upload(pkg, FakeApi::ticketFor(pkg).ticket);

    EXPECT_FALSE(res.success);
    EXPECT_TRUE(res.message.starts_with("upload failed: "));
    EXPECT_FALSE(fs::exists(pkg.archive_path));
}

TEST_F(TicketClientTest, ModifiedArchiveIsNotUploaded) {
    const auto pkg = archive("E1", "zip bytes one");
    sl::util::writeFile(pkg.archive_path, "tampered");

    const auto res = client.upload(pkg, FakeApi::ticketFor(pkg).ticket);

    EXPECT_FALSE(res.success);
    EXPECT_NE(res.message.find("digest changed"), std::string::npos);
    EXPECT_EQ(api->uploadCalls.load(), 0);
}

TEST_F(TicketClientTest, TicketsAreKeyedByDigest) {
    UploadTask task;
    task.task_uid = "task_1";
    task.packages = {archive("E1", "one"), archive("E2", "two")};

    api->onCreateUploadTask = [](const UploadTask& t) {
        std::vector<sl::remote::TicketEntry> entries;
        for (const auto& pkg : t.packages) entries.push_back(FakeApi::ticketFor(pkg));
        sl::remote::TicketEntry unknown;
        unknown.digest = "0000";
        entries.push_back(unknown);
        entries.push_back(FakeApi::ticketFor(t.packages.front()));
        return entries;
    };

    const auto tickets = client.requestTickets(task);

    ASSERT_EQ(tickets.size(), 2u);
    EXPECT_EQ(tickets.at(task.packages[0].package_digest).object_id, "E1.zip");
    EXPECT_EQ(tickets.at(task.packages[1].package_digest).object_id, "E2.zip");
    EXPECT_FALSE(tickets.contains("0000"));
}

TEST_F(TicketClientTest, TicketingFailurePropagates) {
    UploadTask task;
    task.packages = {archive("E1", "one")};
    api->onCreateUploadTask = [](const UploadTask&) -> std::vector<sl::remote::TicketEntry> {
        throw sl::remote::ApiError("unauthorized", 401);
    };

    EXPECT_THROW(client.requestTickets(task), sl::remote::ApiError);
}

TEST_F(TicketClientTest, RejectedUploadTaskDoesNotAdvanceProgress) {
    api->failingUploads.insert("E1");
    const auto progress = std::make_shared<sl::sync::ProgressTracker>();
    progress->reset(1);

    const auto pkg = archive("E1", "zip bytes one");
    const auto uploader = std::make_shared<TicketClient>(api);
    sl::concurrency::PackageUploadTask job(uploader, pkg, FakeApi::ticketFor(pkg).ticket, progress);
    auto future = job.getFuture().value();
    job();

    const auto value = future.get();
    ASSERT_TRUE(std::holds_alternative<ItemResult>(value));
    EXPECT_EQ(std::get<ItemResult>(value).kind, ItemResult::Kind::UploadFailed);
    EXPECT_EQ(progress->snapshot().completed, 0u);
    EXPECT_EQ(progress->snapshot().total, 1u);
}

TEST_F(TicketClientTest, AcceptedUploadTaskAdvancesProgress) {
    const auto progress = std::make_shared<sl::sync::ProgressTracker>();
    progress->reset(1);

    const auto pkg = archive("E2", "zip bytes two");
    sl::concurrency::PackageUploadTask job(std::make_shared<TicketClient>(api), pkg, FakeApi::ticketFor(pkg).ticket, progress);
    auto future = job.getFuture().value();
    job();

    EXPECT_TRUE(std::get<ItemResult>(future.get()).ok());
    EXPECT_EQ(progress->snapshot().completed, 1u);
}
