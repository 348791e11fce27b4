#include "concurrency/upload/PackageUploadTask.hpp"
#include "sync/upload/TicketClient.hpp"
#include "sync/ProgressTracker.hpp"
#include "log/Registry.hpp"

using namespace sl::concurrency;
using namespace sl::sync::model;

PackageUploadTask::PackageUploadTask(std::shared_ptr<sync::upload::TicketClient> c,
                                     UploadPackage pkg,
                                     UploadTicket t,
                                     std::shared_ptr<sync::ProgressTracker> p)
    : client(std::move(c)), package(std::move(pkg)), ticket(std::move(t)), progress(std::move(p)) {}

void PackageUploadTask::operator()() {
    ItemResult item;
    item.event_uid = package.event_uid;

    try {
        const auto res = client->upload(package, ticket);
        item.kind = res.success ? ItemResult::Kind::Uploaded : ItemResult::Kind::UploadFailed;
        item.message = res.message;
    } catch (const std::exception& e) {
        log::Registry::upload()->error("[PackageUploadTask] Failed to upload {}: {}", package.event_uid, e.what());
        item.kind = ItemResult::Kind::UploadFailed;
        item.message = e.what();
    }

    if (progress && item.ok()) progress->increment();
    promise.set_value(item);
}
