#include "sync/upload/TicketClient.hpp"
#include "remote/Api.hpp"
#include "crypto/Hash.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <set>

using namespace sl::sync::upload;
using namespace sl::sync::model;
using namespace sl::log;

TicketClient::TicketClient(std::shared_ptr<remote::Api> api) : api_(std::move(api)) {
    if (!api_) throw std::invalid_argument("TicketClient requires an api");
}

std::map<std::string, UploadTicket> TicketClient::requestTickets(const UploadTask& task) const {
    std::set<std::string> digests;
    for (const auto& pkg : task.packages) digests.insert(pkg.package_digest);

    std::map<std::string, UploadTicket> tickets;
    for (auto& entry : api_->createUploadTask(task)) {
        if (!digests.contains(entry.digest)) {
            Registry::upload()->warn("[TicketClient] Task {} returned a ticket for unknown digest '{}' (event {})",
                                     task.task_uid, entry.digest, entry.event_uid);
            continue;
        }
        if (!tickets.emplace(entry.digest, std::move(entry.ticket)).second)
            Registry::upload()->warn("[TicketClient] Task {} returned a duplicate ticket for digest {}",
                                     task.task_uid, entry.digest);
    }

    Registry::upload()->debug("[TicketClient] Task {} matched {}/{} tickets",
                              task.task_uid, tickets.size(), task.packages.size());
    return tickets;
}

UploadTicket TicketClient::requestTicket(const std::string& archiveName, const std::string& digest) const {
    auto ticket = api_->requestUploadTicket(archiveName, digest);
    if (ticket.host.empty()) throw std::runtime_error("upload ticket for " + archiveName + " has no host");
    return ticket;
}

OpResult TicketClient::upload(const UploadPackage& pkg, const UploadTicket& ticket) const {
    OpResult result;
    try {
        const auto digest = crypto::hash::sha256(pkg.archive_path);
        if (digest != pkg.package_digest)
            throw std::runtime_error("archive digest changed since packaging (" + digest + ")");

        api_->directUpload(ticket, pkg.archive_path);
        result = OpResult::ok("uploaded as " + ticket.objectKey());
    } catch (const std::exception& e) {
        Registry::upload()->error("[TicketClient] Upload of {} failed: {}", pkg.event_uid, e.what());
        result = OpResult::fail(std::string("upload failed: ") + e.what());
    }

    util::removeQuietly(pkg.archive_path);
    return result;
}
