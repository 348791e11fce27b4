#pragma once

#include "sync/model/Result.hpp"
#include "sync/model/Upload.hpp"

#include <map>
#include <memory>
#include <string>

namespace sl::remote { class Api; }

namespace sl::sync::upload {

// Exchanges package digests for one-time upload destinations and performs the direct write.
class TicketClient {
public:
    explicit TicketClient(std::shared_ptr<remote::Api> api);

    // One request for every package of the task. Tickets are matched strictly by digest; entries
    // echoing an unknown digest are logged and dropped. Throws on a ticketing failure.
    std::map<std::string, model::UploadTicket> requestTickets(const model::UploadTask& task) const;

    // Single-package ticket. Throws on failure.
    model::UploadTicket requestTicket(const std::string& archiveName, const std::string& digest) const;

    // Re-verifies the archive digest, then uploads. The archive is deleted afterwards regardless
    // of the outcome. Never throws.
    model::OpResult upload(const model::UploadPackage& pkg, const model::UploadTicket& ticket) const;

private:
    std::shared_ptr<remote::Api> api_;
};

}
