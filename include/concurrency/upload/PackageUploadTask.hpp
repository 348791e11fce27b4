#pragma once

#include "concurrency/Task.hpp"
#include "sync/model/Upload.hpp"

#include <memory>

namespace sl::sync {
class ProgressTracker;
}

namespace sl::sync::upload {
class TicketClient;
}

namespace sl::concurrency {

// Uploads one package to its ticket; fulfils the promise with an ItemResult.
struct PackageUploadTask final : PromisedTask {
    std::shared_ptr<sync::upload::TicketClient> client;
    sync::model::UploadPackage package;
    sync::model::UploadTicket ticket;
    std::shared_ptr<sync::ProgressTracker> progress;

    PackageUploadTask(std::shared_ptr<sync::upload::TicketClient> c,
                      sync::model::UploadPackage pkg,
                      sync::model::UploadTicket t,
                      std::shared_ptr<sync::ProgressTracker> p);

    void operator()() override;
};

}
