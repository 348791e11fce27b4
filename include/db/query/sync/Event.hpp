#pragma once

#include "sync/store/EventStore.hpp"

namespace sl::db::query::sync {

class Event final : public sl::sync::store::EventStore {
public:
    bool isSynced(const std::string& eventUid) override;
    void track(const std::string& eventUid, const std::string& projectUid) override;
    void markSynced(const std::string& eventUid, const std::string& projectUid,
                    const std::string& taskUid, const std::string& packageDigest) override;
    std::vector<std::string> listUnsynced(const std::string& projectUid) override;
};

}
