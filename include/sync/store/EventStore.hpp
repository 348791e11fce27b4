#pragma once

#include <string>
#include <vector>

namespace sl::sync::store {

// Sync bookkeeping for locally captured events.
class EventStore {
public:
    virtual ~EventStore() = default;

    virtual bool isSynced(const std::string& eventUid) = 0;

    // Records a packaged event as pending for its project; existing rows are left alone.
    virtual void track(const std::string& eventUid, const std::string& projectUid) = 0;

    virtual void markSynced(const std::string& eventUid, const std::string& projectUid,
                            const std::string& taskUid, const std::string& packageDigest) = 0;
    virtual std::vector<std::string> listUnsynced(const std::string& projectUid) = 0;
};

}
