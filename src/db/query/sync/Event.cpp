#include "db/query/sync/Event.hpp"
#include "db/Transactions.hpp"

using namespace sl::db::query::sync;

bool Event::isSynced(const std::string& eventUid) {
    return Transactions::exec("Event::isSynced", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"is_event_synced"}, pqxx::params{eventUid});
        return !res.empty() && res.one_field().as<bool>();
    });
}

void Event::track(const std::string& eventUid, const std::string& projectUid) {
    Transactions::exec("Event::track", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"track_event"}, pqxx::params{eventUid, projectUid});
    });
}

void Event::markSynced(const std::string& eventUid, const std::string& projectUid,
                       const std::string& taskUid, const std::string& packageDigest) {
    Transactions::exec("Event::markSynced", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(eventUid);
        p.append(projectUid);
        p.append(taskUid);
        p.append(packageDigest);

        txn.exec(pqxx::prepped{"mark_event_synced"}, p);
    });
}

std::vector<std::string> Event::listUnsynced(const std::string& projectUid) {
    return Transactions::exec("Event::listUnsynced", [&](pqxx::work& txn) {
        std::vector<std::string> uids;
        for (const auto& row : txn.exec(pqxx::prepped{"list_unsynced_events"}, pqxx::params{projectUid}))
            uids.push_back(row[0].as<std::string>());
        return uids;
    });
}
