#pragma once

#include "remote/Api.hpp"

#include <atomic>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace sl::test {

// Scriptable remote service. Downloads write "content:<url>" unless the url is marked failing.
class FakeApi : public remote::Api {
public:
    std::vector<sync::model::Project> projects;
    std::map<std::string, nlohmann::json> details;
    std::set<std::string> unresolvable;     // remote ids the url endpoint rejects
    std::set<std::string> failingDownloads; // urls whose transfer fails
    std::map<std::string, std::string> resolvedFileTypes;

    std::function<std::vector<remote::TicketEntry>(const sync::model::UploadTask&)> onCreateUploadTask;
    std::set<std::string> failingUploads;   // event uids whose direct upload fails
    std::function<bool(const std::string&)> onPoll = [](const std::string&) { return true; };

    std::atomic<int> listCalls{0}, detailCalls{0}, resolveCalls{0}, downloadCalls{0};
    std::atomic<int> createTaskCalls{0}, uploadCalls{0}, pollCalls{0};

    mutable std::mutex mutex;
    std::vector<std::string> detailFetches;
    std::map<std::string, std::string> uploadsByEvent;  // event uid -> object key it was written to
    std::vector<sync::model::UploadTask> createdTasks;

    std::vector<sync::model::Project> listProjects() override {
        ++listCalls;
        return projects;
    }

    nlohmann::json getProjectDetail(const std::string& projectUid) override {
        ++detailCalls;
        {
            std::scoped_lock lock(mutex);
            detailFetches.push_back(projectUid);
        }
        const auto it = details.find(projectUid);
        if (it == details.end()) throw remote::ApiError("no detail for " + projectUid, 404);
        return it->second;
    }

    std::vector<remote::ResolvedUrl> resolveDownloadUrl(const std::vector<std::string>& remoteIds) override {
        ++resolveCalls;
        std::vector<remote::ResolvedUrl> out;
        for (const auto& id : remoteIds) {
            if (unresolvable.contains(id)) throw remote::ApiError("cannot resolve " + id, 500);
            remote::ResolvedUrl r;
            r.remote_id = id;
            r.url = "https://cdn.example.com/files/" + id + ".bin";
            if (const auto t = resolvedFileTypes.find(id); t != resolvedFileTypes.end()) r.file_type = t->second;
            out.push_back(std::move(r));
        }
        return out;
    }

    void download(const std::string& url, const std::filesystem::path& dest) override {
        ++downloadCalls;
        if (failingDownloads.contains(url)) throw std::runtime_error("transfer interrupted: " + url);
        std::ofstream out(dest, std::ios::binary | std::ios::trunc);
        out << "content:" << url;
    }

    sync::model::UploadTicket requestUploadTicket(const std::string& fileName, const std::string& digest) override {
        sync::model::UploadTicket t;
        t.host = fileName.empty() ? "" : "bucket.example.com";
        t.directory = "events/";
        t.object_id = digest;
        return t;
    }

    std::vector<remote::TicketEntry> createUploadTask(const sync::model::UploadTask& task) override {
        ++createTaskCalls;
        {
            std::scoped_lock lock(mutex);
            createdTasks.push_back(task);
        }
        if (onCreateUploadTask) return onCreateUploadTask(task);

        std::vector<remote::TicketEntry> entries;
        for (const auto& pkg : task.packages) entries.push_back(ticketFor(pkg));
        return entries;
    }

    void directUpload(const sync::model::UploadTicket& ticket, const std::filesystem::path& archive) override {
        ++uploadCalls;
        const auto eventUid = archive.stem().string();
        if (failingUploads.contains(eventUid)) throw remote::ApiError("upload rejected for " + eventUid, 403);
        std::scoped_lock lock(mutex);
        uploadsByEvent[eventUid] = ticket.objectKey();
    }

    bool pollTaskStatus(const std::string& taskUid) override {
        ++pollCalls;
        return onPoll(taskUid);
    }

    static remote::TicketEntry ticketFor(const sync::model::UploadPackage& pkg) {
        remote::TicketEntry e;
        e.digest = pkg.package_digest;
        e.event_uid = pkg.event_uid;
        e.package_name = pkg.archive_name;
        e.ticket.host = "bucket.example.com";
        e.ticket.directory = "events/";
        e.ticket.object_id = pkg.event_uid + ".zip";
        return e;
    }

    static sync::model::Project project(const std::string& uid, const std::string& hash,
                                        const unsigned int defects = 0, const unsigned int events = 0) {
        sync::model::Project p;
        p.uid = uid;
        p.name = "Project " + uid;
        p.content_hash = hash;
        p.defect_count = defects;
        p.event_count = events;
        return p;
    }
};

}
