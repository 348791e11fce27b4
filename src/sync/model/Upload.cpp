#include "sync/model/Upload.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

using namespace sl::sync::model;

std::string UploadTicket::uploadUrl() const {
    if (host.starts_with("http://") || host.starts_with("https://")) return host;
    return "https://" + host;
}

std::string ItemResult::reportLine() const {
    return fmt::format("event={} | {} | {}", event_uid, ok() ? "SUCCESS" : "FAIL", message);
}

bool BatchResult::ok() const {
    return outcome == Outcome::Succeeded && std::ranges::all_of(items, [](const ItemResult& i) { return i.ok(); });
}

bool BatchResult::retryable() const {
    if (outcome == Outcome::TimedOut) return true;
    return std::ranges::any_of(items, [](const ItemResult& i) { return i.retryable(); });
}

unsigned int BatchResult::uploadedCount() const {
    return static_cast<unsigned int>(std::ranges::count_if(items, [](const ItemResult& i) { return i.ok(); }));
}

std::string BatchResult::report() const {
    std::string out = message;
    for (const auto& item : items) {
        out += '\n';
        out += item.reportLine();
    }
    return out;
}

std::string sl::sync::model::to_string(const BatchResult::Outcome& outcome) {
    switch (outcome) {
        case BatchResult::Outcome::Succeeded: return "succeeded";
        case BatchResult::Outcome::TimedOut: return "timed_out";
        case BatchResult::Outcome::Failed: return "failed";
        default: throw std::invalid_argument("Unknown batch outcome");
    }
}
