#pragma once

#include "config/Config.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>

namespace sl::services {

struct SweepReport {
    unsigned int removed{};
    uintmax_t bytes{};
};

// Removes stale partial downloads (*.tmp) and leftover scratch archives.
class StorageJanitor {
public:
    explicit StorageJanitor(config::StorageConfig cfg);

    // Only entries older than cache_max_age_days are touched. Never throws.
    SweepReport sweep() const;

    [[nodiscard]] std::chrono::seconds maxAge() const;

private:
    config::StorageConfig cfg_;

    void sweepDir(const std::filesystem::path& dir, bool tmpOnly, SweepReport& report) const;
};

}
