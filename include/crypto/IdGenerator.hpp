#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sl::crypto {

// Thread-safe, idempotent.
void ensure_sodium_init();

// Lowercase Crockford base32 of `bytes` random bytes from libsodium.
std::string randomToken(size_t bytes = 5);

// Upload task identifier: task_<epoch millis>_<random>. Unique per attempt.
std::string generateTaskUid();
std::string generateTaskUid(int64_t epochMillis);

}
