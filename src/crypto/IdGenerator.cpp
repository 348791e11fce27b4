#include "crypto/IdGenerator.hpp"

#include <chrono>
#include <fmt/format.h>
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace sl::crypto {

static constexpr char kBase32Crockford[] = "0123456789abcdefghjkmnpqrstvwxyz";

void ensure_sodium_init() {
    static const int init = [] {
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

static std::string b32_crockford_encode(const uint8_t* data, const size_t len) {
    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;

    for (size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kBase32Crockford[(buffer >> bits) & 0x1F]);
        }
    }

    if (bits > 0) out.push_back(kBase32Crockford[(buffer << (5 - bits)) & 0x1F]);
    return out;
}

std::string randomToken(const size_t bytes) {
    if (bytes == 0) throw std::invalid_argument("randomToken needs at least one byte");
    ensure_sodium_init();

    std::vector<uint8_t> buf(bytes);
    randombytes_buf(buf.data(), buf.size());
    return b32_crockford_encode(buf.data(), buf.size());
}

std::string generateTaskUid(const int64_t epochMillis) {
    return fmt::format("task_{}_{}", epochMillis, randomToken());
}

std::string generateTaskUid() {
    using namespace std::chrono;
    return generateTaskUid(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

}
