#include "crypto/Hash.hpp"
#include "crypto/IdGenerator.hpp"

#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <openssl/evp.h>
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace sl::crypto::hash {

static std::string toHex(const unsigned char* data, const size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) out += fmt::format("{:02x}", data[i]);
    return out;
}

std::string sha256(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());

    const std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("SHA-256 init failed");

    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = file.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1)
            throw std::runtime_error("SHA-256 update failed for " + filepath.string());
    }
    if (file.bad()) throw std::runtime_error("Read error while hashing " + filepath.string());

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1)
        throw std::runtime_error("SHA-256 finalize failed");

    return toHex(digest, len);
}

std::string blake2b(const std::string_view data, const size_t digestBytes) {
    if (digestBytes < crypto_generichash_BYTES_MIN || digestBytes > crypto_generichash_BYTES_MAX)
        throw std::invalid_argument("blake2b digest size out of range");

    ensure_sodium_init();

    std::vector<unsigned char> digest(digestBytes);
    if (crypto_generichash(digest.data(), digest.size(),
                           reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                           nullptr, 0) != 0)
        throw std::runtime_error("blake2b failed");

    return toHex(digest.data(), digest.size());
}

}
