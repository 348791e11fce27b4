#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace sl::crypto::hash {

// SHA-256 of a file's contents, lowercase hex.
std::string sha256(const std::filesystem::path& filepath);

// BLAKE2b of a string, lowercase hex. digestBytes must be within libsodium's generichash bounds.
std::string blake2b(std::string_view data, size_t digestBytes = 16);

}
