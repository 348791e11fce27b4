#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sl::util {

std::string readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(size, '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());
    in.close();

    return buffer;
}

void writeFile(const fs::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + path.string());
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.close();
    if (!out) throw std::runtime_error("Failed to write file: " + path.string());
}

void writeFileAtomically(const fs::path& path, const std::string& contents) {
    auto tmp = path;
    tmp += ".tmp";
    writeFile(tmp, contents);
    fs::rename(tmp, path);
}

std::string sanitizeFileName(const std::string& name) {
    std::string out = name;
    std::ranges::replace_if(out, [](const unsigned char c) {
        return !(std::isalnum(c) || c == '.' || c == '_' || c == '-');
    }, '_');
    return out;
}

std::optional<std::string> extensionOf(const std::string& name) {
    const auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= name.size()) return std::nullopt;

    auto ext = name.substr(dot + 1);
    if (ext.find('/') != std::string::npos) return std::nullopt;
    std::ranges::transform(ext, ext.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string fileNameFromUrl(const std::string& url) {
    auto path = url.substr(0, url.find_first_of("?#"));
    if (const auto scheme = path.find("://"); scheme != std::string::npos) {
        const auto slash = path.find('/', scheme + 3);
        if (slash == std::string::npos) return {};
        path = path.substr(slash);
    }
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool removeQuietly(const fs::path& path) {
    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) log::Registry::storage()->warn("[files] Failed to remove {}: {}", path.string(), ec.message());
    return removed;
}

bool isOlderThan(const fs::path& path, const std::chrono::seconds age) {
    std::error_code ec;
    const auto mtime = fs::last_write_time(path, ec);
    if (ec) return false;
    return fs::file_time_type::clock::now() - mtime > age;
}

}
