#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace sl::util {

// Streaming ZIP (deflate) writer on top of zlib. Entries are written in call order; the
// central directory is appended by close(). Archives are limited to 4 GiB (no ZIP64).
class ZipWriter {
public:
    explicit ZipWriter(const std::filesystem::path& path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    void addFile(const std::string& entryName, const std::filesystem::path& source);
    void addBytes(const std::string& entryName, const std::string& data);

    void close();

    [[nodiscard]] size_t entryCount() const { return entries_.size(); }

private:
    struct Entry {
        std::string name;
        uint32_t crc{}, compressedSize{}, uncompressedSize{}, localHeaderOffset{};
    };

    std::filesystem::path path_;
    std::ofstream out_;
    std::vector<Entry> entries_;
    uint16_t dosTime_{}, dosDate_{};
    bool closed_{false};

    template <class ReadFn>
    void writeEntry(const std::string& entryName, ReadFn&& read);

    [[nodiscard]] uint32_t offset();
};

}
