#include "util/ZipWriter.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <array>
#include <ctime>
#include <limits>
#include <stdexcept>
#include <zlib.h>

using namespace sl::util;

namespace {

constexpr uint32_t kLocalHeaderSig   = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralSig  = 0x06054b50;
constexpr uint16_t kVersion          = 20;
constexpr uint16_t kFlagUtf8         = 0x0800;
constexpr uint16_t kMethodDeflate    = 8;
constexpr size_t   kChunk            = 64 * 1024;

void put16(std::ostream& out, const uint16_t v) {
    const char b[2] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff)};
    out.write(b, 2);
}

void put32(std::ostream& out, const uint32_t v) {
    const char b[4] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff),
                       static_cast<char>((v >> 16) & 0xff), static_cast<char>((v >> 24) & 0xff)};
    out.write(b, 4);
}

uint32_t checked32(const uintmax_t v, const char* what) {
    if (v > std::numeric_limits<uint32_t>::max())
        throw std::runtime_error(std::string("ZIP archive too large: ") + what + " exceeds 4 GiB");
    return static_cast<uint32_t>(v);
}

}

ZipWriter::ZipWriter(const std::filesystem::path& path) : path_(path), out_(path, std::ios::binary | std::ios::trunc) {
    if (!out_) throw std::runtime_error("Failed to open archive for writing: " + path.string());

    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    dosTime_ = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    dosDate_ = static_cast<uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

ZipWriter::~ZipWriter() {
    if (closed_) return;
    try {
        close();
    } catch (const std::exception& e) {
        log::Registry::storage()->error("[ZipWriter] Failed to finalize {}: {}", path_.string(), e.what());
    }
}

uint32_t ZipWriter::offset() {
    const auto pos = out_.tellp();
    if (pos < 0) throw std::runtime_error("Failed to query archive position: " + path_.string());
    return checked32(static_cast<uintmax_t>(pos), "offset");
}

template <class ReadFn>
void ZipWriter::writeEntry(const std::string& entryName, ReadFn&& read) {
    if (closed_) throw std::logic_error("ZipWriter already closed");
    if (entryName.size() > std::numeric_limits<uint16_t>::max())
        throw std::invalid_argument("ZIP entry name too long: " + entryName);

    Entry entry;
    entry.name = entryName;
    entry.localHeaderOffset = offset();

    put32(out_, kLocalHeaderSig);
    put16(out_, kVersion);
    put16(out_, kFlagUtf8);
    put16(out_, kMethodDeflate);
    put16(out_, dosTime_);
    put16(out_, dosDate_);
    put32(out_, 0);  // crc, patched below
    put32(out_, 0);  // compressed size
    put32(out_, 0);  // uncompressed size
    put16(out_, static_cast<uint16_t>(entryName.size()));
    put16(out_, 0);
    out_.write(entryName.data(), static_cast<std::streamsize>(entryName.size()));

    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw std::runtime_error("deflateInit2 failed");

    std::vector<char> in(kChunk);
    std::array<unsigned char, kChunk> outBuf{};
    uLong crc = crc32(0L, Z_NULL, 0);
    uintmax_t rawTotal = 0, compTotal = 0;

    try {
        int flush = Z_NO_FLUSH;
        do {
            const size_t n = read(in.data(), in.size());
            rawTotal += n;
            crc = crc32(crc, reinterpret_cast<const Bytef*>(in.data()), static_cast<uInt>(n));
            flush = n == 0 ? Z_FINISH : Z_NO_FLUSH;

            zs.next_in = reinterpret_cast<Bytef*>(in.data());
            zs.avail_in = static_cast<uInt>(n);
            do {
                zs.next_out = outBuf.data();
                zs.avail_out = static_cast<uInt>(outBuf.size());
                if (deflate(&zs, flush) == Z_STREAM_ERROR) throw std::runtime_error("deflate failed");
                const size_t produced = outBuf.size() - zs.avail_out;
                out_.write(reinterpret_cast<const char*>(outBuf.data()), static_cast<std::streamsize>(produced));
                compTotal += produced;
            } while (zs.avail_out == 0);
        } while (flush != Z_FINISH);
    } catch (...) {
        deflateEnd(&zs);
        throw;
    }
    deflateEnd(&zs);

    entry.crc = static_cast<uint32_t>(crc);
    entry.uncompressedSize = checked32(rawTotal, "entry size");
    entry.compressedSize = checked32(compTotal, "compressed entry size");

    const auto end = out_.tellp();
    out_.seekp(entry.localHeaderOffset + 14);
    put32(out_, entry.crc);
    put32(out_, entry.compressedSize);
    put32(out_, entry.uncompressedSize);
    out_.seekp(end);

    if (!out_) throw std::runtime_error("Failed writing archive entry " + entryName + " to " + path_.string());
    entries_.push_back(std::move(entry));
}

void ZipWriter::addFile(const std::string& entryName, const std::filesystem::path& source) {
    std::ifstream in(source, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open file for archiving: " + source.string());

    writeEntry(entryName, [&](char* buf, const size_t cap) -> size_t {
        in.read(buf, static_cast<std::streamsize>(cap));
        if (in.bad()) throw std::runtime_error("Read error while archiving " + source.string());
        return static_cast<size_t>(in.gcount());
    });
}

void ZipWriter::addBytes(const std::string& entryName, const std::string& data) {
    size_t pos = 0;
    writeEntry(entryName, [&](char* buf, const size_t cap) -> size_t {
        const size_t n = std::min(cap, data.size() - pos);
        std::copy_n(data.data() + pos, n, buf);
        pos += n;
        return n;
    });
}

void ZipWriter::close() {
    if (closed_) return;
    closed_ = true;

    const uint32_t cdOffset = offset();
    for (const auto& e : entries_) {
        put32(out_, kCentralHeaderSig);
        put16(out_, kVersion);
        put16(out_, kVersion);
        put16(out_, kFlagUtf8);
        put16(out_, kMethodDeflate);
        put16(out_, dosTime_);
        put16(out_, dosDate_);
        put32(out_, e.crc);
        put32(out_, e.compressedSize);
        put32(out_, e.uncompressedSize);
        put16(out_, static_cast<uint16_t>(e.name.size()));
        put16(out_, 0);  // extra
        put16(out_, 0);  // comment
        put16(out_, 0);  // disk start
        put16(out_, 0);  // internal attrs
        put32(out_, 0);  // external attrs
        put32(out_, e.localHeaderOffset);
        out_.write(e.name.data(), static_cast<std::streamsize>(e.name.size()));
    }
    const uint32_t cdSize = offset() - cdOffset;

    if (entries_.size() > std::numeric_limits<uint16_t>::max())
        throw std::runtime_error("ZIP archive has too many entries");
    const auto count = static_cast<uint16_t>(entries_.size());

    put32(out_, kEndOfCentralSig);
    put16(out_, 0);
    put16(out_, 0);
    put16(out_, count);
    put16(out_, count);
    put32(out_, cdSize);
    put32(out_, cdOffset);
    put16(out_, 0);

    out_.close();
    if (!out_) throw std::runtime_error("Failed to finalize archive: " + path_.string());
}
