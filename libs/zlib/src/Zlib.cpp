#include "bcproxy/zlib/Zlib.hpp"

namespace bcproxy::zlib {

DeflateStream::DeflateStream(int level) : buffer_(16 * 1024) {
    zstream_.zalloc = Z_NULL;
    zstream_.zfree = Z_NULL;
    zstream_.opaque = Z_NULL;

    if (deflateInit(&zstream_, level) != Z_OK) {
        throw std::runtime_error("zlib deflateInit failed.");
    }
}

DeflateStream::~DeflateStream() {
    deflateEnd(&zstream_);
}

std::string DeflateStream::write(std::string_view input, FlushMode flush) {
    std::string out;
    write(as_bytes(input), [&out](std::span<const std::byte> chunk) {
        out.append(reinterpret_cast<const char*>(chunk.data()), chunk.size());
    }, flush);
    return out;
}

std::string DeflateStream::finish() {
    std::string out;
    finish([&out](std::span<const std::byte> chunk) {
        out.append(reinterpret_cast<const char*>(chunk.data()), chunk.size());
    });
    return out;
}

InflateStream::InflateStream() : buffer_(16 * 1024) {
    zstream_.zalloc = Z_NULL;
    zstream_.zfree = Z_NULL;
    zstream_.opaque = Z_NULL;

    if (inflateInit(&zstream_) != Z_OK) {
        throw std::runtime_error("zlib inflateInit failed.");
    }
}

InflateStream::~InflateStream() {
    inflateEnd(&zstream_);
}

void InflateStream::reset() {
    if (inflateReset(&zstream_) != Z_OK) {
        throw std::runtime_error("zlib inflateReset failed.");
    }
    ended_ = false;
}

InflateResult InflateStream::write(std::string_view input, std::string& out) {
    return write(as_bytes(input), [&out](std::span<const std::byte> chunk) {
        out.append(reinterpret_cast<const char*>(chunk.data()), chunk.size());
    });
}

} // namespace bcproxy::zlib
