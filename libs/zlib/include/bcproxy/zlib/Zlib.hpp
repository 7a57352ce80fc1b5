#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <zlib.h>

namespace bcproxy::zlib {

enum class FlushMode : int {
    none = Z_NO_FLUSH,
    sync = Z_SYNC_FLUSH,
    full = Z_FULL_FLUSH
};

inline std::span<const std::byte> as_bytes(std::string_view text) {
    return {reinterpret_cast<const std::byte*>(text.data()), text.size()};
}

class DeflateStream {
public:
    explicit DeflateStream(int level = Z_DEFAULT_COMPRESSION);
    ~DeflateStream();

    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;

    template <typename Sink>
        requires requires(Sink&& sink, std::span<const std::byte> chunk) { sink(chunk); }
    std::size_t write(std::span<const std::byte> input, Sink&& sink, FlushMode flush = FlushMode::none) {
        return process(input, static_cast<int>(flush), std::forward<Sink>(sink));
    }

    template <typename Sink>
        requires requires(Sink&& sink, std::span<const std::byte> chunk) { sink(chunk); }
    std::size_t finish(Sink&& sink) {
        return process({}, Z_FINISH, std::forward<Sink>(sink));
    }

    // Compresses into a string, for callers that want the whole output at once.
    std::string write(std::string_view input, FlushMode flush = FlushMode::sync);
    std::string finish();

private:
    template <typename Sink>
    std::size_t process(std::span<const std::byte> input, int flush, Sink&& sink) {
        if (ended_) {
            throw std::runtime_error("DeflateStream used after finish().");
        }

        zstream_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
        zstream_.avail_in = static_cast<uInt>(input.size());

        std::size_t total_out = 0;
        for (;;) {
            zstream_.next_out = reinterpret_cast<Bytef*>(buffer_.data());
            zstream_.avail_out = static_cast<uInt>(buffer_.size());

            const int ret = deflate(&zstream_, flush);
            if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
                throw std::runtime_error("zlib deflate failed.");
            }

            const std::size_t produced = buffer_.size() - zstream_.avail_out;
            if (produced > 0) {
                sink(std::span<const std::byte>(buffer_.data(), produced));
                total_out += produced;
            }

            if (ret == Z_STREAM_END) {
                ended_ = true;
                break;
            }
            // A full output buffer means deflate may have more pending.
            if (zstream_.avail_in == 0 && zstream_.avail_out != 0) {
                break;
            }
        }

        return total_out;
    }

    z_stream zstream_{};
    std::vector<std::byte> buffer_;
    bool ended_{false};
};

// Result of feeding compressed bytes. When the zlib stream ends inside the
// input, `consumed` tells how many bytes belonged to it; the rest are plain.
struct InflateResult {
    std::size_t consumed{0};
    std::size_t produced{0};
    bool stream_end{false};
};

class InflateStream {
public:
    InflateStream();
    ~InflateStream();

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    void reset();

    [[nodiscard]] bool ended() const {
        return ended_;
    }

    template <typename Sink>
        requires requires(Sink&& sink, std::span<const std::byte> chunk) { sink(chunk); }
    InflateResult write(std::span<const std::byte> input, Sink&& sink) {
        if (ended_) {
            throw std::runtime_error("InflateStream used after end of stream.");
        }

        zstream_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
        zstream_.avail_in = static_cast<uInt>(input.size());

        InflateResult result;
        for (;;) {
            zstream_.next_out = reinterpret_cast<Bytef*>(buffer_.data());
            zstream_.avail_out = static_cast<uInt>(buffer_.size());

            const int ret = inflate(&zstream_, Z_NO_FLUSH);
            if (ret == Z_BUF_ERROR) {
                // Nothing more to do until more input arrives.
                break;
            }
            if (ret != Z_OK && ret != Z_STREAM_END) {
                throw std::runtime_error(zstream_.msg ? std::string("zlib inflate failed: ") + zstream_.msg
                                                      : std::string("zlib inflate failed."));
            }

            const std::size_t produced = buffer_.size() - zstream_.avail_out;
            if (produced > 0) {
                sink(std::span<const std::byte>(buffer_.data(), produced));
                result.produced += produced;
            }

            if (ret == Z_STREAM_END) {
                ended_ = true;
                result.stream_end = true;
                break;
            }

            // Room left in the output buffer means the input is used up.
            if (zstream_.avail_out != 0) {
                break;
            }
        }

        result.consumed = input.size() - zstream_.avail_in;
        return result;
    }

    // Inflates into `out`, appending.
    InflateResult write(std::string_view input, std::string& out);

private:
    z_stream zstream_{};
    std::vector<std::byte> buffer_;
    bool ended_{false};
};

} // namespace bcproxy::zlib
