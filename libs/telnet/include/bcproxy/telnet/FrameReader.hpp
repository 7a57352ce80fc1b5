#pragma once
#include "Base.hpp"

#include <expected>
#include <optional>

namespace bcproxy::telnet {

    enum class FrameError {
        truncated_stream,
        nested_subnegotiation,
        buffer_overflow,
    };

    std::string_view frame_error_name(FrameError error);

    inline auto format_as(FrameError error) {
        return frame_error_name(error);
    }

    using FrameResult = std::expected<std::optional<TelnetMessage>, FrameError>;

    // Incremental tokenizer for one direction of a telnet stream. Bytes are
    // fed as they arrive from the socket; next() yields one unit at a time and
    // std::nullopt when the buffered tail cannot complete a unit yet.
    class FrameReader {
        public:
        explicit FrameReader(std::size_t max_subnegotiation = telnet_limits.max_subnegotiation);

        void feed(std::string_view bytes);

        FrameResult next();

        // End of stream. A dangling command is released as data; a dangling
        // sub-negotiation is truncated_stream.
        FrameResult finish();

        // Hands back everything not yet parsed, e.g. when the peer switches
        // the rest of the stream to compression.
        std::string take_buffered();

        [[nodiscard]] std::size_t buffered_size() const {
            return buffer_.size() - pos_;
        }

        [[nodiscard]] bool in_subnegotiation() const;

        private:
        void compact();

        std::string buffer_;
        std::size_t pos_{0};
        // How far a pending sub-negotiation has been scanned for IAC SE.
        std::size_t sb_scanned_{0};
        std::size_t max_subnegotiation_;
    };

}
