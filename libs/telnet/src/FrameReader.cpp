#include "bcproxy/telnet/FrameReader.hpp"

#include <algorithm>

namespace bcproxy::telnet {

    std::string_view frame_error_name(FrameError error) {
        switch (error) {
            case FrameError::truncated_stream: return "truncated stream";
            case FrameError::nested_subnegotiation: return "nested subnegotiation";
            case FrameError::buffer_overflow: return "subnegotiation buffer overflow";
        }
        return "unknown frame error";
    }

    static std::string unescape_subnegotiation(std::string_view body) {
        std::string out;
        out.reserve(body.size());
        for (std::size_t i = 0; i < body.size(); ++i) {
            out.push_back(body[i]);
            if (body[i] == codes::IAC && i + 1 < body.size() && body[i + 1] == codes::IAC) {
                ++i;
            }
        }
        return out;
    }

    FrameReader::FrameReader(std::size_t max_subnegotiation)
        : max_subnegotiation_(max_subnegotiation) {}

    void FrameReader::feed(std::string_view bytes) {
        buffer_.append(bytes);
    }

    bool FrameReader::in_subnegotiation() const {
        return buffered_size() >= 2 && buffer_[pos_] == codes::IAC && buffer_[pos_ + 1] == codes::SB;
    }

    void FrameReader::compact() {
        if (pos_ == buffer_.size()) {
            buffer_.clear();
            pos_ = 0;
        } else if (pos_ > 4096 && pos_ > buffer_.size() / 2) {
            buffer_.erase(0, pos_);
            pos_ = 0;
        }
    }

    FrameResult FrameReader::next() {
        compact();
        std::string_view view(buffer_);
        view.remove_prefix(pos_);

        if (view.empty()) {
            return std::nullopt;
        }

        if (view[0] != codes::IAC) {
            auto end = view.find(codes::IAC);
            if (end == std::string_view::npos) {
                end = view.size();
            }
            pos_ += end;
            return TelnetMessageData{std::string(view.substr(0, end))};
        }

        if (view.size() < 2) {
            return std::nullopt;
        }

        switch (view[1]) {
            case codes::IAC:
                pos_ += 2;
                return TelnetMessageData{std::string(1, codes::IAC)};

            case codes::WILL:
            case codes::WONT:
            case codes::DO:
            case codes::DONT:
                if (view.size() < 3) {
                    return std::nullopt;
                }
                pos_ += 3;
                return TelnetMessageNegotiation{view[1], view[2]};

            case codes::SB: {
                if (view.size() < 3) {
                    return std::nullopt;
                }
                std::size_t i = std::max<std::size_t>(3, sb_scanned_);
                while (i + 1 < view.size()) {
                    if (view[i] != codes::IAC) {
                        ++i;
                        continue;
                    }
                    const char next = view[i + 1];
                    if (next == codes::SE) {
                        TelnetMessageSubnegotiation sub{view[2], unescape_subnegotiation(view.substr(3, i - 3))};
                        pos_ += i + 2;
                        sb_scanned_ = 0;
                        return sub;
                    }
                    if (next == codes::SB) {
                        return std::unexpected(FrameError::nested_subnegotiation);
                    }
                    // IAC IAC or a stray command byte; both stay in the body.
                    i += 2;
                }
                sb_scanned_ = i;
                if (view.size() - 3 > max_subnegotiation_) {
                    return std::unexpected(FrameError::buffer_overflow);
                }
                return std::nullopt;
            }

            default:
                pos_ += 2;
                return TelnetMessageCommand{view[1]};
        }
    }

    FrameResult FrameReader::finish() {
        auto unit = next();
        if (!unit || unit->has_value()) {
            return unit;
        }
        if (buffered_size() == 0) {
            return std::nullopt;
        }
        if (in_subnegotiation()) {
            return std::unexpected(FrameError::truncated_stream);
        }
        // An incomplete command: hand its bytes over as they are.
        return TelnetMessageData{take_buffered()};
    }

    std::string FrameReader::take_buffered() {
        std::string rest = buffer_.substr(pos_);
        buffer_.clear();
        pos_ = 0;
        sb_scanned_ = 0;
        return rest;
    }

}
