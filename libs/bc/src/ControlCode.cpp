#include "bcproxy/bc/ControlCode.hpp"

namespace bcproxy::bc {

    std::string_view control_code_error_name(ControlCodeError error) {
        switch (error) {
            case ControlCodeError::too_deep: return "control codes nested too deep";
            case ControlCodeError::too_large: return "control code too large";
            case ControlCodeError::truncated: return "truncated control code";
        }
        return "unknown control code error";
    }

    ControlCodeReader::ControlCodeReader(ControlCodeLimits limits) : limits_(limits) {
    }

    void ControlCodeReader::feed(std::string_view bytes) {
        if (pos_ == buffer_.size()) {
            buffer_.clear();
            pos_ = 0;
        }
        buffer_.append(bytes);
    }

    std::expected<void, ControlCodeError> ControlCodeReader::append(std::string_view bytes) {
        open_bytes_ += bytes.size();
        if (open_bytes_ > limits_.max_open_bytes) {
            return std::unexpected(ControlCodeError::too_large);
        }
        open_.back().body.append(bytes);
        return {};
    }

    ReadResult ControlCodeReader::next() {
        while (pos_ < buffer_.size()) {
            std::string_view view(buffer_);
            view.remove_prefix(pos_);

            switch (state_) {
                case State::text: {
                    auto end = view.find(escape);
                    if (end == 0) {
                        ++pos_;
                        state_ = State::escape;
                        continue;
                    }
                    if (end == std::string_view::npos) {
                        end = view.size();
                    }
                    pos_ += end;
                    if (open_.empty()) {
                        return Text{std::string(view.substr(0, end))};
                    }
                    if (auto appended = append(view.substr(0, end)); !appended) {
                        return std::unexpected(appended.error());
                    }
                    continue;
                }

                case State::escape: {
                    const char ch = view[0];
                    ++pos_;
                    if (ch == '<' || ch == '>') {
                        state_ = ch == '<' ? State::open : State::close;
                        pending_id_.clear();
                        continue;
                    }
                    state_ = State::text;
                    if (ch == '|' && !open_.empty()) {
                        // Everything so far was the attribute.
                        open_.back().attribute = std::move(open_.back().body);
                        open_.back().body.clear();
                        continue;
                    }
                    // Any other escape sequence, ANSI colors included.
                    const char raw[] = {escape, ch};
                    if (open_.empty()) {
                        return Text{std::string(raw, 2)};
                    }
                    if (auto appended = append(std::string_view(raw, 2)); !appended) {
                        return std::unexpected(appended.error());
                    }
                    continue;
                }

                case State::open:
                case State::close: {
                    pending_id_.push_back(view[0]);
                    ++pos_;
                    if (pending_id_.size() < 2) {
                        continue;
                    }
                    const bool opening = state_ == State::open;
                    state_ = State::text;

                    if (opening) {
                        if (open_.size() >= limits_.max_depth) {
                            return std::unexpected(ControlCodeError::too_deep);
                        }
                        open_.push_back(ControlCode{pending_id_, {}, {}});
                        continue;
                    }

                    // Closes that match nothing open are discarded.
                    if (open_.empty() || open_.back().id != pending_id_) {
                        continue;
                    }
                    auto code = std::move(open_.back());
                    open_.pop_back();
                    if (open_.empty()) {
                        open_bytes_ = 0;
                        return code;
                    }
                    if (auto appended = append(render(code)); !appended) {
                        return std::unexpected(appended.error());
                    }
                    continue;
                }
            }
        }
        return std::nullopt;
    }

    ReadResult ControlCodeReader::finish() {
        if (auto unit = next(); !unit || unit->has_value()) {
            return unit;
        }
        if (!open_.empty()) {
            open_.clear();
            open_bytes_ = 0;
            state_ = State::text;
            return std::unexpected(ControlCodeError::truncated);
        }

        std::string rest;
        switch (state_) {
            case State::text: return std::nullopt;
            case State::escape: rest = std::string(1, escape); break;
            case State::open: rest = std::string{escape, '<'} + pending_id_; break;
            case State::close: rest = std::string{escape, '>'} + pending_id_; break;
        }
        state_ = State::text;
        pending_id_.clear();
        return Text{std::move(rest)};
    }

    std::string_view relay_prefix(std::string_view id) {
        if (id == "40") return "[player_action_indicator_clear]";
        if (id == "41") return "[player_spell_action_status] ";
        if (id == "42") return "[player_skill_action_status] ";
        if (id == "50") return "[player_full_health_status] ";
        if (id == "51") return "[player_partial_health_status] ";
        if (id == "52") return "[player_info] ";
        if (id == "53") return "[player_free_exp] ";
        if (id == "54") return "[player_status] ";
        if (id == "60") return "[player_location] ";
        if (id == "61") return "[player_party_position] ";
        if (id == "62") return "[party_player_status] ";
        if (id == "63") return "[party_player_left] ";
        if (id == "64") return "[player_effect] ";
        if (id == "70") return "[player_target] ";
        return "[unspecified] ";
    }

    // "[label:0] first\n[label:1] second\n..."
    static std::string numbered_lines(std::string_view label, std::string_view body) {
        std::string out;
        out.reserve(body.size() + 16);
        for (std::size_t line = 0; !body.empty(); ++line) {
            auto end = body.find('\n');
            end = end == std::string_view::npos ? body.size() : end + 1;
            out += fmt::format("[{}:{}] ", label, line);
            out.append(body.substr(0, end));
            body.remove_prefix(end);
        }
        return out;
    }

    static std::string wrap_sgr(std::string_view sgr, std::string_view body) {
        return fmt::format("\x1b[{}m{}\x1b[0m", sgr, body);
    }

    static std::string link(const ControlCode& code) {
        return fmt::format("[{}]({})", code.body, code.attribute);
    }

    std::string render(const ControlCode& code) {
        const auto& id = code.id;
        const auto& body = code.body;

        if (id == "00" || id == "29") {
            return "\x1b[0m";
        }
        if (id == "05") {
            return "[login] OK\n";
        }
        if (id == "06") {
            return fmt::format("[login] {}\n", body);
        }
        if (id == "10") {
            if (code.attribute == "spec_map") {
                if (body == "NoMapSupport") {
                    return "[spec_map] NoMapSupport\n";
                }
                return numbered_lines(code.attribute, body);
            }
            if (code.attribute == "spec_prompt") {
                return fmt::format("[spec_prompt] {}\n", body);
            }
            if (code.attribute.starts_with("chan_")) {
                return body;
            }
            return fmt::format("[{}] {}", code.attribute, body);
        }
        if (id == "11") {
            return "[clear_screen]\n";
        }
        if (id == "20" || id == "21") {
            // Colors are left to the client.
            return body;
        }
        if (id == "22") return wrap_sgr("1", body);
        if (id == "23") return wrap_sgr("3", body);
        if (id == "24") return wrap_sgr("4", body);
        if (id == "25") return wrap_sgr("5", body);
        if (id == "30") {
            return link(code);
        }
        if (id == "31") {
            return body == code.attribute ? wrap_sgr("4", body) : link(code);
        }
        if (id == "99") {
            if (body.starts_with("BAT_MAPPER;;")) {
                return "[bat_mapper] " + body.substr(12);
            }
            return numbered_lines("custom_info", body) + "\n";
        }
        return fmt::format("{}{}\n", relay_prefix(id), body);
    }

    std::string plain_text(const ControlCode& code) {
        static constexpr std::string_view text_codes[] = {"10", "20", "21", "22", "23", "24", "25", "30", "31"};
        for (auto id : text_codes) {
            if (code.id == id) {
                return code.body;
            }
        }
        return {};
    }

}
