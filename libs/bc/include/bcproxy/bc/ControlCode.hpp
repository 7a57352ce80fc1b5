#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace bcproxy::bc {

    inline constexpr char escape = '\x1b';

    // Sent to the server to switch it into bc mode.
    inline constexpr std::string_view enable_sequence = "\x1b"
                                                        "bc 1\n";

    struct ControlCodeLimits {
        std::size_t max_depth{16};
        // Bytes held across all codes that are still open.
        std::size_t max_open_bytes{256 * 1024};
    };

    // ESC<NN [attribute ESC|] body ESC>NN. Codes opened inside another one
    // are rendered into the enclosing body when they close.
    struct ControlCode {
        std::string id;
        std::string attribute;
        std::string body;
        bool operator==(const ControlCode&) const = default;
    };

    // Game text outside any control code.
    struct Text {
        std::string bytes;
        bool operator==(const Text&) const = default;
    };

    using Unit = std::variant<Text, ControlCode>;

    enum class ControlCodeError {
        too_deep,
        too_large,
        truncated,
    };

    std::string_view control_code_error_name(ControlCodeError error);

    inline auto format_as(ControlCodeError error) {
        return control_code_error_name(error);
    }

    inline auto format_as(const ControlCode& code) {
        return fmt::format("bc<{}>", code.id);
    }

    using ReadResult = std::expected<std::optional<Unit>, ControlCodeError>;

    // Incremental decoder for the server's bc mode stream. Works on the data
    // left after telnet parsing, so IAC sequences never reach it.
    class ControlCodeReader {
        public:
        explicit ControlCodeReader(ControlCodeLimits limits = {});

        void feed(std::string_view bytes);

        ReadResult next();

        // End of stream, called until it yields nothing. A dangling escape is
        // released as text, an open code is truncated.
        ReadResult finish();

        [[nodiscard]] bool idle() const {
            return state_ == State::text && open_.empty();
        }

        private:
        enum class State {
            text,
            escape,
            open,
            close,
        };

        std::expected<void, ControlCodeError> append(std::string_view bytes);

        ControlCodeLimits limits_;
        std::string buffer_;
        std::size_t pos_{0};
        State state_{State::text};
        std::string pending_id_;
        std::vector<ControlCode> open_;
        std::size_t open_bytes_{0};
    };

    // Tag printed in front of status codes, e.g. "[player_location] ".
    std::string_view relay_prefix(std::string_view id);

    // The tagged text form a plain client can show.
    std::string render(const ControlCode& code);

    // Only the readable game text of a code, empty for pure status codes.
    std::string plain_text(const ControlCode& code);

}
