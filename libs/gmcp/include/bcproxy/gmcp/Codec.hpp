#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace bcproxy::gmcp {

    // A message in a namespace we understand, payload parsed.
    struct Message {
        std::string package;
        nlohmann::json data;
        bool operator==(const Message&) const = default;
    };

    // A message we only carry: name plus the payload bytes as received.
    struct OpaqueMessage {
        std::string package;
        std::string raw;
        bool operator==(const OpaqueMessage&) const = default;
    };

    using Event = std::variant<Message, OpaqueMessage>;

    enum class DecodeErrorKind {
        malformed_payload,
    };

    // Deeper JSON payloads are rejected as malformed.
    inline constexpr std::size_t max_nesting_depth = 64;

    struct DecodeError {
        DecodeErrorKind kind{DecodeErrorKind::malformed_payload};
        std::size_t offset{0};
        std::string reason;
    };

    const std::string& event_package(const Event& event);

    std::vector<std::string> default_namespaces();

    class Codec {
        public:
        explicit Codec(std::vector<std::string> known_namespaces = default_namespaces());

        // Parses a GMCP sub-negotiation body: `Package.Name[ <json>]`.
        std::expected<Event, DecodeError> decode(std::string_view body) const;

        std::string encode(const Event& event) const;

        [[nodiscard]] bool isKnown(std::string_view package) const;

        const std::vector<std::string>& namespaces() const {
            return namespaces_;
        }

        private:
        std::vector<std::string> namespaces_;
    };

    inline auto format_as(const DecodeError& error) {
        return fmt::format("malformed payload at byte {}: {}", error.offset, error.reason);
    }

    inline auto format_as(const Event& event) {
        if (const auto* known = std::get_if<Message>(&event)) {
            return fmt::format("GMCP({})", known->package);
        }
        return fmt::format("GMCP({}, opaque)", std::get<OpaqueMessage>(event).package);
    }

}
