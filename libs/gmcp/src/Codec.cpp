#include "bcproxy/gmcp/Codec.hpp"

#include <algorithm>
#include <optional>

#include <boost/algorithm/string/predicate.hpp>

namespace bcproxy::gmcp {

    static bool is_space(char ch) {
        return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
    }

    static bool is_control(char ch) {
        auto uch = static_cast<unsigned char>(ch);
        return uch < 0x20 || uch == 0x7f;
    }

    // Offset of the bracket that opens one level too many, ignoring brackets
    // inside strings. Parsing and dumping recurse per level.
    static std::optional<std::size_t> nesting_overflow(std::string_view payload) {
        std::size_t depth = 0;
        bool in_string = false;
        for (std::size_t i = 0; i < payload.size(); ++i) {
            const char ch = payload[i];
            if (in_string) {
                if (ch == '\\') {
                    ++i;
                } else if (ch == '"') {
                    in_string = false;
                }
                continue;
            }
            switch (ch) {
                case '"': in_string = true; break;
                case '[':
                case '{':
                    if (++depth > max_nesting_depth) {
                        return i;
                    }
                    break;
                case ']':
                case '}':
                    if (depth > 0) {
                        --depth;
                    }
                    break;
                default: break;
            }
        }
        return std::nullopt;
    }

    const std::string& event_package(const Event& event) {
        return std::visit([](const auto& e) -> const std::string& { return e.package; }, event);
    }

    std::vector<std::string> default_namespaces() {
        return {"Core", "Char", "Room", "Comm", "Client", "Group", "External", "Logging"};
    }

    Codec::Codec(std::vector<std::string> known_namespaces)
        : namespaces_(std::move(known_namespaces)) {
    }

    bool Codec::isKnown(std::string_view package) const {
        auto head = package.substr(0, package.find('.'));
        return std::any_of(namespaces_.begin(), namespaces_.end(), [&](const std::string& ns) {
            return boost::iequals(ns, head);
        });
    }

    std::expected<Event, DecodeError> Codec::decode(std::string_view body) const {
        std::size_t name_end = 0;
        while (name_end < body.size() && !is_space(body[name_end])) {
            if (is_control(body[name_end])) {
                return std::unexpected(DecodeError{DecodeErrorKind::malformed_payload, name_end, "control character in package name"});
            }
            ++name_end;
        }
        if (name_end == 0) {
            return std::unexpected(DecodeError{DecodeErrorKind::malformed_payload, 0, "empty package name"});
        }

        std::string package(body.substr(0, name_end));

        // One separator; whatever follows belongs to the payload.
        const std::size_t payload_start = std::min(name_end + 1, body.size());
        auto payload = body.substr(payload_start);

        if (!isKnown(package)) {
            return OpaqueMessage{std::move(package), std::string(payload)};
        }

        if (std::all_of(payload.begin(), payload.end(), is_space)) {
            return Message{std::move(package), nullptr};
        }

        if (auto too_deep = nesting_overflow(payload); too_deep) {
            return std::unexpected(DecodeError{DecodeErrorKind::malformed_payload, payload_start + *too_deep,
                                               fmt::format("nesting deeper than {}", max_nesting_depth)});
        }

        try {
            return Message{std::move(package), nlohmann::json::parse(payload)};
        } catch (const nlohmann::json::parse_error& e) {
            // e.byte is 1-based and points at the offending character.
            const std::size_t within = e.byte > 0 ? e.byte - 1 : 0;
            return std::unexpected(DecodeError{DecodeErrorKind::malformed_payload,
                                               std::min(payload_start + within, body.size()), e.what()});
        } catch (const nlohmann::json::exception& e) {
            // Number overflow and the like carry no position.
            return std::unexpected(DecodeError{DecodeErrorKind::malformed_payload, payload_start, e.what()});
        }
    }

    std::string Codec::encode(const Event& event) const {
        if (const auto* known = std::get_if<Message>(&event)) {
            if (known->data.is_null()) {
                return known->package;
            }
            return known->package + " " + known->data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        const auto& opaque = std::get<OpaqueMessage>(event);
        if (opaque.raw.empty()) {
            return opaque.package;
        }
        return opaque.package + " " + opaque.raw;
    }

}
