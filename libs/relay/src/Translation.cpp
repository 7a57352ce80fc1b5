#include "bcproxy/relay/Translation.hpp"

#include <algorithm>

namespace bcproxy::relay {

    std::string_view PassThroughPolicy::name() const {
        return "passthrough";
    }

    std::vector<TranslatedOutput> PassThroughPolicy::translate(const gmcp::Event& event,
                                                               const gmcp::Codec&,
                                                               const ClientCapabilities& client) const {
        if (!client.gmcp) {
            return {};
        }
        return {event};
    }

    std::vector<TranslatedOutput> PassThroughPolicy::translate(const bc::ControlCode& code,
                                                               const ClientCapabilities&) const {
        return {telnet::TelnetMessageData{bc::render(code)}};
    }

    LinePolicy::LinePolicy(std::string prefix) : prefix_(std::move(prefix)) {
    }

    std::string_view LinePolicy::name() const {
        return "line";
    }

    std::vector<TranslatedOutput> LinePolicy::translate(const gmcp::Event& event,
                                                        const gmcp::Codec& codec,
                                                        const ClientCapabilities&) const {
        auto text = codec.encode(event);
        // Opaque payloads are raw; keep them on one line.
        std::replace_if(text.begin(), text.end(), [](char ch) { return ch == '\r' || ch == '\n'; }, ' ');

        std::string line;
        line.reserve(prefix_.size() + text.size() + 2);
        line += prefix_;
        line += text;
        line += "\r\n";
        return {telnet::TelnetMessageData{std::move(line)}};
    }

    std::vector<TranslatedOutput> LinePolicy::translate(const bc::ControlCode& code,
                                                        const ClientCapabilities&) const {
        return {telnet::TelnetMessageData{bc::render(code)}};
    }

    std::string_view StripPolicy::name() const {
        return "strip";
    }

    std::vector<TranslatedOutput> StripPolicy::translate(const gmcp::Event&,
                                                         const gmcp::Codec&,
                                                         const ClientCapabilities&) const {
        return {};
    }

    std::vector<TranslatedOutput> StripPolicy::translate(const bc::ControlCode& code,
                                                         const ClientCapabilities&) const {
        auto text = bc::plain_text(code);
        if (text.empty()) {
            return {};
        }
        return {telnet::TelnetMessageData{std::move(text)}};
    }

    std::shared_ptr<const TranslationPolicy> make_translation_policy(const config::RelayConfig& relay) {
        switch (relay.translation) {
            case config::TranslationMode::line:
                return std::make_shared<LinePolicy>(relay.line_prefix);
            case config::TranslationMode::strip:
                return std::make_shared<StripPolicy>();
            case config::TranslationMode::passthrough:
                break;
        }
        return std::make_shared<PassThroughPolicy>();
    }

}
