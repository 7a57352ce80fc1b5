#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <bcproxy/bc/ControlCode.hpp>
#include <bcproxy/config/config.hpp>
#include <bcproxy/gmcp/Codec.hpp>
#include <bcproxy/telnet/Base.hpp>

namespace bcproxy::relay {

    struct ClientCapabilities {
        // The client agreed to receive GMCP from us.
        bool gmcp{false};
    };

    // Either plain text for the client's stream or an event to send as GMCP.
    using TranslatedOutput = std::variant<telnet::TelnetMessageData, gmcp::Event>;

    // Decides what a client sees for each GMCP event and bc control code the
    // server sends.
    class TranslationPolicy {
        public:
        virtual ~TranslationPolicy() = default;

        virtual std::string_view name() const = 0;

        virtual std::vector<TranslatedOutput> translate(const gmcp::Event& event,
                                                        const gmcp::Codec& codec,
                                                        const ClientCapabilities& client) const = 0;

        virtual std::vector<TranslatedOutput> translate(const bc::ControlCode& code,
                                                        const ClientCapabilities& client) const = 0;
    };

    class PassThroughPolicy : public TranslationPolicy {
        public:
        std::string_view name() const override;
        std::vector<TranslatedOutput> translate(const gmcp::Event& event,
                                                const gmcp::Codec& codec,
                                                const ClientCapabilities& client) const override;
        std::vector<TranslatedOutput> translate(const bc::ControlCode& code,
                                                const ClientCapabilities& client) const override;
    };

    // Renders each event as one text line: `<prefix>Package.Name <payload>\r\n`.
    // Control codes become their tagged text, e.g. `[player_location] ...`.
    class LinePolicy : public TranslationPolicy {
        public:
        explicit LinePolicy(std::string prefix);
        std::string_view name() const override;
        std::vector<TranslatedOutput> translate(const gmcp::Event& event,
                                                const gmcp::Codec& codec,
                                                const ClientCapabilities& client) const override;
        std::vector<TranslatedOutput> translate(const bc::ControlCode& code,
                                                const ClientCapabilities& client) const override;

        private:
        std::string prefix_;
    };

    // Drops GMCP and keeps only the game text inside control codes.
    class StripPolicy : public TranslationPolicy {
        public:
        std::string_view name() const override;
        std::vector<TranslatedOutput> translate(const gmcp::Event& event,
                                                const gmcp::Codec& codec,
                                                const ClientCapabilities& client) const override;
        std::vector<TranslatedOutput> translate(const bc::ControlCode& code,
                                                const ClientCapabilities& client) const override;
    };

    std::shared_ptr<const TranslationPolicy> make_translation_policy(const config::RelayConfig& relay);

}
