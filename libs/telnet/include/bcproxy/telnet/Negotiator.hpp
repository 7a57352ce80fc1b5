#pragma once

#include "Option.hpp"

#include <memory>
#include <optional>
#include <map>
#include <vector>

namespace bcproxy::telnet {

    enum class OptionState {
        disabled,
        we_requested,
        they_requested,
        enabled,
    };

    std::string_view option_state_name(OptionState state);

    inline auto format_as(OptionState state) {
        return option_state_name(state);
    }

    struct OptionChange {
        char option;
        bool local;   // true: our side, false: the peer's side
        bool enabled;
        bool operator==(const OptionChange&) const = default;
    };

    struct NegotiationOutcome {
        std::vector<TelnetMessageNegotiation> replies;
        std::optional<OptionChange> change;
        // The peer asked and the option waits for answer().
        bool pending{false};
        // The option is not one we implement; a refusal was queued.
        bool unsupported{false};
    };

    // Option state table for one end of a connection. Pure bookkeeping: it
    // never touches a socket, the caller sends the returned replies.
    class TelnetNegotiator {
        public:
        TelnetNegotiator() = default;

        void add(std::shared_ptr<TelnetOption> option);

        // Offers for every option configured to auto-start.
        std::vector<TelnetMessageNegotiation> start();

        NegotiationOutcome receive(const TelnetMessageNegotiation& negotiation);

        // Answers a peer request left pending by an option without auto_accept.
        std::optional<TelnetMessageNegotiation> answer(char option, bool local, bool accept);

        std::optional<TelnetMessageNegotiation> enableLocal(char option);
        std::optional<TelnetMessageNegotiation> disableLocal(char option);
        std::optional<TelnetMessageNegotiation> enableRemote(char option);
        std::optional<TelnetMessageNegotiation> disableRemote(char option);

        OptionState localState(char option) const;
        OptionState remoteState(char option) const;

        bool localEnabled(char option) const {
            return localState(option) == OptionState::enabled;
        }

        bool remoteEnabled(char option) const {
            return remoteState(option) == OptionState::enabled;
        }

        private:
        struct Entry {
            std::shared_ptr<TelnetOption> option;
            OptionState local{OptionState::disabled};
            OptionState remote{OptionState::disabled};
        };

        NegotiationOutcome receiveRequest(Entry* entry, char option, bool local, bool agree);

        std::map<char, Entry> options_;
    };

}
