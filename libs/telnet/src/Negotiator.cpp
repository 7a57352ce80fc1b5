#include "bcproxy/telnet/Negotiator.hpp"

namespace bcproxy::telnet {

    std::string_view option_state_name(OptionState state) {
        switch (state) {
            case OptionState::disabled: return "disabled";
            case OptionState::we_requested: return "we_requested";
            case OptionState::they_requested: return "they_requested";
            case OptionState::enabled: return "enabled";
        }
        return "unknown";
    }

    static char accept_command(bool local) {
        return local ? codes::WILL : codes::DO;
    }

    static char refuse_command(bool local) {
        return local ? codes::WONT : codes::DONT;
    }

    void TelnetNegotiator::add(std::shared_ptr<TelnetOption> option) {
        const char code = option->option_code();
        options_[code] = Entry{std::move(option)};
    }

    std::vector<TelnetMessageNegotiation> TelnetNegotiator::start() {
        std::vector<TelnetMessageNegotiation> out;
        for (auto& [code, entry] : options_) {
            auto local_info = entry.option->getLocalSupportInfo();
            auto remote_info = entry.option->getRemoteSupportInfo();

            if (local_info.supported && local_info.auto_start) {
                if (auto offer = enableLocal(code)) {
                    out.push_back(*offer);
                }
            }
            if (remote_info.supported && remote_info.auto_start) {
                if (auto offer = enableRemote(code)) {
                    out.push_back(*offer);
                }
            }
        }
        return out;
    }

    NegotiationOutcome TelnetNegotiator::receive(const TelnetMessageNegotiation& negotiation) {
        Entry* entry = nullptr;
        if (auto it = options_.find(negotiation.option); it != options_.end()) {
            entry = &it->second;
        }

        switch (negotiation.command) {
            case codes::DO:
                return receiveRequest(entry, negotiation.option, true, true);
            case codes::DONT:
                return receiveRequest(entry, negotiation.option, true, false);
            case codes::WILL:
                return receiveRequest(entry, negotiation.option, false, true);
            case codes::WONT:
                return receiveRequest(entry, negotiation.option, false, false);
            default:
                return {};
        }
    }

    NegotiationOutcome TelnetNegotiator::receiveRequest(Entry* entry, char option, bool local, bool agree) {
        NegotiationOutcome outcome;

        if (agree) {
            SupportInfo info;
            if (entry) {
                info = local ? entry->option->getLocalSupportInfo() : entry->option->getRemoteSupportInfo();
            }
            if (!info.supported) {
                outcome.unsupported = true;
                outcome.replies.push_back({refuse_command(local), option});
                return outcome;
            }

            auto& state = local ? entry->local : entry->remote;
            switch (state) {
                case OptionState::disabled:
                    if (info.auto_accept) {
                        state = OptionState::enabled;
                        outcome.replies.push_back({accept_command(local), option});
                        outcome.change = OptionChange{option, local, true};
                    } else {
                        state = OptionState::they_requested;
                        outcome.pending = true;
                    }
                    break;
                case OptionState::we_requested:
                    // Their agreement answers our offer, or crosses it on the wire.
                    state = OptionState::enabled;
                    outcome.change = OptionChange{option, local, true};
                    break;
                case OptionState::they_requested:
                    outcome.pending = true;
                    break;
                case OptionState::enabled:
                    break;
            }
            return outcome;
        }

        if (!entry) {
            return outcome;
        }

        auto& state = local ? entry->local : entry->remote;
        switch (state) {
            case OptionState::enabled:
                state = OptionState::disabled;
                outcome.replies.push_back({refuse_command(local), option});
                outcome.change = OptionChange{option, local, false};
                break;
            case OptionState::we_requested:
            case OptionState::they_requested:
                state = OptionState::disabled;
                break;
            case OptionState::disabled:
                break;
        }
        return outcome;
    }

    std::optional<TelnetMessageNegotiation> TelnetNegotiator::answer(char option, bool local, bool accept) {
        auto it = options_.find(option);
        if (it == options_.end()) {
            return std::nullopt;
        }
        auto& state = local ? it->second.local : it->second.remote;
        if (state != OptionState::they_requested) {
            return std::nullopt;
        }
        state = accept ? OptionState::enabled : OptionState::disabled;
        return TelnetMessageNegotiation{accept ? accept_command(local) : refuse_command(local), option};
    }

    std::optional<TelnetMessageNegotiation> TelnetNegotiator::enableLocal(char option) {
        auto it = options_.find(option);
        if (it == options_.end() || !it->second.option->getLocalSupportInfo().supported) {
            return std::nullopt;
        }
        auto& state = it->second.local;
        switch (state) {
            case OptionState::disabled:
                state = OptionState::we_requested;
                return TelnetMessageNegotiation{codes::WILL, option};
            case OptionState::they_requested:
                state = OptionState::enabled;
                return TelnetMessageNegotiation{codes::WILL, option};
            default:
                return std::nullopt;
        }
    }

    std::optional<TelnetMessageNegotiation> TelnetNegotiator::disableLocal(char option) {
        auto it = options_.find(option);
        if (it == options_.end() || it->second.local == OptionState::disabled) {
            return std::nullopt;
        }
        it->second.local = OptionState::disabled;
        return TelnetMessageNegotiation{codes::WONT, option};
    }

    std::optional<TelnetMessageNegotiation> TelnetNegotiator::enableRemote(char option) {
        auto it = options_.find(option);
        if (it == options_.end() || !it->second.option->getRemoteSupportInfo().supported) {
            return std::nullopt;
        }
        auto& state = it->second.remote;
        switch (state) {
            case OptionState::disabled:
                state = OptionState::we_requested;
                return TelnetMessageNegotiation{codes::DO, option};
            case OptionState::they_requested:
                state = OptionState::enabled;
                return TelnetMessageNegotiation{codes::DO, option};
            default:
                return std::nullopt;
        }
    }

    std::optional<TelnetMessageNegotiation> TelnetNegotiator::disableRemote(char option) {
        auto it = options_.find(option);
        if (it == options_.end() || it->second.remote == OptionState::disabled) {
            return std::nullopt;
        }
        it->second.remote = OptionState::disabled;
        return TelnetMessageNegotiation{codes::DONT, option};
    }

    OptionState TelnetNegotiator::localState(char option) const {
        auto it = options_.find(option);
        return it == options_.end() ? OptionState::disabled : it->second.local;
    }

    OptionState TelnetNegotiator::remoteState(char option) const {
        auto it = options_.find(option);
        return it == options_.end() ? OptionState::disabled : it->second.remote;
    }

}
