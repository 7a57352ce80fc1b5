#pragma once

#include "Base.hpp"

#include <memory>
#include <string>

namespace bcproxy::telnet {

    // What one side of a connection is willing to do with an option.
    struct SupportInfo {
        bool supported{false};
        // Offer (WILL/DO) as soon as the connection starts.
        bool auto_start{false};
        // Agree to the peer's request without asking the owner first.
        bool auto_accept{true};
    };

    class TelnetOption {
        public:
        TelnetOption(char code, SupportInfo local, SupportInfo remote);
        virtual ~TelnetOption() = default;

        char option_code() const {
            return code_;
        }

        virtual std::string name() const;

        // Our side doing the option (WILL/WONT from us, DO/DONT from them).
        virtual SupportInfo getLocalSupportInfo() const;
        // The peer doing the option (WILL/WONT from them, DO/DONT from us).
        virtual SupportInfo getRemoteSupportInfo() const;

        private:
        char code_;
        SupportInfo local_;
        SupportInfo remote_;
    };

    // GMCP carries out-of-band JSON; see bcproxy::gmcp.
    class GMCPOption : public TelnetOption {
        public:
        GMCPOption(SupportInfo local, SupportInfo remote);
        std::string name() const override;
    };

    // MCCP2 is only ever accepted from the peer; we never compress.
    class MCCP2Option : public TelnetOption {
        public:
        explicit MCCP2Option(bool accept);
        std::string name() const override;
        SupportInfo getLocalSupportInfo() const override;
    };

    std::shared_ptr<TelnetOption> make_option(char code, SupportInfo local, SupportInfo remote);

}
