#include "bcproxy/telnet/Option.hpp"

namespace bcproxy::telnet {

    TelnetOption::TelnetOption(char code, SupportInfo local, SupportInfo remote)
        : code_(code), local_(local), remote_(remote) {
    }

    std::string TelnetOption::name() const {
        return option_name(code_);
    }

    SupportInfo TelnetOption::getLocalSupportInfo() const {
        return local_;
    }

    SupportInfo TelnetOption::getRemoteSupportInfo() const {
        return remote_;
    }

    // GMCP Section
    GMCPOption::GMCPOption(SupportInfo local, SupportInfo remote)
        : TelnetOption(codes::GMCP, local, remote) {
    }

    std::string GMCPOption::name() const {
        return "GMCP";
    }

    // MCCP2 Section
    MCCP2Option::MCCP2Option(bool accept)
        : TelnetOption(codes::MCCP2, {}, SupportInfo{.supported = accept, .auto_start = false, .auto_accept = true}) {
    }

    std::string MCCP2Option::name() const {
        return "MCCP2";
    }

    SupportInfo MCCP2Option::getLocalSupportInfo() const {
        return {};
    }

    std::shared_ptr<TelnetOption> make_option(char code, SupportInfo local, SupportInfo remote) {
        if (code == codes::GMCP) {
            return std::make_shared<GMCPOption>(local, remote);
        }
        return std::make_shared<TelnetOption>(code, local, remote);
    }

}
