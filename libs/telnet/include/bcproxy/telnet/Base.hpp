#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <cstdint>
#include <cstddef>

#include <fmt/format.h>

namespace bcproxy::telnet {

    namespace codes {
        constexpr char NUL = static_cast<char>(0);
        constexpr char TELOPT_ECHO = static_cast<char>(1);
        constexpr char SGA = static_cast<char>(3);
        constexpr char IAC  = static_cast<char>(255);
        constexpr char DONT = static_cast<char>(254);
        constexpr char DO   = static_cast<char>(253);
        constexpr char WONT = static_cast<char>(252);
        constexpr char WILL = static_cast<char>(251);
        constexpr char SB   = static_cast<char>(250);
        constexpr char SE   = static_cast<char>(240);

        // Telnet Commands
        constexpr char GA  = static_cast<char>(249);
        constexpr char EL  = static_cast<char>(248);
        constexpr char EC  = static_cast<char>(247);
        constexpr char AYT = static_cast<char>(246);
        constexpr char AO  = static_cast<char>(245);
        constexpr char IP  = static_cast<char>(244);
        constexpr char BRK = static_cast<char>(243);
        constexpr char DM  = static_cast<char>(242);
        constexpr char NOP = static_cast<char>(241);
        constexpr char EOR = static_cast<char>(239);

        // Telnet Options
        constexpr char MTTS          = static_cast<char>(24);
        constexpr char TELOPT_EOR    = static_cast<char>(25);
        constexpr char NAWS          = static_cast<char>(31);
        constexpr char LINEMODE      = static_cast<char>(34);
        constexpr char CHARSET       = static_cast<char>(42);
        constexpr char MSDP          = static_cast<char>(69);
        constexpr char MSSP          = static_cast<char>(70);
        constexpr char MCCP2         = static_cast<char>(86);
        constexpr char MCCP3         = static_cast<char>(87);
        constexpr char GMCP          = static_cast<char>(201);
    }

    struct TelnetMessageData {
        std::string data;
        bool operator==(const TelnetMessageData&) const = default;
    };

    struct TelnetMessageSubnegotiation {
        char option;
        std::string data;
        bool operator==(const TelnetMessageSubnegotiation&) const = default;
    };

    struct TelnetMessageNegotiation {
        char command; // WILL, WONT, DO, DONT
        char option;
        bool operator==(const TelnetMessageNegotiation&) const = default;
    };

    struct TelnetMessageCommand {
        char command; // e.g., NOP, GA, AYT, etc.
        bool operator==(const TelnetMessageCommand&) const = default;
    };

    using TelnetMessage = std::variant<TelnetMessageData, TelnetMessageSubnegotiation,
        TelnetMessageNegotiation, TelnetMessageCommand>;

    struct TelnetLimits {
        std::size_t max_subnegotiation{1024 * 1024};
    };

    extern TelnetLimits telnet_limits;

    // Serializes a unit for the wire. Data and sub-negotiation bodies are IAC-escaped.
    std::string encodeTelnetMessage(const TelnetMessage& msg);
    void appendTelnetMessage(std::string& out, const TelnetMessage& msg);

    std::string_view command_name(char command);
    std::string option_name(char option);

    inline auto format_as(const TelnetMessageNegotiation& n) {
        return fmt::format("{} {}", command_name(n.command), option_name(n.option));
    }

    inline auto format_as(const TelnetMessageCommand& c) {
        return fmt::format("IAC {}", command_name(c.command));
    }

    inline auto format_as(const TelnetMessageSubnegotiation& s) {
        return fmt::format("SB {} ({} bytes)", option_name(s.option), s.data.size());
    }

    class FrameReader;
    class TelnetNegotiator;
    class TelnetOption;
}
