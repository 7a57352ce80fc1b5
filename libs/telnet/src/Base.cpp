#include "bcproxy/telnet/Base.hpp"

#include <type_traits>

namespace bcproxy::telnet {

	TelnetLimits telnet_limits;

	static void append_iac_escaped(std::string& out, std::string_view data) {
		for (char ch : data) {
			out.push_back(ch);
			if (ch == codes::IAC) {
				out.push_back(codes::IAC);
			}
		}
	}

	void appendTelnetMessage(std::string& out, const TelnetMessage& msg) {
		std::visit([&out](const auto& m) {
			using T = std::decay_t<decltype(m)>;

			if constexpr (std::is_same_v<T, TelnetMessageData>) {
				append_iac_escaped(out, m.data);
			} else if constexpr (std::is_same_v<T, TelnetMessageNegotiation>) {
				out.push_back(codes::IAC);
				out.push_back(m.command);
				out.push_back(m.option);
			} else if constexpr (std::is_same_v<T, TelnetMessageCommand>) {
				out.push_back(codes::IAC);
				out.push_back(m.command);
			} else if constexpr (std::is_same_v<T, TelnetMessageSubnegotiation>) {
				out.push_back(codes::IAC);
				out.push_back(codes::SB);
				out.push_back(m.option);
				append_iac_escaped(out, m.data);
				out.push_back(codes::IAC);
				out.push_back(codes::SE);
			}
		}, msg);
	}

	std::string encodeTelnetMessage(const TelnetMessage& msg) {
		std::string out;
		appendTelnetMessage(out, msg);
		return out;
	}

	std::string_view command_name(char command) {
		switch (command) {
			case codes::WILL: return "WILL";
			case codes::WONT: return "WONT";
			case codes::DO: return "DO";
			case codes::DONT: return "DONT";
			case codes::SB: return "SB";
			case codes::SE: return "SE";
			case codes::GA: return "GA";
			case codes::EL: return "EL";
			case codes::EC: return "EC";
			case codes::AYT: return "AYT";
			case codes::AO: return "AO";
			case codes::IP: return "IP";
			case codes::BRK: return "BRK";
			case codes::DM: return "DM";
			case codes::NOP: return "NOP";
			case codes::EOR: return "EOR";
			default: return "?";
		}
	}

	std::string option_name(char option) {
		switch (option) {
			case codes::TELOPT_ECHO: return "ECHO";
			case codes::SGA: return "SGA";
			case codes::MTTS: return "MTTS";
			case codes::TELOPT_EOR: return "EOR";
			case codes::NAWS: return "NAWS";
			case codes::LINEMODE: return "LINEMODE";
			case codes::CHARSET: return "CHARSET";
			case codes::MSDP: return "MSDP";
			case codes::MSSP: return "MSSP";
			case codes::MCCP2: return "MCCP2";
			case codes::MCCP3: return "MCCP3";
			case codes::GMCP: return "GMCP";
			default: return std::to_string(static_cast<unsigned char>(option));
		}
	}
}
