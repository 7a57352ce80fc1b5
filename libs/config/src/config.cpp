#include "bcproxy/config/config.hpp"
#include "bcproxy/bc/ControlCode.hpp"
#include "bcproxy/dotenv/dotenv.hpp"
#include "bcproxy/log/Log.hpp"
#include "bcproxy/net/net.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <thread>

#include <boost/algorithm/string/predicate.hpp>

namespace bcproxy::config {

    std::expected<TranslationMode, std::string> parse_translation_mode(std::string_view text) {
        if (boost::iequals(text, "passthrough") || boost::iequals(text, "gmcp")) {
            return TranslationMode::passthrough;
        }
        if (boost::iequals(text, "line") || boost::iequals(text, "lines")) {
            return TranslationMode::line;
        }
        if (boost::iequals(text, "strip") || boost::iequals(text, "none")) {
            return TranslationMode::strip;
        }
        return std::unexpected("unknown translation mode '" + std::string(text) + "'");
    }

    std::string_view translation_mode_name(TranslationMode mode) {
        switch (mode) {
            case TranslationMode::passthrough: return "passthrough";
            case TranslationMode::line: return "line";
            case TranslationMode::strip: return "strip";
        }
        return "unknown";
    }

    static int hex_value(char ch) {
        if (ch >= '0' && ch <= '9') return ch - '0';
        if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
        if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
        return -1;
    }

    std::expected<std::string, std::string> decode_escapes(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] != '\\') {
                out.push_back(text[i]);
                continue;
            }
            if (i + 1 >= text.size()) {
                return std::unexpected("dangling backslash");
            }
            const char esc = text[++i];
            switch (esc) {
                case 'e': out.push_back('\x1b'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case '\\': out.push_back('\\'); break;
                case 'x': {
                    if (i + 2 >= text.size()) {
                        return std::unexpected("short \\x escape");
                    }
                    const int hi = hex_value(text[i + 1]);
                    const int lo = hex_value(text[i + 2]);
                    if (hi < 0 || lo < 0) {
                        return std::unexpected("bad \\x escape");
                    }
                    out.push_back(static_cast<char>(hi * 16 + lo));
                    i += 2;
                    break;
                }
                default:
                    return std::unexpected(std::string("unknown escape \\") + esc);
            }
        }
        return out;
    }

    Config load_from_env() {
        auto get_env = [](const char* key) -> const char* {
            const char* value = std::getenv(key);
            return (value && *value) ? value : nullptr;
        };

        auto invalid = [](const char* key, std::string_view value) {
            return std::runtime_error(std::string("Invalid ") + key + ": " + std::string(value));
        };

        auto parse_long = [&](const char* key, long min, long max) -> std::optional<long> {
            const char* value = get_env(key);
            if (!value) {
                return std::nullopt;
            }
            char* end = nullptr;
            const long parsed = std::strtol(value, &end, 10);
            if (end == value || *end != '\0' || parsed < min || parsed > max) {
                throw invalid(key, value);
            }
            return parsed;
        };

        auto parse_port = [&](const char* key, uint16_t& out) {
            if (auto port = parse_long(key, 1, 65535)) {
                out = static_cast<uint16_t>(*port);
            }
        };

        auto parse_bool = [&](const char* key, bool& out) {
            const char* value = get_env(key);
            if (!value) {
                return;
            }
            std::string_view text(value);
            if (text == "1" || boost::iequals(text, "true") || boost::iequals(text, "yes") || boost::iequals(text, "on")) {
                out = true;
            } else if (text == "0" || boost::iequals(text, "false") || boost::iequals(text, "no") || boost::iequals(text, "off")) {
                out = false;
            } else {
                throw invalid(key, value);
            }
        };

        auto parse_address_env = [&](const char* key, auto& out) {
            if (const char* host = get_env(key)) {
                auto parsed = bcproxy::net::parse_address(host);
                if (!parsed) {
                    throw invalid(key, host);
                }
                out = *parsed;
            }
        };

        auto parse_list = [&](const char* key, std::vector<std::string>& out) {
            const char* value = get_env(key);
            if (!value) {
                return;
            }
            std::vector<std::string> parsed_list;
            std::string token;
            auto push_token = [&]() {
                if (!token.empty()) {
                    parsed_list.push_back(std::move(token));
                    token.clear();
                }
            };
            for (const char ch : std::string_view(value)) {
                if (ch == ',' || ch == ' ' || ch == '\t') {
                    push_token();
                } else {
                    token.push_back(ch);
                }
            }
            push_token();
            if (parsed_list.empty()) {
                throw invalid(key, "empty list");
            }
            out = std::move(parsed_list);
        };

        Config cfg{};

        parse_address_env("BCPROXY_HOST", cfg.listen.address);
        parse_port("BCPROXY_PORT", cfg.listen.port);

        if (const char* host = get_env("BCPROXY_UPSTREAM_HOST")) {
            cfg.upstream.host = host;
        }
        parse_port("BCPROXY_UPSTREAM_PORT", cfg.upstream.port);
        if (auto ms = parse_long("BCPROXY_CONNECT_TIMEOUT_MS", 1, 600000)) {
            cfg.upstream.connect_timeout = std::chrono::milliseconds(*ms);
        }
        if (const char* greeting = get_env("BCPROXY_UPSTREAM_GREETING")) {
            auto decoded = decode_escapes(greeting);
            if (!decoded) {
                throw invalid("BCPROXY_UPSTREAM_GREETING", decoded.error());
            }
            cfg.upstream.greeting = std::move(*decoded);
        }

        if (const char* mode = get_env("BCPROXY_TRANSLATION")) {
            auto parsed = parse_translation_mode(mode);
            if (!parsed) {
                throw invalid("BCPROXY_TRANSLATION", mode);
            }
            cfg.relay.translation = *parsed;
        }
        if (const char* prefix = std::getenv("BCPROXY_LINE_PREFIX")) {
            // An empty prefix is allowed here.
            cfg.relay.line_prefix = prefix;
        }
        parse_list("BCPROXY_GMCP_NAMESPACES", cfg.relay.gmcp_namespaces);
        if (auto pending = parse_long("BCPROXY_MAX_PENDING_GMCP", 0, 65536)) {
            cfg.relay.max_pending_gmcp = static_cast<std::size_t>(*pending);
        }
        parse_bool("BCPROXY_MCCP", cfg.relay.mccp);
        parse_bool("BCPROXY_BC_MODE", cfg.relay.bc_mode);
        // An explicitly empty greeting still wins.
        if (cfg.relay.bc_mode && !std::getenv("BCPROXY_UPSTREAM_GREETING")) {
            cfg.upstream.greeting = bc::enable_sequence;
        }
        if (auto secs = parse_long("BCPROXY_IDLE_TIMEOUT", 0, 7 * 24 * 3600)) {
            cfg.relay.idle_timeout = std::chrono::seconds(*secs);
        }
        if (auto ms = parse_long("BCPROXY_TEARDOWN_GRACE_MS", 0, 60000)) {
            cfg.relay.teardown_grace = std::chrono::milliseconds(*ms);
        }

        cfg.threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
        if (auto threads = parse_long("BCPROXY_THREADS", 1, 1024)) {
            cfg.threads = static_cast<int>(*threads);
        }

        if (const char* level = get_env("BCPROXY_LOG_LEVEL")) {
            auto parsed = bcproxy::log::parse_level(level);
            if (!parsed) {
                throw invalid("BCPROXY_LOG_LEVEL", level);
            }
            cfg.log.level = *parsed;
        }
        if (const char* file = std::getenv("BCPROXY_LOG_FILE")) {
            cfg.log.file_path = file;
            cfg.log.to_file = *file != '\0';
        }

        return cfg;
    }

    Config init(std::string_view app_name) {
        auto env = bcproxy::dotenv::load_env_file(".env", false);
        env.merge(bcproxy::dotenv::load_env_file(".env.local", true));

        auto cfg = load_from_env();
        if (!std::getenv("BCPROXY_LOG_FILE")) {
            cfg.log.file_path = "logs/" + std::string(app_name) + ".log";
        }
        bcproxy::log::init(cfg.log);

        for (const auto& message : env.error_messages) {
            LWARN("dotenv: {}", message);
        }
        LDEBUG("dotenv: {} loaded, {} skipped", env.loaded, env.skipped);

        return cfg;
    }
}
