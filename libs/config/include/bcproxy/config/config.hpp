#pragma once
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include <bcproxy/log/Log.hpp>
#include <bcproxy/net/net.hpp>

namespace bcproxy::config {

    enum class TranslationMode {
        passthrough,
        line,
        strip,
    };

    std::expected<TranslationMode, std::string> parse_translation_mode(std::string_view text);
    std::string_view translation_mode_name(TranslationMode mode);

    inline auto format_as(TranslationMode mode) {
        return translation_mode_name(mode);
    }

    // Decodes C-style escapes (\e, \n, \r, \t, \\, \xHH) so control bytes can live in a .env file.
    std::expected<std::string, std::string> decode_escapes(std::string_view text);

    struct EndPointConfig {
        boost::asio::ip::address address = boost::asio::ip::address_v6::any();
        uint16_t port{7788};
    };

    struct UpstreamConfig {
        std::string host{"batmud.bat.org"};
        uint16_t port{2023};
        std::chrono::milliseconds connect_timeout{10000};
        // Bytes written to the server before anything from the client. In bc
        // mode it defaults to the sequence that turns bc mode on.
        std::string greeting;
    };

    struct RelayConfig {
        TranslationMode translation{TranslationMode::passthrough};
        std::string line_prefix{"#GMCP "};
        // Empty means the codec's built-in namespace list.
        std::vector<std::string> gmcp_namespaces;
        std::size_t max_pending_gmcp{64};
        bool mccp{true};
        // Decode BatMUD bc mode control codes from the server.
        bool bc_mode{false};
        // Zero disables the idle watchdog.
        std::chrono::seconds idle_timeout{3600};
        std::chrono::milliseconds teardown_grace{2000};
    };

    struct Config {
        EndPointConfig listen;
        UpstreamConfig upstream;
        RelayConfig relay;
        int threads{0};
        bcproxy::log::Options log;
    };

    // Builds a Config from BCPROXY_* environment variables.
    // Throws std::runtime_error naming the offending variable.
    Config load_from_env();

    // Loads .env/.env.local, reads the environment and starts logging.
    Config init(std::string_view app_name);
}
