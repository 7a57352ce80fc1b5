#include "bcproxy/config/config.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <string>
#include <vector>

using namespace bcproxy::config;

namespace {
// Sets variables for the lifetime of a test and clears them afterwards.
class ScopedEnv {
public:
    ScopedEnv &set(const char *key, const char *value) {
        ::setenv(key, value, 1);
        keys_.emplace_back(key);
        return *this;
    }
    ~ScopedEnv() {
        for (const auto &key : keys_)
            ::unsetenv(key.c_str());
    }

private:
    std::vector<std::string> keys_;
};

void clear_bcproxy_env() {
    for (auto key : {"BCPROXY_HOST", "BCPROXY_PORT", "BCPROXY_UPSTREAM_HOST", "BCPROXY_UPSTREAM_PORT",
                     "BCPROXY_CONNECT_TIMEOUT_MS", "BCPROXY_UPSTREAM_GREETING", "BCPROXY_TRANSLATION",
                     "BCPROXY_LINE_PREFIX", "BCPROXY_GMCP_NAMESPACES", "BCPROXY_MAX_PENDING_GMCP", "BCPROXY_MCCP",
                     "BCPROXY_IDLE_TIMEOUT", "BCPROXY_TEARDOWN_GRACE_MS", "BCPROXY_THREADS", "BCPROXY_LOG_LEVEL",
                     "BCPROXY_LOG_FILE", "BCPROXY_BC_MODE"})
        ::unsetenv(key);
}
}

TEST_CASE("Configuration defaults", "[Config]") {
    clear_bcproxy_env();
    auto cfg = load_from_env();
    CHECK(cfg.listen.port == 7788);
    CHECK(cfg.listen.address == boost::asio::ip::address(boost::asio::ip::address_v6::any()));
    CHECK(cfg.upstream.host == "batmud.bat.org");
    CHECK(cfg.upstream.port == 2023);
    CHECK(cfg.upstream.greeting.empty());
    CHECK(cfg.relay.translation == TranslationMode::passthrough);
    CHECK(cfg.relay.line_prefix == "#GMCP ");
    CHECK(cfg.relay.gmcp_namespaces.empty());
    CHECK(cfg.relay.max_pending_gmcp == 64);
    CHECK(cfg.relay.mccp);
    CHECK_FALSE(cfg.relay.bc_mode);
    CHECK(cfg.relay.idle_timeout == std::chrono::seconds(3600));
    CHECK(cfg.threads >= 1);
}

TEST_CASE("Configuration from the environment", "[Config]") {
    clear_bcproxy_env();
    ScopedEnv env;

    SECTION("listener and upstream") {
        env.set("BCPROXY_HOST", "127.0.0.1")
            .set("BCPROXY_PORT", "4000")
            .set("BCPROXY_UPSTREAM_HOST", "localhost")
            .set("BCPROXY_UPSTREAM_PORT", "23")
            .set("BCPROXY_CONNECT_TIMEOUT_MS", "250")
            .set("BCPROXY_UPSTREAM_GREETING", R"(\ebc 1\n)");
        auto cfg = load_from_env();
        CHECK(cfg.listen.address.to_string() == "127.0.0.1");
        CHECK(cfg.listen.port == 4000);
        CHECK(cfg.upstream.host == "localhost");
        CHECK(cfg.upstream.port == 23);
        CHECK(cfg.upstream.connect_timeout == std::chrono::milliseconds(250));
        CHECK(cfg.upstream.greeting == "\x1b"
                                       "bc 1\n");
    }
    SECTION("relay behaviour") {
        env.set("BCPROXY_TRANSLATION", "line")
            .set("BCPROXY_LINE_PREFIX", "")
            .set("BCPROXY_GMCP_NAMESPACES", "Char, Room,BatMUD")
            .set("BCPROXY_MAX_PENDING_GMCP", "0")
            .set("BCPROXY_MCCP", "off")
            .set("BCPROXY_IDLE_TIMEOUT", "0")
            .set("BCPROXY_THREADS", "2")
            .set("BCPROXY_LOG_LEVEL", "debug");
        auto cfg = load_from_env();
        CHECK(cfg.relay.translation == TranslationMode::line);
        CHECK(cfg.relay.line_prefix.empty());
        CHECK(cfg.relay.gmcp_namespaces == std::vector<std::string>{"Char", "Room", "BatMUD"});
        CHECK(cfg.relay.max_pending_gmcp == 0);
        CHECK(!cfg.relay.mccp);
        CHECK(cfg.relay.idle_timeout.count() == 0);
        CHECK(cfg.threads == 2);
    }
    SECTION("bc mode asks the server for it") {
        env.set("BCPROXY_BC_MODE", "on");
        auto cfg = load_from_env();
        CHECK(cfg.relay.bc_mode);
        CHECK(cfg.upstream.greeting == "\x1b"
                                       "bc 1\n");

        env.set("BCPROXY_UPSTREAM_GREETING", "");
        CHECK(load_from_env().upstream.greeting.empty());
    }
    SECTION("invalid values name the variable") {
        SECTION("port out of range") {
            env.set("BCPROXY_PORT", "70000");
            CHECK_THROWS_WITH(load_from_env(), "Invalid BCPROXY_PORT: 70000");
        }
        SECTION("not a number") {
            env.set("BCPROXY_UPSTREAM_PORT", "telnet");
            CHECK_THROWS_WITH(load_from_env(), "Invalid BCPROXY_UPSTREAM_PORT: telnet");
        }
        SECTION("unknown translation") {
            env.set("BCPROXY_TRANSLATION", "magic");
            CHECK_THROWS_AS(load_from_env(), std::runtime_error);
        }
        SECTION("bad address") {
            env.set("BCPROXY_HOST", "not-an-address");
            CHECK_THROWS_WITH(load_from_env(), "Invalid BCPROXY_HOST: not-an-address");
        }
        SECTION("bad boolean") {
            env.set("BCPROXY_MCCP", "maybe");
            CHECK_THROWS_AS(load_from_env(), std::runtime_error);
        }
        SECTION("bad escape in the greeting") {
            env.set("BCPROXY_UPSTREAM_GREETING", R"(\q)");
            CHECK_THROWS_AS(load_from_env(), std::runtime_error);
        }
    }
}

TEST_CASE("Translation mode names", "[Config]") {
    CHECK(parse_translation_mode("passthrough").value() == TranslationMode::passthrough);
    CHECK(parse_translation_mode("GMCP").value() == TranslationMode::passthrough);
    CHECK(parse_translation_mode("Lines").value() == TranslationMode::line);
    CHECK(parse_translation_mode("none").value() == TranslationMode::strip);
    CHECK(!parse_translation_mode("").has_value());
    CHECK(translation_mode_name(TranslationMode::strip) == "strip");
}

TEST_CASE("Escape decoding", "[Config]") {
    CHECK(decode_escapes(R"(a\tb)").value() == "a\tb");
    CHECK(decode_escapes(R"(\x41\x7e)").value() == "A~");
    CHECK(decode_escapes(R"(\\)").value() == "\\");
    CHECK(decode_escapes(R"(\x4)").error() == "short \\x escape");
    CHECK(decode_escapes(R"(\xzz)").error() == "bad \\x escape");
    CHECK(decode_escapes("trailing\\").error() == "dangling backslash");
}
