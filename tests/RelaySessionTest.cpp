#include "RelayHarness.hpp"

#include "bcproxy/bc/ControlCode.hpp"
#include "bcproxy/relay/Session.hpp"
#include "bcproxy/telnet/Base.hpp"
#include "bcproxy/zlib/Zlib.hpp"

#include <memory>
#include <optional>

using namespace bcproxy;
using namespace bcproxy::test;
using namespace bcproxy::telnet;
using relay::RelaySession;
using relay::SessionEnd;
using relay::SessionResult;

namespace {
const char IAC = codes::IAC;

const std::string will_gmcp = bytes({IAC, codes::WILL, codes::GMCP});
const std::string do_gmcp = bytes({IAC, codes::DO, codes::GMCP});

std::string gmcp_frame(std::string_view body) {
    return encodeTelnetMessage(TelnetMessageSubnegotiation{codes::GMCP, std::string(body)});
}

config::RelayConfig relay_config(config::TranslationMode mode = config::TranslationMode::passthrough) {
    config::RelayConfig cfg;
    cfg.translation = mode;
    cfg.teardown_grace = std::chrono::milliseconds(200);
    return cfg;
}

// A running session with the test playing both the MUD client (user) and
// the game server (mud).
struct Relay {
    Relay(tcp::socket user_socket, tcp::socket mud_socket)
        : user(std::move(user_socket)), mud(std::move(mud_socket)) {}

    tcp::socket user;
    tcp::socket mud;
    std::shared_ptr<RelaySession> session;
    std::optional<SessionResult> result;

    awaitable<SessionResult> finished() {
        co_await wait_until([this] { return result.has_value(); });
        co_return *result;
    }

    // Reads exactly what is expected from one side and checks it.
    awaitable<void> expect(tcp::socket &socket, const std::string &expected) {
        auto got = co_await read_exactly(socket, expected.size());
        CHECK(got == expected);
    }
};

awaitable<std::shared_ptr<Relay>> start_relay(config::RelayConfig cfg, std::string greeting = {}) {
    auto exec = co_await boost::asio::this_coro::executor;
    auto [user, relay_client] = co_await socket_pair();
    auto [relay_server, mud] = co_await socket_pair();

    auto relay = std::make_shared<Relay>(std::move(user), std::move(mud));

    relay::SessionOptions options;
    options.relay = std::move(cfg);
    options.greeting = std::move(greeting);

    auto client_endpoint = relay_client.remote_endpoint();
    auto server_endpoint = relay_server.remote_endpoint();
    relay->session = std::make_shared<RelaySession>(
        net::Connection(1, std::move(relay_client), client_endpoint),
        net::Connection(2, std::move(relay_server), server_endpoint), std::move(options));

    boost::asio::co_spawn(exec, relay->session->run(), [relay](std::exception_ptr e, SessionResult result) {
        if (!e)
            relay->result = result;
    });
    co_return relay;
}

// Keeps writing from the client until the relay stops taking it.
awaitable<void> flood(std::shared_ptr<Relay> relay) {
    const std::string chunk(64 * 1024, 'x');
    for (int i = 0; i < 1024; ++i) {
        boost::system::error_code ec;
        co_await boost::asio::async_write(relay->user, boost::asio::buffer(chunk),
                                          boost::asio::redirect_error(use_awaitable, ec));
        if (ec)
            co_return;
    }
}

// Completes the GMCP handshake on both sides of a pass-through relay.
awaitable<void> enable_gmcp(Relay &relay) {
    co_await relay.expect(relay.user, will_gmcp);
    co_await write(relay.user, do_gmcp + "sync\r\n");
    // Client input is relayed in order, so the agreement has been seen.
    co_await relay.expect(relay.mud, "sync\r\n");

    co_await write(relay.mud, will_gmcp);
    co_await relay.expect(relay.mud, do_gmcp);
}
}

TEST_CASE("Relay session passes text through", "[RelaySession]") {
    run_async([](boost::asio::io_context &) -> awaitable<void> {
        auto relay = co_await start_relay(relay_config());
        co_await relay->expect(relay->user, will_gmcp);

        co_await write(relay->user, "look\r\n");
        co_await relay->expect(relay->mud, "look\r\n");

        const std::string room = "You are in the town square.\r\n";
        co_await write(relay->mud, room);
        co_await relay->expect(relay->user, room);

        relay->user.close();
        auto rest = co_await read_to_eof(relay->mud);
        CHECK(rest.empty());

        auto result = co_await relay->finished();
        CHECK(result.reason == SessionEnd::client_closed);
        CHECK(result.client_bytes == 6);
        CHECK(result.server_bytes == room.size());
    });
}

TEST_CASE("Relay session forwards GMCP both ways", "[RelaySession]") {
    run_async([](boost::asio::io_context &) -> awaitable<void> {
        auto relay = co_await start_relay(relay_config());
        co_await enable_gmcp(*relay);

        const auto room = gmcp_frame(R"(Room.Info {"name":"Square"})");
        co_await write(relay->mud, room);
        co_await relay->expect(relay->user, room);

        const auto hello = gmcp_frame(R"(Core.Hello {"client":"test","version":"1"})");
        co_await write(relay->user, hello);
        co_await relay->expect(relay->mud, hello);

        relay->mud.close();
        co_await relay->finished();
    });
}

TEST_CASE("Relay session renders GMCP as lines in line mode", "[RelaySession]") {
    run_async([](boost::asio::io_context &) -> awaitable<void> {
        auto relay = co_await start_relay(relay_config(config::TranslationMode::line));

        co_await write(relay->mud, will_gmcp);
        co_await relay->expect(relay->mud, do_gmcp);

        co_await write(relay->mud, gmcp_frame(R"(Room.Info {"name":"Square"})") + "> ");
        co_await relay->expect(relay->user, "#GMCP Room.Info {\"name\":\"Square\"}\r\n> ");

        relay->mud.close();
        co_await relay->finished();
    });
}

TEST_CASE("Relay session drops GMCP in strip mode", "[RelaySession]") {
    run_async([](boost::asio::io_context &) -> awaitable<void> {
        auto relay = co_await start_relay(relay_config(config::TranslationMode::strip));

        co_await write(relay->mud, will_gmcp);
        co_await relay->expect(relay->mud, do_gmcp);
        co_await write(relay->mud, gmcp_frame("Char.Vitals {\"hp\":10}") + "hp 10\r\n");
        relay->mud.close();

        auto seen = co_await read_to_eof(relay->user);
        CHECK(seen == "hp 10\r\n");
        auto result = co_await relay->finished();
        CHECK(result.reason == SessionEnd::server_closed);
    });
}

TEST_CASE("Relay session drops malformed GMCP and keeps going", "[RelaySession]") {
    run_async([](boost::asio::io_context &) -> awaitable<void> {
        auto relay = co_await start_relay(relay_config());
        co_await enable_gmcp(*relay);

        co_await write(relay->mud, gmcp_frame(R"(Room.Info {"name":)") + "still here\r\n");
        co_await relay->expect(relay->user, "still here\r\n");

        relay->user.close();
        auto result = co_await relay->finished();
        CHECK(result.malformed_payloads == 1);
    });
}

TEST_CASE("Relay session drops every kind of malformed GMCP", "[RelaySession]") {
    run_async([](boost::asio::io_context &) -> awaitable<void> {
        auto relay = co_await start_relay(relay_config());
        co_await enable_gmcp(*relay);

        const std::string bad[] = {
            R"(Char.Vitals {"hp":1e400})",
            R"(Char.Vitals {"hp":1} trailing)",
            "Char.Vitals nope",
            "Char.Vitals \"\xc3\x28\"",
            "Room.Info " + std::string(100000, '['),
        };
        std::string frames;
        for (const auto &body : bad)
            frames += gmcp_frame(body);
        co_await write(relay->mud, frames + "still here\r\n");
        co_await relay->expect(relay->user, "still here\r\n");

        // The client side is held to the same rules.
        co_await write(relay->user, gmcp_frame(R"(Core.Hello {"version":1e400})") + "sync\r\n");
        co_await relay->expect(relay->mud, "sync\r\n");

        const auto room = gmcp_frame(R"(Room.Info {"name":"Square"})");
        co_await write(relay->mud, room);
        co_await relay->expect(relay->user, room);

        relay->user.close();
        auto result = co_await relay->finished();
        CHECK(result.reason == SessionEnd::client_closed);
        CHECK(result.malformed_payloads == 6);
    });
}

TEST_CASE("Relay session reassembles client input split into small writes", "[RelaySession]") {
    run_async([](boost::asio::io_context &) -> awaitable<void> {
        auto relay = co_await start_relay(relay_config());
        co_await enable_gmcp(*relay);

        const auto message = gmcp_frame(R"(Core.Hello {"client":"test"})") + "look\r\n" +
                             gmcp_frame(R"(Char.Login {"name":"bat"})") + "say hi\r\n";
        for (std::size_t i = 0; i < message.size(); ++i) {
            co_await write(relay->user, std::string_view(message).substr(i, 1));
            if (i % 4 == 0)
                co_await sleep_for(std::chrono::milliseconds(1));
        }
        co_await relay->expect(relay->mud, message);

        relay->user.close();
        co_await relay->finished();
    });
}

TEST_CASE("Relay session answers a server that is not reading", "[RelaySession]") {
    run_async([](boost::asio::io_context &ioc) -> awaitable<void> {
        auto relay = co_await start_relay(relay_config());
        co_await relay->expect(relay->user, will_gmcp);

        // The client fills everything between it and the server.
        boost::asio::co_spawn(ioc, flood(relay), boost::asio::detached);
        co_await sleep_for(std::chrono::milliseconds(1000));

        co_await write(relay->mud, bytes({IAC, codes::WILL, codes::TELOPT_ECHO}) + "text\r\n");
        co_await relay->expect(relay->user, bytes({IAC, codes::WILL, codes::TELOPT_ECHO}) + "text\r\n");

        relay->mud.close();
        co_await relay->finished();
    });
}

TEST_CASE("Relay session decodes bc mode control codes", "[RelaySession]") {
    const std::string greeting(bc::enable_sequence);

    SECTION("as tagged lines") {
        run_async([&](boost::asio::io_context &) -> awaitable<void> {
            auto cfg = relay_config();
            cfg.bc_mode = true;
            auto relay = co_await start_relay(cfg, greeting);
            co_await relay->expect(relay->user, will_gmcp);
            co_await write(relay->user, "sync\r\n");
            co_await relay->expect(relay->mud, greeting + "sync\r\n");

            co_await write(relay->mud, "\x1b<6");
            co_await sleep_for(std::chrono::milliseconds(20));
            co_await write(relay->mud, "0Town square\x1b>60hello\r\n");
            co_await relay->expect(relay->user, "[player_location] Town square\nhello\r\n");

            co_await write(relay->mud, "\x1b<10spec_prompt\x1b|HP: 100\x1b>10");
            co_await relay->expect(relay->user, "[spec_prompt] HP: 100\n");

            relay->mud.close();
            auto result = co_await relay->finished();
            CHECK(result.reason == SessionEnd::server_closed);
        });
    }
    SECTION("keeping only game text in strip mode") {
        run_async([&](boost::asio::io_context &) -> awaitable<void> {
            auto cfg = relay_config(config::TranslationMode::strip);
            cfg.bc_mode = true;
            auto relay = co_await start_relay(cfg, greeting);
            co_await write(relay->mud, "\x1b<60Town\x1b>60\x1b<22bold\x1b>22 text\r\n");
            relay->mud.close();
            auto seen = co_await read_to_eof(relay->user);
            CHECK(seen == "bold text\r\n");
            co_await relay->finished();
        });
    }
    SECTION("ending on a code cut off by the server") {
        run_async([&](boost::asio::io_context &) -> awaitable<void> {
            auto cfg = relay_config();
            cfg.bc_mode = true;
            auto relay = co_await start_relay(cfg, greeting);
            co_await write(relay->mud, "before\r\n\x1b<10spec_map\x1b|half a map");
            relay->mud.close();
            auto seen = co_await read_to_eof(relay->user);
            CHECK(seen == will_gmcp + "before\r\n");
            auto result = co_await relay->finished();
            CHECK(result.reason == SessionEnd::truncated_stream);
        });
    }
}

TEST_CASE("Relay session holds client GMCP until the server enables it", "[RelaySession]") {
    run_async([](boost::asio::io_context &) -> awaitable<void> {
        auto relay = co_await start_relay(relay_config());
        co_await relay->expect(relay->user, will_gmcp);

        const auto hello = gmcp_frame(R"(Core.Hello {"client":"test"})");
        co_await write(relay->user, do_gmcp + hello + "sync\r\n");
        co_await relay->expect(relay->mud, "sync\r\n");

        co_await write(relay->mud, will_gmcp);
        co_await relay->expect(relay->mud, do_gmcp + hello);

        relay->mud.close();
        co_await relay->finished();
    });
}

TEST_CASE("Relay session mirrors server options to the client", "[RelaySession]") {
    run_async([](boost::asio::io_context &) -> awaitable<void> {
        auto relay = co_await start_relay(relay_config());
        co_await relay->expect(relay->user, will_gmcp);

        co_await write(relay->mud, bytes({IAC, codes::WILL, codes::TELOPT_ECHO}));
        co_await relay->expect(relay->mud, bytes({IAC, codes::DO, codes::TELOPT_ECHO}));
        co_await relay->expect(relay->user, bytes({IAC, codes::WILL, codes::TELOPT_ECHO}));

        co_await write(relay->user, bytes({IAC, codes::DO, codes::TELOPT_ECHO}) + "sync\r\n");
        co_await relay->expect(relay->mud, "sync\r\n");
        co_await write(relay->mud, bytes({IAC, codes::WONT, codes::TELOPT_ECHO}));
        co_await relay->expect(relay->mud, bytes({IAC, codes::DONT, codes::TELOPT_ECHO}));
        co_await relay->expect(relay->user, bytes({IAC, codes::WONT, codes::TELOPT_ECHO}));

        // Options the server does not do are refused to the client.
        co_await write(relay->user, bytes({IAC, codes::DO, codes::SGA}));
        co_await relay->expect(relay->user, bytes({IAC, codes::WONT, codes::SGA}));
        co_await write(relay->user, bytes({IAC, codes::WILL, codes::NAWS}));
        co_await relay->expect(relay->user, bytes({IAC, codes::DONT, codes::NAWS}));

        relay->user.close();
        auto result = co_await relay->finished();
        CHECK(result.refused_options == 1);
    });
}

TEST_CASE("Relay session inflates an MCCP2 stream", "[RelaySession]") {
    run_async([](boost::asio::io_context &) -> awaitable<void> {
        auto relay = co_await start_relay(relay_config());
        co_await relay->expect(relay->user, will_gmcp);

        co_await write(relay->mud, bytes({IAC, codes::WILL, codes::MCCP2}));
        co_await relay->expect(relay->mud, bytes({IAC, codes::DO, codes::MCCP2}));

        zlib::DeflateStream deflater;
        const std::string text = "Welcome to the compressed world.\r\n";
        auto compressed = deflater.write(text, zlib::FlushMode::none);
        compressed += deflater.finish();
        co_await write(relay->mud, bytes({IAC, codes::SB, codes::MCCP2, IAC, codes::SE}) + compressed + "plain\r\n");

        co_await relay->expect(relay->user, text + "plain\r\n");

        relay->mud.close();
        co_await relay->finished();
    });
}

TEST_CASE("Relay session sends the greeting first", "[RelaySession]") {
    run_async([](boost::asio::io_context &) -> awaitable<void> {
        const std::string greeting = "\x1b"
                                     "bc 1\n";
        auto relay = co_await start_relay(relay_config(), greeting);
        co_await write(relay->user, "hi\r\n");
        co_await relay->expect(relay->mud, greeting + "hi\r\n");
        relay->user.close();
        co_await relay->finished();
    });
}

TEST_CASE("Relay session ends", "[RelaySession]") {
    SECTION("on server close after delivering what was sent") {
        run_async([](boost::asio::io_context &) -> awaitable<void> {
            auto relay = co_await start_relay(relay_config());
            co_await write(relay->mud, "Goodbye.\r\n");
            relay->mud.close();
            auto seen = co_await read_to_eof(relay->user);
            CHECK(seen == will_gmcp + "Goodbye.\r\n");
            auto result = co_await relay->finished();
            CHECK(result.reason == SessionEnd::server_closed);
        });
    }
    SECTION("without forwarding a truncated sub-negotiation") {
        run_async([](boost::asio::io_context &) -> awaitable<void> {
            auto relay = co_await start_relay(relay_config());
            co_await write(relay->mud, bytes({IAC, codes::SB, codes::GMCP}) + "Room.Info {");
            relay->mud.close();
            auto seen = co_await read_to_eof(relay->user);
            CHECK(seen == will_gmcp);
            auto result = co_await relay->finished();
            CHECK(result.reason == SessionEnd::truncated_stream);
        });
    }
    SECTION("when idle") {
        run_async([](boost::asio::io_context &) -> awaitable<void> {
            auto cfg = relay_config();
            cfg.idle_timeout = std::chrono::seconds(1);
            auto relay = co_await start_relay(cfg);
            auto seen = co_await read_to_eof(relay->user);
            CHECK(seen == will_gmcp);
            auto result = co_await relay->finished();
            CHECK(result.reason == SessionEnd::idle_timeout);
        });
    }
    SECTION("when aborted") {
        run_async([](boost::asio::io_context &) -> awaitable<void> {
            auto relay = co_await start_relay(relay_config());
            co_await relay->expect(relay->user, will_gmcp);
            relay->session->abort();
            auto rest = co_await read_to_eof(relay->mud);
            CHECK(rest.empty());
            auto result = co_await relay->finished();
            CHECK(result.reason == SessionEnd::aborted);
        });
    }
}
