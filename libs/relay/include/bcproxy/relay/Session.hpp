#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include <bcproxy/bc/ControlCode.hpp>
#include <bcproxy/config/config.hpp>
#include <bcproxy/gmcp/Codec.hpp>
#include <bcproxy/net/Connection.hpp>

#include "Endpoint.hpp"
#include "Translation.hpp"

namespace bcproxy::relay {

    // Why a session ended. The first cause recorded wins.
    enum class SessionEnd {
        unknown,
        client_closed,
        server_closed,
        client_error,
        server_error,
        idle_timeout,
        truncated_stream,
        protocol_error,
        upstream_connect_failure,
        aborted,
    };

    std::string_view session_end_name(SessionEnd reason);

    inline auto format_as(SessionEnd reason) {
        return session_end_name(reason);
    }

    struct SessionResult {
        SessionEnd reason{SessionEnd::unknown};
        // Bytes read from each socket.
        uint64_t client_bytes{0};
        uint64_t server_bytes{0};
        // Bytes written to the client.
        uint64_t client_received{0};
        std::size_t malformed_payloads{0};
        std::size_t refused_options{0};
    };

    struct SessionOptions {
        config::RelayConfig relay;
        // Sent to the server before anything the client says.
        std::string greeting;
        std::shared_ptr<const gmcp::Codec> codec;
        std::shared_ptr<const TranslationPolicy> policy;
    };

    // Pairs one client socket with one server socket and relays between them
    // until either side goes away. Both sockets must share one strand.
    class RelaySession : public std::enable_shared_from_this<RelaySession> {
        public:
        RelaySession(net::Connection client, net::Connection server, SessionOptions options);

        boost::asio::awaitable<SessionResult> run();

        // Thread safe. Tears the session down from outside its strand.
        void abort();

        [[nodiscard]] int64_t id() const {
            return id_;
        }

        private:
        Endpoint& peer(Endpoint& endpoint) {
            return &endpoint == &client_ ? server_ : client_;
        }

        void finish(SessionEnd reason);
        void touch();

        boost::asio::awaitable<void> runReader(Endpoint& endpoint);
        boost::asio::awaitable<void> runWriter(Endpoint& endpoint);
        boost::asio::awaitable<void> runIdleWatchdog();
        boost::asio::awaitable<void> closeToward(Endpoint& endpoint, SessionEnd reason);

        // Returns false when the session has to end.
        boost::asio::awaitable<bool> ingest(Endpoint& endpoint, std::string bytes);
        enum class DispatchOutcome {
            proceed,
            // The rest of the stream is MCCP2 compressed.
            start_inflating,
            fail,
        };

        boost::asio::awaitable<DispatchOutcome> dispatch(Endpoint& endpoint, telnet::TelnetMessage& message);
        boost::asio::awaitable<DispatchOutcome> dispatchFromServer(telnet::TelnetMessage& message);
        boost::asio::awaitable<void> dispatchFromClient(telnet::TelnetMessage& message);
        // Relays every complete bc unit. Returns unknown unless the stream is bad.
        boost::asio::awaitable<SessionEnd> drainControlCodes(bool at_end);
        boost::asio::awaitable<void> deliverToClient(std::vector<TranslatedOutput> outputs);
        ClientCapabilities clientCapabilities() const;

        boost::asio::awaitable<void> handleNegotiation(Endpoint& endpoint, const telnet::TelnetMessageNegotiation& negotiation);
        boost::asio::awaitable<void> handleOptionChange(Endpoint& endpoint, const telnet::OptionChange& change);
        boost::asio::awaitable<void> handleServerGMCP(std::string_view body);
        boost::asio::awaitable<void> handleClientGMCP(std::string_view body);
        void flushPendingGMCP();

        int64_t id_;
        Endpoint client_;
        Endpoint server_;
        SessionOptions options_;
        SessionEnd end_{SessionEnd::unknown};
        std::chrono::steady_clock::time_point last_activity_;
        std::deque<gmcp::Event> pending_gmcp_;
        std::unique_ptr<bc::ControlCodeReader> bc_reader_;
        std::size_t malformed_payloads_{0};
        std::size_t refused_options_{0};
    };

}
