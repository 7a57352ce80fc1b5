#pragma once

#include <cstdint>
#include <deque>
#include <expected>
#include <memory>
#include <string_view>
#include <variant>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>

#include <bcproxy/config/config.hpp>
#include <bcproxy/net/Connection.hpp>
#include <bcproxy/telnet/FrameReader.hpp>
#include <bcproxy/telnet/Negotiator.hpp>
#include <bcproxy/zlib/Zlib.hpp>

namespace bcproxy::relay {

    template<typename T>
    using Channel = boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)>;

    enum class Side {
        client,
        server,
    };

    std::string_view side_name(Side side);

    inline auto format_as(Side side) {
        return side_name(side);
    }

    // Queued behind everything else; the writer flushes and then stops.
    struct EndpointClose {};

    // Tells an idle writer that control messages are waiting.
    struct EndpointWake {};

    using Outgoing = std::variant<telnet::TelnetMessage, EndpointWake, EndpointClose>;

    // The relay acts as the server toward the client: it may do GMCP and
    // mirrors whatever ECHO/SGA/EOR the real server does.
    telnet::TelnetNegotiator client_negotiator(const config::RelayConfig& relay);

    // The relay acts as a client toward the server.
    telnet::TelnetNegotiator server_negotiator(const config::RelayConfig& relay);

    // One socket of a relay session with its parsing, option state and
    // outgoing queue. Not thread safe; it lives on the session's strand.
    class Endpoint {
        public:
        Endpoint(Side side, net::Connection connection, telnet::TelnetNegotiator negotiator,
                 std::size_t queue_limit = 256, std::size_t control_limit = 1024);

        Endpoint(const Endpoint&) = delete;
        Endpoint& operator=(const Endpoint&) = delete;

        Side side() const {
            return side_;
        }

        net::Connection& connection() {
            return conn_;
        }

        const net::Connection& connection() const {
            return conn_;
        }

        telnet::FrameReader& reader() {
            return reader_;
        }

        telnet::TelnetNegotiator& negotiator() {
            return negotiator_;
        }

        const telnet::TelnetNegotiator& negotiator() const {
            return negotiator_;
        }

        // Queues a unit for this endpoint's socket. Suspends while the queue is
        // full. Returns false once the queue has been closed.
        boost::asio::awaitable<bool> send(telnet::TelnetMessage message);

        boost::asio::awaitable<bool> sendClose();

        // Queues a reply for this endpoint's socket ahead of relayed traffic
        // without suspending, so a reader never waits on the queue it does not
        // drain. Replies past the limit are dropped.
        void sendControl(telnet::TelnetMessage message);

        // Drains the queue to the socket until EndpointClose is written out.
        // Errors are write failures or the queue being closed or cancelled.
        boost::asio::awaitable<std::expected<void, boost::system::error_code>> runWriter();

        void close();

        // Everything read from this socket from now on is an MCCP2 stream.
        void startInflating();
        void stopInflating();

        zlib::InflateStream* inflater() {
            return inflater_.get();
        }

        void countRead(std::size_t bytes) {
            bytes_read_ += bytes;
        }

        [[nodiscard]] uint64_t bytesRead() const {
            return bytes_read_;
        }

        [[nodiscard]] uint64_t bytesWritten() const {
            return bytes_written_;
        }

        private:
        Side side_;
        net::Connection conn_;
        telnet::FrameReader reader_;
        telnet::TelnetNegotiator negotiator_;
        Channel<Outgoing> outgoing_;
        std::deque<telnet::TelnetMessage> control_;
        std::size_t control_limit_;
        std::unique_ptr<zlib::InflateStream> inflater_;
        uint64_t bytes_read_{0};
        uint64_t bytes_written_{0};
    };

    inline auto format_as(const Endpoint& endpoint) {
        return fmt::format("{} {}", endpoint.side(), endpoint.connection());
    }

}
