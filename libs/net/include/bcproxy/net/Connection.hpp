#pragma once

#include <cstdint>
#include <expected>
#include <string_view>

#include <fmt/format.h>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>

namespace boost::asio::ip {
    inline auto format_as(const address& address) {
        return address.to_string();
    }

    inline auto format_as(const tcp::endpoint& endpoint) {
        if (endpoint.address().is_v6()) {
            return fmt::format("[{}]:{}", endpoint.address().to_string(), endpoint.port());
        }
        return fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
    }
}

namespace bcproxy::net {
    using TcpStream = boost::asio::ip::tcp::socket;

    // One TCP stream plus the identity it is logged under.
    class Connection {
    public:
        using executor_type = TcpStream::executor_type;

        Connection() = delete;
        Connection(int64_t id, TcpStream stream, boost::asio::ip::tcp::endpoint endpoint);

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&&) noexcept = default;
        Connection& operator=(Connection&&) noexcept = default;

        [[nodiscard]] int64_t id() const {
            return id_;
        }

        executor_type get_executor() {
            return stream_.get_executor();
        }

        // Reads whatever is available (up to ceiling) into the buffer.
        boost::asio::awaitable<std::expected<std::size_t, boost::system::error_code>> read_some(boost::beast::flat_buffer& buffer, std::size_t ceiling = 4096);

        boost::asio::awaitable<std::expected<std::size_t, boost::system::error_code>> write_all(std::string_view data);

        // Shuts down and closes the socket; pending operations complete with operation_aborted.
        void close();

        const boost::asio::ip::tcp::endpoint& endpoint() const {
            return endpoint_;
        }

    private:
        TcpStream stream_;
        int64_t id_{0};
        boost::asio::ip::tcp::endpoint endpoint_;
    };

    inline auto format_as(const Connection& connection) {
        return fmt::format("Connection#{}({})", connection.id(), boost::asio::ip::format_as(connection.endpoint()));
    }
}
