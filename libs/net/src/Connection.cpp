#include "bcproxy/net/Connection.hpp"

namespace bcproxy::net {

    Connection::Connection(int64_t id, TcpStream stream, boost::asio::ip::tcp::endpoint endpoint)
        : stream_(std::move(stream)), id_(id), endpoint_(std::move(endpoint)) {}

    boost::asio::awaitable<std::expected<std::size_t, boost::system::error_code>> Connection::read_some(boost::beast::flat_buffer& buffer, std::size_t ceiling) {
        boost::system::error_code ec;
        std::size_t n = co_await stream_.async_read_some(
            buffer.prepare(ceiling),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return std::unexpected(ec);
        }
        buffer.commit(n);
        co_return n;
    }

    boost::asio::awaitable<std::expected<std::size_t, boost::system::error_code>> Connection::write_all(std::string_view data) {
        boost::system::error_code ec;
        std::size_t n = co_await boost::asio::async_write(
            stream_,
            boost::asio::buffer(data.data(), data.size()),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return std::unexpected(ec);
        }
        co_return n;
    }

    void Connection::close() {
        if (!stream_.is_open()) {
            return;
        }
        boost::system::error_code ec;
        // Not connected is fine here; the peer may already be gone.
        stream_.shutdown(TcpStream::shutdown_both, ec);
        stream_.close(ec);
    }

}
