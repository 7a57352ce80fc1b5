#include "bcproxy/net/net.hpp"
#include "bcproxy/log/Log.hpp"

#include <atomic>
#include <variant>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>

namespace bcproxy::net {

    boost::asio::io_context& context() {
        static boost::asio::io_context ioc;
        return ioc;
    }

    static std::atomic<int64_t> connection_id_seed{1};

    int64_t next_connection_id() {
        return connection_id_seed.fetch_add(1, std::memory_order_relaxed);
    }

    std::expected<boost::asio::ip::address, boost::system::error_code> parse_address(std::string_view addr_str) {
        if (boost::iequals(addr_str, "any") || boost::iequals(addr_str, "*")) {
            return boost::asio::ip::address_v6::any();
        }
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address(std::string(addr_str), ec);
        if (ec) {
            return std::unexpected(ec);
        }
        return address;
    }

    boost::asio::awaitable<std::expected<Connection, boost::system::error_code>> connect_tcp(std::string_view host, uint16_t port, ConnectOptions options) {
        using namespace boost::asio::experimental::awaitable_operators;

        auto exec = co_await boost::asio::this_coro::executor;
        boost::asio::ip::tcp::resolver resolver(exec);
        boost::asio::steady_timer deadline(exec);
        deadline.expires_after(options.timeout);
        const std::string host_str(host);

        auto attempt = [&]() -> boost::asio::awaitable<std::expected<TcpStream, boost::system::error_code>> {
            boost::system::error_code ec;
            auto results = co_await resolver.async_resolve(
                host_str, std::to_string(port),
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                co_return std::unexpected(ec);
            }
            TcpStream socket(exec);
            co_await boost::asio::async_connect(socket, results,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                co_return std::unexpected(ec);
            }
            co_return std::move(socket);
        };

        boost::system::error_code timer_ec;
        auto result = co_await (
            attempt() ||
            deadline.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, timer_ec))
        );

        if (result.index() == 1) {
            co_return std::unexpected(make_error_code(boost::asio::error::timed_out));
        }

        auto connected = std::move(std::get<0>(result));
        if (!connected) {
            co_return std::unexpected(connected.error());
        }

        auto& socket = *connected;
        boost::system::error_code ec;
        auto endpoint = socket.remote_endpoint(ec);
        if (ec) {
            co_return std::unexpected(ec);
        }
        if (options.tcp_no_delay) {
            socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);
        }
        if (!ec && options.keep_alive) {
            socket.set_option(boost::asio::socket_base::keep_alive(true), ec);
        }
        if (ec) {
            LWARN("Could not set socket options for {}: {}", endpoint, ec.message());
        }

        co_return Connection(next_connection_id(), std::move(socket), endpoint);
    }

    void run(boost::asio::io_context& ioc, int numThreads) {
        std::vector<std::jthread> workers;
        for (int i = 1; i < numThreads; ++i) {
            workers.emplace_back([&ioc]() { ioc.run(); });
        }
        ioc.run();
    }

}
