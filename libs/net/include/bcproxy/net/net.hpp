#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <thread>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>

#include "Connection.hpp"
#include "Server.hpp"

namespace bcproxy::net {

    struct ConnectOptions {
        bool tcp_no_delay{true};
        bool keep_alive{true};
        std::chrono::steady_clock::duration timeout{std::chrono::seconds(10)};
    };

    boost::asio::io_context& context();

    int64_t next_connection_id();

    // Accepts "any" and "*" for the IPv6 wildcard in addition to literal addresses.
    std::expected<boost::asio::ip::address, boost::system::error_code> parse_address(std::string_view addr_str);

    // Resolves and connects, giving up with timed_out after options.timeout.
    boost::asio::awaitable<std::expected<Connection, boost::system::error_code>> connect_tcp(std::string_view host, uint16_t port, ConnectOptions options = {});

    // Runs the io_context on the calling thread plus numThreads - 1 workers.
    void run(boost::asio::io_context& ioc, int numThreads = static_cast<int>(std::thread::hardware_concurrency()));

}
