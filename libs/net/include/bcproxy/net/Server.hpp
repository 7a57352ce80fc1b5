#pragma once

#include <atomic>
#include <functional>
#include <memory>

#include <boost/asio/awaitable.hpp>

#include "Connection.hpp"

namespace bcproxy::net {

    using ClientHandler = std::function<boost::asio::awaitable<void>(Connection&&)>;

    class Server : public std::enable_shared_from_this<Server> {
        public:

        // Binds immediately; throws boost::system::system_error when the address is taken.
        Server(boost::asio::io_context& ioc, boost::asio::ip::address address, uint16_t port, ClientHandler handler);

        void run();
        void stop();

        boost::asio::ip::tcp::endpoint local_endpoint() const;

        private:
        boost::asio::io_context& ioc_;
        boost::asio::ip::tcp::acceptor acceptor;
        std::atomic<bool> stopping_{false};
        ClientHandler handle_client;
        boost::asio::awaitable<void> accept_loop();
        boost::asio::awaitable<void> accept_client(TcpStream socket, int64_t connection_id);
    };
}
