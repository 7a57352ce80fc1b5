#include "bcproxy/net/Server.hpp"
#include "bcproxy/net/net.hpp"
#include "bcproxy/log/Log.hpp"

#include <chrono>
#include <exception>

namespace bcproxy::net
{
    Server::Server(boost::asio::io_context &ioc, boost::asio::ip::address address, uint16_t port, ClientHandler handler)
        : ioc_(ioc), acceptor(boost::asio::make_strand(ioc), boost::asio::ip::tcp::endpoint(address, port)),
          handle_client(std::move(handler)) {}

    boost::asio::ip::tcp::endpoint Server::local_endpoint() const
    {
        boost::system::error_code ec;
        auto endpoint = acceptor.local_endpoint(ec);
        return ec ? boost::asio::ip::tcp::endpoint{} : endpoint;
    }

    boost::asio::awaitable<void> Server::accept_client(TcpStream socket, int64_t connection_id)
    {
        boost::system::error_code ec;
        auto endpoint = socket.remote_endpoint(ec);
        if (ec)
        {
            LINFO("Connection #{} went away before it could be handled: {}", connection_id, ec.message());
            co_return;
        }
        LINFO("Incoming connection #{} from {}", connection_id, endpoint);

        Connection connection(connection_id, std::move(socket), endpoint);
        co_await handle_client(std::move(connection));
    }

    boost::asio::awaitable<void> Server::accept_loop()
    {
        boost::asio::steady_timer backoff(co_await boost::asio::this_coro::executor);
        for (;;)
        {
            boost::system::error_code ec;
            auto socket = co_await acceptor.async_accept(boost::asio::any_io_executor(boost::asio::make_strand(ioc_)), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec)
            {
                if (stopping_.load(std::memory_order_relaxed) || ec == boost::asio::error::operation_aborted)
                {
                    co_return;
                }
                LERROR("Accept error: {}", ec.message());
                // Out of descriptors and the like; do not spin on it.
                backoff.expires_after(std::chrono::milliseconds(100));
                co_await backoff.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                continue;
            }
            const int64_t connection_id = next_connection_id();
            auto exec = socket.get_executor();
            boost::asio::co_spawn(exec,
                                  accept_client(std::move(socket), connection_id),
                                  [connection_id](std::exception_ptr e)
                                  {
                                      if (!e)
                                      {
                                          return;
                                      }
                                      try
                                      {
                                          std::rethrow_exception(e);
                                      }
                                      catch (const std::exception &ex)
                                      {
                                          LERROR("Connection #{} handler failed: {}", connection_id, ex.what());
                                      }
                                      catch (...)
                                      {
                                          LERROR("Connection #{} handler failed with an unknown exception", connection_id);
                                      }
                                  });
        }
    }

    void Server::run()
    {
        if (!handle_client)
        {
            LERROR("Server has no client handler defined; cannot run.");
            return;
        }
        LINFO("TCP Server listening on {}", local_endpoint());
        boost::asio::co_spawn(acceptor.get_executor(),
                              [self = shared_from_this()]() { return self->accept_loop(); },
                              boost::asio::detached);
    }

    void Server::stop()
    {
        stopping_.store(true, std::memory_order_relaxed);
        boost::asio::post(acceptor.get_executor(), [self = shared_from_this()]()
                          {
                              boost::system::error_code ec;
                              self->acceptor.close(ec);
                              if (ec)
                              {
                                  LWARN("Closing listener failed: {}", ec.message());
                              } });
    }

} // namespace bcproxy::net
