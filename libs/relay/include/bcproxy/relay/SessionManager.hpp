#pragma once

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <bcproxy/config/config.hpp>
#include <bcproxy/net/Server.hpp>

#include "Session.hpp"

namespace bcproxy::relay {

    struct ManagerStats {
        std::size_t accepted{0};
        std::size_t active{0};
        std::size_t completed{0};
        std::size_t upstream_failures{0};
    };

    // Owns the listener and every live RelaySession. Each accepted client gets
    // its own upstream connection; a failure in one session never reaches the
    // others or the listener.
    class SessionManager {
        public:
        SessionManager(boost::asio::io_context& ioc, config::Config cfg);
        ~SessionManager();

        SessionManager(const SessionManager&) = delete;
        SessionManager& operator=(const SessionManager&) = delete;

        // Binds the listening socket and starts accepting.
        std::expected<boost::asio::ip::tcp::endpoint, boost::system::error_code> listen();

        // Stops accepting and aborts every live session.
        void stop();

        // Waits up to the teardown grace period for live sessions to finish.
        // Returns false if some were still open when it ran out.
        boost::asio::awaitable<bool> drain();

        ManagerStats stats() const;

        boost::asio::awaitable<void> handleClient(net::Connection client);

        private:
        SessionOptions sessionOptions() const;

        boost::asio::io_context& ioc_;
        config::Config cfg_;
        std::shared_ptr<const gmcp::Codec> codec_;
        std::shared_ptr<const TranslationPolicy> policy_;
        std::shared_ptr<net::Server> server_;

        mutable std::mutex mutex_;
        std::unordered_map<int64_t, std::weak_ptr<RelaySession>> sessions_;

        std::atomic<std::size_t> accepted_{0};
        std::atomic<std::size_t> completed_{0};
        std::atomic<std::size_t> upstream_failures_{0};
    };

}
