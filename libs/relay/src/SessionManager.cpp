#include "bcproxy/relay/SessionManager.hpp"
#include "bcproxy/log/Log.hpp"
#include "bcproxy/net/net.hpp"

#include <chrono>
#include <exception>
#include <vector>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace bcproxy::relay {

    SessionManager::SessionManager(boost::asio::io_context& ioc, config::Config cfg)
        : ioc_(ioc), cfg_(std::move(cfg)) {
        codec_ = std::make_shared<gmcp::Codec>(cfg_.relay.gmcp_namespaces.empty() ? gmcp::default_namespaces()
                                                                                   : cfg_.relay.gmcp_namespaces);
        policy_ = make_translation_policy(cfg_.relay);
    }

    SessionManager::~SessionManager() {
        if (server_) {
            server_->stop();
        }
    }

    std::expected<boost::asio::ip::tcp::endpoint, boost::system::error_code> SessionManager::listen() {
        try {
            server_ = std::make_shared<net::Server>(ioc_, cfg_.listen.address, cfg_.listen.port,
                                                    [this](net::Connection&& client) { return handleClient(std::move(client)); });
        } catch (const boost::system::system_error& e) {
            LERROR("Cannot listen on {}:{}: {}", cfg_.listen.address, cfg_.listen.port, e.code().message());
            return std::unexpected(e.code());
        }
        server_->run();
        LINFO("Relaying to {}:{} with {} translation", cfg_.upstream.host, cfg_.upstream.port, cfg_.relay.translation);
        return server_->local_endpoint();
    }

    void SessionManager::stop() {
        if (server_) {
            server_->stop();
        }

        std::vector<std::shared_ptr<RelaySession>> live;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& [id, weak] : sessions_) {
                if (auto session = weak.lock()) {
                    live.push_back(std::move(session));
                }
            }
        }
        LINFO("Stopping, aborting {} session(s)", live.size());
        for (auto& session : live) {
            session->abort();
        }
    }

    boost::asio::awaitable<bool> SessionManager::drain() {
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
        const auto deadline = std::chrono::steady_clock::now() + cfg_.relay.teardown_grace;
        while (stats().active > 0) {
            if (std::chrono::steady_clock::now() >= deadline) {
                LWARN("{} session(s) still open after {}ms", stats().active, cfg_.relay.teardown_grace.count());
                co_return false;
            }
            timer.expires_after(std::chrono::milliseconds(20));
            boost::system::error_code ec;
            co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        co_return true;
    }

    ManagerStats SessionManager::stats() const {
        ManagerStats out;
        out.accepted = accepted_.load();
        out.completed = completed_.load();
        out.upstream_failures = upstream_failures_.load();
        std::lock_guard<std::mutex> lock(mutex_);
        out.active = sessions_.size();
        return out;
    }

    SessionOptions SessionManager::sessionOptions() const {
        SessionOptions options;
        options.relay = cfg_.relay;
        options.greeting = cfg_.upstream.greeting;
        options.codec = codec_;
        options.policy = policy_;
        return options;
    }

    boost::asio::awaitable<void> SessionManager::handleClient(net::Connection client) {
        ++accepted_;
        const int64_t id = client.id();

        net::ConnectOptions connect_options;
        connect_options.timeout = cfg_.upstream.connect_timeout;
        auto upstream = co_await net::connect_tcp(cfg_.upstream.host, cfg_.upstream.port, connect_options);
        if (!upstream) {
            ++upstream_failures_;
            LWARN("{} dropped, {} to {}:{}: {}", client, SessionEnd::upstream_connect_failure,
                  cfg_.upstream.host, cfg_.upstream.port, upstream.error().message());
            client.close();
            co_return;
        }
        LDEBUG("{} connected upstream as {}", client, *upstream);

        auto session = std::make_shared<RelaySession>(std::move(client), std::move(*upstream), sessionOptions());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_[id] = session;
        }

        try {
            co_await session->run();
        } catch (const std::exception& e) {
            LERROR("Session #{} failed: {}", id, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_.erase(id);
        }
        ++completed_;
    }

}
