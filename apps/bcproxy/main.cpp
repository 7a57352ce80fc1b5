#include <csignal>
#include <exception>
#include <iostream>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>

#include "bcproxy/config/config.hpp"
#include "bcproxy/log/Log.hpp"
#include "bcproxy/net/net.hpp"
#include "bcproxy/relay/SessionManager.hpp"

int main() {
    bcproxy::config::Config cfg;
    try {
        cfg = bcproxy::config::init("bcproxy");
    } catch (const std::exception& e) {
        std::cerr << "bcproxy: " << e.what() << std::endl;
        return 1;
    }

    // A client vanishing mid-write must not take the process with it.
    std::signal(SIGPIPE, SIG_IGN);

    auto& ioc = bcproxy::net::context();
    bcproxy::relay::SessionManager manager(ioc, cfg);

    auto listening = manager.listen();
    if (!listening) {
        LCRIT("Could not bind {}:{}: {}", cfg.listen.address, cfg.listen.port, listening.error().message());
        return 2;
    }
    LINFO("bcproxy accepting on {}", *listening);

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        LINFO("Received signal {}, shutting down", signal);
        manager.stop();
        // Sessions flush and close their sockets before the loop goes away.
        boost::asio::co_spawn(ioc, manager.drain(), [&](std::exception_ptr e, bool) {
            if (e) {
                LERROR("Shutdown drain failed");
            }
            ioc.stop();
        });
    });

    bcproxy::net::run(ioc, cfg.threads);
    LINFO("bcproxy stopped: {} sessions served", manager.stats().completed);
    return 0;
}
