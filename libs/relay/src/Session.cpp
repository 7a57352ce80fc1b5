#include "bcproxy/relay/Session.hpp"
#include "bcproxy/log/Log.hpp"

#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>

namespace bcproxy::relay {

    std::string_view session_end_name(SessionEnd reason) {
        switch (reason) {
            case SessionEnd::unknown: return "unknown";
            case SessionEnd::client_closed: return "client closed";
            case SessionEnd::server_closed: return "server closed";
            case SessionEnd::client_error: return "client error";
            case SessionEnd::server_error: return "server error";
            case SessionEnd::idle_timeout: return "idle timeout";
            case SessionEnd::truncated_stream: return "truncated stream";
            case SessionEnd::protocol_error: return "protocol error";
            case SessionEnd::upstream_connect_failure: return "upstream connect failure";
            case SessionEnd::aborted: return "aborted";
        }
        return "unknown";
    }

    namespace {
        bool forwardable_client_command(char command) {
            switch (command) {
                case telnet::codes::IP:
                case telnet::codes::AO:
                case telnet::codes::AYT:
                case telnet::codes::BRK:
                case telnet::codes::EC:
                case telnet::codes::EL:
                    return true;
                default:
                    return false;
            }
        }

        bool mirrored_option(char option) {
            return option == telnet::codes::TELOPT_ECHO || option == telnet::codes::SGA || option == telnet::codes::TELOPT_EOR;
        }
    }

    RelaySession::RelaySession(net::Connection client, net::Connection server, SessionOptions options)
        : id_(client.id()),
          client_(Side::client, std::move(client), client_negotiator(options.relay)),
          server_(Side::server, std::move(server), server_negotiator(options.relay)),
          options_(std::move(options)) {
        if (!options_.codec) {
            options_.codec = std::make_shared<gmcp::Codec>(options_.relay.gmcp_namespaces.empty()
                                                               ? gmcp::default_namespaces()
                                                               : options_.relay.gmcp_namespaces);
        }
        if (!options_.policy) {
            options_.policy = make_translation_policy(options_.relay);
        }
        if (options_.relay.bc_mode) {
            bc_reader_ = std::make_unique<bc::ControlCodeReader>();
        }
    }

    void RelaySession::finish(SessionEnd reason) {
        if (end_ == SessionEnd::unknown) {
            end_ = reason;
        }
    }

    void RelaySession::touch() {
        last_activity_ = std::chrono::steady_clock::now();
    }

    void RelaySession::abort() {
        boost::asio::post(client_.connection().get_executor(), [self = shared_from_this()]() {
            self->finish(SessionEnd::aborted);
            self->client_.close();
            self->server_.close();
        });
    }

    boost::asio::awaitable<SessionResult> RelaySession::run() {
        using namespace boost::asio::experimental::awaitable_operators;

        touch();
        LINFO("Session #{} relaying {} <-> {} ({})", id_, client_.connection(), server_.connection(), options_.policy->name());

        if (!options_.greeting.empty()) {
            co_await server_.send(telnet::TelnetMessageData{options_.greeting});
        }
        for (const auto& offer : server_.negotiator().start()) {
            co_await server_.send(offer);
        }
        for (const auto& offer : client_.negotiator().start()) {
            co_await client_.send(offer);
        }

        co_await (runReader(client_) || runReader(server_) || runWriter(client_) || runWriter(server_) || runIdleWatchdog());

        client_.close();
        server_.close();

        SessionResult result;
        result.reason = end_;
        result.client_bytes = client_.bytesRead();
        result.server_bytes = server_.bytesRead();
        result.client_received = client_.bytesWritten();
        result.malformed_payloads = malformed_payloads_;
        result.refused_options = refused_options_;

        LINFO("Session #{} ended ({}): client sent {} bytes and received {} bytes", id_, result.reason, result.client_bytes, result.client_received);
        co_return result;
    }

    boost::asio::awaitable<void> RelaySession::runReader(Endpoint& endpoint) {
        Endpoint& other = peer(endpoint);
        const bool from_client = endpoint.side() == Side::client;
        boost::beast::flat_buffer buffer;

        for (;;) {
            auto read = co_await endpoint.connection().read_some(buffer);
            if (!read) {
                const auto ec = read.error();
                if (ec == boost::asio::error::operation_aborted) {
                    co_return;
                }

                SessionEnd reason = from_client ? SessionEnd::client_closed : SessionEnd::server_closed;
                if (ec == boost::asio::error::eof) {
                    LDEBUG("{} closed the connection", endpoint);
                } else {
                    LINFO("{} read failed: {}", endpoint, ec.message());
                    reason = from_client ? SessionEnd::client_error : SessionEnd::server_error;
                }

                // Leftovers are released, an unterminated sub-negotiation is not.
                bool complete = true;
                for (;;) {
                    auto unit = endpoint.reader().finish();
                    if (!unit) {
                        LWARN("{} left an incomplete stream: {}", endpoint, unit.error());
                        reason = unit.error() == telnet::FrameError::truncated_stream ? SessionEnd::truncated_stream
                                                                                     : SessionEnd::protocol_error;
                        complete = false;
                        break;
                    }
                    if (!unit->has_value()) {
                        break;
                    }
                    if (co_await dispatch(endpoint, **unit) == DispatchOutcome::fail) {
                        reason = SessionEnd::protocol_error;
                        complete = false;
                        break;
                    }
                }
                if (complete && !from_client && bc_reader_) {
                    if (auto tail = co_await drainControlCodes(true); tail != SessionEnd::unknown) {
                        reason = tail;
                    }
                }

                co_await closeToward(other, reason);
                co_return;
            }

            touch();
            endpoint.countRead(*read);
            std::string bytes(static_cast<const char*>(buffer.data().data()), buffer.size());
            buffer.consume(buffer.size());

            if (!co_await ingest(endpoint, std::move(bytes))) {
                co_await closeToward(other, SessionEnd::protocol_error);
                co_return;
            }
        }
    }

    boost::asio::awaitable<void> RelaySession::runWriter(Endpoint& endpoint) {
        auto written = co_await endpoint.runWriter();
        if (written) {
            LDEBUG("{} writer flushed and stopped", endpoint);
            co_return;
        }

        const auto ec = written.error();
        if (ec == boost::asio::error::operation_aborted ||
            ec == boost::asio::experimental::error::channel_closed ||
            ec == boost::asio::experimental::error::channel_cancelled) {
            co_return;
        }
        LINFO("{} write failed: {}", endpoint, ec.message());
        finish(endpoint.side() == Side::client ? SessionEnd::client_error : SessionEnd::server_error);
    }

    boost::asio::awaitable<void> RelaySession::runIdleWatchdog() {
        using clock = std::chrono::steady_clock;
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
        const auto idle = std::chrono::duration_cast<clock::duration>(options_.relay.idle_timeout);

        for (;;) {
            if (idle.count() == 0) {
                timer.expires_at(clock::time_point::max());
            } else {
                const auto deadline = last_activity_ + idle;
                if (clock::now() >= deadline) {
                    LINFO("Session #{} idle for {}s, closing", id_, options_.relay.idle_timeout.count());
                    finish(SessionEnd::idle_timeout);
                    co_return;
                }
                timer.expires_at(deadline);
            }

            boost::system::error_code ec;
            co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                co_return;
            }
        }
    }

    boost::asio::awaitable<void> RelaySession::closeToward(Endpoint& endpoint, SessionEnd reason) {
        using namespace boost::asio::experimental::awaitable_operators;

        finish(reason);

        boost::asio::steady_timer grace(co_await boost::asio::this_coro::executor);
        grace.expires_after(options_.relay.teardown_grace);
        auto wait_grace = [&grace]() -> boost::asio::awaitable<void> {
            boost::system::error_code ec;
            co_await grace.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        };

        // The peer's writer ends the session once the close marker is written;
        // the grace period bounds how long that may take.
        co_await (endpoint.sendClose() || wait_grace());
        co_await wait_grace();
        LDEBUG("{} did not drain within the grace period", endpoint);
    }

    boost::asio::awaitable<bool> RelaySession::ingest(Endpoint& endpoint, std::string bytes) {
        if (auto* inflater = endpoint.inflater()) {
            std::string plain;
            zlib::InflateResult inflated;
            bool corrupt = false;
            try {
                inflated = inflater->write(bytes, plain);
            } catch (const std::runtime_error& e) {
                LWARN("{} sent a corrupt compressed stream: {}", endpoint, e.what());
                corrupt = true;
            }
            if (corrupt) {
                finish(SessionEnd::protocol_error);
                co_return false;
            }
            if (inflated.stream_end) {
                LDEBUG("{} ended compression", endpoint);
                plain.append(bytes, inflated.consumed, std::string::npos);
                endpoint.stopInflating();
            }
            bytes = std::move(plain);
        }

        endpoint.reader().feed(bytes);
        for (;;) {
            auto unit = endpoint.reader().next();
            if (!unit) {
                LWARN("{} sent an unparseable stream: {}", endpoint, unit.error());
                finish(SessionEnd::protocol_error);
                co_return false;
            }
            if (!unit->has_value()) {
                break;
            }
            const auto outcome = co_await dispatch(endpoint, **unit);
            if (outcome == DispatchOutcome::fail) {
                finish(SessionEnd::protocol_error);
                co_return false;
            }
            if (outcome == DispatchOutcome::start_inflating) {
                LDEBUG("{} started compression", endpoint);
                endpoint.startInflating();
                auto rest = endpoint.reader().take_buffered();
                if (rest.empty()) {
                    co_return true;
                }
                co_return co_await ingest(endpoint, std::move(rest));
            }
        }
        co_return true;
    }

    boost::asio::awaitable<RelaySession::DispatchOutcome> RelaySession::dispatch(Endpoint& endpoint, telnet::TelnetMessage& message) {
        if (endpoint.side() == Side::server) {
            co_return co_await dispatchFromServer(message);
        }
        co_await dispatchFromClient(message);
        co_return DispatchOutcome::proceed;
    }

    boost::asio::awaitable<RelaySession::DispatchOutcome> RelaySession::dispatchFromServer(telnet::TelnetMessage& message) {
        using namespace telnet;

        if (auto* data = std::get_if<TelnetMessageData>(&message)) {
            if (!bc_reader_) {
                co_await client_.send(std::move(*data));
            } else {
                bc_reader_->feed(data->data);
                if (co_await drainControlCodes(false) != SessionEnd::unknown) {
                    co_return DispatchOutcome::fail;
                }
            }
        } else if (auto* negotiation = std::get_if<TelnetMessageNegotiation>(&message)) {
            co_await handleNegotiation(server_, *negotiation);
        } else if (auto* command = std::get_if<TelnetMessageCommand>(&message)) {
            if (command->command == codes::GA) {
                // A client that suppressed go-ahead does not want to see it.
                if (!client_.negotiator().localEnabled(codes::SGA)) {
                    co_await client_.send(*command);
                }
            } else if (command->command == codes::EOR) {
                if (client_.negotiator().localEnabled(codes::TELOPT_EOR)) {
                    co_await client_.send(*command);
                }
            } else {
                LTRACE("{} dropped {}", server_, *command);
            }
        } else if (auto* sub = std::get_if<TelnetMessageSubnegotiation>(&message)) {
            if (sub->option == codes::GMCP && server_.negotiator().remoteEnabled(codes::GMCP)) {
                co_await handleServerGMCP(sub->data);
            } else if (sub->option == codes::MCCP2 && server_.negotiator().remoteEnabled(codes::MCCP2)) {
                co_return DispatchOutcome::start_inflating;
            } else {
                LDEBUG("{} dropped {}", server_, *sub);
            }
        }
        co_return DispatchOutcome::proceed;
    }

    boost::asio::awaitable<SessionEnd> RelaySession::drainControlCodes(bool at_end) {
        for (;;) {
            auto unit = at_end ? bc_reader_->finish() : bc_reader_->next();
            if (!unit) {
                LWARN("{} sent a bad bc stream: {}", server_, unit.error());
                co_return unit.error() == bc::ControlCodeError::truncated ? SessionEnd::truncated_stream
                                                                           : SessionEnd::protocol_error;
            }
            if (!unit->has_value()) {
                co_return SessionEnd::unknown;
            }
            if (auto* text = std::get_if<bc::Text>(&**unit)) {
                co_await client_.send(telnet::TelnetMessageData{std::move(text->bytes)});
                continue;
            }
            const auto& code = std::get<bc::ControlCode>(**unit);
            LTRACE("{} sent {}", server_, code);
            co_await deliverToClient(options_.policy->translate(code, clientCapabilities()));
        }
    }

    ClientCapabilities RelaySession::clientCapabilities() const {
        return ClientCapabilities{client_.negotiator().localEnabled(telnet::codes::GMCP)};
    }

    boost::asio::awaitable<void> RelaySession::deliverToClient(std::vector<TranslatedOutput> outputs) {
        for (auto& output : outputs) {
            if (auto* data = std::get_if<telnet::TelnetMessageData>(&output)) {
                co_await client_.send(std::move(*data));
            } else {
                const auto& event = std::get<gmcp::Event>(output);
                co_await client_.send(telnet::TelnetMessageSubnegotiation{telnet::codes::GMCP, options_.codec->encode(event)});
            }
        }
    }

    boost::asio::awaitable<void> RelaySession::dispatchFromClient(telnet::TelnetMessage& message) {
        using namespace telnet;

        if (auto* data = std::get_if<TelnetMessageData>(&message)) {
            co_await server_.send(std::move(*data));
        } else if (auto* negotiation = std::get_if<TelnetMessageNegotiation>(&message)) {
            co_await handleNegotiation(client_, *negotiation);
        } else if (auto* command = std::get_if<TelnetMessageCommand>(&message)) {
            if (forwardable_client_command(command->command)) {
                co_await server_.send(*command);
            } else {
                LTRACE("{} dropped {}", client_, *command);
            }
        } else if (auto* sub = std::get_if<TelnetMessageSubnegotiation>(&message)) {
            if (sub->option == codes::GMCP && client_.negotiator().localEnabled(codes::GMCP)) {
                co_await handleClientGMCP(sub->data);
            } else {
                LDEBUG("{} dropped {}", client_, *sub);
            }
        }
    }

    boost::asio::awaitable<void> RelaySession::handleNegotiation(Endpoint& endpoint, const telnet::TelnetMessageNegotiation& negotiation) {
        auto outcome = endpoint.negotiator().receive(negotiation);
        LTRACE("{} sent {}", endpoint, negotiation);

        if (outcome.unsupported) {
            ++refused_options_;
            LDEBUG("{} asked for unsupported {}", endpoint, negotiation);
        }
        for (const auto& reply : outcome.replies) {
            endpoint.sendControl(reply);
        }

        // The client may only have ECHO/SGA/EOR while the server does them too.
        if (outcome.pending && &endpoint == &client_ && negotiation.command == telnet::codes::DO) {
            const bool accept = server_.negotiator().remoteEnabled(negotiation.option);
            if (auto reply = client_.negotiator().answer(negotiation.option, true, accept)) {
                client_.sendControl(*reply);
            }
        }

        if (outcome.change) {
            co_await handleOptionChange(endpoint, *outcome.change);
        }
    }

    boost::asio::awaitable<void> RelaySession::handleOptionChange(Endpoint& endpoint, const telnet::OptionChange& change) {
        LDEBUG("{} {} option {} {}", endpoint, change.local ? "local" : "remote",
               telnet::option_name(change.option), change.enabled ? "enabled" : "disabled");

        if (&endpoint != &server_ || change.local) {
            co_return;
        }

        if (mirrored_option(change.option)) {
            auto reply = change.enabled ? client_.negotiator().enableLocal(change.option)
                                        : client_.negotiator().disableLocal(change.option);
            if (reply) {
                co_await client_.send(*reply);
            }
        } else if (change.option == telnet::codes::GMCP && change.enabled) {
            flushPendingGMCP();
        }
    }

    boost::asio::awaitable<void> RelaySession::handleServerGMCP(std::string_view body) {
        auto decoded = options_.codec->decode(body);
        if (!decoded) {
            ++malformed_payloads_;
            LWARN("{} GMCP message dropped, {}", server_, decoded.error());
            co_return;
        }

        co_await deliverToClient(options_.policy->translate(*decoded, *options_.codec, clientCapabilities()));
    }

    boost::asio::awaitable<void> RelaySession::handleClientGMCP(std::string_view body) {
        auto decoded = options_.codec->decode(body);
        if (!decoded) {
            ++malformed_payloads_;
            LWARN("{} GMCP message dropped, {}", client_, decoded.error());
            co_return;
        }

        if (server_.negotiator().remoteEnabled(telnet::codes::GMCP)) {
            co_await server_.send(telnet::TelnetMessageSubnegotiation{telnet::codes::GMCP, options_.codec->encode(*decoded)});
            co_return;
        }

        // Held until the server agrees to GMCP.
        const auto limit = options_.relay.max_pending_gmcp;
        if (limit == 0) {
            LDEBUG("{} sent {} before the server enabled GMCP, dropped", client_, *decoded);
            co_return;
        }
        if (pending_gmcp_.size() >= limit) {
            LDEBUG("{} pending GMCP queue full, dropping {}", client_, pending_gmcp_.front());
            pending_gmcp_.pop_front();
        }
        pending_gmcp_.push_back(std::move(*decoded));
    }

    void RelaySession::flushPendingGMCP() {
        // Runs on the server's reader, so the server queue must not be awaited.
        while (!pending_gmcp_.empty()) {
            server_.sendControl(telnet::TelnetMessageSubnegotiation{telnet::codes::GMCP, options_.codec->encode(pending_gmcp_.front())});
            pending_gmcp_.pop_front();
        }
    }

}
