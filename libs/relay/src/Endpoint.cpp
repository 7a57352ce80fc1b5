#include "bcproxy/relay/Endpoint.hpp"
#include "bcproxy/log/Log.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace bcproxy::relay {

    std::string_view side_name(Side side) {
        switch (side) {
            case Side::client: return "client";
            case Side::server: return "server";
        }
        return "unknown";
    }

    telnet::TelnetNegotiator client_negotiator(const config::RelayConfig& relay) {
        using namespace telnet;
        TelnetNegotiator negotiator;

        const bool offer_gmcp = relay.translation == config::TranslationMode::passthrough;
        negotiator.add(std::make_shared<GMCPOption>(SupportInfo{true, offer_gmcp, true}, SupportInfo{}));

        // Answered from the server's state, never on our own.
        const SupportInfo mirrored{true, false, false};
        negotiator.add(make_option(codes::TELOPT_ECHO, mirrored, SupportInfo{}));
        negotiator.add(make_option(codes::SGA, mirrored, SupportInfo{}));
        negotiator.add(make_option(codes::TELOPT_EOR, mirrored, SupportInfo{}));
        return negotiator;
    }

    telnet::TelnetNegotiator server_negotiator(const config::RelayConfig& relay) {
        using namespace telnet;
        TelnetNegotiator negotiator;

        const SupportInfo accept{true, false, true};
        negotiator.add(std::make_shared<GMCPOption>(SupportInfo{}, accept));
        negotiator.add(make_option(codes::TELOPT_ECHO, SupportInfo{}, accept));
        negotiator.add(make_option(codes::SGA, SupportInfo{}, accept));
        negotiator.add(make_option(codes::TELOPT_EOR, SupportInfo{}, accept));
        if (relay.mccp) {
            negotiator.add(std::make_shared<MCCP2Option>(true));
        }
        return negotiator;
    }

    Endpoint::Endpoint(Side side, net::Connection connection, telnet::TelnetNegotiator negotiator,
                       std::size_t queue_limit, std::size_t control_limit)
        : side_(side),
          conn_(std::move(connection)),
          negotiator_(std::move(negotiator)),
          outgoing_(conn_.get_executor(), queue_limit),
          control_limit_(control_limit) {}

    boost::asio::awaitable<bool> Endpoint::send(telnet::TelnetMessage message) {
        boost::system::error_code ec;
        co_await outgoing_.async_send(boost::system::error_code{}, Outgoing{std::move(message)},
                                      boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            LDEBUG("{} outgoing queue rejected a message: {}", *this, ec.message());
            co_return false;
        }
        co_return true;
    }

    boost::asio::awaitable<bool> Endpoint::sendClose() {
        boost::system::error_code ec;
        co_await outgoing_.async_send(boost::system::error_code{}, Outgoing{EndpointClose{}},
                                      boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        co_return !ec;
    }

    void Endpoint::sendControl(telnet::TelnetMessage message) {
        if (control_.size() >= control_limit_) {
            LWARN("{} is not reading, dropping a reply past {} queued", *this, control_limit_);
            return;
        }
        const bool was_empty = control_.empty();
        control_.push_back(std::move(message));
        if (was_empty && !outgoing_.try_send(boost::system::error_code{}, Outgoing{EndpointWake{}})) {
            // Full or closed. A writer with work still picks the reply up.
            LTRACE("{} writer not woken for a reply", *this);
        }
    }

    boost::asio::awaitable<std::expected<void, boost::system::error_code>> Endpoint::runWriter() {
        std::string out;
        for (;;) {
            bool closing = false;
            auto take = [&](Outgoing&& item) {
                if (std::holds_alternative<EndpointClose>(item)) {
                    closing = true;
                } else if (auto* message = std::get_if<telnet::TelnetMessage>(&item)) {
                    telnet::appendTelnetMessage(out, *message);
                }
            };

            if (control_.empty()) {
                boost::system::error_code ec;
                auto first = co_await outgoing_.async_receive(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                if (ec) {
                    co_return std::unexpected(ec);
                }
                take(std::move(first));
            }

            // Replies go out ahead of relayed traffic.
            if (!control_.empty()) {
                std::string replies;
                for (const auto& reply : control_) {
                    telnet::appendTelnetMessage(replies, reply);
                }
                control_.clear();
                out.insert(0, replies);
            }

            // Coalesce whatever is already queued into one write.
            while (!closing && outgoing_.try_receive([&](boost::system::error_code, Outgoing item) { take(std::move(item)); })) {
            }

            if (!out.empty()) {
                auto written = co_await conn_.write_all(out);
                if (!written) {
                    co_return std::unexpected(written.error());
                }
                bytes_written_ += *written;
                out.clear();
            }

            if (closing) {
                co_return std::expected<void, boost::system::error_code>{};
            }
        }
    }

    void Endpoint::close() {
        outgoing_.close();
        conn_.close();
    }

    void Endpoint::startInflating() {
        if (!inflater_) {
            inflater_ = std::make_unique<zlib::InflateStream>();
        } else {
            inflater_->reset();
        }
    }

    void Endpoint::stopInflating() {
        inflater_.reset();
    }

}
