#include "proxy/socks5_session.hpp"

#include "proxy/tunnel.hpp"
#include "proxy/upstream.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <vector>

Socks5Session::Socks5Session(ConnectionContext            ctx,
                             boost::asio::ip::tcp::socket client_socket,
                             SessionServices              services)
    : ctx_{std::move(ctx)}
    , client_{std::move(client_socket)}
    , services_{std::move(services)}
    , snapshot_{services_.policy->snapshot()}
{}

auto Socks5Session::send_reply(Socks5Reply reply, const boost::asio::ip::tcp::endpoint& bound)
    -> boost::asio::awaitable<bool>
{
    const auto bytes = encode_reply(reply, bound);
    boost::system::error_code ec;
    client_.expires_after(services_.timeouts.idle);
    co_await boost::asio::async_write(client_, boost::asio::buffer(bytes),
                                      boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("[socks5] session {}: reply write failed: {}", ctx_.session_id, ec.message());
        co_return false;
    }
    co_return true;
}

auto Socks5Session::read_exact(boost::asio::mutable_buffer buffer) -> boost::asio::awaitable<bool>
{
    boost::system::error_code ec;
    client_.expires_after(services_.timeouts.idle);
    co_await boost::asio::async_read(client_, buffer,
                                     boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec == boost::beast::error::timeout) {
        spdlog::debug("[socks5] session {}: idle timeout during negotiation", ctx_.session_id);
    }
    co_return !ec;
}

auto Socks5Session::negotiate() -> boost::asio::awaitable<std::optional<Socks5Request>>
{
    boost::system::error_code ec;

    // 1. 인사말
    std::array<std::uint8_t, kSocks5GreetingHeaderSize> header{};
    if (!co_await read_exact(boost::asio::buffer(header))) {
        co_return std::nullopt;
    }
    const auto method_count = decode_greeting_header(header);
    if (!method_count) {
        spdlog::debug("[socks5] session {}: {}", ctx_.session_id, method_count.error().message);
        co_return std::nullopt;
    }

    std::vector<std::uint8_t> methods(*method_count);
    if (!co_await read_exact(boost::asio::buffer(methods))) {
        co_return std::nullopt;
    }

    const std::uint8_t method    = select_method(methods);
    const auto         selection = encode_method_selection(method);
    client_.expires_after(services_.timeouts.idle);
    co_await boost::asio::async_write(client_, boost::asio::buffer(selection),
                                      boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec || method == kSocks5MethodNoneUsable) {
        co_return std::nullopt;
    }

    // 2. 요청
    std::vector<std::uint8_t> request(kSocks5RequestPrefixSize);
    if (!co_await read_exact(boost::asio::buffer(request))) {
        co_return std::nullopt;
    }

    const auto remaining = remaining_request_bytes(request);
    if (!remaining) {
        co_await send_reply(reply_for_error(remaining.error()));
        co_return std::nullopt;
    }

    request.resize(kSocks5RequestPrefixSize + *remaining);
    if (!co_await read_exact(boost::asio::buffer(request.data() + kSocks5RequestPrefixSize, *remaining))) {
        co_return std::nullopt;
    }

    auto decoded = decode_request(request);
    if (!decoded) {
        spdlog::debug("[socks5] session {}: {}", ctx_.session_id, decoded.error().message);
        co_await send_reply(reply_for_error(decoded.error()));
        co_return std::nullopt;
    }
    co_return std::move(*decoded);
}

auto Socks5Session::serve() -> boost::asio::awaitable<void>
{
    const auto request = co_await negotiate();
    if (!request) {
        co_return;
    }

    RequestDescriptor desc{
        .host     = request->host,
        .port     = request->port,
        .method   = std::nullopt,
        .tls      = TlsHint::kUnknown,
        .protocol = ProxyProtocol::kSocks5,
    };
    const Decision decision = co_await services_.policy->async_decide(desc, snapshot_);
    record_decision(services_, ctx_, desc, decision, snapshot_->mode());
    if (!decision.allowed) {
        co_await send_reply(Socks5Reply::kNotAllowed);
        co_return;
    }

    auto connected = co_await connect_upstream(request->host, request->port, services_.timeouts.idle);
    if (!connected) {
        spdlog::warn("[socks5] session {}: upstream {}:{} failed: {}",
                     ctx_.session_id, request->host, request->port, connected.error().message());
        if (services_.stats) {
            services_.stats->on_upstream_error();
        }
        co_await send_reply(reply_for_connect_error(connected.error()));
        co_return;
    }
    upstream_.emplace(std::move(*connected));

    boost::system::error_code ec;
    const auto bound = upstream_->socket().local_endpoint(ec);
    if (!co_await send_reply(Socks5Reply::kSucceeded, ec ? boost::asio::ip::tcp::endpoint{} : bound)) {
        co_return;
    }

    client_.expires_never();
    upstream_->expires_never();
    const auto stats = co_await run_tunnel(
        client_.socket(), upstream_->socket(),
        TunnelTimeouts{.idle = services_.timeouts.idle, .half_close = services_.timeouts.half_close});
    spdlog::debug("[socks5] session {}: tunnel {}:{} closed (up {} bytes, down {} bytes{})",
                  ctx_.session_id, request->host, request->port, stats.bytes_up, stats.bytes_down,
                  stats.timed_out ? ", timed out" : "");
}

auto Socks5Session::run() -> boost::asio::awaitable<void>
{
    if (services_.stats) {
        services_.stats->on_connection_open();
    }
    log_connection_event(services_, ctx_, "connect");

    co_await serve();

    close();
    if (services_.stats) {
        services_.stats->on_connection_close();
    }
    log_connection_event(services_, ctx_, "disconnect");
}

void Socks5Session::close()
{
    if (closing_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    boost::system::error_code ignored;
    client_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    client_.close();
    if (upstream_) {
        upstream_->close();
    }
}
