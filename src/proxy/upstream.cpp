#include "proxy/upstream.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>

#include <spdlog/spdlog.h>

auto connect_upstream(std::string host, std::uint16_t port,
                      std::chrono::steady_clock::duration timeout)
    -> boost::asio::awaitable<std::expected<boost::beast::tcp_stream, boost::system::error_code>>
{
    const auto executor = co_await boost::asio::this_coro::executor;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    boost::asio::ip::tcp::resolver resolver{executor};
    boost::system::error_code      ec;

    // resolver 에는 자체 타임아웃이 없으므로 타이머가 취소한다
    bool resolve_timed_out = false;
    boost::asio::steady_timer resolve_timer{executor, deadline};
    resolve_timer.async_wait([&](const boost::system::error_code& timer_ec) {
        if (!timer_ec) {
            resolve_timed_out = true;
            resolver.cancel();
        }
    });
    const auto endpoints = co_await resolver.async_resolve(
        host, std::to_string(port),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    resolve_timer.cancel();
    if (resolve_timed_out) {
        ec = boost::beast::error::timeout;
    }
    if (ec) {
        spdlog::debug("[upstream] resolve {}:{} failed: {}", host, port, ec.message());
        co_return std::unexpected(ec);
    }

    boost::beast::tcp_stream stream{executor};
    stream.expires_at(deadline);
    co_await stream.async_connect(endpoints, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("[upstream] connect {}:{} failed: {}", host, port, ec.message());
        co_return std::unexpected(ec);
    }
    stream.expires_never();

    stream.socket().set_option(boost::asio::ip::tcp::no_delay(true), ec);
    co_return std::move(stream);
}
