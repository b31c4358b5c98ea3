#include "proxy/tunnel.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <exception>

namespace {

using boost::asio::ip::tcp;
using Clock = std::chrono::steady_clock;

constexpr std::size_t kTunnelBufferSize = 16 * 1024;

// 두 pump 와 watchdog 이 공유하는 상태. run_tunnel 프레임이 소유한다.
struct TunnelState {
    tcp::socket&              client;
    tcp::socket&              upstream;
    TunnelTimeouts            timeouts;
    boost::asio::steady_timer watchdog_timer;
    Clock::time_point         last_activity{Clock::now()};
    int                       open_directions{2};
    bool                      half_closed{false};
    bool                      timed_out{false};

    void close_both()
    {
        boost::system::error_code ignored;
        client.close(ignored);
        upstream.close(ignored);
    }

    void touch() { last_activity = Clock::now(); }

    // 방향 하나가 끝남. 마지막 방향이면 watchdog 을 깨워 끝낸다.
    void direction_done()
    {
        --open_directions;
        watchdog_timer.cancel();
    }
};

// pump: from → to 단방향 복사
auto pump(TunnelState& state, tcp::socket& from, tcp::socket& to, std::uint64_t& bytes)
    -> boost::asio::awaitable<void>
{
    std::array<char, kTunnelBufferSize> buf{};

    for (;;) {
        boost::system::error_code ec;
        const std::size_t n = co_await from.async_read_some(
            boost::asio::buffer(buf), boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec == boost::asio::error::eof) {
            boost::system::error_code ignored;
            to.shutdown(tcp::socket::shutdown_send, ignored);
            state.half_closed = true;
            state.touch();
            state.watchdog_timer.cancel();  // half_close 기준으로 다시 계산
            break;
        }
        if (ec) {
            state.close_both();
            break;
        }
        state.touch();

        co_await boost::asio::async_write(
            to, boost::asio::buffer(buf.data(), n),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            state.close_both();
            break;
        }
        state.touch();
        bytes += n;
    }
    state.direction_done();
}

// watchdog: 마지막 활동 이후 허용 시간이 지나면 두 소켓을 닫는다
auto watchdog(TunnelState& state) -> boost::asio::awaitable<void>
{
    while (state.open_directions > 0) {
        const auto limit    = state.half_closed ? state.timeouts.half_close : state.timeouts.idle;
        const auto deadline = state.last_activity + limit;
        if (Clock::now() >= deadline) {
            state.timed_out = true;
            state.close_both();
            co_return;
        }

        boost::system::error_code ec;
        state.watchdog_timer.expires_at(deadline);
        co_await state.watchdog_timer.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

}  // namespace

auto run_tunnel(tcp::socket& client, tcp::socket& upstream, TunnelTimeouts timeouts)
    -> boost::asio::awaitable<TunnelStats>
{
    const auto executor = co_await boost::asio::this_coro::executor;

    TunnelStats stats;
    TunnelState state{
        .client         = client,
        .upstream       = upstream,
        .timeouts       = timeouts,
        .watchdog_timer = boost::asio::steady_timer{executor},
    };

    // downstream 방향과 watchdog 은 별도 코루틴. 둘 다 끝나면 join_timer 를 취소하여 합류한다.
    boost::asio::steady_timer join_timer{executor, boost::asio::steady_timer::time_point::max()};
    int running = 2;

    auto on_done = [&](const char* what) {
        return [&, what](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("[tunnel] {} exception: {}", what, e.what());
                }
                state.close_both();
            }
            if (--running == 0) {
                join_timer.cancel();
            }
        };
    };

    boost::asio::co_spawn(executor, pump(state, upstream, client, stats.bytes_down),
                          on_done("downstream"));
    boost::asio::co_spawn(executor, watchdog(state), on_done("watchdog"));

    co_await pump(state, client, upstream, stats.bytes_up);

    if (running > 0) {
        boost::system::error_code ec;
        co_await join_timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    stats.timed_out = state.timed_out;
    co_return stats;
}
