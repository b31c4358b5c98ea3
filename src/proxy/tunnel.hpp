#pragma once

// ---------------------------------------------------------------------------
// tunnel.hpp
//
// 두 TCP 소켓 사이의 양방향 바이트 터널 (CONNECT 블라인드 터널, SOCKS5).
//
// [종료 규칙]
// - 한쪽에서 EOF 를 읽으면 반대쪽 소켓의 송신 방향만 닫는다 (half-close).
// - 읽기/쓰기 오류가 나면 두 소켓을 모두 닫아 반대 방향도 끝나게 한다.
// - 양방향 모두 idle 동안 아무 바이트도 오가지 않으면 두 소켓을 닫는다.
// - half-close 이후에는 남은 방향이 half_close 동안 조용하면 두 소켓을 닫는다.
// - run_tunnel 은 두 방향과 감시 코루틴이 모두 끝난 뒤에 반환한다.
// ---------------------------------------------------------------------------

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>

struct TunnelTimeouts {
    std::chrono::steady_clock::duration idle{};
    std::chrono::steady_clock::duration half_close{};
};

struct TunnelStats {
    std::uint64_t bytes_up{0};    // client → upstream
    std::uint64_t bytes_down{0};  // upstream → client
    bool          timed_out{false};
};

[[nodiscard]] auto run_tunnel(boost::asio::ip::tcp::socket& client,
                              boost::asio::ip::tcp::socket& upstream,
                              TunnelTimeouts                timeouts)
    -> boost::asio::awaitable<TunnelStats>;
