#pragma once

#include "proxy/client_session.hpp"
#include "proxy/socks5_codec.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <atomic>
#include <memory>
#include <optional>

// ---------------------------------------------------------------------------
// Socks5Session
//   no-auth SOCKS5 CONNECT 세션.
//
//   흐름: 인사말 → 방식 선택 → 요청 → 정책 판정 → 업스트림 연결 → 응답 → 터널
//   스트림 내용은 검사할 수 없으므로 descriptor 는 {unknown, method 없음}.
//   Limited 모드에서는 정책 엔진이 blocked-by-mitm-required 로 거부한다.
//   협상 단계의 읽기/쓰기는 services.timeouts.idle 안에 끝나야 한다.
// ---------------------------------------------------------------------------
class Socks5Session final : public ClientSession {
public:
    Socks5Session(ConnectionContext            ctx,
                  boost::asio::ip::tcp::socket client_socket,
                  SessionServices              services);

    ~Socks5Session() override = default;

    Socks5Session(const Socks5Session&)            = delete;
    Socks5Session& operator=(const Socks5Session&) = delete;
    Socks5Session(Socks5Session&&)                 = delete;
    Socks5Session& operator=(Socks5Session&&)      = delete;

    auto run() -> boost::asio::awaitable<void> override;
    void close() override;

    [[nodiscard]] auto context() const noexcept -> const ConnectionContext& override { return ctx_; }

private:
    // negotiate: 인사말 + 요청 디코드. 실패 시 필요한 응답을 보내고 std::nullopt.
    auto negotiate() -> boost::asio::awaitable<std::optional<Socks5Request>>;

    auto send_reply(Socks5Reply reply, const boost::asio::ip::tcp::endpoint& bound = {})
        -> boost::asio::awaitable<bool>;

    auto serve() -> boost::asio::awaitable<void>;

    // read_exact: idle 상한을 건 async_read. 실패하면 false.
    auto read_exact(boost::asio::mutable_buffer buffer) -> boost::asio::awaitable<bool>;

    ConnectionContext                       ctx_;
    boost::beast::tcp_stream                client_;
    SessionServices                         services_;
    std::shared_ptr<const PolicySnapshot>   snapshot_;
    std::optional<boost::beast::tcp_stream> upstream_{};
    std::atomic<bool>                       closing_{false};
};
