#pragma once

#include "http/http_util.hpp"
#include "proxy/client_session.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/parser.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// HttpSessionState
//
//   kAwaitingRequestLine : 다음 요청 헤더 대기
//   kHeadersParsed       : 헤더 수신 완료, 정책 판정 중
//   kForwarding          : 평문 요청을 업스트림으로 릴레이 중
//   kTunnelEstablishing  : CONNECT 허용, 업스트림/MITM 준비 중 (이후 터널)
//   kRejected            : 403/4xx/5xx 응답 후 종료 대기
//   kClosed              : 세션 종료
// ---------------------------------------------------------------------------
enum class HttpSessionState : std::uint8_t {
    kAwaitingRequestLine = 0,
    kHeadersParsed       = 1,
    kForwarding          = 2,
    kTunnelEstablishing  = 3,
    kRejected            = 4,
    kClosed              = 5,
};

// ---------------------------------------------------------------------------
// HttpSession
//   HTTP forward proxy + CONNECT 세션.
//
//   - 연결 수립 시 정책 스냅샷을 하나 고정하고 연결이 끝날 때까지 사용한다.
//   - keep-alive 요청은 순서대로 처리한다. 직전 요청과 같은 host:port 이면
//     업스트림 연결을 재사용한다.
//   - CONNECT 이후에는 블라인드 터널 또는 MITM 으로 넘어가며 연결이 끝나면 종료.
//   - 모든 읽기/쓰기에 services.timeouts.idle 상한을 건다. 요청 헤더를
//     기다리다 시간이 지나면 응답 없이 연결을 닫는다.
// ---------------------------------------------------------------------------
class HttpSession final : public ClientSession {
public:
    HttpSession(ConnectionContext            ctx,
                boost::asio::ip::tcp::socket client_socket,
                SessionServices              services);

    ~HttpSession() override = default;

    HttpSession(const HttpSession&)            = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&)                 = delete;
    HttpSession& operator=(HttpSession&&)      = delete;

    auto run() -> boost::asio::awaitable<void> override;
    void close() override;

    [[nodiscard]] auto context() const noexcept -> const ConnectionContext& override { return ctx_; }
    [[nodiscard]] auto state() const noexcept -> HttpSessionState { return state_; }

private:
    using RequestParser = http::request_parser<http::buffer_body>;

    // handle_forward: 평문 요청 1건. 연결을 계속 쓸 수 있으면 true.
    auto handle_forward(RequestParser& parser) -> boost::asio::awaitable<bool>;

    // handle_connect: CONNECT. 반환 후 세션은 종료한다.
    auto handle_connect(RequestParser& parser) -> boost::asio::awaitable<void>;

    // handle_unix_socket: x-unix-socket 요청 (항상 연결 종료)
    auto handle_unix_socket(RequestParser& parser, const std::string& path)
        -> boost::asio::awaitable<void>;

    auto reject(http::response<http::string_body> res) -> boost::asio::awaitable<void>;

    // record: 감사/차단 로그/통계 반영 후 decision 을 그대로 돌려준다
    Decision record(const RequestDescriptor& desc, const Decision& decision);

    ConnectionContext                            ctx_;
    boost::beast::tcp_stream                     client_;
    SessionServices                              services_;
    std::shared_ptr<const PolicySnapshot>        snapshot_;
    HttpSessionState                             state_{HttpSessionState::kAwaitingRequestLine};

    boost::beast::flat_buffer                    client_buffer_{};
    std::optional<boost::beast::tcp_stream>      upstream_{};
    boost::beast::flat_buffer                    upstream_buffer_{};
    std::string                                  upstream_key_{};  // "host:port"

    std::atomic<bool>                            closing_{false};
};
