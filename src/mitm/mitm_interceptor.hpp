#pragma once

// ---------------------------------------------------------------------------
// mitm_interceptor.hpp
//
// CONNECT 터널 내부 TLS 가로채기.
//
// 흐름:
//   1. 대상 호스트의 leaf 인증서 발급/조회 (실패 시 이 연결만 종료)
//   2. 클라이언트와 서버측 TLS 핸드셰이크 (ALPN http/1.1)
//   3. 복호화된 요청마다:
//      - CONNECT → 405
//      - Host 불일치 → 400
//      - 연결에 고정된 정책 스냅샷으로 재판정 (https-mitm). 차단 → 403 후 종료
//      - 허용 → origin TLS 연결(지연 생성, SNI + 인증서 검증) 후 릴레이
//   4. inspect 설정 시 메서드/경로/상태/본문 크기 로그
//
// origin 검증 컨텍스트는 services.origin_tls 를 쓰고, 없으면 시스템 루트로 만든다.
// 핸드셰이크와 읽기/쓰기마다 services.timeouts.idle 상한을 건다.
//
// 정책 판정은 요청 바이트가 origin 으로 나가기 전에 끝난다.
// ---------------------------------------------------------------------------

#include "http/http_util.hpp"
#include "mitm/leaf_cert_issuer.hpp"
#include "proxy/client_session.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <expected>
#include <memory>
#include <string>

// make_server_context: leaf 인증서/키를 사용하는 서버측 TLS 컨텍스트
[[nodiscard]] auto make_server_context(const LeafCertificate& leaf)
    -> std::expected<std::shared_ptr<boost::asio::ssl::context>, std::string>;

// make_origin_context: 시스템 루트로 검증하는 클라이언트측 TLS 컨텍스트
[[nodiscard]] auto make_origin_context()
    -> std::expected<std::shared_ptr<boost::asio::ssl::context>, std::string>;

class MitmInterceptor {
public:
    MitmInterceptor(ConnectionContext                     ctx,
                    Authority                             target,
                    std::shared_ptr<const PolicySnapshot> snapshot,
                    SessionServices                       services);

    MitmInterceptor(const MitmInterceptor&)            = delete;
    MitmInterceptor& operator=(const MitmInterceptor&) = delete;

    // run
    //   client_buffer: CONNECT 헤더 뒤에 클라이언트가 이미 보낸 바이트.
    //   TLS 핸드셰이크 입력으로 재사용한다.
    auto run(boost::beast::tcp_stream& client, boost::beast::flat_buffer& client_buffer)
        -> boost::asio::awaitable<void>;

private:
    using OriginStream = boost::asio::ssl::stream<boost::beast::tcp_stream>;

    auto connect_origin()
        -> boost::asio::awaitable<std::expected<std::unique_ptr<OriginStream>, std::string>>;

    ConnectionContext                          ctx_;
    Authority                                  target_;
    std::shared_ptr<const PolicySnapshot>      snapshot_;
    SessionServices                            services_;
    std::shared_ptr<boost::asio::ssl::context> origin_ctx_{};
};
