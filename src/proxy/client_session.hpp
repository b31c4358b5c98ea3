#pragma once

// ---------------------------------------------------------------------------
// client_session.hpp
//
// 프런트엔드 세션 공통 인터페이스와 공유 의존성.
//
// ProxyServer 는 HTTP / SOCKS5 세션을 ClientSession 으로만 다루며
// Graceful Shutdown 시 close() 를 호출한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "logger/structured_logger.hpp"
#include "mitm/leaf_cert_issuer.hpp"
#include "policy/blocked_log.hpp"
#include "policy/policy_engine.hpp"
#include "stats/stats_collector.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <memory>
#include <string_view>

// ---------------------------------------------------------------------------
// SessionTimeouts
//   idle       : 읽기/쓰기 1회, 업스트림 연결, 터널 무활동의 상한
//   half_close : 터널 한쪽이 EOF 를 보낸 뒤 남은 방향의 무활동 상한
//   둘 다 0 보다 커야 한다.
// ---------------------------------------------------------------------------
struct SessionTimeouts {
    std::chrono::steady_clock::duration idle{std::chrono::seconds{120}};
    std::chrono::steady_clock::duration half_close{std::chrono::seconds{5}};
};

// ---------------------------------------------------------------------------
// SessionServices
//   세션이 공유 소유하는 의존성 묶음.
//   issuer 는 accept 시점의 MITM 발급기. nullptr 이면 MITM 비활성.
//   origin_tls 는 MITM origin 연결용 클라이언트 TLS 컨텍스트.
//   nullptr 이면 인터셉터가 시스템 루트로 직접 만든다.
// ---------------------------------------------------------------------------
struct SessionServices {
    std::shared_ptr<PolicyEngine>               policy{};
    std::shared_ptr<StructuredLogger>           logger{};
    std::shared_ptr<StatsCollector>             stats{};
    std::shared_ptr<BlockedRequestLog>          blocked{};
    std::shared_ptr<LeafCertIssuer>             issuer{};
    std::shared_ptr<boost::asio::ssl::context>  origin_tls{};
    SessionTimeouts                             timeouts{};
};

class ClientSession {
public:
    virtual ~ClientSession() = default;

    // run: 세션 메인 코루틴. 반환 시 소켓은 모두 닫혀 있다.
    virtual auto run() -> boost::asio::awaitable<void> = 0;

    // close: 진행 중인 I/O 를 취소한다. 여러 번 호출해도 안전.
    virtual void close() = 0;

    [[nodiscard]] virtual auto context() const noexcept -> const ConnectionContext& = 0;
};

// record_decision
//   판정 1건을 감사 로그 / 차단 로그 / 통계에 반영한다.
void record_decision(const SessionServices&   services,
                     const ConnectionContext& ctx,
                     const RequestDescriptor& desc,
                     const Decision&          decision,
                     NetworkMode              mode);

// log_connection_event: "connect" | "disconnect"
void log_connection_event(const SessionServices&   services,
                          const ConnectionContext& ctx,
                          std::string_view         event);
