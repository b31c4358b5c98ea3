#pragma once

#include "policy/blocked_log.hpp"
#include "policy/policy_engine.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

class StatsCollector;

// ---------------------------------------------------------------------------
// HealthStatus
//   kHealthy   : GET /health → 200 {"status":"ok"}
//   kUnhealthy : GET /health → 503 {"status":"unhealthy","reason":"..."}
// ---------------------------------------------------------------------------
enum class HealthStatus : std::uint8_t {
    kHealthy   = 0,
    kUnhealthy = 1,
};

// ---------------------------------------------------------------------------
// AdminResponse
//   라우팅 결과. 본문은 항상 JSON.
// ---------------------------------------------------------------------------
struct AdminResponse {
    unsigned    status{200};
    std::string body{};
};

// ---------------------------------------------------------------------------
// AdminServer
//   제어용 HTTP/1.1 서버. 요청 1건 처리 후 연결을 닫는다.
//
//   GET  /health    상태
//   GET  /config    현재 스냅샷 설정 (generation 포함)
//   GET  /patterns  정규화된 allow/deny 패턴
//   GET  /blocked   최근 차단 요청 (오래된 순, 비우지 않음)
//   GET  /stats     통계 스냅샷
//   POST /mode      {"mode":"full"|"limited"}
//   POST /reload    정책 파일 재적용
//
//   알려진 경로에 다른 메서드 → 405, 그 외 → 404.
// ---------------------------------------------------------------------------
class AdminServer {
public:
    // ReloadCallback: 성공 시 새 generation, 실패 시 오류 메시지 (기존 정책 유지)
    using ReloadCallback = std::function<std::expected<std::uint64_t, std::string>()>;

    // -----------------------------------------------------------------------
    // 생성자
    //   endpoint 에 즉시 바인딩한다 (실패 시 boost::system::system_error).
    //   port 0 이면 임의 포트 (local_endpoint() 로 확인).
    // -----------------------------------------------------------------------
    AdminServer(boost::asio::ip::tcp::endpoint     endpoint,
                std::shared_ptr<PolicyEngine>      policy,
                std::shared_ptr<StatsCollector>    stats,
                std::shared_ptr<BlockedRequestLog> blocked,
                ReloadCallback                     on_reload,
                boost::asio::io_context&           io_context);

    ~AdminServer() = default;

    AdminServer(const AdminServer&)            = delete;
    AdminServer& operator=(const AdminServer&) = delete;
    AdminServer(AdminServer&&)                 = delete;
    AdminServer& operator=(AdminServer&&)      = delete;

    auto run() -> boost::asio::awaitable<void>;

    // stop: acceptor 를 닫아 run() 을 끝낸다
    void stop();

    // handle: 소켓 없이 라우팅만 수행 (테스트에서도 사용)
    [[nodiscard]] AdminResponse handle(std::string_view method,
                                       std::string_view target,
                                       std::string_view body);

    void set_unhealthy(std::string_view reason);
    void set_healthy();

    [[nodiscard]] auto status() const noexcept -> HealthStatus;
    [[nodiscard]] auto local_endpoint() const -> boost::asio::ip::tcp::endpoint;

private:
    auto handle_connection(boost::asio::ip::tcp::socket socket) -> boost::asio::awaitable<void>;

    [[nodiscard]] AdminResponse health() const;
    [[nodiscard]] AdminResponse config() const;
    [[nodiscard]] AdminResponse patterns() const;
    [[nodiscard]] AdminResponse blocked() const;
    [[nodiscard]] AdminResponse stats() const;
    [[nodiscard]] AdminResponse set_mode(std::string_view body);
    [[nodiscard]] AdminResponse reload();

    boost::asio::ip::tcp::acceptor     acceptor_;
    std::shared_ptr<PolicyEngine>      policy_;
    std::shared_ptr<StatsCollector>    stats_;
    std::shared_ptr<BlockedRequestLog> blocked_;
    ReloadCallback                     on_reload_;
    boost::asio::io_context&           io_context_;
    HealthStatus                       status_{HealthStatus::kHealthy};
    std::string                        unhealthy_reason_{};
};
