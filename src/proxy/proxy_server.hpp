#pragma once

#include "admin/admin_server.hpp"
#include "logger/structured_logger.hpp"
#include "mitm/leaf_cert_issuer.hpp"
#include "policy/blocked_log.hpp"
#include "policy/policy_engine.hpp"
#include "policy/policy_watcher.hpp"
#include "proxy/client_session.hpp"
#include "stats/stats_collector.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

// ---------------------------------------------------------------------------
// ProxyConfig
//   ProxyServer 의 프로세스 설정. main 이 환경변수에서 채운다.
//   정책(allow/deny, mode, mitm)은 여기가 아니라 policy_path 의 YAML 에 있다.
//
//   *_address                       : "host:port" (http:// 접두어, [v6] 허용)
//   allow_non_loopback_*            : loopback 강제 해제 (위험)
//   policy_watch_interval           : 0 이면 파일 감시 비활성
//   max_connections                 : 0 이면 제한 없음
//   idle_timeout / half_close_timeout: 세션 I/O 와 터널의 무활동 상한 (0 보다 커야 함)
// ---------------------------------------------------------------------------
struct ProxyConfig {
    std::string   http_address{"127.0.0.1:3128"};
    std::string   socks_address{"127.0.0.1:8081"};
    std::string   admin_address{"127.0.0.1:8080"};

    bool          allow_non_loopback_http{false};
    bool          allow_non_loopback_socks{false};
    bool          allow_non_loopback_admin{false};

    std::string   policy_path{"config/policy.yaml"};
    std::chrono::seconds policy_watch_interval{5};

    std::string   log_path{"/tmp/netgate.log"};
    std::string   log_level{"info"};

    std::uint32_t max_connections{1000};

    std::chrono::seconds idle_timeout{120};
    std::chrono::seconds half_close_timeout{5};
};

// ---------------------------------------------------------------------------
// ProxyServer
//   HTTP / SOCKS5 / 관리 리스너 → 세션 생성 → Graceful Shutdown 을 담당한다.
//
//   사용 예:
//     ProxyServer server(config);
//     if (auto r = server.start(io_ctx); !r) { ... 기동 실패 ... }
//     io_ctx.run();
//
//   SIGTERM/SIGINT → stop(), SIGHUP → policy_reload().
// ---------------------------------------------------------------------------
class ProxyServer {
public:
    explicit ProxyServer(ProxyConfig config);

    ~ProxyServer() = default;

    ProxyServer(const ProxyServer&)            = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;
    ProxyServer(ProxyServer&&)                 = delete;
    ProxyServer& operator=(ProxyServer&&)      = delete;

    // -----------------------------------------------------------------------
    // start
    //   정책 로드 → 구성 요소 생성 → 리스너 바인딩 → 코루틴 spawn.
    //   초기 정책을 읽을 수 없거나 리스너를 열 수 없으면 오류 (io_ctx 는 건드리지 않음).
    // -----------------------------------------------------------------------
    [[nodiscard]] auto start(boost::asio::io_context& io_ctx) -> std::expected<void, std::string>;

    // -----------------------------------------------------------------------
    // stop
    //   새 연결 Accept 중단 → 활성 세션 close() → 세션이 모두 끝나면 io_context 중단.
    // -----------------------------------------------------------------------
    void stop();

    // policy_reload: 파일을 다시 읽어 새 세대를 게시. 실패 시 기존 정책 유지.
    auto policy_reload() -> std::expected<std::uint64_t, std::string>;

    [[nodiscard]] auto http_endpoint() const -> boost::asio::ip::tcp::endpoint;
    [[nodiscard]] auto socks_endpoint() const -> boost::asio::ip::tcp::endpoint;
    [[nodiscard]] auto admin_endpoint() const -> boost::asio::ip::tcp::endpoint;

    [[nodiscard]] auto policy_engine() const noexcept -> const std::shared_ptr<PolicyEngine>& { return policy_engine_; }

    // mitm_issuer: 새 세션에 넘길 발급기. MITM 비활성이면 nullptr.
    [[nodiscard]] auto mitm_issuer() const -> std::shared_ptr<LeafCertIssuer>
    {
        return mitm_active_ ? issuer_ : nullptr;
    }

private:
    // issuer_ 를 만든 CA 설정. 이 값이 바뀔 때만 발급기를 다시 만든다.
    struct IssuerSettings {
        std::string   ca_cert_path{};
        std::string   ca_key_path{};
        std::uint32_t leaf_validity_hours{0};

        bool operator==(const IssuerSettings&) const = default;
    };

    enum class Frontend : std::uint8_t { kHttp, kSocks5 };

    // accept_loop: 프런트엔드 하나의 Accept 루프 코루틴
    auto accept_loop(boost::asio::ip::tcp::acceptor& acceptor, Frontend frontend)
        -> boost::asio::awaitable<void>;

    // admit: max_connections 확인 + health 상태 전환. 수용 가능하면 true.
    bool admit();

    // update_issuer
    //   mitm.enabled 에 따라 발급기를 켜고 끈다. 발급기(CA, leaf 캐시)는
    //   CA 경로나 leaf 유효기간이 바뀌었을 때만 다시 만든다.
    void update_issuer(const MitmConfig& mitm);

    void spawn_session(std::shared_ptr<ClientSession> session);

    ProxyConfig config_;
    bool        stopping_{false};

    std::shared_ptr<PolicyEngine>      policy_engine_{};
    std::shared_ptr<StructuredLogger>  logger_{};
    std::shared_ptr<StatsCollector>    stats_{};
    std::shared_ptr<BlockedRequestLog> blocked_{};
    std::shared_ptr<LeafCertIssuer>    issuer_{};
    IssuerSettings                     issuer_settings_{};
    bool                               mitm_active_{false};
    std::shared_ptr<boost::asio::ssl::context> origin_tls_{};
    std::unique_ptr<AdminServer>       admin_server_{};
    std::unique_ptr<PolicyWatcher>     watcher_{};

    std::unique_ptr<boost::asio::ip::tcp::acceptor> http_acceptor_{};
    std::unique_ptr<boost::asio::ip::tcp::acceptor> socks_acceptor_{};

    // SIGHUP 재등록 핸들러 (자기 자신을 weak_ptr 로 참조하므로 여기서 소유)
    std::shared_ptr<std::function<void()>> hup_handler_{};

    std::atomic<std::uint64_t> next_session_id_{1};
    std::unordered_map<std::uint64_t, std::shared_ptr<ClientSession>> sessions_{};

    boost::asio::io_context* io_ctx_{nullptr};
};
