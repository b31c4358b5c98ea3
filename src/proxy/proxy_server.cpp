#include "proxy/proxy_server.hpp"

#include "mitm/mitm_interceptor.hpp"
#include "policy/policy_loader.hpp"
#include "proxy/http_session.hpp"
#include "proxy/listen_address.hpp"
#include "proxy/socks5_session.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <csignal>
#include <exception>
#include <functional>

// ---------------------------------------------------------------------------
// ProxyServer 구현
//
// start() 흐름:
//   1. io_ctx_ 저장
//   2. PolicyLoader::load(policy_path), 실패 시 기동 중단
//   3. logger_, stats_, blocked_, policy_engine_, (mitm) issuer_, origin_tls_ 생성
//   4. 리스너 주소 파싱 + loopback clamp + 바인딩
//   5. admin_server_ + co_spawn(run)
//   6. policy watcher + co_spawn(run)
//   7. SIGTERM/SIGINT 핸들러 + SIGHUP 핸들러
//   8. HTTP / SOCKS5 accept 루프 co_spawn
//      세션 완료 콜백에서 sessions_.erase()
//
// stop() 흐름:
//   1. stopping_ = true
//   2. acceptor / admin / watcher 정지
//   3. 활성 세션 각각 session->close()
//   4. 세션 0개이면 io_ctx_->stop()
// ---------------------------------------------------------------------------

namespace {

// co_spawn 완료 핸들러: 예외를 로그로 남긴다
auto log_exceptions(std::string what)
{
    return [what = std::move(what)](std::exception_ptr eptr) {
        if (eptr) {
            try { std::rethrow_exception(eptr); }
            catch (const std::exception& e) {
                spdlog::error("[proxy] {} exception: {}", what, e.what());
            }
        }
    };
}

}  // namespace

ProxyServer::ProxyServer(ProxyConfig config)
    : config_{std::move(config)}
{}

// ---------------------------------------------------------------------------
// update_issuer
// ---------------------------------------------------------------------------
void ProxyServer::update_issuer(const MitmConfig& mitm)
{
    if (!mitm.enabled) {
        if (mitm_active_) {
            spdlog::info("[proxy] MITM disabled");
        }
        mitm_active_ = false;
        return;
    }

    IssuerSettings wanted{
        .ca_cert_path        = mitm.ca_cert_path,
        .ca_key_path         = mitm.ca_key_path,
        .leaf_validity_hours = mitm.leaf_validity_hours,
    };
    if (issuer_ && wanted == issuer_settings_) {
        if (!mitm_active_) {
            spdlog::info("[proxy] MITM enabled (existing CA kept)");
        }
        mitm_active_ = true;
        return;
    }

    auto ca = CertificateAuthority::load_or_create(mitm.ca_cert_path, mitm.ca_key_path);
    if (!ca) {
        // 발급기가 없으면 Full 모드 CONNECT 는 블라인드 터널, Limited 모드 CONNECT 는 차단
        spdlog::error("[proxy] MITM CA unavailable, interception disabled: {}", ca.error());
        mitm_active_ = false;
        return;
    }

    issuer_ = std::make_shared<LeafCertIssuer>(
        std::move(*ca), std::chrono::hours{mitm.leaf_validity_hours});
    issuer_settings_ = std::move(wanted);
    mitm_active_     = true;
    spdlog::info("[proxy] MITM enabled (CA {}, leaf validity {}h)",
                 mitm.ca_cert_path, mitm.leaf_validity_hours);
}

// ---------------------------------------------------------------------------
// policy_reload
// ---------------------------------------------------------------------------
auto ProxyServer::policy_reload() -> std::expected<std::uint64_t, std::string>
{
    spdlog::info("[proxy] reloading policy: {}", config_.policy_path);

    auto result = PolicyLoader::load(config_.policy_path);
    if (!result) {
        spdlog::warn("[proxy] policy reload failed (keeping current policy): {}", result.error());
        return std::unexpected(result.error());
    }

    update_issuer(result->mitm);
    const auto generation = policy_engine_->reload(std::move(*result));
    spdlog::info("[proxy] policy reloaded successfully (generation {})", generation);
    return generation;
}

// ---------------------------------------------------------------------------
// admit
// ---------------------------------------------------------------------------
bool ProxyServer::admit()
{
    if (config_.max_connections == 0) {
        return true;
    }

    const auto snap = stats_->snapshot();
    if (snap.active_sessions >= config_.max_connections) {
        spdlog::warn("[proxy] max_connections ({}) reached, rejecting new connection",
                     config_.max_connections);
        admin_server_->set_unhealthy(
            fmt::format("max_connections ({}) reached", config_.max_connections));
        return false;
    }

    // 세션 수가 회복되면 healthy 전환
    if (admin_server_->status() == HealthStatus::kUnhealthy && !stopping_) {
        admin_server_->set_healthy();
    }
    return true;
}

// ---------------------------------------------------------------------------
// spawn_session
// ---------------------------------------------------------------------------
void ProxyServer::spawn_session(std::shared_ptr<ClientSession> session)
{
    const std::uint64_t sid = session->context().session_id;
    sessions_.emplace(sid, session);

    spdlog::debug("[proxy] new {} session {}", to_string(session->context().protocol), sid);

    // 세션 코루틴 spawn, 완료 시 sessions_ 에서 제거
    boost::asio::co_spawn(
        *io_ctx_,
        session->run(),
        [this, sid](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("[proxy] session {} exception: {}", sid, e.what());
                }
            }

            sessions_.erase(sid);
            spdlog::debug("[proxy] session {} removed (active: {})", sid, sessions_.size());

            // 모든 세션 종료 + stopping 중 → io_context 중단
            if (stopping_ && sessions_.empty()) {
                spdlog::info("[proxy] all sessions closed, stopping io_context");
                io_ctx_->stop();
            }
        });
}

// ---------------------------------------------------------------------------
// accept_loop
// ---------------------------------------------------------------------------
auto ProxyServer::accept_loop(boost::asio::ip::tcp::acceptor& acceptor, Frontend frontend)
    -> boost::asio::awaitable<void>
{
    const char* name = frontend == Frontend::kHttp ? "http" : "socks5";
    spdlog::info("[proxy] {} listening on {}:{}", name,
                 acceptor.local_endpoint().address().to_string(), acceptor.local_endpoint().port());

    while (!stopping_) {
        boost::system::error_code ec;
        auto client_sock = co_await acceptor.async_accept(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) {
            if (ec == boost::asio::error::operation_aborted) {
                spdlog::info("[proxy] {} acceptor closed", name);
                break;
            }
            if (!stopping_) {
                spdlog::warn("[proxy] {} accept error: {}", name, ec.message());
            }
            continue;
        }

        if (stopping_ || !admit()) {
            boost::system::error_code close_ec;
            client_sock.close(close_ec);
            continue;
        }

        const auto remote = client_sock.remote_endpoint(ec);
        ConnectionContext ctx{
            .session_id   = next_session_id_.fetch_add(1, std::memory_order_relaxed),
            .client_ip    = ec ? std::string{} : remote.address().to_string(),
            .client_port  = ec ? std::uint16_t{0} : remote.port(),
            .protocol     = frontend == Frontend::kHttp ? ProxyProtocol::kHttp : ProxyProtocol::kSocks5,
            .connected_at = std::chrono::system_clock::now(),
        };

        SessionServices services{
            .policy     = policy_engine_,
            .logger     = logger_,
            .stats      = stats_,
            .blocked    = blocked_,
            .issuer     = mitm_issuer(),
            .origin_tls = origin_tls_,
            .timeouts   = SessionTimeouts{.idle = config_.idle_timeout,
                                          .half_close = config_.half_close_timeout},
        };

        std::shared_ptr<ClientSession> session;
        if (frontend == Frontend::kHttp) {
            session = std::make_shared<HttpSession>(std::move(ctx), std::move(client_sock),
                                                    std::move(services));
        } else {
            session = std::make_shared<Socks5Session>(std::move(ctx), std::move(client_sock),
                                                      std::move(services));
        }
        spawn_session(std::move(session));
    }
}

// ---------------------------------------------------------------------------
// ProxyServer::start
// ---------------------------------------------------------------------------
auto ProxyServer::start(boost::asio::io_context& io_ctx) -> std::expected<void, std::string>
{
    io_ctx_ = &io_ctx;

    if (config_.idle_timeout.count() <= 0 || config_.half_close_timeout.count() <= 0) {
        return std::unexpected("idle_timeout and half_close_timeout must be positive");
    }

    // -----------------------------------------------------------------------
    // 2. PolicyLoader::load: 초기 정책 없이 기동하지 않는다
    // -----------------------------------------------------------------------
    auto load_result = PolicyLoader::load(config_.policy_path);
    if (!load_result) {
        return std::unexpected("initial policy load failed: " + load_result.error());
    }
    spdlog::info("[proxy] policy loaded from: {}", config_.policy_path);

    // -----------------------------------------------------------------------
    // 3. logger, stats, blocked log, policy_engine, issuer 생성
    // -----------------------------------------------------------------------
    try {
        logger_ = std::make_shared<StructuredLogger>(
            StructuredLogger::parse_log_level(config_.log_level), config_.log_path);
    } catch (const std::runtime_error& e) {
        return std::unexpected(e.what());
    }
    stats_   = std::make_shared<StatsCollector>();
    blocked_ = std::make_shared<BlockedRequestLog>();

    const bool force_loopback = !load_result->policy.allow_unix_sockets.empty();
    update_issuer(load_result->mitm);

    // origin 검증 컨텍스트는 프로세스 수명 동안 하나를 공유한다
    if (auto origin = make_origin_context()) {
        origin_tls_ = std::move(*origin);
    } else {
        spdlog::warn("[proxy] origin TLS context unavailable, MITM sessions will retry: {}",
                     origin.error());
    }
    policy_engine_ = std::make_shared<PolicyEngine>(std::move(*load_result));

    // -----------------------------------------------------------------------
    // 4. 리스너 바인딩 (loopback clamp)
    // -----------------------------------------------------------------------
    const auto http_ep = clamp_listen_endpoint(
        parse_listen_endpoint(config_.http_address, 3128),
        config_.allow_non_loopback_http, force_loopback, "http");
    const auto socks_ep = clamp_listen_endpoint(
        parse_listen_endpoint(config_.socks_address, 8081),
        config_.allow_non_loopback_socks, force_loopback, "socks5");
    const auto admin_ep = clamp_listen_endpoint(
        parse_listen_endpoint(config_.admin_address, 8080),
        config_.allow_non_loopback_admin, force_loopback, "admin");

    try {
        http_acceptor_  = std::make_unique<boost::asio::ip::tcp::acceptor>(io_ctx, http_ep);
        socks_acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_ctx, socks_ep);

        // -------------------------------------------------------------------
        // 5. AdminServer 생성 + co_spawn
        // -------------------------------------------------------------------
        admin_server_ = std::make_unique<AdminServer>(
            admin_ep, policy_engine_, stats_, blocked_,
            [this]() { return policy_reload(); },
            io_ctx);
    } catch (const boost::system::system_error& e) {
        return std::unexpected(std::string{"listener bind failed: "} + e.what());
    }

    boost::asio::co_spawn(io_ctx, admin_server_->run(), log_exceptions("admin server"));

    // -----------------------------------------------------------------------
    // 6. 정책 파일 감시
    // -----------------------------------------------------------------------
    if (config_.policy_watch_interval.count() > 0) {
        watcher_ = std::make_unique<PolicyWatcher>(
            config_.policy_path,
            std::chrono::duration_cast<std::chrono::milliseconds>(config_.policy_watch_interval),
            [this]() { (void)policy_reload(); },
            io_ctx);
        boost::asio::co_spawn(io_ctx, watcher_->run(), log_exceptions("policy watcher"));
    }

    // -----------------------------------------------------------------------
    // 7. 시그널 핸들러
    //    SIGTERM / SIGINT → stop()
    //    SIGHUP           → policy_reload()
    // -----------------------------------------------------------------------
    auto signals_stop = std::make_shared<boost::asio::signal_set>(io_ctx, SIGTERM, SIGINT);
    signals_stop->async_wait(
        [this, signals_stop](const boost::system::error_code& ec, int /*signum*/) {
            if (!ec) {
                spdlog::info("[proxy] shutdown signal received");
                stop();
            }
        });

    // SIGHUP 핸들러: 수신 후 재등록하여 반복 감지
    auto signals_hup = std::make_shared<boost::asio::signal_set>(io_ctx, SIGHUP);
    auto setup_hup   = std::make_shared<std::function<void()>>();
    *setup_hup = [this, signals_hup, weak = std::weak_ptr<std::function<void()>>(setup_hup)]() {
        signals_hup->async_wait(
            [this, weak](const boost::system::error_code& ec, int /*signum*/) {
                if (ec) {
                    return;
                }
                spdlog::info("[proxy] SIGHUP received");
                (void)policy_reload();
                if (auto again = weak.lock()) {
                    (*again)();
                }
            });
    };
    (*setup_hup)();
    hup_handler_ = setup_hup;

    // -----------------------------------------------------------------------
    // 8. Accept 루프 (co_spawn)
    // -----------------------------------------------------------------------
    boost::asio::co_spawn(io_ctx, accept_loop(*http_acceptor_, Frontend::kHttp),
                          log_exceptions("http accept loop"));
    boost::asio::co_spawn(io_ctx, accept_loop(*socks_acceptor_, Frontend::kSocks5),
                          log_exceptions("socks5 accept loop"));
    return {};
}

// ---------------------------------------------------------------------------
// ProxyServer::stop
// ---------------------------------------------------------------------------
void ProxyServer::stop()
{
    if (stopping_) {
        return;
    }

    stopping_ = true;

    spdlog::info("[proxy] stopping, active sessions: {}", sessions_.size());

    boost::system::error_code ec;
    if (http_acceptor_) {
        http_acceptor_->close(ec);
    }
    if (socks_acceptor_) {
        socks_acceptor_->close(ec);
    }

    // 관리 서버는 종료 중 상태를 알리고 정지
    if (admin_server_) {
        admin_server_->set_unhealthy("proxy shutting down");
        admin_server_->stop();
    }
    if (watcher_) {
        watcher_->stop();
    }

    // 활성 세션 전체 close()
    for (auto& [sid, session] : sessions_) {
        spdlog::debug("[proxy] closing session {}", sid);
        session->close();
    }

    // 세션이 없으면 즉시 종료
    if (sessions_.empty() && io_ctx_ != nullptr) {
        spdlog::info("[proxy] no active sessions, stopping io_context immediately");
        io_ctx_->stop();
    }
}

auto ProxyServer::http_endpoint() const -> boost::asio::ip::tcp::endpoint
{
    return http_acceptor_->local_endpoint();
}

auto ProxyServer::socks_endpoint() const -> boost::asio::ip::tcp::endpoint
{
    return socks_acceptor_->local_endpoint();
}

auto ProxyServer::admin_endpoint() const -> boost::asio::ip::tcp::endpoint
{
    return admin_server_->local_endpoint();
}
