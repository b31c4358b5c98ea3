#include "proxy/http_session.hpp"

#include "http/http_relay.hpp"
#include "mitm/mitm_interceptor.hpp"
#include "proxy/tunnel.hpp"
#include "proxy/upstream.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <spdlog/spdlog.h>

#include <limits>
#include <string_view>

// ---------------------------------------------------------------------------
// HttpSession 구현
//
// 흐름:
//   1. 스냅샷 고정, stats/logger 연결 이벤트
//   2. 요청 헤더 읽기 (kAwaitingRequestLine → kHeadersParsed)
//   3. CONNECT → handle_connect (터널 또는 MITM, 이후 종료)
//      x-unix-socket → handle_unix_socket (종료)
//      그 외 → handle_forward (keep-alive 이면 2 로)
//   4. kClosed → 소켓 close
// ---------------------------------------------------------------------------

namespace {

constexpr std::string_view kConnectEstablished = "HTTP/1.1 200 Connection Established\r\n\r\n";

}  // namespace

HttpSession::HttpSession(ConnectionContext            ctx,
                         boost::asio::ip::tcp::socket client_socket,
                         SessionServices              services)
    : ctx_{std::move(ctx)}
    , client_{std::move(client_socket)}
    , services_{std::move(services)}
    , snapshot_{services_.policy->snapshot()}
{}

Decision HttpSession::record(const RequestDescriptor& desc, const Decision& decision)
{
    record_decision(services_, ctx_, desc, decision, snapshot_->mode());
    return decision;
}

auto HttpSession::reject(http::response<http::string_body> res) -> boost::asio::awaitable<void>
{
    state_ = HttpSessionState::kRejected;
    boost::system::error_code ec;
    client_.expires_after(services_.timeouts.idle);
    co_await http::async_write(client_, res, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("[http] session {}: rejection write failed: {}", ctx_.session_id, ec.message());
    }
}

auto HttpSession::run() -> boost::asio::awaitable<void>
{
    if (services_.stats) {
        services_.stats->on_connection_open();
    }
    log_connection_event(services_, ctx_, "connect");

    while (!closing_.load(std::memory_order_relaxed)) {
        state_ = HttpSessionState::kAwaitingRequestLine;

        RequestParser parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

        boost::system::error_code ec;
        client_.expires_after(services_.timeouts.idle);
        co_await http::async_read_header(client_, client_buffer_, parser,
                                         boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec == boost::beast::error::timeout) {
            spdlog::debug("[http] session {}: idle timeout waiting for request", ctx_.session_id);
            break;
        }
        if (ec) {
            if (ec != http::error::end_of_stream && ec != boost::asio::error::eof &&
                ec != boost::asio::error::operation_aborted &&
                ec != boost::asio::error::connection_reset)
            {
                spdlog::debug("[http] session {}: malformed request: {}", ctx_.session_id, ec.message());
                co_await reject(make_text_response(http::status::bad_request, "bad request"));
            }
            break;
        }
        state_ = HttpSessionState::kHeadersParsed;

        if (parser.get().method() == http::verb::connect) {
            co_await handle_connect(parser);
            break;
        }

        if (auto path = unix_socket_path(parser.get())) {
            co_await handle_unix_socket(parser, *path);
            break;
        }

        if (!co_await handle_forward(parser)) {
            break;
        }
    }

    state_ = HttpSessionState::kClosed;
    close();

    if (services_.stats) {
        services_.stats->on_connection_close();
    }
    log_connection_event(services_, ctx_, "disconnect");
}

auto HttpSession::handle_unix_socket(RequestParser& parser, const std::string& path)
    -> boost::asio::awaitable<void>
{
    auto& req = parser.get();
    const std::string method{req.method_string().data(), req.method_string().size()};

    RequestDescriptor desc{
        .host     = "unix:" + path,
        .port     = 0,
        .method   = method,
        .tls      = TlsHint::kPlain,
        .protocol = ProxyProtocol::kHttp,
    };

    // 메서드 게이트 → 소켓 경로 allow-list 순서
    Decision decision{.allowed = true, .reason = BlockReason::kNone, .generation = snapshot_->generation};
    if (!PolicyEngine::method_allowed(snapshot_->mode(), method)) {
        decision = Decision{.allowed = false, .reason = BlockReason::kMethodPolicy,
                            .generation = snapshot_->generation};
    } else if (!unix_socket_allowed(snapshot_->config.policy, path)) {
        decision = Decision{.allowed = false, .reason = BlockReason::kPolicy,
                            .generation = snapshot_->generation};
    }
    record(desc, decision);

    if (!decision.allowed) {
        co_await reject(make_blocked_response(decision.reason, req.version()));
        co_return;
    }

    // 유닉스 소켓 브리지는 플랫폼 전용 기능으로 이 프록시에서는 제공하지 않는다
    co_await reject(make_text_response(http::status::not_implemented, "unix sockets unsupported",
                                       req.version()));
}

auto HttpSession::handle_forward(RequestParser& parser) -> boost::asio::awaitable<bool>
{
    auto& req = parser.get();

    auto target = parse_forward_target(req);
    if (!target) {
        spdlog::debug("[http] session {}: {}", ctx_.session_id, target.error().message);
        co_await reject(make_text_response(http::status::bad_request, "bad request", req.version()));
        co_return false;
    }

    const std::string method{req.method_string().data(), req.method_string().size()};
    RequestDescriptor desc{
        .host     = target->authority.host,
        .port     = target->authority.port,
        .method   = method,
        .tls      = TlsHint::kPlain,
        .protocol = ProxyProtocol::kHttp,
    };

    const Decision decision = record(desc, co_await services_.policy->async_decide(desc, snapshot_));
    if (!decision.allowed) {
        co_await reject(make_blocked_response(decision.reason, req.version()));
        co_return false;
    }

    state_ = HttpSessionState::kForwarding;

    const std::string key = target->authority.host + ":" + std::to_string(target->authority.port);
    if (!upstream_ || key != upstream_key_) {
        upstream_.reset();
        upstream_buffer_.clear();

        auto connected = co_await connect_upstream(target->authority.host, target->authority.port,
                                                   services_.timeouts.idle);
        if (!connected) {
            spdlog::warn("[http] session {}: upstream {} failed: {}",
                         ctx_.session_id, key, connected.error().message());
            if (services_.stats) {
                services_.stats->on_upstream_error();
            }
            co_await reject(make_text_response(http::status::bad_gateway, "upstream failure",
                                               req.version()));
            co_return false;
        }
        upstream_.emplace(std::move(*connected));
        upstream_key_ = key;
    }

    req.target(target->origin_form);
    req.set(http::field::host,
            format_authority(target->authority.host, target->authority.port, kDefaultHttpPort));

    const auto result = co_await relay_exchange(client_, client_buffer_, parser, *upstream_,
                                                upstream_buffer_, services_.timeouts.idle);
    if (result.client_closed) {
        spdlog::debug("[http] session {}: client left while waiting for {}", ctx_.session_id, key);
        upstream_.reset();
        upstream_key_.clear();
        co_return false;
    }
    if (result.upstream_failed) {
        spdlog::warn("[http] session {}: upstream {} exchange failed: {}",
                     ctx_.session_id, key, result.ec.message());
        if (services_.stats) {
            services_.stats->on_upstream_error();
        }
        upstream_.reset();
        upstream_key_.clear();
        co_await reject(make_text_response(http::status::bad_gateway, "upstream failure"));
        co_return false;
    }

    if (!result.upstream_reusable) {
        upstream_.reset();
        upstream_key_.clear();
    }
    co_return !result.ec && result.keep_alive;
}

auto HttpSession::handle_connect(RequestParser& parser) -> boost::asio::awaitable<void>
{
    auto& req = parser.get();
    const std::string_view raw_target{req.target().data(), req.target().size()};

    auto authority = split_authority(raw_target, kDefaultHttpsPort);
    if (!authority) {
        co_await reject(make_text_response(http::status::bad_request, "bad request", req.version()));
        co_return;
    }

    RequestDescriptor desc{
        .host     = authority->host,
        .port     = authority->port,
        .method   = std::nullopt,
        .tls      = TlsHint::kTls,
        .protocol = ProxyProtocol::kHttpConnect,
    };

    Decision verdict = co_await services_.policy->async_decide(desc, snapshot_);

    // Limited 모드의 CONNECT 허용은 MITM 검사를 전제로 한다. 발급기가 없으면 차단.
    if (verdict.allowed && snapshot_->mode() == NetworkMode::kLimited && !services_.issuer) {
        verdict.allowed = false;
        verdict.reason  = BlockReason::kMitmRequired;
    }

    const Decision decision = record(desc, verdict);
    if (!decision.allowed) {
        co_await reject(make_blocked_response(decision.reason, req.version()));
        co_return;
    }

    state_ = HttpSessionState::kTunnelEstablishing;
    boost::system::error_code ec;

    // MITM: 정책 스냅샷과 발급기 모두 활성일 때만
    if (snapshot_->config.mitm.enabled && services_.issuer) {
        client_.expires_after(services_.timeouts.idle);
        co_await boost::asio::async_write(
            client_, boost::asio::buffer(kConnectEstablished.data(), kConnectEstablished.size()),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return;
        }
        MitmInterceptor interceptor{ctx_, *authority, snapshot_, services_};
        co_await interceptor.run(client_, client_buffer_);
        co_return;
    }

    auto connected = co_await connect_upstream(authority->host, authority->port,
                                               services_.timeouts.idle);
    if (!connected) {
        spdlog::warn("[http] session {}: CONNECT {}:{} failed: {}",
                     ctx_.session_id, authority->host, authority->port, connected.error().message());
        if (services_.stats) {
            services_.stats->on_upstream_error();
        }
        co_await reject(make_text_response(http::status::bad_gateway, "upstream failure",
                                           req.version()));
        co_return;
    }
    upstream_.emplace(std::move(*connected));

    client_.expires_after(services_.timeouts.idle);
    co_await boost::asio::async_write(
        client_, boost::asio::buffer(kConnectEstablished.data(), kConnectEstablished.size()),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        co_return;
    }

    // CONNECT 헤더 뒤에 이미 받은 바이트를 먼저 업스트림으로
    if (client_buffer_.size() > 0) {
        upstream_->expires_after(services_.timeouts.idle);
        co_await boost::asio::async_write(*upstream_, client_buffer_.data(),
                                          boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return;
        }
        client_buffer_.consume(client_buffer_.size());
    }

    // 터널은 소켓 단위로 자체 타임아웃을 관리한다
    client_.expires_never();
    upstream_->expires_never();
    const auto stats = co_await run_tunnel(
        client_.socket(), upstream_->socket(),
        TunnelTimeouts{.idle = services_.timeouts.idle, .half_close = services_.timeouts.half_close});
    spdlog::debug("[http] session {}: tunnel {}:{} closed (up {} bytes, down {} bytes{})",
                  ctx_.session_id, authority->host, authority->port, stats.bytes_up, stats.bytes_down,
                  stats.timed_out ? ", timed out" : "");
}

void HttpSession::close()
{
    if (closing_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    boost::system::error_code ignored;
    client_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    client_.close();
    if (upstream_) {
        upstream_->close();
    }
}
