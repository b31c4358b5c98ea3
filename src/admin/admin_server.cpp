#include "admin/admin_server.hpp"

#include "common/json_util.hpp"
#include "stats/stats_collector.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <exception>

// ---------------------------------------------------------------------------
// AdminServer 구현
//
// handle() 이 라우팅의 전부이며 소켓 경로(handle_connection)는
// Beast 로 요청을 읽어 handle() 결과를 그대로 직렬화한다.
// ---------------------------------------------------------------------------

namespace {

namespace http = boost::beast::http;

constexpr std::size_t kMaxAdminBodyBytes = 64 * 1024;

AdminResponse json_error(unsigned status, std::string_view message)
{
    return AdminResponse{
        .status = status,
        .body   = fmt::format(R"({{"error":"{}"}})", json_escape(message)),
    };
}

std::string bool_str(bool v) { return v ? "true" : "false"; }

}  // namespace

AdminServer::AdminServer(boost::asio::ip::tcp::endpoint     endpoint,
                         std::shared_ptr<PolicyEngine>      policy,
                         std::shared_ptr<StatsCollector>    stats,
                         std::shared_ptr<BlockedRequestLog> blocked,
                         ReloadCallback                     on_reload,
                         boost::asio::io_context&           io_context)
    : acceptor_{io_context, endpoint}
    , policy_{std::move(policy)}
    , stats_{std::move(stats)}
    , blocked_{std::move(blocked)}
    , on_reload_{std::move(on_reload)}
    , io_context_{io_context}
{}

// ---------------------------------------------------------------------------
// 라우팅
// ---------------------------------------------------------------------------
AdminResponse AdminServer::handle(std::string_view method,
                                  std::string_view target,
                                  std::string_view body)
{
    const std::string_view path = target.substr(0, target.find('?'));

    const bool get  = method == "GET";
    const bool post = method == "POST";

    if (path == "/health")   { return get ? health()   : json_error(405, "method not allowed"); }
    if (path == "/config")   { return get ? config()   : json_error(405, "method not allowed"); }
    if (path == "/patterns") { return get ? patterns() : json_error(405, "method not allowed"); }
    if (path == "/blocked")  { return get ? blocked()  : json_error(405, "method not allowed"); }
    if (path == "/stats")    { return get ? stats()    : json_error(405, "method not allowed"); }
    if (path == "/mode")     { return post ? set_mode(body) : json_error(405, "method not allowed"); }
    if (path == "/reload")   { return post ? reload()  : json_error(405, "method not allowed"); }

    return json_error(404, "not found");
}

AdminResponse AdminServer::health() const
{
    if (status_ == HealthStatus::kHealthy) {
        return AdminResponse{.status = 200, .body = R"({"status":"ok"})"};
    }
    const std::string reason = unhealthy_reason_.empty() ? "service unavailable" : unhealthy_reason_;
    return AdminResponse{
        .status = 503,
        .body   = fmt::format(R"({{"status":"unhealthy","reason":"{}"}})", json_escape(reason)),
    };
}

AdminResponse AdminServer::config() const
{
    const auto snap = policy_->snapshot();
    const auto& cfg = snap->config;

    return AdminResponse{
        .status = 200,
        .body   = fmt::format(
            R"({{"generation":{},"mode":"{}",)"
            R"("policy":{{"allowed_domains":{},"denied_domains":{},"allow_local_binding":{},"allow_unix_sockets":{}}},)"
            R"("mitm":{{"enabled":{},"inspect":{},"max_body_bytes":{},"ca_cert_path":"{}","ca_key_path":"{}","leaf_validity_hours":{}}}}})",
            snap->generation, to_string(cfg.mode),
            json_string_array(cfg.policy.allowed_domains),
            json_string_array(cfg.policy.denied_domains),
            bool_str(cfg.policy.allow_local_binding),
            json_string_array(cfg.policy.allow_unix_sockets),
            bool_str(cfg.mitm.enabled), bool_str(cfg.mitm.inspect), cfg.mitm.max_body_bytes,
            json_escape(cfg.mitm.ca_cert_path), json_escape(cfg.mitm.ca_key_path),
            cfg.mitm.leaf_validity_hours),
    };
}

AdminResponse AdminServer::patterns() const
{
    const auto snap = policy_->snapshot();
    return AdminResponse{
        .status = 200,
        .body   = fmt::format(R"({{"allowed":{},"denied":{}}})",
                              json_string_array(snap->allowed.patterns()),
                              json_string_array(snap->denied.patterns())),
    };
}

AdminResponse AdminServer::blocked() const
{
    std::string body{"["};
    bool first = true;
    for (const auto& entry : blocked_->recent()) {
        if (!first) {
            body += ',';
        }
        first = false;

        const std::string method =
            entry.method ? "\"" + json_escape(*entry.method) + "\"" : std::string{"null"};
        body += fmt::format(
            R"({{"host":"{}","reason":"{}","client":"{}","method":{},"mode":"{}","protocol":"{}","ts":{}}})",
            json_escape(entry.host), json_escape(entry.reason), json_escape(entry.client), method,
            json_escape(entry.mode), json_escape(entry.protocol), entry.timestamp);
    }
    body += ']';
    return AdminResponse{.status = 200, .body = std::move(body)};
}

AdminResponse AdminServer::stats() const
{
    const auto s = stats_->snapshot();
    return AdminResponse{
        .status = 200,
        .body   = fmt::format(
            R"({{"total_connections":{},"active_sessions":{},"total_requests":{},"blocked_requests":{},)"
            R"("upstream_errors":{},"http_requests":{},"connect_requests":{},"mitm_requests":{},)"
            R"("socks5_requests":{},"rps":{:.3f},"block_rate":{:.4f},"captured_at":"{}"}})",
            s.total_connections, s.active_sessions, s.total_requests, s.blocked_requests,
            s.upstream_errors, s.http_requests, s.connect_requests, s.mitm_requests,
            s.socks5_requests, s.rps, s.block_rate, format_iso8601(s.captured_at)),
    };
}

AdminResponse AdminServer::set_mode(std::string_view body)
{
    if (body.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return json_error(400, "missing body");
    }
    if (!json_is_object(body)) {
        return json_error(400, "invalid json");
    }
    const auto value = json_string_field(body, "mode");
    const auto mode  = value ? parse_network_mode(*value) : std::nullopt;
    if (!mode) {
        return json_error(400, "invalid mode");
    }

    const auto generation = policy_->set_mode(*mode);
    spdlog::info("[admin] mode set to {} (generation {})", to_string(*mode), generation);
    return AdminResponse{
        .status = 200,
        .body   = fmt::format(R"({{"status":"ok","mode":"{}"}})", to_string(*mode)),
    };
}

AdminResponse AdminServer::reload()
{
    if (!on_reload_) {
        return json_error(500, "reload failed");
    }
    const auto result = on_reload_();
    if (!result) {
        spdlog::warn("[admin] reload failed: {}", result.error());
        return AdminResponse{
            .status = 500,
            .body   = fmt::format(R"({{"error":"reload failed","detail":"{}"}})",
                                  json_escape(result.error())),
        };
    }
    return AdminResponse{
        .status = 200,
        .body   = fmt::format(R"({{"status":"reloaded","generation":{}}})", *result),
    };
}

// ---------------------------------------------------------------------------
// 소켓 경로
// ---------------------------------------------------------------------------
auto AdminServer::handle_connection(boost::asio::ip::tcp::socket socket)
    -> boost::asio::awaitable<void>
{
    boost::beast::flat_buffer               buffer;
    http::request_parser<http::string_body> parser;
    parser.body_limit(kMaxAdminBodyBytes);

    boost::system::error_code ec;
    co_await http::async_read(socket, buffer, parser,
                              boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    AdminResponse result;
    unsigned      version = 11;
    if (ec) {
        if (ec == http::error::end_of_stream) {
            co_return;
        }
        spdlog::debug("[admin] read error: {}", ec.message());
        result = json_error(400, "bad request");
    } else {
        const auto& req = parser.get();
        version = req.version();
        result  = handle(std::string_view{req.method_string().data(), req.method_string().size()},
                         std::string_view{req.target().data(), req.target().size()},
                         req.body());
    }

    http::response<http::string_body> res;
    res.version(version);
    res.result(result.status);
    res.set(http::field::content_type, "application/json");
    res.body() = std::move(result.body);
    res.keep_alive(false);
    res.prepare_payload();

    co_await http::async_write(socket, res, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("[admin] write error: {}", ec.message());
    }

    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

auto AdminServer::run() -> boost::asio::awaitable<void>
{
    spdlog::info("[admin] listening on {}:{}",
                 acceptor_.local_endpoint().address().to_string(), acceptor_.local_endpoint().port());

    while (true) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_.async_accept(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) {
            if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
                spdlog::info("[admin] acceptor closed, stopping");
                break;
            }
            spdlog::warn("[admin] accept error: {}", ec.message());
            continue;
        }

        boost::asio::co_spawn(
            io_context_,
            handle_connection(std::move(socket)),
            [](std::exception_ptr eptr) {
                if (eptr) {
                    try { std::rethrow_exception(eptr); }
                    catch (const std::exception& e) {
                        spdlog::error("[admin] connection error: {}", e.what());
                    }
                }
            });
    }
}

void AdminServer::stop()
{
    boost::system::error_code ec;
    acceptor_.close(ec);
}

void AdminServer::set_unhealthy(std::string_view reason)
{
    unhealthy_reason_ = std::string{reason};
    status_ = HealthStatus::kUnhealthy;
}

void AdminServer::set_healthy()
{
    unhealthy_reason_.clear();
    status_ = HealthStatus::kHealthy;
}

auto AdminServer::status() const noexcept -> HealthStatus
{
    return status_;
}

auto AdminServer::local_endpoint() const -> boost::asio::ip::tcp::endpoint
{
    return acceptor_.local_endpoint();
}
