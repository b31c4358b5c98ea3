#include "mitm/mitm_interceptor.hpp"

#include "http/http_relay.hpp"
#include "policy/domain_matcher.hpp"
#include "proxy/upstream.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <openssl/ssl.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace {

namespace ssl = boost::asio::ssl;

constexpr unsigned char kAlpnHttp11[] = {8, 'h', 't', 't', 'p', '/', '1', '.', '1'};

constexpr auto kShutdownTimeout = std::chrono::seconds{2};

int select_alpn(SSL* /*ssl*/, const unsigned char** out, unsigned char* outlen,
                const unsigned char* in, unsigned int inlen, void* /*arg*/)
{
    unsigned char* selected = nullptr;
    if (SSL_select_next_proto(&selected, outlen, kAlpnHttp11, sizeof(kAlpnHttp11), in, inlen) ==
        OPENSSL_NPN_NEGOTIATED)
    {
        *out = selected;
        return SSL_TLSEXT_ERR_OK;
    }
    return SSL_TLSEXT_ERR_NOACK;
}

template <class Stream>
auto write_response(Stream& stream, http::response<http::string_body> res,
                    std::chrono::steady_clock::duration idle)
    -> boost::asio::awaitable<void>
{
    boost::system::error_code ec;
    boost::beast::get_lowest_layer(stream).expires_after(idle);
    co_await http::async_write(stream, res, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("[mitm] response write failed: {}", ec.message());
    }
}

bool is_clean_close(const boost::system::error_code& ec)
{
    return ec == http::error::end_of_stream || ec == boost::asio::error::eof ||
           ec == ssl::error::stream_truncated || ec == boost::asio::error::operation_aborted ||
           ec == boost::beast::error::timeout;
}

}  // namespace

auto make_server_context(const LeafCertificate& leaf)
    -> std::expected<std::shared_ptr<ssl::context>, std::string>
{
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_server);
    ctx->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                     ssl::context::no_sslv3 | ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1);

    SSL_CTX* native = ctx->native_handle();
    if (SSL_CTX_use_certificate(native, leaf.cert.get()) != 1 ||
        SSL_CTX_use_PrivateKey(native, leaf.key.get()) != 1)
    {
        return std::unexpected("server context setup failed: " + drain_ssl_errors());
    }
    SSL_CTX_set_alpn_select_cb(native, &select_alpn, nullptr);
    return ctx;
}

auto make_origin_context()
    -> std::expected<std::shared_ptr<ssl::context>, std::string>
{
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
    ctx->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                     ssl::context::no_sslv3 | ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1);

    boost::system::error_code ec;
    ctx->set_default_verify_paths(ec);
    if (ec) {
        return std::unexpected("cannot load system trust store: " + ec.message());
    }
    ctx->set_verify_mode(ssl::verify_peer);

    // SSL_CTX_set_alpn_protos 는 성공 시 0 을 반환한다
    if (SSL_CTX_set_alpn_protos(ctx->native_handle(), kAlpnHttp11, sizeof(kAlpnHttp11)) != 0) {
        return std::unexpected("ALPN setup failed: " + drain_ssl_errors());
    }
    return ctx;
}

MitmInterceptor::MitmInterceptor(ConnectionContext                     ctx,
                                 Authority                             target,
                                 std::shared_ptr<const PolicySnapshot> snapshot,
                                 SessionServices                       services)
    : ctx_{std::move(ctx)}
    , target_{std::move(target)}
    , snapshot_{std::move(snapshot)}
    , services_{std::move(services)}
{}

auto MitmInterceptor::connect_origin()
    -> boost::asio::awaitable<std::expected<std::unique_ptr<OriginStream>, std::string>>
{
    if (!origin_ctx_) {
        origin_ctx_ = services_.origin_tls;
    }
    if (!origin_ctx_) {
        auto ctx = make_origin_context();
        if (!ctx) {
            co_return std::unexpected(ctx.error());
        }
        origin_ctx_ = std::move(*ctx);
    }

    auto tcp = co_await connect_upstream(target_.host, target_.port, services_.timeouts.idle);
    if (!tcp) {
        co_return std::unexpected("connect: " + tcp.error().message());
    }

    auto stream = std::make_unique<OriginStream>(std::move(*tcp), *origin_ctx_);
    if (!is_ip_literal(target_.host) &&
        SSL_set_tlsext_host_name(stream->native_handle(), target_.host.c_str()) != 1)
    {
        co_return std::unexpected("SNI setup failed: " + drain_ssl_errors());
    }
    stream->set_verify_mode(ssl::verify_peer);
    stream->set_verify_callback(ssl::host_name_verification(target_.host));

    boost::system::error_code ec;
    boost::beast::get_lowest_layer(*stream).expires_after(services_.timeouts.idle);
    co_await stream->async_handshake(ssl::stream_base::client,
                                     boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected("TLS handshake: " + ec.message());
    }
    co_return std::move(stream);
}

auto MitmInterceptor::run(boost::beast::tcp_stream& client, boost::beast::flat_buffer& client_buffer)
    -> boost::asio::awaitable<void>
{
    // 1. leaf 인증서
    auto leaf = services_.issuer->issue(target_.host);
    if (!leaf) {
        spdlog::warn("[mitm] session {}: {}", ctx_.session_id, leaf.error());
        co_return;
    }
    auto server_ctx = make_server_context(**leaf);
    if (!server_ctx) {
        spdlog::warn("[mitm] session {}: {}", ctx_.session_id, server_ctx.error());
        co_return;
    }

    // 2. 클라이언트측 TLS. CONNECT 뒤에 이미 받은 바이트를 핸드셰이크에 넣는다.
    const auto idle = services_.timeouts.idle;
    ssl::stream<boost::beast::tcp_stream&> tls{client, **server_ctx};
    boost::system::error_code ec;
    client.expires_after(idle);
    const std::size_t used = co_await tls.async_handshake(
        ssl::stream_base::server, client_buffer.data(),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("[mitm] session {}: client handshake for {} failed: {}",
                      ctx_.session_id, target_.host, ec.message());
        co_return;
    }
    client_buffer.consume(used);

    const auto& mitm_cfg = snapshot_->config.mitm;
    const std::string target_host = normalize_host(target_.host);

    boost::beast::flat_buffer     tls_buffer;
    boost::beast::flat_buffer     origin_buffer;
    std::unique_ptr<OriginStream> origin;

    // 3. 요청 루프
    for (;;) {
        http::request_parser<http::buffer_body> parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

        client.expires_after(idle);
        co_await http::async_read_header(tls, tls_buffer, parser,
                                         boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            if (!is_clean_close(ec)) {
                spdlog::debug("[mitm] session {}: bad request: {}", ctx_.session_id, ec.message());
                co_await write_response(tls, make_text_response(http::status::bad_request, "bad request"),
                                        idle);
            }
            break;
        }

        auto& req = parser.get();
        if (req.method() == http::verb::connect) {
            co_await write_response(tls, make_text_response(http::status::method_not_allowed,
                                                            "CONNECT not supported inside MITM",
                                                            req.version()),
                                    idle);
            break;
        }

        const std::string_view raw_target{req.target().data(), req.target().size()};
        auto origin_target = parse_origin_target(raw_target, kDefaultHttpsPort);
        if (!origin_target) {
            co_await write_response(tls, make_text_response(http::status::bad_request, "bad request",
                                                            req.version()),
                                    idle);
            break;
        }

        // Host 헤더(또는 absolute-form authority)는 CONNECT 대상과 같아야 한다
        std::optional<Authority> claimed = origin_target->authority;
        if (!claimed) {
            const auto host_it = req.find(http::field::host);
            if (host_it != req.end()) {
                auto parsed = split_authority(
                    std::string_view{host_it->value().data(), host_it->value().size()},
                    target_.port);
                if (!parsed) {
                    co_await write_response(tls, make_text_response(http::status::bad_request,
                                                                    "host mismatch", req.version()),
                                            idle);
                    break;
                }
                claimed = std::move(*parsed);
            }
        }
        if (claimed && (normalize_host(claimed->host) != target_host || claimed->port != target_.port)) {
            spdlog::warn("[mitm] session {}: host mismatch (tunnel {}, request {})",
                         ctx_.session_id, target_.host, claimed->host);
            co_await write_response(tls, make_text_response(http::status::bad_request,
                                                            "host mismatch", req.version()),
                                    idle);
            break;
        }

        // 연결에 고정된 스냅샷으로 재판정
        const std::string method{req.method_string().data(), req.method_string().size()};
        RequestDescriptor desc{
            .host     = target_.host,
            .port     = target_.port,
            .method   = method,
            .tls      = TlsHint::kTls,
            .protocol = ProxyProtocol::kHttpsMitm,
        };
        const Decision decision = co_await services_.policy->async_decide(desc, snapshot_);
        record_decision(services_, ctx_, desc, decision, snapshot_->mode());
        if (!decision.allowed) {
            co_await write_response(tls, make_blocked_response(decision.reason, req.version()), idle);
            break;
        }

        if (!origin) {
            auto connected = co_await connect_origin();
            if (!connected) {
                spdlog::warn("[mitm] session {}: origin {}:{} failed: {}",
                             ctx_.session_id, target_.host, target_.port, connected.error());
                if (services_.stats) {
                    services_.stats->on_upstream_error();
                }
                co_await write_response(tls, make_text_response(http::status::bad_gateway,
                                                                "mitm upstream error", req.version()),
                                        idle);
                break;
            }
            origin = std::move(*connected);
            origin_buffer.clear();
        }

        const std::string path = origin_target->origin_form;
        req.target(path);
        req.set(http::field::host, format_authority(target_.host, target_.port, kDefaultHttpsPort));

        const auto result = co_await relay_exchange(tls, tls_buffer, parser, *origin, origin_buffer, idle);
        if (result.client_closed) {
            break;
        }
        if (result.upstream_failed) {
            if (services_.stats) {
                services_.stats->on_upstream_error();
            }
            spdlog::warn("[mitm] session {}: origin exchange failed: {}",
                         ctx_.session_id, result.ec.message());
            co_await write_response(tls, make_text_response(http::status::bad_gateway,
                                                            "mitm upstream error"),
                                    idle);
            break;
        }

        if (mitm_cfg.inspect && services_.logger) {
            const auto cap = mitm_cfg.max_body_bytes;
            services_.logger->log_inspect(InspectLog{
                .session_id         = ctx_.session_id,
                .host               = target_.host,
                .method             = method,
                .path               = path,
                .status             = result.status,
                .request_bytes      = std::min(result.request_bytes, cap),
                .response_bytes     = std::min(result.response_bytes, cap),
                .request_truncated  = result.request_bytes > cap,
                .response_truncated = result.response_bytes > cap,
                .timestamp          = std::chrono::system_clock::now(),
            });
        }

        if (!result.upstream_reusable) {
            origin.reset();
        }
        if (result.ec || !result.keep_alive) {
            break;
        }
    }

    // close_notify 교환. 응답 없는 클라이언트는 타임아웃으로 끊는다.
    client.expires_after(kShutdownTimeout);
    co_await tls.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
}
