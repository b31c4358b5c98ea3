#pragma once

// ---------------------------------------------------------------------------
// http_relay.hpp
//
// 평문 forward 경로와 MITM 터널 내부 경로가 공유하는 HTTP/1.1 릴레이.
// 스트림 타입(tcp::socket / ssl::stream)에 무관하도록 템플릿으로 구현한다.
//
// [스트리밍]
// 본문은 buffer_body 로 고정 크기 청크 단위 전달한다. 메시지 전체를
// 메모리에 올리지 않으며 청크 인코딩은 serializer 가 다시 만든다.
//
// [순서 보장]
// relay_exchange 는 요청 1건의 요청 본문 → 응답 헤더 → 응답 본문을
// 순서대로 끝낸 뒤 반환한다. keep-alive 연결의 다음 요청은 그 이후에 읽는다.
//
// [타임아웃]
// 두 스트림의 최하위 계층은 beast::tcp_stream 이어야 한다. 읽기/쓰기 1회마다
// expires_after(idle) 을 다시 건다. 응답 헤더를 기다리는 동안 클라이언트 소켓을
// 감시하여 클라이언트가 끊으면 업스트림 읽기를 취소한다.
// ---------------------------------------------------------------------------

#include "http/http_util.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/write.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

inline constexpr std::size_t kRelayChunkSize = 16 * 1024;

// ---------------------------------------------------------------------------
// ExchangeResult
//   upstream_failed : 응답 헤더를 받기 전에 업스트림 쪽이 실패함
//                     (호출자가 502 를 보낼 수 있는 상태)
//   keep_alive      : 클라이언트 연결에서 다음 요청을 읽어도 되는가
//   upstream_reusable: 같은 업스트림 연결을 다음 요청에 재사용해도 되는가
//   client_closed   : 응답 헤더 대기 중 클라이언트가 끊음 (응답을 보낼 곳이 없음)
// ---------------------------------------------------------------------------
struct ExchangeResult {
    boost::system::error_code ec{};
    bool                      upstream_failed{false};
    bool                      client_closed{false};
    unsigned                  status{0};
    std::size_t               request_bytes{0};
    std::size_t               response_bytes{0};
    bool                      keep_alive{false};
    bool                      upstream_reusable{false};
};

// ---------------------------------------------------------------------------
// relay_message
//   헤더를 이미 읽은 parser 의 메시지를 output 으로 전송하면서 나머지
//   본문을 input 에서 읽어 그대로 흘려보낸다. 헤더는 호출 전에 수정해도 된다.
//   body_bytes 에 전달한 본문 바이트 수를 더한다.
// ---------------------------------------------------------------------------
template <bool isRequest, class OutStream, class InStream>
auto relay_message(OutStream&                                  output,
                   InStream&                                   input,
                   boost::beast::flat_buffer&                  input_buffer,
                   http::parser<isRequest, http::buffer_body>& parser,
                   std::size_t&                                body_bytes,
                   std::chrono::steady_clock::duration         idle)
    -> boost::asio::awaitable<boost::system::error_code>
{
    std::array<char, kRelayChunkSize> buf{};
    http::serializer<isRequest, http::buffer_body> sr{parser.get()};

    boost::system::error_code ec;
    do {
        auto& body = parser.get().body();
        if (!parser.is_done()) {
            body.data = buf.data();
            body.size = buf.size();
            boost::beast::get_lowest_layer(input).expires_after(idle);
            co_await http::async_read(input, input_buffer, parser,
                                      boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                co_return ec;
            }
            body.size = buf.size() - body.size;
            body.data = buf.data();
            body.more = !parser.is_done();
            body_bytes += body.size;
        } else {
            body.data = nullptr;
            body.size = 0;
            body.more = false;
        }

        boost::beast::get_lowest_layer(output).expires_after(idle);
        co_await http::async_write(output, sr,
                                   boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            co_return ec;
        }
    } while (!parser.is_done() || !sr.is_done());

    co_return ec;
}

// ---------------------------------------------------------------------------
// watch_for_close
//   소켓이 읽기 가능해질 때까지 기다린 뒤 1바이트를 엿본다.
//   EOF/오류이면 true. 데이터가 도착했거나 대기가 취소되면 false.
// ---------------------------------------------------------------------------
inline auto watch_for_close(boost::asio::ip::tcp::socket& socket) -> boost::asio::awaitable<bool>
{
    boost::system::error_code ec;
    co_await socket.async_wait(boost::asio::ip::tcp::socket::wait_read,
                               boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        co_return false;
    }
    std::array<char, 1> peeked{};
    const std::size_t n = socket.receive(boost::asio::buffer(peeked),
                                         boost::asio::socket_base::message_peek, ec);
    if (ec == boost::asio::error::would_block) {
        co_return false;
    }
    co_return ec || n == 0;
}

// ---------------------------------------------------------------------------
// relay_exchange
//   요청 1건을 upstream 으로 중계하고 응답을 client 로 돌려준다.
//
//   호출 전 요구사항: req_parser 의 헤더를 읽었고 target / Host 를 업스트림
//   기준으로 고쳐 두었다. hop-by-hop 제거와 Expect: 100-continue 응답은
//   여기서 처리한다.
// ---------------------------------------------------------------------------
template <class ClientStream, class UpstreamStream>
auto relay_exchange(ClientStream&                            client,
                    boost::beast::flat_buffer&               client_buffer,
                    http::request_parser<http::buffer_body>& req_parser,
                    UpstreamStream&                          upstream,
                    boost::beast::flat_buffer&               upstream_buffer,
                    std::chrono::steady_clock::duration      idle)
    -> boost::asio::awaitable<ExchangeResult>
{
    ExchangeResult result;
    auto& req = req_parser.get();

    const bool client_keep_alive = req.keep_alive();
    const bool is_head           = req.method() == http::verb::head;

    const auto expect = req[http::field::expect];
    const std::string_view expect_value{expect.data(), expect.size()};
    const bool expect_continue =
        expect_value.size() == 12 &&
        std::equal(expect_value.begin(), expect_value.end(), "100-continue",
                   [](unsigned char a, unsigned char b) { return std::tolower(a) == b; });

    strip_hop_by_hop(req);
    if (expect_continue) {
        req.erase(http::field::expect);
        static constexpr std::string_view kContinue = "HTTP/1.1 100 Continue\r\n\r\n";
        boost::beast::get_lowest_layer(client).expires_after(idle);
        co_await boost::asio::async_write(
            client, boost::asio::buffer(kContinue.data(), kContinue.size()),
            boost::asio::redirect_error(boost::asio::use_awaitable, result.ec));
        if (result.ec) {
            co_return result;
        }
    }

    // 요청 헤더 + 본문
    result.ec = co_await relay_message(upstream, client, client_buffer, req_parser,
                                       result.request_bytes, idle);
    if (result.ec) {
        result.upstream_failed = true;
        co_return result;
    }

    // 응답 헤더 대기 중 클라이언트 감시. 끊기면 업스트림 읽기를 취소한다.
    const auto executor       = co_await boost::asio::this_coro::executor;
    auto&      client_socket  = boost::beast::get_lowest_layer(client).socket();
    bool       client_closed  = false;
    bool       watch_running  = true;
    boost::asio::steady_timer watch_join{executor, boost::asio::steady_timer::time_point::max()};
    boost::asio::co_spawn(
        executor, watch_for_close(client_socket),
        [&](std::exception_ptr eptr, bool closed) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("[relay] client watch exception: {}", e.what());
                }
            } else if (closed) {
                client_closed = true;
                boost::beast::get_lowest_layer(upstream).cancel();
            }
            watch_running = false;
            watch_join.cancel();
        });

    // 응답 헤더 (101 이외의 1xx 는 버리고 다음 헤더를 읽는다)
    std::optional<http::response_parser<http::buffer_body>> res_parser;
    for (;;) {
        res_parser.emplace();
        res_parser->body_limit((std::numeric_limits<std::uint64_t>::max)());
        if (is_head) {
            res_parser->skip(true);
        }
        boost::beast::get_lowest_layer(upstream).expires_after(idle);
        co_await http::async_read_header(upstream, upstream_buffer, *res_parser,
                                         boost::asio::redirect_error(boost::asio::use_awaitable,
                                                                     result.ec));
        if (result.ec) {
            break;
        }
        const unsigned status = res_parser->get().result_int();
        if (status >= 100 && status < 200 && status != 101) {
            continue;
        }
        result.status = status;
        break;
    }

    if (watch_running) {
        boost::system::error_code ignored;
        client_socket.cancel(ignored);
        co_await watch_join.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ignored));
    }
    if (result.ec) {
        result.client_closed   = client_closed;
        result.upstream_failed = !client_closed;
        co_return result;
    }

    auto& res = res_parser->get();
    const bool upstream_keep_alive = res.keep_alive() && !res_parser->need_eof();
    result.keep_alive = client_keep_alive && upstream_keep_alive;

    strip_hop_by_hop(res);
    res.keep_alive(result.keep_alive);

    result.ec = co_await relay_message(client, upstream, upstream_buffer, *res_parser,
                                       result.response_bytes, idle);
    result.upstream_reusable = upstream_keep_alive && !result.ec;
    if (result.ec) {
        result.keep_alive = false;
    }
    co_return result;
}
