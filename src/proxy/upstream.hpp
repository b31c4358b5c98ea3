#pragma once

// ---------------------------------------------------------------------------
// upstream.hpp
//
// 업스트림(목적지) TCP 연결 수립.
// 호스트명은 asio resolver 로 조회하고 결과 주소를 순서대로 시도한다.
// 조회와 연결을 합쳐 timeout 안에 끝나지 않으면 beast::error::timeout.
//
// [주의]
// 정책 판정(async_decide)의 DNS 조회와 여기서의 조회는 별개다.
// 두 조회 사이의 응답 변화(DNS rebinding)는 막지 못한다.
// ---------------------------------------------------------------------------

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

[[nodiscard]] auto connect_upstream(std::string host, std::uint16_t port,
                                    std::chrono::steady_clock::duration timeout)
    -> boost::asio::awaitable<std::expected<boost::beast::tcp_stream, boost::system::error_code>>;
