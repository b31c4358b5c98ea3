#pragma once

// ---------------------------------------------------------------------------
// listen_address.hpp
//
// 리스너 주소 파싱과 loopback 강제.
//
// [형식]
//   "127.0.0.1:3128", "[::1]:3128", "localhost:3128", "http://127.0.0.1:3128"
//   포트가 없거나 잘못되면 default_port, IP 가 아닌 호스트는 127.0.0.1 (경고).
//
// [clamp 규칙]
//   loopback 이 아닌 주소는 해당 리스너의 dangerously_allow_non_loopback
//   설정이 켜져 있지 않으면 127.0.0.1 로 바꾼다. force_loopback 이면
//   설정과 무관하게 바꾼다 (allow_unix_sockets 사용 시).
// ---------------------------------------------------------------------------

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <string_view>

[[nodiscard]] auto parse_listen_endpoint(std::string_view text, std::uint16_t default_port)
    -> boost::asio::ip::tcp::endpoint;

[[nodiscard]] auto clamp_listen_endpoint(const boost::asio::ip::tcp::endpoint& endpoint,
                                         bool                                  allow_non_loopback,
                                         bool                                  force_loopback,
                                         std::string_view                      listener_name)
    -> boost::asio::ip::tcp::endpoint;
