#pragma once

// ---------------------------------------------------------------------------
// http_util.hpp
//
// HTTP 프런트엔드와 MITM 인터셉터가 공유하는 순수 헬퍼 (소켓 I/O 없음).
//
// - authority("host:port") 분해 / 조립
// - forward 요청의 대상 추출 (absolute-form URI 또는 Host 헤더)
// - hop-by-hop 헤더 제거
// - 차단/오류 응답 생성
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "policy/policy_engine.hpp"
#include "policy/rule.hpp"

#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace http = boost::beast::http;

inline constexpr std::uint16_t kDefaultHttpPort  = 80;
inline constexpr std::uint16_t kDefaultHttpsPort = 443;

// 응답 헤더 이름. 값은 to_string(BlockReason) 과 같다.
inline constexpr std::string_view kProxyErrorHeader = "x-proxy-error";
inline constexpr std::string_view kUnixSocketHeader = "x-unix-socket";

// ---------------------------------------------------------------------------
// Authority
//   host 는 대괄호를 제거한 원문 (정규화는 정책 엔진이 수행).
// ---------------------------------------------------------------------------
struct Authority {
    std::string   host{};
    std::uint16_t port{0};
};

// ---------------------------------------------------------------------------
// ForwardTarget
//   평문 forward 요청의 목적지와 업스트림으로 보낼 origin-form 대상.
// ---------------------------------------------------------------------------
struct ForwardTarget {
    Authority   authority{};
    std::string origin_form{"/"};  // "/path?query"
};

// split_authority
//   "host", "host:port", "[v6]", "[v6]:port" 를 분해한다.
//   포트가 없으면 default_port. 빈 호스트나 잘못된 포트는 kInvalidTarget.
[[nodiscard]] auto split_authority(std::string_view authority, std::uint16_t default_port)
    -> std::expected<Authority, ProtocolError>;

// format_authority
//   Host 헤더 값을 만든다. port == default_port 이면 포트를 생략하고
//   IPv6 리터럴은 대괄호로 감싼다.
[[nodiscard]] std::string format_authority(std::string_view host,
                                           std::uint16_t    port,
                                           std::uint16_t    default_port);

// parse_forward_target
//   absolute-form ("http://host[:port]/path") 이면 URI 에서, origin-form
//   ("/path") 이면 Host 헤더에서 목적지를 얻는다. http 이외의 스킴은 거부한다.
[[nodiscard]] auto parse_forward_target(const http::request_header<>& req)
    -> std::expected<ForwardTarget, ProtocolError>;

// parse_origin_target
//   MITM 터널 내부 요청용. 요청 대상이 absolute-form 이면 경로만 남기고
//   URI 의 authority 를 함께 돌려준다 (없으면 std::nullopt).
struct OriginTarget {
    std::optional<Authority> authority{};
    std::string              origin_form{"/"};
};
[[nodiscard]] auto parse_origin_target(std::string_view target, std::uint16_t default_port)
    -> std::expected<OriginTarget, ProtocolError>;

// strip_hop_by_hop
//   connection, proxy-connection, keep-alive, proxy-authenticate,
//   proxy-authorization, te, trailer, upgrade, x-unix-socket 와 Connection
//   헤더가 지명한 필드를 제거한다. Content-Length / Transfer-Encoding 은
//   프레이밍에 필요하므로 유지한다.
void strip_hop_by_hop(http::fields& fields);

// unix_socket_path: x-unix-socket 헤더 값 (없거나 비어 있으면 std::nullopt)
[[nodiscard]] std::optional<std::string> unix_socket_path(const http::fields& fields);

// unix_socket_allowed: allow_unix_sockets 에 정확히 등재된 경로인가
[[nodiscard]] bool unix_socket_allowed(const PolicyConfig& policy, std::string_view path);

// make_text_response
//   text/plain 본문 + Connection: close 응답.
[[nodiscard]] http::response<http::string_body>
make_text_response(http::status status, std::string_view body, unsigned version = 11);

// make_blocked_response
//   403 + x-proxy-error: <reason>, 본문은 reason 문자열.
[[nodiscard]] http::response<http::string_body>
make_blocked_response(BlockReason reason, unsigned version = 11);

// is_ip_literal: 대괄호 없는 IPv4/IPv6 리터럴인가
[[nodiscard]] bool is_ip_literal(std::string_view host);
