#pragma once

// ---------------------------------------------------------------------------
// socks5_codec.hpp
//
// SOCKS5 (RFC 1928) 핸드셰이크 메시지 디코더/인코더. 소켓 I/O 없음.
//
// [지원 범위]
// - 인증 방식: no-auth (0x00) 만. 제공되지 않으면 0xFF 로 거절.
// - 커맨드: CONNECT (0x01) 만. BIND/UDP ASSOCIATE 는 0x07.
// - 주소 타입: IPv4 (0x01), 도메인 (0x03), IPv6 (0x04). 그 외 0x08.
//
// [읽기 순서]
// 1. 인사말 2바이트 → decode_greeting_header() 로 METHODS 길이를 얻는다.
// 2. METHODS → select_method().
// 3. 요청 앞 5바이트 → remaining_request_bytes() 로 나머지 길이를 얻는다.
// 4. 전체 요청 → decode_request().
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

inline constexpr std::uint8_t kSocks5Version          = 0x05;
inline constexpr std::uint8_t kSocks5MethodNoAuth     = 0x00;
inline constexpr std::uint8_t kSocks5MethodNoneUsable = 0xFF;
inline constexpr std::uint8_t kSocks5CmdConnect       = 0x01;

inline constexpr std::size_t kSocks5GreetingHeaderSize = 2;
inline constexpr std::size_t kSocks5RequestPrefixSize  = 5;

enum class Socks5AddressType : std::uint8_t {
    kIPv4   = 0x01,
    kDomain = 0x03,
    kIPv6   = 0x04,
};

enum class Socks5Reply : std::uint8_t {
    kSucceeded               = 0x00,
    kGeneralFailure          = 0x01,
    kNotAllowed              = 0x02,  // 정책 차단
    kNetworkUnreachable      = 0x03,
    kHostUnreachable         = 0x04,
    kConnectionRefused       = 0x05,
    kTtlExpired              = 0x06,  // 연결 타임아웃에도 사용
    kCommandNotSupported     = 0x07,
    kAddressTypeNotSupported = 0x08,
};

struct Socks5Request {
    std::uint8_t      command{kSocks5CmdConnect};
    Socks5AddressType address_type{Socks5AddressType::kIPv4};
    std::string       host{};  // IPv6 는 대괄호 없는 문자열
    std::uint16_t     port{0};
};

// decode_greeting_header: VER, NMETHODS → NMETHODS (0 이면 오류)
[[nodiscard]] auto decode_greeting_header(std::span<const std::uint8_t> header)
    -> std::expected<std::size_t, ProtocolError>;

// select_method: no-auth 가 있으면 0x00, 없으면 0xFF
[[nodiscard]] std::uint8_t select_method(std::span<const std::uint8_t> methods) noexcept;

[[nodiscard]] std::array<std::uint8_t, 2> encode_method_selection(std::uint8_t method) noexcept;

// remaining_request_bytes
//   VER CMD RSV ATYP 와 주소 첫 바이트(5바이트)를 보고 나머지 바이트 수를 계산한다.
[[nodiscard]] auto remaining_request_bytes(std::span<const std::uint8_t> prefix)
    -> std::expected<std::size_t, ProtocolError>;

// decode_request: 요청 전체를 디코드한다. CONNECT 이외 커맨드는 kUnsupportedCommand.
[[nodiscard]] auto decode_request(std::span<const std::uint8_t> message)
    -> std::expected<Socks5Request, ProtocolError>;

// encode_reply: bound 가 IPv6 이면 ATYP 0x04, 아니면 0x01
[[nodiscard]] std::vector<std::uint8_t>
encode_reply(Socks5Reply reply, const boost::asio::ip::tcp::endpoint& bound = {});

// reply_for_error: 디코드 오류 → 응답 코드
[[nodiscard]] Socks5Reply reply_for_error(const ProtocolError& error) noexcept;

// reply_for_connect_error: 업스트림 연결/조회 오류 → 응답 코드
[[nodiscard]] Socks5Reply reply_for_connect_error(const boost::system::error_code& ec) noexcept;
