#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ProxyProtocol
//   요청이 어느 프런트엔드 경로로 들어왔는지 나타낸다.
//   감사 로그 / 차단 로그 / 통계 분류에 공통으로 사용한다.
//
//   kHttp        : 평문 HTTP forward 요청
//   kHttpConnect : HTTP CONNECT 터널 요청
//   kHttpsMitm   : MITM 으로 복호화된 터널 내부 요청
//   kSocks5      : SOCKS5 CONNECT
// ---------------------------------------------------------------------------
enum class ProxyProtocol : std::uint8_t {
    kHttp        = 0,
    kHttpConnect = 1,
    kHttpsMitm   = 2,
    kSocks5      = 3,
};

[[nodiscard]] constexpr auto to_string(ProxyProtocol protocol) noexcept -> std::string_view
{
    switch (protocol) {
        case ProxyProtocol::kHttp:        return "http";
        case ProxyProtocol::kHttpConnect: return "http-connect";
        case ProxyProtocol::kHttpsMitm:   return "https-mitm";
        case ProxyProtocol::kSocks5:      return "socks5";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// ConnectionContext
//   클라이언트 연결 하나를 식별하는 불변 컨텍스트.
//   proxy 레이어가 생성하고 policy/logger/mitm 레이어에 const-ref 로 전달한다.
// ---------------------------------------------------------------------------
struct ConnectionContext {
    std::uint64_t session_id{0};           // 프로세스 범위 내 유일 세션 ID
    std::string   client_ip{};             // 클라이언트 IPv4/IPv6 주소 문자열
    std::uint16_t client_port{0};          // 클라이언트 TCP 포트
    ProxyProtocol protocol{ProxyProtocol::kHttp};
    std::chrono::system_clock::time_point connected_at{};  // 연결 수립 시각
};

// ---------------------------------------------------------------------------
// ProtocolErrorCode
//   와이어 프로토콜(HTTP 요청 라인, SOCKS5 핸드셰이크 등) 파싱 오류 분류.
// ---------------------------------------------------------------------------
enum class ProtocolErrorCode : std::uint8_t {
    kMalformedMessage   = 0,  // 메시지 구조가 올바르지 않음
    kUnsupportedVersion = 1,  // 지원하지 않는 프로토콜 버전
    kUnsupportedCommand = 2,  // 지원하지 않는 커맨드 (예: SOCKS5 BIND)
    kUnsupportedAddress = 3,  // 지원하지 않는 주소 타입
    kInvalidTarget      = 4,  // host:port 형식 오류
};

// ---------------------------------------------------------------------------
// ProtocolError
//   파싱 실패 시 반환되는 오류 정보.
//   std::expected<T, ProtocolError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct ProtocolError {
    ProtocolErrorCode code{ProtocolErrorCode::kMalformedMessage};
    std::string       message{};  // 사람이 읽을 수 있는 오류 설명
    std::string       context{};  // 오류가 발생한 위치/입력 단편 (로깅용)
};
