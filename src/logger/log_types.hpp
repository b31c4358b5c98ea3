#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - policy_engine.hpp 를 include 하지 않는다.
// - reason / mode / protocol 은 호출자가 to_string() 으로 변환한 문자열을 넣는다.
//
// [민감정보 취급 주의]
// - path 는 쿼리 문자열을 포함할 수 있다. 토큰이 URL 에 실리는 경우
//   운영 환경에서 inspect 로그 레벨을 조정할 것.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// ConnectionLog
//   클라이언트 연결/해제 이벤트 로그.
//   event: "connect" | "disconnect"
// ---------------------------------------------------------------------------
struct ConnectionLog {
    std::uint64_t                              session_id{0};
    std::string                                event{};        // "connect" | "disconnect"
    std::string                                protocol{};     // "http" | "socks5"
    std::string                                client_ip{};
    std::uint16_t                              client_port{0};
    std::chrono::system_clock::time_point      timestamp{};
};

// ---------------------------------------------------------------------------
// RequestLog
//   허용된 요청 감사 로그. method 는 CONNECT/SOCKS5 경로에서 비어 있다.
// ---------------------------------------------------------------------------
struct RequestLog {
    std::uint64_t                              session_id{0};
    std::string                                client_ip{};
    std::string                                host{};
    std::uint16_t                              port{0};
    std::string                                method{};
    std::string                                protocol{};
    std::uint64_t                              generation{0};  // 판정에 사용된 정책 세대
    std::chrono::system_clock::time_point      timestamp{};
};

// ---------------------------------------------------------------------------
// BlockLog
//   차단 이벤트 로그. reason 은 x-proxy-error 와 동일한 값.
// ---------------------------------------------------------------------------
struct BlockLog {
    std::uint64_t                              session_id{0};
    std::string                                client_ip{};
    std::string                                host{};
    std::uint16_t                              port{0};
    std::string                                method{};
    std::string                                protocol{};
    std::string                                mode{};
    std::string                                reason{};
    std::uint64_t                              generation{0};
    std::chrono::system_clock::time_point      timestamp{};
};

// ---------------------------------------------------------------------------
// InspectLog
//   MITM inspect 모드의 요청/응답 크기 로그.
//   *_bytes 는 max_body_bytes 로 상한 처리되며 truncated 로 초과 여부를 표시.
// ---------------------------------------------------------------------------
struct InspectLog {
    std::uint64_t                              session_id{0};
    std::string                                host{};
    std::string                                method{};
    std::string                                path{};
    unsigned                                   status{0};
    std::size_t                                request_bytes{0};
    std::size_t                                response_bytes{0};
    bool                                       request_truncated{false};
    bool                                       response_truncated{false};
    std::chrono::system_clock::time_point      timestamp{};
};
