#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 정책 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/policy.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 헤더에 의존하지 않는다 (독립적).
// - 모든 컨테이너 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - allowed_domains 가 비어 있으면 모든 호스트 차단 (fail-close).
//   이 구조체 자체는 판정 로직을 포함하지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// NetworkMode
//   kLimited : GET/HEAD/OPTIONS 만 허용, 불투명 터널은 MITM 필수
//   kFull    : 모든 메서드 허용, 일반 CONNECT 터널 허용
// ---------------------------------------------------------------------------
enum class NetworkMode : std::uint8_t {
    kLimited = 0,
    kFull    = 1,
};

[[nodiscard]] constexpr auto to_string(NetworkMode mode) noexcept -> std::string_view
{
    return mode == NetworkMode::kLimited ? "limited" : "full";
}

// "limited" / "full" 만 허용 (대소문자 구분)
[[nodiscard]] constexpr auto parse_network_mode(std::string_view text) noexcept
    -> std::optional<NetworkMode>
{
    if (text == "limited") { return NetworkMode::kLimited; }
    if (text == "full")    { return NetworkMode::kFull; }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// PolicyConfig
//   도메인 허용/차단 목록과 로컬 네트워크 정책.
//
//   allowed_domains    : "*.example.com" (apex + 하위 도메인) 또는 정확한 호스트명
//   denied_domains     : allowed_domains 보다 항상 우선한다
//   allow_local_binding: false 이면 loopback/사설 대역 목적지 차단
//   allow_unix_sockets : x-unix-socket 헤더로 요청 가능한 소켓 경로 목록
// ---------------------------------------------------------------------------
struct PolicyConfig {
    std::vector<std::string> allowed_domains{};
    std::vector<std::string> denied_domains{};
    bool                     allow_local_binding{false};
    std::vector<std::string> allow_unix_sockets{};
};

// ---------------------------------------------------------------------------
// MitmConfig
//   TLS 가로채기 설정.
//   ca_cert_path / ca_key_path 가 상대 경로이면 정책 파일 디렉터리 기준으로
//   PolicyLoader 가 절대 경로로 변환한다.
// ---------------------------------------------------------------------------
struct MitmConfig {
    bool          enabled{false};
    bool          inspect{false};               // 요청/응답 크기 로깅
    std::size_t   max_body_bytes{4096};         // inspect 로그 크기 상한
    std::string   ca_cert_path{"mitm/ca.pem"};
    std::string   ca_key_path{"mitm/ca.key"};
    std::uint32_t leaf_validity_hours{24};
};

// ---------------------------------------------------------------------------
// RuntimeConfig
//   정책 파일 하나에 대응하는 루트 구조체.
// ---------------------------------------------------------------------------
struct RuntimeConfig {
    NetworkMode  mode{NetworkMode::kFull};
    PolicyConfig policy{};
    MitmConfig   mitm{};
};
