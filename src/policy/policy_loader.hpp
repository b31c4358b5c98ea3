#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 정책 파일을 로드하여 RuntimeConfig 로 변환하는 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자는
//   실패 시 반드시 기존 정책을 유지하거나(reload) 기동을 중단해야 한다(startup).
// - 파일 변경 감시는 PolicyWatcher (policy_watcher.hpp) 가 담당한다.
//
// [순환 의존성]
// policy_loader.hpp → rule.hpp (단방향만)
//
// [보안 고려사항]
// - YAML 파일 경로는 환경변수 설정에서만 지정하고 요청 입력을 사용하지 않는다.
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include "rule.hpp"  // RuntimeConfig

class PolicyLoader {
public:
    // load
    //   지정된 경로의 YAML 파일을 읽어 RuntimeConfig 로 파싱한다.
    //
    //   [fail-close 요구사항]
    //   파일 없음, 파싱 오류, 알 수 없는 mode, 잘못된 도메인 패턴은 모두
    //   실패로 처리한다. 부분적으로 파싱된 정책을 반환하지 않는다.
    //
    //   mitm.ca_cert_path / ca_key_path 가 상대 경로이면 정책 파일이 있는
    //   디렉터리 기준 절대 경로로 변환한다.
    [[nodiscard]] static std::expected<RuntimeConfig, std::string>
    load(const std::filesystem::path& config_path);
};
