#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 이벤트당 JSON 한 줄. 모든 필드는 snake_case 키로 직렬화한다.
// - 운영 진단 메시지는 spdlog 기본 로거(spdlog::info 등)를 사용하고,
//   이 클래스는 감사 이벤트 전용으로 사용한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <string_view>

class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    void log_connection(const ConnectionLog& entry);

    // log_request: 허용 판정. [고빈도 호출 경로]
    void log_request(const RequestLog& entry);

    // log_block: 차단 판정 (warn 레벨)
    void log_block(const BlockLog& entry);

    void log_inspect(const InspectLog& entry);

    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    // parse_log_level: "debug" | "info" | "warn" | "error" (그 외 info)
    [[nodiscard]] static LogLevel parse_log_level(std::string_view level);

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_{};

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
};
