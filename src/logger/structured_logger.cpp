// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"
#include "common/json_util.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <vector>

spdlog::level::level_enum StructuredLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

LogLevel StructuredLogger::parse_log_level(std::string_view level) {
    if (level == "debug") { return LogLevel::kDebug; }
    if (level == "warn")  { return LogLevel::kWarn;  }
    if (level == "error") { return LogLevel::kError; }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        // Rotating file sink (100MB, 3개 파일 유지)
        constexpr std::size_t kMaxFileSize = 100 * 1024 * 1024;
        constexpr std::size_t kMaxFiles    = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), kMaxFileSize, kMaxFiles));

        // 레지스트리에 등록하지 않는다 (인스턴스 여러 개 공존 가능)
        logger_ = std::make_shared<spdlog::logger>("netgate.audit", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 기본 패턴: 타임스탬프만 (구조화 로그는 각 메서드에서 JSON으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::warn);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_connection
// ---------------------------------------------------------------------------
void StructuredLogger::log_connection(const ConnectionLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kInfo) {
        return;
    }

    logger_->info(fmt::format(
        R"({{"event":"connection","type":"{}","session_id":{},"protocol":"{}",)"
        R"("client_ip":"{}","client_port":{},"timestamp":"{}"}})",
        json_escape(entry.event), entry.session_id, json_escape(entry.protocol),
        json_escape(entry.client_ip), entry.client_port, format_iso8601(entry.timestamp)));
}

// ---------------------------------------------------------------------------
// log_request
// ---------------------------------------------------------------------------
void StructuredLogger::log_request(const RequestLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kInfo) {
        return;
    }

    logger_->info(fmt::format(
        R"({{"event":"request_allowed","session_id":{},"client_ip":"{}","host":"{}",)"
        R"("port":{},"method":"{}","protocol":"{}","generation":{},"timestamp":"{}"}})",
        entry.session_id, json_escape(entry.client_ip), json_escape(entry.host),
        entry.port, json_escape(entry.method), json_escape(entry.protocol),
        entry.generation, format_iso8601(entry.timestamp)));
}

// ---------------------------------------------------------------------------
// log_block
// ---------------------------------------------------------------------------
void StructuredLogger::log_block(const BlockLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kWarn) {
        return;
    }

    logger_->warn(fmt::format(
        R"({{"event":"request_blocked","session_id":{},"client_ip":"{}","host":"{}",)"
        R"("port":{},"method":"{}","protocol":"{}","mode":"{}","reason":"{}",)"
        R"("generation":{},"timestamp":"{}"}})",
        entry.session_id, json_escape(entry.client_ip), json_escape(entry.host),
        entry.port, json_escape(entry.method), json_escape(entry.protocol),
        json_escape(entry.mode), json_escape(entry.reason),
        entry.generation, format_iso8601(entry.timestamp)));
}

// ---------------------------------------------------------------------------
// log_inspect
// ---------------------------------------------------------------------------
void StructuredLogger::log_inspect(const InspectLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kInfo) {
        return;
    }

    logger_->info(fmt::format(
        R"({{"event":"mitm_inspect","session_id":{},"host":"{}","method":"{}","path":"{}",)"
        R"("status":{},"request_bytes":{},"request_truncated":{},)"
        R"("response_bytes":{},"response_truncated":{},"timestamp":"{}"}})",
        entry.session_id, json_escape(entry.host), json_escape(entry.method),
        json_escape(entry.path), entry.status,
        entry.request_bytes, entry.request_truncated,
        entry.response_bytes, entry.response_truncated,
        format_iso8601(entry.timestamp)));
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
