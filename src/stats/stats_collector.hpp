#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 실시간 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_connection_open / on_connection_close / on_request / on_upstream_error:
//   데이터패스에서 concurrent 호출 안전 (atomic 사용).
// - snapshot(): 관리 API 조회 경로. 갱신 경로와 contention 없이 읽기 가능.
//
// [격리 원칙]
// - 통계 수집 실패가 데이터패스 실패로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   rps       : 기동 이후 평균 초당 요청 수
//   block_rate: blocked_requests / total_requests (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                              total_connections{0};
    std::uint64_t                              active_sessions{0};
    std::uint64_t                              total_requests{0};
    std::uint64_t                              blocked_requests{0};
    std::uint64_t                              upstream_errors{0};
    std::uint64_t                              http_requests{0};
    std::uint64_t                              connect_requests{0};
    std::uint64_t                              mitm_requests{0};
    std::uint64_t                              socks5_requests{0};
    double                                     rps{0.0};
    double                                     block_rate{0.0};
    std::chrono::system_clock::time_point      captured_at{};
};

class StatsCollector {
public:
    StatsCollector() noexcept
        : started_at_(std::chrono::system_clock::now())
    {}

    ~StatsCollector() = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    void on_connection_open() noexcept {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
        active_sessions_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_connection_close() noexcept {
        // 0 아래로 내려가지 않도록 CAS 루프
        std::uint64_t current = active_sessions_.load(std::memory_order_relaxed);
        while (current > 0 &&
               !active_sessions_.compare_exchange_weak(current, current - 1,
                                                       std::memory_order_relaxed)) {
        }
    }

    // on_request
    //   정책 판정 1건마다 호출 (데이터패스).
    //   blocked: 정책에 의해 차단된 요청이면 true
    void on_request(ProxyProtocol protocol, bool blocked) noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
        per_protocol_[static_cast<std::size_t>(protocol)].fetch_add(1, std::memory_order_relaxed);
        if (blocked) {
            blocked_requests_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void on_upstream_error() noexcept {
        upstream_errors_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto now       = std::chrono::system_clock::now();
        const auto total_req = total_requests_.load(std::memory_order_relaxed);
        const auto blocked   = blocked_requests_.load(std::memory_order_relaxed);

        const double elapsed_sec = std::chrono::duration<double>(now - started_at_).count();

        double rps = 0.0;
        if (elapsed_sec > 0.0) {
            rps = static_cast<double>(total_req) / elapsed_sec;
        }

        double block_rate = 0.0;
        if (total_req > 0) {
            block_rate = static_cast<double>(blocked) / static_cast<double>(total_req);
        }

        auto proto = [this](ProxyProtocol p) {
            return per_protocol_[static_cast<std::size_t>(p)].load(std::memory_order_relaxed);
        };

        return StatsSnapshot{
            .total_connections = total_connections_.load(std::memory_order_relaxed),
            .active_sessions   = active_sessions_.load(std::memory_order_relaxed),
            .total_requests    = total_req,
            .blocked_requests  = blocked,
            .upstream_errors   = upstream_errors_.load(std::memory_order_relaxed),
            .http_requests     = proto(ProxyProtocol::kHttp),
            .connect_requests  = proto(ProxyProtocol::kHttpConnect),
            .mitm_requests     = proto(ProxyProtocol::kHttpsMitm),
            .socks5_requests   = proto(ProxyProtocol::kSocks5),
            .rps               = rps,
            .block_rate        = block_rate,
            .captured_at       = now,
        };
    }

private:
    std::atomic<std::uint64_t>                total_connections_{0};
    std::atomic<std::uint64_t>                active_sessions_{0};
    std::atomic<std::uint64_t>                total_requests_{0};
    std::atomic<std::uint64_t>                blocked_requests_{0};
    std::atomic<std::uint64_t>                upstream_errors_{0};
    std::array<std::atomic<std::uint64_t>, 4> per_protocol_{};  // ProxyProtocol 순서
    std::chrono::system_clock::time_point     started_at_;
};
