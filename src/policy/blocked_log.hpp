#pragma once

// ---------------------------------------------------------------------------
// blocked_log.hpp
//
// 최근 차단 요청을 보관하는 고정 용량 링 버퍼.
// 관리 API GET /blocked 가 조회한다.
//
// [스레드 안전성]
// record()/recent() 는 mutex_ 로 직렬화된다. 임계 구역 안에서
// I/O 를 수행하지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct BlockedRequest {
    std::string                host{};
    std::string                reason{};    // "blocked-by-..."
    std::string                client{};    // 클라이언트 IP
    std::optional<std::string> method{};    // CONNECT/SOCKS5 는 없음
    std::string                mode{};      // "limited" | "full"
    std::string                protocol{};  // "http" | "http-connect" | "https-mitm" | "socks5"
    std::int64_t               timestamp{0};  // unix seconds
};

class BlockedRequestLog {
public:
    static constexpr std::size_t kDefaultCapacity = 200;

    explicit BlockedRequestLog(std::size_t capacity = kDefaultCapacity);

    BlockedRequestLog(const BlockedRequestLog&)            = delete;
    BlockedRequestLog& operator=(const BlockedRequestLog&) = delete;

    // record: 용량 초과 시 가장 오래된 항목을 버린다.
    void record(BlockedRequest entry);

    // recent: 오래된 순서의 사본 (버퍼 유지)
    [[nodiscard]] std::vector<BlockedRequest> recent() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t                capacity_;
    mutable std::mutex         mutex_{};
    std::deque<BlockedRequest> entries_{};
};
