#pragma once

#include "common/types.hpp"
#include "policy/domain_matcher.hpp"
#include "policy/network_guard.hpp"
#include "policy/rule.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/address.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// BlockReason
//   차단 사유. 문자열 형태("blocked-by-...")는 x-proxy-error 헤더 값과
//   감사 로그에 그대로 사용되므로 변경 금지.
// ---------------------------------------------------------------------------
enum class BlockReason : std::uint8_t {
    kNone         = 0,  // 허용
    kDenylist     = 1,
    kAllowlist    = 2,
    kMethodPolicy = 3,
    kMitmRequired = 4,
    kPolicy       = 5,  // 로컬/사설 네트워크 가드 등
};

[[nodiscard]] constexpr auto to_string(BlockReason reason) noexcept -> std::string_view
{
    switch (reason) {
        case BlockReason::kNone:         return "allowed";
        case BlockReason::kDenylist:     return "blocked-by-denylist";
        case BlockReason::kAllowlist:    return "blocked-by-allowlist";
        case BlockReason::kMethodPolicy: return "blocked-by-method-policy";
        case BlockReason::kMitmRequired: return "blocked-by-mitm-required";
        case BlockReason::kPolicy:       return "blocked-by-policy";
    }
    return "blocked-by-policy";
}

// ---------------------------------------------------------------------------
// TlsHint
//   kPlain   : 평문 HTTP (메서드 게이트로 충분)
//   kTls     : CONNECT / MITM 내부 요청
//   kUnknown : SOCKS5 처럼 내용을 알 수 없는 스트림
// ---------------------------------------------------------------------------
enum class TlsHint : std::uint8_t {
    kPlain   = 0,
    kTls     = 1,
    kUnknown = 2,
};

// ---------------------------------------------------------------------------
// RequestDescriptor
//   프런트엔드가 decide() 호출 직전에 만드는 요청 요약. 저장하지 않는다.
//   method 가 비어 있으면 메서드 게이트(3단계)를 건너뛴다.
// ---------------------------------------------------------------------------
struct RequestDescriptor {
    std::string                host{};
    std::uint16_t              port{0};
    std::optional<std::string> method{};
    TlsHint                    tls{TlsHint::kPlain};
    ProxyProtocol              protocol{ProxyProtocol::kHttp};
};

// ---------------------------------------------------------------------------
// Decision
//   정책 판정 결과. generation 은 판정에 사용된 스냅샷 세대.
// ---------------------------------------------------------------------------
struct Decision {
    bool          allowed{false};        // 기본값: 차단 (fail-close)
    BlockReason   reason{BlockReason::kPolicy};
    std::uint64_t generation{0};
};

// ---------------------------------------------------------------------------
// PolicySnapshot
//   특정 세대의 불변 런타임 상태. 생성 후 절대 수정하지 않는다.
//   연결 핸들러는 shared_ptr 로 보유하여 연결 수명 동안 같은 세대를 사용한다.
// ---------------------------------------------------------------------------
struct PolicySnapshot {
    std::uint64_t    generation{0};
    RuntimeConfig    config{};
    DomainPatternSet allowed{};
    DomainPatternSet denied{};

    PolicySnapshot(std::uint64_t gen, RuntimeConfig cfg);

    [[nodiscard]] NetworkMode mode() const noexcept { return config.mode; }
};

// ---------------------------------------------------------------------------
// PolicyEngine
//   모든 프런트엔드가 공유하는 단일 판정 엔진.
//
//   [동시성]
//   - 읽기: snapshot_ 을 atomic load 하여 로컬 shared_ptr 로 보관 후 판정.
//   - 쓰기: reload() / set_mode() 가 새 스냅샷을 만들어 atomic store.
//     writer_mutex_ 로 쓰기끼리만 직렬화하며 I/O 중에는 잡지 않는다.
//
//   [판정 순서] policy_engine.cpp 파일 헤더 참고.
// ---------------------------------------------------------------------------
class PolicyEngine {
public:
    explicit PolicyEngine(RuntimeConfig                       config,
                          std::shared_ptr<const HostResolver> resolver =
                              std::make_shared<SystemHostResolver>());

    ~PolicyEngine() = default;

    PolicyEngine(const PolicyEngine&)            = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;
    PolicyEngine(PolicyEngine&&)                 = delete;
    PolicyEngine& operator=(PolicyEngine&&)      = delete;

    // 현재 세대 스냅샷 (nullptr 반환 없음)
    [[nodiscard]] auto snapshot() const -> std::shared_ptr<const PolicySnapshot>;

    // decide: 현재 스냅샷으로 동기 판정 (DNS 조회는 resolver_ 로 블로킹 수행)
    [[nodiscard]] Decision decide(const RequestDescriptor& desc) const;

    // decide: 고정된 스냅샷으로 동기 판정
    [[nodiscard]] Decision decide(const RequestDescriptor& desc,
                                  const PolicySnapshot&    snap) const;

    // async_decide: 프런트엔드 코루틴용. 5단계 DNS 조회를 asio resolver 로 수행한다.
    [[nodiscard]] auto async_decide(RequestDescriptor                     desc,
                                    std::shared_ptr<const PolicySnapshot> snap) const
        -> boost::asio::awaitable<Decision>;

    // decide_without_dns
    //   1~4단계 + 리터럴 로컬 검사. 호스트명 DNS 조회가 필요하면 std::nullopt.
    [[nodiscard]] std::optional<Decision> decide_without_dns(const RequestDescriptor& desc,
                                                             const PolicySnapshot&    snap) const;

    // decide_resolved: 5단계. addrs 중 하나라도 로컬/사설이면 차단.
    [[nodiscard]] Decision decide_resolved(const RequestDescriptor&                     desc,
                                           const PolicySnapshot&                        snap,
                                           std::span<const boost::asio::ip::address>   addrs) const;

    // 쓰기 경로: 새 세대를 게시하고 그 세대 번호를 반환한다.
    std::uint64_t reload(RuntimeConfig config);
    std::uint64_t set_mode(NetworkMode mode);

    // method_allowed: Limited 모드에서는 GET/HEAD/OPTIONS 만 허용 (대소문자 구분)
    [[nodiscard]] static bool method_allowed(NetworkMode mode, std::string_view method);

private:
    std::atomic<std::shared_ptr<const PolicySnapshot>> snapshot_;
    std::mutex                                         writer_mutex_{};
    LocalNetworkGuard                                  guard_;
};
