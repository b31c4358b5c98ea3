// ---------------------------------------------------------------------------
// policy_engine.cpp
//
// 요청 요약(RequestDescriptor)을 받아 허용/차단 판정을 내리는 엔진.
//
// [판정 순서] 첫 일치가 결정, 순서 변경 금지
// 1.  denied_domains 일치                      → blocked-by-denylist
// 2.  allowed_domains 비어 있음                 → blocked-by-allowlist (fail-close)
// 2b. allow_local_binding=false, 호스트가 로컬/사설 주소 리터럴이고
//     allowed_domains 에 정확히 등재되지 않음    → blocked-by-policy
// 2c. allowed_domains 어느 패턴과도 불일치        → blocked-by-allowlist
// 3.  Limited + method 존재 + GET/HEAD/OPTIONS 외 → blocked-by-method-policy
// 4.  Limited + method 없음 + 평문 아님 + MITM 으로 검사 불가
//                                               → blocked-by-mitm-required
// 5.  allow_local_binding=false, 호스트명 DNS 조회 결과가 로컬/사설
//                                               → blocked-by-policy
// 6.  허용
//
// 1~4 단계와 2b 리터럴 검사는 I/O 가 없다. 차단 판정은 네트워크 접근 없이
// 내려질 수 있어야 하므로 DNS 조회는 항상 마지막(5단계)이다.
//
// [MITM 검사 가능 여부]
// MITM 인터셉터는 HTTP CONNECT 경로에서만 동작한다. SOCKS5 스트림은
// mitm.enabled 와 무관하게 Limited 모드에서 4단계로 차단된다.
//
// [Hot Reload]
// snapshot_ 은 std::atomic<std::shared_ptr<const PolicySnapshot>> 이다.
// 진행 중인 판정은 자신이 load 한 스냅샷을 끝까지 사용하므로 세대가
// 섞이지 않는다 (copy-on-write).
//
// [알려진 한계]
// - 5단계는 DNS rebinding 에 취약하다 (검사 후 재조회 시 다른 응답 가능).
// - DNS 조회 실패는 "로컬 아님" 으로 처리한다. upstream 연결도 같은 이유로
//   실패하므로 우회 경로가 되지 않는다.
// ---------------------------------------------------------------------------

#include "policy/policy_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <set>
#include <vector>

namespace {

constexpr std::array<std::string_view, 3> kReadOnlyMethods{"GET", "HEAD", "OPTIONS"};

Decision deny(BlockReason reason, const PolicySnapshot& snap)
{
    return Decision{.allowed = false, .reason = reason, .generation = snap.generation};
}

Decision allow(const PolicySnapshot& snap)
{
    return Decision{.allowed = true, .reason = BlockReason::kNone, .generation = snap.generation};
}

// ---------------------------------------------------------------------------
// log_list_changes
//   reload 전후 도메인 목록의 추가/삭제 항목을 로그로 남긴다 (대소문자 무시).
// ---------------------------------------------------------------------------
void log_list_changes(std::string_view                list_name,
                      const std::vector<std::string>& previous,
                      const std::vector<std::string>& next)
{
    auto lowered = [](const std::vector<std::string>& items) {
        std::set<std::string> out;
        for (const auto& item : items) {
            out.insert(normalize_host(item));
        }
        return out;
    };

    const auto prev_set = lowered(previous);
    const auto next_set = lowered(next);

    for (const auto& entry : next_set) {
        if (prev_set.find(entry) == prev_set.end()) {
            spdlog::info("policy_engine: {} entry added: {}", list_name, entry);
        }
    }
    for (const auto& entry : prev_set) {
        if (next_set.find(entry) == next_set.end()) {
            spdlog::info("policy_engine: {} entry removed: {}", list_name, entry);
        }
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicySnapshot
// ---------------------------------------------------------------------------
PolicySnapshot::PolicySnapshot(std::uint64_t gen, RuntimeConfig cfg)
    : generation{gen}
    , config{std::move(cfg)}
    , allowed{config.policy.allowed_domains}
    , denied{config.policy.denied_domains}
{}

// ---------------------------------------------------------------------------
// PolicyEngine
// ---------------------------------------------------------------------------
PolicyEngine::PolicyEngine(RuntimeConfig config, std::shared_ptr<const HostResolver> resolver)
    : snapshot_{std::make_shared<const PolicySnapshot>(1, std::move(config))}
    , guard_{std::move(resolver)}
{}

auto PolicyEngine::snapshot() const -> std::shared_ptr<const PolicySnapshot>
{
    return snapshot_.load(std::memory_order_acquire);
}

bool PolicyEngine::method_allowed(NetworkMode mode, std::string_view method)
{
    if (mode == NetworkMode::kFull) {
        return true;
    }
    // 메서드 토큰은 대소문자를 구분한다 ("get" 은 GET 이 아니다)
    return std::any_of(kReadOnlyMethods.begin(), kReadOnlyMethods.end(),
                       [&](std::string_view m) { return m == method; });
}

std::optional<Decision> PolicyEngine::decide_without_dns(const RequestDescriptor& desc,
                                                         const PolicySnapshot&    snap) const
{
    const std::string host = normalize_host(desc.host);
    if (host.empty()) {
        return deny(BlockReason::kPolicy, snap);
    }

    const auto& policy = snap.config.policy;

    // 1. deny-list 우선
    if (snap.denied.matches_any(host)) {
        return deny(BlockReason::kDenylist, snap);
    }

    // 2. 빈 allow-list → fail-close
    if (snap.allowed.empty()) {
        return deny(BlockReason::kAllowlist, snap);
    }

    // 2b. 로컬/사설 리터럴 (I/O 없음)
    const bool explicitly_allowed = snap.allowed.contains_exact(host);
    const auto literal            = LocalNetworkGuard::classify_literal(host);
    if (!policy.allow_local_binding && !explicitly_allowed && literal == LiteralClass::kLocal) {
        return deny(BlockReason::kPolicy, snap);
    }

    // 2c. allow-list 패턴 불일치
    if (!snap.allowed.matches_any(host)) {
        return deny(BlockReason::kAllowlist, snap);
    }

    // 3. Limited 모드 메서드 게이트
    if (desc.method.has_value() && !method_allowed(snap.mode(), *desc.method)) {
        return deny(BlockReason::kMethodPolicy, snap);
    }

    // 4. Limited 모드 불투명 터널
    if (snap.mode() == NetworkMode::kLimited &&
        !desc.method.has_value() &&
        desc.tls != TlsHint::kPlain)
    {
        const bool interceptable =
            snap.config.mitm.enabled && desc.protocol == ProxyProtocol::kHttpConnect;
        if (!interceptable) {
            return deny(BlockReason::kMitmRequired, snap);
        }
    }

    // 5. 호스트명 → DNS 조회 필요
    if (!policy.allow_local_binding && !explicitly_allowed && literal == LiteralClass::kHostname) {
        return std::nullopt;
    }

    return allow(snap);
}

Decision PolicyEngine::decide_resolved(const RequestDescriptor&                   desc,
                                       const PolicySnapshot&                      snap,
                                       std::span<const boost::asio::ip::address> addrs) const
{
    const auto local = std::find_if(addrs.begin(), addrs.end(), [](const auto& a) {
        return LocalNetworkGuard::is_local_or_private(a);
    });
    if (local != addrs.end()) {
        spdlog::debug("policy_engine: host '{}' resolves to local address {}",
                      desc.host, local->to_string());
        return deny(BlockReason::kPolicy, snap);
    }
    return allow(snap);
}

Decision PolicyEngine::decide(const RequestDescriptor& desc) const
{
    const auto snap = snapshot();
    return decide(desc, *snap);
}

Decision PolicyEngine::decide(const RequestDescriptor& desc, const PolicySnapshot& snap) const
{
    if (auto early = decide_without_dns(desc, snap)) {
        return *early;
    }
    const std::string host = normalize_host(desc.host);
    const bool local = guard_.is_local_or_private(host);
    return local ? deny(BlockReason::kPolicy, snap) : allow(snap);
}

auto PolicyEngine::async_decide(RequestDescriptor                     desc,
                                std::shared_ptr<const PolicySnapshot> snap) const
    -> boost::asio::awaitable<Decision>
{
    if (!snap) {
        snap = snapshot();
    }
    if (auto early = decide_without_dns(desc, *snap)) {
        co_return *early;
    }

    const auto addrs = co_await guard_.async_resolve(normalize_host(desc.host));
    co_return decide_resolved(desc, *snap, addrs);
}

// ---------------------------------------------------------------------------
// 쓰기 경로
// ---------------------------------------------------------------------------
std::uint64_t PolicyEngine::reload(RuntimeConfig config)
{
    std::lock_guard lock{writer_mutex_};

    const auto current = snapshot_.load(std::memory_order_acquire);
    log_list_changes("allowed_domains", current->config.policy.allowed_domains,
                     config.policy.allowed_domains);
    log_list_changes("denied_domains", current->config.policy.denied_domains,
                     config.policy.denied_domains);

    const std::uint64_t gen = current->generation + 1;
    snapshot_.store(std::make_shared<const PolicySnapshot>(gen, std::move(config)),
                    std::memory_order_release);

    spdlog::info("policy_engine: policy generation {} published", gen);
    return gen;
}

std::uint64_t PolicyEngine::set_mode(NetworkMode mode)
{
    std::lock_guard lock{writer_mutex_};

    const auto current = snapshot_.load(std::memory_order_acquire);
    RuntimeConfig next = current->config;
    next.mode = mode;

    const std::uint64_t gen = current->generation + 1;
    snapshot_.store(std::make_shared<const PolicySnapshot>(gen, std::move(next)),
                    std::memory_order_release);

    spdlog::info("policy_engine: mode {} -> {} (generation {})",
                 to_string(current->config.mode), to_string(mode), gen);
    return gen;
}
