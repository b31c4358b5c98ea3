#pragma once

// ---------------------------------------------------------------------------
// network_guard.hpp
//
// 목적지가 loopback / 사설 / link-local / ULA 대역인지 판정하는 가드.
//
// [판정 순서]
// 1. 리터럴 검사 (I/O 없음): "localhost", IPv4/IPv6 주소 문자열
// 2. 리터럴이 호스트명이면 HostResolver 로 정방향 조회 후 각 주소 분류
//
// [알려진 한계: DNS rebinding]
// 검사 시점과 실제 upstream 연결 시점의 DNS 응답이 다를 수 있다.
// 이 가드는 심층 방어(defense-in-depth)일 뿐 경계 보장이 아니다.
// 운영자 문서(DESIGN.md)에 잔여 위험으로 명시한다.
// ---------------------------------------------------------------------------

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/address.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// HostResolver
//   호스트명 → 주소 목록. 실패 시 빈 벡터를 반환한다 (예외 없음).
//   테스트에서는 가짜 구현을 주입한다.
//
//   async_resolve 는 프런트엔드 코루틴 경로(PolicyEngine::async_decide)가 쓴다.
//   기본 구현은 resolve 결과를 그대로 돌려준다.
// ---------------------------------------------------------------------------
class HostResolver {
public:
    virtual ~HostResolver() = default;

    [[nodiscard]] virtual auto resolve(std::string_view host) const
        -> std::vector<boost::asio::ip::address> = 0;

    [[nodiscard]] virtual auto async_resolve(std::string host) const
        -> boost::asio::awaitable<std::vector<boost::asio::ip::address>>;
};

// ---------------------------------------------------------------------------
// SystemHostResolver
//   asio tcp::resolver 기반 조회.
//   resolve       : 호출마다 전용 io_context 에서 동기 조회 (호출 스레드 블로킹)
//   async_resolve : 호출한 코루틴의 executor 에서 비동기 조회
// ---------------------------------------------------------------------------
class SystemHostResolver final : public HostResolver {
public:
    [[nodiscard]] auto resolve(std::string_view host) const
        -> std::vector<boost::asio::ip::address> override;

    [[nodiscard]] auto async_resolve(std::string host) const
        -> boost::asio::awaitable<std::vector<boost::asio::ip::address>> override;
};

// ---------------------------------------------------------------------------
// LiteralClass
//   kHostname : 주소 리터럴이 아님 (DNS 조회 필요)
//   kPublic   : 공인 주소 리터럴
//   kLocal    : loopback / 사설 / link-local / ULA / unspecified 리터럴
// ---------------------------------------------------------------------------
enum class LiteralClass : std::uint8_t {
    kHostname = 0,
    kPublic   = 1,
    kLocal    = 2,
};

class LocalNetworkGuard {
public:
    explicit LocalNetworkGuard(std::shared_ptr<const HostResolver> resolver);

    // classify_literal: host 는 normalize_host 를 거친 값
    [[nodiscard]] static LiteralClass classify_literal(std::string_view host);

    [[nodiscard]] static bool is_local_or_private(const boost::asio::ip::address& addr) noexcept;

    // is_local_or_private: 리터럴 검사 후 필요하면 resolver 조회.
    //   조회 실패(빈 결과)는 "로컬 아님" 으로 판정한다.
    [[nodiscard]] bool is_local_or_private(std::string_view host) const;

    // async_resolve: 주입된 resolver 의 비동기 조회. resolver 가 없으면 빈 결과.
    [[nodiscard]] auto async_resolve(std::string host) const
        -> boost::asio::awaitable<std::vector<boost::asio::ip::address>>;

private:
    std::shared_ptr<const HostResolver> resolver_;
};
