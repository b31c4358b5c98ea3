// ---------------------------------------------------------------------------
// test_network_guard.cpp
//
// LocalNetworkGuard 단위 테스트. DNS 는 가짜 resolver 로 대체한다.
// SystemHostResolver 는 네트워크가 필요 없는 숫자 주소로만 확인한다.
// ---------------------------------------------------------------------------

#include "policy/network_guard.hpp"

#include <gtest/gtest.h>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace {

class FakeResolver final : public HostResolver {
public:
    void add(const std::string& host, const std::string& addr)
    {
        table_[host].push_back(boost::asio::ip::make_address(addr));
    }

    [[nodiscard]] auto resolve(std::string_view host) const
        -> std::vector<boost::asio::ip::address> override
    {
        ++calls;
        const auto it = table_.find(std::string{host});
        return it == table_.end() ? std::vector<boost::asio::ip::address>{} : it->second;
    }

    mutable int calls{0};

private:
    std::map<std::string, std::vector<boost::asio::ip::address>> table_{};
};

bool local(const char* addr)
{
    return LocalNetworkGuard::is_local_or_private(boost::asio::ip::make_address(addr));
}

}  // namespace

// ---------------------------------------------------------------------------
// 주소 분류
// ---------------------------------------------------------------------------
TEST(NetworkGuardTest, Ipv4PrivateRanges)
{
    EXPECT_TRUE(local("127.0.0.1"));
    EXPECT_TRUE(local("127.255.255.254"));
    EXPECT_TRUE(local("10.1.2.3"));
    EXPECT_TRUE(local("172.16.0.1"));
    EXPECT_TRUE(local("172.31.255.255"));
    EXPECT_TRUE(local("192.168.0.10"));
    EXPECT_TRUE(local("169.254.169.254"));
    EXPECT_TRUE(local("0.0.0.0"));
}

TEST(NetworkGuardTest, Ipv4PublicAddresses)
{
    EXPECT_FALSE(local("8.8.8.8"));
    EXPECT_FALSE(local("172.32.0.1"));
    EXPECT_FALSE(local("192.169.0.1"));
    EXPECT_FALSE(local("11.0.0.1"));
}

TEST(NetworkGuardTest, Ipv6LocalRanges)
{
    EXPECT_TRUE(local("::1"));
    EXPECT_TRUE(local("::"));
    EXPECT_TRUE(local("fe80::1"));
    EXPECT_TRUE(local("fd12:3456::1"));
    EXPECT_TRUE(local("fc00::1"));
    EXPECT_TRUE(local("::ffff:192.168.1.1"));
}

TEST(NetworkGuardTest, Ipv6PublicAddresses)
{
    EXPECT_FALSE(local("2001:4860:4860::8888"));
    EXPECT_FALSE(local("::ffff:8.8.8.8"));
}

// ---------------------------------------------------------------------------
// 리터럴 분류
// ---------------------------------------------------------------------------
TEST(NetworkGuardTest, ClassifyLiteral)
{
    EXPECT_EQ(LocalNetworkGuard::classify_literal("localhost"), LiteralClass::kLocal);
    EXPECT_EQ(LocalNetworkGuard::classify_literal("app.localhost"), LiteralClass::kLocal);
    EXPECT_EQ(LocalNetworkGuard::classify_literal("10.0.0.1"), LiteralClass::kLocal);
    EXPECT_EQ(LocalNetworkGuard::classify_literal("1.1.1.1"), LiteralClass::kPublic);
    EXPECT_EQ(LocalNetworkGuard::classify_literal("example.com"), LiteralClass::kHostname);
}

// ---------------------------------------------------------------------------
// 호스트명 → resolver 조회
// ---------------------------------------------------------------------------
TEST(NetworkGuardTest, HostnameResolvingToPrivateIsLocal)
{
    auto resolver = std::make_shared<FakeResolver>();
    resolver->add("intranet.example", "93.184.216.34");
    resolver->add("intranet.example", "10.0.0.5");
    LocalNetworkGuard guard{resolver};

    EXPECT_TRUE(guard.is_local_or_private("intranet.example"));
    EXPECT_EQ(resolver->calls, 1);
}

TEST(NetworkGuardTest, HostnameResolvingToPublicIsNotLocal)
{
    auto resolver = std::make_shared<FakeResolver>();
    resolver->add("example.com", "93.184.216.34");
    LocalNetworkGuard guard{resolver};

    EXPECT_FALSE(guard.is_local_or_private("example.com"));
}

TEST(NetworkGuardTest, ResolveFailureIsNotLocal)
{
    auto resolver = std::make_shared<FakeResolver>();
    LocalNetworkGuard guard{resolver};

    EXPECT_FALSE(guard.is_local_or_private("nxdomain.invalid"));
}

TEST(NetworkGuardTest, LiteralsNeverHitResolver)
{
    auto resolver = std::make_shared<FakeResolver>();
    LocalNetworkGuard guard{resolver};

    EXPECT_TRUE(guard.is_local_or_private("127.0.0.1"));
    EXPECT_FALSE(guard.is_local_or_private("8.8.8.8"));
    EXPECT_EQ(resolver->calls, 0);
}

// ---------------------------------------------------------------------------
// 비동기 조회 경로
// ---------------------------------------------------------------------------
TEST(NetworkGuardTest, AsyncResolveFallsBackToSyncResolver)
{
    auto resolver = std::make_shared<FakeResolver>();
    resolver->add("intranet.example", "10.0.0.5");
    LocalNetworkGuard guard{resolver};
    boost::asio::io_context io;

    std::optional<std::vector<boost::asio::ip::address>> addrs;
    boost::asio::co_spawn(
        io,
        [&]() -> boost::asio::awaitable<void> { addrs = co_await guard.async_resolve("intranet.example"); },
        [](std::exception_ptr e) { if (e) { std::rethrow_exception(e); } });
    io.run();

    ASSERT_TRUE(addrs.has_value());
    ASSERT_EQ(addrs->size(), 1U);
    EXPECT_EQ(addrs->front().to_string(), "10.0.0.5");
    EXPECT_EQ(resolver->calls, 1);
}

TEST(NetworkGuardTest, AsyncResolveWithoutResolverIsEmpty)
{
    LocalNetworkGuard guard{nullptr};
    boost::asio::io_context io;

    std::optional<std::vector<boost::asio::ip::address>> addrs;
    boost::asio::co_spawn(
        io,
        [&]() -> boost::asio::awaitable<void> { addrs = co_await guard.async_resolve("example.com"); },
        [](std::exception_ptr e) { if (e) { std::rethrow_exception(e); } });
    io.run();

    ASSERT_TRUE(addrs.has_value());
    EXPECT_TRUE(addrs->empty());
}

TEST(NetworkGuardTest, SystemResolverHandlesNumericHosts)
{
    const SystemHostResolver resolver;

    const auto sync_addrs = resolver.resolve("127.0.0.1");
    ASSERT_FALSE(sync_addrs.empty());
    EXPECT_EQ(sync_addrs.front().to_string(), "127.0.0.1");

    boost::asio::io_context io;
    std::optional<std::vector<boost::asio::ip::address>> async_addrs;
    boost::asio::co_spawn(
        io,
        [&]() -> boost::asio::awaitable<void> { async_addrs = co_await resolver.async_resolve("127.0.0.1"); },
        [](std::exception_ptr e) { if (e) { std::rethrow_exception(e); } });
    io.run();

    ASSERT_TRUE(async_addrs.has_value());
    ASSERT_FALSE(async_addrs->empty());
    EXPECT_EQ(async_addrs->front().to_string(), "127.0.0.1");
}

TEST(NetworkGuardTest, SystemResolverReportsFailureAsEmpty)
{
    const SystemHostResolver resolver;

    // 빈 호스트와 빈 서비스는 getaddrinfo 가 거부한다
    EXPECT_TRUE(resolver.resolve("").empty());
}
