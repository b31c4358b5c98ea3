#include "policy/network_guard.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <string>

namespace {

bool is_local_v4(const boost::asio::ip::address_v4& v4) noexcept
{
    const std::uint32_t ip = v4.to_uint();

    // (network, prefix length)
    constexpr std::array<std::pair<std::uint32_t, unsigned>, 6> kRanges{{
        {0x00000000U, 8},   // 0.0.0.0/8      unspecified
        {0x0A000000U, 8},   // 10.0.0.0/8     RFC1918
        {0x7F000000U, 8},   // 127.0.0.0/8    loopback
        {0xA9FE0000U, 16},  // 169.254.0.0/16 link-local
        {0xAC100000U, 12},  // 172.16.0.0/12  RFC1918
        {0xC0A80000U, 16},  // 192.168.0.0/16 RFC1918
    }};

    return std::any_of(kRanges.begin(), kRanges.end(), [ip](const auto& range) {
        const std::uint32_t mask = 0xFFFFFFFFU << (32U - range.second);
        return (ip & mask) == range.first;
    });
}

bool is_local_v6(const boost::asio::ip::address_v6& v6) noexcept
{
    if (v6.is_v4_mapped()) {
        return is_local_v4(boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, v6));
    }
    if (v6.is_loopback() || v6.is_unspecified() || v6.is_link_local()) {
        return true;
    }
    // fc00::/7 (ULA)
    const auto bytes = v6.to_bytes();
    return (bytes[0] & 0xFEU) == 0xFCU;
}

std::vector<boost::asio::ip::address> addresses_of(
    const boost::asio::ip::tcp::resolver::results_type& results)
{
    std::vector<boost::asio::ip::address> out;
    for (const auto& entry : results) {
        out.push_back(entry.endpoint().address());
    }
    return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// HostResolver / SystemHostResolver
// ---------------------------------------------------------------------------
auto HostResolver::async_resolve(std::string host) const
    -> boost::asio::awaitable<std::vector<boost::asio::ip::address>>
{
    co_return resolve(host);
}

auto SystemHostResolver::resolve(std::string_view host) const
    -> std::vector<boost::asio::ip::address>
{
    boost::asio::io_context        io;
    boost::asio::ip::tcp::resolver resolver{io};
    boost::system::error_code      ec;

    const auto results = resolver.resolve(host, "", ec);
    if (ec) {
        spdlog::debug("network_guard: resolve '{}' failed: {}", host, ec.message());
        return {};
    }
    return addresses_of(results);
}

auto SystemHostResolver::async_resolve(std::string host) const
    -> boost::asio::awaitable<std::vector<boost::asio::ip::address>>
{
    boost::asio::ip::tcp::resolver resolver{co_await boost::asio::this_coro::executor};
    boost::system::error_code      ec;

    const auto results = co_await resolver.async_resolve(
        host, "", boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("network_guard: resolve '{}' failed: {}", host, ec.message());
        co_return std::vector<boost::asio::ip::address>{};
    }
    co_return addresses_of(results);
}

// ---------------------------------------------------------------------------
// LocalNetworkGuard
// ---------------------------------------------------------------------------
LocalNetworkGuard::LocalNetworkGuard(std::shared_ptr<const HostResolver> resolver)
    : resolver_{std::move(resolver)}
{}

LiteralClass LocalNetworkGuard::classify_literal(std::string_view host)
{
    if (host == "localhost" || host.ends_with(".localhost")) {
        return LiteralClass::kLocal;
    }

    boost::system::error_code ec;
    const auto addr = boost::asio::ip::make_address(std::string{host}, ec);
    if (ec) {
        return LiteralClass::kHostname;
    }
    return is_local_or_private(addr) ? LiteralClass::kLocal : LiteralClass::kPublic;
}

bool LocalNetworkGuard::is_local_or_private(const boost::asio::ip::address& addr) noexcept
{
    if (addr.is_v4()) {
        return is_local_v4(addr.to_v4());
    }
    return is_local_v6(addr.to_v6());
}

bool LocalNetworkGuard::is_local_or_private(std::string_view host) const
{
    switch (classify_literal(host)) {
        case LiteralClass::kLocal:  return true;
        case LiteralClass::kPublic: return false;
        case LiteralClass::kHostname: break;
    }

    if (!resolver_) {
        return false;
    }
    const auto addrs = resolver_->resolve(host);
    return std::any_of(addrs.begin(), addrs.end(),
                       [](const boost::asio::ip::address& a) {
                           return LocalNetworkGuard::is_local_or_private(a);
                       });
}

auto LocalNetworkGuard::async_resolve(std::string host) const
    -> boost::asio::awaitable<std::vector<boost::asio::ip::address>>
{
    if (!resolver_) {
        co_return std::vector<boost::asio::ip::address>{};
    }
    co_return co_await resolver_->async_resolve(std::move(host));
}
