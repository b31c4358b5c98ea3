#include "proxy/socks5_codec.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>

#include <algorithm>

namespace {

ProtocolError make_error(ProtocolErrorCode code, std::string message)
{
    return ProtocolError{.code = code, .message = std::move(message), .context = "socks5"};
}

std::uint16_t read_port(std::span<const std::uint8_t> bytes)
{
    return static_cast<std::uint16_t>((static_cast<unsigned>(bytes[0]) << 8U) | bytes[1]);
}

}  // namespace

auto decode_greeting_header(std::span<const std::uint8_t> header)
    -> std::expected<std::size_t, ProtocolError>
{
    if (header.size() < kSocks5GreetingHeaderSize) {
        return std::unexpected(make_error(ProtocolErrorCode::kMalformedMessage, "short greeting"));
    }
    if (header[0] != kSocks5Version) {
        return std::unexpected(make_error(ProtocolErrorCode::kUnsupportedVersion,
                                          "unsupported SOCKS version " + std::to_string(header[0])));
    }
    if (header[1] == 0) {
        return std::unexpected(make_error(ProtocolErrorCode::kMalformedMessage,
                                          "greeting offers no methods"));
    }
    return static_cast<std::size_t>(header[1]);
}

std::uint8_t select_method(std::span<const std::uint8_t> methods) noexcept
{
    const bool no_auth = std::find(methods.begin(), methods.end(), kSocks5MethodNoAuth) != methods.end();
    return no_auth ? kSocks5MethodNoAuth : kSocks5MethodNoneUsable;
}

std::array<std::uint8_t, 2> encode_method_selection(std::uint8_t method) noexcept
{
    return {kSocks5Version, method};
}

auto remaining_request_bytes(std::span<const std::uint8_t> prefix)
    -> std::expected<std::size_t, ProtocolError>
{
    if (prefix.size() < kSocks5RequestPrefixSize) {
        return std::unexpected(make_error(ProtocolErrorCode::kMalformedMessage, "short request"));
    }
    if (prefix[0] != kSocks5Version) {
        return std::unexpected(make_error(ProtocolErrorCode::kUnsupportedVersion,
                                          "unsupported SOCKS version " + std::to_string(prefix[0])));
    }

    // prefix[4] 는 주소의 첫 바이트. 나머지 = 주소 잔여 + 포트 2바이트
    switch (static_cast<Socks5AddressType>(prefix[3])) {
        case Socks5AddressType::kIPv4:   return std::size_t{4 - 1 + 2};
        case Socks5AddressType::kIPv6:   return std::size_t{16 - 1 + 2};
        case Socks5AddressType::kDomain: return static_cast<std::size_t>(prefix[4]) + 2;
    }
    return std::unexpected(make_error(ProtocolErrorCode::kUnsupportedAddress,
                                      "unsupported address type " + std::to_string(prefix[3])));
}

auto decode_request(std::span<const std::uint8_t> message)
    -> std::expected<Socks5Request, ProtocolError>
{
    auto remaining = remaining_request_bytes(message);
    if (!remaining) {
        return std::unexpected(remaining.error());
    }
    if (message.size() != kSocks5RequestPrefixSize + *remaining) {
        return std::unexpected(make_error(ProtocolErrorCode::kMalformedMessage,
                                          "request length mismatch"));
    }
    if (message[1] != kSocks5CmdConnect) {
        return std::unexpected(make_error(ProtocolErrorCode::kUnsupportedCommand,
                                          "unsupported command " + std::to_string(message[1])));
    }

    Socks5Request req;
    req.command      = message[1];
    req.address_type = static_cast<Socks5AddressType>(message[3]);

    const auto addr = message.subspan(4);
    switch (req.address_type) {
        case Socks5AddressType::kIPv4: {
            boost::asio::ip::address_v4::bytes_type bytes{};
            std::copy_n(addr.begin(), bytes.size(), bytes.begin());
            req.host = boost::asio::ip::address_v4{bytes}.to_string();
            req.port = read_port(addr.subspan(4));
            break;
        }
        case Socks5AddressType::kIPv6: {
            boost::asio::ip::address_v6::bytes_type bytes{};
            std::copy_n(addr.begin(), bytes.size(), bytes.begin());
            req.host = boost::asio::ip::address_v6{bytes}.to_string();
            req.port = read_port(addr.subspan(16));
            break;
        }
        case Socks5AddressType::kDomain: {
            const std::size_t len = addr[0];
            if (len == 0) {
                return std::unexpected(make_error(ProtocolErrorCode::kInvalidTarget,
                                                  "empty domain name"));
            }
            req.host.assign(reinterpret_cast<const char*>(addr.data() + 1), len);
            req.port = read_port(addr.subspan(1 + len));
            break;
        }
    }

    if (req.port == 0) {
        return std::unexpected(make_error(ProtocolErrorCode::kInvalidTarget, "port 0"));
    }
    return req;
}

std::vector<std::uint8_t> encode_reply(Socks5Reply reply, const boost::asio::ip::tcp::endpoint& bound)
{
    std::vector<std::uint8_t> out{kSocks5Version, static_cast<std::uint8_t>(reply), 0x00};

    const auto addr = bound.address();
    if (addr.is_v6()) {
        out.push_back(static_cast<std::uint8_t>(Socks5AddressType::kIPv6));
        const auto bytes = addr.to_v6().to_bytes();
        out.insert(out.end(), bytes.begin(), bytes.end());
    } else {
        out.push_back(static_cast<std::uint8_t>(Socks5AddressType::kIPv4));
        const auto bytes = addr.to_v4().to_bytes();
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
    out.push_back(static_cast<std::uint8_t>(bound.port() >> 8U));
    out.push_back(static_cast<std::uint8_t>(bound.port() & 0xFFU));
    return out;
}

Socks5Reply reply_for_error(const ProtocolError& error) noexcept
{
    switch (error.code) {
        case ProtocolErrorCode::kUnsupportedCommand: return Socks5Reply::kCommandNotSupported;
        case ProtocolErrorCode::kUnsupportedAddress: return Socks5Reply::kAddressTypeNotSupported;
        default:                                     return Socks5Reply::kGeneralFailure;
    }
}

Socks5Reply reply_for_connect_error(const boost::system::error_code& ec) noexcept
{
    namespace error = boost::asio::error;

    if (ec == error::host_not_found || ec == error::host_not_found_try_again ||
        ec == error::no_data || ec == error::host_unreachable)
    {
        return Socks5Reply::kHostUnreachable;
    }
    if (ec == error::connection_refused) {
        return Socks5Reply::kConnectionRefused;
    }
    if (ec == error::network_unreachable || ec == error::network_down) {
        return Socks5Reply::kNetworkUnreachable;
    }
    if (ec == error::timed_out) {
        return Socks5Reply::kTtlExpired;
    }
    return Socks5Reply::kGeneralFailure;
}
