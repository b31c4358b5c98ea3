#include "proxy/listen_address.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <string>

namespace {

using boost::asio::ip::tcp;

const auto kLoopbackV4 = boost::asio::ip::address_v4::loopback();

}  // namespace

auto parse_listen_endpoint(std::string_view text, std::uint16_t default_port) -> tcp::endpoint
{
    std::string_view rest = text;
    if (const auto scheme = rest.find("://"); scheme != std::string_view::npos) {
        rest.remove_prefix(scheme + 3);
    }
    if (const auto slash = rest.find('/'); slash != std::string_view::npos) {
        rest = rest.substr(0, slash);
    }

    std::string_view host = rest;
    std::string_view port_text;
    if (!rest.empty() && rest.front() == '[') {
        const auto close = rest.find(']');
        if (close != std::string_view::npos) {
            host = rest.substr(1, close - 1);
            if (close + 1 < rest.size() && rest[close + 1] == ':') {
                port_text = rest.substr(close + 2);
            }
        }
    } else if (const auto colon = rest.rfind(':');
               colon != std::string_view::npos && rest.find(':') == colon)
    {
        host      = rest.substr(0, colon);
        port_text = rest.substr(colon + 1);
    }

    std::uint16_t port = default_port;
    if (!port_text.empty()) {
        unsigned value = 0;
        const auto* end = port_text.data() + port_text.size();
        const auto [ptr, ec] = std::from_chars(port_text.data(), end, value);
        if (ec != std::errc{} || ptr != end || value > 65535) {
            spdlog::warn("[proxy] invalid port in listen address '{}', using {}", text, default_port);
        } else {
            port = static_cast<std::uint16_t>(value);
        }
    }

    if (host.empty() || host == "localhost") {
        return tcp::endpoint{kLoopbackV4, port};
    }

    boost::system::error_code ec;
    const auto address = boost::asio::ip::make_address(std::string{host}, ec);
    if (ec) {
        spdlog::warn("[proxy] listen host '{}' is not an IP address, using 127.0.0.1", host);
        return tcp::endpoint{kLoopbackV4, port};
    }
    return tcp::endpoint{address, port};
}

auto clamp_listen_endpoint(const tcp::endpoint& endpoint,
                           bool                 allow_non_loopback,
                           bool                 force_loopback,
                           std::string_view     listener_name) -> tcp::endpoint
{
    if (endpoint.address().is_loopback()) {
        return endpoint;
    }
    if (allow_non_loopback && !force_loopback) {
        spdlog::warn("[proxy] {} listener bound to non-loopback address {}",
                     listener_name, endpoint.address().to_string());
        return endpoint;
    }
    spdlog::warn("[proxy] {} listener address {} clamped to 127.0.0.1{}",
                 listener_name, endpoint.address().to_string(),
                 force_loopback ? " (allow_unix_sockets in use)" : "");
    return tcp::endpoint{kLoopbackV4, endpoint.port()};
}
