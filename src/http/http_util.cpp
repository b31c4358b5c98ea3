#include "http/http_util.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/ip/address.hpp>
#include <boost/beast/http/field.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <vector>

namespace {

constexpr std::array<http::field, 8> kHopByHopFields{
    http::field::connection,
    http::field::proxy_connection,
    http::field::keep_alive,
    http::field::proxy_authenticate,
    http::field::proxy_authorization,
    http::field::te,
    http::field::trailer,
    http::field::upgrade,
};

ProtocolError invalid_target(std::string message, std::string_view context)
{
    return ProtocolError{
        .code    = ProtocolErrorCode::kInvalidTarget,
        .message = std::move(message),
        .context = std::string{context},
    };
}

std::optional<std::uint16_t> parse_port(std::string_view text)
{
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    unsigned value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

bool iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) { s.remove_prefix(1); }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))   { s.remove_suffix(1); }
    return s;
}

}  // namespace

auto split_authority(std::string_view authority, std::uint16_t default_port)
    -> std::expected<Authority, ProtocolError>
{
    if (authority.empty()) {
        return std::unexpected(invalid_target("empty authority", authority));
    }
    // userinfo 는 허용하지 않는다 ("user@host")
    if (authority.find('@') != std::string_view::npos) {
        return std::unexpected(invalid_target("userinfo not allowed", authority));
    }

    Authority out{.host = {}, .port = default_port};

    if (authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos || close == 1) {
            return std::unexpected(invalid_target("unterminated IPv6 literal", authority));
        }
        out.host = std::string{authority.substr(1, close - 1)};
        const auto rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return std::unexpected(invalid_target("garbage after IPv6 literal", authority));
            }
            const auto port = parse_port(rest.substr(1));
            if (!port) {
                return std::unexpected(invalid_target("invalid port", authority));
            }
            out.port = *port;
        }
        return out;
    }

    const auto colon = authority.rfind(':');
    if (colon == std::string_view::npos) {
        out.host = std::string{authority};
        return out;
    }
    // 대괄호 없는 IPv6 리터럴 ("::1") 은 포트 없이 취급한다
    if (authority.find(':') != colon) {
        out.host = std::string{authority};
        return out;
    }

    out.host = std::string{authority.substr(0, colon)};
    if (out.host.empty()) {
        return std::unexpected(invalid_target("empty host", authority));
    }
    const auto port = parse_port(authority.substr(colon + 1));
    if (!port) {
        return std::unexpected(invalid_target("invalid port", authority));
    }
    out.port = *port;
    return out;
}

bool is_ip_literal(std::string_view host)
{
    boost::system::error_code ec;
    (void)boost::asio::ip::make_address(std::string{host}, ec);
    return !ec;
}

std::string format_authority(std::string_view host, std::uint16_t port, std::uint16_t default_port)
{
    std::string out;
    const bool v6 = host.find(':') != std::string_view::npos;
    if (v6) {
        out += '[';
        out += host;
        out += ']';
    } else {
        out += host;
    }
    if (port != default_port) {
        out += ':';
        out += std::to_string(port);
    }
    return out;
}

auto parse_origin_target(std::string_view target, std::uint16_t default_port)
    -> std::expected<OriginTarget, ProtocolError>
{
    OriginTarget out;
    if (target.empty()) {
        return std::unexpected(invalid_target("empty request target", target));
    }
    if (target.front() == '/') {
        out.origin_form = std::string{target};
        return out;
    }

    const auto scheme_end = target.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::unexpected(invalid_target("unsupported request target", target));
    }

    const auto rest      = target.substr(scheme_end + 3);
    const auto path_pos  = rest.find_first_of("/?#");
    const auto authority = rest.substr(0, path_pos);

    auto parsed = split_authority(authority, default_port);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    out.authority = std::move(*parsed);

    if (path_pos == std::string_view::npos) {
        out.origin_form = "/";
    } else if (rest[path_pos] == '/') {
        out.origin_form = std::string{rest.substr(path_pos)};
    } else {
        out.origin_form = "/" + std::string{rest.substr(path_pos)};
    }
    // 프래그먼트는 서버로 보내지 않는다
    if (const auto frag = out.origin_form.find('#'); frag != std::string::npos) {
        out.origin_form.erase(frag);
    }
    return out;
}

auto parse_forward_target(const http::request_header<>& req)
    -> std::expected<ForwardTarget, ProtocolError>
{
    const std::string_view target{req.target().data(), req.target().size()};

    if (target.empty()) {
        return std::unexpected(invalid_target("empty request target", target));
    }

    if (target.front() != '/') {
        const auto scheme_end = target.find("://");
        if (scheme_end == std::string_view::npos ||
            !iequals(target.substr(0, scheme_end), "http"))
        {
            return std::unexpected(invalid_target("only http:// targets are forwarded", target));
        }
        auto origin = parse_origin_target(target, kDefaultHttpPort);
        if (!origin) {
            return std::unexpected(origin.error());
        }
        return ForwardTarget{
            .authority   = std::move(*origin->authority),
            .origin_form = std::move(origin->origin_form),
        };
    }

    // origin-form: Host 헤더 필수
    const auto host_it = req.find(http::field::host);
    if (host_it == req.end()) {
        return std::unexpected(invalid_target("missing Host header", target));
    }
    const std::string_view host_value{host_it->value().data(), host_it->value().size()};
    auto authority = split_authority(trim(host_value), kDefaultHttpPort);
    if (!authority) {
        return std::unexpected(authority.error());
    }
    return ForwardTarget{
        .authority   = std::move(*authority),
        .origin_form = std::string{target},
    };
}

void strip_hop_by_hop(http::fields& fields)
{
    // Connection 헤더가 지명한 필드 먼저 수집
    std::vector<std::string> named;
    for (const auto& field : fields) {
        if (field.name() != http::field::connection &&
            field.name() != http::field::proxy_connection)
        {
            continue;
        }
        std::string_view value{field.value().data(), field.value().size()};
        while (!value.empty()) {
            const auto comma = value.find(',');
            const auto token = trim(value.substr(0, comma));
            if (!token.empty() && !iequals(token, "close") && !iequals(token, "keep-alive")) {
                named.emplace_back(token);
            }
            if (comma == std::string_view::npos) {
                break;
            }
            value.remove_prefix(comma + 1);
        }
    }

    for (const auto& name : named) {
        // 프레이밍 헤더는 Connection 에 지명되어도 유지
        if (iequals(name, "content-length") || iequals(name, "transfer-encoding")) {
            continue;
        }
        fields.erase(name);
    }
    for (const auto f : kHopByHopFields) {
        fields.erase(f);
    }
    fields.erase(kUnixSocketHeader);
}

std::optional<std::string> unix_socket_path(const http::fields& fields)
{
    const auto it = fields.find(kUnixSocketHeader);
    if (it == fields.end()) {
        return std::nullopt;
    }
    const auto value = trim(std::string_view{it->value().data(), it->value().size()});
    if (value.empty()) {
        return std::nullopt;
    }
    return std::string{value};
}

bool unix_socket_allowed(const PolicyConfig& policy, std::string_view path)
{
    return std::any_of(policy.allow_unix_sockets.begin(), policy.allow_unix_sockets.end(),
                       [&](const std::string& allowed) { return allowed == path; });
}

http::response<http::string_body>
make_text_response(http::status status, std::string_view body, unsigned version)
{
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.body() = std::string{body};
    res.keep_alive(false);
    res.prepare_payload();
    return res;
}

http::response<http::string_body>
make_blocked_response(BlockReason reason, unsigned version)
{
    auto res = make_text_response(http::status::forbidden, to_string(reason), version);
    res.set(kProxyErrorHeader, to_string(reason));
    return res;
}
