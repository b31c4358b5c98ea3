// ---------------------------------------------------------------------------
// test_http_util.cpp
//
// HTTP 헬퍼 단위 테스트 (소켓 I/O 없음).
//
// [테스트 범위]
// - authority 분해: host / host:port / [v6] / [v6]:port / 잘못된 포트 / userinfo
// - forward 대상: absolute-form, origin-form + Host, https 스킴 거부
// - hop-by-hop 제거 (Connection 지명 필드 포함, 프레이밍 헤더 유지)
// - 차단 응답 형태 (403 + x-proxy-error)
// - unix socket 허용 목록
// ---------------------------------------------------------------------------

#include "http/http_util.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

http::request_header<> make_header(http::verb method, const std::string& target)
{
    http::request_header<> req;
    req.method(method);
    req.target(target);
    req.version(11);
    return req;
}

}  // namespace

// ---------------------------------------------------------------------------
// split_authority / format_authority
// ---------------------------------------------------------------------------
TEST(AuthorityTest, HostWithoutPortUsesDefault)
{
    const auto a = split_authority("example.com", 443);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->host, "example.com");
    EXPECT_EQ(a->port, 443);
}

TEST(AuthorityTest, HostWithPort)
{
    const auto a = split_authority("example.com:8443", 443);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->port, 8443);
}

TEST(AuthorityTest, BracketedIpv6)
{
    const auto a = split_authority("[2001:db8::1]:8080", 80);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->host, "2001:db8::1");
    EXPECT_EQ(a->port, 8080);

    const auto b = split_authority("[::1]", 80);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->host, "::1");
    EXPECT_EQ(b->port, 80);
}

TEST(AuthorityTest, InvalidInputs)
{
    EXPECT_FALSE(split_authority("", 80).has_value());
    EXPECT_FALSE(split_authority("example.com:0", 80).has_value());
    EXPECT_FALSE(split_authority("example.com:70000", 80).has_value());
    EXPECT_FALSE(split_authority("example.com:abc", 80).has_value());
    EXPECT_FALSE(split_authority(":443", 80).has_value());
    EXPECT_FALSE(split_authority("[::1", 80).has_value());
    EXPECT_FALSE(split_authority("user@example.com", 80).has_value());
}

TEST(AuthorityTest, FormatOmitsDefaultPortAndBracketsIpv6)
{
    EXPECT_EQ(format_authority("example.com", 80, 80), "example.com");
    EXPECT_EQ(format_authority("example.com", 8080, 80), "example.com:8080");
    EXPECT_EQ(format_authority("::1", 443, 443), "[::1]");
    EXPECT_EQ(format_authority("::1", 8443, 443), "[::1]:8443");
}

// ---------------------------------------------------------------------------
// parse_forward_target
// ---------------------------------------------------------------------------
TEST(ForwardTargetTest, AbsoluteForm)
{
    const auto req = make_header(http::verb::get, "http://Example.com:8080/a/b?q=1");
    const auto t = parse_forward_target(req);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->authority.host, "Example.com");
    EXPECT_EQ(t->authority.port, 8080);
    EXPECT_EQ(t->origin_form, "/a/b?q=1");
}

TEST(ForwardTargetTest, AbsoluteFormWithoutPathGetsSlash)
{
    const auto req = make_header(http::verb::get, "http://example.com");
    const auto t = parse_forward_target(req);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->authority.port, 80);
    EXPECT_EQ(t->origin_form, "/");
}

TEST(ForwardTargetTest, QueryWithoutPath)
{
    const auto req = make_header(http::verb::get, "http://example.com?x=1");
    const auto t = parse_forward_target(req);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->origin_form, "/?x=1");
}

TEST(ForwardTargetTest, OriginFormUsesHostHeader)
{
    auto req = make_header(http::verb::get, "/index.html");
    req.set(http::field::host, "example.com:8000");
    const auto t = parse_forward_target(req);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->authority.host, "example.com");
    EXPECT_EQ(t->authority.port, 8000);
    EXPECT_EQ(t->origin_form, "/index.html");
}

TEST(ForwardTargetTest, OriginFormWithoutHostFails)
{
    const auto req = make_header(http::verb::get, "/index.html");
    EXPECT_FALSE(parse_forward_target(req).has_value());
}

TEST(ForwardTargetTest, HttpsSchemeRejected)
{
    const auto req = make_header(http::verb::get, "https://example.com/");
    const auto t = parse_forward_target(req);
    ASSERT_FALSE(t.has_value());
    EXPECT_EQ(t.error().code, ProtocolErrorCode::kInvalidTarget);
}

TEST(OriginTargetTest, StripsFragment)
{
    const auto t = parse_origin_target("https://example.com/p#frag", 443);
    ASSERT_TRUE(t.has_value());
    ASSERT_TRUE(t->authority.has_value());
    EXPECT_EQ(t->authority->port, 443);
    EXPECT_EQ(t->origin_form, "/p");
}

TEST(OriginTargetTest, OriginFormHasNoAuthority)
{
    const auto t = parse_origin_target("/v1/models", 443);
    ASSERT_TRUE(t.has_value());
    EXPECT_FALSE(t->authority.has_value());
    EXPECT_EQ(t->origin_form, "/v1/models");
}

// ---------------------------------------------------------------------------
// strip_hop_by_hop
// ---------------------------------------------------------------------------
TEST(HopByHopTest, RemovesStandardHopHeaders)
{
    http::fields f;
    f.set(http::field::connection, "keep-alive");
    f.set(http::field::proxy_connection, "keep-alive");
    f.set(http::field::keep_alive, "timeout=5");
    f.set(http::field::proxy_authorization, "Basic abc");
    f.set(http::field::te, "trailers");
    f.set(http::field::upgrade, "websocket");
    f.set(kUnixSocketHeader, "/var/run/docker.sock");
    f.set(http::field::user_agent, "curl");

    strip_hop_by_hop(f);

    EXPECT_EQ(f.count(http::field::connection), 0U);
    EXPECT_EQ(f.count(http::field::proxy_connection), 0U);
    EXPECT_EQ(f.count(http::field::keep_alive), 0U);
    EXPECT_EQ(f.count(http::field::proxy_authorization), 0U);
    EXPECT_EQ(f.count(http::field::te), 0U);
    EXPECT_EQ(f.count(http::field::upgrade), 0U);
    EXPECT_EQ(f.count(kUnixSocketHeader), 0U);
    EXPECT_EQ(f.count(http::field::user_agent), 1U);
}

TEST(HopByHopTest, RemovesFieldsNamedByConnection)
{
    http::fields f;
    f.set(http::field::connection, "close, X-Secret , Content-Length");
    f.set("X-Secret", "1");
    f.set(http::field::content_length, "10");

    strip_hop_by_hop(f);

    EXPECT_EQ(f.count("X-Secret"), 0U);
    EXPECT_EQ(f.count(http::field::content_length), 1U);
}

// ---------------------------------------------------------------------------
// 응답 생성
// ---------------------------------------------------------------------------
TEST(BlockedResponseTest, ShapeAndHeader)
{
    const auto res = make_blocked_response(BlockReason::kMitmRequired);

    EXPECT_EQ(res.result(), http::status::forbidden);
    EXPECT_EQ(res[kProxyErrorHeader], "blocked-by-mitm-required");
    EXPECT_EQ(res.body(), "blocked-by-mitm-required");
    EXPECT_FALSE(res.keep_alive());
    EXPECT_EQ(res[http::field::content_length], std::to_string(res.body().size()));
}

TEST(BlockedResponseTest, HonorsVersion)
{
    const auto res = make_blocked_response(BlockReason::kDenylist, 10);
    EXPECT_EQ(res.version(), 10U);
}

// ---------------------------------------------------------------------------
// unix socket
// ---------------------------------------------------------------------------
TEST(UnixSocketTest, HeaderAndAllowList)
{
    http::fields f;
    EXPECT_FALSE(unix_socket_path(f).has_value());

    f.set(kUnixSocketHeader, " /var/run/docker.sock ");
    const auto path = unix_socket_path(f);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, "/var/run/docker.sock");

    PolicyConfig policy;
    policy.allow_unix_sockets = {"/var/run/docker.sock"};
    EXPECT_TRUE(unix_socket_allowed(policy, *path));
    EXPECT_FALSE(unix_socket_allowed(policy, "/tmp/other.sock"));
}

TEST(IpLiteralTest, Detects)
{
    EXPECT_TRUE(is_ip_literal("127.0.0.1"));
    EXPECT_TRUE(is_ip_literal("::1"));
    EXPECT_FALSE(is_ip_literal("example.com"));
    EXPECT_FALSE(is_ip_literal("[::1]"));
}
