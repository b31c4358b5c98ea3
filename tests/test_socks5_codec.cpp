// ---------------------------------------------------------------------------
// test_socks5_codec.cpp
//
// SOCKS5 핸드셰이크 디코더/인코더 단위 테스트.
//
// [테스트 범위]
// - 인사말: 버전 검사, NMETHODS 0, no-auth 선택 / 0xFF 거절
// - 요청: IPv4 / 도메인 / IPv6 디코드, 길이 계산
// - 오류 → 응답 코드: 0x07 (BIND/UDP), 0x08 (ATYP), 0x01
// - 연결 오류 → 응답 코드 매핑
// - 응답 인코딩 (IPv4 / IPv6 바운드 주소)
// ---------------------------------------------------------------------------

#include "proxy/socks5_codec.hpp"

#include <gtest/gtest.h>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/error.hpp>

#include <cstdint>
#include <vector>

namespace {

std::vector<std::uint8_t> domain_request(const std::string& host, std::uint16_t port,
                                         std::uint8_t cmd = kSocks5CmdConnect)
{
    std::vector<std::uint8_t> msg{kSocks5Version, cmd, 0x00, 0x03,
                                  static_cast<std::uint8_t>(host.size())};
    msg.insert(msg.end(), host.begin(), host.end());
    msg.push_back(static_cast<std::uint8_t>(port >> 8U));
    msg.push_back(static_cast<std::uint8_t>(port & 0xFFU));
    return msg;
}

}  // namespace

// ---------------------------------------------------------------------------
// 인사말
// ---------------------------------------------------------------------------
TEST(Socks5GreetingTest, ReturnsMethodCount)
{
    const std::vector<std::uint8_t> header{0x05, 0x02};
    const auto n = decode_greeting_header(header);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(*n, 2U);
}

TEST(Socks5GreetingTest, RejectsWrongVersion)
{
    const std::vector<std::uint8_t> header{0x04, 0x01};
    const auto n = decode_greeting_header(header);
    ASSERT_FALSE(n.has_value());
    EXPECT_EQ(n.error().code, ProtocolErrorCode::kUnsupportedVersion);
}

TEST(Socks5GreetingTest, RejectsZeroMethods)
{
    const std::vector<std::uint8_t> header{0x05, 0x00};
    EXPECT_FALSE(decode_greeting_header(header).has_value());
}

TEST(Socks5GreetingTest, SelectsNoAuth)
{
    const std::vector<std::uint8_t> methods{0x02, 0x00};
    EXPECT_EQ(select_method(methods), kSocks5MethodNoAuth);
}

TEST(Socks5GreetingTest, RejectsWhenNoAuthMissing)
{
    const std::vector<std::uint8_t> methods{0x02};
    EXPECT_EQ(select_method(methods), kSocks5MethodNoneUsable);

    const auto reply = encode_method_selection(kSocks5MethodNoneUsable);
    EXPECT_EQ(reply[0], 0x05);
    EXPECT_EQ(reply[1], 0xFF);
}

// ---------------------------------------------------------------------------
// 요청 디코드
// ---------------------------------------------------------------------------
TEST(Socks5RequestTest, DecodesIpv4)
{
    const std::vector<std::uint8_t> msg{0x05, 0x01, 0x00, 0x01, 93, 184, 216, 34, 0x01, 0xBB};

    const auto rest = remaining_request_bytes(msg);
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(kSocks5RequestPrefixSize + *rest, msg.size());

    const auto req = decode_request(msg);
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->host, "93.184.216.34");
    EXPECT_EQ(req->port, 443);
    EXPECT_EQ(req->address_type, Socks5AddressType::kIPv4);
}

TEST(Socks5RequestTest, DecodesDomain)
{
    const auto msg = domain_request("api.openai.com", 8443);

    const auto rest = remaining_request_bytes(msg);
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(kSocks5RequestPrefixSize + *rest, msg.size());

    const auto req = decode_request(msg);
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->host, "api.openai.com");
    EXPECT_EQ(req->port, 8443);
}

TEST(Socks5RequestTest, DecodesIpv6)
{
    std::vector<std::uint8_t> msg{0x05, 0x01, 0x00, 0x04};
    for (int i = 0; i < 15; ++i) {
        msg.push_back(0);
    }
    msg.push_back(1);  // ::1
    msg.push_back(0x00);
    msg.push_back(0x50);

    const auto rest = remaining_request_bytes(msg);
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(*rest, 17U);

    const auto req = decode_request(msg);
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->host, "::1");
    EXPECT_EQ(req->port, 80);
}

TEST(Socks5RequestTest, BindIsUnsupportedCommand)
{
    const auto msg = domain_request("example.com", 80, 0x02);
    const auto req = decode_request(msg);
    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error().code, ProtocolErrorCode::kUnsupportedCommand);
    EXPECT_EQ(reply_for_error(req.error()), Socks5Reply::kCommandNotSupported);
}

TEST(Socks5RequestTest, UdpAssociateIsUnsupportedCommand)
{
    const auto msg = domain_request("example.com", 80, 0x03);
    const auto req = decode_request(msg);
    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(reply_for_error(req.error()), Socks5Reply::kCommandNotSupported);
}

TEST(Socks5RequestTest, UnknownAddressType)
{
    const std::vector<std::uint8_t> prefix{0x05, 0x01, 0x00, 0x09, 0x00};
    const auto rest = remaining_request_bytes(prefix);
    ASSERT_FALSE(rest.has_value());
    EXPECT_EQ(rest.error().code, ProtocolErrorCode::kUnsupportedAddress);
    EXPECT_EQ(reply_for_error(rest.error()), Socks5Reply::kAddressTypeNotSupported);
}

TEST(Socks5RequestTest, EmptyDomainRejected)
{
    const auto msg = domain_request("", 80);
    const auto req = decode_request(msg);
    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error().code, ProtocolErrorCode::kInvalidTarget);
    EXPECT_EQ(reply_for_error(req.error()), Socks5Reply::kGeneralFailure);
}

TEST(Socks5RequestTest, PortZeroRejected)
{
    const auto msg = domain_request("example.com", 0);
    EXPECT_FALSE(decode_request(msg).has_value());
}

TEST(Socks5RequestTest, LengthMismatchRejected)
{
    auto msg = domain_request("example.com", 80);
    msg.pop_back();
    EXPECT_FALSE(decode_request(msg).has_value());
}

// ---------------------------------------------------------------------------
// 응답 인코딩
// ---------------------------------------------------------------------------
TEST(Socks5ReplyTest, EncodesIpv4Bound)
{
    const boost::asio::ip::tcp::endpoint bound{boost::asio::ip::make_address("10.0.0.2"), 0x1F90};
    const auto reply = encode_reply(Socks5Reply::kSucceeded, bound);

    const std::vector<std::uint8_t> expected{0x05, 0x00, 0x00, 0x01, 10, 0, 0, 2, 0x1F, 0x90};
    EXPECT_EQ(reply, expected);
}

TEST(Socks5ReplyTest, EncodesIpv6Bound)
{
    const boost::asio::ip::tcp::endpoint bound{boost::asio::ip::make_address("::1"), 443};
    const auto reply = encode_reply(Socks5Reply::kSucceeded, bound);

    ASSERT_EQ(reply.size(), 4U + 16U + 2U);
    EXPECT_EQ(reply[3], 0x04);
    EXPECT_EQ(reply[19], 1);
}

TEST(Socks5ReplyTest, FailureReplyUsesZeroAddress)
{
    const auto reply = encode_reply(Socks5Reply::kNotAllowed);

    const std::vector<std::uint8_t> expected{0x05, 0x02, 0x00, 0x01, 0, 0, 0, 0, 0, 0};
    EXPECT_EQ(reply, expected);
}

TEST(Socks5ReplyTest, ConnectErrorMapping)
{
    namespace error = boost::asio::error;

    EXPECT_EQ(reply_for_connect_error(error::host_not_found), Socks5Reply::kHostUnreachable);
    EXPECT_EQ(reply_for_connect_error(error::host_unreachable), Socks5Reply::kHostUnreachable);
    EXPECT_EQ(reply_for_connect_error(error::connection_refused), Socks5Reply::kConnectionRefused);
    EXPECT_EQ(reply_for_connect_error(error::network_unreachable), Socks5Reply::kNetworkUnreachable);
    EXPECT_EQ(reply_for_connect_error(error::timed_out), Socks5Reply::kTtlExpired);
    EXPECT_EQ(reply_for_connect_error(error::broken_pipe), Socks5Reply::kGeneralFailure);
}
