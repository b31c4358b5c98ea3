// ---------------------------------------------------------------------------
// test_admin_server.cpp
//
// AdminServer 라우팅 및 소켓 경로 테스트.
//
// [테스트 범위]
// - GET /health: healthy 200, unhealthy 503 + reason
// - GET /config, /patterns, /blocked, /stats 본문 형태
// - POST /mode: 본문 없음 / 잘못된 JSON / 잘못된 모드 → 400, 성공 시 세대 증가
// - POST /reload: 성공 시 새 세대, 실패 시 500 + detail (기존 정책 유지)
// - 알려진 경로에 다른 메서드 → 405, 그 외 → 404
// - 실제 소켓으로 GET /health 왕복 (port 0)
// ---------------------------------------------------------------------------

#include "admin/admin_server.hpp"
#include "stats/stats_collector.hpp"

#include <gtest/gtest.h>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <exception>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace asio = boost::asio;
namespace http = boost::beast::http;
using tcp      = asio::ip::tcp;

class NullResolver final : public HostResolver {
public:
    [[nodiscard]] auto resolve(std::string_view) const
        -> std::vector<asio::ip::address> override
    {
        return {};
    }
};

class AdminServerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        RuntimeConfig cfg{};
        cfg.mode                   = NetworkMode::kLimited;
        cfg.policy.allowed_domains = {"*.Example.COM", "api.openai.com"};
        cfg.policy.denied_domains  = {"evil.example.com"};

        engine_  = std::make_shared<PolicyEngine>(cfg, std::make_shared<NullResolver>());
        stats_   = std::make_shared<StatsCollector>();
        blocked_ = std::make_shared<BlockedRequestLog>();
        next_reload_ = cfg;

        server_ = std::make_unique<AdminServer>(
            tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0},
            engine_, stats_, blocked_,
            [this]() -> std::expected<std::uint64_t, std::string> {
                if (!reload_error_.empty()) {
                    return std::unexpected(reload_error_);
                }
                return engine_->reload(next_reload_);
            },
            io_);
    }

    asio::io_context                   io_;
    std::shared_ptr<PolicyEngine>      engine_;
    std::shared_ptr<StatsCollector>    stats_;
    std::shared_ptr<BlockedRequestLog> blocked_;
    std::unique_ptr<AdminServer>       server_;
    RuntimeConfig                      next_reload_{};
    std::string                        reload_error_{};
};

}  // namespace

// ---------------------------------------------------------------------------
// /health
// ---------------------------------------------------------------------------
TEST_F(AdminServerTest, HealthOkByDefault)
{
    const auto res = server_->handle("GET", "/health", "");
    EXPECT_EQ(res.status, 200U);
    EXPECT_EQ(res.body, R"({"status":"ok"})");
    EXPECT_EQ(server_->status(), HealthStatus::kHealthy);
}

TEST_F(AdminServerTest, HealthUnhealthyReportsReason)
{
    server_->set_unhealthy("connection limit reached");

    const auto res = server_->handle("GET", "/health", "");
    EXPECT_EQ(res.status, 503U);
    EXPECT_NE(res.body.find(R"("status":"unhealthy")"), std::string::npos);
    EXPECT_NE(res.body.find("connection limit reached"), std::string::npos);

    server_->set_healthy();
    EXPECT_EQ(server_->handle("GET", "/health", "").status, 200U);
}

TEST_F(AdminServerTest, QueryStringIgnoredForRouting)
{
    EXPECT_EQ(server_->handle("GET", "/health?verbose=1", "").status, 200U);
}

// ---------------------------------------------------------------------------
// /config, /patterns
// ---------------------------------------------------------------------------
TEST_F(AdminServerTest, ConfigShowsGenerationAndMode)
{
    const auto res = server_->handle("GET", "/config", "");
    ASSERT_EQ(res.status, 200U);
    EXPECT_NE(res.body.find(R"("generation":1)"), std::string::npos) << res.body;
    EXPECT_NE(res.body.find(R"("mode":"limited")"), std::string::npos);
    EXPECT_NE(res.body.find(R"("denied_domains":["evil.example.com"])"), std::string::npos);
    EXPECT_NE(res.body.find(R"("enabled":false)"), std::string::npos);
}

TEST_F(AdminServerTest, PatternsAreNormalized)
{
    const auto res = server_->handle("GET", "/patterns", "");
    ASSERT_EQ(res.status, 200U);
    EXPECT_EQ(res.body,
              R"({"allowed":["*.example.com","api.openai.com"],"denied":["evil.example.com"]})");
}

// ---------------------------------------------------------------------------
// /blocked
// ---------------------------------------------------------------------------
TEST_F(AdminServerTest, BlockedEmptyArray)
{
    const auto res = server_->handle("GET", "/blocked", "");
    EXPECT_EQ(res.status, 200U);
    EXPECT_EQ(res.body, "[]");
}

TEST_F(AdminServerTest, BlockedListsEntriesOldestFirst)
{
    blocked_->record(BlockedRequest{
        .host      = "a.test",
        .reason    = "blocked-by-allowlist",
        .client    = "127.0.0.1",
        .method    = std::nullopt,
        .mode      = "limited",
        .protocol  = "socks5",
        .timestamp = 100,
    });
    blocked_->record(BlockedRequest{
        .host      = "b.test",
        .reason    = "blocked-by-method-policy",
        .client    = "127.0.0.1",
        .method    = "POST",
        .mode      = "limited",
        .protocol  = "http",
        .timestamp = 200,
    });

    const auto res = server_->handle("GET", "/blocked", "");
    ASSERT_EQ(res.status, 200U);
    EXPECT_NE(res.body.find(R"("method":null)"), std::string::npos);
    EXPECT_NE(res.body.find(R"("method":"POST")"), std::string::npos);
    EXPECT_LT(res.body.find("a.test"), res.body.find("b.test"));

    // 조회는 버퍼를 비우지 않는다
    EXPECT_EQ(blocked_->size(), 2U);
}

// ---------------------------------------------------------------------------
// /stats
// ---------------------------------------------------------------------------
TEST_F(AdminServerTest, StatsReflectsCollector)
{
    stats_->on_connection_open();
    stats_->on_request(ProxyProtocol::kSocks5, true);

    const auto res = server_->handle("GET", "/stats", "");
    ASSERT_EQ(res.status, 200U);
    EXPECT_NE(res.body.find(R"("total_connections":1)"), std::string::npos) << res.body;
    EXPECT_NE(res.body.find(R"("blocked_requests":1)"), std::string::npos);
    EXPECT_NE(res.body.find(R"("socks5_requests":1)"), std::string::npos);
    EXPECT_NE(res.body.find(R"("block_rate":1.0000)"), std::string::npos);
}

// ---------------------------------------------------------------------------
// POST /mode
// ---------------------------------------------------------------------------
TEST_F(AdminServerTest, ModeSwitchBumpsGeneration)
{
    const auto res = server_->handle("POST", "/mode", R"({"mode":"full"})");
    EXPECT_EQ(res.status, 200U);
    EXPECT_EQ(res.body, R"({"status":"ok","mode":"full"})");

    const auto snap = engine_->snapshot();
    EXPECT_EQ(snap->mode(), NetworkMode::kFull);
    EXPECT_EQ(snap->generation, 2U);
}

TEST_F(AdminServerTest, ModeErrors)
{
    const auto empty = server_->handle("POST", "/mode", "");
    EXPECT_EQ(empty.status, 400U);
    EXPECT_NE(empty.body.find("missing body"), std::string::npos);

    const auto garbage = server_->handle("POST", "/mode", "{mode:");
    EXPECT_EQ(garbage.status, 400U);
    EXPECT_NE(garbage.body.find("invalid json"), std::string::npos);

    const auto unknown = server_->handle("POST", "/mode", R"({"mode":"open"})");
    EXPECT_EQ(unknown.status, 400U);
    EXPECT_NE(unknown.body.find("invalid mode"), std::string::npos);

    const auto missing = server_->handle("POST", "/mode", R"({"other":"full"})");
    EXPECT_EQ(missing.status, 400U);

    // 실패한 요청은 정책을 바꾸지 않는다
    EXPECT_EQ(engine_->snapshot()->generation, 1U);
    EXPECT_EQ(engine_->snapshot()->mode(), NetworkMode::kLimited);
}

// ---------------------------------------------------------------------------
// POST /reload
// ---------------------------------------------------------------------------
TEST_F(AdminServerTest, ReloadSuccessReturnsGeneration)
{
    next_reload_.policy.allowed_domains = {"new.example.org"};

    const auto res = server_->handle("POST", "/reload", "");
    EXPECT_EQ(res.status, 200U);
    EXPECT_EQ(res.body, R"({"status":"reloaded","generation":2})");
    EXPECT_EQ(engine_->snapshot()->allowed.patterns(),
              std::vector<std::string>{"new.example.org"});
}

TEST_F(AdminServerTest, ReloadFailureKeepsPolicy)
{
    reload_error_ = "bad yaml";

    const auto res = server_->handle("POST", "/reload", "");
    EXPECT_EQ(res.status, 500U);
    EXPECT_NE(res.body.find(R"("error":"reload failed")"), std::string::npos);
    EXPECT_NE(res.body.find("bad yaml"), std::string::npos);
    EXPECT_EQ(engine_->snapshot()->generation, 1U);
}

// ---------------------------------------------------------------------------
// 메서드 / 경로 오류
// ---------------------------------------------------------------------------
TEST_F(AdminServerTest, WrongMethodIs405)
{
    EXPECT_EQ(server_->handle("POST", "/health", "").status, 405U);
    EXPECT_EQ(server_->handle("GET", "/mode", "").status, 405U);
    EXPECT_EQ(server_->handle("DELETE", "/reload", "").status, 405U);
}

TEST_F(AdminServerTest, UnknownPathIs404)
{
    EXPECT_EQ(server_->handle("GET", "/metrics", "").status, 404U);
    EXPECT_EQ(server_->handle("GET", "/", "").status, 404U);
}

// ---------------------------------------------------------------------------
// 소켓 경로: GET /health 왕복
// ---------------------------------------------------------------------------
TEST_F(AdminServerTest, ServesHealthOverSocket)
{
    const auto endpoint = server_->local_endpoint();
    ASSERT_NE(endpoint.port(), 0);

    asio::co_spawn(io_, server_->run(), asio::detached);

    http::response<http::string_body> response;
    auto client = [&]() -> asio::awaitable<void> {
        tcp::socket socket{io_};
        co_await socket.async_connect(endpoint, asio::use_awaitable);

        http::request<http::string_body> req{http::verb::get, "/health", 11};
        req.set(http::field::host, "127.0.0.1");
        co_await http::async_write(socket, req, asio::use_awaitable);

        boost::beast::flat_buffer buffer;
        co_await http::async_read(socket, buffer, response, asio::use_awaitable);

        server_->stop();
    };

    std::exception_ptr failure;
    asio::co_spawn(io_, client(), [&](std::exception_ptr e) { failure = e; });
    io_.run_for(std::chrono::seconds{5});

    ASSERT_FALSE(failure);
    EXPECT_EQ(response.result_int(), 200U);
    EXPECT_EQ(response[http::field::content_type], "application/json");
    EXPECT_EQ(response.body(), R"({"status":"ok"})");
}
