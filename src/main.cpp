#include "proxy/proxy_server.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// 환경변수 → ProxyConfig
//   값이 없거나 비어 있으면 ProxyConfig 기본값을 유지한다.
//   형식이 잘못된 값은 경고 후 무시한다.
// ---------------------------------------------------------------------------
namespace {

std::optional<std::string_view> env_raw(const char* name)
{
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return std::nullopt;
    }
    return std::string_view{val};
}

void env_override(const char* name, std::string& target)
{
    if (const auto raw = env_raw(name)) {
        target = std::string{*raw};
    }
}

void env_override(const char* name, std::uint32_t& target)
{
    const auto raw = env_raw(name);
    if (!raw) {
        return;
    }
    std::uint32_t parsed = 0;
    const auto* end = raw->data() + raw->size();
    const auto [ptr, ec] = std::from_chars(raw->data(), end, parsed);
    if (ec != std::errc{} || ptr != end) {
        spdlog::warn("env {}: '{}' is not an unsigned integer, keeping {}", name, *raw, target);
        return;
    }
    target = parsed;
}

// "1" / "true" / "yes" / "on" 만 참 (대소문자 무시), 그 외 값은 거짓
void env_override(const char* name, bool& target)
{
    const auto raw = env_raw(name);
    if (!raw) {
        return;
    }
    std::string lower;
    for (const char c : *raw) {
        lower += static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c);
    }
    target = lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

ProxyConfig config_from_env()
{
    ProxyConfig config;

    env_override("NETGATE_HTTP_ADDR",  config.http_address);
    env_override("NETGATE_SOCKS_ADDR", config.socks_address);
    env_override("NETGATE_ADMIN_ADDR", config.admin_address);

    env_override("NETGATE_DANGEROUSLY_ALLOW_NON_LOOPBACK_HTTP",  config.allow_non_loopback_http);
    env_override("NETGATE_DANGEROUSLY_ALLOW_NON_LOOPBACK_SOCKS", config.allow_non_loopback_socks);
    env_override("NETGATE_DANGEROUSLY_ALLOW_NON_LOOPBACK_ADMIN", config.allow_non_loopback_admin);

    env_override("NETGATE_POLICY_PATH", config.policy_path);
    auto watch_sec = static_cast<std::uint32_t>(config.policy_watch_interval.count());
    env_override("NETGATE_POLICY_WATCH_SEC", watch_sec);
    config.policy_watch_interval = std::chrono::seconds{watch_sec};

    env_override("NETGATE_LOG_PATH",  config.log_path);
    env_override("NETGATE_LOG_LEVEL", config.log_level);
    env_override("NETGATE_MAX_CONNECTIONS", config.max_connections);

    auto idle_sec = static_cast<std::uint32_t>(config.idle_timeout.count());
    env_override("NETGATE_IDLE_TIMEOUT_SEC", idle_sec);
    if (idle_sec == 0) {
        spdlog::warn("env NETGATE_IDLE_TIMEOUT_SEC: must be positive, keeping {}",
                     config.idle_timeout.count());
    } else {
        config.idle_timeout = std::chrono::seconds{idle_sec};
    }

    return config;
}

}  // namespace

int main()
{
    const ProxyConfig config = config_from_env();

    spdlog::info("[proxy] netgate starting (http {}, socks5 {}, admin {})",
                 config.http_address, config.socks_address, config.admin_address);
    spdlog::info("[proxy] policy file {}, watch every {}s",
                 config.policy_path, config.policy_watch_interval.count());

    boost::asio::io_context ioc;
    ProxyServer server{config};
    if (auto started = server.start(ioc); !started) {
        spdlog::error("[proxy] startup failed: {}", started.error());
        return EXIT_FAILURE;
    }
    ioc.run();

    spdlog::info("[proxy] netgate stopped");
    return EXIT_SUCCESS;
}
