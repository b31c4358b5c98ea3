#include "policy/policy_watcher.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

namespace {

std::optional<std::filesystem::file_time_type> read_mtime(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return mtime;
}

}  // namespace

PolicyWatcher::PolicyWatcher(std::filesystem::path     path,
                             std::chrono::milliseconds interval,
                             ChangeCallback            on_change,
                             boost::asio::io_context&  io_context)
    : path_{std::move(path)}
    , interval_{interval}
    , on_change_{std::move(on_change)}
    , timer_{io_context}
    , last_mtime_{read_mtime(path_)}
{}

bool PolicyWatcher::poll_once()
{
    const auto mtime = read_mtime(path_);
    if (!mtime) {
        spdlog::warn("[policy_watcher] cannot stat '{}', will retry", path_.string());
        return false;
    }
    if (last_mtime_ && *last_mtime_ == *mtime) {
        return false;
    }

    last_mtime_ = mtime;
    spdlog::info("[policy_watcher] '{}' changed on disk", path_.string());
    if (on_change_) {
        on_change_();
    }
    return true;
}

auto PolicyWatcher::run() -> boost::asio::awaitable<void>
{
    spdlog::info("[policy_watcher] watching '{}' every {} ms",
                 path_.string(), interval_.count());

    while (!stopped_.load(std::memory_order_acquire)) {
        timer_.expires_after(interval_);

        boost::system::error_code ec;
        co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec == boost::asio::error::operation_aborted || stopped_.load(std::memory_order_acquire)) {
            break;
        }
        poll_once();
    }
    spdlog::info("[policy_watcher] stopped");
}

void PolicyWatcher::stop()
{
    if (stopped_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    timer_.cancel();
}
