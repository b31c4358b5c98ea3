#pragma once

// ---------------------------------------------------------------------------
// policy_watcher.hpp
//
// 정책 파일의 mtime 을 주기적으로 확인하여 변경 시 콜백을 호출한다.
// Boost.Asio steady_timer 기반 (inotify 의존 없음).
//
// [동작]
// - 시작 시점의 mtime 을 기준값으로 기록한다.
// - interval 마다 mtime 을 비교하고 다르면 on_change() 호출.
// - 파일이 일시적으로 없으면(에디터의 rename-save 등) 경고 후 다음 주기에 재시도.
// - 콜백의 성공/실패와 무관하게 기준 mtime 은 갱신된다. 같은 잘못된 파일로
//   매 주기 재시도하지 않기 위함이며, 파일이 다시 수정되면 재시도한다.
// ---------------------------------------------------------------------------

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>

class PolicyWatcher {
public:
    using ChangeCallback = std::function<void()>;

    PolicyWatcher(std::filesystem::path     path,
                  std::chrono::milliseconds interval,
                  ChangeCallback            on_change,
                  boost::asio::io_context&  io_context);

    PolicyWatcher(const PolicyWatcher&)            = delete;
    PolicyWatcher& operator=(const PolicyWatcher&) = delete;

    // run: stop() 전까지 폴링하는 코루틴. co_spawn 으로 실행한다.
    auto run() -> boost::asio::awaitable<void>;

    void stop();

    // poll_once: 한 번 비교 후 변경 감지 시 콜백 호출. 변경 여부 반환.
    bool poll_once();

private:
    std::filesystem::path                             path_;
    std::chrono::milliseconds                         interval_;
    ChangeCallback                                    on_change_;
    boost::asio::steady_timer                         timer_;
    std::optional<std::filesystem::file_time_type>    last_mtime_{};
    std::atomic<bool>                                 stopped_{false};
};
