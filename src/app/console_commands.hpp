#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/streambuf.hpp>

#include <functional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ConsoleCommands
//   운영자 콘솔(표준 입력)에서 한 줄씩 명령을 읽는다.
//
//   "stop"   → on_stop 콜백 (한 번 호출 후 읽기 종료)
//   그 외    → 알 수 없는 명령으로 경고
//   EOF      → 조용히 종료
//
//   fd 는 dup 되어 소유된다. 원래 fd 는 닫지 않는다.
// ---------------------------------------------------------------------------
class ConsoleCommands {
public:
    using StopCallback = std::function<void()>;

    ConsoleCommands(boost::asio::io_context& io_ctx, int fd, StopCallback on_stop);

    ConsoleCommands(const ConsoleCommands&)            = delete;
    ConsoleCommands& operator=(const ConsoleCommands&) = delete;

    // 읽기 루프 코루틴
    auto run() -> boost::asio::awaitable<void>;

    // 진행 중인 읽기를 취소한다
    void stop();

    // handle_line
    //   한 줄을 해석한다. stop 이면 true.
    [[nodiscard]] auto handle_line(std::string_view line) -> bool;

private:
    boost::asio::posix::stream_descriptor input_;
    boost::asio::streambuf                buffer_;
    StopCallback                          on_stop_;
};
