// ---------------------------------------------------------------------------
// test_console_commands.cpp
//
// ConsoleCommands 단위 테스트
//   표준 입력 대신 pipe 를 연결해 읽기 루프를 검증한다.
// ---------------------------------------------------------------------------

#include "app/console_commands.hpp"

#include <gtest/gtest.h>

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <unistd.h>

#include <chrono>
#include <string>

namespace {

// ---------------------------------------------------------------------------
// Pipe: 테스트 동안 열린 pipe 한 쌍
// ---------------------------------------------------------------------------
class Pipe {
public:
    Pipe() {
        if (::pipe(fds_) != 0) {
            fds_[0] = fds_[1] = -1;
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&)            = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] int read_fd() const { return fds_[0]; }

    bool write(const std::string& text) {
        return ::write(fds_[1], text.data(), text.size()) == static_cast<ssize_t>(text.size());
    }

    void close_read() {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void close_write() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2]{-1, -1};
};

}  // namespace

// ---------------------------------------------------------------------------
// 1. handle_line: stop / 공백 / 알 수 없는 명령
// ---------------------------------------------------------------------------
TEST(ConsoleCommandsTest, HandleLineRecognisesStop) {
    boost::asio::io_context ioc;
    Pipe                    pipe;
    ASSERT_GE(pipe.read_fd(), 0);

    int stops = 0;
    ConsoleCommands console{ioc, pipe.read_fd(), [&stops] { ++stops; }};

    EXPECT_FALSE(console.handle_line(""));
    EXPECT_FALSE(console.handle_line("   "));
    EXPECT_FALSE(console.handle_line("status"));
    EXPECT_EQ(stops, 0);

    EXPECT_TRUE(console.handle_line("  stop\r"));
    EXPECT_EQ(stops, 1);
}

// ---------------------------------------------------------------------------
// 2. run: 알 수 없는 명령은 건너뛰고 stop 에서 종료
// ---------------------------------------------------------------------------
TEST(ConsoleCommandsTest, RunStopsOnStopCommand) {
    boost::asio::io_context ioc;
    Pipe                    pipe;
    ASSERT_GE(pipe.read_fd(), 0);

    int stops = 0;
    ConsoleCommands console{ioc, pipe.read_fd(), [&stops] { ++stops; }};

    ASSERT_TRUE(pipe.write("help\nstop\nstop\n"));

    bool finished = false;
    boost::asio::co_spawn(ioc, console.run(), [&finished](std::exception_ptr eptr) {
        EXPECT_FALSE(eptr);
        finished = true;
    });
    ioc.run_for(std::chrono::seconds(5));

    EXPECT_TRUE(finished);
    EXPECT_EQ(stops, 1);
}

// ---------------------------------------------------------------------------
// 3. run: EOF 는 콜백 없이 조용히 종료, 개행 없는 마지막 줄도 처리
// ---------------------------------------------------------------------------
TEST(ConsoleCommandsTest, EofEndsQuietly) {
    boost::asio::io_context ioc;
    Pipe                    pipe;
    ASSERT_GE(pipe.read_fd(), 0);

    int stops = 0;
    ConsoleCommands console{ioc, pipe.read_fd(), [&stops] { ++stops; }};

    ASSERT_TRUE(pipe.write("unknown\n"));
    pipe.close_write();

    bool finished = false;
    boost::asio::co_spawn(ioc, console.run(), [&finished](std::exception_ptr) { finished = true; });
    ioc.run_for(std::chrono::seconds(5));

    EXPECT_TRUE(finished);
    EXPECT_EQ(stops, 0);
}

TEST(ConsoleCommandsTest, FinalLineWithoutNewline) {
    boost::asio::io_context ioc;
    Pipe                    pipe;
    ASSERT_GE(pipe.read_fd(), 0);

    int stops = 0;
    ConsoleCommands console{ioc, pipe.read_fd(), [&stops] { ++stops; }};

    ASSERT_TRUE(pipe.write("stop"));
    pipe.close_write();

    boost::asio::co_spawn(ioc, console.run(), boost::asio::detached);
    ioc.run_for(std::chrono::seconds(5));

    EXPECT_EQ(stops, 1);
}

// ---------------------------------------------------------------------------
// 4. stop(): 대기 중인 읽기를 취소한다
// ---------------------------------------------------------------------------
TEST(ConsoleCommandsTest, StopCancelsPendingRead) {
    boost::asio::io_context ioc;
    Pipe                    pipe;
    ASSERT_GE(pipe.read_fd(), 0);

    ConsoleCommands console{ioc, pipe.read_fd(), [] {}};

    bool finished = false;
    boost::asio::co_spawn(ioc, console.run(), [&finished](std::exception_ptr) { finished = true; });

    ioc.poll();
    EXPECT_FALSE(finished);

    console.stop();
    ioc.run_for(std::chrono::seconds(5));
    EXPECT_TRUE(finished);
}
