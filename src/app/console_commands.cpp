#include "app/console_commands.hpp"

#include <utility>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <istream>

namespace {

std::string_view trim(std::string_view s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

ConsoleCommands::ConsoleCommands(boost::asio::io_context& io_ctx, int fd, StopCallback on_stop)
    : input_{io_ctx, ::dup(fd)}
    , on_stop_{std::move(on_stop)}
{}

auto ConsoleCommands::handle_line(std::string_view line) -> bool
{
    const auto command = trim(line);
    if (command.empty()) {
        return false;
    }
    if (command == "stop") {
        spdlog::info("[console] stop requested");
        if (on_stop_) {
            on_stop_();
        }
        return true;
    }
    spdlog::warn("[console] unknown command '{}' (available: stop)", command);
    return false;
}

auto ConsoleCommands::run() -> boost::asio::awaitable<void>
{
    while (true) {
        boost::system::error_code ec;
        co_await boost::asio::async_read_until(
            input_, buffer_, '\n',
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        // EOF 직전의 개행 없는 마지막 줄도 처리한다
        if (ec && buffer_.size() == 0) {
            if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                spdlog::warn("[console] read error: {}", ec.message());
            }
            co_return;
        }

        std::istream stream{&buffer_};
        std::string  line;
        std::getline(stream, line);

        if (handle_line(line)) {
            co_return;
        }
        if (ec) {
            co_return;
        }
    }
}

void ConsoleCommands::stop()
{
    boost::system::error_code ec;
    input_.cancel(ec);
    input_.close(ec);
}
