#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>
#include <memory>

// ---------------------------------------------------------------------------
// run_concurrently
//   두 awaitable 을 현재 코루틴의 executor 위에서 동시에 실행하고
//   둘 다 끝날 때까지 기다린다 (join).
//
//   - 호출자가 strand 위에서 실행 중이면 두 작업도 같은 strand 에서 직렬화된다.
//   - 한쪽이 예외로 끝나도 다른 쪽이 끝날 때까지 기다린 뒤,
//     먼저 기록된 예외를 다시 던진다.
// ---------------------------------------------------------------------------
inline auto run_concurrently(boost::asio::awaitable<void> first,
                             boost::asio::awaitable<void> second)
    -> boost::asio::awaitable<void>
{
    auto executor = co_await boost::asio::this_coro::executor;

    struct JoinState {
        explicit JoinState(const boost::asio::any_io_executor& ex)
            : done{ex, boost::asio::steady_timer::time_point::max()}
        {}

        boost::asio::steady_timer done;
        int                       pending{2};
        std::exception_ptr        error{};
    };

    auto state = std::make_shared<JoinState>(executor);

    auto on_complete = [state](std::exception_ptr e) {
        if (e && !state->error) {
            state->error = e;
        }
        if (--state->pending == 0) {
            state->done.cancel();
        }
    };

    boost::asio::co_spawn(executor, std::move(first), on_complete);
    boost::asio::co_spawn(executor, std::move(second), on_complete);

    while (state->pending > 0) {
        boost::system::error_code ec;
        co_await state->done.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (state->error) {
        std::rethrow_exception(state->error);
    }
}
