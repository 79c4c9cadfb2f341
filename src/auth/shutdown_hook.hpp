#pragma once

#include <atomic>
#include <functional>

// ---------------------------------------------------------------------------
// ShutdownHook
//   종료 시 한 번만 실행되는 동작 (토큰 저장).
//
//   run() 을 여러 경로(시그널, 콘솔 stop)에서 호출해도 action 은 정확히
//   한 번 실행된다. 아무도 run() 하지 않았으면 소멸자가 실행한다.
//   action 의 예외는 로그로 남기고 삼킨다 (프로세스는 어차피 종료 중이다).
// ---------------------------------------------------------------------------
class ShutdownHook {
public:
    explicit ShutdownHook(std::function<void()> action);
    ~ShutdownHook();

    ShutdownHook(const ShutdownHook&)            = delete;
    ShutdownHook& operator=(const ShutdownHook&) = delete;

    void run() noexcept;

    [[nodiscard]] auto has_run() const noexcept -> bool
    {
        return fired_.load(std::memory_order_acquire);
    }

private:
    std::function<void()> action_;
    std::atomic<bool>      fired_{false};
};
