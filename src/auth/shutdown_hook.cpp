#include "auth/shutdown_hook.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

ShutdownHook::ShutdownHook(std::function<void()> action)
    : action_{std::move(action)}
{}

ShutdownHook::~ShutdownHook()
{
    run();
}

void ShutdownHook::run() noexcept
{
    if (fired_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (!action_) {
        return;
    }
    try {
        action_();
    } catch (const std::exception& e) {
        spdlog::error("[auth] shutdown hook failed: {}", e.what());
    } catch (...) {
        // 최후 안전망: noexcept 경계 밖으로 내보내지 않는다
        spdlog::error("[auth] shutdown hook failed: unknown exception");
    }
}
