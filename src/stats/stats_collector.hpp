#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 릴레이 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_session_open / on_session_close / on_packet / on_dial_failure:
//   세션 strand 들에서 동시에 호출되어도 안전하다 (atomic 사용).
// - snapshot(): 갱신 경로와 mutex 없이 읽는다.
//
// 모든 갱신 메서드는 noexcept 이다. 통계 실패가 릴레이로 전파되지 않는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                              total_sessions{0};
    std::uint64_t                              active_sessions{0};
    std::uint64_t                              client_packets{0};   // client → upstream
    std::uint64_t                              server_packets{0};   // upstream → client
    std::uint64_t                              dial_failures{0};
    std::chrono::system_clock::time_point      captured_at{};
};

class StatsCollector {
public:
    StatsCollector() noexcept = default;
    ~StatsCollector()         = default;

    // 복사/이동 금지 (atomic)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    void on_session_open() noexcept {
        total_sessions_.fetch_add(1, std::memory_order_relaxed);
        active_sessions_.fetch_add(1, std::memory_order_relaxed);
    }

    // active_sessions 는 0 아래로 내려가지 않는다
    void on_session_close() noexcept {
        std::uint64_t current = active_sessions_.load(std::memory_order_relaxed);
        while (current > 0
               && !active_sessions_.compare_exchange_weak(current, current - 1,
                                                          std::memory_order_relaxed)) {
        }
    }

    // on_packet
    //   dir 방향으로 패킷 1개가 전달되었을 때 호출한다.
    void on_packet(Direction dir) noexcept {
        if (dir == Direction::kClient) {
            client_packets_.fetch_add(1, std::memory_order_relaxed);
        } else {
            server_packets_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void on_dial_failure() noexcept {
        dial_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        return StatsSnapshot{
            .total_sessions  = total_sessions_.load(std::memory_order_relaxed),
            .active_sessions = active_sessions_.load(std::memory_order_relaxed),
            .client_packets  = client_packets_.load(std::memory_order_relaxed),
            .server_packets  = server_packets_.load(std::memory_order_relaxed),
            .dial_failures   = dial_failures_.load(std::memory_order_relaxed),
            .captured_at     = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> total_sessions_{0};
    std::atomic<std::uint64_t> active_sessions_{0};
    std::atomic<std::uint64_t> client_packets_{0};
    std::atomic<std::uint64_t> server_packets_{0};
    std::atomic<std::uint64_t> dial_failures_{0};
};
