#pragma once

#include "common/types.hpp"
#include "logger/log_types.hpp"
#include "logger/structured_logger.hpp"
#include "protocol/packet.hpp"

#include <cstdint>
#include <memory>
#include <optional>

// ---------------------------------------------------------------------------
// PacketObserver
//   릴레이 루프가 패킷을 전달하기 직전에 동기 호출하는 검사 훅.
//
//   - 릴레이 루프 안에서 인라인으로 호출되므로 지연은 더할 수 있지만
//     순서를 바꾸지는 않는다.
//   - 어떤 경우에도 예외를 밖으로 던지지 않는다 (noexcept).
// ---------------------------------------------------------------------------
class PacketObserver {
public:
    virtual ~PacketObserver() = default;

    virtual void observe(std::uint64_t session_id,
                         Direction     direction,
                         const Packet& packet) noexcept = 0;
};

// ---------------------------------------------------------------------------
// LoggingObserver
//   기본 옵저버. PacketClassifier 로 분류한 뒤
//     - 억제 대상이면 아무것도 기록하지 않는다.
//     - ChangeDimension / PlayStatus / PlayerAction / SetLocalPlayerAsInitialised
//       은 의미 있는 필드를 "fields" 로 기록한다.
//     - 나머지는 종류 이름 + payload 덤프(앞 kMaxDumpBytes 바이트)를 기록한다.
// ---------------------------------------------------------------------------
class LoggingObserver final : public PacketObserver {
public:
    static constexpr std::size_t kMaxDumpBytes = 64;

    explicit LoggingObserver(std::shared_ptr<StructuredLogger> logger);

    void observe(std::uint64_t session_id,
                 Direction     direction,
                 const Packet& packet) noexcept override;

    // -----------------------------------------------------------------------
    // describe
    //   packet 에 대한 로그 레코드를 만든다. 억제 대상이면 std::nullopt.
    //   timestamp 는 호출 시각으로 채운다.
    // -----------------------------------------------------------------------
    [[nodiscard]] static auto describe(std::uint64_t session_id,
                                       Direction     direction,
                                       const Packet& packet) -> std::optional<PacketLog>;

private:
    std::shared_ptr<StructuredLogger> logger_;
};
