#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - Packet / PacketKind 를 include 하지 않는다.
//   옵저버가 패킷을 kind_name 과 필드 목록으로 풀어서 전달한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// ConnectionLog
//   세션 연결/해제 이벤트 로그.
//   event : "connect" | "disconnect" | "dial_failed"
//   reason: 해제/실패 사유 (없으면 빈 문자열)
// ---------------------------------------------------------------------------
struct ConnectionLog {
    std::uint64_t                              session_id{0};
    std::string                                event{};
    std::string                                client_ip{};
    std::uint16_t                              client_port{0};
    std::string                                reason{};
    std::chrono::system_clock::time_point      timestamp{};
};

// ---------------------------------------------------------------------------
// PacketField
//   패킷의 의미 있는 필드 하나.
//   json_value 는 이미 JSON 으로 직렬화된 값이다 (숫자, true/false, 배열 등).
// ---------------------------------------------------------------------------
struct PacketField {
    std::string name{};
    std::string json_value{};
};

// ---------------------------------------------------------------------------
// PacketLog
//   릴레이된 패킷 1개에 대한 로그.
//
//   fields 가 비어 있지 않으면 "fields" 객체로 기록하고,
//   비어 있으면 payload_size + payload_hex (앞부분만) 를 기록한다.
// ---------------------------------------------------------------------------
struct PacketLog {
    std::uint64_t                              session_id{0};
    Direction                                  direction{Direction::kClient};
    std::string                                kind_name{};
    std::vector<PacketField>                   fields{};
    std::size_t                                payload_size{0};
    std::string                                payload_hex{};
    std::chrono::system_clock::time_point      timestamp{};
};
