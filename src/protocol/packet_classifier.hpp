#pragma once

#include "protocol/packet.hpp"

#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// Classification
//   kind_name  : 패킷 종류의 안정적인 이름 (예: "MovePlayer")
//   suppressed : 고빈도 텔레메트리 종류라서 로그에서 제외되는지 여부
// ---------------------------------------------------------------------------
struct Classification {
    std::string kind_name{};
    bool        suppressed{false};
};

// ---------------------------------------------------------------------------
// PacketClassifier
//   패킷 종류 → {이름, 억제 여부} 매핑.
//
//   이름 테이블과 억제 집합은 PacketKind 닫힌 집합에서 최초 사용 시 한 번
//   만들어지고 이후 변경되지 않는다. 알 수 없는 ID 는 "Unknown(0x..)" 이며
//   억제되지 않는다.
//
//   순수 함수 집합. 실패 경로 없음.
// ---------------------------------------------------------------------------
class PacketClassifier {
public:
    [[nodiscard]] static auto classify(const Packet& packet) -> Classification;
    [[nodiscard]] static auto classify(PacketKind kind) -> Classification;

    // kind_name: 알려진 종류면 이름, 아니면 "Unknown(0x..)"
    [[nodiscard]] static auto kind_name(PacketKind kind) -> std::string;

    [[nodiscard]] static auto is_known(PacketKind kind) noexcept -> bool;
    [[nodiscard]] static auto is_suppressed(PacketKind kind) noexcept -> bool;
};
