#pragma once

#include "common/types.hpp"
#include "protocol/packet.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

// ---------------------------------------------------------------------------
// PacketCodec
//   Packet <-> 와이어 프레임 변환.
//
//   Wire 포맷:
//     [4바이트 body length LE][body]
//     body = [2바이트 packet id LE][payload...]
//
//   payload 인코딩:
//     정수     : 고정 폭 리틀 엔디언
//     bool     : 1바이트 (0 / 1)
//     string   : [4바이트 길이 LE][바이트]
//     Vec3     : float 3개 (IEEE-754, LE)
//     BlockPos : int32 3개
//
//   구조체 arm 으로 정확히 디코딩되지 않는 payload (짧거나 남는 바이트가
//   있는 경우) 는 RawPacket 으로 보존된다. 따라서 유효한 프레임은 항상
//   디코딩에 성공하고, decode → encode 결과는 원본 바이트와 같다.
// ---------------------------------------------------------------------------
class PacketCodec {
public:
    static constexpr std::size_t   kHeaderSize  = 4;
    static constexpr std::size_t   kIdSize      = 2;
    static constexpr std::uint32_t kMaxBodySize = 16U * 1024U * 1024U;

    // -----------------------------------------------------------------------
    // body_length
    //   프레임 헤더 4바이트에서 body 길이를 읽는다.
    //   0, 1 (id 도 담을 수 없음) 또는 kMaxBodySize 초과 시 kMalformedPacket.
    // -----------------------------------------------------------------------
    static auto body_length(const std::array<std::uint8_t, kHeaderSize>& header)
        -> std::expected<std::uint32_t, RelayError>;

    // -----------------------------------------------------------------------
    // decode_body
    //   헤더를 제외한 body (id + payload) 를 Packet 으로 변환한다.
    // -----------------------------------------------------------------------
    static auto decode_body(std::span<const std::uint8_t> body)
        -> std::expected<Packet, RelayError>;

    // -----------------------------------------------------------------------
    // decode
    //   헤더를 포함한 프레임 전체를 Packet 으로 변환한다.
    //   프레임 뒤에 남는 바이트가 있으면 kMalformedPacket.
    // -----------------------------------------------------------------------
    static auto decode(std::span<const std::uint8_t> frame)
        -> std::expected<Packet, RelayError>;

    // -----------------------------------------------------------------------
    // encode
    //   헤더 + body 를 이어붙인 프레임 바이트를 반환한다.
    // -----------------------------------------------------------------------
    [[nodiscard]] static auto encode(const Packet& packet) -> std::vector<std::uint8_t>;
};
