// ---------------------------------------------------------------------------
// test_packet_codec.cpp
//
// PacketCodec / Packet 단위 테스트
// ---------------------------------------------------------------------------

#include "protocol/packet.hpp"
#include "protocol/packet_codec.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <span>
#include <vector>

// ===========================================================================
// 프레임 헤더
// ===========================================================================

// ---------------------------------------------------------------------------
// 1. encode: 헤더는 body(id + payload) 길이, id 는 리틀 엔디언
// ---------------------------------------------------------------------------
TEST(PacketCodecEncode, PlayStatusLayout) {
    const Packet pkt = PlayStatusPacket{3};

    const auto frame = PacketCodec::encode(pkt);

    const std::vector<std::uint8_t> expected = {
        0x06, 0x00, 0x00, 0x00,  // body length = 6
        0x02, 0x00,              // id = PlayStatus
        0x03, 0x00, 0x00, 0x00   // status = 3 (PlayerSpawn)
    };
    EXPECT_EQ(frame, expected);
}

// ---------------------------------------------------------------------------
// 2. body_length: id 도 담지 못하는 길이 → kMalformedPacket
// ---------------------------------------------------------------------------
TEST(PacketCodecHeader, RejectsTooShortBody) {
    const std::array<std::uint8_t, PacketCodec::kHeaderSize> header = {0x01, 0x00, 0x00, 0x00};

    auto result = PacketCodec::body_length(header);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, RelayErrorCode::kMalformedPacket);
}

// ---------------------------------------------------------------------------
// 3. body_length: 상한 초과 → kMalformedPacket
// ---------------------------------------------------------------------------
TEST(PacketCodecHeader, RejectsOversizedBody) {
    const std::array<std::uint8_t, PacketCodec::kHeaderSize> header = {0x01, 0x00, 0x00, 0x02};

    auto result = PacketCodec::body_length(header);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, RelayErrorCode::kMalformedPacket);
    EXPECT_EQ(result.error().message, "frame too large");
}

TEST(PacketCodecHeader, AcceptsMinimalBody) {
    const std::array<std::uint8_t, PacketCodec::kHeaderSize> header = {0x02, 0x00, 0x00, 0x00};

    auto result = PacketCodec::body_length(header);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 2U);
}

// ===========================================================================
// decode
// ===========================================================================

// ---------------------------------------------------------------------------
// 4. 선언 길이보다 짧은 프레임 / 남는 바이트
// ---------------------------------------------------------------------------
TEST(PacketCodecDecode, ErrorIncompleteBody) {
    const std::vector<std::uint8_t> data = {
        0x0A, 0x00, 0x00, 0x00,  // body length = 10
        0x02, 0x00, 0x00         // 3바이트만 제공
    };

    auto result = PacketCodec::decode(std::span<const std::uint8_t>{data});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, RelayErrorCode::kMalformedPacket);
    EXPECT_EQ(result.error().message, "incomplete frame body");
}

TEST(PacketCodecDecode, ErrorTrailingBytes) {
    auto data = PacketCodec::encode(Packet{PlayStatusPacket{0}});
    data.push_back(0xFF);

    auto result = PacketCodec::decode(std::span<const std::uint8_t>{data});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "trailing bytes after frame");
}

TEST(PacketCodecDecode, ErrorHeaderIncomplete) {
    const std::vector<std::uint8_t> data = {0x02, 0x00};

    auto result = PacketCodec::decode(std::span<const std::uint8_t>{data});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, RelayErrorCode::kMalformedPacket);
}

// ---------------------------------------------------------------------------
// 5. 구조체 arm 디코딩
// ---------------------------------------------------------------------------
TEST(PacketCodecDecode, LoginFields) {
    const Packet original = LoginPacket{594, R"({"DeviceOS":7})", "tok-123"};

    const auto frame  = PacketCodec::encode(original);
    auto       result = PacketCodec::decode(std::span<const std::uint8_t>{frame});
    ASSERT_TRUE(result.has_value());

    const auto* login = result->as<LoginPacket>();
    ASSERT_NE(login, nullptr);
    EXPECT_EQ(login->protocol_version, 594);
    EXPECT_EQ(login->client_data, R"({"DeviceOS":7})");
    EXPECT_EQ(login->access_token, "tok-123");
    EXPECT_EQ(result->kind(), PacketKind::kLogin);
}

TEST(PacketCodecDecode, StartGameKeepsOpaqueTail) {
    StartGamePacket start;
    start.entity_unique_id  = -5;
    start.entity_runtime_id = 77;
    start.dimension         = 1;
    start.world_name        = "Bedrock level";
    start.extra             = {0xDE, 0xAD, 0xBE, 0xEF};

    const auto frame  = PacketCodec::encode(Packet{start});
    auto       result = PacketCodec::decode(std::span<const std::uint8_t>{frame});
    ASSERT_TRUE(result.has_value());

    const auto* decoded = result->as<StartGamePacket>();
    ASSERT_NE(decoded, nullptr);
    EXPECT_EQ(*decoded, start);
}

TEST(PacketCodecDecode, PlayerActionFields) {
    const PlayerActionPacket action{42, 18, BlockPos{1, 64, -3}, BlockPos{1, 65, -3}, 1};

    const auto frame  = PacketCodec::encode(Packet{action});
    auto       result = PacketCodec::decode(std::span<const std::uint8_t>{frame});
    ASSERT_TRUE(result.has_value());

    const auto* decoded = result->as<PlayerActionPacket>();
    ASSERT_NE(decoded, nullptr);
    EXPECT_EQ(decoded->block_position, (BlockPos{1, 64, -3}));
    EXPECT_EQ(decoded->block_face, 1);
}

// ---------------------------------------------------------------------------
// 6. 구조가 맞지 않는 payload 는 RawPacket 으로 보존된다
// ---------------------------------------------------------------------------
TEST(PacketCodecDecode, ShortStructuredPayloadFallsBackToRaw) {
    const std::vector<std::uint8_t> data = {
        0x04, 0x00, 0x00, 0x00,  // body length = 4
        0x02, 0x00,              // id = PlayStatus
        0x01, 0x00               // status 는 4바이트여야 한다
    };

    auto result = PacketCodec::decode(std::span<const std::uint8_t>{data});
    ASSERT_TRUE(result.has_value());

    const auto* raw = result->as<RawPacket>();
    ASSERT_NE(raw, nullptr);
    EXPECT_EQ(raw->id, 0x02);
    EXPECT_EQ(raw->payload, (std::vector<std::uint8_t>{0x01, 0x00}));
    EXPECT_EQ(result->kind(), PacketKind::kPlayStatus);

    // 재인코딩 결과는 원본 바이트와 같다
    EXPECT_EQ(PacketCodec::encode(*result), data);
}

TEST(PacketCodecDecode, InvalidBoolFallsBackToRaw) {
    const std::vector<std::uint8_t> data = {
        0x07, 0x00, 0x00, 0x00,
        0x05, 0x00,              // id = Disconnect
        0x02,                    // bool 은 0/1 만 허용
        0x00, 0x00, 0x00, 0x00   // message = ""
    };

    auto result = PacketCodec::decode(std::span<const std::uint8_t>{data});
    ASSERT_TRUE(result.has_value());
    EXPECT_NE(result->as<RawPacket>(), nullptr);
}

// ---------------------------------------------------------------------------
// 7. 이름 테이블에 없는 ID 도 합법
// ---------------------------------------------------------------------------
TEST(PacketCodecDecode, UnknownIdIsCarriedVerbatim) {
    const std::vector<std::uint8_t> data = {
        0x05, 0x00, 0x00, 0x00,
        0x34, 0x12,              // id = 0x1234
        0x0A, 0x0B, 0x0C
    };

    auto result = PacketCodec::decode(std::span<const std::uint8_t>{data});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->id(), 0x1234);
    EXPECT_EQ(PacketCodec::encode(*result), data);
}

// ===========================================================================
// Packet
// ===========================================================================
TEST(PacketTest, DefaultIsEmptyRaw) {
    const Packet pkt;
    EXPECT_NE(pkt.as<RawPacket>(), nullptr);
    EXPECT_EQ(pkt.id(), 0);
}

TEST(PacketTest, EqualityComparesBody) {
    const Packet a = RawPacket{0x09, {1, 2, 3}};
    const Packet b = RawPacket{0x09, {1, 2, 3}};
    const Packet c = RawPacket{0x09, {1, 2}};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
