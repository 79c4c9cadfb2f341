// ---------------------------------------------------------------------------
// test_packet_classifier.cpp
//
// PacketClassifier 단위 테스트
// ---------------------------------------------------------------------------

#include "protocol/packet.hpp"
#include "protocol/packet_classifier.hpp"

#include <gtest/gtest.h>

#include <cstdint>

// ---------------------------------------------------------------------------
// 1. 고빈도 텔레메트리는 억제된다
// ---------------------------------------------------------------------------
TEST(PacketClassifierTest, MovePlayerIsSuppressed) {
    const auto c = PacketClassifier::classify(PacketKind::kMovePlayer);
    EXPECT_EQ(c.kind_name, "MovePlayer");
    EXPECT_TRUE(c.suppressed);
}

TEST(PacketClassifierTest, TelemetryKindsAreSuppressed) {
    for (const auto kind : {PacketKind::kPlayerAuthInput, PacketKind::kLevelChunk,
                            PacketKind::kSubChunk, PacketKind::kMoveActorDelta,
                            PacketKind::kStartGame, PacketKind::kCraftingData}) {
        EXPECT_TRUE(PacketClassifier::is_suppressed(kind))
            << PacketClassifier::kind_name(kind);
    }
}

// ---------------------------------------------------------------------------
// 2. 관심 대상 패킷은 억제되지 않는다
// ---------------------------------------------------------------------------
TEST(PacketClassifierTest, ChangeDimensionIsLogged) {
    const auto c = PacketClassifier::classify(PacketKind::kChangeDimension);
    EXPECT_EQ(c.kind_name, "ChangeDimension");
    EXPECT_FALSE(c.suppressed);
}

TEST(PacketClassifierTest, HandshakeKindsAreLogged) {
    for (const auto kind : {PacketKind::kLogin, PacketKind::kPlayStatus,
                            PacketKind::kDisconnect, PacketKind::kText,
                            PacketKind::kPlayerAction,
                            PacketKind::kSetLocalPlayerAsInitialised}) {
        EXPECT_FALSE(PacketClassifier::is_suppressed(kind))
            << PacketClassifier::kind_name(kind);
        EXPECT_TRUE(PacketClassifier::is_known(kind));
    }
}

// ---------------------------------------------------------------------------
// 3. 알 수 없는 ID: 실패 없이 이름을 만들고 억제하지 않는다
// ---------------------------------------------------------------------------
TEST(PacketClassifierTest, UnknownKindHasHexName) {
    const auto kind = static_cast<PacketKind>(0x0FFF);

    const auto c = PacketClassifier::classify(kind);
    EXPECT_EQ(c.kind_name, "Unknown(0xfff)");
    EXPECT_FALSE(c.suppressed);
    EXPECT_FALSE(PacketClassifier::is_known(kind));
}

TEST(PacketClassifierTest, UnknownSmallIdIsZeroPadded) {
    EXPECT_EQ(PacketClassifier::kind_name(static_cast<PacketKind>(0x10)), "Unknown(0x10)");
    EXPECT_EQ(PacketClassifier::kind_name(static_cast<PacketKind>(0x00)), "Unknown(0x00)");
}

// ---------------------------------------------------------------------------
// 4. Packet 오버로드는 kind() 를 따른다 (RawPacket 도 포함)
// ---------------------------------------------------------------------------
TEST(PacketClassifierTest, ClassifiesRawPacketById) {
    const Packet raw = RawPacket{static_cast<std::uint16_t>(PacketKind::kMovePlayer), {0x01}};

    const auto c = PacketClassifier::classify(raw);
    EXPECT_EQ(c.kind_name, "MovePlayer");
    EXPECT_TRUE(c.suppressed);
}

TEST(PacketClassifierTest, ClassificationIsStable) {
    const Packet pkt = PlayStatusPacket{0};

    const auto first  = PacketClassifier::classify(pkt);
    const auto second = PacketClassifier::classify(pkt);
    EXPECT_EQ(first.kind_name, second.kind_name);
    EXPECT_EQ(first.suppressed, second.suppressed);
}
