#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// PacketKind
//   게임 프로토콜 패킷 ID.
//   릴레이가 이름을 알고 있는 닫힌 집합이다. 이 집합 밖의 ID 도 합법이며
//   RawPacket 으로 그대로 운반된다 (static_cast<PacketKind>(id)).
// ---------------------------------------------------------------------------
enum class PacketKind : std::uint16_t {
    kLogin                       = 0x01,
    kPlayStatus                  = 0x02,
    kServerToClientHandshake     = 0x03,
    kClientToServerHandshake     = 0x04,
    kDisconnect                  = 0x05,
    kResourcePacksInfo           = 0x06,
    kResourcePackStack           = 0x07,
    kResourcePackClientResponse  = 0x08,
    kText                        = 0x09,
    kSetTime                     = 0x0A,
    kStartGame                   = 0x0B,
    kAddPlayer                   = 0x0C,
    kAddActor                    = 0x0D,
    kRemoveActor                 = 0x0E,
    kAddItemActor                = 0x0F,
    kTakeItemActor               = 0x11,
    kMoveActorAbsolute           = 0x12,
    kMovePlayer                  = 0x13,
    kUpdateBlock                 = 0x15,
    kLevelEvent                  = 0x19,
    kBlockEvent                  = 0x1A,
    kActorEvent                  = 0x1B,
    kMobEffect                   = 0x1C,
    kUpdateAttributes            = 0x1D,
    kInventoryTransaction        = 0x1E,
    kMobEquipment                = 0x1F,
    kInteract                    = 0x21,
    kPlayerAction                = 0x24,
    kSetActorData                = 0x27,
    kSetActorMotion              = 0x28,
    kAnimate                     = 0x2C,
    kRespawn                     = 0x2D,
    kContainerOpen               = 0x2E,
    kContainerClose              = 0x2F,
    kInventoryContent            = 0x31,
    kInventorySlot               = 0x32,
    kCraftingData                = 0x34,
    kCraftingEvent               = 0x35,
    kLevelChunk                  = 0x3A,
    kChangeDimension             = 0x3D,
    kSetPlayerGameType           = 0x3E,
    kPlayerList                  = 0x3F,
    kRequestChunkRadius          = 0x45,
    kChunkRadiusUpdated          = 0x46,
    kAvailableCommands           = 0x4C,
    kCommandRequest              = 0x4D,
    kSetTitle                    = 0x58,
    kMoveActorDelta              = 0x6F,
    kSetLocalPlayerAsInitialised = 0x71,
    kNetworkChunkPublisherUpdate = 0x79,
    kBiomeDefinitionList         = 0x7A,
    kLevelSoundEvent             = 0x7B,
    kNetworkSettings             = 0x8F,
    kPlayerAuthInput             = 0x90,
    kCreativeContent             = 0x91,
    kSubChunk                    = 0xAE,
    kSubChunkRequest             = 0xAF,
};

// ---------------------------------------------------------------------------
// PlayStatusCode
//   PlayStatus 패킷의 status 값.
// ---------------------------------------------------------------------------
enum class PlayStatusCode : std::int32_t {
    kLoginSuccess              = 0,
    kLoginFailedClient         = 1,
    kLoginFailedServer         = 2,
    kPlayerSpawn               = 3,
    kLoginFailedInvalidTenant  = 4,
    kLoginFailedVanillaEdu     = 5,
    kLoginFailedEduVanilla     = 6,
    kLoginFailedServerFull     = 7,
};

struct Vec3 {
    float x{0.0F};
    float y{0.0F};
    float z{0.0F};

    friend bool operator==(const Vec3&, const Vec3&) = default;
};

struct BlockPos {
    std::int32_t x{0};
    std::int32_t y{0};
    std::int32_t z{0};

    friend bool operator==(const BlockPos&, const BlockPos&) = default;
};

// ---------------------------------------------------------------------------
// 필드가 해석되는 패킷들 (variant arm)
//   핸드셰이크에 필요한 패킷과 옵저버가 의미 있는 필드를 기록하는 패킷만
//   구조체로 디코딩한다. 나머지는 RawPacket 이다.
// ---------------------------------------------------------------------------
struct LoginPacket {
    static constexpr PacketKind kKind = PacketKind::kLogin;

    std::int32_t protocol_version{0};
    std::string  client_data{};   // 클라이언트 메타데이터 (불투명 텍스트, 원문 유지)
    std::string  access_token{};  // 업스트림 방향 Login 에만 채워진다

    friend bool operator==(const LoginPacket&, const LoginPacket&) = default;
};

struct PlayStatusPacket {
    static constexpr PacketKind kKind = PacketKind::kPlayStatus;

    std::int32_t status{0};

    friend bool operator==(const PlayStatusPacket&, const PlayStatusPacket&) = default;
};

struct DisconnectPacket {
    static constexpr PacketKind kKind = PacketKind::kDisconnect;

    bool        hide_screen{false};
    std::string message{};

    friend bool operator==(const DisconnectPacket&, const DisconnectPacket&) = default;
};

struct StartGamePacket {
    static constexpr PacketKind kKind = PacketKind::kStartGame;

    std::int64_t              entity_unique_id{0};
    std::uint64_t             entity_runtime_id{0};
    std::int32_t              dimension{0};
    std::string               world_name{};
    std::vector<std::uint8_t> extra{};  // 릴레이가 해석하지 않는 나머지 게임 데이터

    friend bool operator==(const StartGamePacket&, const StartGamePacket&) = default;
};

struct ChangeDimensionPacket {
    static constexpr PacketKind kKind = PacketKind::kChangeDimension;

    std::int32_t dimension{0};
    Vec3         position{};
    bool         respawn{false};

    friend bool operator==(const ChangeDimensionPacket&, const ChangeDimensionPacket&) = default;
};

struct PlayerActionPacket {
    static constexpr PacketKind kKind = PacketKind::kPlayerAction;

    std::uint64_t entity_runtime_id{0};
    std::int32_t  action_type{0};
    BlockPos      block_position{};
    BlockPos      result_position{};
    std::int32_t  block_face{0};

    friend bool operator==(const PlayerActionPacket&, const PlayerActionPacket&) = default;
};

struct SetLocalPlayerAsInitialisedPacket {
    static constexpr PacketKind kKind = PacketKind::kSetLocalPlayerAsInitialised;

    std::uint64_t entity_runtime_id{0};

    friend bool operator==(const SetLocalPlayerAsInitialisedPacket&,
                           const SetLocalPlayerAsInitialisedPacket&) = default;
};

// RawPacket: 필드를 해석하지 않는 모든 종류. payload 는 와이어 바이트 그대로.
struct RawPacket {
    std::uint16_t             id{0};
    std::vector<std::uint8_t> payload{};

    friend bool operator==(const RawPacket&, const RawPacket&) = default;
};

using PacketBody = std::variant<
    LoginPacket,
    PlayStatusPacket,
    DisconnectPacket,
    StartGamePacket,
    ChangeDimensionPacket,
    PlayerActionPacket,
    SetLocalPlayerAsInitialisedPacket,
    RawPacket>;

// ---------------------------------------------------------------------------
// Packet
//   디코딩된 프로토콜 메시지 1개. 릴레이는 Packet 을 변경하지 않는다.
//   kind() 가 variant 의 판별자 역할을 한다.
// ---------------------------------------------------------------------------
class Packet {
public:
    Packet() = default;

    template <typename Body>
        requires (!std::is_same_v<std::remove_cvref_t<Body>, Packet>
                  && std::is_constructible_v<PacketBody, Body&&>)
    Packet(Body&& body)  // NOLINT(google-explicit-constructor)
        : body_{std::forward<Body>(body)}
    {}

    [[nodiscard]] auto kind() const noexcept -> PacketKind;
    [[nodiscard]] auto id()   const noexcept -> std::uint16_t
    {
        return static_cast<std::uint16_t>(kind());
    }

    [[nodiscard]] auto body() const noexcept -> const PacketBody& { return body_; }

    template <typename T>
    [[nodiscard]] auto as() const noexcept -> const T*
    {
        return std::get_if<T>(&body_);
    }

    friend bool operator==(const Packet&, const Packet&) = default;

private:
    PacketBody body_{RawPacket{}};
};
