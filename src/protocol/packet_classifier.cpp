#include "protocol/packet_classifier.hpp"

#include <fmt/format.h>

#include <unordered_map>
#include <unordered_set>

namespace {

struct KindHash {
    std::size_t operator()(PacketKind kind) const noexcept
    {
        return static_cast<std::size_t>(kind);
    }
};

using NameTable     = std::unordered_map<PacketKind, std::string_view, KindHash>;
using SuppressedSet = std::unordered_set<PacketKind, KindHash>;

const NameTable& name_table()
{
    static const NameTable kNames = {
        {PacketKind::kLogin,                       "Login"},
        {PacketKind::kPlayStatus,                  "PlayStatus"},
        {PacketKind::kServerToClientHandshake,     "ServerToClientHandshake"},
        {PacketKind::kClientToServerHandshake,     "ClientToServerHandshake"},
        {PacketKind::kDisconnect,                  "Disconnect"},
        {PacketKind::kResourcePacksInfo,           "ResourcePacksInfo"},
        {PacketKind::kResourcePackStack,           "ResourcePackStack"},
        {PacketKind::kResourcePackClientResponse,  "ResourcePackClientResponse"},
        {PacketKind::kText,                        "Text"},
        {PacketKind::kSetTime,                     "SetTime"},
        {PacketKind::kStartGame,                   "StartGame"},
        {PacketKind::kAddPlayer,                   "AddPlayer"},
        {PacketKind::kAddActor,                    "AddActor"},
        {PacketKind::kRemoveActor,                 "RemoveActor"},
        {PacketKind::kAddItemActor,                "AddItemActor"},
        {PacketKind::kTakeItemActor,               "TakeItemActor"},
        {PacketKind::kMoveActorAbsolute,           "MoveActorAbsolute"},
        {PacketKind::kMovePlayer,                  "MovePlayer"},
        {PacketKind::kUpdateBlock,                 "UpdateBlock"},
        {PacketKind::kLevelEvent,                  "LevelEvent"},
        {PacketKind::kBlockEvent,                  "BlockEvent"},
        {PacketKind::kActorEvent,                  "ActorEvent"},
        {PacketKind::kMobEffect,                   "MobEffect"},
        {PacketKind::kUpdateAttributes,            "UpdateAttributes"},
        {PacketKind::kInventoryTransaction,        "InventoryTransaction"},
        {PacketKind::kMobEquipment,                "MobEquipment"},
        {PacketKind::kInteract,                    "Interact"},
        {PacketKind::kPlayerAction,                "PlayerAction"},
        {PacketKind::kSetActorData,                "SetActorData"},
        {PacketKind::kSetActorMotion,              "SetActorMotion"},
        {PacketKind::kAnimate,                     "Animate"},
        {PacketKind::kRespawn,                     "Respawn"},
        {PacketKind::kContainerOpen,               "ContainerOpen"},
        {PacketKind::kContainerClose,              "ContainerClose"},
        {PacketKind::kInventoryContent,            "InventoryContent"},
        {PacketKind::kInventorySlot,               "InventorySlot"},
        {PacketKind::kCraftingData,                "CraftingData"},
        {PacketKind::kCraftingEvent,               "CraftingEvent"},
        {PacketKind::kLevelChunk,                  "LevelChunk"},
        {PacketKind::kChangeDimension,             "ChangeDimension"},
        {PacketKind::kSetPlayerGameType,           "SetPlayerGameType"},
        {PacketKind::kPlayerList,                  "PlayerList"},
        {PacketKind::kRequestChunkRadius,          "RequestChunkRadius"},
        {PacketKind::kChunkRadiusUpdated,          "ChunkRadiusUpdated"},
        {PacketKind::kAvailableCommands,           "AvailableCommands"},
        {PacketKind::kCommandRequest,              "CommandRequest"},
        {PacketKind::kSetTitle,                    "SetTitle"},
        {PacketKind::kMoveActorDelta,              "MoveActorDelta"},
        {PacketKind::kSetLocalPlayerAsInitialised, "SetLocalPlayerAsInitialised"},
        {PacketKind::kNetworkChunkPublisherUpdate, "NetworkChunkPublisherUpdate"},
        {PacketKind::kBiomeDefinitionList,         "BiomeDefinitionList"},
        {PacketKind::kLevelSoundEvent,             "LevelSoundEvent"},
        {PacketKind::kNetworkSettings,             "NetworkSettings"},
        {PacketKind::kPlayerAuthInput,             "PlayerAuthInput"},
        {PacketKind::kCreativeContent,             "CreativeContent"},
        {PacketKind::kSubChunk,                    "SubChunk"},
        {PacketKind::kSubChunkRequest,             "SubChunkRequest"},
    };
    return kNames;
}

// 이동, 청크 스트리밍, 인벤토리 동기화, 액터 갱신 등 고빈도 텔레메트리
const SuppressedSet& suppressed_set()
{
    static const SuppressedSet kSuppressed = {
        PacketKind::kMovePlayer,
        PacketKind::kPlayerAuthInput,
        PacketKind::kSetActorData,
        PacketKind::kSetActorMotion,
        PacketKind::kMoveActorAbsolute,
        PacketKind::kMoveActorDelta,
        PacketKind::kSubChunk,
        PacketKind::kSubChunkRequest,
        PacketKind::kActorEvent,
        PacketKind::kAvailableCommands,
        PacketKind::kStartGame,
        PacketKind::kBiomeDefinitionList,
        PacketKind::kInventoryContent,
        PacketKind::kInventoryTransaction,
        PacketKind::kInventorySlot,
        PacketKind::kCreativeContent,
        PacketKind::kAddActor,
        PacketKind::kLevelEvent,
        PacketKind::kRemoveActor,
        PacketKind::kLevelSoundEvent,
        PacketKind::kSetTime,
        PacketKind::kUpdateAttributes,
        PacketKind::kNetworkChunkPublisherUpdate,
        PacketKind::kLevelChunk,
        PacketKind::kCraftingEvent,
        PacketKind::kCraftingData,
    };
    return kSuppressed;
}

}  // namespace

auto PacketClassifier::classify(const Packet& packet) -> Classification
{
    return classify(packet.kind());
}

auto PacketClassifier::classify(PacketKind kind) -> Classification
{
    return Classification{
        .kind_name  = kind_name(kind),
        .suppressed = is_suppressed(kind),
    };
}

auto PacketClassifier::kind_name(PacketKind kind) -> std::string
{
    const auto& names = name_table();
    if (const auto it = names.find(kind); it != names.end()) {
        return std::string{it->second};
    }
    return fmt::format("Unknown(0x{:02x})", static_cast<std::uint16_t>(kind));
}

auto PacketClassifier::is_known(PacketKind kind) noexcept -> bool
{
    return name_table().contains(kind);
}

auto PacketClassifier::is_suppressed(PacketKind kind) noexcept -> bool
{
    return suppressed_set().contains(kind);
}
