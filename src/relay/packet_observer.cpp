#include "relay/packet_observer.hpp"

#include "protocol/packet_classifier.hpp"
#include "protocol/packet_codec.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <exception>
#include <string>
#include <vector>

namespace {

std::string json_number(float value)
{
    // NaN / Inf 는 JSON 숫자가 아니다
    if (!std::isfinite(value)) {
        return "null";
    }
    return fmt::format("{}", value);
}

std::string json_vec3(const Vec3& v)
{
    return fmt::format("[{},{},{}]", json_number(v.x), json_number(v.y), json_number(v.z));
}

std::string json_block_pos(const BlockPos& p)
{
    return fmt::format("[{},{},{}]", p.x, p.y, p.z);
}

std::string json_bool(bool value)
{
    return value ? "true" : "false";
}

// -----------------------------------------------------------------------
// interesting_fields
//   관심 종류면 필드 목록, 아니면 빈 벡터.
// -----------------------------------------------------------------------
std::vector<PacketField> interesting_fields(const Packet& packet)
{
    if (const auto* p = packet.as<ChangeDimensionPacket>()) {
        return {
            {"dimension", fmt::format("{}", p->dimension)},
            {"respawn",   json_bool(p->respawn)},
            {"position",  json_vec3(p->position)},
        };
    }
    if (const auto* p = packet.as<PlayStatusPacket>()) {
        return {
            {"status", fmt::format("{}", p->status)},
        };
    }
    if (const auto* p = packet.as<PlayerActionPacket>()) {
        return {
            {"entity_runtime_id", fmt::format("{}", p->entity_runtime_id)},
            {"action_type",       fmt::format("{}", p->action_type)},
            {"block_position",    json_block_pos(p->block_position)},
            {"block_face",        fmt::format("{}", p->block_face)},
            {"result_position",   json_block_pos(p->result_position)},
        };
    }
    if (const auto* p = packet.as<SetLocalPlayerAsInitialisedPacket>()) {
        return {
            {"entity_runtime_id", fmt::format("{}", p->entity_runtime_id)},
        };
    }
    return {};
}

// payload 바이트 (프레임 헤더와 ID 제외)
std::vector<std::uint8_t> payload_bytes(const Packet& packet)
{
    if (const auto* raw = packet.as<RawPacket>()) {
        return raw->payload;
    }
    auto frame = PacketCodec::encode(packet);
    constexpr auto kSkip = static_cast<std::ptrdiff_t>(PacketCodec::kHeaderSize + PacketCodec::kIdSize);
    return std::vector<std::uint8_t>(frame.begin() + kSkip, frame.end());
}

std::string hex_dump(const std::vector<std::uint8_t>& bytes, std::size_t limit)
{
    const std::size_t n = std::min(bytes.size(), limit);
    std::string out;
    out.reserve(n * 2);
    for (std::size_t i = 0; i < n; ++i) {
        out += fmt::format("{:02x}", bytes[i]);
    }
    return out;
}

}  // namespace

LoggingObserver::LoggingObserver(std::shared_ptr<StructuredLogger> logger)
    : logger_{std::move(logger)}
{}

auto LoggingObserver::describe(std::uint64_t session_id,
                               Direction     direction,
                               const Packet& packet) -> std::optional<PacketLog>
{
    const auto cls = PacketClassifier::classify(packet);
    if (cls.suppressed) {
        return std::nullopt;
    }

    PacketLog entry{
        .session_id = session_id,
        .direction  = direction,
        .kind_name  = cls.kind_name,
        .fields     = interesting_fields(packet),
        .timestamp  = std::chrono::system_clock::now(),
    };

    if (entry.fields.empty()) {
        const auto bytes   = payload_bytes(packet);
        entry.payload_size = bytes.size();
        entry.payload_hex  = hex_dump(bytes, kMaxDumpBytes);
    }

    return entry;
}

void LoggingObserver::observe(std::uint64_t session_id,
                              Direction     direction,
                              const Packet& packet) noexcept
{
    try {
        if (auto entry = describe(session_id, direction, packet)) {
            logger_->log_packet(*entry);
        }
    } catch (const std::exception& e) {
        // 옵저버 실패는 릴레이 루프로 전파하지 않는다
        spdlog::debug("[session {}] observer failed: {}", session_id, e.what());
    } catch (...) {
        spdlog::debug("[session {}] observer failed: unknown exception", session_id);
    }
}
