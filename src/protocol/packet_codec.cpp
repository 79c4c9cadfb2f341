#include "protocol/packet_codec.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <optional>
#include <string>
#include <type_traits>

// ---------------------------------------------------------------------------
// PacketCodec 구현
// ---------------------------------------------------------------------------

namespace {

// -----------------------------------------------------------------------
// ByteWriter
//   payload 직렬화 헬퍼. 모든 정수는 리틀 엔디언.
// -----------------------------------------------------------------------
class ByteWriter {
public:
    explicit ByteWriter(std::vector<std::uint8_t>& out) : out_{out} {}

    template <typename T>
        requires std::is_integral_v<T>
    void put(T value)
    {
        using U = std::make_unsigned_t<T>;
        auto bits = static_cast<U>(value);
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            out_.push_back(static_cast<std::uint8_t>(bits & 0xFFU));
            bits = static_cast<U>(bits >> 8U);
        }
    }

    void put_bool(bool value) { out_.push_back(value ? 1 : 0); }

    void put_float(float value)
    {
        std::uint32_t bits{0};
        std::memcpy(&bits, &value, sizeof(bits));
        put(bits);
    }

    void put_string(const std::string& value)
    {
        put(static_cast<std::uint32_t>(value.size()));
        out_.insert(out_.end(), value.begin(), value.end());
    }

    void put_bytes(std::span<const std::uint8_t> bytes)
    {
        out_.insert(out_.end(), bytes.begin(), bytes.end());
    }

    void put_vec3(const Vec3& v)
    {
        put_float(v.x);
        put_float(v.y);
        put_float(v.z);
    }

    void put_block_pos(const BlockPos& p)
    {
        put(p.x);
        put(p.y);
        put(p.z);
    }

private:
    std::vector<std::uint8_t>& out_;
};

// -----------------------------------------------------------------------
// ByteReader
//   payload 역직렬화 헬퍼. 범위를 벗어나는 읽기는 std::nullopt.
// -----------------------------------------------------------------------
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) : data_{data} {}

    template <typename T>
        requires std::is_integral_v<T>
    auto get() -> std::optional<T>
    {
        if (remaining() < sizeof(T)) {
            return std::nullopt;
        }
        using U = std::make_unsigned_t<T>;
        U bits{0};
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            bits = static_cast<U>(bits | (static_cast<U>(data_[pos_ + i]) << (8U * i)));
        }
        pos_ += sizeof(T);
        return static_cast<T>(bits);
    }

    auto get_bool() -> std::optional<bool>
    {
        const auto byte = get<std::uint8_t>();
        if (!byte || *byte > 1) {
            return std::nullopt;
        }
        return *byte == 1;
    }

    auto get_float() -> std::optional<float>
    {
        const auto bits = get<std::uint32_t>();
        if (!bits) {
            return std::nullopt;
        }
        float value{0.0F};
        std::memcpy(&value, &*bits, sizeof(value));
        return value;
    }

    auto get_string() -> std::optional<std::string>
    {
        const auto len = get<std::uint32_t>();
        if (!len || remaining() < *len) {
            return std::nullopt;
        }
        std::string value(reinterpret_cast<const char*>(data_.data() + pos_), *len);
        pos_ += *len;
        return value;
    }

    auto get_vec3() -> std::optional<Vec3>
    {
        const auto x = get_float();
        const auto y = get_float();
        const auto z = get_float();
        if (!x || !y || !z) {
            return std::nullopt;
        }
        return Vec3{*x, *y, *z};
    }

    auto get_block_pos() -> std::optional<BlockPos>
    {
        const auto x = get<std::int32_t>();
        const auto y = get<std::int32_t>();
        const auto z = get<std::int32_t>();
        if (!x || !y || !z) {
            return std::nullopt;
        }
        return BlockPos{*x, *y, *z};
    }

    auto rest() -> std::vector<std::uint8_t>
    {
        std::vector<std::uint8_t> out(data_.begin() + static_cast<std::ptrdiff_t>(pos_), data_.end());
        pos_ = data_.size();
        return out;
    }

    [[nodiscard]] auto remaining() const noexcept -> std::size_t { return data_.size() - pos_; }
    [[nodiscard]] auto at_end()    const noexcept -> bool        { return pos_ == data_.size(); }

private:
    std::span<const std::uint8_t> data_;
    std::size_t                   pos_{0};
};

// -----------------------------------------------------------------------
// encode_payload: variant arm 별 payload 직렬화
// -----------------------------------------------------------------------
void encode_payload(ByteWriter& w, const LoginPacket& p)
{
    w.put(p.protocol_version);
    w.put_string(p.client_data);
    w.put_string(p.access_token);
}

void encode_payload(ByteWriter& w, const PlayStatusPacket& p)
{
    w.put(p.status);
}

void encode_payload(ByteWriter& w, const DisconnectPacket& p)
{
    w.put_bool(p.hide_screen);
    w.put_string(p.message);
}

void encode_payload(ByteWriter& w, const StartGamePacket& p)
{
    w.put(p.entity_unique_id);
    w.put(p.entity_runtime_id);
    w.put(p.dimension);
    w.put_string(p.world_name);
    w.put_bytes(p.extra);
}

void encode_payload(ByteWriter& w, const ChangeDimensionPacket& p)
{
    w.put(p.dimension);
    w.put_vec3(p.position);
    w.put_bool(p.respawn);
}

void encode_payload(ByteWriter& w, const PlayerActionPacket& p)
{
    w.put(p.entity_runtime_id);
    w.put(p.action_type);
    w.put_block_pos(p.block_position);
    w.put_block_pos(p.result_position);
    w.put(p.block_face);
}

void encode_payload(ByteWriter& w, const SetLocalPlayerAsInitialisedPacket& p)
{
    w.put(p.entity_runtime_id);
}

void encode_payload(ByteWriter& w, const RawPacket& p)
{
    w.put_bytes(p.payload);
}

// -----------------------------------------------------------------------
// decode_structured
//   구조체 arm 디코딩. payload 를 정확히 소비하지 못하면 std::nullopt
//   (호출자가 RawPacket 으로 보존한다).
// -----------------------------------------------------------------------
auto decode_structured(PacketKind kind, ByteReader& r) -> std::optional<Packet>
{
    switch (kind) {
        case PacketKind::kLogin: {
            LoginPacket p;
            const auto version = r.get<std::int32_t>();
            auto client_data   = r.get_string();
            auto access_token  = r.get_string();
            if (!version || !client_data || !access_token || !r.at_end()) {
                return std::nullopt;
            }
            p.protocol_version = *version;
            p.client_data      = std::move(*client_data);
            p.access_token     = std::move(*access_token);
            return Packet{std::move(p)};
        }
        case PacketKind::kPlayStatus: {
            const auto status = r.get<std::int32_t>();
            if (!status || !r.at_end()) {
                return std::nullopt;
            }
            return Packet{PlayStatusPacket{*status}};
        }
        case PacketKind::kDisconnect: {
            const auto hide = r.get_bool();
            auto message    = r.get_string();
            if (!hide || !message || !r.at_end()) {
                return std::nullopt;
            }
            return Packet{DisconnectPacket{*hide, std::move(*message)}};
        }
        case PacketKind::kStartGame: {
            StartGamePacket p;
            const auto unique_id  = r.get<std::int64_t>();
            const auto runtime_id = r.get<std::uint64_t>();
            const auto dimension  = r.get<std::int32_t>();
            auto world_name       = r.get_string();
            if (!unique_id || !runtime_id || !dimension || !world_name) {
                return std::nullopt;
            }
            p.entity_unique_id  = *unique_id;
            p.entity_runtime_id = *runtime_id;
            p.dimension         = *dimension;
            p.world_name        = std::move(*world_name);
            p.extra             = r.rest();
            return Packet{std::move(p)};
        }
        case PacketKind::kChangeDimension: {
            const auto dimension = r.get<std::int32_t>();
            const auto position  = r.get_vec3();
            const auto respawn   = r.get_bool();
            if (!dimension || !position || !respawn || !r.at_end()) {
                return std::nullopt;
            }
            return Packet{ChangeDimensionPacket{*dimension, *position, *respawn}};
        }
        case PacketKind::kPlayerAction: {
            const auto runtime_id = r.get<std::uint64_t>();
            const auto action     = r.get<std::int32_t>();
            const auto block_pos  = r.get_block_pos();
            const auto result_pos = r.get_block_pos();
            const auto face       = r.get<std::int32_t>();
            if (!runtime_id || !action || !block_pos || !result_pos || !face || !r.at_end()) {
                return std::nullopt;
            }
            return Packet{PlayerActionPacket{*runtime_id, *action, *block_pos, *result_pos, *face}};
        }
        case PacketKind::kSetLocalPlayerAsInitialised: {
            const auto runtime_id = r.get<std::uint64_t>();
            if (!runtime_id || !r.at_end()) {
                return std::nullopt;
            }
            return Packet{SetLocalPlayerAsInitialisedPacket{*runtime_id}};
        }
        default:
            return std::nullopt;
    }
}

}  // namespace

// static
auto PacketCodec::body_length(const std::array<std::uint8_t, kHeaderSize>& header)
    -> std::expected<std::uint32_t, RelayError>
{
    const std::uint32_t length =
        static_cast<std::uint32_t>(header[0])
        | (static_cast<std::uint32_t>(header[1]) << 8U)
        | (static_cast<std::uint32_t>(header[2]) << 16U)
        | (static_cast<std::uint32_t>(header[3]) << 24U);

    if (length < kIdSize) {
        return std::unexpected(RelayError{
            RelayErrorCode::kMalformedPacket,
            "frame too short",
            fmt::format("declared body length={}, need at least {}", length, kIdSize)
        });
    }
    if (length > kMaxBodySize) {
        return std::unexpected(RelayError{
            RelayErrorCode::kMalformedPacket,
            "frame too large",
            fmt::format("declared body length={}, limit={}", length, kMaxBodySize)
        });
    }
    return length;
}

// static
auto PacketCodec::decode_body(std::span<const std::uint8_t> body)
    -> std::expected<Packet, RelayError>
{
    if (body.size() < kIdSize) {
        return std::unexpected(RelayError{
            RelayErrorCode::kMalformedPacket,
            "packet body too short",
            fmt::format("received {} bytes, need at least {}", body.size(), kIdSize)
        });
    }

    const auto id = static_cast<std::uint16_t>(
        static_cast<std::uint16_t>(body[0]) | (static_cast<std::uint16_t>(body[1]) << 8U));
    const auto payload = body.subspan(kIdSize);

    ByteReader reader{payload};
    if (auto structured = decode_structured(static_cast<PacketKind>(id), reader)) {
        return std::move(*structured);
    }

    return Packet{RawPacket{id, std::vector<std::uint8_t>(payload.begin(), payload.end())}};
}

// static
auto PacketCodec::decode(std::span<const std::uint8_t> frame)
    -> std::expected<Packet, RelayError>
{
    if (frame.size() < kHeaderSize) {
        return std::unexpected(RelayError{
            RelayErrorCode::kMalformedPacket,
            "frame header incomplete",
            fmt::format("received {} bytes, need at least {}", frame.size(), kHeaderSize)
        });
    }

    std::array<std::uint8_t, kHeaderSize> header{};
    std::copy_n(frame.begin(), kHeaderSize, header.begin());

    auto length = body_length(header);
    if (!length) {
        return std::unexpected(length.error());
    }

    const auto body = frame.subspan(kHeaderSize);
    if (body.size() != *length) {
        return std::unexpected(RelayError{
            RelayErrorCode::kMalformedPacket,
            body.size() < *length ? "incomplete frame body" : "trailing bytes after frame",
            fmt::format("declared length={}, available={}", *length, body.size())
        });
    }

    return decode_body(body);
}

// static
auto PacketCodec::encode(const Packet& packet) -> std::vector<std::uint8_t>
{
    std::vector<std::uint8_t> frame(kHeaderSize, 0);
    ByteWriter writer{frame};

    writer.put(packet.id());
    std::visit([&writer](const auto& body) { encode_payload(writer, body); }, packet.body());

    // 헤더 자리에 body 길이를 채운다
    const auto length = static_cast<std::uint32_t>(frame.size() - kHeaderSize);
    frame[0] = static_cast<std::uint8_t>(length & 0xFFU);
    frame[1] = static_cast<std::uint8_t>((length >> 8U) & 0xFFU);
    frame[2] = static_cast<std::uint8_t>((length >> 16U) & 0xFFU);
    frame[3] = static_cast<std::uint8_t>((length >> 24U) & 0xFFU);

    return frame;
}
