#include "protocol/packet.hpp"

#include <type_traits>

auto Packet::kind() const noexcept -> PacketKind
{
    return std::visit(
        [](const auto& body) -> PacketKind {
            using T = std::decay_t<decltype(body)>;
            if constexpr (std::is_same_v<T, RawPacket>) {
                return static_cast<PacketKind>(body.id);
            } else {
                return T::kKind;
            }
        },
        body_);
}
