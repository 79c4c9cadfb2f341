#pragma once

#include "common/types.hpp"
#include "protocol/packet.hpp"

#include <utility>
#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// GameData
//   업스트림 로그인에서 받은 StartGame 내용.
//   클라이언트 쪽 게임 시작 알림과 업스트림 spawn 완료에 그대로 쓰인다.
// ---------------------------------------------------------------------------
using GameData = StartGamePacket;

// ---------------------------------------------------------------------------
// PacketConnection
//   한 피어와 Packet 을 순서대로 주고받는 채널.
//
//   - read_packet / write_packet 은 패킷 1개 단위로 완료된다.
//   - 피어가 Disconnect 로 끊으면 read_packet 은 kRemoteDisconnect(사유)를
//     반환하고, 이후 write_packet 도 같은 사유로 실패한다.
//   - close() 는 멱등이며 진행 중인 read/write 를 실패시킨다.
// ---------------------------------------------------------------------------
class PacketConnection {
public:
    virtual ~PacketConnection() = default;

    virtual auto read_packet()
        -> boost::asio::awaitable<std::expected<Packet, RelayError>> = 0;

    virtual auto write_packet(const Packet& packet)
        -> boost::asio::awaitable<std::expected<void, RelayError>> = 0;

    virtual void close() noexcept = 0;

    [[nodiscard]] virtual auto remote_address() const -> std::string = 0;
    [[nodiscard]] virtual auto remote_port() const noexcept -> std::uint16_t = 0;
};

// ---------------------------------------------------------------------------
// ClientConnection
//   릴레이가 서버 역할을 하는 클라이언트 쪽 연결.
// ---------------------------------------------------------------------------
class ClientConnection : public PacketConnection {
public:
    // Login 에 실려 온 클라이언트 메타데이터 (원문 그대로)
    [[nodiscard]] virtual auto client_data() const -> const std::string& = 0;

    // 업스트림에서 받은 게임 데이터로 클라이언트에게 게임 시작을 알린다.
    virtual auto start_game(const GameData& game)
        -> boost::asio::awaitable<std::expected<void, RelayError>> = 0;

    // 사유를 담아 연결을 끊는다 (best effort). 이후 연결은 닫힌다.
    virtual auto disconnect(std::string reason) -> boost::asio::awaitable<void> = 0;
};

// ---------------------------------------------------------------------------
// UpstreamConnection
//   릴레이가 클라이언트 역할을 하는 업스트림 서버 쪽 연결.
// ---------------------------------------------------------------------------
class UpstreamConnection : public PacketConnection {
public:
    [[nodiscard]] virtual auto game_data() const -> const GameData& = 0;

    // 업스트림의 spawn 시퀀스를 끝낸다.
    virtual auto do_spawn()
        -> boost::asio::awaitable<std::expected<void, RelayError>> = 0;
};

// ---------------------------------------------------------------------------
// Dialer
//   업스트림 연결을 만든다. 실패 시 kDialFailed.
// ---------------------------------------------------------------------------
class Dialer {
public:
    virtual ~Dialer() = default;

    virtual auto dial(const std::string& client_data)
        -> boost::asio::awaitable<
            std::expected<std::shared_ptr<UpstreamConnection>, RelayError>> = 0;
};
