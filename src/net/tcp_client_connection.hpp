#pragma once

#include "net/connection.hpp"
#include "net/packet_stream.hpp"

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// TcpClientConnection
//   accept 된 TCP 소켓 위의 ClientConnection.
//
//   accept() 가 클라이언트의 Login 을 읽어 client_data 를 보관한다.
//   첫 패킷이 Login 이 아니면 Disconnect 를 보내고 거절한다.
//   make_shared 로만 생성한다 (disconnect 의 기한 타이머가 소유권을 잡는다).
// ---------------------------------------------------------------------------
class TcpClientConnection final
    : public ClientConnection
    , public std::enable_shared_from_this<TcpClientConnection> {
public:
    // start_game 에서 SetLocalPlayerAsInitialised 를 기다리는 최대 패킷 수
    static constexpr std::size_t kMaxSpawnPackets = 64;

    // disconnect 가 Disconnect 프레임 전송에 쓰는 최대 시간.
    // 읽지 않는 클라이언트 때문에 진행 중인 write 가 끝나지 않아도
    // 이 시간이 지나면 소켓을 닫는다.
    static constexpr std::chrono::milliseconds kDisconnectTimeout{1000};

    explicit TcpClientConnection(boost::asio::ip::tcp::socket socket);

    static auto accept(boost::asio::ip::tcp::socket socket)
        -> boost::asio::awaitable<
            std::expected<std::shared_ptr<TcpClientConnection>, RelayError>>;

    auto read_packet()
        -> boost::asio::awaitable<std::expected<Packet, RelayError>> override;

    auto write_packet(const Packet& packet)
        -> boost::asio::awaitable<std::expected<void, RelayError>> override;

    void close() noexcept override;

    [[nodiscard]] auto remote_address() const -> std::string override;
    [[nodiscard]] auto remote_port() const noexcept -> std::uint16_t override;

    [[nodiscard]] auto client_data() const -> const std::string& override { return login_.client_data; }
    [[nodiscard]] auto protocol_version() const noexcept -> std::int32_t { return login_.protocol_version; }

    auto start_game(const GameData& game)
        -> boost::asio::awaitable<std::expected<void, RelayError>> override;

    auto disconnect(std::string reason) -> boost::asio::awaitable<void> override;

private:
    auto read_login() -> boost::asio::awaitable<std::expected<void, RelayError>>;

    PacketStream stream_;
    LoginPacket  login_{};
};
