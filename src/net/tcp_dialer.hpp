#pragma once

#include "net/connection.hpp"
#include "net/packet_stream.hpp"

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// TcpUpstreamConnection
//   TcpDialer 가 로그인까지 끝낸 업스트림 연결.
// ---------------------------------------------------------------------------
class TcpUpstreamConnection final : public UpstreamConnection {
public:
    // do_spawn 에서 PlayStatus(PlayerSpawn) 를 기다리는 최대 패킷 수
    static constexpr std::size_t kMaxSpawnPackets = 64;

    explicit TcpUpstreamConnection(boost::asio::ip::tcp::socket socket);

    auto read_packet()
        -> boost::asio::awaitable<std::expected<Packet, RelayError>> override;

    auto write_packet(const Packet& packet)
        -> boost::asio::awaitable<std::expected<void, RelayError>> override;

    void close() noexcept override;

    [[nodiscard]] auto remote_address() const -> std::string override;
    [[nodiscard]] auto remote_port() const noexcept -> std::uint16_t override;

    [[nodiscard]] auto game_data() const -> const GameData& override { return game_; }

    auto do_spawn()
        -> boost::asio::awaitable<std::expected<void, RelayError>> override;

private:
    friend class TcpDialer;

    PacketStream stream_;
    GameData     game_{};
    bool         spawned_{false};  // login 중 PlayerSpawn 수신
};

// ---------------------------------------------------------------------------
// TcpDialer
//   업스트림 주소로 접속해 Login(클라이언트 메타데이터 원문 + access token)을
//   보내고 StartGame 을 받을 때까지 로그인 시퀀스를 진행한다.
//
//   실패 (해석/접속 실패, Disconnect, 실패 PlayStatus) 는 모두 kDialFailed.
//   소켓은 dial() 을 호출한 코루틴의 executor 위에 만들어진다.
// ---------------------------------------------------------------------------
class TcpDialer final : public Dialer {
public:
    static constexpr std::int32_t kProtocolVersion = 594;
    static constexpr std::size_t  kMaxLoginPackets = 64;

    TcpDialer(std::string host, std::uint16_t port, std::string access_token);

    auto dial(const std::string& client_data)
        -> boost::asio::awaitable<
            std::expected<std::shared_ptr<UpstreamConnection>, RelayError>> override;

    [[nodiscard]] auto target() const -> std::string;

private:
    auto login(TcpUpstreamConnection& conn, const std::string& client_data)
        -> boost::asio::awaitable<std::expected<void, RelayError>>;

    std::string   host_;
    std::uint16_t port_;
    std::string   access_token_;
};
