#include "net/tcp_client_connection.hpp"

#include <utility>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>


TcpClientConnection::TcpClientConnection(boost::asio::ip::tcp::socket socket)
    : stream_{std::move(socket)}
{}

auto TcpClientConnection::accept(boost::asio::ip::tcp::socket socket)
    -> boost::asio::awaitable<
        std::expected<std::shared_ptr<TcpClientConnection>, RelayError>>
{
    auto conn = std::make_shared<TcpClientConnection>(std::move(socket));

    auto login = co_await conn->read_login();
    if (!login) {
        co_return std::unexpected(login.error());
    }
    co_return conn;
}

// ---------------------------------------------------------------------------
// read_login
//   첫 패킷은 반드시 Login 이어야 한다.
// ---------------------------------------------------------------------------
auto TcpClientConnection::read_login()
    -> boost::asio::awaitable<std::expected<void, RelayError>>
{
    auto first = co_await stream_.receive();
    if (!first) {
        co_return std::unexpected(first.error());
    }

    const auto* login = first->as<LoginPacket>();
    if (login == nullptr) {
        co_await disconnect("expected login");
        co_return std::unexpected(RelayError{
            RelayErrorCode::kMalformedPacket,
            "first packet was not a login",
            fmt::format("client {}:{} sent packet id 0x{:02x}",
                        stream_.remote_address(), stream_.remote_port(), first->id())});
    }

    login_ = *login;
    co_return std::expected<void, RelayError>{};
}

auto TcpClientConnection::read_packet()
    -> boost::asio::awaitable<std::expected<Packet, RelayError>>
{
    co_return co_await stream_.read();
}

auto TcpClientConnection::write_packet(const Packet& packet)
    -> boost::asio::awaitable<std::expected<void, RelayError>>
{
    co_return co_await stream_.write(packet);
}

void TcpClientConnection::close() noexcept
{
    stream_.close();
}

auto TcpClientConnection::remote_address() const -> std::string
{
    return stream_.remote_address();
}

auto TcpClientConnection::remote_port() const noexcept -> std::uint16_t
{
    return stream_.remote_port();
}

// ---------------------------------------------------------------------------
// start_game
//   PlayStatus(LoginSuccess) → StartGame → PlayStatus(PlayerSpawn) 를 보내고
//   클라이언트의 SetLocalPlayerAsInitialised 를 기다린다.
//   그 사이 받은 다른 패킷은 보관했다가 read_packet 이 돌려준다.
// ---------------------------------------------------------------------------
auto TcpClientConnection::start_game(const GameData& game)
    -> boost::asio::awaitable<std::expected<void, RelayError>>
{
    const Packet sequence[] = {
        PlayStatusPacket{static_cast<std::int32_t>(PlayStatusCode::kLoginSuccess)},
        game,
        PlayStatusPacket{static_cast<std::int32_t>(PlayStatusCode::kPlayerSpawn)},
    };
    for (const auto& packet : sequence) {
        auto written = co_await stream_.write(packet);
        if (!written) {
            co_return std::unexpected(written.error());
        }
    }

    for (std::size_t i = 0; i < kMaxSpawnPackets; ++i) {
        auto packet = co_await stream_.receive();
        if (!packet) {
            co_return std::unexpected(packet.error());
        }
        if (packet->kind() == PacketKind::kSetLocalPlayerAsInitialised) {
            co_return std::expected<void, RelayError>{};
        }
        stream_.defer(std::move(*packet));
    }

    co_return std::unexpected(RelayError{
        RelayErrorCode::kMalformedPacket,
        "client did not finish spawning",
        fmt::format("no SetLocalPlayerAsInitialised within {} packets", kMaxSpawnPackets)});
}

// ---------------------------------------------------------------------------
// disconnect
//   Disconnect 패킷을 보내고 (실패해도 무시) 연결을 닫는다.
//   앞선 write 가 멈춰 있으면 write gate 가 열리지 않으므로
//   kDisconnectTimeout 뒤에 소켓을 닫아 대기 중인 write 를 모두 끝낸다.
// ---------------------------------------------------------------------------
auto TcpClientConnection::disconnect(std::string reason) -> boost::asio::awaitable<void>
{
    if (stream_.is_open()) {
        boost::asio::steady_timer deadline{co_await boost::asio::this_coro::executor,
                                           kDisconnectTimeout};
        deadline.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            spdlog::debug("[relay] disconnect to {}:{} timed out, closing",
                          self->stream_.remote_address(), self->stream_.remote_port());
            self->stream_.close();
        });

        auto written = co_await stream_.write(DisconnectPacket{false, std::move(reason)});
        deadline.cancel();
        if (!written) {
            spdlog::debug("[relay] disconnect to {}:{} not delivered: {}",
                          stream_.remote_address(), stream_.remote_port(),
                          written.error().message);
        }
    }
    stream_.close();
}
