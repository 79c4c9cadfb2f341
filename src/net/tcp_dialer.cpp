#include "net/tcp_dialer.hpp"

#include <utility>
#include <boost/asio/connect.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>


// ---------------------------------------------------------------------------
// TcpUpstreamConnection
// ---------------------------------------------------------------------------
TcpUpstreamConnection::TcpUpstreamConnection(boost::asio::ip::tcp::socket socket)
    : stream_{std::move(socket)}
{}

auto TcpUpstreamConnection::read_packet()
    -> boost::asio::awaitable<std::expected<Packet, RelayError>>
{
    co_return co_await stream_.read();
}

auto TcpUpstreamConnection::write_packet(const Packet& packet)
    -> boost::asio::awaitable<std::expected<void, RelayError>>
{
    co_return co_await stream_.write(packet);
}

void TcpUpstreamConnection::close() noexcept
{
    stream_.close();
}

auto TcpUpstreamConnection::remote_address() const -> std::string
{
    return stream_.remote_address();
}

auto TcpUpstreamConnection::remote_port() const noexcept -> std::uint16_t
{
    return stream_.remote_port();
}

// ---------------------------------------------------------------------------
// do_spawn
//   PlayStatus(PlayerSpawn) 까지 읽고 (다른 패킷은 보관)
//   SetLocalPlayerAsInitialised 로 spawn 완료를 알린다.
//   login 중에 이미 PlayerSpawn 을 받았으면 바로 알린다.
// ---------------------------------------------------------------------------
auto TcpUpstreamConnection::do_spawn()
    -> boost::asio::awaitable<std::expected<void, RelayError>>
{
    if (spawned_) {
        co_return co_await stream_.write(
            SetLocalPlayerAsInitialisedPacket{game_.entity_runtime_id});
    }

    for (std::size_t i = 0; i < kMaxSpawnPackets; ++i) {
        auto packet = co_await stream_.receive();
        if (!packet) {
            co_return std::unexpected(packet.error());
        }

        const auto* status = packet->as<PlayStatusPacket>();
        if (status != nullptr
            && status->status == static_cast<std::int32_t>(PlayStatusCode::kPlayerSpawn)) {
            co_return co_await stream_.write(
                SetLocalPlayerAsInitialisedPacket{game_.entity_runtime_id});
        }
        stream_.defer(std::move(*packet));
    }

    co_return std::unexpected(RelayError{
        RelayErrorCode::kMalformedPacket,
        "upstream did not spawn the player",
        fmt::format("no PlayerSpawn status within {} packets", kMaxSpawnPackets)});
}

// ---------------------------------------------------------------------------
// TcpDialer
// ---------------------------------------------------------------------------
TcpDialer::TcpDialer(std::string host, std::uint16_t port, std::string access_token)
    : host_{std::move(host)}
    , port_{port}
    , access_token_{std::move(access_token)}
{}

auto TcpDialer::target() const -> std::string
{
    return fmt::format("{}:{}", host_, port_);
}

auto TcpDialer::dial(const std::string& client_data)
    -> boost::asio::awaitable<
        std::expected<std::shared_ptr<UpstreamConnection>, RelayError>>
{
    auto executor = co_await boost::asio::this_coro::executor;

    boost::asio::ip::tcp::resolver resolver{executor};
    boost::system::error_code      ec;

    const auto endpoints = co_await resolver.async_resolve(
        host_, std::to_string(port_),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(RelayError{
            RelayErrorCode::kDialFailed,
            fmt::format("cannot resolve upstream: {}", ec.message()),
            target()});
    }

    boost::asio::ip::tcp::socket socket{executor};
    co_await boost::asio::async_connect(
        socket, endpoints,
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(RelayError{
            RelayErrorCode::kDialFailed,
            fmt::format("cannot connect to upstream: {}", ec.message()),
            target()});
    }

    auto conn = std::make_shared<TcpUpstreamConnection>(std::move(socket));

    auto logged_in = co_await login(*conn, client_data);
    if (!logged_in) {
        conn->close();
        co_return std::unexpected(logged_in.error());
    }

    spdlog::debug("[relay] upstream {} logged in (runtime id {})",
                  target(), conn->game_.entity_runtime_id);
    co_return conn;
}

// ---------------------------------------------------------------------------
// login
//   Login 전송 → PlayStatus(LoginSuccess) → ... → StartGame.
//   StartGame 이전의 다른 패킷은 보관했다가 릴레이가 시작되면 전달된다.
// ---------------------------------------------------------------------------
auto TcpDialer::login(TcpUpstreamConnection& conn, const std::string& client_data)
    -> boost::asio::awaitable<std::expected<void, RelayError>>
{
    auto sent = co_await conn.stream_.write(
        LoginPacket{kProtocolVersion, client_data, access_token_});
    if (!sent) {
        co_return std::unexpected(RelayError{
            RelayErrorCode::kDialFailed, sent.error().message, target()});
    }

    for (std::size_t i = 0; i < kMaxLoginPackets; ++i) {
        auto packet = co_await conn.stream_.receive();
        if (!packet) {
            // Disconnect 로 거절되면 상대의 사유를 그대로 전달한다
            co_return std::unexpected(RelayError{
                RelayErrorCode::kDialFailed, packet.error().message, target()});
        }

        if (const auto* status = packet->as<PlayStatusPacket>()) {
            if (status->status == static_cast<std::int32_t>(PlayStatusCode::kLoginSuccess)) {
                continue;
            }
            if (status->status != static_cast<std::int32_t>(PlayStatusCode::kPlayerSpawn)) {
                co_return std::unexpected(RelayError{
                    RelayErrorCode::kDialFailed,
                    fmt::format("upstream rejected login (status {})", status->status),
                    target()});
            }
            // StartGame 보다 먼저 온 PlayerSpawn
            conn.spawned_ = true;
            continue;
        }

        if (const auto* start = packet->as<StartGamePacket>()) {
            conn.game_ = *start;
            co_return std::expected<void, RelayError>{};
        }

        conn.stream_.defer(std::move(*packet));
    }

    co_return std::unexpected(RelayError{
        RelayErrorCode::kDialFailed,
        "upstream did not start the game",
        target()});
}
