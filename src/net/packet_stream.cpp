#include "net/packet_stream.hpp"

#include "protocol/packet_codec.hpp"

#include <utility>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <fmt/format.h>

#include <array>
#include <vector>

PacketStream::PacketStream(boost::asio::ip::tcp::socket socket)
    : socket_{std::move(socket)}
    , write_gate_{socket_.get_executor(), boost::asio::steady_timer::time_point::max()}
{
    boost::system::error_code ec;
    const auto ep = socket_.remote_endpoint(ec);
    if (!ec) {
        remote_address_ = ep.address().to_string();
        remote_port_    = ep.port();
    }
}

auto PacketStream::io_error(RelayErrorCode code,
                            const boost::system::error_code& ec,
                            const char* stage) const -> RelayError
{
    return RelayError{
        code,
        ec == boost::asio::error::eof ? "connection closed by peer" : ec.message(),
        fmt::format("{} {}:{}", stage, remote_address_, remote_port_),
    };
}

// ---------------------------------------------------------------------------
// read
// ---------------------------------------------------------------------------
auto PacketStream::read() -> boost::asio::awaitable<std::expected<Packet, RelayError>>
{
    if (!deferred_.empty()) {
        Packet packet = std::move(deferred_.front());
        deferred_.pop_front();
        co_return packet;
    }
    co_return co_await receive();
}

// ---------------------------------------------------------------------------
// receive
//   [4바이트 길이][id + payload] 프레임 1개를 읽어 디코딩한다.
// ---------------------------------------------------------------------------
auto PacketStream::receive() -> boost::asio::awaitable<std::expected<Packet, RelayError>>
{
    if (remote_reason_) {
        co_return std::unexpected(RelayError{
            RelayErrorCode::kRemoteDisconnect, *remote_reason_, "receive after disconnect"});
    }

    std::array<std::uint8_t, PacketCodec::kHeaderSize> header{};
    boost::system::error_code ec;

    co_await boost::asio::async_read(
        socket_,
        boost::asio::buffer(header),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(io_error(RelayErrorCode::kReadFailed, ec, "read header"));
    }

    auto length = PacketCodec::body_length(header);
    if (!length) {
        close();
        co_return std::unexpected(length.error());
    }

    std::vector<std::uint8_t> body(*length);
    co_await boost::asio::async_read(
        socket_,
        boost::asio::buffer(body),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(io_error(RelayErrorCode::kReadFailed, ec, "read body"));
    }

    auto packet = PacketCodec::decode_body(body);
    if (!packet) {
        close();
        co_return std::unexpected(packet.error());
    }

    if (const auto* disconnect = packet->as<DisconnectPacket>()) {
        remote_reason_ = disconnect->message;
        close();
        co_return std::unexpected(RelayError{
            RelayErrorCode::kRemoteDisconnect,
            disconnect->message,
            fmt::format("disconnect from {}:{}", remote_address_, remote_port_)});
    }

    co_return std::move(*packet);
}

// ---------------------------------------------------------------------------
// write
//   write gate: 이전 쓰기가 끝날 때까지 기다린 뒤 프레임 전체를 쓴다.
// ---------------------------------------------------------------------------
auto PacketStream::write(const Packet& packet)
    -> boost::asio::awaitable<std::expected<void, RelayError>>
{
    const auto frame = PacketCodec::encode(packet);

    while (writing_) {
        boost::system::error_code wait_ec;
        co_await write_gate_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, wait_ec));
    }

    if (remote_reason_) {
        co_return std::unexpected(RelayError{
            RelayErrorCode::kRemoteDisconnect, *remote_reason_, "write after disconnect"});
    }

    writing_ = true;
    boost::system::error_code ec;
    co_await boost::asio::async_write(
        socket_,
        boost::asio::buffer(frame),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    writing_ = false;
    write_gate_.cancel();

    if (ec) {
        co_return std::unexpected(io_error(RelayErrorCode::kWriteFailed, ec, "write"));
    }
    co_return std::expected<void, RelayError>{};
}

void PacketStream::defer(Packet packet)
{
    deferred_.push_back(std::move(packet));
}

void PacketStream::close() noexcept
{
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    write_gate_.cancel();
}
