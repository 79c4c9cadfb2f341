#pragma once

#include "common/types.hpp"
#include "protocol/packet.hpp"

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <deque>
#include <expected>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// PacketStream
//   TCP 소켓 위의 프레임 단위 Packet 스트림.
//
//   - 쓰기는 한 번에 하나만 진행된다 (write gate). 종료 시의 Disconnect 가
//     릴레이 쓰기와 바이트 단위로 섞이지 않는다.
//   - 핸드셰이크 중 받은 관심 밖 패킷은 defer() 로 보관했다가
//     read() 가 먼저 돌려준다. 어떤 패킷도 버려지지 않는다.
//   - 피어의 Disconnect 를 읽으면 연결을 닫고 kRemoteDisconnect(사유)를
//     반환한다. 이후 write() 도 같은 사유로 실패한다.
//
//   스레드 안전성: 하나의 strand 위에서만 사용한다.
// ---------------------------------------------------------------------------
class PacketStream {
public:
    explicit PacketStream(boost::asio::ip::tcp::socket socket);

    PacketStream(const PacketStream&)            = delete;
    PacketStream& operator=(const PacketStream&) = delete;

    // 보관된 패킷이 있으면 그것부터, 없으면 소켓에서 읽는다.
    auto read() -> boost::asio::awaitable<std::expected<Packet, RelayError>>;

    // 보관 큐를 거치지 않고 소켓에서 바로 읽는다 (핸드셰이크용).
    auto receive() -> boost::asio::awaitable<std::expected<Packet, RelayError>>;

    auto write(const Packet& packet)
        -> boost::asio::awaitable<std::expected<void, RelayError>>;

    void defer(Packet packet);

    void close() noexcept;

    [[nodiscard]] auto is_open() const noexcept -> bool { return socket_.is_open(); }
    [[nodiscard]] auto remote_address() const -> const std::string& { return remote_address_; }
    [[nodiscard]] auto remote_port() const noexcept -> std::uint16_t { return remote_port_; }

private:
    auto io_error(RelayErrorCode code,
                  const boost::system::error_code& ec,
                  const char* stage) const -> RelayError;

    boost::asio::ip::tcp::socket socket_;
    boost::asio::steady_timer    write_gate_;
    bool                         writing_{false};

    std::deque<Packet>           deferred_;
    std::optional<std::string>   remote_reason_;

    std::string                  remote_address_;
    std::uint16_t                remote_port_{0};
};
