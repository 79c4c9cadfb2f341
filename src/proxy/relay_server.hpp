#pragma once

#include "common/types.hpp"
#include "config/relay_config.hpp"
#include "logger/structured_logger.hpp"
#include "net/connection.hpp"
#include "proxy/session.hpp"
#include "relay/packet_observer.hpp"
#include "stats/stats_collector.hpp"

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <unordered_map>

// ---------------------------------------------------------------------------
// RelayServer
//   TCP 리슨 → 클라이언트마다 Session 생성 → 종료를 담당한다.
//
//   사용 예:
//     RelayServer server(config, dialer, observer, logger, stats);
//     server.run(io_ctx);   // io_ctx.run() 은 호출자가 실행
//
//   - accept 한 소켓마다 새 strand 를 만들어 Login 읽기 → Session::run 을
//     실행한다. 다음 accept 는 기다리지 않는다.
//   - accept 오류는 로그만 남기고 루프를 계속한다.
//   - stop() 은 리스너를 닫고 모든 세션을 close() 한다.
//     세션이 모두 끝나면 io_context 를 멈춘다.
// ---------------------------------------------------------------------------
class RelayServer {
public:
    RelayServer(RelayConfig                       config,
                std::shared_ptr<Dialer>           dialer,
                std::shared_ptr<PacketObserver>   observer,
                std::shared_ptr<StructuredLogger> logger,
                std::shared_ptr<StatsCollector>   stats);

    ~RelayServer() = default;

    // 복사/이동 금지
    RelayServer(const RelayServer&)            = delete;
    RelayServer& operator=(const RelayServer&) = delete;
    RelayServer(RelayServer&&)                 = delete;
    RelayServer& operator=(RelayServer&&)      = delete;

    // -----------------------------------------------------------------------
    // run
    //   리스너를 바인딩하고 accept 루프를 co_spawn 한다.
    //   바인딩 실패 (주소 오류, 포트 사용 중) 는 kConfigError / kIoError.
    // -----------------------------------------------------------------------
    [[nodiscard]] auto run(boost::asio::io_context& io_ctx) -> std::expected<void, RelayError>;

    // -----------------------------------------------------------------------
    // stop
    //   새 연결 수락 중단 + 활성 세션 close(). 멱등.
    // -----------------------------------------------------------------------
    void stop();

    [[nodiscard]] auto active_sessions() const -> std::size_t;

    // 실제 바인딩된 엔드포인트 (listen_port 0 일 때 할당된 포트 확인용)
    [[nodiscard]] auto local_endpoint() const -> boost::asio::ip::tcp::endpoint;

private:
    auto accept_loop(std::shared_ptr<boost::asio::ip::tcp::acceptor> acceptor)
        -> boost::asio::awaitable<void>;

    auto handle_client(boost::asio::ip::tcp::socket                      socket,
                       boost::asio::strand<boost::asio::any_io_executor> strand)
        -> boost::asio::awaitable<void>;

    void remove_session(std::uint64_t sid);

    RelayConfig                       config_;
    std::shared_ptr<Dialer>           dialer_;
    std::shared_ptr<PacketObserver>   observer_;
    std::shared_ptr<StructuredLogger> logger_;
    std::shared_ptr<StatsCollector>   stats_;

    // acceptor 는 accept_loop 코루틴이 소유한다 (io_context 와 함께 정리된다)
    boost::asio::io_context*                      io_ctx_{nullptr};
    std::weak_ptr<boost::asio::ip::tcp::acceptor> acceptor_{};
    boost::asio::ip::tcp::endpoint                local_endpoint_{};

    std::atomic<bool>          stopping_{false};
    std::atomic<std::uint64_t> next_session_id_{1};

    mutable std::mutex                                          sessions_mutex_;
    std::unordered_map<std::uint64_t, std::shared_ptr<Session>> sessions_{};
};
