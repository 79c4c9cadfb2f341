#pragma once

#include "common/types.hpp"
#include "logger/structured_logger.hpp"
#include "net/connection.hpp"
#include "relay/packet_observer.hpp"
#include "stats/stats_collector.hpp"

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// SessionState
//   Session 의 생명주기 상태.
//
//   kConnecting  : 업스트림 dial 진행 중
//   kHandshaking : 클라이언트 게임 시작 + 업스트림 spawn 을 동시에 진행 중
//   kRelaying    : 양방향 릴레이 루프 실행 중
//   kClosing     : teardown 진행 중
//   kClosed      : 세션 완전 종료
// ---------------------------------------------------------------------------
enum class SessionState : std::uint8_t {
    kConnecting  = 0,
    kHandshaking = 1,
    kRelaying    = 2,
    kClosing     = 3,
    kClosed      = 4,
};

// ---------------------------------------------------------------------------
// Session
//   클라이언트 연결 1개와 업스트림 연결 1개를 1:1 로 릴레이하는 세션.
//
//   생명주기:
//     1. accept 된 ClientConnection 을 받아 생성
//     2. run(): dial → 핸드셰이크(두 작업 join) → 양방향 릴레이(두 루프 join)
//     3. 어느 한쪽 루프가 실패하면 teardown: 업스트림 close + 클라이언트 disconnect.
//        teardown 은 정확히 한 번만 수행되고, 나머지 루프의 실패는 조용히 끝난다.
//
//   스레드 안전성:
//     run() 과 모든 자식 코루틴은 strand_ 위에서 실행된다.
//     close() 는 어느 스레드에서 호출해도 된다 (teardown 을 strand_ 로 보낸다).
// ---------------------------------------------------------------------------
class Session : public std::enable_shared_from_this<Session> {
public:
    static constexpr std::string_view kConnectionLost = "connection lost";
    static constexpr std::string_view kShuttingDown   = "relay shutting down";

    // -----------------------------------------------------------------------
    // 생성자
    //   session_id : 프로세스 범위 유일 ID
    //   strand     : 세션의 모든 코루틴이 실행될 strand
    //   client     : accept + Login 까지 끝난 클라이언트 연결 (shared 소유권)
    //   dialer     : 업스트림 연결 생성기
    //   observer   : 패킷마다 호출되는 훅
    //   logger     : 구조화 로거
    //   stats      : 통계 수집기
    // -----------------------------------------------------------------------
    Session(std::uint64_t                                     session_id,
            boost::asio::strand<boost::asio::any_io_executor> strand,
            std::shared_ptr<ClientConnection>                 client,
            std::shared_ptr<Dialer>                           dialer,
            std::shared_ptr<PacketObserver>                   observer,
            std::shared_ptr<StructuredLogger>                 logger,
            std::shared_ptr<StatsCollector>                   stats);

    ~Session() = default;

    // 복사/이동 금지 (shared_ptr 로만 관리)
    Session(const Session&)            = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&)                 = delete;
    Session& operator=(Session&&)      = delete;

    // -----------------------------------------------------------------------
    // run
    //   세션의 메인 코루틴. strand_ 위에서 co_spawn 해야 한다.
    //   반환 시 세션은 kClosed 상태이며 두 연결은 모두 닫혀 있다.
    // -----------------------------------------------------------------------
    auto run() -> boost::asio::awaitable<void>;

    // -----------------------------------------------------------------------
    // close
    //   운영자 종료. "relay shutting down" 사유로 teardown 한다.
    //   이미 teardown 이 시작되었으면 no-op.
    // -----------------------------------------------------------------------
    void close();

    [[nodiscard]] auto id()      const noexcept -> std::uint64_t { return session_id_; }
    [[nodiscard]] auto state()   const noexcept -> SessionState;
    [[nodiscard]] auto context() const noexcept -> const SessionContext&;

    // dir 방향으로 전달된 패킷 수
    [[nodiscard]] auto relayed(Direction dir) const noexcept -> std::uint64_t;

    // teardown 에서 사용된 사유 (teardown 전이면 std::nullopt)
    [[nodiscard]] auto close_reason() const -> std::optional<std::string>;

private:
    auto start_client_game() -> boost::asio::awaitable<void>;
    auto spawn_upstream()    -> boost::asio::awaitable<void>;

    auto relay_client_to_server() -> boost::asio::awaitable<void>;
    auto relay_server_to_client() -> boost::asio::awaitable<void>;

    // close-once. reason 이 없으면 kConnectionLost.
    auto teardown(std::optional<std::string> reason) -> boost::asio::awaitable<void>;

    void log_event(const char* event, const std::string& reason);

    std::uint64_t                                     session_id_;
    boost::asio::strand<boost::asio::any_io_executor> strand_;

    std::shared_ptr<ClientConnection>                 client_;
    std::shared_ptr<UpstreamConnection>               upstream_;
    std::shared_ptr<Dialer>                           dialer_;
    std::shared_ptr<PacketObserver>                   observer_;
    std::shared_ptr<StructuredLogger>                 logger_;
    std::shared_ptr<StatsCollector>                   stats_;

    SessionContext                                    ctx_;
    std::atomic<SessionState>                         state_{SessionState::kConnecting};  // 다른 스레드에서 state() 로 읽는다
    bool                                              handshake_failed_{false};

    std::uint64_t                                     relayed_client_{0};
    std::uint64_t                                     relayed_server_{0};
    std::optional<std::string>                        close_reason_;

    // teardown 중복 실행 방지용 atomic 플래그
    std::atomic<bool>                                 closing_{false};
};
