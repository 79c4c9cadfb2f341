#include "proxy/session.hpp"

#include "common/concurrency.hpp"

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>

// ---------------------------------------------------------------------------
// Session 구현
//
// 흐름:
//   1. SessionContext 초기화, stats_.on_session_open()
//   2. kConnecting : dialer_->dial(client_data)
//        실패 → 클라이언트 disconnect(사유) 후 종료 (kHandshaking 진입 안 함)
//   3. kHandshaking: start_client_game ‖ spawn_upstream (join, 실패는 로그만)
//   4. kRelaying   : relay_client_to_server ‖ relay_server_to_client (join)
//   5. kClosed     : stats_guard 소멸 시 on_session_close()
// ---------------------------------------------------------------------------

Session::Session(std::uint64_t                                     session_id,
                 boost::asio::strand<boost::asio::any_io_executor> strand,
                 std::shared_ptr<ClientConnection>                 client,
                 std::shared_ptr<Dialer>                           dialer,
                 std::shared_ptr<PacketObserver>                   observer,
                 std::shared_ptr<StructuredLogger>                 logger,
                 std::shared_ptr<StatsCollector>                   stats)
    : session_id_{session_id}
    , strand_{std::move(strand)}
    , client_{std::move(client)}
    , dialer_{std::move(dialer)}
    , observer_{std::move(observer)}
    , logger_{std::move(logger)}
    , stats_{std::move(stats)}
{}

void Session::log_event(const char* event, const std::string& reason)
{
    logger_->log_connection(ConnectionLog{
        .session_id  = session_id_,
        .event       = event,
        .client_ip   = ctx_.client_ip,
        .client_port = ctx_.client_port,
        .reason      = reason,
        .timestamp   = std::chrono::system_clock::now(),
    });
}

// ---------------------------------------------------------------------------
// Session::run
// ---------------------------------------------------------------------------
auto Session::run() -> boost::asio::awaitable<void>
{
    ctx_.session_id   = session_id_;
    ctx_.client_ip    = client_->remote_address();
    ctx_.client_port  = client_->remote_port();
    ctx_.client_data  = client_->client_data();
    ctx_.connected_at = std::chrono::system_clock::now();

    stats_->on_session_open();

    // 세션 종료 시 on_session_close 호출 보장
    struct StatsGuard {
        StatsCollector* stats;
        ~StatsGuard() { stats->on_session_close(); }
    } stats_guard{stats_.get()};

    log_event("connect", "");
    spdlog::info("[session {}] accepted {}:{}", session_id_, ctx_.client_ip, ctx_.client_port);

    // -----------------------------------------------------------------------
    // 1. Connecting
    // -----------------------------------------------------------------------
    state_ = SessionState::kConnecting;

    auto dialed = co_await dialer_->dial(ctx_.client_data);
    if (!dialed) {
        const auto& err = dialed.error();
        spdlog::warn("[session {}] dial failed: {} ({})", session_id_, err.message, err.context);
        stats_->on_dial_failure();
        log_event("dial_failed", err.message);

        bool expected = false;
        if (closing_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            close_reason_ = err.message;
            co_await client_->disconnect(err.message);
        }
        state_ = SessionState::kClosed;
        co_return;
    }

    upstream_ = std::move(*dialed);

    if (closing_.load(std::memory_order_acquire)) {
        // dial 도중 close() 되었다
        upstream_->close();
        state_ = SessionState::kClosed;
        co_return;
    }

    // -----------------------------------------------------------------------
    // 2. Handshaking: 두 시퀀스가 모두 끝나야 릴레이를 시작한다.
    //    실패는 세션을 끝내지 않는다.
    // -----------------------------------------------------------------------
    state_ = SessionState::kHandshaking;

    co_await run_concurrently(start_client_game(), spawn_upstream());

    ctx_.handshake_clean = !handshake_failed_;

    // -----------------------------------------------------------------------
    // 3. Relaying
    // -----------------------------------------------------------------------
    if (!closing_.load(std::memory_order_acquire)) {
        state_ = SessionState::kRelaying;
        spdlog::info("[session {}] relaying (handshake {})",
                     session_id_, ctx_.handshake_clean ? "clean" : "incomplete");

        co_await run_concurrently(relay_client_to_server(), relay_server_to_client());
    }

    state_ = SessionState::kClosed;
    spdlog::info("[session {}] closed (client->server {}, server->client {})",
                 session_id_, relayed_client_, relayed_server_);
}

// ---------------------------------------------------------------------------
// 핸드셰이크 작업
// ---------------------------------------------------------------------------
auto Session::start_client_game() -> boost::asio::awaitable<void>
{
    auto started = co_await client_->start_game(upstream_->game_data());
    if (!started) {
        handshake_failed_ = true;
        spdlog::warn("[session {}] client start game failed: {}",
                     session_id_, started.error().message);
    }
}

auto Session::spawn_upstream() -> boost::asio::awaitable<void>
{
    auto spawned = co_await upstream_->do_spawn();
    if (!spawned) {
        handshake_failed_ = true;
        spdlog::warn("[session {}] upstream spawn failed: {}",
                     session_id_, spawned.error().message);
    }
}

// ---------------------------------------------------------------------------
// relay_client_to_server
//   read(client) → observe → write(upstream)
//   read 실패           : 사유 없이 teardown
//   write 가 원격 종료 : 업스트림의 사유를 클라이언트에 전달
// ---------------------------------------------------------------------------
auto Session::relay_client_to_server() -> boost::asio::awaitable<void>
{
    while (true) {
        auto packet = co_await client_->read_packet();
        if (!packet) {
            spdlog::debug("[session {}] client read ended: {}",
                          session_id_, packet.error().message);
            co_await teardown(std::nullopt);
            co_return;
        }

        observer_->observe(session_id_, Direction::kClient, *packet);

        auto written = co_await upstream_->write_packet(*packet);
        if (!written) {
            spdlog::debug("[session {}] upstream write failed: {}",
                          session_id_, written.error().message);
            if (written.error().is_remote_disconnect()) {
                co_await teardown(written.error().message);
            } else {
                co_await teardown(std::nullopt);
            }
            co_return;
        }

        ++relayed_client_;
        stats_->on_packet(Direction::kClient);
    }
}

// ---------------------------------------------------------------------------
// relay_server_to_client
//   read(upstream) → observe → write(client)
//   read 가 원격 종료 : 업스트림의 사유를 클라이언트에 전달
//   read 실패          : 사유 없이 teardown
//   write 실패         : 클라이언트가 사라졌다. 사유 없이 teardown
// ---------------------------------------------------------------------------
auto Session::relay_server_to_client() -> boost::asio::awaitable<void>
{
    while (true) {
        auto packet = co_await upstream_->read_packet();
        if (!packet) {
            spdlog::debug("[session {}] upstream read ended: {}",
                          session_id_, packet.error().message);
            if (packet.error().is_remote_disconnect()) {
                co_await teardown(packet.error().message);
            } else {
                co_await teardown(std::nullopt);
            }
            co_return;
        }

        observer_->observe(session_id_, Direction::kServer, *packet);

        auto written = co_await client_->write_packet(*packet);
        if (!written) {
            spdlog::debug("[session {}] client write failed: {}",
                          session_id_, written.error().message);
            co_await teardown(std::nullopt);
            co_return;
        }

        ++relayed_server_;
        stats_->on_packet(Direction::kServer);
    }
}

// ---------------------------------------------------------------------------
// teardown
//   먼저 도착한 호출만 수행된다. 업스트림을 닫고 클라이언트에 사유를 전달한다.
//   두 번째 루프의 read/write 실패는 여기서 no-op 으로 끝난다.
// ---------------------------------------------------------------------------
auto Session::teardown(std::optional<std::string> reason) -> boost::asio::awaitable<void>
{
    bool expected = false;
    if (!closing_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        co_return;
    }

    state_ = SessionState::kClosing;
    std::string why = reason.value_or(std::string{kConnectionLost});
    close_reason_ = why;

    if (upstream_) {
        upstream_->close();
    }
    co_await client_->disconnect(why);

    log_event("disconnect", why);
    spdlog::info("[session {}] disconnected: {}", session_id_, why);
}

// ---------------------------------------------------------------------------
// Session::close
// ---------------------------------------------------------------------------
void Session::close()
{
    if (closing_.load(std::memory_order_acquire)) {
        return;
    }

    spdlog::debug("[session {}] close() called", session_id_);
    boost::asio::co_spawn(
        strand_,
        [self = shared_from_this()]() -> boost::asio::awaitable<void> {
            co_await self->teardown(std::string{kShuttingDown});
        },
        [id = session_id_](std::exception_ptr ep) {
            if (!ep) {
                return;
            }
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                spdlog::error("[session {}] close failed: {}", id, e.what());
            }
        });
}

auto Session::state() const noexcept -> SessionState
{
    return state_.load(std::memory_order_acquire);
}

auto Session::context() const noexcept -> const SessionContext&
{
    return ctx_;
}

auto Session::relayed(Direction dir) const noexcept -> std::uint64_t
{
    return dir == Direction::kClient ? relayed_client_ : relayed_server_;
}

auto Session::close_reason() const -> std::optional<std::string>
{
    return close_reason_;
}
