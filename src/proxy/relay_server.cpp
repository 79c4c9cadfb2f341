#include "proxy/relay_server.hpp"

#include "net/tcp_client_connection.hpp"

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RelayServer 구현
//
// run() 흐름:
//   1. 리슨 주소 해석 + acceptor open/bind/listen
//   2. accept_loop co_spawn
//
// accept_loop:
//   accept → 새 strand → co_spawn(handle_client)
//
// handle_client:
//   TcpClientConnection::accept (Login 읽기) → Session 등록 → run → 등록 해제
//
// stop() 흐름:
//   1. stopping_ = true
//   2. acceptor close (acceptor executor 에서)
//   3. 활성 세션 각각 close()
//   4. 세션이 없으면 즉시 io_ctx_ stop, 있으면 마지막 세션이 끝날 때 stop
// ---------------------------------------------------------------------------

namespace {

auto log_exception(const char* what)
{
    return [what](std::exception_ptr eptr) {
        if (!eptr) {
            return;
        }
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            spdlog::error("[relay] {} exception: {}", what, e.what());
        }
    };
}

}  // namespace

RelayServer::RelayServer(RelayConfig                       config,
                         std::shared_ptr<Dialer>           dialer,
                         std::shared_ptr<PacketObserver>   observer,
                         std::shared_ptr<StructuredLogger> logger,
                         std::shared_ptr<StatsCollector>   stats)
    : config_{std::move(config)}
    , dialer_{std::move(dialer)}
    , observer_{std::move(observer)}
    , logger_{std::move(logger)}
    , stats_{std::move(stats)}
{}

// ---------------------------------------------------------------------------
// RelayServer::run
// ---------------------------------------------------------------------------
auto RelayServer::run(boost::asio::io_context& io_ctx) -> std::expected<void, RelayError>
{
    io_ctx_ = &io_ctx;

    boost::system::error_code ec;
    const auto listen_addr = boost::asio::ip::make_address(config_.listen_address, ec);
    if (ec) {
        return std::unexpected(RelayError{
            RelayErrorCode::kConfigError,
            fmt::format("invalid listen address '{}'", config_.listen_address),
            ec.message()});
    }
    const boost::asio::ip::tcp::endpoint listen_ep{listen_addr, config_.listen_port};

    auto acceptor = std::make_shared<boost::asio::ip::tcp::acceptor>(io_ctx);

    acceptor->open(listen_ep.protocol(), ec);
    if (!ec) {
        acceptor->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor->bind(listen_ep, ec);
    }
    if (!ec) {
        acceptor->listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        return std::unexpected(RelayError{
            RelayErrorCode::kIoError,
            fmt::format("cannot listen on {}:{}", config_.listen_address, config_.listen_port),
            ec.message()});
    }

    local_endpoint_ = acceptor->local_endpoint(ec);
    acceptor_       = acceptor;

    spdlog::info("[relay] listening on {}:{}, upstream {}:{}",
                 local_endpoint_.address().to_string(), local_endpoint_.port(),
                 config_.upstream_address, config_.upstream_port);

    boost::asio::co_spawn(io_ctx, accept_loop(std::move(acceptor)), log_exception("accept loop"));
    return {};
}

// ---------------------------------------------------------------------------
// accept_loop
// ---------------------------------------------------------------------------
auto RelayServer::accept_loop(std::shared_ptr<boost::asio::ip::tcp::acceptor> acceptor)
    -> boost::asio::awaitable<void>
{
    while (!stopping_.load(std::memory_order_acquire)) {
        boost::system::error_code ec;
        auto client_sock = co_await acceptor->async_accept(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) {
            if (ec == boost::asio::error::operation_aborted) {
                spdlog::info("[relay] acceptor closed");
                break;
            }
            if (!stopping_.load(std::memory_order_acquire)) {
                spdlog::warn("[relay] accept error: {}", ec.message());
            }
            continue;
        }

        if (stopping_.load(std::memory_order_acquire)) {
            boost::system::error_code close_ec;
            client_sock.close(close_ec);
            continue;
        }

        auto strand = boost::asio::make_strand(client_sock.get_executor());
        boost::asio::co_spawn(
            strand,
            handle_client(std::move(client_sock), strand),
            log_exception("client handler"));
    }
}

// ---------------------------------------------------------------------------
// handle_client
//   Login 을 읽고 Session 을 실행한다. 세션 레지스트리 등록/해제를 책임진다.
// ---------------------------------------------------------------------------
auto RelayServer::handle_client(boost::asio::ip::tcp::socket                      socket,
                                boost::asio::strand<boost::asio::any_io_executor> strand)
    -> boost::asio::awaitable<void>
{
    auto accepted = co_await TcpClientConnection::accept(std::move(socket));
    if (!accepted) {
        spdlog::warn("[relay] client handshake failed: {} ({})",
                     accepted.error().message, accepted.error().context);
        co_return;
    }

    auto client = std::move(*accepted);

    if (stopping_.load(std::memory_order_acquire)) {
        co_await client->disconnect(std::string{Session::kShuttingDown});
        co_return;
    }

    const std::uint64_t sid = next_session_id_.fetch_add(1, std::memory_order_relaxed);

    auto session = std::make_shared<Session>(
        sid, std::move(strand), client, dialer_, observer_, logger_, stats_);

    {
        std::lock_guard lock{sessions_mutex_};
        sessions_.emplace(sid, session);
    }
    spdlog::debug("[relay] new session {}", sid);

    // 예외로 끝나도 레지스트리에서 제거한다
    struct Registration {
        RelayServer*  server;
        std::uint64_t sid;
        ~Registration() { server->remove_session(sid); }
    } registration{this, sid};

    co_await session->run();
}

void RelayServer::remove_session(std::uint64_t sid)
{
    bool drained = false;
    {
        std::lock_guard lock{sessions_mutex_};
        sessions_.erase(sid);
        spdlog::debug("[relay] session {} removed (active: {})", sid, sessions_.size());
        drained = sessions_.empty();
    }

    // 모든 세션 종료 + stopping 중 → io_context 중단
    if (drained && stopping_.load(std::memory_order_acquire) && io_ctx_ != nullptr) {
        spdlog::info("[relay] all sessions closed, stopping io_context");
        io_ctx_->stop();
    }
}

// ---------------------------------------------------------------------------
// RelayServer::stop
// ---------------------------------------------------------------------------
void RelayServer::stop()
{
    if (stopping_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    if (auto acceptor = acceptor_.lock()) {
        boost::asio::post(acceptor->get_executor(), [acceptor] {
            boost::system::error_code ec;
            acceptor->close(ec);
        });
    }

    std::vector<std::shared_ptr<Session>> live;
    {
        std::lock_guard lock{sessions_mutex_};
        live.reserve(sessions_.size());
        for (const auto& [sid, session] : sessions_) {
            live.push_back(session);
        }
    }

    spdlog::info("[relay] stopping, active sessions: {}", live.size());

    for (const auto& session : live) {
        session->close();
    }

    if (live.empty() && io_ctx_ != nullptr) {
        spdlog::info("[relay] no active sessions, stopping io_context immediately");
        io_ctx_->stop();
    }
}

auto RelayServer::active_sessions() const -> std::size_t
{
    std::lock_guard lock{sessions_mutex_};
    return sessions_.size();
}

auto RelayServer::local_endpoint() const -> boost::asio::ip::tcp::endpoint
{
    return local_endpoint_;
}
