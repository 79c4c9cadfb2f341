#include "app/console_commands.hpp"
#include "auth/auth_provider.hpp"
#include "auth/credential_store.hpp"
#include "auth/shutdown_hook.hpp"
#include "auth/token_source.hpp"
#include "config/config_loader.hpp"
#include "logger/structured_logger.hpp"
#include "net/tcp_dialer.hpp"
#include "proxy/relay_server.hpp"
#include "relay/packet_observer.hpp"
#include "stats/stats_collector.hpp"

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>

// ---------------------------------------------------------------------------
// main
//   설정 → 로깅 → 토큰 획득 → 릴레이 실행 → 종료 시 토큰 저장
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 명령행 / 설정 ───────────────────────────────────────────────────
    auto cli = ConfigLoader::parse_command_line(argc, argv);
    if (!cli) {
        std::cerr << cli.error() << '\n' << ConfigLoader::usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (cli->show_help) {
        std::cout << ConfigLoader::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    auto config = ConfigLoader::resolve(*cli);
    if (!config) {
        spdlog::critical("[config] {}", config.error());
        return EXIT_FAILURE;
    }

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    const LogLevel level = parse_log_level(config->log_level);
    apply_global_log_level(level);

    std::shared_ptr<StructuredLogger> logger;
    try {
        logger = std::make_shared<StructuredLogger>(level, config->log_path);
    } catch (const std::exception& e) {
        spdlog::critical("cannot open log file {}: {}", config->log_path, e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("Starting mcrelay");
    spdlog::info("Listen: {}:{}", config->listen_address, config->listen_port);
    spdlog::info("Upstream: {}:{}", config->upstream_address, config->upstream_port);
    spdlog::info("Token cache: {}", config->token_path);
    spdlog::info("Log: {} ({})", config->log_path, config->log_level);

    // ── 자격 증명 ───────────────────────────────────────────────────────
    const CredentialStore store{config->token_path};
    ConsoleAuthProvider   provider{std::cin, std::cout,
                                   std::chrono::seconds{config->interactive_token_lifetime_sec}};

    auto token = TokenSource::acquire(store, provider);
    if (!token) {
        spdlog::critical("[auth] cannot obtain credentials: {} ({})",
                         token.error().message, token.error().context);
        return EXIT_FAILURE;
    }
    spdlog::info("[auth] credentials ready (type {})", token->token_type);

    // 종료 경로(시그널 / 콘솔 stop / 정상 반환) 어디서든 한 번만 저장
    ShutdownHook persist_token{[&store, &token] {
        if (auto saved = store.persist(*token); !saved) {
            spdlog::error("[auth] cannot persist credentials: {} ({})",
                          saved.error().message, saved.error().context);
            return;
        }
        spdlog::info("[auth] credentials saved to {}", store.path().string());
    }};

    // ── 릴레이 구성 ─────────────────────────────────────────────────────
    auto stats    = std::make_shared<StatsCollector>();
    auto observer = std::make_shared<LoggingObserver>(logger);
    auto dialer   = std::make_shared<TcpDialer>(config->upstream_address,
                                                config->upstream_port,
                                                token->access_token);

    // server 가 io_context 보다 오래 살아야 한다 (남은 세션 프레임 정리 시 참조)
    RelayServer             server{*config, dialer, observer, logger, stats};
    boost::asio::io_context ioc;

    if (auto started = server.run(ioc); !started) {
        spdlog::critical("[relay] {} ({})", started.error().message, started.error().context);
        return EXIT_FAILURE;
    }

    boost::asio::signal_set          signals{ioc, SIGINT, SIGTERM};
    std::optional<ConsoleCommands>   console;

    auto shutdown = [&] {
        persist_token.run();
        server.stop();
        boost::system::error_code ec;
        signals.cancel(ec);
        if (console) {
            console->stop();
        }
    };

    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        spdlog::info("received signal {}, shutting down", signo);
        shutdown();
    });

    try {
        console.emplace(ioc, STDIN_FILENO, [&] { shutdown(); });
        boost::asio::co_spawn(ioc, console->run(), [](std::exception_ptr eptr) {
            if (!eptr) {
                return;
            }
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& e) {
                spdlog::error("[console] exception: {}", e.what());
            }
        });
    } catch (const std::exception& e) {
        spdlog::warn("[console] disabled: {}", e.what());
        console.reset();
    }

    ioc.run();

    // ── 종료 처리 ───────────────────────────────────────────────────────
    persist_token.run();

    const auto snapshot = stats->snapshot();
    spdlog::info("Relay stopped: sessions={} client_packets={} server_packets={} dial_failures={}",
                 snapshot.total_sessions, snapshot.client_packets,
                 snapshot.server_packets, snapshot.dial_failures);

    return EXIT_SUCCESS;
}
