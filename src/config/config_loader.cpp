// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML / 환경변수 / 명령행에서 RelayConfig 를 조립한다.
//
// [설계 원칙]
// - All-or-nothing: YAML 파싱 실패 시 부분 설정을 반환하지 않는다.
// - 섹션 또는 키가 없으면 이전 값(기본값)을 유지한다.
// - 키가 있는데 타입/범위가 틀리면 실패로 처리한다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <getopt.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

using StepResult = std::expected<void, std::string>;

// ---------------------------------------------------------------------------
// 내부 헬퍼: 포트 문자열 파싱. 범위 밖이거나 숫자가 아니면 std::nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::uint16_t> parse_port(std::string_view raw, bool allow_zero) {
    std::int64_t value{0};
    const char*  end = raw.data() + raw.size();
    auto [ptr, ec]   = std::from_chars(raw.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    if (value < (allow_zero ? 0 : 1) || value > 65535) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

[[nodiscard]] bool is_log_level(std::string_view level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 섹션의 스칼라 읽기.
// 키가 없으면 out 을 건드리지 않는다.
// ---------------------------------------------------------------------------
[[nodiscard]] StepResult read_string(const YAML::Node& section,
                                     const char*       path,
                                     const char*       key,
                                     std::string&      out) {
    const YAML::Node node = section[key];
    if (!node) {
        return {};
    }
    if (!node.IsScalar()) {
        return std::unexpected(fmt::format("'{}.{}' must be a string", path, key));
    }
    out = node.as<std::string>();
    return {};
}

[[nodiscard]] StepResult read_port(const YAML::Node& section,
                                   const char*       path,
                                   const char*       key,
                                   bool              allow_zero,
                                   std::uint16_t&    out) {
    const YAML::Node node = section[key];
    if (!node) {
        return {};
    }
    if (!node.IsScalar()) {
        return std::unexpected(fmt::format("'{}.{}' must be a port number", path, key));
    }
    const auto port = parse_port(node.Scalar(), allow_zero);
    if (!port) {
        return std::unexpected(fmt::format("'{}.{}' is not a valid port: '{}'",
                                           path, key, node.Scalar()));
    }
    out = *port;
    return {};
}

[[nodiscard]] StepResult read_u32(const YAML::Node& section,
                                  const char*       path,
                                  const char*       key,
                                  std::uint32_t&    out) {
    const YAML::Node node = section[key];
    if (!node) {
        return {};
    }
    if (!node.IsScalar()) {
        return std::unexpected(fmt::format("'{}.{}' must be a number", path, key));
    }
    const std::string& raw = node.Scalar();
    std::uint32_t value{0};
    const char* end = raw.data() + raw.size();
    auto [ptr, ec]  = std::from_chars(raw.data(), end, value);
    if (ec != std::errc{} || ptr != end || value == 0) {
        return std::unexpected(fmt::format("'{}.{}' must be a positive integer: '{}'",
                                           path, key, raw));
    }
    out = value;
    return {};
}

// 섹션이 있으면 map 이어야 한다
[[nodiscard]] StepResult expect_map(const YAML::Node& node, const char* name) {
    if (node && !node.IsMap()) {
        return std::unexpected(fmt::format("'{}' must be a map", name));
    }
    return {};
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 환경변수 읽기
// ---------------------------------------------------------------------------
std::optional<std::string> env_str(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return std::string{val};
    }
    return std::nullopt;
}

// 잘못된 값이면 이전 값을 유지하고 경고한다
void override_port(const char* source, const std::string& raw, bool allow_zero,
                   std::uint16_t& out) {
    const auto port = parse_port(raw, allow_zero);
    if (!port) {
        spdlog::warn("[config] {}: invalid port '{}', keeping {}", source, raw, out);
        return;
    }
    out = *port;
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load
// ---------------------------------------------------------------------------
std::expected<RelayConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path, const RelayConfig& base) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path.string());
    } catch (const YAML::BadFile& e) {
        return std::unexpected(fmt::format(
            "config: cannot open file '{}': {}", config_path.string(), e.what()));
    } catch (const YAML::ParserException& e) {
        return std::unexpected(fmt::format(
            "config: YAML parse error in '{}' at line {}, col {}: {}",
            config_path.string(), e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format(
            "config: YAML error in '{}': {}", config_path.string(), e.what()));
    }

    // 빈 파일은 기본값 그대로
    if (root.IsNull()) {
        return base;
    }
    if (!root.IsMap()) {
        return std::unexpected(fmt::format(
            "config: '{}' is not a valid YAML map (top-level)", config_path.string()));
    }

    RelayConfig cfg = base;

    const YAML::Node listen   = root["listen"];
    const YAML::Node upstream = root["upstream"];
    const YAML::Node auth     = root["auth"];
    const YAML::Node log      = root["log"];

    const StepResult steps[] = {
        expect_map(listen, "listen"),
        expect_map(upstream, "upstream"),
        expect_map(auth, "auth"),
        expect_map(log, "log"),
    };
    for (const auto& step : steps) {
        if (!step) {
            return std::unexpected("config: " + step.error());
        }
    }

    try {
        StepResult result;
        if (listen) {
            if (result = read_string(listen, "listen", "address", cfg.listen_address); !result) {
                return std::unexpected("config: " + result.error());
            }
            if (result = read_port(listen, "listen", "port", true, cfg.listen_port); !result) {
                return std::unexpected("config: " + result.error());
            }
        }
        if (upstream) {
            if (result = read_string(upstream, "upstream", "address", cfg.upstream_address); !result) {
                return std::unexpected("config: " + result.error());
            }
            if (result = read_port(upstream, "upstream", "port", false, cfg.upstream_port); !result) {
                return std::unexpected("config: " + result.error());
            }
        }
        if (auth) {
            if (result = read_string(auth, "auth", "token_path", cfg.token_path); !result) {
                return std::unexpected("config: " + result.error());
            }
            if (result = read_u32(auth, "auth", "interactive_token_lifetime_sec",
                                  cfg.interactive_token_lifetime_sec); !result) {
                return std::unexpected("config: " + result.error());
            }
        }
        if (log) {
            if (result = read_string(log, "log", "path", cfg.log_path); !result) {
                return std::unexpected("config: " + result.error());
            }
            if (result = read_string(log, "log", "level", cfg.log_level); !result) {
                return std::unexpected("config: " + result.error());
            }
        }
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("config: error reading '{}': {}",
                                           config_path.string(), e.what()));
    }

    if (cfg.upstream_address.empty()) {
        return std::unexpected(std::string{"config: 'upstream.address' must not be empty"});
    }
    if (!is_log_level(cfg.log_level)) {
        return std::unexpected(fmt::format(
            "config: 'log.level' must be one of debug|info|warn|error, got '{}'", cfg.log_level));
    }

    spdlog::info("[config] loaded '{}'", config_path.string());
    return cfg;
}

// ---------------------------------------------------------------------------
// ConfigLoader::parse_command_line
// ---------------------------------------------------------------------------
std::expected<CommandLine, std::string>
ConfigLoader::parse_command_line(int argc, char* argv[]) {
    enum : int {
        kOptHost = 1000,
        kOptPort,
        kOptListen,
        kOptListenPort,
        kOptToken,
    };

    static const struct option long_options[] = {
        {"config",      required_argument, nullptr, 'c'},
        {"help",        no_argument,       nullptr, 'h'},
        {"host",        required_argument, nullptr, kOptHost},
        {"port",        required_argument, nullptr, kOptPort},
        {"listen",      required_argument, nullptr, kOptListen},
        {"listen-port", required_argument, nullptr, kOptListenPort},
        {"token",       required_argument, nullptr, kOptToken},
        {nullptr,       0,                 nullptr, 0},
    };

    CommandLine cli;

    // 반복 호출을 위해 getopt 상태 초기화
    optind = 0;
    opterr = 0;

    while (true) {
        int option_index = 0;
        const int cmd = getopt_long(argc, argv, ":c:h", long_options, &option_index);
        if (cmd == -1) {
            break;
        }

        switch (cmd) {
            case 'c':            cli.config_path      = optarg; break;
            case 'h':            cli.show_help        = true;   break;
            case kOptHost:       cli.upstream_address = optarg; break;
            case kOptPort:       cli.upstream_port    = optarg; break;
            case kOptListen:     cli.listen_address   = optarg; break;
            case kOptListenPort: cli.listen_port      = optarg; break;
            case kOptToken:      cli.token_path       = optarg; break;
            case ':':
                return std::unexpected(fmt::format("option '{}' requires a value",
                                                   argv[optind - 1]));
            default:
                return std::unexpected(fmt::format("unknown option '{}'",
                                                   argv[optind - 1]));
        }
    }

    if (optind < argc) {
        return std::unexpected(fmt::format("unexpected argument '{}'", argv[optind]));
    }

    return cli;
}

// ---------------------------------------------------------------------------
// ConfigLoader::apply_env
// ---------------------------------------------------------------------------
void ConfigLoader::apply_env(RelayConfig& config) {
    if (auto v = env_str("MCRELAY_UPSTREAM_HOST")) { config.upstream_address = *v; }
    if (auto v = env_str("MCRELAY_UPSTREAM_PORT")) {
        override_port("MCRELAY_UPSTREAM_PORT", *v, false, config.upstream_port);
    }
    if (auto v = env_str("MCRELAY_LISTEN_ADDR")) { config.listen_address = *v; }
    if (auto v = env_str("MCRELAY_LISTEN_PORT")) {
        override_port("MCRELAY_LISTEN_PORT", *v, true, config.listen_port);
    }
    if (auto v = env_str("MCRELAY_TOKEN_PATH")) { config.token_path = *v; }
    if (auto v = env_str("MCRELAY_LOG_PATH"))   { config.log_path   = *v; }
    if (auto v = env_str("MCRELAY_LOG_LEVEL")) {
        if (is_log_level(*v)) {
            config.log_level = *v;
        } else {
            spdlog::warn("[config] MCRELAY_LOG_LEVEL: invalid level '{}', keeping {}",
                         *v, config.log_level);
        }
    }
}

void ConfigLoader::apply_command_line(const CommandLine& cli, RelayConfig& config) {
    if (cli.upstream_address) { config.upstream_address = *cli.upstream_address; }
    if (cli.upstream_port) {
        override_port("--port", *cli.upstream_port, false, config.upstream_port);
    }
    if (cli.listen_address) { config.listen_address = *cli.listen_address; }
    if (cli.listen_port) {
        override_port("--listen-port", *cli.listen_port, true, config.listen_port);
    }
    if (cli.token_path) { config.token_path = *cli.token_path; }
}

std::expected<RelayConfig, std::string>
ConfigLoader::resolve(const CommandLine& cli) {
    RelayConfig config;

    if (cli.config_path) {
        auto loaded = load(*cli.config_path, config);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    apply_env(config);
    apply_command_line(cli, config);
    return config;
}

auto ConfigLoader::usage(const char* program) -> std::string {
    return fmt::format(
        "usage: {} [options]\n"
        "  -c, --config <path>     YAML configuration file\n"
        "      --host <addr>       upstream server address\n"
        "      --port <n>          upstream server port\n"
        "      --listen <addr>     listen address\n"
        "      --listen-port <n>   listen port (0 = any)\n"
        "      --token <path>      cached credential file\n"
        "  -h, --help              show this help\n",
        program);
}
