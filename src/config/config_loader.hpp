#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// RelayConfig 를 YAML 파일, 환경변수, 명령행에서 읽는다.
//
// [설계 원칙]
// - load() 는 all-or-nothing: 하나라도 잘못된 값이 있으면
//   std::unexpected(error_message) 를 반환하고 부분 설정을 돌려주지 않는다.
// - 알 수 없는 키는 무시한다.
// - 환경변수/플래그의 잘못된 포트 값은 이전 값을 유지하고 경고한다.
//
// YAML 예:
//   listen:
//     address: 0.0.0.0
//     port: 19132
//   upstream:
//     address: play.example.net
//     port: 19132
//   auth:
//     token_path: token.tok
//     interactive_token_lifetime_sec: 86400
//   log:
//     path: logs/mcrelay.log
//     level: info
// ---------------------------------------------------------------------------

#include "config/relay_config.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// CommandLine
//   명령행 플래그. 지정되지 않은 항목은 std::nullopt.
//     --config <path>  --host <addr>  --port <n>
//     --listen <addr>  --listen-port <n>  --token <path>  --help
// ---------------------------------------------------------------------------
struct CommandLine {
    std::optional<std::filesystem::path> config_path{};
    std::optional<std::string>           upstream_address{};
    std::optional<std::string>           upstream_port{};
    std::optional<std::string>           listen_address{};
    std::optional<std::string>           listen_port{};
    std::optional<std::string>           token_path{};
    bool                                 show_help{false};
};

class ConfigLoader {
public:
    // load
    //   YAML 파일을 읽어 base 위에 덮어쓴 RelayConfig 를 반환한다.
    //   파일 없음, 파싱 오류, 타입 불일치, 범위 밖 값은 모두 실패.
    [[nodiscard]] static std::expected<RelayConfig, std::string>
    load(const std::filesystem::path& config_path, const RelayConfig& base = {});

    // parse_command_line
    //   알 수 없는 플래그나 인자 누락은 실패.
    [[nodiscard]] static std::expected<CommandLine, std::string>
    parse_command_line(int argc, char* argv[]);

    // apply_env
    //   MCRELAY_UPSTREAM_HOST / MCRELAY_UPSTREAM_PORT / MCRELAY_LISTEN_ADDR /
    //   MCRELAY_LISTEN_PORT / MCRELAY_TOKEN_PATH / MCRELAY_LOG_PATH /
    //   MCRELAY_LOG_LEVEL 를 적용한다.
    static void apply_env(RelayConfig& config);

    static void apply_command_line(const CommandLine& cli, RelayConfig& config);

    // resolve
    //   기본값 → YAML → 환경변수 → 플래그 순서로 최종 설정을 만든다.
    [[nodiscard]] static std::expected<RelayConfig, std::string>
    resolve(const CommandLine& cli);

    [[nodiscard]] static auto usage(const char* program) -> std::string;
};
