#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 고빈도 로그 경로(log_packet)에서 불필요한 문자열 복사를 줄이기 위해
//   const-ref 파라미터를 사용한다.
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다. 한 줄에 레코드 하나.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

// ---------------------------------------------------------------------------
// StructuredLogger
//   ConnectionLog / PacketLog 를 JSON 포맷으로 기록한다.
//
//   출력: stdout + rotating file (log_path 가 비어 있으면 stdout 만)
//   레코드마다 flush 한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   실패 시 std::runtime_error (프로세스 기동 단계에서만 생성된다)
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // log_connection
    //   세션 연결/해제 이벤트를 JSON 으로 기록한다.
    void log_connection(const ConnectionLog& entry);

    // log_packet
    //   릴레이된 패킷을 JSON 으로 기록한다.
    //   [고빈도 호출 경로] 억제 대상 패킷은 호출자가 걸러낸다.
    void log_packet(const PacketLog& entry);

    [[nodiscard]] auto min_level() const noexcept -> LogLevel { return min_level_; }

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};

// ---------------------------------------------------------------------------
// parse_log_level
//   "debug" | "info" | "warn" | "error" → LogLevel (그 외는 kInfo)
// ---------------------------------------------------------------------------
[[nodiscard]] auto parse_log_level(std::string_view level_str) noexcept -> LogLevel;

// ---------------------------------------------------------------------------
// apply_global_log_level
//   spdlog 기본 로거(진단 로그)의 레벨을 맞춘다.
// ---------------------------------------------------------------------------
void apply_global_log_level(LogLevel level);
