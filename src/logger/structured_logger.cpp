// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷
// ---------------------------------------------------------------------------
static std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프 (기본적인 구현)
// ---------------------------------------------------------------------------
static std::string escape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
static spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return spdlog::level::debug;
        case LogLevel::kInfo:
            return spdlog::level::info;
        case LogLevel::kWarn:
            return spdlog::level::warn;
        case LogLevel::kError:
            return spdlog::level::err;
        default:
            return spdlog::level::info;
    }
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Stdout sink
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        if (!log_path_.empty()) {
            // 로그 디렉터리 생성
            if (log_path_.has_parent_path()) {
                std::filesystem::create_directories(log_path_.parent_path());
            }

            // Rotating file sink (100MB, 3개 파일 유지)
            const size_t max_file_size = 100 * 1024 * 1024;  // 100MB
            const size_t max_files     = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path_.string(), max_file_size, max_files));
        }

        // 로거 생성 (스레드 안전). 전역 레지스트리에는 등록하지 않는다.
        logger_ = std::make_shared<spdlog::logger>("mcrelay", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 기본 패턴: 타임스탬프만 (구조화 로그는 각 메서드에서 JSON으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");

        // 매 로그마다 파일을 플러시하도록 설정
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_connection: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_connection(const ConnectionLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":")" << escape_json_string(entry.event) << R"(","session_id":)"
         << entry.session_id << R"(,"client_ip":")" << escape_json_string(entry.client_ip)
         << R"(","client_port":)" << entry.client_port << R"(,"reason":")"
         << escape_json_string(entry.reason) << R"(","timestamp":")"
         << format_iso8601(entry.timestamp) << R"("})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_packet: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_packet(const PacketLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"packet","session_id":)" << entry.session_id
         << R"(,"direction":")" << to_string(entry.direction)
         << R"(","kind":")" << escape_json_string(entry.kind_name)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << '"';

    if (!entry.fields.empty()) {
        json << R"(,"fields":{)";
        for (size_t i = 0; i < entry.fields.size(); ++i) {
            if (i > 0) {
                json << ',';
            }
            json << '"' << escape_json_string(entry.fields[i].name) << R"(":)"
                 << entry.fields[i].json_value;
        }
        json << '}';
    } else {
        json << R"(,"payload_size":)" << entry.payload_size
             << R"(,"payload":")" << entry.payload_hex << '"';
    }

    json << '}';

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// 레벨 헬퍼
// ---------------------------------------------------------------------------
auto parse_log_level(std::string_view level_str) noexcept -> LogLevel
{
    if (level_str == "debug") { return LogLevel::kDebug; }
    if (level_str == "warn")  { return LogLevel::kWarn;  }
    if (level_str == "error") { return LogLevel::kError; }
    return LogLevel::kInfo;
}

void apply_global_log_level(LogLevel level)
{
    spdlog::set_level(to_spdlog_level(level));
}
