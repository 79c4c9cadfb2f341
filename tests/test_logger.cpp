// ---------------------------------------------------------------------------
// test_logger.cpp
//
// StructuredLogger 단위 테스트
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"
#include "logger/structured_logger.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

// ---------------------------------------------------------------------------
// Helper: JSON 라인에서 최상위 필드 값 하나를 꺼낸다 (단순 구현)
//   문자열은 따옴표 없이, 객체/배열은 괄호 포함, 숫자/불리언은 그대로.
// ---------------------------------------------------------------------------
std::string json_field(const std::string& line, const std::string& field)
{
    const std::string key = "\"" + field + "\":";
    std::size_t       pos = line.find(key);
    if (pos == std::string::npos) {
        return {};
    }
    pos += key.size();
    if (pos >= line.size()) {
        return {};
    }

    std::string out;
    const char  open = line[pos];

    if (open == '"') {
        for (++pos; pos < line.size() && line[pos] != '"'; ++pos) {
            if (line[pos] == '\\' && pos + 1 < line.size()) {
                ++pos;
            }
            out += line[pos];
        }
        return out;
    }

    if (open == '{' || open == '[') {
        const char close = open == '{' ? '}' : ']';
        int        depth = 0;
        for (; pos < line.size(); ++pos) {
            out += line[pos];
            if (line[pos] == open) {
                ++depth;
            } else if (line[pos] == close && --depth == 0) {
                break;
            }
        }
        return out;
    }

    for (; pos < line.size() && line[pos] != ',' && line[pos] != '}'; ++pos) {
        out += line[pos];
    }
    return out;
}

bool has_json_field(const std::string& line, const std::string& field)
{
    return line.find("\"" + field + "\":") != std::string::npos;
}

}  // namespace

// ---------------------------------------------------------------------------
// Fixture: 테스트마다 별도 로그 파일
// ---------------------------------------------------------------------------
class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        log_dir_  = fs::temp_directory_path() / "mcrelay_test_logs"
                    / (std::string(info->test_suite_name()) + "_" + info->name());
        log_file_ = log_dir_ / "relay.log";
        fs::remove_all(log_dir_);
    }

    void TearDown() override {
        fs::remove_all(log_dir_);
    }

    // 타임스탬프 접두사를 떼고 JSON 부분만 반환
    std::vector<std::string> read_json_lines() const {
        std::vector<std::string> lines;
        std::ifstream            file(log_file_);
        std::string              line;
        while (std::getline(file, line)) {
            if (const auto start = line.find('{'); start != std::string::npos) {
                lines.push_back(line.substr(start));
            }
        }
        return lines;
    }

    fs::path log_dir_;
    fs::path log_file_;
};

// ---------------------------------------------------------------------------
// Test: 로그 디렉터리가 없으면 만든다
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, CreatesParentDirectory) {
    ASSERT_FALSE(fs::exists(log_dir_));

    StructuredLogger logger(LogLevel::kInfo, log_file_);

    EXPECT_TRUE(fs::is_directory(log_dir_));
}

// ---------------------------------------------------------------------------
// Test: ConnectionLog JSON 직렬화
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, ConnectionLogJsonFormat) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    ConnectionLog entry;
    entry.session_id  = 12345;
    entry.event       = "disconnect";
    entry.client_ip   = "192.168.1.100";
    entry.client_port = 54321;
    entry.reason      = "connection lost";
    entry.timestamp   = std::chrono::system_clock::now();

    logger.log_connection(entry);

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1U);

    EXPECT_EQ(json_field(lines[0], "event"), "disconnect");
    EXPECT_EQ(json_field(lines[0], "session_id"), "12345");
    EXPECT_EQ(json_field(lines[0], "client_ip"), "192.168.1.100");
    EXPECT_EQ(json_field(lines[0], "client_port"), "54321");
    EXPECT_EQ(json_field(lines[0], "reason"), "connection lost");
    EXPECT_TRUE(has_json_field(lines[0], "timestamp"));
}

// ---------------------------------------------------------------------------
// Test: 필드가 있는 PacketLog 는 "fields" 객체로 기록
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, PacketLogWithFields) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    PacketLog entry;
    entry.session_id = 7;
    entry.direction  = Direction::kServer;
    entry.kind_name  = "ChangeDimension";
    entry.fields     = {{"dimension", "1"}, {"respawn", "false"}};
    entry.timestamp  = std::chrono::system_clock::now();

    logger.log_packet(entry);

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1U);

    EXPECT_EQ(json_field(lines[0], "event"), "packet");
    EXPECT_EQ(json_field(lines[0], "direction"), "server");
    EXPECT_EQ(json_field(lines[0], "kind"), "ChangeDimension");
    EXPECT_EQ(json_field(lines[0], "fields"), R"({"dimension":1,"respawn":false})");
    EXPECT_FALSE(has_json_field(lines[0], "payload"));
}

// ---------------------------------------------------------------------------
// Test: 필드가 없으면 payload 크기와 hex 덤프
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, PacketLogWithPayloadDump) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    PacketLog entry;
    entry.session_id   = 8;
    entry.direction    = Direction::kClient;
    entry.kind_name    = "Text";
    entry.payload_size = 3;
    entry.payload_hex  = "0a0b0c";
    entry.timestamp    = std::chrono::system_clock::now();

    logger.log_packet(entry);

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1U);

    EXPECT_EQ(json_field(lines[0], "direction"), "client");
    EXPECT_EQ(json_field(lines[0], "payload_size"), "3");
    EXPECT_EQ(json_field(lines[0], "payload"), "0a0b0c");
    EXPECT_FALSE(has_json_field(lines[0], "fields"));
}

// ---------------------------------------------------------------------------
// Test: warn 이상으로 설정하면 구조화 로그는 기록되지 않는다
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, LogLevelFiltering) {
    StructuredLogger logger(LogLevel::kWarn, log_file_);

    ConnectionLog entry;
    entry.session_id = 22222;
    entry.event      = "connect";
    logger.log_connection(entry);

    PacketLog packet;
    packet.kind_name = "Text";
    logger.log_packet(packet);

    EXPECT_TRUE(read_json_lines().empty());
    EXPECT_EQ(logger.min_level(), LogLevel::kWarn);
}

// ---------------------------------------------------------------------------
// Test: 멀티스레드 동시 로깅 (라인이 섞이지 않는다)
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, MultithreadedLoggingKeepsLinesIntact) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    constexpr int kThreads        = 4;
    constexpr int kLogsPerThread  = 25;
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kLogsPerThread; ++i) {
                ConnectionLog entry;
                entry.session_id = static_cast<std::uint64_t>(t) * 1000U + static_cast<std::uint64_t>(i);
                entry.event      = "connect";
                entry.client_ip  = "10.0.0." + std::to_string(t);
                entry.timestamp  = std::chrono::system_clock::now();
                logger.log_connection(entry);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), static_cast<std::size_t>(kThreads * kLogsPerThread));
    for (const auto& line : lines) {
        EXPECT_EQ(line.back(), '}');
        EXPECT_EQ(json_field(line, "event"), "connect");
    }
}

// ---------------------------------------------------------------------------
// Test: JSON 이스케이프 처리
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, JsonEscaping) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    ConnectionLog entry;
    entry.session_id = 44444;
    entry.event      = "disconnect";
    entry.reason     = "kicked \"AFK\"\nbye";
    logger.log_connection(entry);

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1U);
    EXPECT_NE(lines[0].find(R"(kicked \"AFK\"\nbye)"), std::string::npos);
    EXPECT_EQ(json_field(lines[0], "reason"), "kicked \"AFK\"nbye");
}

// ---------------------------------------------------------------------------
// Test: parse_log_level
// ---------------------------------------------------------------------------
TEST(LogLevelTest, ParsesKnownNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::kInfo);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::kError);
}

TEST(LogLevelTest, UnknownFallsBackToInfo) {
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::kInfo);
    EXPECT_EQ(parse_log_level(""), LogLevel::kInfo);
}
