// ---------------------------------------------------------------------------
// test_logger.cpp
//
// StructuredLogger 단위 테스트
//
// [테스트 범위]
// - file_rewritten / file_skipped / scan_summary JSON 필드
// - 레벨 필터링 (file_skipped 는 debug 에서만 기록)
// - 멀티스레드 동시 로깅, JSON 이스케이프, 진단 로그
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"
#include "logger/structured_logger.hpp"

#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helper: JSON 라인 파싱 (단순 구현)
// ---------------------------------------------------------------------------
class JsonLineParser {
public:
    explicit JsonLineParser(const std::string& json_str)
        : parsed_(json_str) {}

    bool has_field(const std::string& field) const {
        return parsed_.find("\"" + field + "\"") != std::string::npos;
    }

    std::string get_field(const std::string& field) const {
        std::string search_key = "\"" + field + "\":";
        size_t      pos         = parsed_.find(search_key);
        if (pos == std::string::npos) {
            return "";
        }

        pos += search_key.length();

        // Skip whitespace
        while (pos < parsed_.size() && std::isspace(parsed_[pos])) {
            ++pos;
        }

        if (pos >= parsed_.size()) {
            return "";
        }

        // Extract value (string or number)
        std::ostringstream oss;

        if (parsed_[pos] == '"') {
            // String value
            ++pos;
            while (pos < parsed_.size() && parsed_[pos] != '"') {
                if (parsed_[pos] == '\\' && pos + 1 < parsed_.size()) {
                    ++pos;
                }
                oss << parsed_[pos];
                ++pos;
            }
        } else if (parsed_[pos] == '[') {
            // Array value
            int depth = 0;
            while (pos < parsed_.size()) {
                oss << parsed_[pos];
                if (parsed_[pos] == '[') {
                    ++depth;
                } else if (parsed_[pos] == ']') {
                    --depth;
                    if (depth == 0) {
                        ++pos;
                        break;
                    }
                }
                ++pos;
            }
        } else if (parsed_[pos] == '{') {
            // Object value
            int depth = 0;
            while (pos < parsed_.size()) {
                oss << parsed_[pos];
                if (parsed_[pos] == '{') {
                    ++depth;
                } else if (parsed_[pos] == '}') {
                    --depth;
                    if (depth == 0) {
                        ++pos;
                        break;
                    }
                }
                ++pos;
            }
        } else {
            // Number or boolean
            while (pos < parsed_.size() && (std::isalnum(parsed_[pos]) || parsed_[pos] == '-' ||
                                             parsed_[pos] == '.' || parsed_[pos] == '+')) {
                oss << parsed_[pos];
                ++pos;
            }
        }

        return oss.str();
    }

private:
    std::string parsed_;
};

// ---------------------------------------------------------------------------
// Fixture: Temporary log file
// ---------------------------------------------------------------------------
class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name =
            std::string(info->test_suite_name()) + "_" + info->name();
        log_dir_  = fs::temp_directory_path() / "dbport_test_logs" / unique_name;
        log_file_ = log_dir_ / "test.log";
        fs::create_directories(log_dir_);
    }

    void TearDown() override {
        fs::remove_all(log_dir_);
    }

    std::vector<std::string> read_log_lines() const {
        std::vector<std::string> lines;
        std::ifstream            file(log_file_);
        if (!file.is_open()) {
            return lines;
        }

        std::string line;
        while (std::getline(file, line)) {
            // Skip timestamps and keep only JSON part
            size_t json_start = line.find('{');
            if (json_start != std::string::npos) {
                lines.push_back(line.substr(json_start));
            }
        }
        return lines;
    }

    fs::path log_dir_;
    fs::path log_file_;
};

// ---------------------------------------------------------------------------
// Test: FileRewriteLog JSON 직렬화
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, FileRewriteLogJsonFormat) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, false);

    FileRewriteLog entry;
    entry.path            = "models/marts/orders.sql";
    entry.functions       = {"COLLECT_LIST", "NVL"};
    entry.calls_rewritten = 3;
    entry.dry_run         = false;
    entry.timestamp       = std::chrono::system_clock::now();

    logger.log_rewrite(entry);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_GT(lines.size(), 0) << "No log lines found";

    JsonLineParser parser(lines[0]);
    EXPECT_TRUE(parser.has_field("event"));
    EXPECT_TRUE(parser.has_field("path"));
    EXPECT_TRUE(parser.has_field("functions"));
    EXPECT_TRUE(parser.has_field("calls_rewritten"));
    EXPECT_TRUE(parser.has_field("dry_run"));
    EXPECT_TRUE(parser.has_field("timestamp"));

    EXPECT_EQ(parser.get_field("event"), "file_rewritten");
    EXPECT_EQ(parser.get_field("path"), "models/marts/orders.sql");
    EXPECT_EQ(parser.get_field("functions"), R"(["COLLECT_LIST","NVL"])");
    EXPECT_EQ(parser.get_field("calls_rewritten"), "3");
    EXPECT_EQ(parser.get_field("dry_run"), "false");
}

TEST_F(StructuredLoggerTest, FileRewriteLogDryRun) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, false);

    FileRewriteLog entry;
    entry.path      = "models/a.sql";
    entry.dry_run   = true;
    entry.timestamp = std::chrono::system_clock::now();

    logger.log_rewrite(entry);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_GT(lines.size(), 0);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("dry_run"), "true");
    EXPECT_EQ(parser.get_field("functions"), "[]");
}

// ---------------------------------------------------------------------------
// Test: FileSkipLog reason 과 detail
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, FileSkipLogReasonAndDetail) {
    StructuredLogger logger(LogLevel::kDebug, log_file_, false);

    FileSkipLog entry;
    entry.path      = "models/staging/stg_users.sql";
    entry.reason    = "unsafe_template";
    entry.detail    = "unknown call dbt_utils.star at offset 42";
    entry.timestamp = std::chrono::system_clock::now();

    logger.log_skip(entry);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_GT(lines.size(), 0);

    JsonLineParser parser(lines[0]);
    EXPECT_TRUE(parser.has_field("reason"));
    EXPECT_TRUE(parser.has_field("detail"));

    EXPECT_EQ(parser.get_field("event"), "file_skipped");
    EXPECT_EQ(parser.get_field("reason"), "unsafe_template");
    EXPECT_EQ(parser.get_field("detail"), "unknown call dbt_utils.star at offset 42");
}

// ---------------------------------------------------------------------------
// Test: ScanSummaryLog 함수 집계 객체
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, ScanSummaryJsonFields) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, false);

    ScanSummaryLog entry;
    entry.dialects      = {"spark", "duckdb"};
    entry.functions     = {{"COLLECT_LIST", 4}, {"NVL", 1}};
    entry.files_scanned = 12;
    entry.timestamp     = std::chrono::system_clock::now();
    entry.duration      = std::chrono::milliseconds(250);

    logger.log_scan_summary(entry);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_GT(lines.size(), 0);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("event"), "scan_summary");
    EXPECT_EQ(parser.get_field("dialects"), R"(["spark","duckdb"])");
    EXPECT_EQ(parser.get_field("functions"), R"({"COLLECT_LIST":4,"NVL":1})");
    EXPECT_EQ(parser.get_field("files_scanned"), "12");
    EXPECT_EQ(parser.get_field("duration_ms"), "250");
}

// ---------------------------------------------------------------------------
// Test: 로그 레벨 필터링
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, LogLevelFiltering) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, false);

    auto now = std::chrono::system_clock::now();

    // debug 레벨 skip 로그 (필터되어야 함)
    FileSkipLog skip;
    skip.path      = "models/a.sql";
    skip.reason    = "empty";
    skip.timestamp = now;
    logger.log_skip(skip);

    // info 레벨 rewrite 로그 (기록되어야 함)
    FileRewriteLog rewrite;
    rewrite.path      = "models/b.sql";
    rewrite.timestamp = now;
    logger.log_rewrite(rewrite);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    EXPECT_EQ(lines.size(), 1);
    EXPECT_TRUE(lines[0].find("file_rewritten") != std::string::npos);
}

TEST_F(StructuredLoggerTest, WarnLevelSuppressesEvents) {
    StructuredLogger logger(LogLevel::kWarn, log_file_, false);

    FileRewriteLog rewrite;
    rewrite.path      = "models/b.sql";
    rewrite.timestamp = std::chrono::system_clock::now();
    logger.log_rewrite(rewrite);

    ScanSummaryLog summary;
    summary.timestamp = rewrite.timestamp;
    logger.log_scan_summary(summary);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    EXPECT_TRUE(read_log_lines().empty());
}

// ---------------------------------------------------------------------------
// Test: 멀티스레드 동시 로깅 (크래시 없음)
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, MultithreadedLoggingNoCrash) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, false);

    const int                      num_threads = 4;
    const int                      logs_per_thread = 10;
    std::vector<std::thread>       threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&logger, t]() {
            auto now = std::chrono::system_clock::now();
            for (int i = 0; i < logs_per_thread; ++i) {
                FileRewriteLog entry;
                entry.path            = "models/worker_" + std::to_string(t) + "/m_" +
                                        std::to_string(i) + ".sql";
                entry.functions       = {"COLLECT_LIST"};
                entry.calls_rewritten = static_cast<std::uint64_t>(i);
                entry.timestamp       = now;
                logger.log_rewrite(entry);
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto lines = read_log_lines();
    EXPECT_EQ(lines.size(), static_cast<std::size_t>(num_threads * logs_per_thread));
}

// ---------------------------------------------------------------------------
// Test: JSON 이스케이프 처리
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, JsonEscaping) {
    StructuredLogger logger(LogLevel::kDebug, log_file_, false);

    FileSkipLog entry;
    entry.path      = "models/odd\"name\\.sql";
    entry.reason    = "parse_failed";
    entry.detail    = "line 1\nline 2\ttabbed";
    entry.timestamp = std::chrono::system_clock::now();

    logger.log_skip(entry);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u) << "escaped newline must not split the JSON line";

    EXPECT_NE(lines[0].find(R"(odd\"name\\.sql)"), std::string::npos);
    EXPECT_NE(lines[0].find(R"(line 1\nline 2\ttabbed)"), std::string::npos);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("reason"), "parse_failed");
}

// ---------------------------------------------------------------------------
// Test: 디버그/정보/경고/에러 로깅
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, DiagnosticLogging) {
    StructuredLogger logger(LogLevel::kDebug, log_file_, false);

    logger.debug("Debug message");
    logger.info("Info message");
    logger.warn("Warning message");
    logger.error("Error message");

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // 진단 로그는 일반 텍스트이므로, 파일이 생성되고 크기가 0이 아닌지 확인
    std::ifstream file(log_file_);
    EXPECT_TRUE(file.is_open()) << "Log file was not created";

    file.seekg(0, std::ios::end);
    std::streamsize file_size = file.tellg();
    EXPECT_GT(file_size, 0) << "Log file is empty";
}

// ---------------------------------------------------------------------------
// Test: 로그 파일 상위 디렉터리 자동 생성
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, CreatesParentDirectories) {
    const fs::path nested = log_dir_ / "a" / "b" / "dbport.jsonl";
    {
        StructuredLogger logger(LogLevel::kInfo, nested, false);
        logger.info("hello");
    }
    EXPECT_TRUE(fs::exists(nested));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
