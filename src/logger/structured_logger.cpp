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
#include <string>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kLoggerName = "dbport";

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
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
// Helper: JSON 문자열 이스케이프
// ---------------------------------------------------------------------------
std::string escape_json_string(const std::string& str) {
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
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

void write_string_array(std::ostringstream& json, const std::vector<std::string>& items) {
    json << '[';
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            json << ',';
        }
        json << '"' << escape_json_string(items[i]) << '"';
    }
    json << ']';
}

} // namespace

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
spdlog::level::level_enum StructuredLogger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return spdlog::level::debug;
        case LogLevel::kInfo:
            return spdlog::level::info;
        case LogLevel::kWarn:
            return spdlog::level::warn;
        case LogLevel::kError:
            return spdlog::level::err;
    }
    return spdlog::level::info;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   bool                         echo_stdout)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        if (echo_stdout) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        }

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 기본 패턴: 타임스탬프만 (구조화 로그는 각 메서드에서 JSON으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);

        spdlog::register_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(kLoggerName);
    }
}

// ---------------------------------------------------------------------------
// log_rewrite: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_rewrite(const FileRewriteLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"file_rewritten","path":")" << escape_json_string(entry.path)
         << R"(","functions":)";
    write_string_array(json, entry.functions);
    json << R"(,"calls_rewritten":)" << entry.calls_rewritten << R"(,"dry_run":)"
         << (entry.dry_run ? "true" : "false") << R"(,"timestamp":")"
         << format_iso8601(entry.timestamp) << R"("})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_skip: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_skip(const FileSkipLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kDebug)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"file_skipped","path":")" << escape_json_string(entry.path)
         << R"(","reason":")" << escape_json_string(entry.reason) << R"(","detail":")"
         << escape_json_string(entry.detail) << R"(","timestamp":")"
         << format_iso8601(entry.timestamp) << R"("})";

    logger_->debug(json.str());
}

// ---------------------------------------------------------------------------
// log_scan_summary: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_scan_summary(const ScanSummaryLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"scan_summary","dialects":)";
    write_string_array(json, entry.dialects);
    json << R"(,"functions":{)";
    for (std::size_t i = 0; i < entry.functions.size(); ++i) {
        if (i > 0) {
            json << ',';
        }
        json << '"' << escape_json_string(entry.functions[i].first) << R"(":)"
             << entry.functions[i].second;
    }
    json << R"(},"files_scanned":)" << entry.files_scanned << R"(,"timestamp":")"
         << format_iso8601(entry.timestamp) << R"(","duration_ms":)" << entry.duration.count()
         << R"(})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
