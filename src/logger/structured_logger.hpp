#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 워커 스레드에서 동시에 호출된다. spdlog _mt 싱크로 직렬화한다.
//
// [JSON 스키마 일관성]
// 재작성/스캔 로그 간 필드명 불일치를 최소화하기 위해
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/logger.h>

// ---------------------------------------------------------------------------
// StructuredLogger
//   FileRewriteLog / FileSkipLog / ScanSummaryLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level   : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path    : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   echo_stdout : true 면 stdout 에도 같은 줄을 출력한다.
    //   초기화 실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel                     min_level,
                              const std::filesystem::path& log_path,
                              bool                         echo_stdout = true);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    StructuredLogger(StructuredLogger&&)            = delete;
    StructuredLogger& operator=(StructuredLogger&&) = delete;

    // log_rewrite
    //   파일 재작성(또는 dry-run 변경 감지) 이벤트를 기록한다.
    void log_rewrite(const FileRewriteLog& entry);

    // log_skip
    //   제외된 파일을 기록한다. 레벨은 debug.
    void log_skip(const FileSkipLog& entry);

    // log_scan_summary
    //   스캔 집계 결과를 기록한다.
    void log_scan_summary(const ScanSummaryLog& entry);

    // 내부 진단용 spdlog 래퍼
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

private:
    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
