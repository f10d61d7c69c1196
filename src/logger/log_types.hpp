#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - rewrite / scan 모듈 타입을 include 하지 않는다.
//   호출자가 필요한 값만 복사해 채운다.
//
// [경로 표기]
// - path 는 호출자가 넘긴 경로 문자열 그대로 기록한다 (정규화하지 않음).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// FileRewriteLog
//   모델 파일 재작성 이벤트 (event: "file_rewritten").
//   dry_run 이면 디스크에는 쓰지 않았지만 변경이 있었음을 뜻한다.
// ---------------------------------------------------------------------------
struct FileRewriteLog {
    std::string                           path{};
    std::vector<std::string>              functions{};  // 치환된 함수 이름 (대문자)
    std::uint64_t                         calls_rewritten{0};
    bool                                  dry_run{false};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// FileSkipLog
//   재작성 대상에서 제외된 파일 (event: "file_skipped").
//   reason: "unsafe_template" | "unreadable" | "empty" | "no_sql" | "parse_failed"
// ---------------------------------------------------------------------------
struct FileSkipLog {
    std::string                           path{};
    std::string                           reason{};
    std::string                           detail{};  // 사람이 읽을 수 있는 부가 설명
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// ScanSummaryLog
//   프로젝트 스캔 결과 요약 (event: "scan_summary").
// ---------------------------------------------------------------------------
struct ScanSummaryLog {
    std::vector<std::string>                           dialects{};
    std::vector<std::pair<std::string, std::uint64_t>> functions{};  // 이름, 출현 횟수
    std::uint64_t                                      files_scanned{0};
    std::chrono::system_clock::time_point              timestamp{};
    std::chrono::milliseconds                          duration{0};
};
