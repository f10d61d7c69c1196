#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 실행 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_* 갱신 메서드: 워커 스레드에서 concurrent 호출 안전 (atomic 사용).
// - snapshot(): 실행 종료 후 요약 출력 경로에서 호출. 갱신 경로와
//   contention 없이 읽기 가능.
//
// [격리 원칙]
// - 통계 수집 실패가 파일 처리 실패로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   rewrite_rate: files_rewritten / files_seen (files_seen == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                         files_seen{0};
    std::uint64_t                         files_rewritten{0};
    std::uint64_t                         files_unsafe{0};
    std::uint64_t                         files_unreadable{0};
    std::uint64_t                         span_parse_failures{0};
    std::uint64_t                         calls_rewritten{0};
    double                                rewrite_rate{0.0};
    std::chrono::milliseconds             elapsed{0};
    std::chrono::system_clock::time_point captured_at{};
};

// ---------------------------------------------------------------------------
// StatsCollector
//   파일 처리 이벤트를 집계하고 StatsSnapshot 을 제공한다.
// ---------------------------------------------------------------------------
class StatsCollector {
public:
    StatsCollector() noexcept
        : files_seen_{0}
        , files_rewritten_{0}
        , files_unsafe_{0}
        , files_unreadable_{0}
        , span_parse_failures_{0}
        , calls_rewritten_{0}
        , started_at_(std::chrono::steady_clock::now())
    {}

    ~StatsCollector() = default;

    // 복사 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;

    // 이동 금지 (atomic 소유권 명확화)
    StatsCollector(StatsCollector&&)            = delete;
    StatsCollector& operator=(StatsCollector&&) = delete;

    // on_file_seen
    //   처리 대상 파일 하나를 읽기 시작할 때 호출.
    void on_file_seen() noexcept {
        files_seen_.fetch_add(1, std::memory_order_relaxed);
    }

    // on_file_rewritten
    //   calls: 해당 파일에서 치환된 호출 수
    void on_file_rewritten(std::uint64_t calls) noexcept {
        files_rewritten_.fetch_add(1, std::memory_order_relaxed);
        calls_rewritten_.fetch_add(calls, std::memory_order_relaxed);
    }

    void on_file_unsafe() noexcept {
        files_unsafe_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_file_unreadable() noexcept {
        files_unreadable_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_span_parse_failure() noexcept {
        span_parse_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    // snapshot
    //   현재 통계의 불변 스냅샷을 반환한다.
    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto seen        = files_seen_.load(std::memory_order_relaxed);
        const auto rewritten   = files_rewritten_.load(std::memory_order_relaxed);
        const auto unsafe      = files_unsafe_.load(std::memory_order_relaxed);
        const auto unreadable  = files_unreadable_.load(std::memory_order_relaxed);
        const auto parse_fail  = span_parse_failures_.load(std::memory_order_relaxed);
        const auto calls       = calls_rewritten_.load(std::memory_order_relaxed);

        double rewrite_rate = 0.0;
        if (seen > 0) {
            rewrite_rate = static_cast<double>(rewritten) / static_cast<double>(seen);
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at_);

        return StatsSnapshot{
            .files_seen          = seen,
            .files_rewritten     = rewritten,
            .files_unsafe        = unsafe,
            .files_unreadable    = unreadable,
            .span_parse_failures = parse_fail,
            .calls_rewritten     = calls,
            .rewrite_rate        = rewrite_rate,
            .elapsed             = elapsed,
            .captured_at         = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t>            files_seen_;
    std::atomic<std::uint64_t>            files_rewritten_;
    std::atomic<std::uint64_t>            files_unsafe_;
    std::atomic<std::uint64_t>            files_unreadable_;
    std::atomic<std::uint64_t>            span_parse_failures_;
    std::atomic<std::uint64_t>            calls_rewritten_;
    const std::chrono::steady_clock::time_point started_at_;
};
