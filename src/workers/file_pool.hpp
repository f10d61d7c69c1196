#pragma once

// ---------------------------------------------------------------------------
// file_pool.hpp
//
// 모델 파일 열거와 파일 단위 병렬 처리.
//
// [동시성 모델]
// - 파일 하나의 분류 → 파싱 → 재작성 파이프라인은 다른 파일과 상태를
//   공유하지 않으므로 파일 단위로 boost::asio::thread_pool 에 분배한다.
// - fn 은 여러 스레드에서 동시에 호출된다. 결과 병합은 호출자가 직접
//   mutex 로 보호해야 한다.
// - 처리 순서는 보장하지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

// collect_sql_files
//   roots 아래 *.sql 파일을 재귀 탐색해 정렬된 목록으로 반환한다.
//   존재하지 않거나 읽을 수 없는 루트는 경고 로그 후 건너뛴다.
[[nodiscard]] std::vector<std::filesystem::path>
collect_sql_files(const std::vector<std::filesystem::path>& roots);

// resolve_worker_count
//   requested == 0 이면 하드웨어 동시성 (최소 1).
[[nodiscard]] std::size_t resolve_worker_count(std::size_t requested) noexcept;

// parallel_for_each
//   files 각각에 fn 을 실행하고 모두 끝날 때까지 기다린다.
//   fn 에서 던진 예외는 오류 로그 후 해당 파일만 제외된다.
void parallel_for_each(const std::vector<std::filesystem::path>&             files,
                       std::size_t                                           workers,
                       const std::function<void(const std::filesystem::path&)>& fn);
