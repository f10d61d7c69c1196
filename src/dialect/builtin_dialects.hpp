#pragma once

// ---------------------------------------------------------------------------
// builtin_dialects.hpp
//
// 기본 제공 방언 정의 (spark, databricks, duckdb, postgres, redshift,
// snowflake, bigquery, trino, presto, mysql).
//
// [카탈로그 작성 규칙]
// - 모든 방언이 같은 이름/같은 동작으로 제공하는 함수는 공통 목록으로 등록한다.
// - 방언마다 이름이나 인자 순서가 다른 함수는 PascalCase impl_id 로 묶는다.
// - 방언에 구현이 없는 함수는 렌더 템플릿을 두지 않는다 (렌더 실패 = 이식 불가).
// ---------------------------------------------------------------------------

#include <vector>

#include "dialect/dialect_profile.hpp"

// builtin_dialect_definitions
//   정규 방언 이름으로 정렬되지 않은 정의 목록을 반환한다.
[[nodiscard]] std::vector<DialectDefinition> builtin_dialect_definitions();
