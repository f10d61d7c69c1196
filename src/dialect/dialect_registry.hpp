#pragma once

// ---------------------------------------------------------------------------
// dialect_registry.hpp
//
// 정규 방언 이름 → DialectProfile 정적 테이블.
//
// [수명]
// - 테이블은 최초 조회 시 한 번 생성되고 프로세스 종료까지 유지된다.
//   find() 가 반환한 포인터는 항상 유효하다.
// - 생성 이후 읽기 전용이므로 여러 스레드에서 동시 조회해도 안전하다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>
#include <vector>

#include "dialect/dialect_profile.hpp"

class DialectRegistry {
public:
    DialectRegistry() = delete;

    // normalize
    //   대소문자 무시 별칭 테이블로 정규 이름을 돌려준다.
    //   알 수 없는 이름은 소문자로만 바꿔 그대로 반환한다.
    [[nodiscard]] static std::string normalize(std::string_view dialect_id);

    // find
    //   별칭 정규화 후 프로필을 찾는다. 등록되지 않은 방언이면 nullptr.
    [[nodiscard]] static const DialectProfile* find(std::string_view dialect_id);

    // names
    //   등록된 정규 방언 이름 (정렬됨).
    [[nodiscard]] static std::vector<std::string> names();
};
