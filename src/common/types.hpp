#pragma once

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// ParseErrorCode
//   템플릿 토큰화 / SQL 파싱 / 방언 렌더링 단계에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class ParseErrorCode : std::uint8_t {
    kTemplateSyntax     = 0,  // Jinja 템플릿 구문 오류 (닫히지 않은 {{ 등)
    kInvalidSql         = 1,  // SQL 문법 오류
    kUnexpectedToken    = 2,  // 파서가 기대하지 않은 토큰
    kUnsupportedDialect = 3,  // 레지스트리에 없는 방언
    kRenderError        = 4,  // 방언 렌더링 실패 (템플릿 없음, 인자 수 불일치)
    kInternalError      = 5,  // 내부 오류
};

// ---------------------------------------------------------------------------
// ParseError
//   실패 시 반환되는 오류 정보.
//   std::expected<T, ParseError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct ParseError {
    ParseErrorCode code{ParseErrorCode::kInternalError};
    std::string    message{};  // 사람이 읽을 수 있는 오류 설명
    std::string    context{};  // 오류가 발생한 위치/입력 단편 (로깅용)
};
