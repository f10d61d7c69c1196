#pragma once

// ---------------------------------------------------------------------------
// sql_lexer.hpp
//
// 방언별 문법 옵션(GrammarOptions)을 따르는 SQL 토크나이저.
// 주석(--, /* */)과 공백은 토큰으로 내보내지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// GrammarOptions
//   방언별 어휘/구문 차이. DialectProfile 이 소유하고 파서에 전달한다.
// ---------------------------------------------------------------------------
struct GrammarOptions {
    char identifier_quote{'"'};       // 인용 식별자 문자 (" 또는 `)
    bool double_quote_is_string{false}; // "..." 를 문자열 리터럴로 취급 (spark, bigquery, mysql)
    bool backslash_escapes{false};    // 문자열 내 \' 이스케이프 허용
    bool double_colon_cast{false};    // expr::TYPE 캐스트 허용
};

// ---------------------------------------------------------------------------
// SqlTokenType
// ---------------------------------------------------------------------------
enum class SqlTokenType : std::uint8_t {
    kIdentifier       = 0,  // 비인용 식별자 / 키워드
    kQuotedIdentifier = 1,  // 인용 식별자 (value 는 따옴표 제거)
    kString           = 2,  // 문자열 리터럴 (value 는 이스케이프 해제)
    kNumber           = 3,
    kOperator         = 4,
    kEnd              = 5,
};

// ---------------------------------------------------------------------------
// SqlToken
// ---------------------------------------------------------------------------
struct SqlToken {
    SqlTokenType type{SqlTokenType::kEnd};
    std::string  value{};
    std::size_t  offset{0};  // 마스킹 텍스트 내 시작 위치 (오류 메시지용)
};

// ---------------------------------------------------------------------------
// SqlLexer
// ---------------------------------------------------------------------------
class SqlLexer {
public:
    explicit SqlLexer(GrammarOptions options) : options_(options) {}
    ~SqlLexer() = default;

    SqlLexer(const SqlLexer&)            = default;
    SqlLexer& operator=(const SqlLexer&) = default;
    SqlLexer(SqlLexer&&)                 = default;
    SqlLexer& operator=(SqlLexer&&)      = default;

    // tokenize
    //   반환 목록은 항상 kEnd 토큰으로 끝난다.
    [[nodiscard]] std::expected<std::vector<SqlToken>, ParseError>
    tokenize(std::string_view sql) const;

private:
    GrammarOptions options_;
};
