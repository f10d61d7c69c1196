// ---------------------------------------------------------------------------
// sql_lexer.cpp
//
// SQL 토크나이저 구현.
//
// [주석 처리]
// - /* ... */ 블록 주석 (중첩 미지원), -- 인라인 주석은 건너뛴다.
// - 닫히지 않은 블록 주석은 입력 끝까지 주석으로 간주한다.
// ---------------------------------------------------------------------------

#include "parser/sql_lexer.hpp"

#include <array>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace {

constexpr std::array<std::string_view, 11> kMultiCharOperators = {
    "<=>", "::", "<>", "!=", ">=", "<=", "||", "->", "=>", "==", "**",
};

constexpr std::string_view kSingleCharOperators = "+-*/%(),.;=<>[]~&|^!:{}";

bool is_ident_start(char c) {
    return (std::isalpha(static_cast<unsigned char>(c)) != 0) || c == '_'
        || static_cast<unsigned char>(c) >= 0x80;
}

bool is_ident_char(char c) {
    return is_ident_start(c) || (std::isdigit(static_cast<unsigned char>(c)) != 0) || c == '$';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

ParseError make_error(std::string message, std::string_view sql, std::size_t pos) {
    return ParseError{
        .code    = ParseErrorCode::kInvalidSql,
        .message = std::move(message),
        .context = fmt::format("offset {}: '{}'", pos, sql.substr(pos, 24)),
    };
}

// 따옴표로 둘러싸인 구간을 읽는다. 같은 따옴표 두 번은 따옴표 하나로 해석.
// 반환: 닫는 따옴표 다음 위치, 닫히지 않으면 npos.
std::size_t scan_quoted(std::string_view sql,
                        std::size_t      pos,
                        bool             backslash_escapes,
                        std::string&     out) {
    const char quote = sql[pos];
    std::size_t i    = pos + 1;
    while (i < sql.size()) {
        const char c = sql[i];
        if (backslash_escapes && c == '\\' && i + 1 < sql.size()) {
            out.push_back(sql[i + 1]);
            i += 2;
            continue;
        }
        if (c == quote) {
            if (i + 1 < sql.size() && sql[i + 1] == quote) {
                out.push_back(quote);
                i += 2;
                continue;
            }
            return i + 1;
        }
        out.push_back(c);
        ++i;
    }
    return std::string_view::npos;
}

} // namespace

// ---------------------------------------------------------------------------
// SqlLexer::tokenize
// ---------------------------------------------------------------------------
std::expected<std::vector<SqlToken>, ParseError>
SqlLexer::tokenize(std::string_view sql) const {
    std::vector<SqlToken> tokens;
    std::size_t           i   = 0;
    const std::size_t     len = sql.size();

    while (i < len) {
        const char c = sql[i];

        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++i;
            continue;
        }

        // 블록 주석 /* ... */
        if (c == '/' && i + 1 < len && sql[i + 1] == '*') {
            const std::size_t close = sql.find("*/", i + 2);
            i = (close == std::string_view::npos) ? len : close + 2;
            continue;
        }

        // 인라인 주석 -- (줄 끝까지)
        if (c == '-' && i + 1 < len && sql[i + 1] == '-') {
            while (i < len && sql[i] != '\n') {
                ++i;
            }
            continue;
        }

        const std::size_t start = i;

        if (is_ident_start(c)) {
            while (i < len && is_ident_char(sql[i])) {
                ++i;
            }
            tokens.push_back(SqlToken{
                .type   = SqlTokenType::kIdentifier,
                .value  = std::string(sql.substr(start, i - start)),
                .offset = start,
            });
            continue;
        }

        if (is_digit(c) || (c == '.' && i + 1 < len && is_digit(sql[i + 1]))) {
            while (i < len && is_digit(sql[i])) {
                ++i;
            }
            if (i < len && sql[i] == '.') {
                ++i;
                while (i < len && is_digit(sql[i])) {
                    ++i;
                }
            }
            if (i < len && (sql[i] == 'e' || sql[i] == 'E')) {
                std::size_t j = i + 1;
                if (j < len && (sql[j] == '+' || sql[j] == '-')) {
                    ++j;
                }
                if (j < len && is_digit(sql[j])) {
                    i = j;
                    while (i < len && is_digit(sql[i])) {
                        ++i;
                    }
                }
            }
            tokens.push_back(SqlToken{
                .type   = SqlTokenType::kNumber,
                .value  = std::string(sql.substr(start, i - start)),
                .offset = start,
            });
            continue;
        }

        const bool is_string_quote =
            c == '\'' || (c == '"' && options_.double_quote_is_string);
        const bool is_ident_quote =
            !is_string_quote && (c == options_.identifier_quote || c == '"' || c == '`');

        if (is_string_quote || is_ident_quote) {
            std::string value;
            const std::size_t end = scan_quoted(
                sql, i, is_string_quote && options_.backslash_escapes, value);
            if (end == std::string_view::npos) {
                return std::unexpected(make_error(
                    is_string_quote ? "unterminated string literal" : "unterminated identifier",
                    sql, start));
            }
            tokens.push_back(SqlToken{
                .type   = is_string_quote ? SqlTokenType::kString
                                          : SqlTokenType::kQuotedIdentifier,
                .value  = std::move(value),
                .offset = start,
            });
            i = end;
            continue;
        }

        bool matched = false;
        for (const auto op : kMultiCharOperators) {
            if (sql.substr(i, op.size()) == op) {
                tokens.push_back(SqlToken{
                    .type   = SqlTokenType::kOperator,
                    .value  = std::string(op),
                    .offset = start,
                });
                i += op.size();
                matched = true;
                break;
            }
        }
        if (matched) {
            continue;
        }

        if (kSingleCharOperators.find(c) != std::string_view::npos) {
            tokens.push_back(SqlToken{
                .type   = SqlTokenType::kOperator,
                .value  = std::string(1, c),
                .offset = start,
            });
            ++i;
            continue;
        }

        return std::unexpected(
            make_error(fmt::format("unexpected character '{}'", c), sql, start));
    }

    tokens.push_back(SqlToken{.type = SqlTokenType::kEnd, .value = {}, .offset = len});
    return tokens;
}
