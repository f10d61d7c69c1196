// ---------------------------------------------------------------------------
// template_lexer.cpp
//
// Jinja 스타일 템플릿 무손실 토크나이저 구현.
//
// [구현 메모]
// - 표현식 내부는 괄호 스택을 유지한다. 스택이 비어 있을 때만 닫는
//   구분자(}}, %})를 인식하므로 {{ {'a': 1} }} 같은 dict 리터럴도 안전하다.
// - 괄호 불일치, 닫히지 않은 문자열/주석/표현식은 모두 kTemplateSyntax 오류.
//   호출자(TemplateClassifier)는 오류 시 파일 전체를 Unsafe 로 처리한다.
// ---------------------------------------------------------------------------

#include "template/template_lexer.hpp"

#include <array>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace {

// 2글자 연산자 (1글자보다 먼저 검사)
constexpr std::array<std::string_view, 6> kTwoCharOperators = {
    "//", "**", "==", "!=", ">=", "<=",
};

constexpr std::string_view kSingleCharOperators = "+-/*%~|,.:=<>!;()[]{}";

bool is_name_start(char c) {
    return (std::isalpha(static_cast<unsigned char>(c)) != 0) || c == '_';
}

bool is_name_char(char c) {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

ParseError make_error(std::string message, std::string_view source, std::size_t pos) {
    return ParseError{
        .code    = ParseErrorCode::kTemplateSyntax,
        .message = std::move(message),
        .context = fmt::format("offset {}: '{}'", pos, source.substr(pos, 24)),
    };
}

void push_token(std::vector<TemplateToken>& tokens,
                TemplateTokenType           type,
                std::string_view            source,
                std::size_t                 begin,
                std::size_t                 end) {
    tokens.push_back(TemplateToken{
        .type   = type,
        .value  = std::string(source.substr(begin, end - begin)),
        .offset = begin,
    });
}

// pos 이후 첫 번째 템플릿 여는 구분자({{, {%, {#) 위치. 없으면 npos.
std::size_t find_opener(std::string_view source, std::size_t pos) {
    for (std::size_t i = pos; i + 1 < source.size(); ++i) {
        if (source[i] != '{') {
            continue;
        }
        const char next = source[i + 1];
        if (next == '{' || next == '%' || next == '#') {
            return i;
        }
    }
    return std::string_view::npos;
}

// pos 에서 닫는 구분자(선택적 -/+ 후 mark + '}')가 시작하면 그 길이, 아니면 0.
std::size_t match_closer(std::string_view source, std::size_t pos, char mark) {
    std::size_t i = pos;
    if (i < source.size() && (source[i] == '-' || source[i] == '+')) {
        ++i;
    }
    if (i + 1 < source.size() && source[i] == mark && source[i + 1] == '}') {
        return i + 2 - pos;
    }
    return 0;
}

// pos 에서 {% endraw %} 블록이 시작하는지 확인한다.
bool is_endraw_block(std::string_view source, std::size_t pos) {
    if (source.substr(pos, 2) != "{%") {
        return false;
    }
    std::size_t i = pos + 2;
    if (i < source.size() && (source[i] == '-' || source[i] == '+')) {
        ++i;
    }
    while (i < source.size() && is_space(source[i])) {
        ++i;
    }
    if (source.substr(i, 6) != "endraw") {
        return false;
    }
    i += 6;
    while (i < source.size() && is_space(source[i])) {
        ++i;
    }
    return match_closer(source, i, '%') > 0;
}

// 문자열 리터럴 끝(닫는 따옴표 다음) 위치. 닫히지 않으면 npos.
std::size_t scan_string(std::string_view source, std::size_t pos) {
    const char quote = source[pos];
    std::size_t i    = pos + 1;
    while (i < source.size()) {
        if (source[i] == '\\') {
            i += 2;
            continue;
        }
        if (source[i] == quote) {
            return i + 1;
        }
        ++i;
    }
    return std::string_view::npos;
}

std::size_t scan_number(std::string_view source, std::size_t pos) {
    std::size_t i = pos;
    while (i < source.size() && (is_digit(source[i]) || source[i] == '_')) {
        ++i;
    }
    if (i + 1 < source.size() && source[i] == '.' && is_digit(source[i + 1])) {
        ++i;
        while (i < source.size() && (is_digit(source[i]) || source[i] == '_')) {
            ++i;
        }
    }
    if (i < source.size() && (source[i] == 'e' || source[i] == 'E')) {
        std::size_t j = i + 1;
        if (j < source.size() && (source[j] == '+' || source[j] == '-')) {
            ++j;
        }
        if (j < source.size() && is_digit(source[j])) {
            i = j;
            while (i < source.size() && is_digit(source[i])) {
                ++i;
            }
        }
    }
    return i;
}

char matching_open(char close) {
    switch (close) {
        case ')': return '(';
        case ']': return '[';
        default:  return '{';
    }
}

// ---------------------------------------------------------------------------
// 표현식/블록 본문 토큰화.
//   pos     : 여는 구분자 바로 다음 위치
//   mark    : '}' (변수) 또는 '%' (블록)
//   반환    : 닫는 구분자 다음 위치
// ---------------------------------------------------------------------------
std::expected<std::size_t, ParseError> lex_expression(std::string_view            source,
                                                      std::size_t                 pos,
                                                      char                        mark,
                                                      TemplateTokenType           end_type,
                                                      std::vector<TemplateToken>& tokens) {
    std::vector<char> brackets;
    std::size_t       i = pos;

    while (i < source.size()) {
        const char c = source[i];

        if (brackets.empty()) {
            const std::size_t closer = match_closer(source, i, mark);
            if (closer > 0) {
                push_token(tokens, end_type, source, i, i + closer);
                return i + closer;
            }
        }

        if (is_space(c)) {
            std::size_t j = i;
            while (j < source.size() && is_space(source[j])) {
                ++j;
            }
            push_token(tokens, TemplateTokenType::kWhitespace, source, i, j);
            i = j;
            continue;
        }

        if (is_name_start(c)) {
            std::size_t j = i;
            while (j < source.size() && is_name_char(source[j])) {
                ++j;
            }
            push_token(tokens, TemplateTokenType::kName, source, i, j);
            i = j;
            continue;
        }

        if (is_digit(c)) {
            const std::size_t j = scan_number(source, i);
            push_token(tokens, TemplateTokenType::kNumber, source, i, j);
            i = j;
            continue;
        }

        if (c == '\'' || c == '"') {
            const std::size_t j = scan_string(source, i);
            if (j == std::string_view::npos) {
                return std::unexpected(make_error("unterminated string literal", source, i));
            }
            push_token(tokens, TemplateTokenType::kString, source, i, j);
            i = j;
            continue;
        }

        bool two_char = false;
        for (const auto op : kTwoCharOperators) {
            if (source.substr(i, 2) == op) {
                push_token(tokens, TemplateTokenType::kOperator, source, i, i + 2);
                i += 2;
                two_char = true;
                break;
            }
        }
        if (two_char) {
            continue;
        }

        if (kSingleCharOperators.find(c) == std::string_view::npos) {
            return std::unexpected(
                make_error(fmt::format("unexpected character '{}'", c), source, i));
        }

        if (c == '(' || c == '[' || c == '{') {
            brackets.push_back(c);
        } else if (c == ')' || c == ']' || c == '}') {
            if (brackets.empty() || brackets.back() != matching_open(c)) {
                return std::unexpected(
                    make_error(fmt::format("unexpected '{}'", c), source, i));
            }
            brackets.pop_back();
        }
        push_token(tokens, TemplateTokenType::kOperator, source, i, i + 1);
        ++i;
    }

    if (!brackets.empty()) {
        return std::unexpected(make_error(
            fmt::format("unexpected end of template, expected closing for '{}'", brackets.back()),
            source, pos));
    }
    return std::unexpected(make_error("unexpected end of template", source, pos));
}

// 블록 본문의 이름 토큰이 정확히 "raw" 하나인지 확인한다.
bool is_raw_block(const std::vector<TemplateToken>& tokens, std::size_t first) {
    bool seen_raw = false;
    for (std::size_t k = first; k < tokens.size(); ++k) {
        const auto& tok = tokens[k];
        if (tok.type == TemplateTokenType::kName) {
            if (seen_raw || tok.value != "raw") {
                return false;
            }
            seen_raw = true;
        } else if (tok.type != TemplateTokenType::kWhitespace &&
                   tok.type != TemplateTokenType::kBlockEnd) {
            return false;
        }
    }
    return seen_raw;
}

} // namespace

// ---------------------------------------------------------------------------
// TemplateLexer::tokenize
// ---------------------------------------------------------------------------
std::expected<std::vector<TemplateToken>, ParseError>
TemplateLexer::tokenize(std::string_view source) const {
    std::vector<TemplateToken> tokens;
    std::size_t                pos = 0;

    while (pos < source.size()) {
        const std::size_t opener = find_opener(source, pos);
        if (opener == std::string_view::npos) {
            push_token(tokens, TemplateTokenType::kData, source, pos, source.size());
            break;
        }
        if (opener > pos) {
            push_token(tokens, TemplateTokenType::kData, source, pos, opener);
        }

        const char kind = source[opener + 1];

        // ── 주석 {# ... #} ──────────────────────────────────────────────
        if (kind == '#') {
            const std::size_t close = source.find("#}", opener + 2);
            if (close == std::string_view::npos) {
                return std::unexpected(make_error("unterminated comment", source, opener));
            }
            push_token(tokens, TemplateTokenType::kCommentBegin, source, opener, opener + 2);
            if (close > opener + 2) {
                push_token(tokens, TemplateTokenType::kComment, source, opener + 2, close);
            }
            push_token(tokens, TemplateTokenType::kCommentEnd, source, close, close + 2);
            pos = close + 2;
            continue;
        }

        // ── 표현식 {{ ... }} / 블록 {% ... %} ───────────────────────────
        std::size_t body = opener + 2;
        if (body < source.size() && (source[body] == '-' || source[body] == '+')) {
            ++body;
        }
        const bool is_block = (kind == '%');
        push_token(tokens,
                   is_block ? TemplateTokenType::kBlockBegin : TemplateTokenType::kVariableBegin,
                   source, opener, body);

        const std::size_t first_body_token = tokens.size();
        auto next = lex_expression(source, body, is_block ? '%' : '}',
                                   is_block ? TemplateTokenType::kBlockEnd
                                            : TemplateTokenType::kVariableEnd,
                                   tokens);
        if (!next) {
            return std::unexpected(next.error());
        }
        pos = *next;

        // ── {% raw %} 본문은 endraw 까지 data ──────────────────────────
        if (is_block && is_raw_block(tokens, first_body_token)) {
            std::size_t end_raw = pos;
            while (end_raw < source.size() && !is_endraw_block(source, end_raw)) {
                end_raw = source.find("{%", end_raw + 1);
                if (end_raw == std::string_view::npos) {
                    return std::unexpected(make_error("missing endraw", source, opener));
                }
            }
            if (end_raw >= source.size()) {
                return std::unexpected(make_error("missing endraw", source, opener));
            }
            if (end_raw > pos) {
                push_token(tokens, TemplateTokenType::kData, source, pos, end_raw);
            }
            pos = end_raw;
        }
    }

    return tokens;
}
