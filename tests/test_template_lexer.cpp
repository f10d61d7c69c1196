// ---------------------------------------------------------------------------
// test_template_lexer.cpp
//
// TemplateLexer 단위 테스트.
//
// [테스트 범위]
// - 무손실 토큰화 (토큰 value 연결 == 원문)
// - {{ }}, {% %}, {# #} 구분자와 공백 제어 마커
// - 표현식 내부 dict 리터럴 / 중첩 괄호
// - {% raw %} 본문의 data 처리
// - 구문 오류: 닫히지 않은 표현식/문자열/주석, 괄호 불일치
// ---------------------------------------------------------------------------

#include "template/template_lexer.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// 헬퍼: 토큰 value 를 이어 붙인다
// ---------------------------------------------------------------------------
static std::string join_tokens(const std::vector<TemplateToken>& tokens) {
    std::string out;
    for (const auto& tok : tokens) {
        out += tok.value;
    }
    return out;
}

static std::size_t count_type(const std::vector<TemplateToken>& tokens, TemplateTokenType type) {
    std::size_t n = 0;
    for (const auto& tok : tokens) {
        if (tok.type == type) {
            ++n;
        }
    }
    return n;
}

// ---------------------------------------------------------------------------
// 무손실 토큰화
// ---------------------------------------------------------------------------

TEST(TemplateLexer, PlainSqlIsSingleDataToken) {
    TemplateLexer lexer;
    const auto    result = lexer.tokenize("SELECT id FROM users");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_EQ((*result)[0].type, TemplateTokenType::kData);
    EXPECT_EQ((*result)[0].offset, 0u);
}

TEST(TemplateLexer, EmptyInputHasNoTokens) {
    TemplateLexer lexer;
    const auto    result = lexer.tokenize("");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(TemplateLexer, ConcatenationReproducesSource) {
    const std::string source =
        "{{ config(materialized='table') }}\n"
        "SELECT {%- if var(\"x\", 1) >= 2 -%} a {% else %} b {% endif %}\n"
        "FROM {{ ref('orders') }} {# trailing comment #}";

    TemplateLexer lexer;
    const auto    result = lexer.tokenize(source);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(join_tokens(*result), source);
}

TEST(TemplateLexer, OffsetsPointIntoSource) {
    const std::string source = "SELECT {{ ref('a') }} x";
    TemplateLexer     lexer;
    const auto        result = lexer.tokenize(source);
    ASSERT_TRUE(result.has_value());
    for (const auto& tok : *result) {
        EXPECT_EQ(source.substr(tok.offset, tok.value.size()), tok.value);
    }
}

// ---------------------------------------------------------------------------
// 구분자
// ---------------------------------------------------------------------------

TEST(TemplateLexer, VariableDelimiters) {
    TemplateLexer lexer;
    const auto    result = lexer.tokenize("{{ ref('x') }}");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->front().type, TemplateTokenType::kVariableBegin);
    EXPECT_EQ(result->back().type, TemplateTokenType::kVariableEnd);
    EXPECT_EQ(count_type(*result, TemplateTokenType::kName), 1u);
    EXPECT_EQ(count_type(*result, TemplateTokenType::kString), 1u);
}

TEST(TemplateLexer, WhitespaceControlMarkersKeptInDelimiter) {
    TemplateLexer lexer;
    const auto    result = lexer.tokenize("{%- if x -%}");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->front().value, "{%-");
    EXPECT_EQ(result->back().value, "-%}");
}

TEST(TemplateLexer, CommentBodyIsSingleToken) {
    TemplateLexer lexer;
    const auto    result = lexer.tokenize("{# {{ not an expression }} #}");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 3u);
    EXPECT_EQ((*result)[0].type, TemplateTokenType::kCommentBegin);
    EXPECT_EQ((*result)[1].type, TemplateTokenType::kComment);
    EXPECT_EQ((*result)[2].type, TemplateTokenType::kCommentEnd);
}

TEST(TemplateLexer, DictLiteralDoesNotCloseExpression) {
    TemplateLexer     lexer;
    const std::string source = "{{ config(meta={'owner': 'x'}) }} SELECT 1";
    const auto        result = lexer.tokenize(source);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(count_type(*result, TemplateTokenType::kVariableEnd), 1u);
    EXPECT_EQ(result->back().type, TemplateTokenType::kData);
    EXPECT_EQ(result->back().value, " SELECT 1");
}

TEST(TemplateLexer, StringMayContainCloser) {
    TemplateLexer lexer;
    const auto    result = lexer.tokenize("{{ var('a }} b') }}");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(count_type(*result, TemplateTokenType::kVariableEnd), 1u);
}

TEST(TemplateLexer, RawBlockBodyIsData) {
    const std::string source = "{% raw %}{{ not_parsed }}{% endraw %}";
    TemplateLexer     lexer;
    const auto        result = lexer.tokenize(source);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(join_tokens(*result), source);

    bool found = false;
    for (const auto& tok : *result) {
        if (tok.type == TemplateTokenType::kData && tok.value == "{{ not_parsed }}") {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

// ---------------------------------------------------------------------------
// 구문 오류
// ---------------------------------------------------------------------------

TEST(TemplateLexer, UnterminatedExpression) {
    TemplateLexer lexer;
    const auto    result = lexer.tokenize("SELECT {{ ref('x') ");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kTemplateSyntax);
}

TEST(TemplateLexer, UnbalancedParenthesis) {
    TemplateLexer lexer;
    const auto    result = lexer.tokenize("{{ ref('x' }}");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kTemplateSyntax);
}

TEST(TemplateLexer, UnterminatedString) {
    TemplateLexer lexer;
    const auto    result = lexer.tokenize("{{ var('x) }}");
    EXPECT_FALSE(result.has_value());
}

TEST(TemplateLexer, UnterminatedComment) {
    TemplateLexer lexer;
    const auto    result = lexer.tokenize("SELECT 1 {# open");
    EXPECT_FALSE(result.has_value());
}

TEST(TemplateLexer, MissingEndraw) {
    TemplateLexer lexer;
    const auto    result = lexer.tokenize("{% raw %} SELECT 1");
    EXPECT_FALSE(result.has_value());
}

TEST(TemplateLexer, LoneBraceIsData) {
    TemplateLexer lexer;
    const auto    result = lexer.tokenize("SELECT '{' AS brace");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_EQ((*result)[0].type, TemplateTokenType::kData);
}
