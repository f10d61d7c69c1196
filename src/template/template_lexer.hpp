#pragma once

// ---------------------------------------------------------------------------
// template_lexer.hpp
//
// dbt 모델 파일에 쓰이는 Jinja 스타일 템플릿 문법의 무손실 토크나이저.
//
// [무손실 원칙]
// - 모든 토큰은 원문 바이트를 그대로 value 에 보존한다.
//   (문자열 이스케이프 해제, 공백 제거를 하지 않는다)
// - 토큰 value 를 순서대로 이어 붙이면 입력 텍스트와 정확히 일치한다.
//   TemplateClassifier 의 region tiling 불변식은 이 성질에 의존한다.
//
// [지원 범위]
// - {{ ... }}  표현식, {% ... %} 블록, {# ... #} 주석
// - 공백 제어 마커 {{- -}} {%- -%} {%+ +%}
// - {% raw %} ... {% endraw %} 내부는 data 로 취급
//
// [알려진 한계]
// - line statement(# 접두), 사용자 정의 delimiter 는 지원하지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"  // ParseError, ParseErrorCode

// ---------------------------------------------------------------------------
// TemplateTokenType
//   템플릿 토큰 종류.
// ---------------------------------------------------------------------------
enum class TemplateTokenType : std::uint8_t {
    kData          = 0,   // 템플릿 외부의 원문 텍스트 (SQL)
    kVariableBegin = 1,   // {{ / {{- / {{+
    kVariableEnd   = 2,   // }} / -}} / +}}
    kBlockBegin    = 3,   // {% / {%- / {%+
    kBlockEnd      = 4,   // %} / -%} / +%}
    kCommentBegin  = 5,   // {#
    kComment       = 6,   // 주석 본문
    kCommentEnd    = 7,   // #}
    kName          = 8,   // 식별자 / 키워드
    kString        = 9,   // 따옴표 포함 문자열 리터럴 (이스케이프 원문 유지)
    kNumber        = 10,  // 정수 / 실수 리터럴
    kOperator      = 11,  // 연산자 / 괄호 / 구분자
    kWhitespace    = 12,  // 표현식 내부 공백
};

// ---------------------------------------------------------------------------
// TemplateToken
//   offset 은 원문 텍스트 기준 바이트 오프셋.
// ---------------------------------------------------------------------------
struct TemplateToken {
    TemplateTokenType type{TemplateTokenType::kData};
    std::string       value{};    // 원문 바이트 그대로
    std::size_t       offset{0};  // 원문 내 시작 위치
};

// ---------------------------------------------------------------------------
// TemplateLexer
//   템플릿 텍스트를 토큰 스트림으로 변환한다.
//   구문 오류(닫히지 않은 표현식, 괄호 불일치 등) 시 ParseError 를 반환한다.
//   부분 결과는 반환하지 않는다.
// ---------------------------------------------------------------------------
class TemplateLexer {
public:
    TemplateLexer()  = default;
    ~TemplateLexer() = default;

    // 복사/이동 허용 (stateless)
    TemplateLexer(const TemplateLexer&)            = default;
    TemplateLexer& operator=(const TemplateLexer&) = default;
    TemplateLexer(TemplateLexer&&)                 = default;
    TemplateLexer& operator=(TemplateLexer&&)      = default;

    // tokenize
    //   source: 템플릿 원문
    //   반환: 토큰 목록 또는 ParseError(kTemplateSyntax)
    [[nodiscard]] std::expected<std::vector<TemplateToken>, ParseError>
    tokenize(std::string_view source) const;
};
