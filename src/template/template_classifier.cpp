// ---------------------------------------------------------------------------
// template_classifier.cpp
//
// Region 분류 / 안전성 판정 / 마스킹 구현.
//
// [분류 규칙]
// - {{ ... }} 의 첫 이름 토큰이 안전 호출 허용 목록에 있으면 kSafeExpression.
// - {% ... %} 의 첫 이름 토큰이 제어 흐름 키워드면 kControlFlow.
// - {# ... #} 주석은 렌더링 결과가 없으므로 kControlFlow 로 마스킹한다.
// - 나머지는 모두 kUnsafe (fail-close).
// ---------------------------------------------------------------------------

#include "template/template_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

constexpr std::array<std::string_view, 7> kSafeCalls = {
    "ref", "source", "var", "config", "this", "target", "env_var",
};

constexpr std::array<std::string_view, 12> kControlFlowKeywords = {
    "if",    "elif",     "else",  "endif",    "for", "endfor",
    "block", "endblock", "macro", "endmacro", "set", "endset",
};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& set, std::string_view name) {
    return std::find(set.begin(), set.end(), name) != set.end();
}

bool is_unit_begin(TemplateTokenType type) {
    return type == TemplateTokenType::kVariableBegin
        || type == TemplateTokenType::kBlockBegin
        || type == TemplateTokenType::kCommentBegin;
}

TemplateTokenType unit_end_for(TemplateTokenType begin) {
    switch (begin) {
        case TemplateTokenType::kVariableBegin: return TemplateTokenType::kVariableEnd;
        case TemplateTokenType::kBlockBegin:    return TemplateTokenType::kBlockEnd;
        default:                                return TemplateTokenType::kCommentEnd;
    }
}

RegionKind classify_unit(TemplateTokenType begin, std::string_view first_name) {
    switch (begin) {
        case TemplateTokenType::kVariableBegin:
            return contains(kSafeCalls, first_name) ? RegionKind::kSafeExpression
                                                    : RegionKind::kUnsafe;
        case TemplateTokenType::kBlockBegin:
            return contains(kControlFlowKeywords, first_name) ? RegionKind::kControlFlow
                                                              : RegionKind::kUnsafe;
        case TemplateTokenType::kCommentBegin:
            return RegionKind::kControlFlow;
        default:
            return RegionKind::kUnsafe;
    }
}

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

// ---------------------------------------------------------------------------
// classify
// ---------------------------------------------------------------------------
std::vector<TemplateRegion> TemplateClassifier::classify(std::string_view source) const {
    std::vector<TemplateRegion> regions;

    auto tokens = lexer_.tokenize(source);
    if (!tokens) {
        spdlog::debug("template_classifier: tokenize failed ({}), whole text is unsafe",
                      tokens.error().message);
        if (!source.empty()) {
            regions.push_back(TemplateRegion{
                .start   = 0,
                .end     = source.size(),
                .kind    = RegionKind::kUnsafe,
                .content = std::string(source),
            });
        }
        return regions;
    }

    std::size_t offset = 0;
    const auto& toks   = *tokens;

    for (std::size_t i = 0; i < toks.size(); ++i) {
        const auto& tok = toks[i];

        if (tok.type == TemplateTokenType::kData) {
            regions.push_back(TemplateRegion{
                .start   = offset,
                .end     = offset + tok.value.size(),
                .kind    = RegionKind::kStatic,
                .content = tok.value,
            });
            offset += tok.value.size();
            continue;
        }

        if (!is_unit_begin(tok.type)) {
            // 단위 밖 구조 토큰: 위치만 전진
            offset += tok.value.size();
            continue;
        }

        // ── 여는 구분자부터 짝이 맞는 닫는 구분자까지 하나의 단위 ───────
        const TemplateTokenType end_type = unit_end_for(tok.type);
        std::string             content  = tok.value;
        std::string_view        first_name;

        std::size_t j = i + 1;
        for (; j < toks.size(); ++j) {
            content += toks[j].value;
            if (first_name.empty() && toks[j].type == TemplateTokenType::kName) {
                first_name = toks[j].value;
            }
            if (toks[j].type == end_type) {
                break;
            }
        }

        const std::size_t start = offset;
        offset += content.size();
        regions.push_back(TemplateRegion{
            .start   = start,
            .end     = offset,
            .kind    = classify_unit(tok.type, first_name),
            .content = std::move(content),
        });
        i = j;
    }

    return regions;
}

// ---------------------------------------------------------------------------
// can_safely_rewrite
// ---------------------------------------------------------------------------
SafetyVerdict TemplateClassifier::can_safely_rewrite(
    const std::vector<TemplateRegion>& regions) const {
    const auto unsafe = std::find_if(regions.begin(), regions.end(), [](const TemplateRegion& r) {
        return r.kind == RegionKind::kUnsafe;
    });
    if (unsafe != regions.end()) {
        return SafetyVerdict{
            .can_rewrite = false,
            .reason      = "Template contains complex Jinja expressions",
        };
    }
    return SafetyVerdict{
        .can_rewrite = true,
        .reason      = "Template is safe to rewrite",
    };
}

// ---------------------------------------------------------------------------
// extract_masked_spans
// ---------------------------------------------------------------------------
std::vector<MaskedSpan> TemplateClassifier::extract_masked_spans(
    const std::vector<TemplateRegion>& regions) const {
    std::string masked;
    std::size_t total = 0;

    for (const auto& region : regions) {
        switch (region.kind) {
            case RegionKind::kStatic:
                masked += region.content;
                break;
            case RegionKind::kSafeExpression:
                masked += kSafePlaceholder;
                break;
            case RegionKind::kControlFlow:
            case RegionKind::kUnsafe:
                masked += kJinjaPlaceholder;
                break;
        }
        total = region.end;
    }

    if (is_blank(masked)) {
        return {};
    }

    std::vector<MaskedSpan> spans;
    spans.push_back(MaskedSpan{
        .start       = 0,
        .end         = total,
        .masked_text = std::move(masked),
    });
    return spans;
}
