// ---------------------------------------------------------------------------
// span_splicer.cpp
// ---------------------------------------------------------------------------

#include "rewrite/span_splicer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <regex>

#include <fmt/format.h>

namespace {

bool is_ident_char(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '_';
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::size_t count_occurrences(std::string_view text, std::string_view token) {
    std::size_t count = 0;
    for (auto pos = text.find(token); pos != std::string_view::npos;
         pos      = text.find(token, pos + token.size())) {
        ++count;
    }
    return count;
}

// Jinja 문자열 인자로 감싼다. 내부 따옴표 종류에 따라 구분자를 고른다.
std::string quote_argument(std::string_view interior) {
    if (interior.find('\'') == std::string_view::npos) {
        return fmt::format("'{}'", interior);
    }
    if (interior.find('"') == std::string_view::npos) {
        return fmt::format("\"{}\"", interior);
    }
    std::string out = "'";
    for (const char c : interior) {
        if (c == '\'' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// build_macro_call
//   정규 렌더링의 바깥 괄호 내부를 인자로 넘긴다.
//   내부가 이미 문자열 리터럴이면 그대로, 아니면 문자열로 감싼다.
// ---------------------------------------------------------------------------
std::string build_macro_call(std::string_view function_name, std::string_view canonical) {
    static const std::regex kInteriorRe(R"(^[A-Za-z_][A-Za-z0-9_]*\s*\(([\s\S]*)\)$)");

    const std::string macro_name = "portable_" + to_lower(function_name);
    const std::string text(canonical);

    std::smatch match;
    if (!std::regex_match(text, match, kInteriorRe)) {
        return fmt::format("{{{{ {}() }}}}", macro_name);
    }
    const std::string      captured = match[1].str();
    const std::string_view interior = trim(captured);
    if (interior.empty()) {
        return fmt::format("{{{{ {}() }}}}", macro_name);
    }
    if (is_string_literal(interior)) {
        return fmt::format("{{{{ {}({}) }}}}", macro_name, interior);
    }
    return fmt::format("{{{{ {}({}) }}}}", macro_name, quote_argument(interior));
}

bool is_string_literal(std::string_view text) {
    if (text.size() < 2) {
        return false;
    }
    const char quote = text.front();
    if (quote != '\'' && quote != '"') {
        return false;
    }
    for (std::size_t i = 1; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\\') {
            ++i;
            continue;
        }
        if (c != quote) {
            continue;
        }
        if (i + 1 < text.size() && text[i + 1] == quote) {
            ++i;  // '' 이스케이프
            continue;
        }
        return i == text.size() - 1;
    }
    return false;
}

// ---------------------------------------------------------------------------
// inside_open_template
//   괄호 수 세기 방식의 근사 판정. 중첩되거나 깨진 템플릿에서는 틀릴 수 있다.
// ---------------------------------------------------------------------------
bool inside_open_template(std::string_view text, std::size_t pos) {
    const std::string_view before = text.substr(0, std::min(pos, text.size()));
    const std::size_t      opened = count_occurrences(before, "{{") + count_occurrences(before, "{%")
                             + count_occurrences(before, "{#");
    const std::size_t closed = count_occurrences(before, "}}") + count_occurrences(before, "%}")
                             + count_occurrences(before, "#}");
    return opened > closed;
}

// ---------------------------------------------------------------------------
// code_mask
//   문자열 / 인용 식별자 / 주석 / 템플릿 태그를 추적하는 상태 머신.
//   '' 와 \' 이스케이프를 모두 인식한다.
// ---------------------------------------------------------------------------
std::vector<bool> code_mask(std::string_view text) {
    enum class State : std::uint8_t {
        kNormal,
        kQuoted,        // ' " ` 내부
        kBlockComment,  // /* ... */
        kLineComment,   // -- ... \n
        kTemplate,      // {{ }} / {% %} / {# #}
    };

    std::vector<bool> mask(text.size(), false);
    State             state        = State::kNormal;
    char              quote        = '\0';
    char              tag_closer   = '\0';
    const std::size_t len          = text.size();

    for (std::size_t i = 0; i < len; ++i) {
        const char c    = text[i];
        const char next = (i + 1 < len) ? text[i + 1] : '\0';

        switch (state) {
            case State::kNormal:
                if (c == '{' && (next == '{' || next == '%' || next == '#')) {
                    state      = State::kTemplate;
                    tag_closer = next == '{' ? '}' : next;
                    ++i;
                } else if (c == '\'' || c == '"' || c == '`') {
                    state = State::kQuoted;
                    quote = c;
                } else if (c == '/' && next == '*') {
                    state = State::kBlockComment;
                    ++i;
                } else if (c == '-' && next == '-') {
                    state = State::kLineComment;
                    ++i;
                } else {
                    mask[i] = true;
                }
                break;

            case State::kQuoted:
                if (c == '\\' && quote != '`') {
                    ++i;
                } else if (c == quote) {
                    if (next == quote) {
                        ++i;
                    } else {
                        state = State::kNormal;
                    }
                }
                break;

            case State::kBlockComment:
                if (c == '*' && next == '/') {
                    state = State::kNormal;
                    ++i;
                }
                break;

            case State::kLineComment:
                if (c == '\n') {
                    state = State::kNormal;
                }
                break;

            case State::kTemplate:
                if (c == tag_closer && next == '}') {
                    state = State::kNormal;
                    ++i;
                }
                break;
        }
    }
    return mask;
}

// ---------------------------------------------------------------------------
// locate_call
// ---------------------------------------------------------------------------
std::optional<std::size_t> locate_call(std::string_view text, std::string_view needle) {
    if (needle.empty() || needle.size() > text.size()) {
        return std::nullopt;
    }
    const std::vector<bool> mask = code_mask(text);

    const auto accept = [&](std::size_t pos) {
        if (!mask[pos]) {
            return false;
        }
        if (pos > 0 && is_ident_char(text[pos - 1])) {
            return false;
        }
        const std::size_t end = pos + needle.size();
        if (is_ident_char(needle.back()) && end < text.size() && is_ident_char(text[end])) {
            return false;
        }
        return !inside_open_template(text, pos);
    };

    for (auto pos = text.find(needle); pos != std::string_view::npos;
         pos      = text.find(needle, pos + 1)) {
        if (accept(pos)) {
            return pos;
        }
    }

    // 렌더링 대소문자가 원문과 다를 수 있으므로 대소문자 무시로 한 번 더 찾는다.
    const std::string lowered_text   = to_lower(text);
    const std::string lowered_needle = to_lower(needle);
    for (auto pos = lowered_text.find(lowered_needle); pos != std::string::npos;
         pos      = lowered_text.find(lowered_needle, pos + 1)) {
        if (accept(pos)) {
            return pos;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// apply_directives
//   긴 호출부터 치환해야 짧은 이름이 긴 호출 안에서 먼저 매칭되지 않는다.
// ---------------------------------------------------------------------------
AppliedDirectives apply_directives(std::string_view region, std::vector<RewriteDirective> directives) {
    std::stable_sort(directives.begin(), directives.end(),
                     [](const RewriteDirective& a, const RewriteDirective& b) {
                         return a.original_text.size() > b.original_text.size();
                     });

    AppliedDirectives result{.text = std::string(region), .functions = {}};
    for (const auto& directive : directives) {
        const auto pos = locate_call(result.text, directive.original_text);
        if (!pos) {
            continue;
        }
        result.text.replace(*pos, directive.original_text.size(), directive.replacement_text);
        result.functions.push_back(directive.function_name);
    }
    return result;
}

// ---------------------------------------------------------------------------
// splice_span / current_slice
// ---------------------------------------------------------------------------
namespace {

std::size_t shifted(std::size_t pos, std::ptrdiff_t offset, std::size_t limit) {
    const auto moved = static_cast<std::ptrdiff_t>(pos) + offset;
    if (moved < 0) {
        return 0;
    }
    return std::min(static_cast<std::size_t>(moved), limit);
}

} // namespace

SpliceState splice_span(const SpliceState& state,
                        std::size_t        start,
                        std::size_t        end,
                        std::string_view   replacement) {
    const std::size_t from = shifted(start, state.offset, state.text.size());
    const std::size_t to   = shifted(end, state.offset, state.text.size());

    SpliceState next{.text = state.text, .offset = state.offset};
    next.text.replace(from, to - from, replacement);
    next.offset += static_cast<std::ptrdiff_t>(replacement.size())
                 - static_cast<std::ptrdiff_t>(to - from);
    return next;
}

std::string_view current_slice(const SpliceState& state, std::size_t start, std::size_t end) {
    const std::size_t from = shifted(start, state.offset, state.text.size());
    const std::size_t to   = shifted(end, state.offset, state.text.size());
    return std::string_view(state.text).substr(from, to - from);
}
