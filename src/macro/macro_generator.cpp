// ---------------------------------------------------------------------------
// macro_generator.cpp
// ---------------------------------------------------------------------------

#include "macro/macro_generator.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "dialect/dialect_registry.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kLibraryHeader =
    "{#- Generated by dbport. Edits are overwritten on the next generate run. -#}\n\n";

// 최상위 쉼표로 인자를 나눈다. 따옴표 안과 괄호 안의 쉼표는 무시한다.
constexpr std::string_view kSplitArgsMacro = R"({% macro portable_split_args(expression) -%}
    {%- set ns = namespace(parts=[], current='', depth=0, quote=none) -%}
    {%- for ch in expression -%}
        {%- if ns.quote is not none -%}
            {%- set ns.current = ns.current ~ ch -%}
            {%- if ch == ns.quote -%}{%- set ns.quote = none -%}{%- endif -%}
        {%- elif ch == "'" or ch == '"' -%}
            {%- set ns.quote = ch -%}
            {%- set ns.current = ns.current ~ ch -%}
        {%- elif ch == '(' or ch == '[' -%}
            {%- set ns.depth = ns.depth + 1 -%}
            {%- set ns.current = ns.current ~ ch -%}
        {%- elif ch == ')' or ch == ']' -%}
            {%- set ns.depth = ns.depth - 1 -%}
            {%- set ns.current = ns.current ~ ch -%}
        {%- elif ch == ',' and ns.depth == 0 -%}
            {%- set ns.parts = ns.parts + [ns.current | trim] -%}
            {%- set ns.current = '' -%}
        {%- else -%}
            {%- set ns.current = ns.current ~ ch -%}
        {%- endif -%}
    {%- endfor -%}
    {%- if ns.current | trim != '' -%}
        {%- set ns.parts = ns.parts + [ns.current | trim] -%}
    {%- endif -%}
    {{- return(ns.parts) -}}
{%- endmacro %}

)";

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool has_positional(std::string_view pattern) {
    for (std::size_t i = 0; i + 1 < pattern.size(); ++i) {
        if (pattern[i] == '{' && std::isdigit(static_cast<unsigned char>(pattern[i + 1]))) {
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// to_jinja
//   렌더 템플릿 패턴을 Jinja 본문으로 바꾼다.
//   split = false : {*} → {{ expression }}
//   split = true  : {*} → {{ args | join(', ') }}, {N} → {{ args[surface(N)] }}
// ---------------------------------------------------------------------------
std::string to_jinja(std::string_view                pattern,
                     bool                            split,
                     const std::vector<std::size_t>& primary_order) {
    std::string out;
    std::size_t i = 0;
    while (i < pattern.size()) {
        if (pattern.substr(i, 3) == "{*}") {
            out += split ? "{{ args | join(', ') }}" : "{{ expression }}";
            i += 3;
            continue;
        }
        if (pattern[i] == '{') {
            std::size_t j = i + 1;
            while (j < pattern.size() && std::isdigit(static_cast<unsigned char>(pattern[j]))) {
                ++j;
            }
            if (j > i + 1 && j < pattern.size() && pattern[j] == '}') {
                std::size_t index = std::stoul(std::string(pattern.substr(i + 1, j - i - 1)));
                if (index < primary_order.size()) {
                    index = primary_order[index];
                }
                out += fmt::format("{{{{ args[{}] }}}}", index);
                i = j + 1;
                continue;
            }
        }
        out += pattern[i];
        ++i;
    }
    return out;
}

std::string raise_error(std::string_view macro_name, std::string_view detail) {
    return fmt::format("{{{{ exceptions.raise_compiler_error(\"{}: {}\") }}}}", macro_name,
                       detail);
}

// ---------------------------------------------------------------------------
// render_body
//   방언 하나의 매크로 본문.
// ---------------------------------------------------------------------------
std::string render_body(const std::string&                 lower_name,
                        const std::string&                 dialect,
                        const std::vector<RenderTemplate>* templates,
                        const std::vector<std::size_t>&    primary_order) {
    const std::string macro_name = "portable_" + lower_name;
    if (templates == nullptr || templates->empty()) {
        return "    " + raise_error(macro_name, fmt::format("not supported on {}", dialect)) + "\n";
    }

    const bool split = std::any_of(templates->begin(), templates->end(), [](const auto& t) {
        return t.arity != kAnyArity || has_positional(t.pattern);
    });
    if (!split) {
        return "    " + to_jinja(templates->front().pattern, false, primary_order) + "\n";
    }

    std::string body = "    {%- set args = portable_split_args(expression) -%}\n";
    const RenderTemplate* fallback = nullptr;
    bool                  first    = true;
    for (const auto& t : *templates) {
        if (t.arity == kAnyArity) {
            if (fallback == nullptr) {
                fallback = &t;
            }
            continue;
        }
        body += fmt::format("    {{%- {} args | length == {} -%}}\n", first ? "if" : "elif",
                            t.arity);
        body += "    " + to_jinja(t.pattern, true, primary_order) + "\n";
        first = false;
    }

    const std::string otherwise =
        fallback != nullptr
            ? to_jinja(fallback->pattern, true, primary_order)
            : raise_error(macro_name,
                          fmt::format("unsupported argument count on {}", dialect));
    if (first) {
        body += "    " + otherwise + "\n";
        return body;
    }
    body += "    {%- else -%}\n";
    body += "    " + otherwise + "\n";
    body += "    {%- endif -%}\n";
    return body;
}

} // namespace

MacroGenerator::MacroGenerator(DialectOracle oracle)
    : oracle_(std::move(oracle)) {}

// ---------------------------------------------------------------------------
// render_function
//   impl_id 는 주 방언 카탈로그에서 먼저 찾고, 없으면 설정 순서대로 찾는다.
//   어느 카탈로그에도 없는 함수는 이름 그대로 통과시킨다.
// ---------------------------------------------------------------------------
std::string MacroGenerator::render_function(const std::string& function_name) const {
    const std::string upper = to_upper(function_name);
    const std::string lower = to_lower(function_name);

    std::string              impl_id;
    std::vector<std::size_t> primary_order;
    for (const auto& dialect : oracle_.dialects()) {
        const DialectProfile* profile = DialectRegistry::find(dialect);
        if (profile == nullptr) {
            continue;
        }
        const auto it = profile->catalog().find(upper);
        if (it == profile->catalog().end()) {
            continue;
        }
        impl_id = it->second.impl_id;
        if (dialect == oracle_.primary()) {
            primary_order = it->second.arg_order;
        }
        break;
    }

    std::string out;
    out += fmt::format("{{% macro portable_{}(expression='') -%}}\n", lower);
    out += fmt::format("    {{{{- return(adapter.dispatch('{}', 'portable')(expression)) -}}}}\n",
                       lower);
    out += "{%- endmacro %}\n\n";

    for (const auto& dialect : oracle_.dialects()) {
        out += fmt::format("{{% macro {}__{}(expression='') -%}}\n", dialect, lower);

        const DialectProfile* profile = DialectRegistry::find(dialect);
        if (profile == nullptr) {
            out += "    " + raise_error("portable_" + lower,
                                        fmt::format("unknown adapter {}", dialect)) + "\n";
        } else if (impl_id.empty()) {
            out += fmt::format("    {}({{{{ expression }}}})\n", upper);
        } else {
            out += render_body(lower, dialect, profile->templates_for(impl_id), primary_order);
        }
        out += "{%- endmacro %}\n\n";
    }

    out += fmt::format("{{% macro default__{}(expression='') -%}}\n", lower);
    out += fmt::format("    {{{{- return({}__{}(expression)) -}}}}\n", oracle_.primary(), lower);
    out += "{%- endmacro %}\n\n";
    return out;
}

std::string MacroGenerator::render_library(const std::vector<std::string>& function_names) const {
    std::string out(kLibraryHeader);
    out += kSplitArgsMacro;

    std::set<std::string> seen;
    for (const auto& name : function_names) {
        if (name.empty() || !seen.insert(to_upper(name)).second) {
            continue;
        }
        out += render_function(name);
    }
    return out;
}

// ---------------------------------------------------------------------------
// generate
// ---------------------------------------------------------------------------
std::expected<fs::path, std::string>
MacroGenerator::generate(const ProjectConfig&            config,
                         const std::vector<std::string>& function_names) const {
    const fs::path& output = config.macro_output;
    if (function_names.empty()) {
        spdlog::info("macro_generator: no non-portable functions, {} not written",
                     output.string());
        return output;
    }

    std::error_code ec;
    if (output.has_parent_path()) {
        fs::create_directories(output.parent_path(), ec);
        if (ec) {
            return std::unexpected(fmt::format("cannot create {}: {}",
                                               output.parent_path().string(), ec.message()));
        }
    }

    const std::string library = render_library(function_names);
    std::ofstream     out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(fmt::format("cannot open {} for writing", output.string()));
    }
    out.write(library.data(), static_cast<std::streamsize>(library.size()));
    out.flush();
    if (!out) {
        return std::unexpected(fmt::format("write error on {}", output.string()));
    }

    spdlog::info("macro_generator: wrote {} macro(s) to {}", function_names.size(),
                 output.string());
    return output;
}
