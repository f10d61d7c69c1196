// ---------------------------------------------------------------------------
// model_rewriter.cpp
// ---------------------------------------------------------------------------

#include "rewrite/model_rewriter.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <expected>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "logger/structured_logger.hpp"
#include "rewrite/function_collector.hpp"
#include "stats/stats_collector.hpp"
#include "workers/file_pool.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 5> kOrderOnlyAggregates = {"COUNT", "SUM", "MIN", "MAX",
                                                                   "AVG"};

constexpr std::string_view kReasonUnreadable = "unreadable";
constexpr std::string_view kReasonEmpty      = "empty";
constexpr std::string_view kReasonUnsafe     = "unsafe_template";
constexpr std::string_view kReasonNoSql      = "no_sql";
constexpr std::string_view kReasonParse      = "parse_failed";

// 인자 없는 집계 함수, '*' 인자 호출은 방언 간 동일하다고 본다.
bool is_rewrite_eligible(const FunctionCandidate& candidate, const std::string& canonical) {
    if (canonical.find('*') != std::string::npos) {
        return false;
    }
    if (function_arity(*candidate.node) > 0) {
        return true;
    }
    return std::find(kOrderOnlyAggregates.begin(), kOrderOnlyAggregates.end(),
                     candidate.rendered_name)
        == kOrderOnlyAggregates.end();
}

std::expected<std::string, std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(fmt::format("cannot open {}", path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(fmt::format("read error on {}", path.string()));
    }
    return buffer.str();
}

// 대상 파일과 같은 디렉터리의 임시 파일에 쓰고 rename 으로 교체한다.
// 동시에 읽는 쪽은 이전 내용 또는 새 내용 전체만 보게 된다.
// 심볼릭 링크는 실제 파일을 교체하고, 원래 파일 권한을 유지한다.
std::expected<void, std::string> write_file_atomically(const fs::path& path,
                                                       std::string_view content) {
    std::error_code ec;
    const fs::path  target = fs::canonical(path, ec);
    if (ec) {
        return std::unexpected(fmt::format("cannot resolve {}: {}", path.string(), ec.message()));
    }
    const fs::perms mode = fs::status(target, ec).permissions();
    if (ec) {
        return std::unexpected(fmt::format("cannot stat {}: {}", target.string(), ec.message()));
    }

    fs::path tmp = target;
    tmp += ".dbport.tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return std::unexpected(fmt::format("cannot create {}", tmp.string()));
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return std::unexpected(fmt::format("write error on {}", tmp.string()));
        }
    }

    fs::permissions(tmp, mode, fs::perm_options::replace, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return std::unexpected(
            fmt::format("cannot set permissions on {}: {}", tmp.string(), ec.message()));
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return std::unexpected(
            fmt::format("cannot replace {}: {}", target.string(), ec.message()));
    }
    return {};
}

} // namespace

ModelRewriter::ModelRewriter(DialectOracle oracle, StructuredLogger* logger, StatsCollector* stats)
    : oracle_(std::move(oracle))
    , logger_(logger)
    , stats_(stats)
{}

// ---------------------------------------------------------------------------
// build_directives
//   후보 → 적격성 필터 → 이식성 필터 → 매크로 호출 생성.
// ---------------------------------------------------------------------------
std::vector<RewriteDirective> ModelRewriter::build_directives(const SqlNode& tree) const {
    std::vector<RewriteDirective> directives;
    for (const auto& candidate : collect_functions(tree, oracle_)) {
        auto canonical = oracle_.render_primary(*candidate.node);
        if (!canonical) {
            continue;  // 원문에서 찾을 텍스트가 없다
        }
        if (!is_rewrite_eligible(candidate, *canonical)) {
            continue;
        }
        if (!oracle_.function_differs(*candidate.node)) {
            continue;
        }
        std::string replacement = build_macro_call(candidate.rendered_name, *canonical);
        directives.push_back(RewriteDirective{
            .original_text    = std::move(*canonical),
            .replacement_text = std::move(replacement),
            .function_name    = candidate.rendered_name,
            .depth            = candidate.depth,
        });
    }
    return directives;
}

// ---------------------------------------------------------------------------
// rewrite_text
// ---------------------------------------------------------------------------
RewriteOutcome ModelRewriter::rewrite_text(std::string_view source) const {
    RewriteOutcome outcome;
    outcome.text = std::string(source);

    if (source.empty()) {
        outcome.skip_reason = kReasonEmpty;
        return outcome;
    }

    const auto regions = classifier_.classify(source);
    const auto verdict = classifier_.can_safely_rewrite(regions);
    if (!verdict.can_rewrite) {
        outcome.skip_reason = kReasonUnsafe;
        outcome.detail      = verdict.reason;
        return outcome;
    }

    const auto spans = classifier_.extract_masked_spans(regions);
    if (spans.empty()) {
        outcome.skip_reason = kReasonNoSql;
        return outcome;
    }

    SpliceState state{.text = std::string(source), .offset = 0};
    for (const auto& span : spans) {
        auto tree = oracle_.parse(span.masked_text);
        if (!tree) {
            ++outcome.spans_failed;
            outcome.detail = tree.error().message;
            spdlog::debug("model_rewriter: span [{}, {}) not parsed: {}", span.start, span.end,
                          tree.error().message);
            continue;
        }

        auto directives = build_directives(*tree);
        if (directives.empty()) {
            continue;
        }

        const std::string original_slice(current_slice(state, span.start, span.end));
        auto applied = apply_directives(original_slice, std::move(directives));
        if (applied.text == original_slice) {
            continue;
        }
        state = splice_span(state, span.start, span.end, applied.text);
        outcome.functions.insert(outcome.functions.end(),
                                 std::make_move_iterator(applied.functions.begin()),
                                 std::make_move_iterator(applied.functions.end()));
    }

    if (outcome.spans_failed == spans.size()) {
        outcome.skip_reason = kReasonParse;
    }
    outcome.modified = state.text != source;
    outcome.text     = std::move(state.text);
    return outcome;
}

// ---------------------------------------------------------------------------
// rewrite_file
// ---------------------------------------------------------------------------
bool ModelRewriter::rewrite_file(const fs::path& path, bool dry_run) const {
    if (stats_ != nullptr) {
        stats_->on_file_seen();
    }

    auto content = read_file(path);
    if (!content) {
        spdlog::warn("model_rewriter: {}", content.error());
        if (logger_ != nullptr) {
            logger_->warn(fmt::format("model_rewriter: {}", content.error()));
        }
        if (stats_ != nullptr) {
            stats_->on_file_unreadable();
        }
        report_skip(path, kReasonUnreadable, content.error());
        return false;
    }

    const RewriteOutcome outcome = rewrite_text(*content);
    if (stats_ != nullptr) {
        if (outcome.skip_reason == kReasonUnsafe) {
            stats_->on_file_unsafe();
        }
        for (std::size_t i = 0; i < outcome.spans_failed; ++i) {
            stats_->on_span_parse_failure();
        }
    }
    if (!outcome.skip_reason.empty()) {
        report_skip(path, outcome.skip_reason, outcome.detail);
    } else if (outcome.spans_failed > 0 && logger_ != nullptr) {
        logger_->debug(fmt::format("model_rewriter: {} span(s) not parsed in {}: {}",
                                   outcome.spans_failed, path.string(), outcome.detail));
    }
    if (!outcome.modified) {
        return false;
    }

    if (!dry_run) {
        auto written = write_file_atomically(path, outcome.text);
        if (!written) {
            spdlog::error("model_rewriter: {}", written.error());
            if (logger_ != nullptr) {
                logger_->error(fmt::format("model_rewriter: {}", written.error()));
            }
            return false;
        }
    }

    if (stats_ != nullptr) {
        stats_->on_file_rewritten(outcome.functions.size());
    }
    if (logger_ != nullptr) {
        logger_->log_rewrite(FileRewriteLog{
            .path            = path.string(),
            .functions       = outcome.functions,
            .calls_rewritten = outcome.functions.size(),
            .dry_run         = dry_run,
            .timestamp       = std::chrono::system_clock::now(),
        });
    }
    spdlog::debug("model_rewriter: {} {} ({} call(s))", dry_run ? "would rewrite" : "rewrote",
                  path.string(), outcome.functions.size());
    return true;
}

// ---------------------------------------------------------------------------
// rewrite_models
// ---------------------------------------------------------------------------
std::vector<fs::path> ModelRewriter::rewrite_models(const std::vector<fs::path>& roots,
                                                    bool                         dry_run,
                                                    std::size_t                  workers) const {
    const auto files = collect_sql_files(roots);

    std::mutex            mutex;
    std::vector<fs::path> modified;
    parallel_for_each(files, workers, [&](const fs::path& file) {
        if (rewrite_file(file, dry_run)) {
            const std::lock_guard<std::mutex> lock(mutex);
            modified.push_back(file);
        }
    });

    std::sort(modified.begin(), modified.end());
    return modified;
}

void ModelRewriter::report_skip(const fs::path&  path,
                                std::string_view reason,
                                std::string_view detail) const {
    if (logger_ == nullptr) {
        return;
    }
    logger_->log_skip(FileSkipLog{
        .path      = path.string(),
        .reason    = std::string(reason),
        .detail    = std::string(detail),
        .timestamp = std::chrono::system_clock::now(),
    });
}
