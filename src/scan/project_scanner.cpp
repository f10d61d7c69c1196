// ---------------------------------------------------------------------------
// project_scanner.cpp
// ---------------------------------------------------------------------------

#include "scan/project_scanner.hpp"

#include <chrono>
#include <fstream>
#include <mutex>
#include <set>
#include <sstream>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "logger/structured_logger.hpp"
#include "rewrite/function_collector.hpp"
#include "workers/file_pool.hpp"

namespace fs = std::filesystem;

ProjectScanner::ProjectScanner(DialectOracle oracle, StructuredLogger* logger)
    : oracle_(std::move(oracle))
    , logger_(logger)
{}

std::vector<std::string> ProjectScanner::functions_in(std::string_view source) const {
    std::vector<std::string> names;

    const auto regions = classifier_.classify(source);
    if (!classifier_.can_safely_rewrite(regions).can_rewrite) {
        return names;
    }

    for (const auto& span : classifier_.extract_masked_spans(regions)) {
        auto tree = oracle_.parse(span.masked_text);
        if (!tree) {
            spdlog::debug("project_scanner: span not parsed: {}", tree.error().message);
            continue;
        }
        for (auto& candidate : collect_functions(*tree, oracle_)) {
            names.push_back(std::move(candidate.rendered_name));
        }
    }
    return names;
}

FunctionTally ProjectScanner::scan(const std::vector<fs::path>& model_roots,
                                   std::size_t                  workers) const {
    const auto started = std::chrono::steady_clock::now();
    const auto files   = collect_sql_files(model_roots);

    std::mutex    mutex;
    FunctionTally tally;
    parallel_for_each(files, workers, [&](const fs::path& file) {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            spdlog::warn("project_scanner: cannot open {}", file.string());
            if (logger_ != nullptr) {
                logger_->warn(fmt::format("project_scanner: cannot open {}", file.string()));
            }
            return;
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();

        const auto names = functions_in(buffer.str());
        const std::lock_guard<std::mutex> lock(mutex);
        for (const auto& name : names) {
            ++tally[name];
        }
    });

    const auto            differences = oracle_.catalog_differences();
    const std::set<std::string> known(differences.begin(), differences.end());

    FunctionTally non_portable;
    for (const auto& [name, count] : tally) {
        if (known.contains(name)) {
            non_portable.emplace(name, count);
        }
    }

    if (logger_ != nullptr) {
        ScanSummaryLog summary{
            .dialects      = oracle_.dialects(),
            .functions     = {},
            .files_scanned = files.size(),
            .timestamp     = std::chrono::system_clock::now(),
            .duration      = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started),
        };
        for (const auto& [name, count] : non_portable) {
            summary.functions.emplace_back(name, count);
        }
        logger_->log_scan_summary(summary);
    }
    spdlog::debug("project_scanner: {} file(s), {} non-portable function(s)", files.size(),
                  non_portable.size());
    return non_portable;
}

FunctionTally ProjectScanner::scan_project(const ProjectConfig& config) const {
    if (!config.scan_project) {
        return {};
    }
    return scan(config.model_paths, config.workers);
}
