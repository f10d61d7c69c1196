#include "config/config_loader.hpp"
#include "dialect/dialect_oracle.hpp"
#include "logger/structured_logger.hpp"
#include "macro/macro_generator.hpp"
#include "rewrite/model_rewriter.hpp"
#include "scan/project_scanner.hpp"
#include "stats/stats_collector.hpp"
#include "workers/file_pool.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helper: 환경변수 / 인자 읽기
// ---------------------------------------------------------------------------
namespace {

constexpr const char* kUsage =
    "usage: dbport <command> [options]\n"
    "\n"
    "commands:\n"
    "  scan                         list non-portable function calls in models\n"
    "  generate                     scan, then write portable_* macros for them\n"
    "  generate-library             write macros for every non-portable catalog function\n"
    "  rewrite [--dry-run]          replace non-portable calls with portable_* macros\n"
    "  migrate [--dry-run]          scan, generate and rewrite\n"
    "  transpile <read> <write> <sql>\n"
    "                               render one statement in another dialect\n"
    "\n"
    "options:\n"
    "  -c, --config <path>   config file (env DBPORT_CONFIG, default .dbt-multi-adapter.yml)\n"
    "  -j, --jobs <n>        worker threads (env DBPORT_WORKERS, 0 = hardware concurrency)\n"
    "  --dry-run             report changes without writing files\n"
    "  -v, --verbose         debug diagnostics\n";

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

uint32_t env_u32(const char* name, uint32_t default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    try {
        const long parsed = std::stol(val);
        if (parsed < 0) {
            spdlog::warn("env {}: negative value {}, using default {}", name, parsed, default_val);
            return default_val;
        }
        return static_cast<uint32_t>(parsed);
    } catch (const std::exception&) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    }
}

struct CliOptions {
    std::string                command{};
    std::vector<std::string>   positional{};
    fs::path                   config_path{};
    std::optional<std::size_t> workers{};
    bool                       dry_run{false};
    bool                       verbose{false};
    bool                       help{false};
};

std::expected<CliOptions, std::string> parse_args(int argc, char* argv[]) {
    CliOptions options;
    options.config_path = env_str("DBPORT_CONFIG", kDefaultConfigFile);

    const std::vector<std::string> args(argv + 1, argv + argc);
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--dry-run") {
            options.dry_run = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= args.size()) {
                return std::unexpected(fmt::format("{} requires a path", arg));
            }
            options.config_path = args[++i];
        } else if (arg == "-j" || arg == "--jobs") {
            if (i + 1 >= args.size()) {
                return std::unexpected(fmt::format("{} requires a number", arg));
            }
            const std::string& value = args[++i];
            try {
                const long parsed = std::stol(value);
                if (parsed < 0) {
                    return std::unexpected(fmt::format("{}: negative worker count {}", arg, value));
                }
                options.workers = static_cast<std::size_t>(parsed);
            } catch (const std::exception&) {
                return std::unexpected(fmt::format("{}: invalid worker count '{}'", arg, value));
            }
        } else if (arg.size() > 1 && arg.front() == '-') {
            return std::unexpected(fmt::format("unknown option {}", arg));
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.positional.push_back(arg);
        }
    }
    return options;
}

LogLevel to_log_level(const std::string& name) {
    if (name == "trace" || name == "debug") {
        return LogLevel::kDebug;
    }
    if (name == "warn") {
        return LogLevel::kWarn;
    }
    if (name == "error") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// RunContext
//   명령 실행에 필요한 설정과 공유 객체.
// ---------------------------------------------------------------------------
struct RunContext {
    ProjectConfig     config{};
    DialectOracle     oracle;
    StructuredLogger* logger{nullptr};
    std::size_t       workers{0};
    bool              dry_run{false};
};

FunctionTally run_scan(const RunContext& ctx) {
    const ProjectScanner scanner{ctx.oracle, ctx.logger};
    ProjectConfig        config = ctx.config;
    config.workers              = ctx.workers;
    return scanner.scan_project(config);
}

void print_tally(const FunctionTally& tally) {
    if (tally.empty()) {
        fmt::print("No non-portable functions found.\n");
        return;
    }
    std::size_t total = 0;
    fmt::print("{:<32} {:>8}\n", "FUNCTION", "CALLS");
    for (const auto& [name, count] : tally) {
        fmt::print("{:<32} {:>8}\n", name, count);
        total += count;
    }
    fmt::print("Total: {} call(s) across {} function(s)\n", total, tally.size());
}

int write_macros(const RunContext& ctx, const std::vector<std::string>& names) {
    if (ctx.dry_run) {
        fmt::print("Would write {} macro(s) to {}\n", names.size(), ctx.config.macro_output.string());
        return EXIT_SUCCESS;
    }
    const MacroGenerator generator{ctx.oracle};
    auto                 written = generator.generate(ctx.config, names);
    if (!written) {
        spdlog::error("dbport: {}", written.error());
        return EXIT_FAILURE;
    }
    if (names.empty()) {
        fmt::print("No macros to write.\n");
    } else {
        fmt::print("Wrote {} macro(s) to {}\n", names.size(), written->string());
    }
    return EXIT_SUCCESS;
}

std::vector<std::string> tally_names(const FunctionTally& tally) {
    std::vector<std::string> names;
    names.reserve(tally.size());
    for (const auto& [name, count] : tally) {
        names.push_back(name);
    }
    return names;
}

int run_rewrite(const RunContext& ctx) {
    if (ctx.config.model_paths.empty()) {
        spdlog::warn("dbport: no model paths configured, nothing to rewrite");
        return EXIT_SUCCESS;
    }

    StatsCollector      stats;
    const ModelRewriter rewriter{ctx.oracle, ctx.logger, &stats};
    const auto modified = rewriter.rewrite_models(ctx.config.model_paths, ctx.dry_run, ctx.workers);

    for (const auto& path : modified) {
        fmt::print("{} {}\n", ctx.dry_run ? "would rewrite" : "rewrote", path.string());
    }
    const auto        snap    = stats.snapshot();
    const std::string summary = fmt::format(
        "{} {} file(s), {} call(s); scanned {}, unsafe {}, unreadable {}, "
        "span parse failures {} ({} ms)",
        ctx.dry_run ? "Would rewrite" : "Rewrote", snap.files_rewritten, snap.calls_rewritten,
        snap.files_seen, snap.files_unsafe, snap.files_unreadable, snap.span_parse_failures,
        snap.elapsed.count());
    fmt::print("{}\n", summary);
    if (ctx.logger != nullptr) {
        ctx.logger->info("dbport: " + summary);
    }
    return EXIT_SUCCESS;
}

int run_transpile(const CliOptions& options) {
    if (options.positional.size() != 3) {
        fmt::print(stderr, "transpile requires <read> <write> <sql>\n\n{}", kUsage);
        return EXIT_FAILURE;
    }
    auto rendered = DialectOracle::transpile(options.positional[2], options.positional[0],
                                             options.positional[1]);
    if (!rendered) {
        spdlog::error("dbport: transpile failed: {}", rendered.error().message);
        return EXIT_FAILURE;
    }
    fmt::print("{}\n", *rendered);
    return EXIT_SUCCESS;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 콘솔 로거 ───────────────────────────────────────────────────────
    spdlog::set_default_logger(spdlog::stderr_color_mt("console"));
    spdlog::set_pattern("%^[%l]%$ %v");

    // ── 인자 파싱 ───────────────────────────────────────────────────────
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        fmt::print(stderr, "{}\n\n{}", parsed.error(), kUsage);
        return EXIT_FAILURE;
    }
    const CliOptions& options = *parsed;
    if (options.help) {
        fmt::print("{}", kUsage);
        return EXIT_SUCCESS;
    }
    if (options.command.empty()) {
        fmt::print(stderr, "{}", kUsage);
        return EXIT_FAILURE;
    }
    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    if (options.command == "transpile") {
        return run_transpile(options);
    }
    if (options.command != "scan" && options.command != "generate"
        && options.command != "generate-library" && options.command != "rewrite"
        && options.command != "migrate") {
        fmt::print(stderr, "unknown command '{}'\n\n{}", options.command, kUsage);
        return EXIT_FAILURE;
    }

    // ── 설정 로드 ───────────────────────────────────────────────────────
    auto config = ConfigLoader::load(options.config_path);
    if (!config) {
        spdlog::error("dbport: {}", config.error());
        return EXIT_FAILURE;
    }
    if (!options.verbose) {
        spdlog::set_level(spdlog::level::from_str(config->log_level));
    }

    // ── 구조화 로그 ─────────────────────────────────────────────────────
    std::unique_ptr<StructuredLogger> event_log;
    if (!config->log_file.empty()) {
        try {
            event_log = std::make_unique<StructuredLogger>(to_log_level(config->log_level),
                                                           config->log_file, false);
        } catch (const std::runtime_error& e) {
            spdlog::error("dbport: {}", e.what());
            return EXIT_FAILURE;
        }
    }

    const std::size_t workers =
        options.workers.value_or(env_u32("DBPORT_WORKERS",
                                         static_cast<uint32_t>(config->workers)));
    RunContext ctx{
        .config  = *config,
        .oracle  = DialectOracle{config->adapters},
        .logger  = event_log.get(),
        .workers = workers,
        .dry_run = options.dry_run,
    };
    spdlog::debug("dbport: adapters [{}], primary {}, workers {}",
                  fmt::join(ctx.oracle.dialects(), ", "), ctx.oracle.primary(),
                  resolve_worker_count(workers));

    // ── 명령 실행 ───────────────────────────────────────────────────────
    if (options.command == "scan") {
        print_tally(run_scan(ctx));
        return EXIT_SUCCESS;
    }
    if (options.command == "generate") {
        return write_macros(ctx, tally_names(run_scan(ctx)));
    }
    if (options.command == "generate-library") {
        return write_macros(ctx, ctx.oracle.catalog_differences());
    }
    if (options.command == "rewrite") {
        return run_rewrite(ctx);
    }

    // migrate: scan → generate → rewrite
    const auto tally = run_scan(ctx);
    print_tally(tally);
    if (const int rc = write_macros(ctx, tally_names(tally)); rc != EXIT_SUCCESS) {
        return rc;
    }
    return run_rewrite(ctx);
}
