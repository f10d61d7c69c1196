// ---------------------------------------------------------------------------
// test_model_rewriter.cpp
//
// ModelRewriter 단위 테스트.
//
// [테스트 범위]
// - 방언 간 차이가 있는 호출만 portable_* 매크로로 치환
// - 템플릿 보존: 제어 흐름 블록 / 허용 목록 호출은 원문 그대로
// - Unsafe 템플릿 거부 (파일 전체 변경 없음)
// - 멱등성: 재작성 결과를 다시 처리해도 변경 없음
// - 적격성 필터: COUNT(*) / 인자 없는 COUNT() 제외
// - 문자열 리터럴 안의 같은 텍스트는 건드리지 않음
// - 파일 처리: dry-run 순수성, 원자적 기록, 읽기 실패, 통계 집계
// - 심볼릭 링크는 실제 파일을 갱신, 원래 파일 권한 유지
// - 읽기 실패 진단은 구조화 로그 파일에도 기록
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"
#include "rewrite/model_rewriter.hpp"
#include "stats/stats_collector.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// 문자열 단위 재작성
// ---------------------------------------------------------------------------

TEST(ModelRewriter, CollectListRewritten) {
    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    const auto    outcome = rewriter.rewrite_text("SELECT COLLECT_LIST(col) FROM t");
    EXPECT_TRUE(outcome.modified);
    EXPECT_EQ(outcome.text, "SELECT {{ portable_collect_list('col') }} FROM t");
    EXPECT_EQ(outcome.functions, (std::vector<std::string>{"COLLECT_LIST"}));
    EXPECT_TRUE(outcome.skip_reason.empty());
}

TEST(ModelRewriter, PortableSqlUnchanged) {
    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    const auto    outcome = rewriter.rewrite_text("SELECT a, COUNT(b) FROM t GROUP BY a");
    EXPECT_FALSE(outcome.modified);
    EXPECT_EQ(outcome.text, "SELECT a, COUNT(b) FROM t GROUP BY a");
    EXPECT_TRUE(outcome.functions.empty());
    EXPECT_TRUE(outcome.skip_reason.empty());
}

TEST(ModelRewriter, ControlFlowPreserved) {
    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    const auto    outcome =
        rewriter.rewrite_text("SELECT {% if x %} COLLECT_LIST(col) {% endif %} FROM t");
    EXPECT_TRUE(outcome.modified);
    EXPECT_EQ(outcome.text,
              "SELECT {% if x %} {{ portable_collect_list('col') }} {% endif %} FROM t");
}

TEST(ModelRewriter, SafeExpressionPreserved) {
    ModelRewriter     rewriter{DialectOracle{{"spark", "duckdb"}}};
    const std::string source =
        "{{ config(materialized='table') }}\n"
        "SELECT user_id, COLLECT_LIST(event) AS events\n"
        "FROM {{ ref('events') }}\n"
        "GROUP BY user_id\n";
    const auto outcome = rewriter.rewrite_text(source);
    EXPECT_TRUE(outcome.modified);
    EXPECT_EQ(outcome.text,
              "{{ config(materialized='table') }}\n"
              "SELECT user_id, {{ portable_collect_list('event') }} AS events\n"
              "FROM {{ ref('events') }}\n"
              "GROUP BY user_id\n");
}

TEST(ModelRewriter, UnsafeTemplateVetoesFile) {
    ModelRewriter     rewriter{DialectOracle{{"spark", "duckdb"}}};
    const std::string source  = "SELECT COLLECT_LIST(col) FROM {{ my_macro() }}";
    const auto        outcome = rewriter.rewrite_text(source);
    EXPECT_FALSE(outcome.modified);
    EXPECT_EQ(outcome.text, source);
    EXPECT_EQ(outcome.skip_reason, "unsafe_template");
    EXPECT_FALSE(outcome.detail.empty());
}

TEST(ModelRewriter, BrokenTemplateVetoesFile) {
    ModelRewriter     rewriter{DialectOracle{{"spark", "duckdb"}}};
    const std::string source  = "SELECT COLLECT_LIST(col) FROM {{ ref('x' }}";
    const auto        outcome = rewriter.rewrite_text(source);
    EXPECT_FALSE(outcome.modified);
    EXPECT_EQ(outcome.text, source);
}

TEST(ModelRewriter, Idempotent) {
    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    const auto    first = rewriter.rewrite_text("SELECT COLLECT_LIST(col) FROM t");
    ASSERT_TRUE(first.modified);

    const auto second = rewriter.rewrite_text(first.text);
    EXPECT_FALSE(second.modified);
    EXPECT_EQ(second.text, first.text);
}

TEST(ModelRewriter, CountStarAndEmptyCountExcluded) {
    // 미등록 방언이 있으면 모든 함수가 "다름" 이지만 적격성 필터는 그대로 적용된다
    ModelRewriter rewriter{DialectOracle{{"spark", "oracle"}}};
    const auto    outcome = rewriter.rewrite_text("SELECT COUNT(*), COUNT() FROM t");
    EXPECT_FALSE(outcome.modified);
}

TEST(ModelRewriter, UnknownDialectFlagsEveryCall) {
    ModelRewriter rewriter{DialectOracle{{"spark", "oracle"}}};
    const auto    outcome = rewriter.rewrite_text("SELECT UPPER(name) FROM t");
    EXPECT_TRUE(outcome.modified);
    EXPECT_EQ(outcome.text, "SELECT {{ portable_upper('name') }} FROM t");
}

TEST(ModelRewriter, StringLiteralNotTouched) {
    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    const auto    outcome =
        rewriter.rewrite_text("SELECT COLLECT_LIST(col), 'COLLECT_LIST(col)' AS s FROM t");
    EXPECT_TRUE(outcome.modified);
    EXPECT_EQ(outcome.text,
              "SELECT {{ portable_collect_list('col') }}, 'COLLECT_LIST(col)' AS s FROM t");
}

TEST(ModelRewriter, LowercaseSourceLocated) {
    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    const auto    outcome = rewriter.rewrite_text("select collect_list(col) from t");
    EXPECT_TRUE(outcome.modified);
    EXPECT_EQ(outcome.text, "select {{ portable_collect_list('col') }} from t");
}

TEST(ModelRewriter, RepeatedCallsAllRewritten) {
    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    const auto    outcome = rewriter.rewrite_text("SELECT COLLECT_LIST(a), COLLECT_LIST(a) FROM t");
    EXPECT_EQ(outcome.text, "SELECT {{ portable_collect_list('a') }}, "
                            "{{ portable_collect_list('a') }} FROM t");
    EXPECT_EQ(outcome.functions.size(), 2u);
}

TEST(ModelRewriter, WrappingCallRewrittenAsWhole) {
    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    const auto    outcome = rewriter.rewrite_text("SELECT COALESCE(COLLECT_LIST(a), b) FROM t");
    EXPECT_TRUE(outcome.modified);
    EXPECT_EQ(outcome.text, "SELECT {{ portable_coalesce('COLLECT_LIST(a), b') }} FROM t");
    EXPECT_EQ(outcome.functions, (std::vector<std::string>{"COALESCE"}));
}

TEST(ModelRewriter, EmptySource) {
    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    const auto    outcome = rewriter.rewrite_text("");
    EXPECT_FALSE(outcome.modified);
    EXPECT_EQ(outcome.skip_reason, "empty");
}

TEST(ModelRewriter, WhitespaceOnlySource) {
    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    const auto    outcome = rewriter.rewrite_text("  \n  ");
    EXPECT_FALSE(outcome.modified);
    EXPECT_EQ(outcome.skip_reason, "no_sql");
}

TEST(ModelRewriter, ParseFailureLeavesText) {
    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    const auto    outcome = rewriter.rewrite_text("SELECT FROM WHERE");
    EXPECT_FALSE(outcome.modified);
    EXPECT_EQ(outcome.text, "SELECT FROM WHERE");
    EXPECT_EQ(outcome.spans_failed, 1u);
    EXPECT_EQ(outcome.skip_reason, "parse_failed");
}

TEST(ModelRewriter, BuildDirectivesSkipsPortableCalls) {
    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    const auto    tree = rewriter.oracle().parse("SELECT UPPER(a), COLLECT_LIST(b) FROM t");
    ASSERT_TRUE(tree.has_value());

    const auto directives = rewriter.build_directives(*tree);
    ASSERT_EQ(directives.size(), 1u);
    EXPECT_EQ(directives[0].function_name, "COLLECT_LIST");
    EXPECT_EQ(directives[0].original_text, "COLLECT_LIST(b)");
    EXPECT_EQ(directives[0].replacement_text, "{{ portable_collect_list('b') }}");
}

// ---------------------------------------------------------------------------
// Fixture: 임시 모델 디렉터리
// ---------------------------------------------------------------------------
class ModelRewriterFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name =
            std::string(info->test_suite_name()) + "_" + info->name();
        root_ = fs::temp_directory_path() / "dbport_test_models" / unique_name;
        fs::remove_all(root_);
        fs::create_directories(root_ / "marts");
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    fs::path write_model(const fs::path& relative, const std::string& content) const {
        const fs::path path = root_ / relative;
        std::ofstream  out(path, std::ios::binary);
        out << content;
        return path;
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream      in(path, std::ios::binary);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    fs::path root_;
};

TEST_F(ModelRewriterFileTest, RewriteFileWritesResult) {
    const auto path = write_model("orders.sql", "SELECT COLLECT_LIST(id) FROM orders");

    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    EXPECT_TRUE(rewriter.rewrite_file(path, /*dry_run=*/false));
    EXPECT_EQ(read_file(path), "SELECT {{ portable_collect_list('id') }} FROM orders");

    fs::path tmp = path;
    tmp += ".dbport.tmp";
    EXPECT_FALSE(fs::exists(tmp));
}

TEST_F(ModelRewriterFileTest, DryRunDoesNotWrite) {
    const std::string source = "SELECT COLLECT_LIST(id) FROM orders";
    const auto        path   = write_model("orders.sql", source);

    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    EXPECT_TRUE(rewriter.rewrite_file(path, /*dry_run=*/true));
    EXPECT_EQ(read_file(path), source);
}

TEST_F(ModelRewriterFileTest, UnchangedFileReturnsFalse) {
    const std::string source = "SELECT id FROM orders";
    const auto        path   = write_model("orders.sql", source);

    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    EXPECT_FALSE(rewriter.rewrite_file(path, false));
    EXPECT_EQ(read_file(path), source);
}

TEST_F(ModelRewriterFileTest, MissingFileCountsUnreadable) {
    StatsCollector stats;
    ModelRewriter  rewriter{DialectOracle{{"spark", "duckdb"}}, nullptr, &stats};
    EXPECT_FALSE(rewriter.rewrite_file(root_ / "missing.sql", false));

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.files_seen, 1u);
    EXPECT_EQ(snap.files_unreadable, 1u);
    EXPECT_EQ(snap.files_rewritten, 0u);
}

TEST_F(ModelRewriterFileTest, RewriteModelsAcrossDirectories) {
    const auto a = write_model("a.sql", "SELECT COLLECT_LIST(x) FROM t");
    const auto b = write_model("marts/b.sql", "SELECT NVL(x, 0), COLLECT_LIST(y) FROM t");
    write_model("marts/c.sql", "SELECT x FROM t");
    write_model("marts/d.sql", "SELECT COLLECT_LIST(x) FROM {{ unknown() }}");
    write_model("notes.md", "COLLECT_LIST(x)");

    StatsCollector stats;
    ModelRewriter  rewriter{DialectOracle{{"spark", "duckdb"}}, nullptr, &stats};
    const auto     modified = rewriter.rewrite_models({root_}, /*dry_run=*/false, /*workers=*/2);

    std::vector<fs::path> expected{a, b};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(modified, expected);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.files_seen, 4u);
    EXPECT_EQ(snap.files_rewritten, 2u);
    EXPECT_EQ(snap.files_unsafe, 1u);
    EXPECT_EQ(snap.calls_rewritten, 3u);
    EXPECT_EQ(read_file(root_ / "notes.md"), "COLLECT_LIST(x)");
}

TEST_F(ModelRewriterFileTest, RewriteModelsDryRunKeepsFiles) {
    const std::string source = "SELECT COLLECT_LIST(x) FROM t";
    const auto        path   = write_model("a.sql", source);

    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    const auto    modified = rewriter.rewrite_models({root_}, /*dry_run=*/true);
    ASSERT_EQ(modified.size(), 1u);
    EXPECT_EQ(modified[0], path);
    EXPECT_EQ(read_file(path), source);
}

TEST_F(ModelRewriterFileTest, SymlinkedModelUpdatesTarget) {
    fs::create_directories(root_ / "shared");
    const auto target = write_model("shared/orders.sql", "SELECT COLLECT_LIST(id) FROM orders");
    const fs::path link = root_ / "marts" / "orders.sql";
    fs::create_symlink(target, link);

    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    EXPECT_TRUE(rewriter.rewrite_file(link, false));

    EXPECT_TRUE(fs::is_symlink(link)) << "link must not be replaced by a regular file";
    EXPECT_EQ(read_file(target), "SELECT {{ portable_collect_list('id') }} FROM orders");
    EXPECT_EQ(read_file(link), read_file(target));

    fs::path tmp = target;
    tmp += ".dbport.tmp";
    EXPECT_FALSE(fs::exists(tmp));
}

TEST_F(ModelRewriterFileTest, RewritePreservesFileMode) {
    const auto path = write_model("orders.sql", "SELECT COLLECT_LIST(id) FROM orders");
    const auto mode = fs::perms::owner_read | fs::perms::owner_write;
    fs::permissions(path, mode, fs::perm_options::replace);

    ModelRewriter rewriter{DialectOracle{{"spark", "duckdb"}}};
    EXPECT_TRUE(rewriter.rewrite_file(path, false));

    EXPECT_EQ(fs::status(path).permissions() & fs::perms::mask, mode);
    EXPECT_EQ(read_file(path), "SELECT {{ portable_collect_list('id') }} FROM orders");
}

TEST_F(ModelRewriterFileTest, UnreadableModelLoggedToEventLog) {
    const fs::path log_file = root_ / "logs" / "dbport.jsonl";
    {
        StructuredLogger logger(LogLevel::kWarn, log_file, false);
        ModelRewriter    rewriter{DialectOracle{{"spark", "duckdb"}}, &logger};
        EXPECT_FALSE(rewriter.rewrite_file(root_ / "missing.sql", false));
    }

    const std::string content = read_file(log_file);
    EXPECT_NE(content.find("model_rewriter: cannot open"), std::string::npos);
    EXPECT_EQ(content.find("file_skipped"), std::string::npos)
        << "skip events are debug level and must be filtered at warn";
}
