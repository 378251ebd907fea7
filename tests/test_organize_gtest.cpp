// ==============================================================================
// test_organize_gtest.cpp - Тесты раскладки файлов по категориям (GoogleTest)
// ==============================================================================
//
// Тесты: TST-ORG-001..TST-ORG-009
//
// ==============================================================================

#include "fiq/config.hpp"
#include "fiq/organize.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <set>
#include <string>
#include <unistd.h>

namespace fiq::organize::test {

// ==============================================================================
// Test Fixture
// ==============================================================================

class OrganizeTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name =
            std::string("fiq_organize_") + test_info->name() + "_" + std::to_string(getpid());
        test_dir_ = std::filesystem::canonical(std::filesystem::temp_directory_path()) / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_ / "in");
        config::install(config::Settings{});
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path in() const { return test_dir_ / "in"; }

    void create_file(const std::string& rel, const std::string& content = "data") {
        auto p = in() / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream f(p, std::ios::binary);
        f << content;
    }

    std::string read(const std::filesystem::path& p) const {
        std::ifstream f(p, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }

    OrganizeParams params(ConflictMode mode = ConflictMode::Rename, bool dry_run = false) const {
        OrganizeParams p;
        p.directory = in();
        p.by = Strategy::Type;
        p.mode = mode;
        p.dry_run = dry_run;
        return p;
    }

    std::set<std::string> destinations(const OrganizeResult& r) const {
        std::set<std::string> out;
        for (const auto& m : r.moves) {
            out.insert(std::filesystem::path(m.to).lexically_relative(in()).generic_string());
        }
        return out;
    }
};

// ==============================================================================
// TST-ORG-001: Категории по типу
// ==============================================================================

TEST(CategorizeTest, TST_ORG_001_ByType) {
    EXPECT_STREQ(categorize_by_type("jpg"), "Images");
    EXPECT_STREQ(categorize_by_type("mkv"), "Videos");
    EXPECT_STREQ(categorize_by_type("flac"), "Audio");
    EXPECT_STREQ(categorize_by_type("pdf"), "Documents");
    EXPECT_STREQ(categorize_by_type("md"), "Documents");
    EXPECT_STREQ(categorize_by_type("7z"), "Archives");
    EXPECT_STREQ(categorize_by_type("rs"), "Code");
    EXPECT_STREQ(categorize_by_type("json"), "Code");
    EXPECT_STREQ(categorize_by_type("deb"), "Executables");
    EXPECT_STREQ(categorize_by_type("woff2"), "Fonts");
    EXPECT_STREQ(categorize_by_type("qcow2"), "DiskImages");
    EXPECT_STREQ(categorize_by_type("unknownext"), "Other");
    EXPECT_STREQ(categorize_by_type(""), "Other");
}

// ==============================================================================
// TST-ORG-002: Категории по размеру и дате
// ==============================================================================

TEST(CategorizeTest, TST_ORG_002_BySize) {
    EXPECT_STREQ(categorize_by_size(0), "Empty");
    EXPECT_STREQ(categorize_by_size(999), "Tiny (< 1KB)");
    EXPECT_STREQ(categorize_by_size(1000), "Small (1KB-1MB)");
    EXPECT_STREQ(categorize_by_size(1000000), "Medium (1MB-100MB)");
    EXPECT_STREQ(categorize_by_size(100000000), "Large (100MB-1GB)");
    EXPECT_STREQ(categorize_by_size(1000000000), "Huge (> 1GB)");
}

TEST(CategorizeTest, TST_ORG_002_ByDate) {
    EXPECT_EQ(categorize_by_date(std::nullopt), "Unknown");

    // 2024-06-15 12:00 UTC: тот же месяц в любом часовом поясе
    auto mid_june = platform::TimePoint(std::chrono::duration_cast<platform::Clock::duration>(
        std::chrono::seconds(1718452800)));
    EXPECT_EQ(categorize_by_date(mid_june), "2024/06");
}

// ==============================================================================
// TST-ORG-003: Разбор стратегии и режима
// ==============================================================================

TEST(CategorizeTest, TST_ORG_003_ParseOptions) {
    EXPECT_EQ(parse_strategy("type"), std::optional<Strategy>(Strategy::Type));
    EXPECT_EQ(parse_strategy("date"), std::optional<Strategy>(Strategy::Date));
    EXPECT_EQ(parse_strategy("size"), std::optional<Strategy>(Strategy::Size));
    EXPECT_FALSE(parse_strategy("color").has_value());
    EXPECT_FALSE(parse_strategy("TYPE").has_value());

    EXPECT_EQ(parse_conflict_mode("skip"), std::optional<ConflictMode>(ConflictMode::Skip));
    EXPECT_EQ(parse_conflict_mode("rename"), std::optional<ConflictMode>(ConflictMode::Rename));
    EXPECT_EQ(parse_conflict_mode("overwrite"),
              std::optional<ConflictMode>(ConflictMode::Overwrite));
    EXPECT_FALSE(parse_conflict_mode("merge").has_value());

    EXPECT_STREQ(strategy_name(Strategy::Date), "date");
    EXPECT_STREQ(conflict_mode_name(ConflictMode::Skip), "skip");
}

// ==============================================================================
// TST-ORG-004: Dry-run ничего не меняет
// ==============================================================================

TEST_F(OrganizeTest, TST_ORG_004_DryRunPlansOnly) {
    create_file("a.txt");
    create_file("b.jpg");
    create_file("c");

    auto result = run_organize(params(ConflictMode::Rename, true));
    EXPECT_TRUE(result.dry_run);
    EXPECT_EQ(result.total_files, 3u);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(destinations(result),
              (std::set<std::string>{"Documents/a.txt", "Images/b.jpg", "Other/c"}));

    EXPECT_TRUE(std::filesystem::exists(in() / "a.txt"));
    EXPECT_FALSE(std::filesystem::exists(in() / "Documents"));
}

TEST_F(OrganizeTest, TST_ORG_004_DryRunSimulatesRenames) {
    create_file("x/report.txt");
    create_file("y/report.txt");
    create_file("z/report.txt");

    auto result = run_organize(params(ConflictMode::Rename, true));
    ASSERT_EQ(result.moves.size(), 3u);
    EXPECT_EQ(destinations(result),
              (std::set<std::string>{"Documents/report.txt", "Documents/report_1.txt",
                                     "Documents/report_2.txt"}));
}

// ==============================================================================
// TST-ORG-005: Реальное перемещение
// ==============================================================================

TEST_F(OrganizeTest, TST_ORG_005_MovesFiles) {
    create_file("a.txt", "text");
    create_file("nested/song.mp3", "audio");

    auto result = run_organize(params());
    EXPECT_FALSE(result.dry_run);
    EXPECT_TRUE(result.errors.empty());
    ASSERT_EQ(result.moves.size(), 2u);

    EXPECT_FALSE(std::filesystem::exists(in() / "a.txt"));
    EXPECT_EQ(read(in() / "Documents" / "a.txt"), "text");
    EXPECT_EQ(read(in() / "Audio" / "song.mp3"), "audio");

    for (const auto& m : result.moves) {
        if (m.to == (in() / "Documents" / "a.txt").string()) {
            EXPECT_EQ(m.size, 4u);
            EXPECT_EQ(m.from, (in() / "a.txt").string());
        }
    }
}

TEST_F(OrganizeTest, TST_ORG_005_AlreadyInPlaceUntouched) {
    create_file("Documents/a.txt", "kept");
    auto result = run_organize(params());
    EXPECT_TRUE(result.moves.empty());
    EXPECT_EQ(read(in() / "Documents" / "a.txt"), "kept");
}

// ==============================================================================
// TST-ORG-006: Конфликт - skip
// ==============================================================================

TEST_F(OrganizeTest, TST_ORG_006_SkipLeavesSource) {
    create_file("Documents/a.txt", "existing");
    create_file("a.txt", "incoming");

    auto result = run_organize(params(ConflictMode::Skip));
    EXPECT_TRUE(result.moves.empty());
    EXPECT_EQ(read(in() / "a.txt"), "incoming");
    EXPECT_EQ(read(in() / "Documents" / "a.txt"), "existing");
}

// ==============================================================================
// TST-ORG-007: Конфликт - rename
// ==============================================================================

TEST_F(OrganizeTest, TST_ORG_007_RenameFindsFreeSuffix) {
    create_file("Documents/a.txt", "existing");
    create_file("Documents/a_1.txt", "existing too");
    create_file("a.txt", "incoming");

    auto result = run_organize(params(ConflictMode::Rename));
    ASSERT_EQ(result.moves.size(), 1u);
    EXPECT_EQ(result.moves[0].to, (in() / "Documents" / "a_2.txt").string());
    EXPECT_EQ(read(in() / "Documents" / "a_2.txt"), "incoming");
    EXPECT_EQ(read(in() / "Documents" / "a.txt"), "existing");
}

// ==============================================================================
// TST-ORG-008: Конфликт - overwrite
// ==============================================================================

TEST_F(OrganizeTest, TST_ORG_008_OverwriteReplaces) {
    create_file("Documents/a.txt", "existing");
    create_file("a.txt", "incoming");

    auto result = run_organize(params(ConflictMode::Overwrite));
    ASSERT_EQ(result.moves.size(), 1u);
    EXPECT_EQ(read(in() / "Documents" / "a.txt"), "incoming");
    EXPECT_FALSE(std::filesystem::exists(in() / "a.txt"));
}

// ==============================================================================
// TST-ORG-009: Отдельный каталог назначения и стратегия size
// ==============================================================================

TEST_F(OrganizeTest, TST_ORG_009_OutputDirectoryAndSizeStrategy) {
    create_file("empty.dat", "");
    create_file("small.dat", std::string(2000, 's'));

    auto p = params();
    p.by = Strategy::Size;
    p.output = test_dir_ / "out";
    auto result = run_organize(p);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "out" / "Empty" / "empty.dat"));
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "out" / "Small (1KB-1MB)" / "small.dat"));
    EXPECT_TRUE(std::filesystem::is_empty(in()));
}

TEST_F(OrganizeTest, TST_ORG_009_NonRecursiveIgnoresNested) {
    create_file("top.png");
    create_file("deep/inner.png");

    auto p = params(ConflictMode::Rename, true);
    p.recursive = false;
    auto result = run_organize(p);
    EXPECT_EQ(result.total_files, 1u);
    EXPECT_EQ(destinations(result), (std::set<std::string>{"Images/top.png"}));
}

}  // namespace fiq::organize::test
