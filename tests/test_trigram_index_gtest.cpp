// ==============================================================================
// test_trigram_index_gtest.cpp - Тесты триграммного индекса (GoogleTest)
// ==============================================================================
//
// Тесты: TST-TRI-001..TST-TRI-013
//
// ==============================================================================

#include "fiq/config.hpp"
#include "fiq/glob.hpp"
#include "fiq/trigram_index.hpp"
#include "fiq/walker.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <unistd.h>
#include <vector>

namespace fiq::index::test {

// ==============================================================================
// Test Fixture: временное дерево + изолированный каталог кэша
// ==============================================================================

class TrigramIndexTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;
    std::filesystem::path cache_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("fiq_trigram_") + test_info->name() + "_" +
                                  std::to_string(getpid());

        auto base = std::filesystem::canonical(std::filesystem::temp_directory_path());
        test_dir_ = base / unique_name / "tree";
        cache_dir_ = base / unique_name / "cache";

        std::error_code ec;
        std::filesystem::remove_all(test_dir_.parent_path(), ec);
        std::filesystem::create_directories(test_dir_);

        config::Settings settings;
        settings.cache_dir = cache_dir_;
        config::install(settings);
    }

    void TearDown() override {
        config::install(config::Settings{});
        std::error_code ec;
        std::filesystem::remove_all(test_dir_.parent_path(), ec);
    }

    void create_file(const std::string& rel, const std::string& content = "x") {
        auto p = test_dir_ / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream f(p, std::ios::binary);
        f << content;
    }

    std::set<std::string> as_relative(const std::vector<std::filesystem::path>& paths) const {
        std::set<std::string> out;
        for (const auto& p : paths) {
            out.insert(p.lexically_relative(test_dir_).generic_string());
        }
        return out;
    }

    /// Эталон: полный обход + glob по basename
    std::set<std::string> full_walk_then_glob(const std::string& pattern) const {
        std::set<std::string> out;
        auto matcher = glob::GlobMatcher::compile(pattern);
        if (!matcher) {
            return out;
        }
        for (const auto& r : io::walk(test_dir_, true, io::ScanMode::full())) {
            if (matcher->is_match(r.path.filename().string())) {
                out.insert(r.path.lexically_relative(test_dir_).generic_string());
            }
        }
        return out;
    }
};

// ==============================================================================
// TST-TRI-001: Базовый запрос по расширению
// ==============================================================================

TEST_F(TrigramIndexTest, TST_TRI_001_BasicExtensionQuery) {
    create_file("hello.rs");
    create_file("world.rs");
    create_file("readme.md");
    create_file("test.txt");

    auto idx = TrigramIndex::build(test_dir_);
    EXPECT_EQ(idx.total_files(), 4u);

    auto rs = idx.query("*.rs");
    ASSERT_TRUE(rs.has_value());
    EXPECT_EQ(as_relative(*rs), (std::set<std::string>{"hello.rs", "world.rs"}));

    auto xyz = idx.query("*.xyz");
    ASSERT_TRUE(xyz.has_value());
    EXPECT_TRUE(xyz->empty());

    // Паттерн без триграмм непригоден для индекса
    EXPECT_FALSE(idx.query("*.c").has_value());
    EXPECT_FALSE(idx.query("*").has_value());
}

// ==============================================================================
// TST-TRI-002: Вложенные каталоги
// ==============================================================================

TEST_F(TrigramIndexTest, TST_TRI_002_NestedPaths) {
    create_file("src/main.rs");
    create_file("src/lib.rs");
    create_file("Cargo.toml");

    auto idx = TrigramIndex::build(test_dir_);
    auto rs = idx.query("*.rs");
    ASSERT_TRUE(rs.has_value());
    EXPECT_EQ(as_relative(*rs), (std::set<std::string>{"src/main.rs", "src/lib.rs"}));

    for (const auto& p : *rs) {
        EXPECT_TRUE(std::filesystem::exists(p)) << p;
    }
}

// ==============================================================================
// TST-TRI-003: Сохранение и загрузка из кэша
// ==============================================================================

TEST_F(TrigramIndexTest, TST_TRI_003_CacheRoundTrip) {
    create_file("file.rs");

    auto idx = TrigramIndex::build(test_dir_);
    ASSERT_TRUE(idx.save_to_cache());

    auto path = TrigramIndex::cache_path(test_dir_);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->parent_path(), cache_dir_);
    EXPECT_EQ(path->extension(), ".idx");
    EXPECT_TRUE(std::filesystem::exists(*path));

    auto loaded = TrigramIndex::load_cached(test_dir_);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->total_files(), 1u);
    EXPECT_EQ(loaded->root(), test_dir_);
    EXPECT_EQ(*loaded, idx);

    auto rs = loaded->query("*.rs");
    ASSERT_TRUE(rs.has_value());
    ASSERT_EQ(rs->size(), 1u);
    EXPECT_EQ((*rs)[0], test_dir_ / "file.rs");
}

TEST_F(TrigramIndexTest, TST_TRI_003_SerializeDeserializeEqual) {
    create_file("alpha.cpp");
    create_file("beta/gamma.hpp");
    create_file("beta/delta/EPSILON.TXT");
    create_file("ab");

    auto idx = TrigramIndex::build(test_dir_);
    auto restored = TrigramIndex::deserialize(idx.serialize());
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, idx);
    EXPECT_EQ(restored->built_at(), idx.built_at());
    EXPECT_EQ(restored->trigram_count(), idx.trigram_count());
}

// ==============================================================================
// TST-TRI-004: Порча файла кэша
// ==============================================================================

TEST_F(TrigramIndexTest, TST_TRI_004_CorruptBytesRejected) {
    create_file("hello.rs");
    create_file("world.rs");
    auto bytes = TrigramIndex::build(test_dir_).serialize();

    EXPECT_FALSE(TrigramIndex::deserialize("").has_value());
    EXPECT_FALSE(TrigramIndex::deserialize("not an index").has_value());

    // Неверная магия
    std::string bad_magic = bytes;
    bad_magic[0] = 'X';
    EXPECT_FALSE(TrigramIndex::deserialize(bad_magic).has_value());

    // Неизвестная версия
    std::string bad_version = bytes;
    bad_version[8] = static_cast<char>(0x7F);
    EXPECT_FALSE(TrigramIndex::deserialize(bad_version).has_value());

    // Обрезанный файл
    for (std::size_t len : {std::size_t{12}, bytes.size() / 2, bytes.size() - 1}) {
        EXPECT_FALSE(TrigramIndex::deserialize(std::string_view(bytes).substr(0, len)).has_value())
            << "length " << len;
    }

    // Лишние байты в конце
    EXPECT_FALSE(TrigramIndex::deserialize(bytes + "junk").has_value());
}

TEST_F(TrigramIndexTest, TST_TRI_004_CorruptCacheFileFallsThrough) {
    create_file("hello.rs");
    auto path = TrigramIndex::cache_path(test_dir_);
    ASSERT_TRUE(path.has_value());
    std::filesystem::create_directories(path->parent_path());
    {
        std::ofstream f(*path, std::ios::binary);
        f << "garbage garbage garbage";
    }
    EXPECT_FALSE(TrigramIndex::load_cached(test_dir_).has_value());
}

// ==============================================================================
// TST-TRI-005: Свежесть по mtime корня
// ==============================================================================

TEST_F(TrigramIndexTest, TST_TRI_005_FreshAfterBuild) {
    create_file("a.rs");
    auto idx = TrigramIndex::build(test_dir_);
    EXPECT_TRUE(idx.is_fresh());
}

TEST_F(TrigramIndexTest, TST_TRI_005_StaleAfterRootTouched) {
    create_file("a.rs");
    auto idx = TrigramIndex::build(test_dir_);
    ASSERT_TRUE(idx.save_to_cache());

    auto mtime = std::filesystem::last_write_time(test_dir_);
    std::filesystem::last_write_time(test_dir_, mtime + std::chrono::hours(1));

    EXPECT_FALSE(idx.is_fresh());
    EXPECT_FALSE(TrigramIndex::load_cached(test_dir_).has_value());
}

TEST_F(TrigramIndexTest, TST_TRI_005_MissingRootIsNotFresh) {
    create_file("a.rs");
    auto idx = TrigramIndex::build(test_dir_);
    std::filesystem::remove_all(test_dir_);
    EXPECT_FALSE(idx.is_fresh());
}

TEST_F(TrigramIndexTest, TST_TRI_005_RootMismatchRejected) {
    create_file("a.rs");
    auto idx = TrigramIndex::build(test_dir_);
    ASSERT_TRUE(idx.save_to_cache());

    // Подменяем файл кэша другого корня содержимым нашего индекса
    auto other = test_dir_.parent_path() / "other";
    std::filesystem::create_directories(other);
    auto other_path = TrigramIndex::cache_path(other);
    ASSERT_TRUE(other_path.has_value());
    std::filesystem::copy_file(*TrigramIndex::cache_path(test_dir_), *other_path,
                               std::filesystem::copy_options::overwrite_existing);

    EXPECT_FALSE(TrigramIndex::load_cached(other).has_value());
}

// ==============================================================================
// TST-TRI-006: Инварианты posting-листов
// ==============================================================================

TEST_F(TrigramIndexTest, TST_TRI_006_PostingListsStrictlyIncreasing) {
    for (int i = 0; i < 40; ++i) {
        create_file("dir" + std::to_string(i % 5) + "/file_" + std::to_string(i) + ".dat");
    }
    create_file("aaaaaa");  // повторяющиеся триграммы в одном имени

    auto idx = TrigramIndex::build(test_dir_);
    ASSERT_EQ(idx.total_files(), 41u);

    for (const auto& [key, list] : idx.trigrams()) {
        EXPECT_LE(key, 0xFFFFFFu);
        ASSERT_FALSE(list.empty());
        for (std::size_t i = 0; i < list.size(); ++i) {
            EXPECT_LT(list[i], idx.total_files());
            if (i > 0) {
                EXPECT_LT(list[i - 1], list[i]);
            }
        }
    }

    const auto* aaa = idx.postings(pack_trigram('a', 'a', 'a'));
    ASSERT_NE(aaa, nullptr);
    EXPECT_EQ(aaa->size(), 1u);
    EXPECT_EQ(idx.postings(pack_trigram('z', 'z', 'z')), nullptr);
}

// ==============================================================================
// TST-TRI-007: Запрос совпадает с полным обходом
// ==============================================================================

TEST_F(TrigramIndexTest, TST_TRI_007_QueryEqualsFullWalk) {
    create_file("main.rs");
    create_file("Main.RS");
    create_file("src/lib.rs");
    create_file("src/lib.rs.bak");
    create_file("docs/readme.md");
    create_file("docs/README.md");
    create_file("test_walker.cpp");
    create_file("tests/test_index.cpp");
    create_file("build/test.o");

    for (const char* pattern : {"*.rs", "*.md", "test_*.cpp", "*lib*", "README.*", "*.{rs,md}",
                                "mai?.rs", "*[0-9]*.cpp"}) {
        auto idx = TrigramIndex::build(test_dir_);
        auto result = idx.query(pattern);
        if (!result) {
            continue;  // непригодный паттерн: вызывающий делает полный обход
        }
        EXPECT_EQ(as_relative(*result), full_walk_then_glob(pattern)) << pattern;
    }
}

TEST_F(TrigramIndexTest, TST_TRI_007_CaseInsensitiveCandidatesCaseSensitiveMatch) {
    create_file("Main.RS");
    create_file("main.rs");

    auto idx = TrigramIndex::build(test_dir_);
    auto result = idx.query("*.rs");
    ASSERT_TRUE(result.has_value());
    // Триграммы lowercase, проверка glob регистрозависимая
    EXPECT_EQ(as_relative(*result), (std::set<std::string>{"main.rs"}));
}

// ==============================================================================
// TST-TRI-008: Пустое дерево
// ==============================================================================

TEST_F(TrigramIndexTest, TST_TRI_008_EmptyTree) {
    auto idx = TrigramIndex::build(test_dir_);
    EXPECT_EQ(idx.total_files(), 0u);
    EXPECT_EQ(idx.trigram_count(), 0u);

    auto result = idx.query("*.rs");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());

    auto restored = TrigramIndex::deserialize(idx.serialize());
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, idx);
}

TEST_F(TrigramIndexTest, TST_TRI_008_NonexistentRootBuildsEmpty) {
    auto idx = TrigramIndex::build(test_dir_ / "missing");
    EXPECT_EQ(idx.total_files(), 0u);
}

// ==============================================================================
// TST-TRI-009: Извлечение триграмм из glob
// ==============================================================================

TEST(TrigramExtractTest, TST_TRI_009_LiteralRuns) {
    auto t = extract_trigrams_from_glob("*.rs");
    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t[0], pack_trigram('.', 'r', 's'));

    EXPECT_TRUE(extract_trigrams_from_glob("*").empty());
    EXPECT_TRUE(extract_trigrams_from_glob("*.c").empty());
    EXPECT_TRUE(extract_trigrams_from_glob("a*b*c").empty());
}

TEST(TrigramExtractTest, TST_TRI_009_LowercasedAndDeduplicated) {
    auto t = extract_trigrams_from_glob("ABAB*abab");
    // "abab" -> aba, bab; второй участок ничего нового не добавляет
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[0], pack_trigram('a', 'b', 'a'));
    EXPECT_EQ(t[1], pack_trigram('b', 'a', 'b'));
}

TEST(TrigramExtractTest, TST_TRI_009_ClassesAndAlternativesAreNotLiteral) {
    // Содержимое {..} и [..] не литерал
    auto braces = extract_trigrams_from_glob("*.{rs,toml}");
    EXPECT_TRUE(braces.empty());

    auto cls = extract_trigrams_from_glob("[abc]def");
    ASSERT_EQ(cls.size(), 1u);
    EXPECT_EQ(cls[0], pack_trigram('d', 'e', 'f'));
}

TEST(TrigramExtractTest, TST_TRI_009_WindowsOverlap) {
    auto t = extract_trigrams_from_glob("main");
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[0], pack_trigram('m', 'a', 'i'));
    EXPECT_EQ(t[1], pack_trigram('a', 'i', 'n'));
}

// ==============================================================================
// TST-TRI-010: Пересечение отсортированных списков
// ==============================================================================

TEST(IntersectSortedTest, TST_TRI_010_MergeJoin) {
    EXPECT_EQ(intersect_sorted({1, 3, 5, 7, 9}, {2, 3, 4, 7, 10}), (PostingList{3, 7}));
    EXPECT_EQ(intersect_sorted({}, {1, 2}), PostingList{});
    EXPECT_EQ(intersect_sorted({1, 2, 3}, {1, 2, 3}), (PostingList{1, 2, 3}));
    EXPECT_EQ(intersect_sorted({1, 2}, {3, 4}), PostingList{});
}

// ==============================================================================
// TST-TRI-011: FNV-1a и имя файла кэша
// ==============================================================================

TEST(Fnv1aTest, TST_TRI_011_KnownVectors) {
    EXPECT_EQ(fnv1a_64(""), 0xcbf29ce484222325ULL);
    EXPECT_EQ(fnv1a_64("a"), 0xaf63dc4c8601ec8cULL);
    EXPECT_EQ(fnv1a_64("foobar"), 0x85944171f73967e8ULL);
}

TEST_F(TrigramIndexTest, TST_TRI_011_CachePathIsStableHex) {
    auto a = TrigramIndex::cache_path(test_dir_);
    auto b = TrigramIndex::cache_path(test_dir_);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, *b);

    std::string stem = a->stem().string();
    EXPECT_EQ(stem.size(), 16u);
    EXPECT_TRUE(std::all_of(stem.begin(), stem.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    }));

    auto other = TrigramIndex::cache_path(test_dir_ / "sub");
    ASSERT_TRUE(other.has_value());
    EXPECT_NE(*a, *other);
}

// ==============================================================================
// TST-TRI-012: Относительные пути
// ==============================================================================

TEST_F(TrigramIndexTest, TST_TRI_012_RelativePathsStored) {
    create_file("one/two/three.txt");
    auto idx = TrigramIndex::build(test_dir_);
    ASSERT_EQ(idx.total_files(), 1u);
    EXPECT_EQ(idx.relative_path(0), "one/two/three.txt");
}

// ==============================================================================
// TST-TRI-013: Предельная длина пути
// ==============================================================================

namespace {

void append_u16(std::string& out, std::uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void append_u32(std::string& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

void append_u64(std::string& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

/// Файл кэша с одним путём path_data и слотом {0, slot_length}
std::string single_path_index(const std::string& root, const std::string& path_data,
                              std::uint16_t slot_length, const std::vector<Trigram>& keys) {
    std::string out("FIQTRIX", 8);
    append_u32(out, INDEX_FORMAT_VERSION);
    append_u32(out, static_cast<std::uint32_t>(root.size()));
    out += root;
    append_u64(out, 0);
    append_u32(out, 1);  // total_files
    append_u32(out, 0);  // offset
    append_u16(out, slot_length);
    append_u32(out, static_cast<std::uint32_t>(path_data.size()));
    out += path_data;
    append_u32(out, static_cast<std::uint32_t>(keys.size()));
    for (Trigram key : keys) {
        append_u32(out, key);
        append_u32(out, 1);
        append_u32(out, 0);
    }
    return out;
}

}  // namespace

TEST(TrigramPathLimitTest, TST_TRI_013_ClampRelativePath) {
    std::string short_path = "a/b/c.txt";
    EXPECT_EQ(clamp_relative_path(short_path), short_path);

    std::string exact(MAX_INDEXED_PATH_LENGTH, 'p');
    EXPECT_EQ(clamp_relative_path(exact).size(), MAX_INDEXED_PATH_LENGTH);

    std::string longer(MAX_INDEXED_PATH_LENGTH + 4465, 'p');
    auto clamped = clamp_relative_path(longer);
    EXPECT_EQ(clamped.size(), MAX_INDEXED_PATH_LENGTH);
    EXPECT_EQ(clamped.data(), longer.data());

    // "é" (2 байта) на границе: символ целиком отбрасывается
    std::string split(MAX_INDEXED_PATH_LENGTH - 1, 'p');
    split += "\xC3\xA9tail";
    auto cut = clamp_relative_path(split);
    EXPECT_EQ(cut.size(), MAX_INDEXED_PATH_LENGTH - 1);
    EXPECT_EQ(cut.back(), 'p');
}

TEST(TrigramPathLimitTest, TST_TRI_013_MaxLengthSlotDeserializes) {
    const std::string suffix = "long.rs";
    std::string rel = "deep/";
    rel += std::string(MAX_INDEXED_PATH_LENGTH - rel.size() - suffix.size(), 'q');
    rel += suffix;
    ASSERT_EQ(rel.size(), MAX_INDEXED_PATH_LENGTH);

    auto keys = extract_trigrams_from_glob("*long.rs");
    ASSERT_FALSE(keys.empty());
    std::sort(keys.begin(), keys.end());

    auto bytes = single_path_index("/r", rel, static_cast<std::uint16_t>(MAX_INDEXED_PATH_LENGTH),
                                   keys);
    auto idx = TrigramIndex::deserialize(bytes);
    ASSERT_TRUE(idx.has_value());
    EXPECT_EQ(idx->total_files(), 1u);
    EXPECT_EQ(idx->relative_path(0).size(), MAX_INDEXED_PATH_LENGTH);
    EXPECT_EQ(idx->relative_path(0), rel);

    auto found = idx->query("*long.rs");
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(found->size(), 1u);
    EXPECT_EQ((*found)[0], std::filesystem::path("/r") / rel);

    // Повторная сериализация даёт те же байты
    EXPECT_EQ(idx->serialize(), bytes);
}

TEST(TrigramPathLimitTest, TST_TRI_013_SlotBeyondPathDataRejected) {
    std::string rel(100, 'z');
    auto bytes = single_path_index("/r", rel, 101, {});
    EXPECT_FALSE(TrigramIndex::deserialize(bytes).has_value());

    // Слот короче данных допустим: путь усечён до длины слота
    auto shorter = TrigramIndex::deserialize(single_path_index("/r", rel, 40, {}));
    ASSERT_TRUE(shorter.has_value());
    EXPECT_EQ(shorter->relative_path(0), std::string(40, 'z'));
}

}  // namespace fiq::index::test
