// ==============================================================================
// test_duplicates_gtest.cpp - Тесты хешера, пула и поиска дубликатов (GoogleTest)
// ==============================================================================
//
// Тесты: TST-HASH-001..TST-HASH-004, TST-POOL-001..TST-POOL-002,
//        TST-DUP-001..TST-DUP-006
//
// ==============================================================================

#include "fiq/config.hpp"
#include "fiq/duplicates.hpp"
#include "fiq/hasher.hpp"
#include "fiq/parallel.hpp"
#include "fiq/platform.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace fiq::duplicates::test {

// ==============================================================================
// Test Fixture
// ==============================================================================

class DuplicatesTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name =
            std::string("fiq_dup_") + test_info->name() + "_" + std::to_string(getpid());
        test_dir_ = std::filesystem::canonical(std::filesystem::temp_directory_path()) / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
        config::install(config::Settings{});
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path create_file(const std::string& rel, const std::string& content) {
        auto p = test_dir_ / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream f(p, std::ios::binary);
        f << content;
        return p;
    }

    std::string abs(const std::string& rel) const {
        return platform::path_to_utf8(test_dir_ / rel);
    }
};

// ==============================================================================
// TST-HASH-001: Известные векторы SHA-256
// ==============================================================================

TEST(HasherTest, TST_HASH_001_KnownVectors) {
    EXPECT_EQ(hash::hash_bytes(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(hash::hash_bytes("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(hash::empty_fingerprint(), hash::hash_bytes(""));
    EXPECT_EQ(hash::empty_fingerprint().size(), hash::FINGERPRINT_HEX_LENGTH);
}

// ==============================================================================
// TST-HASH-002..004: Файлы
// ==============================================================================

TEST_F(DuplicatesTest, TST_HASH_002_SmallFileReadFully) {
    auto p = create_file("small.txt", "abc");
    auto h = hash::hash_file(p, 3);
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(*h, hash::hash_bytes("abc"));
}

TEST_F(DuplicatesTest, TST_HASH_003_LargeFileMapped) {
    std::string big(static_cast<std::size_t>(platform::MMAP_THRESHOLD) + 4097, 'q');
    big[100] = 'Z';
    auto p = create_file("big.bin", big);

    auto h = hash::hash_file(p, big.size());
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(*h, hash::hash_bytes(big));
}

TEST_F(DuplicatesTest, TST_HASH_004_EmptyAndMissing) {
    auto p = create_file("empty", "");
    EXPECT_EQ(hash::hash_file(p, 0), hash::empty_fingerprint());
    EXPECT_FALSE(hash::hash_file(test_dir_ / "missing", 10).has_value());
}

// ==============================================================================
// TST-POOL-001..002: Data-parallel пул
// ==============================================================================

TEST(ParallelTest, TST_POOL_001_VisitsEveryIndexOnce) {
    std::vector<std::atomic<int>> hits(1000);
    parallel::for_each_index(hits.size(), [&](std::size_t i) { hits[i].fetch_add(1); }, 8);
    for (const auto& h : hits) {
        EXPECT_EQ(h.load(), 1);
    }

    int calls = 0;
    parallel::for_each_index(0, [&](std::size_t) { ++calls; }, 4);
    EXPECT_EQ(calls, 0);
}

TEST(ParallelTest, TST_POOL_002_FirstExceptionPropagates) {
    EXPECT_THROW(parallel::for_each_index(
                     100,
                     [](std::size_t i) {
                         if (i == 42) {
                             throw std::runtime_error("boom");
                         }
                     },
                     4),
                 std::runtime_error);
}

// ==============================================================================
// TST-DUP-001: Базовое обнаружение дубликатов
// ==============================================================================

TEST_F(DuplicatesTest, TST_DUP_001_OneGroupOfTwo) {
    create_file("a", "duplicate content here");
    create_file("b", "duplicate content here");
    create_file("c", "unique content, different size");

    auto result = run_duplicates(test_dir_, 1, true);
    EXPECT_EQ(result.total_files_scanned, 3u);
    ASSERT_EQ(result.duplicate_groups.size(), 1u);

    const auto& g = result.duplicate_groups[0];
    EXPECT_EQ(g.size, 22u);
    EXPECT_EQ(g.hash, hash::hash_bytes("duplicate content here"));
    EXPECT_EQ(g.files, (std::vector<std::string>{abs("a"), abs("b")}));
    EXPECT_EQ(result.total_wasted_bytes, 22u);
}

// ==============================================================================
// TST-DUP-002: Одинаковый размер, разное содержимое
// ==============================================================================

TEST_F(DuplicatesTest, TST_DUP_002_SameSizeDifferentContent) {
    create_file("x", "aaaa");
    create_file("y", "bbbb");
    auto result = run_duplicates(test_dir_, 1, true);
    EXPECT_TRUE(result.duplicate_groups.empty());
    EXPECT_EQ(result.total_wasted_bytes, 0u);
}

// ==============================================================================
// TST-DUP-003: min_size
// ==============================================================================

TEST_F(DuplicatesTest, TST_DUP_003_MinSizeFilters) {
    create_file("a", "duplicate content here");
    create_file("b", "duplicate content here");
    create_file("e1", "");
    create_file("e2", "");

    auto high = run_duplicates(test_dir_, 999999, true);
    EXPECT_TRUE(high.duplicate_groups.empty());

    // min_size = 0 включает пустые файлы
    auto zero = run_duplicates(test_dir_, 0, true);
    ASSERT_EQ(zero.duplicate_groups.size(), 2u);
    bool found_empty = false;
    for (const auto& g : zero.duplicate_groups) {
        if (g.size == 0) {
            found_empty = true;
            EXPECT_EQ(g.hash, hash::empty_fingerprint());
            EXPECT_EQ(g.wasted_bytes(), 0u);
        }
    }
    EXPECT_TRUE(found_empty);
}

// ==============================================================================
// TST-DUP-004: Сортировка по освобождаемым байтам
// ==============================================================================

TEST_F(DuplicatesTest, TST_DUP_004_SortedByWastedBytes) {
    // 3 копии x 10 байт = 20 потерянных; 2 копии x 15 байт = 15 потерянных
    create_file("ten1", "0123456789");
    create_file("ten2", "0123456789");
    create_file("ten3", "0123456789");
    create_file("fifteen1", "abcdefghijklmno");
    create_file("fifteen2", "abcdefghijklmno");

    auto result = run_duplicates(test_dir_, 1, true);
    ASSERT_EQ(result.duplicate_groups.size(), 2u);
    EXPECT_EQ(result.duplicate_groups[0].size, 10u);
    EXPECT_EQ(result.duplicate_groups[0].files.size(), 3u);
    EXPECT_EQ(result.duplicate_groups[0].wasted_bytes(), 20u);
    EXPECT_EQ(result.duplicate_groups[1].wasted_bytes(), 15u);
    EXPECT_EQ(result.total_wasted_bytes, 35u);
}

// ==============================================================================
// TST-DUP-005: Рекурсия
// ==============================================================================

TEST_F(DuplicatesTest, TST_DUP_005_NestedAndNonRecursive) {
    create_file("top", "same bytes");
    create_file("sub/inner", "same bytes");

    auto recursive = run_duplicates(test_dir_, 1, true);
    ASSERT_EQ(recursive.duplicate_groups.size(), 1u);
    EXPECT_EQ(recursive.duplicate_groups[0].files,
              (std::vector<std::string>{abs("sub/inner"), abs("top")}));

    auto flat = run_duplicates(test_dir_, 1, false);
    EXPECT_EQ(flat.total_files_scanned, 1u);
    EXPECT_TRUE(flat.duplicate_groups.empty());
}

// ==============================================================================
// TST-DUP-006: Инварианты групп
// ==============================================================================

TEST_F(DuplicatesTest, TST_DUP_006_GroupsShareSizeAndHash) {
    for (int i = 0; i < 30; ++i) {
        create_file("f" + std::to_string(i), std::string(static_cast<std::size_t>(i % 4 + 1), 'k'));
    }
    auto result = run_duplicates(test_dir_, 1, true);
    ASSERT_EQ(result.duplicate_groups.size(), 4u);

    std::set<std::string> seen;
    for (const auto& g : result.duplicate_groups) {
        EXPECT_GE(g.files.size(), 2u);
        EXPECT_EQ(g.hash, hash::hash_bytes(std::string(g.size, 'k')));
        for (const auto& f : g.files) {
            EXPECT_EQ(std::filesystem::file_size(f), g.size);
            EXPECT_TRUE(seen.insert(f).second) << f;
        }
    }
    EXPECT_EQ(seen.size(), 30u);
}

TEST_F(DuplicatesTest, TST_DUP_006_MissingDirectoryEmpty) {
    auto result = run_duplicates(test_dir_ / "nope", 1, true);
    EXPECT_EQ(result.total_files_scanned, 0u);
    EXPECT_TRUE(result.duplicate_groups.empty());
}

}  // namespace fiq::duplicates::test
