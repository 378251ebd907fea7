// ==============================================================================
// fiq/duplicates.hpp - Поиск файлов-дубликатов
// ==============================================================================
//
// Два прохода:
// 1. Размер: полный обход, файлы < min_size отбрасываются, группировка по
//    точному размеру, одиночки отбрасываются
// 2. Хеш: кандидаты хешируются параллельно, группировка по отпечатку,
//    одиночки отбрасываются
//
// Группы упорядочены по убыванию size * (count - 1), при равенстве по hash.
//
// ==============================================================================

#ifndef FIQ_DUPLICATES_HPP
#define FIQ_DUPLICATES_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fiq::duplicates {

struct DuplicateGroup {
    std::string hash;
    std::uint64_t size = 0;
    std::vector<std::string> files;  // отсортированы, не менее двух

    /// Байты, освобождаемые удалением всех копий кроме одной
    std::uint64_t wasted_bytes() const {
        return files.empty() ? 0 : size * static_cast<std::uint64_t>(files.size() - 1);
    }
};

struct DuplicatesResult {
    std::size_t total_files_scanned = 0;
    std::vector<DuplicateGroup> duplicate_groups;
    std::uint64_t total_wasted_bytes = 0;
};

/// Найти дубликаты в дереве
DuplicatesResult run_duplicates(const std::filesystem::path& directory, std::uint64_t min_size,
                                bool recursive);

}  // namespace fiq::duplicates

#endif  // FIQ_DUPLICATES_HPP
