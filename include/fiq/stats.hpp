// ==============================================================================
// fiq/stats.hpp - Сводная статистика по дереву
// ==============================================================================

#ifndef FIQ_STATS_HPP
#define FIQ_STATS_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fiq::stats {

/// Метка для файлов без расширения
constexpr const char* NO_EXTENSION_LABEL = "(no ext)";

/// Размер top-N по умолчанию
constexpr std::size_t DEFAULT_TOP_N = 10;

struct ExtensionStats {
    std::string extension;
    std::size_t count = 0;
    std::uint64_t total_size = 0;
};

struct FileEntry {
    std::string path;
    std::uint64_t size = 0;
};

struct StatsResult {
    std::size_t total_files = 0;
    std::uint64_t total_size = 0;
    std::vector<ExtensionStats> by_extension;  // по убыванию total_size
    std::vector<FileEntry> largest_files;      // не более top_n
};

/// Полный обход и агрегация
StatsResult run_stats(const std::filesystem::path& directory, std::size_t top_n, bool recursive);

}  // namespace fiq::stats

#endif  // FIQ_STATS_HPP
