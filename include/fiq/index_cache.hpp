// ==============================================================================
// fiq/index_cache.hpp - Двухуровневый кэш триграммных индексов
// ==============================================================================
//
// Уровни:
// - память процесса: map<canonical root, shared_ptr<const TrigramIndex>>
//   под одним мьютексом, создаётся лениво (долгоживущий режим)
// - диск: <cache-dir>/<16 hex>.idx, доступен всегда
//
// Порядок поиска с памятью: память (только свежий) -> диск -> build.
// Без памяти: диск -> build.
// build выполняется вне мьютекса; при гонке последний записавший побеждает.
//
// ==============================================================================

#ifndef FIQ_INDEX_CACHE_HPP
#define FIQ_INDEX_CACHE_HPP

#include "fiq/search.hpp"
#include "fiq/trigram_index.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace fiq::index {

using IndexPtr = std::shared_ptr<const TrigramIndex>;

/// Канонический путь корня; сам путь если canonical() не удался
std::filesystem::path canonical_root(const std::filesystem::path& root);

/// Найти или построить индекс для root
IndexPtr get_or_build_index(const std::filesystem::path& root, bool use_memory_cache);

/// Построить заново в обход всех кэшей, записать на диск и
/// заменить запись в памяти (если use_memory_cache)
IndexPtr build_index(const std::filesystem::path& root, bool use_memory_cache);

/// Поиск только по имени через индекс.
/// nullopt - индекс неприменим (нерекурсивный поиск или паттерн без триграмм).
/// Размеры в результате 0, files_scanned = total_files индекса.
std::optional<search::SearchResult> try_indexed_search(const std::filesystem::path& dir,
                                                       std::string_view name_pattern,
                                                       bool recursive, bool use_memory_cache);

/// Число индексов в памяти процесса
std::size_t memory_cache_size();

/// Очистить память процесса
void clear_memory_cache();

}  // namespace fiq::index

#endif  // FIQ_INDEX_CACHE_HPP
