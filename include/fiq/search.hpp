// ==============================================================================
// fiq/search.hpp - Поиск по имени, размеру, дате и содержимому
// ==============================================================================
//
// Назначение:
// - Разбор пользовательских фильтров размера и времени
// - Планировщик: индексный путь или обход (NamesOnly / Filtered)
// - Цепочка фильтров size -> date -> content
// - Параллельный поиск подстроки в содержимом
//
// Нераспознанный фильтр игнорируется, ошибкой не считается.
//
// ==============================================================================

#ifndef FIQ_SEARCH_HPP
#define FIQ_SEARCH_HPP

#include "fiq/platform.hpp"
#include "fiq/walker.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fiq::search {

/// Максимум совпадений по содержимому на файл
constexpr std::size_t MAX_CONTENT_MATCHES = 10;

/// Максимальная длина строки совпадения в байтах (до "...")
constexpr std::size_t MAX_MATCH_LINE_BYTES = 200;

// ----------------------------------------------------------------------------
// Результаты
// ----------------------------------------------------------------------------

struct ContentMatch {
    std::size_t line_number = 0;  // с 1
    std::string line;
};

struct SearchMatch {
    std::string path;
    std::uint64_t size = 0;
    std::optional<std::vector<ContentMatch>> content_matches;
};

struct SearchResult {
    std::vector<SearchMatch> matches;
    std::size_t total_matches = 0;
    std::size_t files_scanned = 0;
};

// ----------------------------------------------------------------------------
// Параметры и план
// ----------------------------------------------------------------------------

struct SearchParams {
    std::filesystem::path directory;
    std::optional<std::string> name_pattern;
    std::optional<std::string> content_query;
    std::optional<std::string> min_size;
    std::optional<std::string> max_size;
    std::optional<std::string> newer;
    std::optional<std::string> older;
    bool recursive = true;
};

/// Выбранный путь исполнения
enum class SearchPath {
    Indexed,    // триграммный индекс
    NamesOnly,  // обход без stat
    Filtered    // обход со stat выживших
};

/// Разобранные фильтры и выбранный путь
struct SearchPlan {
    SearchPath path = SearchPath::Filtered;
    std::optional<std::string> name_pattern;  // только корректный glob
    std::optional<std::string> content_query;
    std::optional<std::uint64_t> min_size;
    std::optional<std::uint64_t> max_size;
    std::optional<platform::TimePoint> newer;
    std::optional<platform::TimePoint> older;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// "1KB" -> 1000, "1.5GB" -> 1500000000, "42" -> 42. Степени 1000,
/// суффиксы B/KB/MB/GB без учёта регистра. nullopt если не разобрать.
std::optional<std::uint64_t> parse_size(std::string_view s);

/// "YYYY-MM-DD" (полночь UTC) или "Nd" / "Nh" / "Nm" (now минус N).
/// nullopt если не разобрать.
std::optional<platform::TimePoint> parse_time(std::string_view s);

/// То же с явным "сейчас"
std::optional<platform::TimePoint> parse_time(std::string_view s, platform::TimePoint now);

/// Разобрать фильтры и выбрать путь исполнения
SearchPlan plan_search(const SearchParams& params);

/// Выполнить поиск.
/// @param use_memory_cache true = индексный путь использует память процесса
SearchResult run_search(const SearchParams& params, bool use_memory_cache = false);

/// Поиск подстроки (без учёта ASCII-регистра) в файле.
/// nullopt если совпадений нет или файл не прочитать.
std::optional<std::vector<ContentMatch>> search_content(const std::filesystem::path& path,
                                                        std::uint64_t size,
                                                        std::string_view query);

/// Поиск подстроки в готовом тексте (строки по '\n', '\r' в конце отбрасывается)
std::vector<ContentMatch> match_lines(std::string_view text, std::string_view query);

/// Заменить некорректные UTF-8 последовательности на U+FFFD
std::string lossy_utf8(std::string_view bytes);

/// Обрезать строку до limit байт по границе UTF-8 символа, добавив "..."
std::string truncate_line(std::string_view line, std::size_t limit);

}  // namespace fiq::search

#endif  // FIQ_SEARCH_HPP
