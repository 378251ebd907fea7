// ==============================================================================
// fiq/organize.hpp - Раскладка файлов по категориям
// ==============================================================================
//
// Назначение:
// - Категория файла по типу, дате изменения или размеру
// - Перемещение в <output>/<категория>/<basename> (или только план при dry-run)
// - Разрешение конфликтов: skip / rename (_1.._999) / overwrite
// - Перемещение между устройствами: copy + remove
//
// Ошибки отдельных файлов собираются в errors, обход не прерывается.
//
// ==============================================================================

#ifndef FIQ_ORGANIZE_HPP
#define FIQ_ORGANIZE_HPP

#include "fiq/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fiq::organize {

/// Максимальный суффикс _N в режиме rename
constexpr int MAX_RENAME_SUFFIX = 999;

enum class Strategy { Type, Date, Size };

enum class ConflictMode { Skip, Rename, Overwrite };

struct OrganizeParams {
    std::filesystem::path directory;
    Strategy by = Strategy::Type;
    bool dry_run = false;
    ConflictMode mode = ConflictMode::Rename;
    bool recursive = true;
    std::optional<std::filesystem::path> output;  // nullopt = directory
};

struct FileMove {
    std::string from;
    std::string to;
    std::uint64_t size = 0;
};

struct OrganizeResult {
    std::size_t total_files = 0;
    std::vector<FileMove> moves;
    bool dry_run = false;
    std::vector<std::string> errors;
};

/// "type" | "date" | "size"
std::optional<Strategy> parse_strategy(std::string_view s);

/// "skip" | "rename" | "overwrite"
std::optional<ConflictMode> parse_conflict_mode(std::string_view s);

const char* strategy_name(Strategy s);
const char* conflict_mode_name(ConflictMode m);

/// Категория по расширению (lowercase, без точки; пустое = нет расширения)
const char* categorize_by_type(std::string_view extension);

/// "YYYY/MM" по локальному времени; "Unknown" без времени
std::string categorize_by_date(const std::optional<platform::TimePoint>& modified);

/// Категория по размеру (десятичные единицы)
const char* categorize_by_size(std::uint64_t size);

/// Выполнить раскладку (или её план при dry_run)
OrganizeResult run_organize(const OrganizeParams& params);

}  // namespace fiq::organize

#endif  // FIQ_ORGANIZE_HPP
