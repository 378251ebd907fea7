// ==============================================================================
// fiq/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI
//
// Коды возврата парсинга:
// - 2: некорректный вызов (неизвестная опция, нет значения, неверное значение)
// - 1: подкоманда не указана (вне режима сервера)
//
// ==============================================================================

#ifndef FIQ_CLI_HPP
#define FIQ_CLI_HPP

#include "fiq/organize.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace fiq::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q
    bool json = false;   // --json
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// stats [DIR] [--top N] [--recursive[=BOOL]]
struct StatsCommand {
    std::filesystem::path directory = ".";
    std::size_t top = 10;
    bool recursive = true;
};

/// duplicates [DIR] [--min-size N] [--recursive[=BOOL]]
struct DuplicatesCommand {
    std::filesystem::path directory = ".";
    std::uint64_t min_size = 1;
    bool recursive = true;
};

/// search [DIR] [--name GLOB] [--content STR] [--min-size S] [--max-size S]
///        [--newer T] [--older T] [--recursive[=BOOL]]
struct SearchCommand {
    std::filesystem::path directory = ".";
    std::optional<std::string> name;
    std::optional<std::string> content;
    std::optional<std::string> min_size;
    std::optional<std::string> max_size;
    std::optional<std::string> newer;
    std::optional<std::string> older;
    bool recursive = true;
};

/// organize DIR [--by type|date|size] [--dry-run] [--mode skip|rename|overwrite]
///              [--recursive[=BOOL]] [--output DIR]
struct OrganizeCommand {
    std::filesystem::path directory;
    organize::Strategy by = organize::Strategy::Type;
    bool dry_run = false;
    organize::ConflictMode mode = organize::ConflictMode::Rename;
    bool recursive = true;
    std::optional<std::filesystem::path> output;
};

/// build-index [DIR] - принудительная пересборка индекса
struct BuildIndexCommand {
    std::filesystem::path directory = ".";
};

/// --mcp - долгоживущий JSON-RPC сервер
struct ServeCommand {};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<StatsCommand, DuplicatesCommand, SearchCommand, OrganizeCommand,
                             BuildIndexCommand, ServeCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, const char* const* argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

/// "true"/"false" (а также 1/0, yes/no)
std::optional<bool> parse_bool(std::string_view s);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* PROGRAM_NAME = "fiq";
constexpr const char* VERSION = "0.1.0";
constexpr const char* ABOUT = "Fast file intelligence CLI + MCP server";

}  // namespace fiq::cli

#endif  // FIQ_CLI_HPP
