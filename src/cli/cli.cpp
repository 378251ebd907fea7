// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: сообщения об ошибках в стиле clap, чтобы вывод
// совпадал с привычным для пользователей форматом.
//
// Глобальные опции (-v, -q, --json, --mcp, -h, -V) допускаются в любой позиции.
// Опции со значением принимают форму "--opt VALUE" и "--opt=VALUE".
//
// ==============================================================================

#include "fiq/cli.hpp"

#include "fiq/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <utility>

namespace fiq::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

const char* const TRY_HELP = "For more information, try '--help'.\n";

std::string usage_line(const std::string& command) {
    if (command == "stats") {
        return "Usage: fiq stats [OPTIONS] [DIRECTORY]";
    }
    if (command == "duplicates") {
        return "Usage: fiq duplicates [OPTIONS] [DIRECTORY]";
    }
    if (command == "search") {
        return "Usage: fiq search [OPTIONS] [DIRECTORY]";
    }
    if (command == "organize") {
        return "Usage: fiq organize [OPTIONS] <DIRECTORY>";
    }
    if (command == "build-index") {
        return "Usage: fiq build-index [OPTIONS] [DIRECTORY]";
    }
    return "Usage: fiq [OPTIONS] [COMMAND]";
}

CliDiagnostic usage_error(const std::string& command, const std::string& message) {
    CliDiagnostic d;
    d.exit_code = 2;
    d.stderr_message = "error: " + message + "\n\n" + usage_line(command) + "\n\n" + TRY_HELP;
    return d;
}

CliDiagnostic invalid_value(const std::string& option, const std::string& value,
                            const std::string& reason) {
    CliDiagnostic d;
    d.exit_code = 2;
    d.stderr_message = "error: invalid value '" + value + "' for '" + option + "': " + reason +
                       "\n\n" + TRY_HELP;
    return d;
}

CliDiagnostic missing_value(const std::string& option) {
    CliDiagnostic d;
    d.exit_code = 2;
    d.stderr_message =
        "error: a value is required for '" + option + "' but none was supplied\n\n" + TRY_HELP;
    return d;
}

/// Беззнаковое десятичное число без знака и пробелов
std::optional<std::uint64_t> parse_u64(const char* s) {
    if (s == nullptr || *s == '\0' || *s == '-' || *s == '+' || *s == ' ') {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno == ERANGE || end == s || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(v);
}

// ----------------------------------------------------------------------------
// ArgCursor - проход по аргументам подкоманды
// ----------------------------------------------------------------------------

class ArgCursor {
public:
    ArgCursor(int argc, const char* const* argv, int start)
        : argc_(argc), argv_(argv), index_(start) {}

    bool done() const { return index_ >= argc_; }
    const char* current() const { return argv_[index_]; }
    void advance() { ++index_; }

    const char* peek_next() const {
        return (index_ + 1 < argc_) ? argv_[index_ + 1] : nullptr;
    }

    /// Совпадение опции со значением: "--name VALUE" или "--name=VALUE".
    /// При совпадении value заполняется (nullptr, если значения нет).
    bool match_value(const char* name, const char*& value) {
        const char* arg = current();
        if (str_eq(arg, name)) {
            const char* next = peek_next();
            if (next != nullptr) {
                ++index_;
                value = next;
            } else {
                value = nullptr;
            }
            return true;
        }
        std::size_t len = std::strlen(name);
        if (std::strncmp(arg, name, len) == 0 && arg[len] == '=') {
            value = arg + len + 1;
            return true;
        }
        return false;
    }

private:
    int argc_;
    const char* const* argv_;
    int index_;
};

/// Общее состояние разбора одной подкоманды
struct CommandScan {
    std::string name;
    std::optional<std::string> positional;
    std::optional<CliDiagnostic> error;
    bool help = false;
};

/// Глобальные опции внутри подкоманды. true если аргумент поглощён.
bool consume_global(const char* arg, GlobalOptions& global, CommandScan& scan) {
    if (str_eq(arg, "-v")) {
        global.verbose++;
    } else if (arg[0] == '-' && arg[1] == 'v' && arg[2] == 'v' &&
               std::strspn(arg + 1, "v") == std::strlen(arg + 1)) {
        // -vv, -vvv
        global.verbose += static_cast<int>(std::strlen(arg + 1));
    } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
        global.quiet = true;
    } else if (str_eq(arg, "--json")) {
        global.json = true;
    } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
        scan.help = true;
    } else {
        return false;
    }
    return true;
}

/// --recursive / -r: голый флаг, "=BOOL" или следующий true/false
bool consume_recursive(ArgCursor& cur, bool& recursive, CommandScan& scan) {
    const char* arg = cur.current();
    if (str_eq(arg, "--recursive") || str_eq(arg, "-r")) {
        recursive = true;
        const char* next = cur.peek_next();
        if (next != nullptr) {
            if (auto b = parse_bool(next)) {
                recursive = *b;
                cur.advance();
            }
        }
        return true;
    }
    const char* value = nullptr;
    if (starts_with(arg, "--recursive=")) {
        value = arg + std::strlen("--recursive=");
    } else if (starts_with(arg, "-r=")) {
        value = arg + 3;
    } else {
        return false;
    }
    if (auto b = parse_bool(value)) {
        recursive = *b;
    } else {
        scan.error = invalid_value("--recursive", value, "possible values: true, false");
    }
    return true;
}

/// Позиционный DIRECTORY (не более одного)
void consume_positional(const char* arg, CommandScan& scan) {
    if (scan.positional) {
        scan.error = usage_error(scan.name, std::string("unexpected argument '") + arg + "' found");
        return;
    }
    scan.positional = arg;
}

void reject_unknown(const char* arg, CommandScan& scan) {
    scan.error = usage_error(scan.name, std::string("unexpected argument '") + arg + "' found");
}

/// Строковое значение опции; nullopt + ошибка в scan при отсутствии
std::optional<std::string> require_value(const char* option, const char* value,
                                         CommandScan& scan) {
    if (value == nullptr) {
        scan.error = missing_value(option);
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<std::uint64_t> require_number(const char* option, const char* value,
                                            CommandScan& scan) {
    if (value == nullptr) {
        scan.error = missing_value(option);
        return std::nullopt;
    }
    auto n = parse_u64(value);
    if (!n) {
        scan.error = invalid_value(option, value, "invalid digit found in string");
    }
    return n;
}

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

void scan_stats(ArgCursor& cur, GlobalOptions& global, StatsCommand& cmd, CommandScan& scan) {
    for (; !cur.done() && !scan.error; cur.advance()) {
        const char* arg = cur.current();
        const char* value = nullptr;
        if (consume_global(arg, global, scan) || consume_recursive(cur, cmd.recursive, scan)) {
            continue;
        }
        if (cur.match_value("--top", value)) {
            if (auto n = require_number("--top <TOP>", value, scan)) {
                if (*n > std::numeric_limits<std::size_t>::max()) {
                    scan.error = invalid_value("--top <TOP>", value, "number too large");
                } else {
                    cmd.top = static_cast<std::size_t>(*n);
                }
            }
        } else if (arg[0] == '-' && arg[1] != '\0') {
            reject_unknown(arg, scan);
        } else {
            consume_positional(arg, scan);
        }
    }
    if (scan.positional) {
        cmd.directory = platform::path_from_utf8(*scan.positional);
    }
}

void scan_duplicates(ArgCursor& cur, GlobalOptions& global, DuplicatesCommand& cmd,
                     CommandScan& scan) {
    for (; !cur.done() && !scan.error; cur.advance()) {
        const char* arg = cur.current();
        const char* value = nullptr;
        if (consume_global(arg, global, scan) || consume_recursive(cur, cmd.recursive, scan)) {
            continue;
        }
        if (cur.match_value("--min-size", value)) {
            if (auto n = require_number("--min-size <MIN_SIZE>", value, scan)) {
                cmd.min_size = *n;
            }
        } else if (arg[0] == '-' && arg[1] != '\0') {
            reject_unknown(arg, scan);
        } else {
            consume_positional(arg, scan);
        }
    }
    if (scan.positional) {
        cmd.directory = platform::path_from_utf8(*scan.positional);
    }
}

void scan_search(ArgCursor& cur, GlobalOptions& global, SearchCommand& cmd, CommandScan& scan) {
    struct StringOption {
        const char* name;
        const char* display;
        std::optional<std::string>* target;
    };
    const StringOption options[] = {
        {"--name", "--name <NAME>", &cmd.name},
        {"--content", "--content <CONTENT>", &cmd.content},
        {"--min-size", "--min-size <MIN_SIZE>", &cmd.min_size},
        {"--max-size", "--max-size <MAX_SIZE>", &cmd.max_size},
        {"--newer", "--newer <NEWER>", &cmd.newer},
        {"--older", "--older <OLDER>", &cmd.older},
    };

    for (; !cur.done() && !scan.error; cur.advance()) {
        const char* arg = cur.current();
        if (consume_global(arg, global, scan) || consume_recursive(cur, cmd.recursive, scan)) {
            continue;
        }
        bool matched = false;
        for (const auto& opt : options) {
            const char* value = nullptr;
            if (cur.match_value(opt.name, value)) {
                matched = true;
                if (auto v = require_value(opt.display, value, scan)) {
                    *opt.target = std::move(*v);
                }
                break;
            }
        }
        if (matched) {
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            reject_unknown(arg, scan);
        } else {
            consume_positional(arg, scan);
        }
    }
    if (scan.positional) {
        cmd.directory = platform::path_from_utf8(*scan.positional);
    }
}

void scan_organize(ArgCursor& cur, GlobalOptions& global, OrganizeCommand& cmd,
                   CommandScan& scan) {
    for (; !cur.done() && !scan.error; cur.advance()) {
        const char* arg = cur.current();
        const char* value = nullptr;
        if (consume_global(arg, global, scan) || consume_recursive(cur, cmd.recursive, scan)) {
            continue;
        }
        if (str_eq(arg, "--dry-run")) {
            cmd.dry_run = true;
        } else if (cur.match_value("--by", value)) {
            if (auto v = require_value("--by <BY>", value, scan)) {
                if (auto s = organize::parse_strategy(*v)) {
                    cmd.by = *s;
                } else {
                    scan.error =
                        invalid_value("--by <BY>", *v, "possible values: type, date, size");
                }
            }
        } else if (cur.match_value("--mode", value)) {
            if (auto v = require_value("--mode <MODE>", value, scan)) {
                if (auto m = organize::parse_conflict_mode(*v)) {
                    cmd.mode = *m;
                } else {
                    scan.error = invalid_value("--mode <MODE>", *v,
                                               "possible values: skip, rename, overwrite");
                }
            }
        } else if (cur.match_value("--output", value)) {
            if (auto v = require_value("--output <OUTPUT>", value, scan)) {
                cmd.output = platform::path_from_utf8(*v);
            }
        } else if (arg[0] == '-' && arg[1] != '\0') {
            reject_unknown(arg, scan);
        } else {
            consume_positional(arg, scan);
        }
    }
    if (scan.positional) {
        cmd.directory = platform::path_from_utf8(*scan.positional);
    } else if (!scan.error && !scan.help) {
        CliDiagnostic d;
        d.exit_code = 2;
        d.stderr_message = "error: the following required arguments were not provided:\n"
                           "  <DIRECTORY>\n\n" +
                           usage_line("organize") + "\n\n" + TRY_HELP;
        scan.error = d;
    }
}

void scan_build_index(ArgCursor& cur, GlobalOptions& global, BuildIndexCommand& cmd,
                      CommandScan& scan) {
    for (; !cur.done() && !scan.error; cur.advance()) {
        const char* arg = cur.current();
        if (consume_global(arg, global, scan)) {
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            reject_unknown(arg, scan);
        } else {
            consume_positional(arg, scan);
        }
    }
    if (scan.positional) {
        cmd.directory = platform::path_from_utf8(*scan.positional);
    }
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// parse_bool
// ----------------------------------------------------------------------------

std::optional<bool> parse_bool(std::string_view s) {
    if (s == "true" || s == "1" || s == "yes" || s == "on") {
        return true;
    }
    if (s == "false" || s == "0" || s == "no" || s == "off") {
        return false;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string(PROGRAM_NAME) + " " + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: fiq [OPTIONS] [COMMAND]\n"
               "\n"
               "Commands:\n"
               "  stats        Show file statistics for a directory\n"
               "  duplicates   Find duplicate files by content hash\n"
               "  search       Search for files by name, content, size, or date\n"
               "  organize     Organize files into folders by type, date, or size\n"
               "  build-index  Rebuild the filename index for a directory\n"
               "  help         Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --mcp      Run as MCP (Model Context Protocol) JSON-RPC server over stdio\n"
               "      --json     Print results as JSON\n"
               "  -v...          Print verbose output\n"
               "  -q, --quiet    Suppress informational messages\n"
               "  -h, --help     Print help\n"
               "  -V, --version  Print version\n";
    } else if (*command == "stats") {
        return "Show file statistics for a directory\n"
               "\n"
               "Usage: fiq stats [OPTIONS] [DIRECTORY]\n"
               "\n"
               "Arguments:\n"
               "  [DIRECTORY]  Directory to scan [default: .]\n"
               "\n"
               "Options:\n"
               "      --top <TOP>              Number of largest files to show [default: 10]\n"
               "  -r, --recursive[=<BOOL>]     Scan recursively [default: true]\n"
               "  -h, --help                   Print help\n";
    } else if (*command == "duplicates") {
        return "Find duplicate files by content hash\n"
               "\n"
               "Usage: fiq duplicates [OPTIONS] [DIRECTORY]\n"
               "\n"
               "Arguments:\n"
               "  [DIRECTORY]  Directory to scan [default: .]\n"
               "\n"
               "Options:\n"
               "      --min-size <MIN_SIZE>    Minimum file size to consider (bytes) [default: 1]\n"
               "  -r, --recursive[=<BOOL>]     Scan recursively [default: true]\n"
               "  -h, --help                   Print help\n";
    } else if (*command == "search") {
        return "Search for files by name, content, size, or date\n"
               "\n"
               "Usage: fiq search [OPTIONS] [DIRECTORY]\n"
               "\n"
               "Arguments:\n"
               "  [DIRECTORY]  Directory to search [default: .]\n"
               "\n"
               "Options:\n"
               "      --name <NAME>            Glob pattern for file names (e.g. \"*.rs\")\n"
               "      --content <CONTENT>      Search file contents for this string\n"
               "      --min-size <MIN_SIZE>    Minimum file size (e.g. \"1KB\", \"10MB\")\n"
               "      --max-size <MAX_SIZE>    Maximum file size (e.g. \"100MB\", \"1GB\")\n"
               "      --newer <NEWER>          Files newer than this (e.g. \"2024-01-01\", \"7d\", "
               "\"24h\")\n"
               "      --older <OLDER>          Files older than this (e.g. \"2024-01-01\", \"7d\", "
               "\"24h\")\n"
               "  -r, --recursive[=<BOOL>]     Scan recursively [default: true]\n"
               "  -h, --help                   Print help\n";
    } else if (*command == "organize") {
        return "Organize files into folders by type, date, or size\n"
               "\n"
               "Usage: fiq organize [OPTIONS] <DIRECTORY>\n"
               "\n"
               "Arguments:\n"
               "  <DIRECTORY>  Directory to organize\n"
               "\n"
               "Options:\n"
               "      --by <BY>                Organization strategy: type, date, size "
               "[default: type]\n"
               "      --dry-run                Preview changes without moving files\n"
               "      --mode <MODE>            How to handle conflicts: skip, rename, overwrite "
               "[default: rename]\n"
               "  -r, --recursive[=<BOOL>]     Process subdirectories [default: true]\n"
               "      --output <OUTPUT>        Output directory (default: organize in-place)\n"
               "  -h, --help                   Print help\n";
    } else if (*command == "build-index") {
        return "Rebuild the filename index for a directory\n"
               "\n"
               "Usage: fiq build-index [OPTIONS] [DIRECTORY]\n"
               "\n"
               "Arguments:\n"
               "  [DIRECTORY]  Directory to index [default: .]\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else {
        return "error: unrecognized subcommand '" + *command + "'\n";
    }
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, const char* const* argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    // --mcp в любой позиции заменяет подкоманды
    for (int i = 1; i < argc; ++i) {
        if (str_eq(argv[i], "--mcp")) {
            result.ok = true;
            result.command = ServeCommand{};
            return result;
        }
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        CommandScan dummy;
        if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (consume_global(arg, result.global, dummy)) {
            if (dummy.help) {
                result.ok = true;
                result.command = HelpCommand{};
                return result;
            }
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            result.diagnostic = usage_error("", std::string("unexpected argument '") + arg + "' found");
            return result;
        }
    }

    if (cmd_idx >= argc) {
        result.diagnostic.exit_code = 1;
        result.diagnostic.stderr_message = "No command specified. Use --help for usage information.\n";
        return result;
    }

    const char* cmd = argv[cmd_idx];
    ArgCursor cur(argc, argv, cmd_idx + 1);
    CommandScan scan;
    scan.name = cmd;

    if (str_eq(cmd, "stats")) {
        StatsCommand stats_cmd;
        scan_stats(cur, result.global, stats_cmd, scan);
        result.command = stats_cmd;
    } else if (str_eq(cmd, "duplicates")) {
        DuplicatesCommand dup_cmd;
        scan_duplicates(cur, result.global, dup_cmd, scan);
        result.command = dup_cmd;
    } else if (str_eq(cmd, "search")) {
        SearchCommand search_cmd;
        scan_search(cur, result.global, search_cmd, scan);
        result.command = search_cmd;
    } else if (str_eq(cmd, "organize")) {
        OrganizeCommand org_cmd;
        scan_organize(cur, result.global, org_cmd, scan);
        result.command = org_cmd;
    } else if (str_eq(cmd, "build-index")) {
        BuildIndexCommand index_cmd;
        scan_build_index(cur, result.global, index_cmd, scan);
        result.command = index_cmd;
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{std::string(argv[cmd_idx + 1])};
        } else {
            result.command = HelpCommand{};
        }
        return result;
    } else {
        result.diagnostic =
            usage_error("", std::string("unrecognized subcommand '") + cmd + "'");
        return result;
    }

    // -h внутри подкоманды важнее остальных ошибок
    if (scan.help) {
        result.ok = true;
        result.command = HelpCommand{scan.name};
        return result;
    }
    if (scan.error) {
        result.diagnostic = *scan.error;
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace fiq::cli
