// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Загрузка конфигурации (config)
// 4. Dispatch команды
// 5. Возврат exit code
//
// Исключения перехватываются на границе приложения: "[x] <err>", код 1.
//
// ==============================================================================

#include "fiq/cli.hpp"
#include "fiq/config.hpp"
#include "fiq/duplicates.hpp"
#include "fiq/index_cache.hpp"
#include "fiq/mcp.hpp"
#include "fiq/organize.hpp"
#include "fiq/output.hpp"
#include "fiq/platform.hpp"
#include "fiq/report.hpp"
#include "fiq/search.hpp"
#include "fiq/stats.hpp"

#include <exception>
#include <iostream>
#include <system_error>
#include <string>
#include <type_traits>
#include <variant>

namespace {

using namespace fiq;

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

void load_config(output::Writer& writer) {
    writer.trace(std::string(cli::PROGRAM_NAME) + " " + cli::VERSION + " (" + platform::os_name() +
                 ")");
    auto loaded = config::load(config::default_config_path());
    if (loaded.warning) {
        writer.warn(*loaded.warning);
    }
    if (loaded.source) {
        writer.debug("config: " + platform::path_to_utf8(*loaded.source));
    }
    config::install(loaded.settings);
}

/// Предупреждение, если каталог не существует (результат будет пустым)
void check_directory(output::Writer& writer, const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        writer.warn("Directory not found: " + platform::path_to_utf8(dir));
    }
}

template <typename Result>
int emit(output::Writer& writer, const cli::GlobalOptions& global, const Result& result) {
    if (global.json) {
        writer.write_json_pretty(report::to_json(result));
    } else {
        report::render(writer, result);
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Выполнение команд
// ----------------------------------------------------------------------------

int run_stats(const cli::StatsCommand& cmd, const cli::GlobalOptions& global,
              output::Writer& writer) {
    check_directory(writer, cmd.directory);
    writer.debug("stats: " + platform::path_to_utf8(cmd.directory));
    auto result = stats::run_stats(cmd.directory, cmd.top, cmd.recursive);
    return emit(writer, global, result);
}

int run_duplicates(const cli::DuplicatesCommand& cmd, const cli::GlobalOptions& global,
                   output::Writer& writer) {
    check_directory(writer, cmd.directory);
    writer.debug("duplicates: " + platform::path_to_utf8(cmd.directory) +
                 " (min size " + std::to_string(cmd.min_size) + ")");
    auto result = duplicates::run_duplicates(cmd.directory, cmd.min_size, cmd.recursive);
    return emit(writer, global, result);
}

int run_search(const cli::SearchCommand& cmd, const cli::GlobalOptions& global,
               output::Writer& writer) {
    check_directory(writer, cmd.directory);

    search::SearchParams params;
    params.directory = cmd.directory;
    params.name_pattern = cmd.name;
    params.content_query = cmd.content;
    params.min_size = cmd.min_size;
    params.max_size = cmd.max_size;
    params.newer = cmd.newer;
    params.older = cmd.older;
    params.recursive = cmd.recursive;

    if (global.verbose > 0) {
        auto plan = search::plan_search(params);
        const char* path = plan.path == search::SearchPath::Indexed     ? "indexed"
                           : plan.path == search::SearchPath::NamesOnly ? "names-only walk"
                                                                        : "filtered walk";
        writer.debug(std::string("search plan: ") + path);
        if (cmd.name && !plan.name_pattern) {
            writer.debug("invalid glob ignored: " + *cmd.name);
        }
    }

    // Однократный запуск: память процесса не используется, только диск
    auto result = search::run_search(params, false);
    return emit(writer, global, result);
}

int run_organize(const cli::OrganizeCommand& cmd, const cli::GlobalOptions& global,
                 output::Writer& writer) {
    check_directory(writer, cmd.directory);

    organize::OrganizeParams params;
    params.directory = cmd.directory;
    params.by = cmd.by;
    params.dry_run = cmd.dry_run;
    params.mode = cmd.mode;
    params.recursive = cmd.recursive;
    params.output = cmd.output;

    writer.debug(std::string("organize by ") + organize::strategy_name(cmd.by) + ", mode " +
                 organize::conflict_mode_name(cmd.mode));
    auto result = organize::run_organize(params);
    for (const auto& e : result.errors) {
        writer.trace(e);
    }
    return emit(writer, global, result);
}

int run_build_index(const cli::BuildIndexCommand& cmd, const cli::GlobalOptions& global,
                    output::Writer& writer) {
    check_directory(writer, cmd.directory);
    writer.info("Building index for " + platform::path_to_utf8(cmd.directory));

    auto idx = fiq::index::build_index(cmd.directory, false);
    auto summary = report::summarize_index(*idx);
    if (!summary.saved) {
        writer.warn("Index could not be written to the cache directory");
    }
    return emit(writer, global, summary);
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.json = parse_result.global.json;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга печатаются как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                load_config(writer);
                if constexpr (std::is_same_v<T, cli::ServeCommand>) {
                    return mcp::run_stdio_server(writer);
                } else if constexpr (std::is_same_v<T, cli::StatsCommand>) {
                    return run_stats(cmd, parse_result.global, writer);
                } else if constexpr (std::is_same_v<T, cli::DuplicatesCommand>) {
                    return run_duplicates(cmd, parse_result.global, writer);
                } else if constexpr (std::is_same_v<T, cli::SearchCommand>) {
                    return run_search(cmd, parse_result.global, writer);
                } else if constexpr (std::is_same_v<T, cli::OrganizeCommand>) {
                    return run_organize(cmd, parse_result.global, writer);
                } else if constexpr (std::is_same_v<T, cli::BuildIndexCommand>) {
                    return run_build_index(cmd, parse_result.global, writer);
                } else {
                    // Unreachable
                    return 1;
                }
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
