// ==============================================================================
// fiq/config.hpp - Конфигурация процесса
// ==============================================================================
//
// Назначение:
// - Загрузка опционального YAML-файла конфигурации (yaml-cpp)
// - Наложение переменных окружения (FIQ_THREADS, FIQ_POOL_THREADS)
// - Процессный снимок настроек, читаемый walker'ом, пулом и кэшем индекса
//
// Приоритет: окружение > файл > встроенные значения.
//
// ==============================================================================

#ifndef FIQ_CONFIG_HPP
#define FIQ_CONFIG_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace fiq::config {

/// Настройки, влияющие на ядро
struct Settings {
    /// Потоки walker'а (nullopt = по режиму сканирования)
    std::optional<std::size_t> threads;

    /// Потоки data-parallel пула (nullopt = число ядер)
    std::optional<std::size_t> pool_threads;

    /// Каталог кэша индексов (nullopt = <user-cache-root>/fiq)
    std::optional<std::filesystem::path> cache_dir;
};

/// Результат загрузки конфигурации
struct LoadResult {
    Settings settings;
    std::optional<std::filesystem::path> source;  // файл, из которого прочитано
    std::optional<std::string> warning;           // проблема с файлом (не фатальна)
};

/// Путь к файлу конфигурации по умолчанию:
/// $FIQ_CONFIG, иначе <user-config-root>/fiq/config.yml
std::optional<std::filesystem::path> default_config_path();

/// Разобрать YAML-текст конфигурации
/// @throws std::runtime_error при синтаксической ошибке или неверных типах
Settings parse_yaml(const std::string& text);

/// Загрузить настройки: файл (если есть) + переменные окружения.
/// Никогда не бросает: ошибки файла попадают в warning.
LoadResult load(const std::optional<std::filesystem::path>& path);

/// Установить процессный снимок настроек
void install(const Settings& settings);

/// Текущий снимок. До install() лениво строится из окружения.
Settings current();

}  // namespace fiq::config

#endif  // FIQ_CONFIG_HPP
