// ==============================================================================
// config.cpp - Конфигурация процесса
// ==============================================================================
//
// Формат файла (все ключи опциональны):
//
//   threads: 8
//   pool_threads: 8
//   cache_dir: /var/tmp/fiq
//
// ==============================================================================

#include "fiq/config.hpp"

#include "fiq/platform.hpp"

#include <mutex>
#include <stdexcept>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace fiq::config {

namespace {

std::mutex g_settings_mutex;
std::optional<Settings> g_settings;

std::optional<std::size_t> parse_thread_count(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        throw std::runtime_error(std::string("'") + key + "' must be a positive integer");
    }
    long long value = 0;
    try {
        value = node.as<long long>();
    } catch (const YAML::Exception&) {
        throw std::runtime_error(std::string("'") + key + "' must be a positive integer");
    }
    if (value <= 0) {
        throw std::runtime_error(std::string("'") + key + "' must be a positive integer");
    }
    return static_cast<std::size_t>(value);
}

/// Наложить переменные окружения поверх настроек файла
void apply_environment(Settings& settings) {
    if (auto threads = platform::env_positive_int("FIQ_THREADS")) {
        settings.threads = *threads;
    }
    if (auto pool = platform::env_positive_int("FIQ_POOL_THREADS")) {
        settings.pool_threads = *pool;
    }
}

}  // namespace

std::optional<std::filesystem::path> default_config_path() {
    if (auto explicit_path = platform::env_var("FIQ_CONFIG")) {
        return platform::path_from_utf8(*explicit_path);
    }
    auto root = platform::user_config_root();
    if (!root) {
        return std::nullopt;
    }
    return *root / "fiq" / "config.yml";
}

Settings parse_yaml(const std::string& text) {
    Settings settings;

    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("invalid YAML - ") + e.what());
    }

    // Пустой файл - допустимая конфигурация
    if (!root || root.IsNull()) {
        return settings;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("configuration root must be a mapping");
    }

    settings.threads = parse_thread_count(root, "threads");
    settings.pool_threads = parse_thread_count(root, "pool_threads");

    const YAML::Node cache_dir = root["cache_dir"];
    if (cache_dir && !cache_dir.IsNull()) {
        if (!cache_dir.IsScalar() || cache_dir.Scalar().empty()) {
            throw std::runtime_error("'cache_dir' must be a non-empty path");
        }
        settings.cache_dir = platform::path_from_utf8(cache_dir.Scalar());
    }

    return settings;
}

LoadResult load(const std::optional<std::filesystem::path>& path) {
    LoadResult result;

    if (path.has_value()) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(*path, ec)) {
            auto text = platform::read_file(*path);
            if (!text) {
                result.warning =
                    "failed to read config file - " + platform::path_to_utf8(*path);
            } else {
                try {
                    result.settings = parse_yaml(*text);
                    result.source = *path;
                } catch (const std::exception& e) {
                    result.warning = "ignoring config file '" + platform::path_to_utf8(*path) +
                                     "' - " + e.what();
                    result.settings = Settings{};
                }
            }
        }
    }

    apply_environment(result.settings);
    return result;
}

void install(const Settings& settings) {
    std::lock_guard<std::mutex> lock(g_settings_mutex);
    g_settings = settings;
}

Settings current() {
    std::lock_guard<std::mutex> lock(g_settings_mutex);
    if (!g_settings.has_value()) {
        // Без install(): только окружение
        Settings settings;
        apply_environment(settings);
        return settings;
    }
    return *g_settings;
}

}  // namespace fiq::config
