// ==============================================================================
// fiq/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - TTY detection
// - Метаданные файлов (size + mtime одним stat)
// - Каталоги пользователя (cache / config), переменные окружения
// - Read-only memory mapping с RAII
//
// Вся платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef FIQ_PLATFORM_HPP
#define FIQ_PLATFORM_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fiq::platform {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Создать path из UTF-8 строки
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 строку из path
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Метаданные файла
// ----------------------------------------------------------------------------

/// Результат stat(): размер и время модификации
struct FileStat {
    std::uint64_t size = 0;
    std::optional<TimePoint> modified;
    bool is_regular = false;
    bool is_directory = false;
};

/// stat() с переходом по symlink. nullopt при любой ошибке.
std::optional<FileStat> stat_path(const std::filesystem::path& p);

/// Время модификации пути (директории или файла)
std::optional<TimePoint> modified_time(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// Окружение и каталоги пользователя
// ----------------------------------------------------------------------------

/// Значение переменной окружения; nullopt если не задана или пуста
std::optional<std::string> env_var(const char* name);

/// Положительное целое из переменной окружения; nullopt если нет или мусор
std::optional<std::size_t> env_positive_int(const char* name);

/// Корень пользовательского кэша: $XDG_CACHE_HOME, иначе $HOME/.cache
std::optional<std::filesystem::path> user_cache_root();

/// Корень пользовательской конфигурации: $XDG_CONFIG_HOME, иначе $HOME/.config
std::optional<std::filesystem::path> user_config_root();

/// Количество доступных ядер (минимум 1)
std::size_t available_cores();

// ----------------------------------------------------------------------------
// MappedFile - read-only отображение файла в память
// ----------------------------------------------------------------------------

/// Файлы от этого размера читаются через mmap, меньшие - целиком в память
constexpr std::uint64_t MMAP_THRESHOLD = 128 * 1024;

/// Отображение освобождается в деструкторе. Предполагается, что файл
/// не усекается конкурентно сторонним процессом.
class MappedFile {
public:
    MappedFile() = default;
    ~MappedFile();

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    MappedFile(MappedFile&& other) noexcept;
    MappedFile& operator=(MappedFile&& other) noexcept;

    /// Отобразить файл целиком. nullopt при ошибке open/fstat/mmap
    /// или для пустого файла.
    static std::optional<MappedFile> open(const std::filesystem::path& p);

    const unsigned char* data() const { return data_; }
    std::size_t size() const { return size_; }
    std::string_view view() const {
        return std::string_view(reinterpret_cast<const char*>(data_), size_);
    }

private:
    void release();

    const unsigned char* data_ = nullptr;
    std::size_t size_ = 0;
};

/// Прочитать файл целиком. nullopt при ошибке.
std::optional<std::string> read_file(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name();

}  // namespace fiq::platform

#endif  // FIQ_PLATFORM_HPP
