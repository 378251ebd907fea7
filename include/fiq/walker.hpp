// ==============================================================================
// fiq/walker.hpp - Параллельный обход дерева каталогов
// ==============================================================================
//
// Назначение:
// - Поток FileRecord из дерева каталогов
// - Три уровня стоимости метаданных (ScanMode)
// - Фильтр по glob применяется в воркере до stat()
// - Батчевый сборщик результатов (512 записей на захват мьютекса)
//
// Поведение:
// - Директории не выдаются; symlink не разыменовываются и не выдаются
// - Скрытые файлы включаются; ignore-файлы не читаются
// - Ошибки отдельных записей пропускаются молча, без повторов
// - Нечитаемый корень -> пустой результат, не ошибка
// - Порядок выдачи не определён
//
// ==============================================================================

#ifndef FIQ_WALKER_HPP
#define FIQ_WALKER_HPP

#include "fiq/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fiq::io {

// ----------------------------------------------------------------------------
// FileRecord
// ----------------------------------------------------------------------------

/// Одна запись на обычный файл
struct FileRecord {
    std::filesystem::path path;                    // абсолютный путь
    std::uint64_t size = 0;                        // 0 если stat пропущен
    std::optional<platform::TimePoint> modified;   // nullopt если stat пропущен
    std::optional<std::string> extension;          // lowercase, без точки
    bool is_dir = false;                           // всегда false
};

// ----------------------------------------------------------------------------
// ScanMode
// ----------------------------------------------------------------------------

/// Режим сканирования
struct ScanMode {
    enum class Kind {
        Full,       // stat каждого файла; size, modified, extension
        Filtered,   // glob в воркере; stat выживших; extension не вычисляется
        NamesOnly   // glob в воркере; без stat: size = 0, modified = nullopt
    };

    Kind kind = Kind::Full;
    std::optional<std::string> pattern;

    static ScanMode full() { return ScanMode{Kind::Full, std::nullopt}; }
    static ScanMode filtered(std::optional<std::string> glob) {
        return ScanMode{Kind::Filtered, std::move(glob)};
    }
    static ScanMode names_only(std::optional<std::string> glob) {
        return ScanMode{Kind::NamesOnly, std::move(glob)};
    }
};

// ----------------------------------------------------------------------------
// Collector
// ----------------------------------------------------------------------------

/// Размер thread-local батча
constexpr std::size_t COLLECTOR_BATCH_SIZE = 512;

/// Общий приёмник записей. Один захват мьютекса на батч.
class Collector {
public:
    /// Добавить батч целиком
    void append(std::vector<FileRecord>&& batch);

    /// Забрать накопленное
    std::vector<FileRecord> take();

private:
    std::mutex mutex_;
    std::vector<FileRecord> records_;
};

// ----------------------------------------------------------------------------
// Параметры потоков
// ----------------------------------------------------------------------------

/// Потоки по умолчанию для полного сканирования
constexpr std::size_t DEFAULT_WALKER_THREADS = 4;

/// Число потоков walker'а для режима.
/// FIQ_THREADS / config threads, иначе 4 для Full и max(2, cores/2) для
/// Filtered/NamesOnly.
std::size_t walker_threads(ScanMode::Kind kind);

// ----------------------------------------------------------------------------
// walk
// ----------------------------------------------------------------------------

/// Обойти дерево
/// @param root Корневой каталог (приводится к абсолютному пути)
/// @param recursive false = только записи непосредственно в root
/// @param mode Режим сканирования
/// @return Неупорядоченный список записей
std::vector<FileRecord> walk(const std::filesystem::path& root, bool recursive,
                             const ScanMode& mode);

/// То же с явным числом потоков
std::vector<FileRecord> walk(const std::filesystem::path& root, bool recursive,
                             const ScanMode& mode, std::size_t threads);

/// Lowercase расширение без точки; nullopt если расширения нет
std::optional<std::string> lowercase_extension(const std::filesystem::path& p);

}  // namespace fiq::io

#endif  // FIQ_WALKER_HPP
