// ==============================================================================
// fiq/trigram_index.hpp - Триграммный индекс имён файлов
// ==============================================================================
//
// Назначение:
// - Индекс 3-байтовых подстрок lowercase basename -> отсортированные file ID
// - Запрос по glob: пересечение posting-листов + проверка полным glob
// - Сохранение/загрузка в <cache-dir>/<16 hex>.idx
// - Проверка свежести по mtime корня
//
// После построения индекс неизменяем и разделяется через
// std::shared_ptr<const TrigramIndex>.
//
// Формат файла кэша (little-endian):
//
//   magic[8] = "FIQTRIX\0"
//   u32 version
//   u32 root_len, root_bytes[root_len]
//   i64 built_at (наносекунды от эпохи)
//   u32 total_files
//   total_files x { u32 offset, u16 length }
//   u32 data_len, path_data[data_len]
//   u32 trigram_count
//   trigram_count x { u32 key, u32 n, u32 ids[n] }
//
// ==============================================================================

#ifndef FIQ_TRIGRAM_INDEX_HPP
#define FIQ_TRIGRAM_INDEX_HPP

#include "fiq/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fiq::index {

/// Триграмма, упакованная в младшие 24 бита: (b0 << 16) | (b1 << 8) | b2
using Trigram = std::uint32_t;

/// Отсортированный список file ID
using PostingList = std::vector<std::uint32_t>;

/// Версия формата файла кэша
constexpr std::uint32_t INDEX_FORMAT_VERSION = 1;

/// Максимальная длина относительного пути в индексе
constexpr std::size_t MAX_INDEXED_PATH_LENGTH = 65535;

/// Упаковать три байта в Trigram
constexpr Trigram pack_trigram(unsigned char a, unsigned char b, unsigned char c) {
    return (static_cast<Trigram>(a) << 16) | (static_cast<Trigram>(b) << 8) |
           static_cast<Trigram>(c);
}

// ----------------------------------------------------------------------------
// TrigramIndex
// ----------------------------------------------------------------------------

class TrigramIndex {
public:
    /// Построить индекс обходом root в режиме NamesOnly (рекурсивно).
    /// Никогда не падает: пустое дерево даёт пустой индекс.
    static TrigramIndex build(const std::filesystem::path& root);

    /// Запрос по glob.
    /// nullopt - паттерн без триграмм (или некорректен), нужен полный обход.
    /// Иначе абсолютные пути файлов, basename которых совпадает с glob.
    std::optional<std::vector<std::filesystem::path>> query(std::string_view pattern) const;

    /// mtime(root) <= built_at. false если root недоступен.
    bool is_fresh() const;

    // Сохранение / загрузка
    // -------------------------------------------------------------------------

    /// Сериализовать в байты
    std::string serialize() const;

    /// Разобрать байты. nullopt при несовпадении magic/версии или порче.
    static std::optional<TrigramIndex> deserialize(std::string_view bytes);

    /// Записать в кэш. false при любой ошибке (каталог, запись).
    bool save_to_cache() const;

    /// Загрузить из кэша. nullopt если файла нет, он испорчен,
    /// root не совпадает или индекс устарел.
    static std::optional<TrigramIndex> load_cached(const std::filesystem::path& root);

    /// Путь файла кэша для root. nullopt если каталог кэша не определить.
    static std::optional<std::filesystem::path> cache_path(const std::filesystem::path& root);

    // Доступ к состоянию
    // -------------------------------------------------------------------------

    const std::filesystem::path& root() const { return root_; }
    platform::TimePoint built_at() const { return built_at_; }
    std::uint32_t total_files() const { return total_files_; }

    /// Относительный путь файла по ID (байты как есть)
    std::string_view relative_path(std::uint32_t id) const;

    /// Posting-лист триграммы; nullptr если триграммы нет в индексе
    const PostingList* postings(Trigram key) const;

    /// Число различных триграмм
    std::size_t trigram_count() const { return trigrams_.size(); }

    /// Все триграммы (для проверки инвариантов)
    const std::unordered_map<Trigram, PostingList>& trigrams() const { return trigrams_; }

    bool operator==(const TrigramIndex& other) const;
    bool operator!=(const TrigramIndex& other) const { return !(*this == other); }

private:
    struct PathSlot {
        std::uint32_t offset = 0;
        std::uint16_t length = 0;
    };

    TrigramIndex() = default;

    std::filesystem::path root_;
    platform::TimePoint built_at_{};
    std::vector<PathSlot> path_slots_;
    std::string path_data_;
    std::unordered_map<Trigram, PostingList> trigrams_;
    std::uint32_t total_files_ = 0;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Триграммы литеральных участков glob (lowercase, без повторов, в порядке
/// появления). Текст внутри [..] и {..} литералом не считается.
/// Пустой результат - паттерн непригоден для индекса.
std::vector<Trigram> extract_trigrams_from_glob(std::string_view pattern);

/// Пересечение двух отсортированных списков (merge-join)
PostingList intersect_sorted(const PostingList& a, const PostingList& b);

/// FNV-1a 64 от байтов
std::uint64_t fnv1a_64(std::string_view bytes);

/// Каталог кэша индексов: config cache_dir, иначе <user-cache-root>/fiq
std::optional<std::filesystem::path> cache_directory();

/// ASCII lowercase
std::string ascii_lower(std::string_view s);

/// Обрезать относительный путь до MAX_INDEXED_PATH_LENGTH байт,
/// не разрывая многобайтовый символ UTF-8
std::string_view clamp_relative_path(std::string_view rel);

}  // namespace fiq::index

#endif  // FIQ_TRIGRAM_INDEX_HPP
