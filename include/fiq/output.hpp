// ==============================================================================
// fiq/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами ([+] [!] [x] [*] [~])
// - Таблицы (Unicode box-drawing)
// - JSON вывод через RapidJSON
// - Цвет (ANSI) только для TTY
//
// В режиме сервера stdout занят протоколом: диагностика идёт в stderr.
//
// ==============================================================================

#ifndef FIQ_OUTPUT_HPP
#define FIQ_OUTPUT_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace fiq::output {

// ----------------------------------------------------------------------------
// Потоки и цвета
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Выделение
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить informational stderr
    int verbose = 0;     // -v: уровень подробности (0..2+)
    bool json = false;   // --json: структурированный результат в stdout
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    /// Зелёная строка в stdout
    void green_line(std::string_view message);

    /// Жёлтая строка в stdout
    void yellow_line(std::string_view message);

    /// Красная строка в stdout
    void red_line(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать JSON значение одной строкой + newline
    void write_json_line(const rapidjson::Value& value);

    /// Записать pretty JSON (с отступами) + newline
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);
    void write_colored(Stream s, std::string_view message, Color color);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    /// Заголовки
    void set_headers(const std::vector<std::string>& headers);

    /// Строка данных
    void add_row(const std::vector<std::string>& cells);

    /// Выравнивание столбца по правому краю (числа)
    void set_right_aligned(std::size_t col);

    /// Вывести таблицу через Writer
    void print(Writer& w) const;

    /// Таблица в строку
    std::string to_string() const;

    std::size_t row_count() const { return rows_.size(); }

private:
    std::vector<std::size_t> column_widths() const;
    std::string format_line(char position, const std::vector<std::size_t>& widths) const;
    std::string format_row(const std::vector<std::string>& cells,
                           const std::vector<std::size_t>& widths) const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<bool> right_aligned_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Размер в десятичных единицах: "512 B", "1.50 KB", "2.00 GB"
std::string format_size(std::uint64_t bytes);

/// Сериализовать JSON компактно
std::string json_to_string(const rapidjson::Value& value);

/// Сериализовать JSON с отступами
std::string json_to_pretty_string(const rapidjson::Value& value);

/// Ширина строки в символах (UTF-8 code points)
std::size_t display_width(std::string_view s);

std::string ansi_color_code(Color color);
std::string ansi_reset_code();

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace fiq::output

#endif  // FIQ_OUTPUT_HPP
