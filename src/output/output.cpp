// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
// Байты первичны: std::endl не используется.
//
// ==============================================================================

#include "fiq/output.hpp"

#include "fiq/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace fiq::output {

namespace {

// ANSI SGR коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr && !bytes.empty()) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    write_colored(Stream::Stderr, prefix, color);
    write(Stream::Stderr, " ");
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+]", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!]", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    write_prefixed("[x]", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*]", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~]", Color::Magenta, message);
}

void Writer::green_line(std::string_view message) {
    write_colored(Stream::Stdout, message, Color::Green);
    write(Stream::Stdout, "\n");
}

void Writer::yellow_line(std::string_view message) {
    write_colored(Stream::Stdout, message, Color::Yellow);
    write(Stream::Stdout, "\n");
}

void Writer::red_line(std::string_view message) {
    write_colored(Stream::Stdout, message, Color::Red);
    write(Stream::Stdout, "\n");
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    if (color != Color::Default && supports_color(s)) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ANSI_RESET);
    } else {
        write(s, message);
    }
}

void Writer::write_json_line(const rapidjson::Value& value) {
    write(Stream::Stdout, json_to_string(value));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    write(Stream::Stdout, json_to_pretty_string(value));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

void Table::set_right_aligned(std::size_t col) {
    if (col >= right_aligned_.size()) {
        right_aligned_.resize(col + 1, false);
    }
    right_aligned_[col] = true;
}

std::vector<std::size_t> Table::column_widths() const {
    std::size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<std::size_t> widths(num_cols, 0);
    for (std::size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }
    return widths;
}

std::string Table::format_line(char position, const std::vector<std::size_t>& widths) const {
    // position: 'T' верх, 'M' разделитель заголовка, 'B' низ
    const char* left = position == 'T' ? BOX_TL : (position == 'M' ? BOX_LT : BOX_BL);
    const char* middle = position == 'T' ? BOX_TT : (position == 'M' ? BOX_CROSS : BOX_BT);
    const char* right = position == 'T' ? BOX_TR : (position == 'M' ? BOX_RT : BOX_BR);

    std::string line = left;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        for (std::size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        line += (i + 1 < widths.size()) ? middle : right;
    }
    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells,
                              const std::vector<std::size_t>& widths) const {
    std::string line = BOX_V;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        const std::string cell = (i < cells.size()) ? cells[i] : "";
        std::size_t pad = widths[i] - std::min(widths[i], display_width(cell));
        bool right = i < right_aligned_.size() && right_aligned_[i];

        line += ' ';
        if (right) {
            line.append(pad, ' ');
        }
        line += cell;
        if (!right) {
            line.append(pad, ' ');
        }
        line += ' ';
        line += BOX_V;
    }
    return line;
}

std::string Table::to_string() const {
    auto widths = column_widths();
    if (widths.empty()) {
        return {};
    }

    std::string result = format_line('T', widths);
    result += '\n';
    if (!headers_.empty()) {
        result += format_row(headers_, widths);
        result += '\n';
        result += format_line('M', widths);
        result += '\n';
    }
    for (const auto& row : rows_) {
        result += format_row(row, widths);
        result += '\n';
    }
    result += format_line('B', widths);
    result += '\n';
    return result;
}

void Table::print(Writer& w) const {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_size(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1000ULL;
    constexpr std::uint64_t MB = 1000ULL * KB;
    constexpr std::uint64_t GB = 1000ULL * MB;
    constexpr std::uint64_t TB = 1000ULL * GB;

    struct Unit {
        std::uint64_t factor;
        const char* suffix;
    };
    static const Unit UNITS[] = {{TB, "TB"}, {GB, "GB"}, {MB, "MB"}, {KB, "KB"}};

    char buf[64];
    for (const auto& unit : UNITS) {
        if (bytes >= unit.factor) {
            std::snprintf(buf, sizeof(buf), "%.2f %s",
                          static_cast<double>(bytes) / static_cast<double>(unit.factor),
                          unit.suffix);
            return buf;
        }
    }
    std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    return buf;
}

std::string json_to_string(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string json_to_pretty_string(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::size_t display_width(std::string_view s) {
    std::size_t width = 0;
    for (char c : s) {
        // Считаем только первые байты UTF-8 последовательностей
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace fiq::output
