// ==============================================================================
// search.cpp - Поиск по имени, размеру, дате и содержимому
// ==============================================================================

#include "fiq/search.hpp"

#include "fiq/glob.hpp"
#include "fiq/index_cache.hpp"
#include "fiq/parallel.hpp"
#include "fiq/trigram_index.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace fiq::search {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

void lower_in_place(std::string& s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
}

bool all_digits(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

/// Беззнаковое целое целиком; nullopt при мусоре или переполнении
std::optional<std::uint64_t> parse_u64(std::string_view s) {
    if (!all_digits(s)) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : s) {
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

/// Десятичное число вида "12", "1.5", ".5"
std::optional<double> parse_decimal(std::string_view s) {
    bool seen_digit = false;
    bool seen_dot = false;
    for (char c : s) {
        if (c >= '0' && c <= '9') {
            seen_digit = true;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else {
            return std::nullopt;
        }
    }
    if (!seen_digit) {
        return std::nullopt;
    }
    std::string buf(s);
    double value = std::strtod(buf.c_str(), nullptr);
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

/// Дней от 1970-01-01 (proleptic Gregorian)
std::int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::optional<platform::TimePoint> parse_date(std::string_view s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') {
        return std::nullopt;
    }
    auto year = parse_u64(s.substr(0, 4));
    auto month = parse_u64(s.substr(5, 2));
    auto day = parse_u64(s.substr(8, 2));
    if (!year || !month || !day) {
        return std::nullopt;
    }
    int y = static_cast<int>(*year);
    int m = static_cast<int>(*month);
    int d = static_cast<int>(*day);
    if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) {
        return std::nullopt;
    }
    std::int64_t days = days_from_civil(y, m, d);
    if (days < 0) {
        return std::nullopt;
    }
    return platform::TimePoint(std::chrono::duration_cast<platform::Clock::duration>(
        std::chrono::seconds(days * 86400)));
}

std::optional<std::vector<ContentMatch>> search_record(const io::FileRecord& record,
                                                       std::string_view query) {
    return search_content(record.path, record.size, query);
}

io::ScanMode scan_mode_for(const SearchPlan& plan) {
    if (plan.path == SearchPath::NamesOnly || plan.path == SearchPath::Indexed) {
        return io::ScanMode::names_only(plan.name_pattern);
    }
    return io::ScanMode::filtered(plan.name_pattern);
}

bool passes_size(const io::FileRecord& r, const SearchPlan& plan) {
    if (plan.min_size && r.size < *plan.min_size) {
        return false;
    }
    if (plan.max_size && r.size > *plan.max_size) {
        return false;
    }
    return true;
}

bool passes_date(const io::FileRecord& r, const SearchPlan& plan) {
    if (plan.newer && (!r.modified || *r.modified < *plan.newer)) {
        return false;
    }
    if (plan.older && (!r.modified || *r.modified > *plan.older)) {
        return false;
    }
    return true;
}

}  // namespace

// ----------------------------------------------------------------------------
// Разбор фильтров
// ----------------------------------------------------------------------------

std::optional<std::uint64_t> parse_size(std::string_view s) {
    std::string upper(trim(s));
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (auto plain = parse_u64(upper)) {
        return plain;
    }

    std::string_view text = upper;
    double multiplier = 1.0;
    auto strip = [&text](std::string_view suffix) {
        if (text.size() >= suffix.size() &&
            text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0) {
            text.remove_suffix(suffix.size());
            return true;
        }
        return false;
    };
    if (strip("GB")) {
        multiplier = 1e9;
    } else if (strip("MB")) {
        multiplier = 1e6;
    } else if (strip("KB")) {
        multiplier = 1e3;
    } else if (!strip("B")) {
        return std::nullopt;
    }

    auto number = parse_decimal(trim(text));
    if (!number) {
        return std::nullopt;
    }
    double bytes = *number * multiplier;
    if (bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
        return std::nullopt;
    }
    // Округление к ближайшему: 1.1 * 1e9 не должно терять байт на погрешности double
    return static_cast<std::uint64_t>(std::llround(bytes));
}

std::optional<platform::TimePoint> parse_time(std::string_view s) {
    return parse_time(s, platform::Clock::now());
}

std::optional<platform::TimePoint> parse_time(std::string_view s, platform::TimePoint now) {
    s = trim(s);

    if (auto date = parse_date(s)) {
        return date;
    }
    if (s.empty()) {
        return std::nullopt;
    }

    std::int64_t unit = 0;
    switch (s.back()) {
    case 'd':
        unit = 86400;
        break;
    case 'h':
        unit = 3600;
        break;
    case 'm':
        unit = 60;
        break;
    default:
        return std::nullopt;
    }

    auto count = parse_u64(trim(s.substr(0, s.size() - 1)));
    if (!count) {
        return std::nullopt;
    }
    // Ограничение сверху: вычитание не должно переполнить представление времени
    constexpr std::uint64_t MAX_SECONDS = 1ULL << 40;
    if (*count > MAX_SECONDS / static_cast<std::uint64_t>(unit)) {
        return std::nullopt;
    }
    auto offset = std::chrono::seconds(static_cast<std::int64_t>(*count) * unit);
    return now - std::chrono::duration_cast<platform::Clock::duration>(offset);
}

// ----------------------------------------------------------------------------
// Планировщик
// ----------------------------------------------------------------------------

SearchPlan plan_search(const SearchParams& params) {
    SearchPlan plan;

    if (params.name_pattern && glob::GlobMatcher::compile(*params.name_pattern)) {
        plan.name_pattern = params.name_pattern;
    }
    plan.content_query = params.content_query;
    if (params.min_size) {
        plan.min_size = parse_size(*params.min_size);
    }
    if (params.max_size) {
        plan.max_size = parse_size(*params.max_size);
    }
    if (params.newer) {
        plan.newer = parse_time(*params.newer);
    }
    if (params.older) {
        plan.older = parse_time(*params.older);
    }

    bool heavy = plan.content_query || plan.min_size || plan.max_size || plan.newer || plan.older;
    if (heavy || !plan.name_pattern) {
        plan.path = SearchPath::Filtered;
    } else if (params.recursive && !index::extract_trigrams_from_glob(*plan.name_pattern).empty()) {
        plan.path = SearchPath::Indexed;
    } else {
        plan.path = SearchPath::NamesOnly;
    }
    return plan;
}

// ----------------------------------------------------------------------------
// Исполнение
// ----------------------------------------------------------------------------

SearchResult run_search(const SearchParams& params, bool use_memory_cache) {
    SearchPlan plan = plan_search(params);

    if (plan.path == SearchPath::Indexed) {
        auto indexed = index::try_indexed_search(params.directory, *plan.name_pattern,
                                                 params.recursive, use_memory_cache);
        if (indexed) {
            return std::move(*indexed);
        }
    }

    auto records = io::walk(params.directory, params.recursive, scan_mode_for(plan));

    SearchResult result;
    result.files_scanned = records.size();

    std::vector<const io::FileRecord*> candidates;
    candidates.reserve(records.size());
    for (const auto& r : records) {
        if (passes_size(r, plan) && passes_date(r, plan)) {
            candidates.push_back(&r);
        }
    }

    if (!plan.content_query) {
        result.matches.reserve(candidates.size());
        for (const auto* r : candidates) {
            SearchMatch m;
            m.path = platform::path_to_utf8(r->path);
            m.size = r->size;
            result.matches.push_back(std::move(m));
        }
        result.total_matches = result.matches.size();
        return result;
    }

    const std::string& query = *plan.content_query;
    std::vector<std::optional<std::vector<ContentMatch>>> found(candidates.size());
    parallel::for_each_index(candidates.size(), [&](std::size_t i) {
        found[i] = search_record(*candidates[i], query);
    });

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (!found[i]) {
            continue;
        }
        SearchMatch m;
        m.path = platform::path_to_utf8(candidates[i]->path);
        m.size = candidates[i]->size;
        m.content_matches = std::move(found[i]);
        result.matches.push_back(std::move(m));
    }
    result.total_matches = result.matches.size();
    return result;
}

// ----------------------------------------------------------------------------
// Поиск по содержимому
// ----------------------------------------------------------------------------

std::optional<std::vector<ContentMatch>> search_content(const std::filesystem::path& path,
                                                        std::uint64_t size,
                                                        std::string_view query) {
    std::string text;
    if (size >= platform::MMAP_THRESHOLD) {
        auto mapped = platform::MappedFile::open(path);
        if (!mapped) {
            return std::nullopt;
        }
        text = lossy_utf8(mapped->view());
    } else {
        auto bytes = platform::read_file(path);
        if (!bytes) {
            return std::nullopt;
        }
        text = lossy_utf8(*bytes);
    }

    auto matches = match_lines(text, query);
    if (matches.empty()) {
        return std::nullopt;
    }
    return matches;
}

std::vector<ContentMatch> match_lines(std::string_view text, std::string_view query) {
    std::vector<ContentMatch> matches;

    std::string needle(query);
    lower_in_place(needle);
    // ASCII lowercase не меняет длину: позиции строк совпадают с исходными
    std::string lowered(text);
    lower_in_place(lowered);
    std::string_view haystack = lowered;

    std::size_t line_no = 0;
    std::size_t pos = 0;
    while (pos < text.size() && matches.size() < MAX_CONTENT_MATCHES) {
        std::size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::size_t line_end = end;
        if (line_end > pos && text[line_end - 1] == '\r') {
            --line_end;
        }
        ++line_no;

        std::string_view line_lower = haystack.substr(pos, line_end - pos);
        if (line_lower.find(needle) != std::string_view::npos) {
            ContentMatch m;
            m.line_number = line_no;
            m.line = truncate_line(text.substr(pos, line_end - pos), MAX_MATCH_LINE_BYTES);
            matches.push_back(std::move(m));
        }
        pos = end + 1;
    }
    return matches;
}

std::string truncate_line(std::string_view line, std::size_t limit) {
    if (line.size() <= limit) {
        return std::string(line);
    }
    std::size_t end = limit;
    while (end > 0 && (static_cast<unsigned char>(line[end]) & 0xC0) == 0x80) {
        --end;
    }
    std::string out(line.substr(0, end));
    out += "...";
    return out;
}

std::string lossy_utf8(std::string_view bytes) {
    static constexpr const char* REPLACEMENT = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    const std::size_t n = bytes.size();
    while (i < n) {
        auto b0 = static_cast<unsigned char>(bytes[i]);
        if (b0 < 0x80) {
            out.push_back(static_cast<char>(b0));
            ++i;
            continue;
        }

        std::size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (b0 >= 0xC2 && b0 <= 0xDF) {
            len = 2;
        } else if (b0 >= 0xE0 && b0 <= 0xEF) {
            len = 3;
            if (b0 == 0xE0) {
                lo = 0xA0;
            } else if (b0 == 0xED) {
                hi = 0x9F;
            }
        } else if (b0 >= 0xF0 && b0 <= 0xF4) {
            len = 4;
            if (b0 == 0xF0) {
                lo = 0x90;
            } else if (b0 == 0xF4) {
                hi = 0x8F;
            }
        } else {
            out += REPLACEMENT;
            ++i;
            continue;
        }

        // Максимальная корректная часть последовательности заменяется одним U+FFFD
        std::size_t j = 1;
        for (; j < len && i + j < n; ++j) {
            auto b = static_cast<unsigned char>(bytes[i + j]);
            unsigned char min = (j == 1) ? lo : 0x80;
            unsigned char max = (j == 1) ? hi : 0xBF;
            if (b < min || b > max) {
                break;
            }
        }
        if (j == len) {
            out.append(bytes.data() + i, len);
        } else {
            out += REPLACEMENT;
        }
        i += j;
    }
    return out;
}

}  // namespace fiq::search
