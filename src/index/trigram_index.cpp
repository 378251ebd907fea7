// ==============================================================================
// trigram_index.cpp - Триграммный индекс имён файлов
// ==============================================================================

#include "fiq/trigram_index.hpp"

#include "fiq/config.hpp"
#include "fiq/glob.hpp"
#include "fiq/walker.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <system_error>
#include <unordered_set>

namespace fiq::index {

namespace {

constexpr char INDEX_MAGIC[8] = {'F', 'I', 'Q', 'T', 'R', 'I', 'X', '\0'};

constexpr std::uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

constexpr Trigram MAX_TRIGRAM = 0xFFFFFF;

inline char lower_byte(char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c - 'A' + 'a');
    }
    return c;
}

// ----------------------------------------------------------------------------
// Кодирование little-endian
// ----------------------------------------------------------------------------

void put_u16(std::string& out, std::uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put_u32(std::string& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

void put_u64(std::string& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

/// Читатель с проверкой границ
class ByteReader {
public:
    explicit ByteReader(std::string_view bytes) : bytes_(bytes) {}

    std::size_t remaining() const { return bytes_.size() - pos_; }

    bool read_bytes(std::size_t n, std::string_view& out) {
        if (remaining() < n) {
            return false;
        }
        out = bytes_.substr(pos_, n);
        pos_ += n;
        return true;
    }

    bool read_u16(std::uint16_t& out) {
        std::string_view raw;
        if (!read_bytes(2, raw)) {
            return false;
        }
        out = static_cast<std::uint16_t>(static_cast<unsigned char>(raw[0]) |
                                         (static_cast<unsigned char>(raw[1]) << 8));
        return true;
    }

    bool read_u32(std::uint32_t& out) {
        std::string_view raw;
        if (!read_bytes(4, raw)) {
            return false;
        }
        out = 0;
        for (int i = 0; i < 4; ++i) {
            out |= static_cast<std::uint32_t>(static_cast<unsigned char>(raw[i])) << (8 * i);
        }
        return true;
    }

    bool read_u64(std::uint64_t& out) {
        std::string_view raw;
        if (!read_bytes(8, raw)) {
            return false;
        }
        out = 0;
        for (int i = 0; i < 8; ++i) {
            out |= static_cast<std::uint64_t>(static_cast<unsigned char>(raw[i])) << (8 * i);
        }
        return true;
    }

private:
    std::string_view bytes_;
    std::size_t pos_ = 0;
};

// ----------------------------------------------------------------------------
// Извлечение триграмм
// ----------------------------------------------------------------------------

void emit_literal_trigrams(const std::string& literal, std::vector<Trigram>& out,
                           std::unordered_set<Trigram>& seen) {
    if (literal.size() < 3) {
        return;
    }
    for (std::size_t i = 0; i + 3 <= literal.size(); ++i) {
        Trigram t = pack_trigram(static_cast<unsigned char>(literal[i]),
                                 static_cast<unsigned char>(literal[i + 1]),
                                 static_cast<unsigned char>(literal[i + 2]));
        if (seen.insert(t).second) {
            out.push_back(t);
        }
    }
}

/// Пропустить класс [..]; i указывает на '['. Возвращает позицию ']' или size.
std::size_t skip_class(std::string_view p, std::size_t i) {
    std::size_t j = i + 1;
    if (j < p.size() && (p[j] == '!' || p[j] == '^')) {
        ++j;
    }
    if (j < p.size() && p[j] == ']') {
        ++j;
    }
    while (j < p.size() && p[j] != ']') {
        if (p[j] == '\\') {
            ++j;
        }
        ++j;
    }
    return std::min(j, p.size());
}

/// Пропустить альтернативу {..} с вложенностью; i указывает на '{'.
std::size_t skip_braces(std::string_view p, std::size_t i) {
    int depth = 0;
    std::size_t j = i;
    for (; j < p.size(); ++j) {
        char c = p[j];
        if (c == '\\') {
            ++j;
        } else if (c == '[') {
            j = skip_class(p, j);
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) {
                return j;
            }
        }
    }
    return p.size();
}

/// Добавить триграммы lowercase basename файла id
void index_basename(std::string_view basename, std::uint32_t id,
                    std::unordered_map<Trigram, PostingList>& trigrams) {
    if (basename.size() < 3) {
        return;
    }
    std::string lower = ascii_lower(basename);
    for (std::size_t i = 0; i + 3 <= lower.size(); ++i) {
        Trigram t = pack_trigram(static_cast<unsigned char>(lower[i]),
                                 static_cast<unsigned char>(lower[i + 1]),
                                 static_cast<unsigned char>(lower[i + 2]));
        trigrams[t].push_back(id);
    }
}

std::string_view basename_of(std::string_view rel) {
    auto pos = rel.rfind('/');
    if (pos == std::string_view::npos) {
        return rel;
    }
    return rel.substr(pos + 1);
}

std::int64_t to_nanos(platform::TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

platform::TimePoint from_nanos(std::int64_t ns) {
    return platform::TimePoint(
        std::chrono::duration_cast<platform::Clock::duration>(std::chrono::nanoseconds(ns)));
}

}  // namespace

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ascii_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = lower_byte(c);
    }
    return out;
}

std::string_view clamp_relative_path(std::string_view rel) {
    if (rel.size() <= MAX_INDEXED_PATH_LENGTH) {
        return rel;
    }
    std::size_t cut = MAX_INDEXED_PATH_LENGTH;
    // Байт на месте разреза - продолжение (10xxxxxx): отступаем к началу символа
    while (cut > 0 && (static_cast<unsigned char>(rel[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return rel.substr(0, cut);
}

std::vector<Trigram> extract_trigrams_from_glob(std::string_view pattern) {
    std::vector<Trigram> out;
    std::unordered_set<Trigram> seen;
    std::string literal;

    for (std::size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        switch (c) {
        case '*':
        case '?':
        case ']':
        case '}':
            emit_literal_trigrams(literal, out, seen);
            literal.clear();
            break;
        case '[':
            emit_literal_trigrams(literal, out, seen);
            literal.clear();
            i = skip_class(pattern, i);
            break;
        case '{':
            emit_literal_trigrams(literal, out, seen);
            literal.clear();
            i = skip_braces(pattern, i);
            break;
        case '\\':
            if (i + 1 < pattern.size()) {
                ++i;
                literal.push_back(lower_byte(pattern[i]));
            } else {
                literal.push_back('\\');
            }
            break;
        default:
            literal.push_back(lower_byte(c));
            break;
        }
    }
    emit_literal_trigrams(literal, out, seen);
    return out;
}

PostingList intersect_sorted(const PostingList& a, const PostingList& b) {
    PostingList result;
    result.reserve(std::min(a.size(), b.size()));
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (a[i] < b[j]) {
            ++i;
        } else if (a[i] > b[j]) {
            ++j;
        } else {
            result.push_back(a[i]);
            ++i;
            ++j;
        }
    }
    return result;
}

std::uint64_t fnv1a_64(std::string_view bytes) {
    std::uint64_t hash = FNV_OFFSET_BASIS;
    for (char c : bytes) {
        hash ^= static_cast<unsigned char>(c);
        hash *= FNV_PRIME;
    }
    return hash;
}

std::optional<std::filesystem::path> cache_directory() {
    auto settings = config::current();
    if (settings.cache_dir.has_value()) {
        return *settings.cache_dir;
    }
    auto root = platform::user_cache_root();
    if (!root) {
        return std::nullopt;
    }
    return *root / "fiq";
}

// ----------------------------------------------------------------------------
// TrigramIndex: построение и запрос
// ----------------------------------------------------------------------------

TrigramIndex TrigramIndex::build(const std::filesystem::path& root) {
    TrigramIndex idx;
    idx.root_ = root;

    auto records = io::walk(root, true, io::ScanMode::names_only(std::nullopt));

    // Префикс, который отрезается от абсолютных путей walker'а
    std::error_code ec;
    std::string prefix = platform::path_to_utf8(std::filesystem::absolute(root, ec));
    if (ec) {
        prefix = platform::path_to_utf8(root);
    }
    if (!prefix.empty() && prefix.back() != '/') {
        prefix.push_back('/');
    }

    idx.path_slots_.reserve(records.size());
    idx.path_data_.reserve(records.size() * 32);

    std::uint32_t id = 0;
    for (const auto& record : records) {
        std::string full = platform::path_to_utf8(record.path);
        std::string_view rel = full;
        if (rel.size() >= prefix.size() && rel.compare(0, prefix.size(), prefix) == 0) {
            rel.remove_prefix(prefix.size());
        }
        rel = clamp_relative_path(rel);

        PathSlot slot;
        slot.offset = static_cast<std::uint32_t>(idx.path_data_.size());
        slot.length = static_cast<std::uint16_t>(rel.size());
        idx.path_data_.append(rel.data(), rel.size());
        idx.path_slots_.push_back(slot);

        index_basename(platform::path_to_utf8(record.path.filename()), id, idx.trigrams_);
        ++id;
    }

    for (auto& entry : idx.trigrams_) {
        auto& list = entry.second;
        std::sort(list.begin(), list.end());
        list.erase(std::unique(list.begin(), list.end()), list.end());
    }

    idx.total_files_ = id;
    idx.built_at_ = platform::Clock::now();
    return idx;
}

std::optional<std::vector<std::filesystem::path>> TrigramIndex::query(
    std::string_view pattern) const {
    auto matcher = glob::GlobMatcher::compile(pattern);
    if (!matcher) {
        return std::nullopt;
    }
    auto wanted = extract_trigrams_from_glob(pattern);
    if (wanted.empty()) {
        return std::nullopt;
    }

    std::vector<std::filesystem::path> results;

    PostingList candidates;
    bool first = true;
    for (Trigram t : wanted) {
        const PostingList* list = postings(t);
        if (list == nullptr) {
            // Триграммы нет ни в одном имени
            return results;
        }
        if (first) {
            candidates = *list;
            first = false;
        } else {
            candidates = intersect_sorted(candidates, *list);
        }
        if (candidates.empty()) {
            return results;
        }
    }

    for (std::uint32_t id : candidates) {
        std::string_view rel = relative_path(id);
        if (!matcher->is_match(basename_of(rel))) {
            continue;
        }
        results.push_back(root_ / platform::path_from_utf8(rel));
    }
    return results;
}

bool TrigramIndex::is_fresh() const {
    auto mtime = platform::modified_time(root_);
    if (!mtime) {
        return false;
    }
    return *mtime <= built_at_;
}

std::string_view TrigramIndex::relative_path(std::uint32_t id) const {
    if (id >= path_slots_.size()) {
        return {};
    }
    const auto& slot = path_slots_[id];
    return std::string_view(path_data_).substr(slot.offset, slot.length);
}

const PostingList* TrigramIndex::postings(Trigram key) const {
    auto it = trigrams_.find(key);
    if (it == trigrams_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool TrigramIndex::operator==(const TrigramIndex& other) const {
    if (root_ != other.root_ || built_at_ != other.built_at_ ||
        total_files_ != other.total_files_ || path_data_ != other.path_data_ ||
        trigrams_ != other.trigrams_ || path_slots_.size() != other.path_slots_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < path_slots_.size(); ++i) {
        if (path_slots_[i].offset != other.path_slots_[i].offset ||
            path_slots_[i].length != other.path_slots_[i].length) {
            return false;
        }
    }
    return true;
}

// ----------------------------------------------------------------------------
// TrigramIndex: сериализация
// ----------------------------------------------------------------------------

std::string TrigramIndex::serialize() const {
    std::string out;
    std::string root_bytes = platform::path_to_utf8(root_);

    out.append(INDEX_MAGIC, sizeof(INDEX_MAGIC));
    put_u32(out, INDEX_FORMAT_VERSION);
    put_u32(out, static_cast<std::uint32_t>(root_bytes.size()));
    out.append(root_bytes);
    put_u64(out, static_cast<std::uint64_t>(to_nanos(built_at_)));
    put_u32(out, total_files_);
    for (const auto& slot : path_slots_) {
        put_u32(out, slot.offset);
        put_u16(out, slot.length);
    }
    put_u32(out, static_cast<std::uint32_t>(path_data_.size()));
    out.append(path_data_);

    // Порядок ключей фиксируется, чтобы одинаковые индексы давали одинаковые байты
    std::vector<Trigram> keys;
    keys.reserve(trigrams_.size());
    for (const auto& entry : trigrams_) {
        keys.push_back(entry.first);
    }
    std::sort(keys.begin(), keys.end());

    put_u32(out, static_cast<std::uint32_t>(keys.size()));
    for (Trigram key : keys) {
        const auto& list = trigrams_.at(key);
        put_u32(out, key);
        put_u32(out, static_cast<std::uint32_t>(list.size()));
        for (std::uint32_t id : list) {
            put_u32(out, id);
        }
    }
    return out;
}

std::optional<TrigramIndex> TrigramIndex::deserialize(std::string_view bytes) {
    ByteReader r(bytes);

    std::string_view magic;
    if (!r.read_bytes(sizeof(INDEX_MAGIC), magic) ||
        std::memcmp(magic.data(), INDEX_MAGIC, sizeof(INDEX_MAGIC)) != 0) {
        return std::nullopt;
    }
    std::uint32_t version = 0;
    if (!r.read_u32(version) || version != INDEX_FORMAT_VERSION) {
        return std::nullopt;
    }

    TrigramIndex idx;

    std::uint32_t root_len = 0;
    std::string_view root_bytes;
    if (!r.read_u32(root_len) || !r.read_bytes(root_len, root_bytes)) {
        return std::nullopt;
    }
    idx.root_ = platform::path_from_utf8(root_bytes);

    std::uint64_t built_ns = 0;
    if (!r.read_u64(built_ns)) {
        return std::nullopt;
    }
    idx.built_at_ = from_nanos(static_cast<std::int64_t>(built_ns));

    if (!r.read_u32(idx.total_files_)) {
        return std::nullopt;
    }
    // 6 байт на слот: отсекаем заведомо невозможные счётчики до reserve
    if (static_cast<std::uint64_t>(idx.total_files_) * 6 > r.remaining()) {
        return std::nullopt;
    }
    idx.path_slots_.resize(idx.total_files_);
    for (auto& slot : idx.path_slots_) {
        if (!r.read_u32(slot.offset) || !r.read_u16(slot.length)) {
            return std::nullopt;
        }
    }

    std::uint32_t data_len = 0;
    std::string_view data;
    if (!r.read_u32(data_len) || !r.read_bytes(data_len, data)) {
        return std::nullopt;
    }
    idx.path_data_.assign(data.data(), data.size());
    for (const auto& slot : idx.path_slots_) {
        if (static_cast<std::uint64_t>(slot.offset) + slot.length > idx.path_data_.size()) {
            return std::nullopt;
        }
    }

    std::uint32_t trigram_count = 0;
    if (!r.read_u32(trigram_count)) {
        return std::nullopt;
    }
    if (static_cast<std::uint64_t>(trigram_count) * 8 > r.remaining()) {
        return std::nullopt;
    }
    idx.trigrams_.reserve(trigram_count);
    for (std::uint32_t k = 0; k < trigram_count; ++k) {
        std::uint32_t key = 0;
        std::uint32_t n = 0;
        if (!r.read_u32(key) || !r.read_u32(n) || key > MAX_TRIGRAM) {
            return std::nullopt;
        }
        if (n == 0 || static_cast<std::uint64_t>(n) * 4 > r.remaining()) {
            return std::nullopt;
        }
        PostingList list(n);
        for (std::uint32_t i = 0; i < n; ++i) {
            if (!r.read_u32(list[i]) || list[i] >= idx.total_files_) {
                return std::nullopt;
            }
            // Строго возрастающий список
            if (i > 0 && list[i] <= list[i - 1]) {
                return std::nullopt;
            }
        }
        if (!idx.trigrams_.emplace(key, std::move(list)).second) {
            return std::nullopt;
        }
    }

    if (r.remaining() != 0) {
        return std::nullopt;
    }
    return idx;
}

std::optional<std::filesystem::path> TrigramIndex::cache_path(const std::filesystem::path& root) {
    auto dir = cache_directory();
    if (!dir) {
        return std::nullopt;
    }
    char name[32];
    std::snprintf(name, sizeof(name), "%016llx.idx",
                  static_cast<unsigned long long>(fnv1a_64(platform::path_to_utf8(root))));
    return *dir / name;
}

bool TrigramIndex::save_to_cache() const {
    auto path = cache_path(root_);
    if (!path) {
        return false;
    }
    std::error_code ec;
    std::filesystem::create_directories(path->parent_path(), ec);
    if (ec) {
        return false;
    }

    std::string bytes = serialize();
    std::ofstream out(*path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    return static_cast<bool>(out);
}

std::optional<TrigramIndex> TrigramIndex::load_cached(const std::filesystem::path& root) {
    auto path = cache_path(root);
    if (!path) {
        return std::nullopt;
    }
    auto bytes = platform::read_file(*path);
    if (!bytes) {
        return std::nullopt;
    }
    auto idx = deserialize(*bytes);
    if (!idx) {
        return std::nullopt;
    }
    if (idx->root_ != root || !idx->is_fresh()) {
        return std::nullopt;
    }
    return idx;
}

}  // namespace fiq::index
