// ==============================================================================
// index_cache.cpp - Двухуровневый кэш триграммных индексов
// ==============================================================================

#include "fiq/index_cache.hpp"

#include <map>
#include <mutex>
#include <system_error>
#include <utility>

namespace fiq::index {

namespace {

using IndexMap = std::map<std::filesystem::path, IndexPtr>;

struct MemoryCache {
    std::mutex mutex;
    std::unique_ptr<IndexMap> map;  // создаётся при первой записи
};

MemoryCache& memory_cache() {
    static MemoryCache cache;
    return cache;
}

IndexPtr lookup_fresh(const std::filesystem::path& canonical) {
    auto& cache = memory_cache();
    std::lock_guard<std::mutex> lock(cache.mutex);
    if (!cache.map) {
        return nullptr;
    }
    auto it = cache.map->find(canonical);
    if (it == cache.map->end() || !it->second->is_fresh()) {
        return nullptr;
    }
    return it->second;
}

void store(const std::filesystem::path& canonical, IndexPtr idx) {
    auto& cache = memory_cache();
    std::lock_guard<std::mutex> lock(cache.mutex);
    if (!cache.map) {
        cache.map = std::make_unique<IndexMap>();
    }
    (*cache.map)[canonical] = std::move(idx);
}

/// Построить, записать на диск (ошибка записи не важна), опционально запомнить
IndexPtr build_and_store(const std::filesystem::path& canonical, bool use_memory_cache) {
    auto idx = std::make_shared<const TrigramIndex>(TrigramIndex::build(canonical));
    // Кэш на диске необязателен: при неудаче следующий вызов просто перестроит
    static_cast<void>(idx->save_to_cache());
    if (use_memory_cache) {
        store(canonical, idx);
    }
    return idx;
}

}  // namespace

std::filesystem::path canonical_root(const std::filesystem::path& root) {
    std::error_code ec;
    auto canonical = std::filesystem::canonical(root, ec);
    if (ec) {
        return root;
    }
    return canonical;
}

IndexPtr get_or_build_index(const std::filesystem::path& root, bool use_memory_cache) {
    auto canonical = canonical_root(root);

    if (use_memory_cache) {
        if (auto idx = lookup_fresh(canonical)) {
            return idx;
        }
    }

    if (auto loaded = TrigramIndex::load_cached(canonical)) {
        auto idx = std::make_shared<const TrigramIndex>(std::move(*loaded));
        if (use_memory_cache) {
            store(canonical, idx);
        }
        return idx;
    }

    return build_and_store(canonical, use_memory_cache);
}

IndexPtr build_index(const std::filesystem::path& root, bool use_memory_cache) {
    return build_and_store(canonical_root(root), use_memory_cache);
}

std::optional<search::SearchResult> try_indexed_search(const std::filesystem::path& dir,
                                                       std::string_view name_pattern,
                                                       bool recursive, bool use_memory_cache) {
    // Индекс всегда покрывает всё дерево
    if (!recursive) {
        return std::nullopt;
    }
    if (extract_trigrams_from_glob(name_pattern).empty()) {
        return std::nullopt;
    }

    auto idx = get_or_build_index(dir, use_memory_cache);
    auto paths = idx->query(name_pattern);
    if (!paths) {
        return std::nullopt;
    }

    search::SearchResult result;
    result.matches.reserve(paths->size());
    for (const auto& p : *paths) {
        search::SearchMatch match;
        match.path = platform::path_to_utf8(p);
        match.size = 0;
        result.matches.push_back(std::move(match));
    }
    result.total_matches = result.matches.size();
    result.files_scanned = idx->total_files();
    return result;
}

std::size_t memory_cache_size() {
    auto& cache = memory_cache();
    std::lock_guard<std::mutex> lock(cache.mutex);
    return cache.map ? cache.map->size() : 0;
}

void clear_memory_cache() {
    auto& cache = memory_cache();
    std::lock_guard<std::mutex> lock(cache.mutex);
    cache.map.reset();
}

}  // namespace fiq::index
