// ==============================================================================
// duplicates.cpp - Поиск файлов-дубликатов
// ==============================================================================

#include "fiq/duplicates.hpp"

#include "fiq/hasher.hpp"
#include "fiq/parallel.hpp"
#include "fiq/walker.hpp"

#include <algorithm>
#include <optional>
#include <unordered_map>

namespace fiq::duplicates {

DuplicatesResult run_duplicates(const std::filesystem::path& directory, std::uint64_t min_size,
                                bool recursive) {
    auto files = io::walk(directory, recursive, io::ScanMode::full());

    DuplicatesResult result;
    result.total_files_scanned = files.size();

    // Проход 1: размер
    std::unordered_map<std::uint64_t, std::vector<const io::FileRecord*>> by_size;
    for (const auto& f : files) {
        if (f.size >= min_size) {
            by_size[f.size].push_back(&f);
        }
    }

    std::vector<const io::FileRecord*> candidates;
    for (auto& entry : by_size) {
        if (entry.second.size() > 1) {
            candidates.insert(candidates.end(), entry.second.begin(), entry.second.end());
        }
    }

    // Проход 2: хеш
    std::vector<std::optional<std::string>> fingerprints(candidates.size());
    parallel::for_each_index(candidates.size(), [&](std::size_t i) {
        fingerprints[i] = hash::hash_file(candidates[i]->path, candidates[i]->size);
    });

    std::unordered_map<std::string, DuplicateGroup> by_hash;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (!fingerprints[i]) {
            continue;  // файл не прочитан
        }
        auto& group = by_hash[*fingerprints[i]];
        if (group.files.empty()) {
            group.hash = *fingerprints[i];
            group.size = candidates[i]->size;
        }
        group.files.push_back(platform::path_to_utf8(candidates[i]->path));
    }

    for (auto& entry : by_hash) {
        auto& group = entry.second;
        if (group.files.size() < 2) {
            continue;
        }
        std::sort(group.files.begin(), group.files.end());
        result.total_wasted_bytes += group.wasted_bytes();
        result.duplicate_groups.push_back(std::move(group));
    }

    std::sort(result.duplicate_groups.begin(), result.duplicate_groups.end(),
              [](const DuplicateGroup& a, const DuplicateGroup& b) {
                  if (a.wasted_bytes() != b.wasted_bytes()) {
                      return a.wasted_bytes() > b.wasted_bytes();
                  }
                  return a.hash < b.hash;
              });

    return result;
}

}  // namespace fiq::duplicates
