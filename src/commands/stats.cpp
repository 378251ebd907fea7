// ==============================================================================
// stats.cpp - Сводная статистика по дереву
// ==============================================================================

#include "fiq/stats.hpp"

#include "fiq/walker.hpp"

#include <algorithm>
#include <map>

namespace fiq::stats {

StatsResult run_stats(const std::filesystem::path& directory, std::size_t top_n, bool recursive) {
    auto files = io::walk(directory, recursive, io::ScanMode::full());

    StatsResult result;
    result.total_files = files.size();

    std::map<std::string, ExtensionStats> by_ext;
    for (const auto& f : files) {
        result.total_size += f.size;
        const std::string key = f.extension.value_or(NO_EXTENSION_LABEL);
        auto& entry = by_ext[key];
        entry.extension = key;
        entry.count += 1;
        entry.total_size += f.size;
    }

    result.by_extension.reserve(by_ext.size());
    for (auto& entry : by_ext) {
        result.by_extension.push_back(std::move(entry.second));
    }
    // map уже упорядочен по имени: stable_sort сохраняет его при равных размерах
    std::stable_sort(result.by_extension.begin(), result.by_extension.end(),
                     [](const ExtensionStats& a, const ExtensionStats& b) {
                         return a.total_size > b.total_size;
                     });

    std::size_t n = std::min(top_n, files.size());
    std::partial_sort(files.begin(), files.begin() + static_cast<std::ptrdiff_t>(n), files.end(),
                      [](const io::FileRecord& a, const io::FileRecord& b) {
                          if (a.size != b.size) {
                              return a.size > b.size;
                          }
                          return a.path < b.path;
                      });

    result.largest_files.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        result.largest_files.push_back(FileEntry{platform::path_to_utf8(files[i].path), files[i].size});
    }
    return result;
}

}  // namespace fiq::stats
