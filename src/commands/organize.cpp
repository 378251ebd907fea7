// ==============================================================================
// organize.cpp - Раскладка файлов по категориям
// ==============================================================================

#include "fiq/organize.hpp"

#include "fiq/walker.hpp"

#include <algorithm>
#include <cerrno>
#include <ctime>
#include <map>
#include <system_error>
#include <unordered_map>

namespace fiq::organize {

namespace {

const std::unordered_map<std::string_view, const char*>& type_table() {
    static const std::unordered_map<std::string_view, const char*> table = [] {
        std::unordered_map<std::string_view, const char*> t;
        auto add = [&t](std::initializer_list<std::string_view> exts, const char* category) {
            for (auto e : exts) {
                t.emplace(e, category);
            }
        };
        add({"jpg", "jpeg", "png", "gif", "bmp", "svg", "webp", "ico", "tiff", "tif"}, "Images");
        add({"mp4", "mkv", "avi", "mov", "wmv", "flv", "webm"}, "Videos");
        add({"mp3", "wav", "flac", "aac", "ogg", "wma", "m4a"}, "Audio");
        add({"pdf", "doc", "docx", "xls", "xlsx", "ppt", "pptx", "odt", "ods", "odp", "txt",
             "rtf", "csv", "md"},
            "Documents");
        add({"zip", "tar", "gz", "bz2", "xz", "7z", "rar", "zst"}, "Archives");
        add({"rs",   "py",  "js",   "ts",   "go",  "c",    "cpp", "h",   "hpp", "java",
             "rb",   "php", "swift", "kt",  "cs",  "sh",   "bash", "zsh", "fish", "ps1",
             "toml", "yaml", "yml", "json", "xml", "html", "css", "scss", "less", "sql",
             "r",    "lua", "vim",  "el",   "ex",  "exs",  "hs",  "ml",  "clj"},
            "Code");
        add({"exe", "msi", "dmg", "app", "deb", "rpm", "appimage", "bin"}, "Executables");
        add({"ttf", "otf", "woff", "woff2", "eot"}, "Fonts");
        add({"iso", "img", "vmdk", "vdi", "qcow2"}, "DiskImages");
        return t;
    }();
    return table;
}

/// stem_N.ext рядом с dest
std::filesystem::path numbered_path(const std::filesystem::path& dest, std::size_t n) {
    std::string stem = platform::path_to_utf8(dest.stem());
    std::string ext = platform::path_to_utf8(dest.extension());
    if (stem.empty()) {
        stem = "file";
    }
    return dest.parent_path() /
           platform::path_from_utf8(stem + "_" + std::to_string(n) + ext);
}

/// Первый свободный stem_N.ext, N в [1, MAX_RENAME_SUFFIX]
std::optional<std::filesystem::path> free_numbered_path(const std::filesystem::path& dest) {
    for (int i = 1; i <= MAX_RENAME_SUFFIX; ++i) {
        auto candidate = numbered_path(dest, static_cast<std::size_t>(i));
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec) && !ec) {
            return candidate;
        }
    }
    return std::nullopt;
}

/// rename(), при EXDEV - copy + remove. Пустая строка = успех.
std::string move_file(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return {};
    }
    if (ec.value() != EXDEV) {
        return "Failed to move " + platform::path_to_utf8(from) + " -> " +
               platform::path_to_utf8(to) + ": " + ec.message();
    }

    std::error_code copy_ec;
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing,
                               copy_ec);
    if (!copy_ec) {
        std::filesystem::remove(from, copy_ec);
    }
    if (copy_ec) {
        return "Failed to copy " + platform::path_to_utf8(from) + " -> " +
               platform::path_to_utf8(to) + ": " + copy_ec.message();
    }
    return {};
}

std::string category_for(const io::FileRecord& f, Strategy by) {
    switch (by) {
    case Strategy::Type:
        return categorize_by_type(f.extension.value_or(std::string()));
    case Strategy::Date:
        return categorize_by_date(f.modified);
    case Strategy::Size:
        return categorize_by_size(f.size);
    }
    return categorize_by_type(std::string_view());
}

}  // namespace

// ----------------------------------------------------------------------------
// Разбор параметров
// ----------------------------------------------------------------------------

std::optional<Strategy> parse_strategy(std::string_view s) {
    if (s == "type") {
        return Strategy::Type;
    }
    if (s == "date") {
        return Strategy::Date;
    }
    if (s == "size") {
        return Strategy::Size;
    }
    return std::nullopt;
}

std::optional<ConflictMode> parse_conflict_mode(std::string_view s) {
    if (s == "skip") {
        return ConflictMode::Skip;
    }
    if (s == "rename") {
        return ConflictMode::Rename;
    }
    if (s == "overwrite") {
        return ConflictMode::Overwrite;
    }
    return std::nullopt;
}

const char* strategy_name(Strategy s) {
    switch (s) {
    case Strategy::Type:
        return "type";
    case Strategy::Date:
        return "date";
    case Strategy::Size:
        return "size";
    }
    return "type";
}

const char* conflict_mode_name(ConflictMode m) {
    switch (m) {
    case ConflictMode::Skip:
        return "skip";
    case ConflictMode::Rename:
        return "rename";
    case ConflictMode::Overwrite:
        return "overwrite";
    }
    return "rename";
}

// ----------------------------------------------------------------------------
// Категории
// ----------------------------------------------------------------------------

const char* categorize_by_type(std::string_view extension) {
    const auto& table = type_table();
    auto it = table.find(extension);
    if (it == table.end()) {
        return "Other";
    }
    return it->second;
}

std::string categorize_by_date(const std::optional<platform::TimePoint>& modified) {
    if (!modified) {
        return "Unknown";
    }
    std::time_t t = platform::Clock::to_time_t(*modified);
    std::tm local{};
    if (localtime_r(&t, &local) == nullptr) {
        return "Unknown";
    }
    char buf[16];
    if (std::strftime(buf, sizeof(buf), "%Y/%m", &local) == 0) {
        return "Unknown";
    }
    return buf;
}

const char* categorize_by_size(std::uint64_t size) {
    if (size == 0) {
        return "Empty";
    }
    if (size < 1000ULL) {
        return "Tiny (< 1KB)";
    }
    if (size < 1000000ULL) {
        return "Small (1KB-1MB)";
    }
    if (size < 100000000ULL) {
        return "Medium (1MB-100MB)";
    }
    if (size < 1000000000ULL) {
        return "Large (100MB-1GB)";
    }
    return "Huge (> 1GB)";
}

// ----------------------------------------------------------------------------
// run_organize
// ----------------------------------------------------------------------------

OrganizeResult run_organize(const OrganizeParams& params) {
    auto files = io::walk(params.directory, params.recursive, io::ScanMode::full());
    // Порядок обхода не определён; сортировка делает план воспроизводимым
    std::sort(files.begin(), files.end(),
              [](const io::FileRecord& a, const io::FileRecord& b) { return a.path < b.path; });

    OrganizeResult result;
    result.total_files = files.size();
    result.dry_run = params.dry_run;

    std::error_code ec;
    std::filesystem::path base = params.output.value_or(params.directory);
    base = std::filesystem::absolute(base, ec);
    if (ec) {
        result.errors.push_back("Failed to resolve " + platform::path_to_utf8(base) + ": " +
                                ec.message());
        return result;
    }

    // Счётчики назначений для имитации rename при dry-run
    std::map<std::filesystem::path, std::size_t> dest_counts;

    for (const auto& f : files) {
        std::filesystem::path dest_dir = base / platform::path_from_utf8(category_for(f, params.by));
        std::filesystem::path dest = dest_dir / f.path.filename();

        if (f.path == dest) {
            continue;
        }

        std::filesystem::path final_dest = dest;

        if (params.dry_run) {
            std::size_t count = ++dest_counts[dest];
            if (count > 1 && params.mode == ConflictMode::Rename) {
                final_dest = numbered_path(dest, count - 1);
            }
        } else {
            std::error_code dir_ec;
            std::filesystem::create_directories(dest_dir, dir_ec);
            if (dir_ec) {
                result.errors.push_back("Failed to create " + platform::path_to_utf8(dest_dir) +
                                        ": " + dir_ec.message());
                continue;
            }

            std::error_code exists_ec;
            bool exists = std::filesystem::exists(dest, exists_ec);
            if (exists && params.mode == ConflictMode::Skip) {
                continue;
            }
            if (exists && params.mode == ConflictMode::Rename) {
                auto free = free_numbered_path(dest);
                if (!free) {
                    result.errors.push_back("No free name for " + platform::path_to_utf8(dest) +
                                            " after " + std::to_string(MAX_RENAME_SUFFIX) +
                                            " attempts");
                    continue;
                }
                final_dest = *free;
            }

            std::string error = move_file(f.path, final_dest);
            if (!error.empty()) {
                result.errors.push_back(std::move(error));
                continue;
            }
        }

        FileMove move;
        move.from = platform::path_to_utf8(f.path);
        move.to = platform::path_to_utf8(final_dest);
        move.size = f.size;
        result.moves.push_back(std::move(move));
    }

    return result;
}

}  // namespace fiq::organize
