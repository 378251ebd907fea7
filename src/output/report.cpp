// ==============================================================================
// report.cpp - Представление результатов команд
// ==============================================================================

#include "fiq/report.hpp"

#include "fiq/platform.hpp"

#include <system_error>

namespace fiq::report {

namespace {

using Allocator = rapidjson::Document::AllocatorType;

rapidjson::Value make_string(const std::string& s, Allocator& alloc) {
    rapidjson::Value v;
    v.SetString(s.data(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

void write_field(output::Writer& w, std::string_view label, std::string_view value) {
    w.write(output::Stream::Stdout, "  ");
    w.write(output::Stream::Stdout, label);
    w.write_line(output::Stream::Stdout, value);
}

void write_title(output::Writer& w, std::string_view title) {
    w.write(output::Stream::Stdout, "\n");
    w.green_line(std::string("  ") + std::string(title));
    w.write(output::Stream::Stdout, "\n");
}

}  // namespace

IndexSummary summarize_index(const index::TrigramIndex& idx) {
    IndexSummary s;
    s.root = platform::path_to_utf8(idx.root());
    s.total_files = idx.total_files();
    s.trigram_count = idx.trigram_count();
    if (auto path = index::TrigramIndex::cache_path(idx.root())) {
        s.cache_file = platform::path_to_utf8(*path);
        std::error_code ec;
        s.saved = std::filesystem::is_regular_file(*path, ec);
    }
    return s;
}

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

rapidjson::Document to_json(const stats::StatsResult& r) {
    rapidjson::Document doc(rapidjson::kObjectType);
    auto& alloc = doc.GetAllocator();

    doc.AddMember("total_files", static_cast<std::uint64_t>(r.total_files), alloc);
    doc.AddMember("total_size", r.total_size, alloc);

    rapidjson::Value by_ext(rapidjson::kArrayType);
    for (const auto& e : r.by_extension) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("extension", make_string(e.extension, alloc), alloc);
        item.AddMember("count", static_cast<std::uint64_t>(e.count), alloc);
        item.AddMember("total_size", e.total_size, alloc);
        by_ext.PushBack(item, alloc);
    }
    doc.AddMember("by_extension", by_ext, alloc);

    rapidjson::Value largest(rapidjson::kArrayType);
    for (const auto& f : r.largest_files) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("path", make_string(f.path, alloc), alloc);
        item.AddMember("size", f.size, alloc);
        largest.PushBack(item, alloc);
    }
    doc.AddMember("largest_files", largest, alloc);
    return doc;
}

rapidjson::Document to_json(const duplicates::DuplicatesResult& r) {
    rapidjson::Document doc(rapidjson::kObjectType);
    auto& alloc = doc.GetAllocator();

    doc.AddMember("total_files_scanned", static_cast<std::uint64_t>(r.total_files_scanned), alloc);

    rapidjson::Value groups(rapidjson::kArrayType);
    for (const auto& g : r.duplicate_groups) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("hash", make_string(g.hash, alloc), alloc);
        item.AddMember("size", g.size, alloc);
        rapidjson::Value files(rapidjson::kArrayType);
        for (const auto& f : g.files) {
            files.PushBack(make_string(f, alloc), alloc);
        }
        item.AddMember("files", files, alloc);
        groups.PushBack(item, alloc);
    }
    doc.AddMember("duplicate_groups", groups, alloc);
    doc.AddMember("total_wasted_bytes", r.total_wasted_bytes, alloc);
    return doc;
}

rapidjson::Document to_json(const search::SearchResult& r) {
    rapidjson::Document doc(rapidjson::kObjectType);
    auto& alloc = doc.GetAllocator();

    rapidjson::Value matches(rapidjson::kArrayType);
    for (const auto& m : r.matches) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("path", make_string(m.path, alloc), alloc);
        item.AddMember("size", m.size, alloc);
        // content_matches только при поиске по содержимому
        if (m.content_matches) {
            rapidjson::Value lines(rapidjson::kArrayType);
            for (const auto& cm : *m.content_matches) {
                rapidjson::Value line(rapidjson::kObjectType);
                line.AddMember("line_number", static_cast<std::uint64_t>(cm.line_number), alloc);
                line.AddMember("line", make_string(cm.line, alloc), alloc);
                lines.PushBack(line, alloc);
            }
            item.AddMember("content_matches", lines, alloc);
        }
        matches.PushBack(item, alloc);
    }
    doc.AddMember("matches", matches, alloc);
    doc.AddMember("total_matches", static_cast<std::uint64_t>(r.total_matches), alloc);
    doc.AddMember("files_scanned", static_cast<std::uint64_t>(r.files_scanned), alloc);
    return doc;
}

rapidjson::Document to_json(const organize::OrganizeResult& r) {
    rapidjson::Document doc(rapidjson::kObjectType);
    auto& alloc = doc.GetAllocator();

    doc.AddMember("total_files", static_cast<std::uint64_t>(r.total_files), alloc);

    rapidjson::Value moves(rapidjson::kArrayType);
    for (const auto& m : r.moves) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("from", make_string(m.from, alloc), alloc);
        item.AddMember("to", make_string(m.to, alloc), alloc);
        item.AddMember("size", m.size, alloc);
        moves.PushBack(item, alloc);
    }
    doc.AddMember("moves", moves, alloc);
    doc.AddMember("dry_run", r.dry_run, alloc);

    rapidjson::Value errors(rapidjson::kArrayType);
    for (const auto& e : r.errors) {
        errors.PushBack(make_string(e, alloc), alloc);
    }
    doc.AddMember("errors", errors, alloc);
    return doc;
}

rapidjson::Document to_json(const IndexSummary& r) {
    rapidjson::Document doc(rapidjson::kObjectType);
    auto& alloc = doc.GetAllocator();

    doc.AddMember("root", make_string(r.root, alloc), alloc);
    doc.AddMember("total_files", static_cast<std::uint64_t>(r.total_files), alloc);
    doc.AddMember("trigrams", static_cast<std::uint64_t>(r.trigram_count), alloc);
    if (r.cache_file) {
        doc.AddMember("cache_file", make_string(*r.cache_file, alloc), alloc);
    } else {
        doc.AddMember("cache_file", rapidjson::Value(rapidjson::kNullType), alloc);
    }
    doc.AddMember("saved", r.saved, alloc);
    return doc;
}

// ----------------------------------------------------------------------------
// Текст
// ----------------------------------------------------------------------------

void render(output::Writer& w, const stats::StatsResult& r) {
    write_title(w, "Directory Stats");
    write_field(w, "Total files: ", std::to_string(r.total_files));
    write_field(w, "Total size:  ", output::format_size(r.total_size));

    if (!r.by_extension.empty()) {
        w.write(output::Stream::Stdout, "\n");
        w.yellow_line("  By Extension");
        output::Table table;
        table.set_headers({"Extension", "Count", "Size"});
        table.set_right_aligned(1);
        table.set_right_aligned(2);
        for (const auto& e : r.by_extension) {
            std::string label = e.extension == stats::NO_EXTENSION_LABEL
                                    ? e.extension
                                    : "." + e.extension;
            table.add_row({label, std::to_string(e.count), output::format_size(e.total_size)});
        }
        table.print(w);
    }

    if (!r.largest_files.empty()) {
        w.write(output::Stream::Stdout, "\n");
        w.yellow_line("  Largest Files");
        std::size_t i = 0;
        for (const auto& f : r.largest_files) {
            ++i;
            w.write_line(output::Stream::Stdout, "  " + std::to_string(i) + ". " + f.path + " (" +
                                                     output::format_size(f.size) + ")");
        }
    }
    w.write(output::Stream::Stdout, "\n");
}

void render(output::Writer& w, const duplicates::DuplicatesResult& r) {
    write_title(w, "Duplicate Files");
    write_field(w, "Files scanned: ", std::to_string(r.total_files_scanned));
    write_field(w, "Duplicate groups: ", std::to_string(r.duplicate_groups.size()));
    write_field(w, "Wasted space: ", output::format_size(r.total_wasted_bytes));
    w.write(output::Stream::Stdout, "\n");

    std::size_t i = 0;
    for (const auto& g : r.duplicate_groups) {
        ++i;
        w.yellow_line("  Group " + std::to_string(i) + " (" + output::format_size(g.size) + ", " +
                      std::to_string(g.files.size()) + " copies)");
        for (const auto& f : g.files) {
            w.write_line(output::Stream::Stdout, "    " + f);
        }
        w.write(output::Stream::Stdout, "\n");
    }
}

void render(output::Writer& w, const search::SearchResult& r) {
    write_title(w, "Search Results");
    write_field(w, "Files scanned: ", std::to_string(r.files_scanned));
    write_field(w, "Matches: ", std::to_string(r.total_matches));
    w.write(output::Stream::Stdout, "\n");

    for (const auto& m : r.matches) {
        w.green_line("  " + m.path + "  (" + output::format_size(m.size) + ")");
        if (!m.content_matches) {
            continue;
        }
        for (const auto& cm : *m.content_matches) {
            w.write_line(output::Stream::Stdout,
                         "    " + std::to_string(cm.line_number) + ": " + cm.line);
        }
    }
    w.write(output::Stream::Stdout, "\n");
}

void render(output::Writer& w, const organize::OrganizeResult& r) {
    write_title(w, r.dry_run ? "Organize Preview (dry run)" : "Organize Complete");
    write_field(w, "Total files: ", std::to_string(r.total_files));
    write_field(w, r.dry_run ? "Files to move: " : "Files moved: ", std::to_string(r.moves.size()));
    w.write(output::Stream::Stdout, "\n");

    for (const auto& m : r.moves) {
        w.write_line(output::Stream::Stdout, "  " + m.from + " -> " + m.to + "  (" +
                                                 output::format_size(m.size) + ")");
    }

    if (!r.errors.empty()) {
        w.write(output::Stream::Stdout, "\n");
        w.red_line("  Errors:");
        for (const auto& e : r.errors) {
            w.write_line(output::Stream::Stdout, "    " + e);
        }
    }
    w.write(output::Stream::Stdout, "\n");
}

void render(output::Writer& w, const IndexSummary& r) {
    write_title(w, "Index Built");
    write_field(w, "Root: ", r.root);
    write_field(w, "Files: ", std::to_string(r.total_files));
    write_field(w, "Trigrams: ", std::to_string(r.trigram_count));
    if (r.cache_file) {
        write_field(w, "Cache file: ", *r.cache_file + (r.saved ? "" : " (not written)"));
    }
    w.write(output::Stream::Stdout, "\n");
}

}  // namespace fiq::report
