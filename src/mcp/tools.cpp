// ==============================================================================
// tools.cpp - Инструменты сервера: схемы и обработчики
// ==============================================================================

#include "fiq/duplicates.hpp"
#include "fiq/index_cache.hpp"
#include "fiq/mcp.hpp"
#include "fiq/organize.hpp"
#include "fiq/platform.hpp"
#include "fiq/report.hpp"
#include "fiq/search.hpp"
#include "fiq/stats.hpp"

#include <rapidjson/error/en.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace fiq::mcp {

namespace {

const char* const MISSING_DIRECTORY = "Missing required parameter: directory";

// ----------------------------------------------------------------------------
// Схемы
// ----------------------------------------------------------------------------

// Схемы хранятся как JSON-текст и разбираются при запросе tools/list
const char* const TOOL_DEFINITIONS_JSON = R"json({
  "tools": [
    {
      "name": "scan_stats",
      "description": "Get file statistics for a directory: total files, total size, breakdown by extension, and largest files.",
      "inputSchema": {
        "type": "object",
        "properties": {
          "directory": {"type": "string", "description": "Directory path to scan"},
          "top_n": {"type": "integer", "description": "Number of largest files to return", "default": 10},
          "recursive": {"type": "boolean", "description": "Scan subdirectories", "default": true}
        },
        "required": ["directory"]
      }
    },
    {
      "name": "find_duplicates",
      "description": "Find duplicate files by content hash (SHA-256). Groups files by size first, then hashes only potential duplicates.",
      "inputSchema": {
        "type": "object",
        "properties": {
          "directory": {"type": "string", "description": "Directory path to scan"},
          "min_size": {"type": "integer", "description": "Minimum file size in bytes to consider", "default": 1},
          "recursive": {"type": "boolean", "description": "Scan subdirectories", "default": true}
        },
        "required": ["directory"]
      }
    },
    {
      "name": "search_files",
      "description": "Search for files by name pattern, content, size range, and date range. Name-only searches use a cached trigram index.",
      "inputSchema": {
        "type": "object",
        "properties": {
          "directory": {"type": "string", "description": "Directory path to search"},
          "name": {"type": "string", "description": "Glob pattern for file names (e.g. '*.rs', '*.{js,ts}')"},
          "content": {"type": "string", "description": "Search file contents for this string (case-insensitive)"},
          "min_size": {"type": "string", "description": "Minimum file size (e.g. '1KB', '10MB')"},
          "max_size": {"type": "string", "description": "Maximum file size (e.g. '100MB', '1GB')"},
          "newer": {"type": "string", "description": "Files modified after this time (e.g. '2024-01-01', '7d', '24h')"},
          "older": {"type": "string", "description": "Files modified before this time (e.g. '2024-01-01', '7d', '24h')"},
          "recursive": {"type": "boolean", "description": "Search subdirectories", "default": true}
        },
        "required": ["directory"]
      }
    },
    {
      "name": "organize_files",
      "description": "Organize files into folders by type, date, or size. Supports dry-run mode to preview changes without moving files.",
      "inputSchema": {
        "type": "object",
        "properties": {
          "directory": {"type": "string", "description": "Directory to organize"},
          "by": {"type": "string", "description": "Organization strategy: 'type', 'date', or 'size'", "enum": ["type", "date", "size"], "default": "type"},
          "dry_run": {"type": "boolean", "description": "Preview changes without moving files", "default": true},
          "mode": {"type": "string", "description": "Collision handling: 'skip', 'rename', or 'overwrite'", "enum": ["skip", "rename", "overwrite"], "default": "rename"},
          "recursive": {"type": "boolean", "description": "Process subdirectories", "default": true},
          "output": {"type": "string", "description": "Output directory (default: organize in-place)"}
        },
        "required": ["directory"]
      }
    },
    {
      "name": "build_index",
      "description": "Rebuild the trigram filename index for a directory and store it in the index cache.",
      "inputSchema": {
        "type": "object",
        "properties": {
          "directory": {"type": "string", "description": "Directory to index"}
        },
        "required": ["directory"]
      }
    }
  ]
})json";

// ----------------------------------------------------------------------------
// Аргументы
// ----------------------------------------------------------------------------

std::optional<std::string> get_string(const rapidjson::Value& args, const char* key) {
    if (!args.IsObject()) {
        return std::nullopt;
    }
    auto it = args.FindMember(key);
    if (it == args.MemberEnd() || !it->value.IsString()) {
        return std::nullopt;
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

std::optional<std::uint64_t> get_u64(const rapidjson::Value& args, const char* key) {
    if (!args.IsObject()) {
        return std::nullopt;
    }
    auto it = args.FindMember(key);
    if (it == args.MemberEnd() || !it->value.IsUint64()) {
        return std::nullopt;
    }
    return it->value.GetUint64();
}

std::optional<bool> get_bool(const rapidjson::Value& args, const char* key) {
    if (!args.IsObject()) {
        return std::nullopt;
    }
    auto it = args.FindMember(key);
    if (it == args.MemberEnd() || !it->value.IsBool()) {
        return std::nullopt;
    }
    return it->value.GetBool();
}

ToolResult pretty(const rapidjson::Value& value) {
    return ToolResult::success(output::json_to_pretty_string(value));
}

// ----------------------------------------------------------------------------
// Обработчики
// ----------------------------------------------------------------------------

ToolResult handle_scan_stats(const rapidjson::Value& args) {
    auto directory = get_string(args, "directory");
    if (!directory) {
        return ToolResult::error(MISSING_DIRECTORY);
    }
    auto top_n = static_cast<std::size_t>(get_u64(args, "top_n").value_or(stats::DEFAULT_TOP_N));
    bool recursive = get_bool(args, "recursive").value_or(true);

    auto result = stats::run_stats(platform::path_from_utf8(*directory), top_n, recursive);
    return pretty(report::to_json(result));
}

ToolResult handle_find_duplicates(const rapidjson::Value& args) {
    auto directory = get_string(args, "directory");
    if (!directory) {
        return ToolResult::error(MISSING_DIRECTORY);
    }
    auto min_size = get_u64(args, "min_size").value_or(1);
    bool recursive = get_bool(args, "recursive").value_or(true);

    auto result =
        duplicates::run_duplicates(platform::path_from_utf8(*directory), min_size, recursive);
    return pretty(report::to_json(result));
}

ToolResult handle_search_files(const rapidjson::Value& args) {
    auto directory = get_string(args, "directory");
    if (!directory) {
        return ToolResult::error(MISSING_DIRECTORY);
    }
    search::SearchParams params;
    params.directory = platform::path_from_utf8(*directory);
    params.name_pattern = get_string(args, "name");
    params.content_query = get_string(args, "content");
    params.min_size = get_string(args, "min_size");
    params.max_size = get_string(args, "max_size");
    params.newer = get_string(args, "newer");
    params.older = get_string(args, "older");
    params.recursive = get_bool(args, "recursive").value_or(true);

    // Долгоживущий процесс: индекс держим в памяти между вызовами
    auto result = search::run_search(params, true);
    return pretty(report::to_json(result));
}

ToolResult handle_organize_files(const rapidjson::Value& args) {
    auto directory = get_string(args, "directory");
    if (!directory) {
        return ToolResult::error(MISSING_DIRECTORY);
    }

    organize::OrganizeParams params;
    params.directory = platform::path_from_utf8(*directory);

    auto by = get_string(args, "by").value_or("type");
    auto strategy = organize::parse_strategy(by);
    if (!strategy) {
        return ToolResult::error("Invalid organization strategy: " + by +
                                 " (expected type, date or size)");
    }
    params.by = *strategy;

    auto mode = get_string(args, "mode").value_or("rename");
    auto conflict = organize::parse_conflict_mode(mode);
    if (!conflict) {
        return ToolResult::error("Invalid conflict mode: " + mode +
                                 " (expected skip, rename or overwrite)");
    }
    params.mode = *conflict;

    params.dry_run = get_bool(args, "dry_run").value_or(true);
    params.recursive = get_bool(args, "recursive").value_or(true);
    if (auto out = get_string(args, "output")) {
        params.output = platform::path_from_utf8(*out);
    }

    auto result = organize::run_organize(params);
    return pretty(report::to_json(result));
}

ToolResult handle_build_index(const rapidjson::Value& args) {
    auto directory = get_string(args, "directory");
    if (!directory) {
        return ToolResult::error(MISSING_DIRECTORY);
    }
    auto idx = index::build_index(platform::path_from_utf8(*directory), true);
    return pretty(report::to_json(report::summarize_index(*idx)));
}

}  // namespace

// ----------------------------------------------------------------------------
// ToolResult
// ----------------------------------------------------------------------------

ToolResult ToolResult::success(std::string text) {
    ToolResult r;
    r.text = std::move(text);
    r.is_error = false;
    return r;
}

ToolResult ToolResult::error(std::string message) {
    ToolResult r;
    r.text = std::move(message);
    r.is_error = true;
    return r;
}

rapidjson::Document ToolResult::to_json() const {
    rapidjson::Document doc(rapidjson::kObjectType);
    auto& alloc = doc.GetAllocator();

    rapidjson::Value item(rapidjson::kObjectType);
    item.AddMember("type", "text", alloc);
    rapidjson::Value t;
    t.SetString(text.data(), static_cast<rapidjson::SizeType>(text.size()), alloc);
    item.AddMember("text", t, alloc);

    rapidjson::Value content(rapidjson::kArrayType);
    content.PushBack(item, alloc);
    doc.AddMember("content", content, alloc);
    doc.AddMember("isError", is_error, alloc);
    return doc;
}

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

rapidjson::Document tool_definitions() {
    rapidjson::Document doc;
    doc.Parse(TOOL_DEFINITIONS_JSON);
    if (doc.HasParseError()) {
        throw std::runtime_error(std::string("tool definitions: ") +
                                 rapidjson::GetParseError_En(doc.GetParseError()));
    }
    return doc;
}

std::optional<ToolResult> call_tool(std::string_view name, const rapidjson::Value& arguments) {
    if (name == "scan_stats") {
        return handle_scan_stats(arguments);
    }
    if (name == "find_duplicates") {
        return handle_find_duplicates(arguments);
    }
    if (name == "search_files") {
        return handle_search_files(arguments);
    }
    if (name == "organize_files") {
        return handle_organize_files(arguments);
    }
    if (name == "build_index") {
        return handle_build_index(arguments);
    }
    return std::nullopt;
}

}  // namespace fiq::mcp
