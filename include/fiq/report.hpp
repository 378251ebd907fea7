// ==============================================================================
// fiq/report.hpp - Представление результатов команд
// ==============================================================================
//
// Назначение:
// - JSON-представление результатов (RapidJSON), общее для --json и сервера
// - Текстовый вывод результатов через output::Writer
//
// ==============================================================================

#ifndef FIQ_REPORT_HPP
#define FIQ_REPORT_HPP

#include "fiq/duplicates.hpp"
#include "fiq/organize.hpp"
#include "fiq/output.hpp"
#include "fiq/search.hpp"
#include "fiq/stats.hpp"
#include "fiq/trigram_index.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <rapidjson/document.h>
#include <string>

namespace fiq::report {

/// Сводка по построенному индексу (build-index / build_index)
struct IndexSummary {
    std::string root;
    std::uint32_t total_files = 0;
    std::size_t trigram_count = 0;
    std::optional<std::string> cache_file;
    bool saved = false;
};

/// Собрать сводку по индексу
IndexSummary summarize_index(const index::TrigramIndex& idx);

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

rapidjson::Document to_json(const stats::StatsResult& r);
rapidjson::Document to_json(const duplicates::DuplicatesResult& r);
rapidjson::Document to_json(const search::SearchResult& r);
rapidjson::Document to_json(const organize::OrganizeResult& r);
rapidjson::Document to_json(const IndexSummary& r);

// ----------------------------------------------------------------------------
// Текст
// ----------------------------------------------------------------------------

void render(output::Writer& w, const stats::StatsResult& r);
void render(output::Writer& w, const duplicates::DuplicatesResult& r);
void render(output::Writer& w, const search::SearchResult& r);
void render(output::Writer& w, const organize::OrganizeResult& r);
void render(output::Writer& w, const IndexSummary& r);

}  // namespace fiq::report

#endif  // FIQ_REPORT_HPP
