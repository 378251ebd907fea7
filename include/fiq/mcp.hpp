// ==============================================================================
// fiq/mcp.hpp - JSON-RPC 2.0 сервер инструментов (MCP) поверх stdio
// ==============================================================================
//
// Протокол:
// - одна строка stdin = один JSON-RPC запрос, одна строка stdout = один ответ
// - запрос без "id" (или с "id": null) - уведомление, ответа нет
// - запросы обрабатываются строго последовательно
// - stdout занят протоколом; диагностика идёт в stderr через output::Writer
//
// Методы: initialize, ping, tools/list, tools/call.
// Инструменты: scan_stats, find_duplicates, search_files, organize_files, build_index.
//
// ==============================================================================

#ifndef FIQ_MCP_HPP
#define FIQ_MCP_HPP

#include "fiq/output.hpp"

#include <iosfwd>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <string_view>

namespace fiq::mcp {

// ----------------------------------------------------------------------------
// Константы протокола
// ----------------------------------------------------------------------------

constexpr const char* PROTOCOL_VERSION = "2024-11-05";
constexpr const char* SERVER_NAME = "fiq";

constexpr int PARSE_ERROR = -32700;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// ----------------------------------------------------------------------------
// Инструменты
// ----------------------------------------------------------------------------

/// Результат вызова инструмента: текст (pretty JSON) + флаг ошибки
struct ToolResult {
    std::string text;
    bool is_error = false;

    static ToolResult success(std::string text);
    static ToolResult error(std::string message);

    /// {"content":[{"type":"text","text":...}],"isError":...}
    rapidjson::Document to_json() const;
};

/// Описание всех инструментов с JSON Schema входных параметров ({"tools":[...]})
rapidjson::Document tool_definitions();

/// Вызвать инструмент. nullopt для неизвестного имени.
/// arguments - объект аргументов (не объект трактуется как пустой).
std::optional<ToolResult> call_tool(std::string_view name, const rapidjson::Value& arguments);

// ----------------------------------------------------------------------------
// Server
// ----------------------------------------------------------------------------

class Server {
public:
    /// diag - поток диагностики (stderr)
    explicit Server(output::Writer& diag);

    /// Читать запросы из in до EOF, писать ответы в out
    void run(std::istream& in, std::ostream& out);

    /// Обработать одну строку. nullopt - ответ не нужен
    /// (пустая строка или уведомление).
    std::optional<std::string> handle_line(std::string_view line);

private:
    rapidjson::Document dispatch(const std::string& method, const rapidjson::Value* params,
                                 const rapidjson::Value& id);

    output::Writer& diag_;
};

/// Запустить сервер на stdin/stdout
int run_stdio_server(output::Writer& diag);

}  // namespace fiq::mcp

#endif  // FIQ_MCP_HPP
