// ==============================================================================
// server.cpp - JSON-RPC 2.0 сервер поверх stdio
// ==============================================================================
//
// Каждый запрос обрабатывается изолированно: исключение внутри обработчика
// превращается в ответ -32603, сессия продолжается.
//
// ==============================================================================

#include "fiq/cli.hpp"
#include "fiq/mcp.hpp"

#include <iostream>
#include <istream>
#include <ostream>
#include <rapidjson/error/en.h>
#include <stdexcept>
#include <string>

namespace fiq::mcp {

namespace {

// ----------------------------------------------------------------------------
// Формирование ответов
// ----------------------------------------------------------------------------

rapidjson::Document make_envelope(const rapidjson::Value& id) {
    rapidjson::Document doc(rapidjson::kObjectType);
    auto& alloc = doc.GetAllocator();
    doc.AddMember("jsonrpc", "2.0", alloc);
    doc.AddMember("id", rapidjson::Value(id, alloc), alloc);
    return doc;
}

rapidjson::Document make_result(const rapidjson::Value& id, const rapidjson::Value& result) {
    auto doc = make_envelope(id);
    auto& alloc = doc.GetAllocator();
    doc.AddMember("result", rapidjson::Value(result, alloc), alloc);
    return doc;
}

rapidjson::Document make_error(const rapidjson::Value& id, int code, const std::string& message) {
    auto doc = make_envelope(id);
    auto& alloc = doc.GetAllocator();
    rapidjson::Value error(rapidjson::kObjectType);
    error.AddMember("code", code, alloc);
    rapidjson::Value msg;
    msg.SetString(message.data(), static_cast<rapidjson::SizeType>(message.size()), alloc);
    error.AddMember("message", msg, alloc);
    doc.AddMember("error", error, alloc);
    return doc;
}

std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// ----------------------------------------------------------------------------
// Методы
// ----------------------------------------------------------------------------

rapidjson::Document initialize_result() {
    rapidjson::Document doc(rapidjson::kObjectType);
    auto& alloc = doc.GetAllocator();

    doc.AddMember("protocolVersion", rapidjson::StringRef(PROTOCOL_VERSION), alloc);

    rapidjson::Value tools(rapidjson::kObjectType);
    tools.AddMember("listChanged", false, alloc);
    rapidjson::Value capabilities(rapidjson::kObjectType);
    capabilities.AddMember("tools", tools, alloc);
    doc.AddMember("capabilities", capabilities, alloc);

    rapidjson::Value info(rapidjson::kObjectType);
    info.AddMember("name", rapidjson::StringRef(SERVER_NAME), alloc);
    info.AddMember("version", rapidjson::StringRef(cli::VERSION), alloc);
    doc.AddMember("serverInfo", info, alloc);
    return doc;
}

}  // namespace

// ----------------------------------------------------------------------------
// Server
// ----------------------------------------------------------------------------

Server::Server(output::Writer& diag) : diag_(diag) {}

void Server::run(std::istream& in, std::ostream& out) {
    diag_.info("MCP server listening on stdio");
    std::string line;
    while (std::getline(in, line)) {
        auto response = handle_line(line);
        if (!response) {
            continue;
        }
        out << *response << '\n';
        out.flush();
    }
    diag_.debug("stdin closed, server stopping");
}

std::optional<std::string> Server::handle_line(std::string_view line) {
    auto text = trim(line);
    if (text.empty()) {
        return std::nullopt;
    }

    const rapidjson::Value null_id(rapidjson::kNullType);

    rapidjson::Document request;
    request.Parse(text.data(), text.size());
    if (request.HasParseError()) {
        std::string message = std::string("Parse error: ") +
                              rapidjson::GetParseError_En(request.GetParseError()) +
                              " (offset " + std::to_string(request.GetErrorOffset()) + ")";
        diag_.debug(message);
        return output::json_to_string(make_error(null_id, PARSE_ERROR, message));
    }

    // Корректный JSON, но не объект запроса
    if (!request.IsObject() || !request.HasMember("method") || !request["method"].IsString()) {
        diag_.debug("request is not a JSON-RPC request object");
        return output::json_to_string(
            make_error(null_id, PARSE_ERROR, "Parse error: not a JSON-RPC request object"));
    }

    auto id_it = request.FindMember("id");
    if (id_it == request.MemberEnd() || id_it->value.IsNull()) {
        diag_.trace(std::string("notification: ") + request["method"].GetString());
        return std::nullopt;
    }
    const rapidjson::Value& id = id_it->value;

    std::string method(request["method"].GetString(), request["method"].GetStringLength());
    auto params_it = request.FindMember("params");
    const rapidjson::Value* params =
        params_it != request.MemberEnd() && !params_it->value.IsNull() ? &params_it->value
                                                                       : nullptr;

    diag_.debug("request: " + method);
    try {
        return output::json_to_string(dispatch(method, params, id));
    } catch (const std::exception& e) {
        diag_.error(method + " failed: " + e.what());
        return output::json_to_string(
            make_error(id, INTERNAL_ERROR, std::string("Internal error: ") + e.what()));
    }
}

rapidjson::Document Server::dispatch(const std::string& method, const rapidjson::Value* params,
                                     const rapidjson::Value& id) {
    if (method == "initialize") {
        return make_result(id, initialize_result());
    }
    if (method == "ping") {
        return make_result(id, rapidjson::Value(rapidjson::kObjectType));
    }
    if (method == "tools/list") {
        return make_result(id, tool_definitions());
    }
    if (method == "tools/call") {
        if (params == nullptr) {
            return make_error(id, INVALID_PARAMS, "Missing params");
        }
        if (!params->IsObject()) {
            return make_error(id, INVALID_PARAMS, "Invalid params: expected an object");
        }
        auto name_it = params->FindMember("name");
        if (name_it == params->MemberEnd() || !name_it->value.IsString()) {
            return make_error(id, INVALID_PARAMS, "Invalid params: missing field `name`");
        }
        std::string name(name_it->value.GetString(), name_it->value.GetStringLength());

        const rapidjson::Value empty_args(rapidjson::kObjectType);
        auto args_it = params->FindMember("arguments");
        const rapidjson::Value& args =
            args_it != params->MemberEnd() ? args_it->value : empty_args;

        auto result = call_tool(name, args);
        if (!result) {
            return make_error(id, INVALID_PARAMS, "Unknown tool: " + name);
        }
        if (result->is_error) {
            diag_.warn(name + ": " + result->text);
        }
        return make_result(id, result->to_json());
    }
    return make_error(id, METHOD_NOT_FOUND, "Method not found: " + method);
}

int run_stdio_server(output::Writer& diag) {
    Server server(diag);
    server.run(std::cin, std::cout);
    return 0;
}

}  // namespace fiq::mcp
