#include "server/mcp_dispatcher.hpp"
#include "server/mcp_constants.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlmcp {

namespace {

std::string dump(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool is_valid_id(const json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

} // anonymous namespace

McpDispatcher::McpDispatcher(std::shared_ptr<const ToolRegistry> tools)
    : tools_(std::move(tools)) {}

// ============================================================================
// Envelope
// ============================================================================

McpDispatcher::ParsedMessage McpDispatcher::parse(std::string_view text) {
    ParsedMessage parsed;

    json msg;
    try {
        msg = json::parse(text);
    } catch (const json::parse_error& e) {
        parsed.reply = error_response(nullptr, mcp::kParseError,
                                      std::format("Parse error: {}", e.what()));
        return parsed;
    }

    if (!msg.is_object()) {
        parsed.reply = error_response(nullptr, mcp::kInvalidRequest,
                                      "Invalid Request: expected a JSON object");
        return parsed;
    }

    const auto id_it = msg.find("id");
    const bool has_id = id_it != msg.end();
    if (has_id && !is_valid_id(*id_it)) {
        parsed.reply = error_response(nullptr, mcp::kInvalidRequest,
                                      "Invalid Request: id must be a string or number");
        return parsed;
    }
    parsed.id = has_id ? *id_it : json(nullptr);
    parsed.is_notification = !has_id;

    const auto version = msg.find("jsonrpc");
    if (version == msg.end() || !version->is_string() || version->get<std::string>() != "2.0") {
        if (parsed.is_notification) {
            parsed.ignore = true;
        } else {
            parsed.reply = error_response(parsed.id, mcp::kInvalidRequest,
                                          "Invalid Request: jsonrpc must be \"2.0\"");
        }
        return parsed;
    }

    const auto method = msg.find("method");
    if (method == msg.end()) {
        // A response to something we never send, or junk: answer only the latter
        if (has_id && (msg.contains("result") || msg.contains("error"))) {
            parsed.ignore = true;
        } else if (has_id) {
            parsed.reply = error_response(parsed.id, mcp::kInvalidRequest,
                                          "Invalid Request: missing method");
        } else {
            parsed.ignore = true;
        }
        return parsed;
    }
    if (!method->is_string()) {
        if (parsed.is_notification) {
            parsed.ignore = true;
        } else {
            parsed.reply = error_response(parsed.id, mcp::kInvalidRequest,
                                          "Invalid Request: method must be a string");
        }
        return parsed;
    }

    parsed.message = std::move(msg);
    return parsed;
}

// ============================================================================
// Dispatch
// ============================================================================

std::optional<std::string> McpDispatcher::handle(std::string_view text) const {
    return dispatch(parse(text));
}

std::optional<std::string> McpDispatcher::dispatch(const ParsedMessage& parsed) const {
    if (parsed.reply) return parsed.reply;
    if (parsed.ignore) return std::nullopt;

    const auto& method = parsed.message["method"].get_ref<const std::string&>();
    const bool notify = parsed.is_notification;

    json params = json::object();
    if (const auto it = parsed.message.find("params"); it != parsed.message.end() && !it->is_null()) {
        if (!it->is_object()) {
            if (notify) return std::nullopt;
            return error_response(parsed.id, mcp::kInvalidParams,
                                  "Invalid params: params must be an object");
        }
        params = *it;
    }

    try {
        if (method.starts_with("notifications/")) {
            return std::nullopt;
        }

        json result;
        if (method == "initialize") {
            result = handle_initialize(params);
        } else if (method == "ping") {
            result = json::object();
        } else if (method == "tools/list") {
            result = json{{"tools", tools_->list_tools()}};
        } else if (method == "tools/call") {
            if (notify) return std::nullopt;
            return handle_tools_call(parsed.id, params);
        } else {
            if (notify) return std::nullopt;
            return error_response(parsed.id, mcp::kMethodNotFound,
                                  std::format("Method not found: {}", method));
        }

        if (notify) return std::nullopt;
        return result_response(parsed.id, result);

    } catch (const std::exception& e) {
        utils::log::error(std::format("Request '{}' failed: {}", method, e.what()));
        if (notify) return std::nullopt;
        return error_response(parsed.id, mcp::kInternalError,
                              std::format("Internal error: {}", e.what()));
    }
}

json McpDispatcher::handle_initialize(const json& params) const {
    std::string_view version = mcp::kSupportedProtocolVersions.front();
    if (const auto it = params.find("protocolVersion"); it != params.end() && it->is_string()) {
        const auto& requested = it->get_ref<const std::string&>();
        const auto& supported = mcp::kSupportedProtocolVersions;
        if (std::find(supported.begin(), supported.end(), requested) != supported.end()) {
            version = requested;
        }
    }

    if (const auto it = params.find("clientInfo"); it != params.end() && it->is_object()) {
        utils::log::info(std::format("Client connected: {} {} (protocol {})",
            it->value("name", "unknown"), it->value("version", ""), version));
    }

    return json{
        {"protocolVersion", std::string(version)},
        {"capabilities", json{{"tools", json{{"listChanged", false}}}}},
        {"serverInfo", json{
            {"name", std::string(mcp::kServerName)},
            {"version", std::string(mcp::kServerVersion)}
        }}
    };
}

std::optional<std::string> McpDispatcher::handle_tools_call(const json& id,
                                                            const json& params) const {
    const auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return error_response(id, mcp::kInvalidParams, "Invalid params: missing tool name");
    }
    const auto& name = name_it->get_ref<const std::string&>();

    json arguments = json::object();
    if (const auto it = params.find("arguments"); it != params.end() && !it->is_null()) {
        if (!it->is_object()) {
            return error_response(id, mcp::kInvalidParams,
                                  "Invalid params: arguments must be an object");
        }
        arguments = *it;
    }

    utils::Timer timer;
    const auto outcome = tools_->call(name, arguments);
    if (outcome.is_error()) {
        return error_response(id, mcp::kInvalidParams, outcome.error_message());
    }

    const bool failed = outcome.value().value("isError", false);
    utils::log::info(std::format("tools/call {} -> {} in {} ms",
        name, failed ? "error" : "ok", timer.elapsed_ms().count()));
    return result_response(id, outcome.value());
}

// ============================================================================
// Response framing
// ============================================================================

std::string McpDispatcher::result_response(const json& id, const json& result) {
    return dump(json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
}

std::string McpDispatcher::error_response(const json& id, int code, std::string_view message) {
    return dump(json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", json{{"code", code}, {"message", std::string(message)}}}
    });
}

std::string McpDispatcher::busy_response(const json& id) {
    return error_response(id, mcp::kServerBusy, "server busy");
}

} // namespace sqlmcp
