#pragma once

#include "server/tool_registry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sqlmcp {

/**
 * @brief JSON-RPC 2.0 / MCP method dispatch, transport independent
 *
 * Methods: initialize, notifications/*, ping, tools/list, tools/call.
 * Requests get exactly one response; notifications (no "id") and stray
 * client responses never get one, not even an error.
 * Thread-safe: holds only the immutable tool registry.
 */
class McpDispatcher {
public:
    /**
     * @brief One wire message after parsing and envelope checks
     *
     * When `reply` is set the message is answered with it and not dispatched
     * (malformed input). `ignore` marks messages that get no answer at all.
     */
    struct ParsedMessage {
        json message;
        json id;                            // null for notifications
        bool is_notification = false;
        bool ignore = false;
        std::optional<std::string> reply;
    };

    explicit McpDispatcher(std::shared_ptr<const ToolRegistry> tools);

    [[nodiscard]] static ParsedMessage parse(std::string_view text);

    /// Dispatch a parsed request; nullopt when no response is due
    [[nodiscard]] std::optional<std::string> dispatch(const ParsedMessage& parsed) const;

    /// parse() + dispatch()
    [[nodiscard]] std::optional<std::string> handle(std::string_view text) const;

    [[nodiscard]] static std::string error_response(const json& id, int code,
                                                    std::string_view message);
    [[nodiscard]] static std::string result_response(const json& id, const json& result);

    /// -32000 reply for a request refused because the worker queue is full
    [[nodiscard]] static std::string busy_response(const json& id);

private:
    [[nodiscard]] json handle_initialize(const json& params) const;
    [[nodiscard]] std::optional<std::string> handle_tools_call(const json& id,
                                                               const json& params) const;

    std::shared_ptr<const ToolRegistry> tools_;
};

} // namespace sqlmcp
