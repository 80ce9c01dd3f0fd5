#pragma once
#include "mcpserve/exceptions.hpp"
#include "mcpserve/types.hpp"

#include <optional>
#include <string>

namespace mcpserve::mcp::jsonrpc
{

/// A validated JSON-RPC 2.0 request or notification.
struct Request
{
    /// Absent for notifications; otherwise a string or integer, echoed verbatim.
    std::optional<Json> id;
    std::string method;
    /// Object, array, or null when omitted
    Json params;

    bool is_notification() const
    {
        return !id.has_value();
    }
};

/// Throws ValidationError when the envelope is malformed: not an object,
/// wrong "jsonrpc" tag, missing or non-string "method", an id that is not a
/// string or integer, or params that are neither object nor array.
Request parse_request(const Json& message);

/// Best-effort id for answering a message that failed validation.
/// nullopt when the message carries no "id" member (a notification);
/// null when the id is present but unusable.
std::optional<Json> recover_id(const Json& message);

bool is_valid_id(const Json& id);

Json make_result(const Json& id, Json result);
Json make_error(const Json& id, int code, const std::string& message, const Json& data = Json());

} // namespace mcpserve::mcp::jsonrpc
