// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <acp/types.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace acp
{

// =============================================================================
// JSON-RPC 2.0 Exceptions
// =============================================================================

/// JSON-RPC error codes (standard and custom)
enum class JsonRpcErrorCode : int
{
    // Standard JSON-RPC 2.0 errors
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,

    // Server errors (-32000 to -32099)
    ServerError = -32000,
};

/// Exception for JSON-RPC errors
///
/// Thrown by reverse-request handlers; converted into the error object of the
/// response frame written back to the agent.
class JsonRpcError : public std::runtime_error
{
  public:
    JsonRpcError(
        JsonRpcErrorCode code, const std::string& message, const json& data = nullptr
    )
        : std::runtime_error(message), code_(code), data_(data)
    {
    }

    JsonRpcErrorCode code() const
    {
        return code_;
    }
    const json& data() const
    {
        return data_;
    }

  private:
    JsonRpcErrorCode code_;
    json data_;
};

// =============================================================================
// JSON-RPC 2.0 Message Types
// =============================================================================

/// JSON-RPC request ID (can be string or integer)
using JsonRpcId = std::variant<std::string, int64_t>;

/// Convert JsonRpcId to JSON
inline json id_to_json(const JsonRpcId& id)
{
    return std::visit([](const auto& v) -> json { return v; }, id);
}

/// Parse JsonRpcId from JSON
inline JsonRpcId id_from_json(const json& j)
{
    if (j.is_string())
        return j.get<std::string>();
    else if (j.is_number_integer())
        return j.get<int64_t>();
    throw JsonRpcError(JsonRpcErrorCode::InvalidRequest, "Invalid JSON-RPC id type");
}

/// Printable form of an id for log lines
inline std::string id_to_string(const JsonRpcId& id)
{
    if (auto* s = std::get_if<std::string>(&id))
        return *s;
    return std::to_string(std::get<int64_t>(id));
}

/// JSON-RPC 2.0 Request (carries both id and method)
struct JsonRpcRequest
{
    JsonRpcId id;
    std::string method;
    json params;

    json to_json() const
    {
        json j = {{"jsonrpc", "2.0"}, {"id", id_to_json(id)}, {"method", method}};
        if (!params.is_null())
            j["params"] = params;
        return j;
    }
};

/// JSON-RPC 2.0 Notification (method, no id)
struct JsonRpcNotification
{
    std::string method;
    json params;

    json to_json() const
    {
        json j = {{"jsonrpc", "2.0"}, {"method", method}};
        if (!params.is_null())
            j["params"] = params;
        return j;
    }
};

/// JSON-RPC 2.0 Error object
struct JsonRpcErrorObject
{
    int code;
    std::string message;
    json data;

    json to_json() const
    {
        json j = {{"code", code}, {"message", message}};
        if (!data.is_null())
            j["data"] = data;
        return j;
    }

    static JsonRpcErrorObject from_json(const json& j)
    {
        JsonRpcErrorObject err;
        err.code = j.contains("code") && j.at("code").is_number_integer()
                       ? j.at("code").get<int>()
                       : static_cast<int>(JsonRpcErrorCode::InternalError);
        err.message = j.contains("message") && j.at("message").is_string()
                          ? j.at("message").get<std::string>()
                          : "Unknown error";
        if (j.contains("data"))
            err.data = j.at("data");
        return err;
    }

    /// Text reported to callers: a string `data` wins over `message`
    std::string describe() const
    {
        if (data.is_string())
            return data.get<std::string>();
        return message;
    }
};

/// JSON-RPC 2.0 Response (id, no method)
struct JsonRpcResponse
{
    JsonRpcId id;
    std::optional<json> result;
    std::optional<JsonRpcErrorObject> error;

    json to_json() const
    {
        json j = {{"jsonrpc", "2.0"}, {"id", id_to_json(id)}};
        if (error)
            j["error"] = error->to_json();
        else
            j["result"] = result.value_or(json::object());
        return j;
    }

    bool is_error() const
    {
        return error.has_value();
    }

    static JsonRpcResponse success(const JsonRpcId& id, json result)
    {
        return JsonRpcResponse{id, std::move(result), std::nullopt};
    }

    static JsonRpcResponse failure(
        const JsonRpcId& id, JsonRpcErrorCode code, const std::string& message,
        const json& data = nullptr
    )
    {
        return JsonRpcResponse{
            id, std::nullopt, JsonRpcErrorObject{static_cast<int>(code), message, data}
        };
    }
};

// =============================================================================
// Frame Classification
// =============================================================================

/// One inbound line, classified once at parse time
using Frame = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

/// Classify a parsed message by the presence of `id` and `method`
///
/// - id and method: request (the agent calling back into us)
/// - id only:       response to one of our requests
/// - method only:   notification
///
/// @throws JsonRpcError (InvalidRequest) for anything else
inline Frame parse_frame(const json& message)
{
    if (!message.is_object())
        throw JsonRpcError(JsonRpcErrorCode::InvalidRequest, "Frame is not a JSON object");

    bool has_id = message.contains("id") && !message.at("id").is_null();
    bool has_method = message.contains("method") && message.at("method").is_string();
    json params = message.contains("params") ? message.at("params") : json(nullptr);

    if (has_id && has_method)
        return JsonRpcRequest{
            id_from_json(message.at("id")), message.at("method").get<std::string>(), params
        };

    if (has_id)
    {
        JsonRpcResponse response{id_from_json(message.at("id")), std::nullopt, std::nullopt};
        if (message.contains("error") && message.at("error").is_object())
            response.error = JsonRpcErrorObject::from_json(message.at("error"));
        else if (message.contains("result"))
            response.result = message.at("result");
        else
            response.result = json::object();
        return response;
    }

    if (has_method)
        return JsonRpcNotification{message.at("method").get<std::string>(), params};

    throw JsonRpcError(JsonRpcErrorCode::InvalidRequest, "Frame has neither id nor method");
}

} // namespace acp
