// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/logging.hpp>
#include <acp/reverse_handler.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace acp
{

namespace
{

/// Fetch a required string parameter or throw InvalidParams
std::string require_string(const json& params, const char* name)
{
    if (!params.is_object() || !params.contains(name) || !params.at(name).is_string())
        throw JsonRpcError(
            JsonRpcErrorCode::InvalidParams, std::string("Missing ") + name + " parameter"
        );
    return params.at(name).get<std::string>();
}

/// Optional non-negative integer parameter
std::optional<size_t> optional_count(const json& params, const char* name)
{
    if (!params.is_object() || !params.contains(name) || params.at(name).is_null())
        return std::nullopt;
    const auto& value = params.at(name);
    if (!value.is_number_integer() || value.get<int64_t>() < 0)
        throw JsonRpcError(
            JsonRpcErrorCode::InvalidParams, std::string("Invalid ") + name + " parameter"
        );
    return static_cast<size_t>(value.get<int64_t>());
}

/// Keep lines [line, line + limit) of content (line is 1-based)
std::string select_lines(
    const std::string& content, std::optional<size_t> line, std::optional<size_t> limit
)
{
    size_t first = line.value_or(1);
    if (first == 0)
        first = 1;

    std::istringstream in(content);
    std::string out;
    std::string current;
    size_t number = 0;
    size_t taken = 0;
    while (std::getline(in, current))
    {
        ++number;
        if (number < first)
            continue;
        if (limit && taken >= *limit)
            break;
        if (taken > 0)
            out += '\n';
        out += current;
        ++taken;
    }
    return out;
}

} // namespace

PermissionOutcome auto_approve(const PermissionRequest& request)
{
    for (const auto& option : request.options)
        if (option.kind == "allow_once" || option.kind == "allow_always")
            return PermissionOutcome::selected(option.option_id);
    return PermissionOutcome::selected(kDefaultAllowOptionId);
}

ReverseRequestHandler::ReverseRequestHandler(PermissionPolicy policy)
    : policy_(std::move(policy))
{
}

void ReverseRequestHandler::set_permission_policy(PermissionPolicy policy)
{
    std::lock_guard<std::mutex> lock(policy_mutex_);
    policy_ = std::move(policy);
}

JsonRpcResponse ReverseRequestHandler::handle(const JsonRpcRequest& request)
{
    logger()->info("Agent request: {} id={}", request.method, id_to_string(request.id));
    try
    {
        if (request.method == methods::kRequestPermission)
            return JsonRpcResponse::success(request.id, request_permission(request.params));
        if (request.method == methods::kReadTextFile)
            return JsonRpcResponse::success(request.id, read_text_file(request.params));
        if (request.method == methods::kWriteTextFile)
            return JsonRpcResponse::success(request.id, write_text_file(request.params));

        return JsonRpcResponse::failure(
            request.id, JsonRpcErrorCode::MethodNotFound, "Method not supported: " + request.method
        );
    }
    catch (const JsonRpcError& e)
    {
        return JsonRpcResponse::failure(request.id, e.code(), e.what(), e.data());
    }
    catch (const std::exception& e)
    {
        logger()->warn("Handler for {} failed: {}", request.method, e.what());
        return JsonRpcResponse::failure(request.id, JsonRpcErrorCode::InternalError, e.what());
    }
}

json ReverseRequestHandler::request_permission(const json& params)
{
    PermissionRequest request;
    if (params.is_object())
        request = params.get<PermissionRequest>();

    PermissionPolicy policy;
    {
        std::lock_guard<std::mutex> lock(policy_mutex_);
        policy = policy_;
    }

    PermissionOutcome outcome;
    try
    {
        outcome = policy ? policy(request) : auto_approve(request);
    }
    catch (const std::exception& e)
    {
        logger()->warn("Permission policy threw, cancelling: {}", e.what());
        outcome = PermissionOutcome::cancel();
    }

    if (outcome.cancelled)
        logger()->info("Permission request for session {} cancelled", request.session_id);
    else
        logger()->info(
            "Permission request for session {} approved with option={}",
            request.session_id,
            outcome.option_id
        );
    return outcome;
}

json ReverseRequestHandler::read_text_file(const json& params)
{
    std::string path = require_string(params, "path");
    auto line = optional_count(params, "line");
    auto limit = optional_count(params, "limit");

    std::error_code ec;
    std::ifstream in(path, std::ios::binary);
    if (!in || fs::is_directory(path, ec))
        throw JsonRpcError(
            JsonRpcErrorCode::ServerError, "File not found: " + path, json{{"path", path}}
        );

    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad())
        throw JsonRpcError(
            JsonRpcErrorCode::ServerError, "File not found: " + path, json{{"path", path}}
        );

    if (line || limit)
        text = select_lines(text, line, limit);
    return json{{"content", text}};
}

json ReverseRequestHandler::write_text_file(const json& params)
{
    std::string path;
    std::string content;
    try
    {
        path = require_string(params, "path");
        content = require_string(params, "content");
    }
    catch (const JsonRpcError&)
    {
        throw JsonRpcError(JsonRpcErrorCode::InvalidParams, "Missing path or content parameter");
    }

    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path())
        fs::create_directories(target.parent_path(), ec);
    if (ec)
        throw JsonRpcError(
            JsonRpcErrorCode::ServerError,
            "Failed to write file: " + ec.message(),
            json{{"path", path}}
        );

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out || !out.write(content.data(), static_cast<std::streamsize>(content.size())))
        throw JsonRpcError(
            JsonRpcErrorCode::ServerError,
            "Failed to write file: cannot open " + path,
            json{{"path", path}}
        );
    return json::object();
}

} // namespace acp
