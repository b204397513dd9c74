// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstdlib>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace acp
{

// =============================================================================
// Type Aliases
// =============================================================================

/// JSON type alias for cleaner API
using json = nlohmann::json;

// =============================================================================
// Protocol Constants
// =============================================================================

/// Agent Client Protocol version sent in the initialize handshake
inline constexpr int kProtocolVersion = 1;

/// Usage multiplier reported for models the catalog does not know
inline constexpr const char* kDefaultModelMultiplier = "1x";

/// Option id selected when a permission request carries no "allow" option
inline constexpr const char* kDefaultAllowOptionId = "allow-once";

// =============================================================================
// Enums
// =============================================================================

/// Lifecycle state of a SessionEngine
enum class EngineState
{
    Uninitialized,
    Initializing,
    Ready,
    Failed,
    Closed
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    EngineState,
    {
        {EngineState::Uninitialized, "uninitialized"},
        {EngineState::Initializing, "initializing"},
        {EngineState::Ready, "ready"},
        {EngineState::Failed, "failed"},
        {EngineState::Closed, "closed"},
    }
)

// =============================================================================
// Model Catalog
// =============================================================================

/// A model offered by the agent for a session
struct Model
{
    std::string id;
    std::string name;
    std::string description;
    /// Cost weight such as "1x", "3x" or "0x"; kept as an opaque string
    std::optional<std::string> usage;
};

inline void to_json(json& j, const Model& m)
{
    j = json{{"modelId", m.id}, {"name", m.name}};
    if (!m.description.empty())
        j["description"] = m.description;
    if (m.usage)
        j["_meta"] = json{{"copilotUsage", *m.usage}};
}

inline void from_json(const json& j, Model& m)
{
    j.at("modelId").get_to(m.id);
    m.name = j.contains("name") && j.at("name").is_string() ? j.at("name").get<std::string>()
                                                             : m.id;
    m.description = j.contains("description") && j.at("description").is_string()
                        ? j.at("description").get<std::string>()
                        : "";
    if (j.contains("_meta") && j.at("_meta").is_object())
    {
        const auto& meta = j.at("_meta");
        if (meta.contains("copilotUsage") && meta.at("copilotUsage").is_string())
            m.usage = meta.at("copilotUsage").get<std::string>();
    }
}

/// State of the session created by session/new
struct SessionInfo
{
    std::string session_id;
    std::string cwd;
    std::vector<Model> models;
    std::optional<std::string> current_model_id;
};

// =============================================================================
// Authentication
// =============================================================================

/// Authentication method advertised by the agent in the initialize result
struct AuthMethod
{
    std::string id;
    std::string name;
    std::string description;

    /// External login command from _meta["terminal-auth"], if any
    std::optional<std::string> command;
    std::vector<std::string> args;
};

inline void from_json(const json& j, AuthMethod& m)
{
    m.id = j.value("id", "");
    m.name = j.value("name", "");
    m.description = j.value("description", "");
    if (!j.contains("_meta") || !j.at("_meta").is_object())
        return;

    const auto& meta = j.at("_meta");
    if (!meta.contains("terminal-auth") || !meta.at("terminal-auth").is_object())
        return;

    const auto& terminal = meta.at("terminal-auth");
    if (terminal.contains("command") && terminal.at("command").is_string())
        m.command = terminal.at("command").get<std::string>();
    if (terminal.contains("args") && terminal.at("args").is_array())
        for (const auto& arg : terminal.at("args"))
            if (arg.is_string())
                m.args.push_back(arg.get<std::string>());
}

// =============================================================================
// Prompt Types
// =============================================================================

/// File or selection context attached to a prompt as a "resource" block
struct ResourceReference
{
    std::string uri;
    std::optional<std::string> mime_type;
    std::string text;
};

inline void to_json(json& j, const ResourceReference& r)
{
    json resource = {{"uri", r.uri}};
    if (r.mime_type)
        resource["mimeType"] = *r.mime_type;
    resource["text"] = r.text;
    j = json{{"type", "resource"}, {"resource", resource}};
}

/// Text chunk callback for streamed agent_message_chunk updates
using ChunkHandler = std::function<void(const std::string& text)>;

/// Raw session/update callback (plans, tool calls, thoughts, chunks)
using UpdateHandler = std::function<void(const json& update)>;

/// One prompt turn
struct PromptRequest
{
    std::string session_id;
    std::string text;
    std::optional<std::string> model;
    std::vector<ResourceReference> references;
    ChunkHandler on_chunk;
    UpdateHandler on_update;
};

/// Terminal outcome of a prompt turn
struct PromptResult
{
    /// e.g. "end_turn", "max_tokens", "cancelled"
    std::string stop_reason;
};

// =============================================================================
// Permission Types
// =============================================================================

/// One choice offered by session/request_permission
struct PermissionOption
{
    std::string option_id;
    std::string name;
    std::string kind; // allow_once, allow_always, reject_once, reject_always
};

inline void from_json(const json& j, PermissionOption& o)
{
    o.option_id = j.value("optionId", "");
    o.name = j.value("name", "");
    o.kind = j.value("kind", "");
}

/// Permission request received from the agent
struct PermissionRequest
{
    std::string session_id;
    json tool_call; // {kind, title, toolCallId, ...}
    std::vector<PermissionOption> options;
};

inline void from_json(const json& j, PermissionRequest& r)
{
    r.session_id = j.value("sessionId", "");
    r.tool_call = j.contains("toolCall") ? j.at("toolCall") : json::object();
    r.options.clear();
    if (j.contains("options") && j.at("options").is_array())
        for (const auto& option : j.at("options"))
            if (option.is_object())
                r.options.push_back(option.get<PermissionOption>());
}

/// Decision returned to the agent for a permission request
struct PermissionOutcome
{
    bool cancelled = false;
    std::string option_id;

    static PermissionOutcome selected(std::string option_id)
    {
        return PermissionOutcome{false, std::move(option_id)};
    }

    static PermissionOutcome cancel()
    {
        return PermissionOutcome{true, ""};
    }
};

inline void to_json(json& j, const PermissionOutcome& o)
{
    if (o.cancelled)
        j = json{{"outcome", {{"outcome", "cancelled"}}}};
    else
        j = json{{"outcome", {{"outcome", "selected"}, {"optionId", o.option_id}}}};
}

/// Permission decision policy
using PermissionPolicy = std::function<PermissionOutcome(const PermissionRequest& request)>;

// =============================================================================
// Engine Options
// =============================================================================

/// Options for creating a SessionEngine
struct EngineOptions
{
    /// Explicit agent executable; skips PATH and install-directory lookup
    std::optional<std::string> agent_path;

    /// Executable name looked up on PATH and in known install directories
    std::string agent_command = "copilot";

    /// Extra arguments appended after the protocol flags
    std::vector<std::string> agent_args;

    /// Model passed as --model at launch
    std::optional<std::string> model;

    /// Passed as --config-dir at launch
    std::optional<std::string> config_dir;

    /// Working directory of the agent process (empty = inherit)
    std::optional<std::string> working_directory;

    /// Extra environment variables for the agent process
    std::map<std::string, std::string> environment;

    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds prompt_timeout{300000};
    std::chrono::milliseconds shutdown_grace{5000};

    /// Level of the process-wide "acp" logger: trace, debug, info, warn, error,
    /// critical or off. Unset leaves the logger as it is (info when first created).
    std::optional<std::string> log_level;

    std::string client_name = "acp-bridge";
    std::string client_version = "0.1.0";

    /// Decides session/request_permission; empty means auto-approve
    PermissionPolicy permission_policy;

    // ─────────────────────────────────────────────────────────────────────────
    // Environment Variable Support
    // ─────────────────────────────────────────────────────────────────────────

    static constexpr const char* ENV_AGENT_PATH = "ACP_AGENT_PATH";
    static constexpr const char* ENV_AGENT_MODEL = "ACP_AGENT_MODEL";
    static constexpr const char* ENV_CONFIG_DIR = "ACP_CONFIG_DIR";
    static constexpr const char* ENV_LOG_LEVEL = "ACP_LOG_LEVEL";

    /// Defaults overridden by ACP_* environment variables
    static EngineOptions from_env()
    {
        EngineOptions options;
        if (auto value = env(ENV_AGENT_PATH))
            options.agent_path = *value;
        if (auto value = env(ENV_AGENT_MODEL))
            options.model = *value;
        if (auto value = env(ENV_CONFIG_DIR))
            options.config_dir = *value;
        if (auto value = env(ENV_LOG_LEVEL))
            options.log_level = *value;
        return options;
    }

  private:
    static std::optional<std::string> env(const char* name)
    {
        const char* value = std::getenv(name);
        if (value == nullptr || value[0] == '\0')
            return std::nullopt;
        return std::string(value);
    }
};

} // namespace acp
