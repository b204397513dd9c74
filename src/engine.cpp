// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/engine.hpp>
#include <acp/logging.hpp>
#include <acp/transport_stdio.hpp>

namespace acp
{

namespace
{

/// Text of an agent_message_chunk update, if it carries a text block
std::optional<std::string> chunk_text(const json& update)
{
    if (!update.contains("sessionUpdate") || update.at("sessionUpdate") != "agent_message_chunk")
        return std::nullopt;
    if (!update.contains("content") || !update.at("content").is_object())
        return std::nullopt;

    const auto& content = update.at("content");
    if (!content.contains("type") || content.at("type") != "text")
        return std::nullopt;
    if (!content.contains("text") || !content.at("text").is_string())
        return std::nullopt;
    return content.at("text").get<std::string>();
}

} // namespace

// =============================================================================
// Request Builder Helpers (exposed for unit testing)
// =============================================================================

json build_initialize_request(const EngineOptions& options)
{
    return json{
        {"protocolVersion", kProtocolVersion},
        {"clientCapabilities", {{"fs", {{"readTextFile", true}, {"writeTextFile", true}}}}},
        {"clientInfo", {{"name", options.client_name}, {"version", options.client_version}}},
    };
}

json build_prompt_request(const std::string& session_id, const PromptRequest& request)
{
    json prompt = json::array();
    for (const auto& reference : request.references)
        prompt.push_back(reference);
    prompt.push_back({{"type", "text"}, {"text", request.text}});

    json params = {{"sessionId", session_id}, {"prompt", prompt}};
    if (request.model)
        params["model"] = *request.model;
    return params;
}

SessionInfo parse_session_result(const json& result, const std::string& cwd)
{
    if (!result.is_object() || !result.contains("sessionId") || !result.at("sessionId").is_string())
        throw Error("session/new returned no sessionId");

    SessionInfo info;
    info.session_id = result.at("sessionId").get<std::string>();
    info.cwd = cwd;

    if (result.contains("models") && result.at("models").is_object())
    {
        const auto& models = result.at("models");
        if (models.contains("availableModels") && models.at("availableModels").is_array())
            for (const auto& model : models.at("availableModels"))
                if (model.is_object() && model.contains("modelId"))
                    info.models.push_back(model.get<Model>());
        if (models.contains("currentModelId") && models.at("currentModelId").is_string())
            info.current_model_id = models.at("currentModelId").get<std::string>();
    }
    return info;
}

// =============================================================================
// Constructor / Destructor
// =============================================================================

SessionEngine::SessionEngine(EngineOptions options)
    : options_(std::move(options)), router_(std::make_shared<NotificationRouter>()),
      handler_(std::make_shared<ReverseRequestHandler>(options_.permission_policy))
{
    if (options_.log_level)
        set_log_level(*options_.log_level);
}

SessionEngine::~SessionEngine()
{
    close();
}

// =============================================================================
// Lifecycle
// =============================================================================

void SessionEngine::start()
{
    ensure_started();
}

void SessionEngine::close()
{
    if (closed_.exchange(true))
        return;

    // Release callers first; a start in progress is blocked on its handshake
    if (auto current = connection())
        current->fail_pending([] { return std::make_exception_ptr(ClosedError()); });

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    teardown_locked([] { return std::make_exception_ptr(ClosedError()); });
    state_ = EngineState::Closed;
    logger()->info("ACP client closed");
}

bool SessionEngine::is_healthy() const
{
    if (closed_)
        return false;
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return healthy_locked();
}

bool SessionEngine::healthy_locked() const
{
    auto current = connection();
    return !closed_ && initialized_ && process_ && process_->is_alive() && current &&
           current->is_running();
}

std::shared_ptr<Connection> SessionEngine::ensure_started()
{
    if (closed_)
        throw ClosedError();

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (closed_)
        throw ClosedError();

    if (!healthy_locked())
    {
        if (process_)
            logger()->info("Agent is not healthy; restarting");
        start_locked();
    }
    return connection();
}

void SessionEngine::start_locked()
{
    teardown_locked([] { return std::make_exception_ptr(ProcessTerminatedError()); });
    state_ = EngineState::Initializing;

    try
    {
        auto command = build_agent_command(locate_agent(options_), options_);

        ProcessOptions process_options;
        if (options_.working_directory)
            process_options.working_directory = *options_.working_directory;
        process_options.environment = options_.environment;

        process_ = std::make_unique<AgentProcess>(std::move(command), process_options);
        process_->start();

        auto transport =
            std::make_unique<PipeTransport>(process_->stdin_pipe(), process_->stdout_pipe());
        auto current = std::make_shared<Connection>(std::move(transport), router_, handler_);
        current->set_close_handler([this] { on_agent_exit(); });
        {
            std::lock_guard<std::mutex> lock(connection_mutex_);
            connection_ = current;
        }
        current->start();

        initialize(*current);
        if (closed_)
            throw ClosedError();
        state_ = EngineState::Ready;
    }
    catch (const ProcessError& e)
    {
        teardown_locked([] { return std::make_exception_ptr(ProcessTerminatedError()); });
        state_ = closed_ ? EngineState::Closed : EngineState::Failed;
        throw Error(std::string("Failed to start ACP agent: ") + e.what(), false);
    }
    catch (const std::exception&)
    {
        teardown_locked([] { return std::make_exception_ptr(ProcessTerminatedError()); });
        state_ = closed_ ? EngineState::Closed : EngineState::Failed;
        throw;
    }
}

void SessionEngine::teardown_locked(const ErrorFactory& pending_error)
{
    std::shared_ptr<Connection> current;
    {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        current = std::move(connection_);
        connection_.reset();
    }

    // The connection goes first so nothing touches the pipes once the process is gone
    if (current)
    {
        current->fail_pending(pending_error);
        current->stop();
    }
    if (process_)
    {
        process_->stop(options_.shutdown_grace);
        process_.reset();
    }
    initialized_ = false;

    std::lock_guard<std::mutex> lock(data_mutex_);
    session_id_.reset();
    models_.reset();
    current_model_id_.reset();
    agent_info_ = nullptr;
    agent_capabilities_ = nullptr;
    auth_methods_.clear();
}

void SessionEngine::initialize(Connection& connection)
{
    auto result = connection.request(
        methods::kInitialize, build_initialize_request(options_), options_.request_timeout
    );

    std::vector<AuthMethod> auth_methods;
    if (result.contains("authMethods") && result.at("authMethods").is_array())
        for (const auto& method : result.at("authMethods"))
            if (method.is_object())
                auth_methods.push_back(method.get<AuthMethod>());

    json agent_info = result.contains("agentInfo") ? result.at("agentInfo") : json(nullptr);
    {
        std::lock_guard<std::mutex> lock(data_mutex_);
        agent_info_ = agent_info;
        agent_capabilities_ =
            result.contains("agentCapabilities") ? result.at("agentCapabilities") : json(nullptr);
        auth_methods_ = std::move(auth_methods);
    }
    initialized_ = true;

    logger()->info(
        "ACP initialized: {}", agent_info.is_null() ? std::string("unknown agent") : agent_info.dump()
    );
}

void SessionEngine::on_agent_exit()
{
    auto expected = EngineState::Ready;
    if (state_.compare_exchange_strong(expected, EngineState::Failed))
        logger()->warn("Agent process exited; it will be restarted on next use");
}

std::shared_ptr<Connection> SessionEngine::connection() const
{
    std::lock_guard<std::mutex> lock(connection_mutex_);
    return connection_;
}

// =============================================================================
// Sessions
// =============================================================================

SessionInfo SessionEngine::create_session(std::optional<std::string> cwd)
{
    auto current = ensure_started();

    std::string dir = cwd.value_or(home_directory());
    if (dir.empty())
        dir = ".";

    auto result =
        current->request(methods::kSessionNew, json{{"cwd", dir}}, options_.request_timeout);
    auto info = parse_session_result(result, dir);

    {
        std::lock_guard<std::mutex> lock(data_mutex_);
        session_id_ = info.session_id;
        models_ = info.models;
        current_model_id_ = info.current_model_id;
    }

    logger()->info("ACP session created: {} with {} models", info.session_id, info.models.size());
    return info;
}

std::string SessionEngine::current_session()
{
    {
        std::lock_guard<std::mutex> lock(data_mutex_);
        if (session_id_)
            return *session_id_;
    }
    return create_session().session_id;
}

PromptResult SessionEngine::send_prompt(const PromptRequest& request)
{
    // Start first: a restart discards the previous session id
    auto current = ensure_started();
    std::string session_id = request.session_id.empty() ? current_session() : request.session_id;

    logger()->info(
        "send_prompt: session={} model={} refs={}",
        session_id,
        request.model.value_or("default"),
        request.references.size()
    );

    // Captured by value: a dispatch snapshot may still run the listener after
    // the subscription is gone
    auto on_chunk = request.on_chunk;
    auto on_update = request.on_update;
    auto subscription = router_->subscribe(
        [session_id, on_chunk, on_update](const Notification& notification)
        {
            if (notification.id || notification.method != methods::kSessionUpdate)
                return;
            const auto& params = notification.params;
            if (!params.is_object() || !params.contains("sessionId") ||
                params.at("sessionId") != session_id)
                return;
            if (!params.contains("update") || !params.at("update").is_object())
                return;

            const auto& update = params.at("update");
            if (on_chunk)
                if (auto text = chunk_text(update))
                    on_chunk(*text);
            if (on_update)
                on_update(update);
        }
    );

    try
    {
        auto result = current->request(
            methods::kSessionPrompt,
            build_prompt_request(session_id, request),
            options_.prompt_timeout
        );

        PromptResult prompt_result;
        prompt_result.stop_reason =
            result.contains("stopReason") && result.at("stopReason").is_string()
                ? result.at("stopReason").get<std::string>()
                : "unknown";
        logger()->info("send_prompt: session={} stopReason={}", session_id, prompt_result.stop_reason);
        return prompt_result;
    }
    catch (const AgentError& e)
    {
        if (!e.recoverable())
        {
            logger()->warn("Agent unavailable ({}); discarding session {}", e.what(), session_id);
            std::lock_guard<std::mutex> lock(data_mutex_);
            session_id_.reset();
        }
        throw;
    }
}

void SessionEngine::cancel_session(const std::string& session_id)
{
    if (closed_)
        return;

    auto current = connection();
    if (!current)
        return;

    try
    {
        current->notify(methods::kSessionCancel, json{{"sessionId", session_id}});
        logger()->info("Sent session/cancel for session {}", session_id);
    }
    catch (const std::exception& e)
    {
        logger()->warn("Failed to send session/cancel: {}", e.what());
    }
}

void SessionEngine::set_model(const std::string& session_id, const std::string& model_id)
{
    auto current = ensure_started();
    current->request(
        methods::kSessionSetModel,
        json{{"sessionId", session_id}, {"modelId", model_id}},
        options_.request_timeout
    );

    std::lock_guard<std::mutex> lock(data_mutex_);
    if (session_id_ == session_id)
        current_model_id_ = model_id;
    logger()->info("Session {} switched to model {}", session_id, model_id);
}

std::vector<Model> SessionEngine::list_models()
{
    ensure_started();
    {
        std::lock_guard<std::mutex> lock(data_mutex_);
        if (models_)
            return *models_;
    }
    return create_session().models;
}

std::string SessionEngine::model_multiplier(const std::string& model_id) const
{
    std::lock_guard<std::mutex> lock(data_mutex_);
    if (!models_)
        return kDefaultModelMultiplier;
    for (const auto& model : *models_)
        if (model.id == model_id)
            return model.usage.value_or(kDefaultModelMultiplier);
    return kDefaultModelMultiplier;
}

std::optional<AuthMethod> SessionEngine::auth_method() const
{
    std::lock_guard<std::mutex> lock(data_mutex_);
    if (auth_methods_.empty())
        return std::nullopt;
    return auth_methods_.front();
}

std::optional<std::string> SessionEngine::session_id() const
{
    std::lock_guard<std::mutex> lock(data_mutex_);
    return session_id_;
}

std::optional<std::string> SessionEngine::current_model_id() const
{
    std::lock_guard<std::mutex> lock(data_mutex_);
    return current_model_id_;
}

void SessionEngine::reset_session()
{
    std::lock_guard<std::mutex> lock(data_mutex_);
    session_id_.reset();
}

// =============================================================================
// Observation
// =============================================================================

Subscription SessionEngine::on_notification(NotificationListener listener)
{
    return router_->subscribe(std::move(listener));
}

void SessionEngine::set_permission_policy(PermissionPolicy policy)
{
    handler_->set_permission_policy(std::move(policy));
}

json SessionEngine::agent_info() const
{
    std::lock_guard<std::mutex> lock(data_mutex_);
    return agent_info_;
}

json SessionEngine::agent_capabilities() const
{
    std::lock_guard<std::mutex> lock(data_mutex_);
    return agent_capabilities_;
}

int SessionEngine::agent_pid() const
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return process_ ? process_->pid() : 0;
}

} // namespace acp
