// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file permission_callback.cpp
/// @brief Example deciding session/request_permission with a custom policy
///
/// This example shows how to:
/// 1. Install a PermissionPolicy that picks one of the agent's options
/// 2. Reject edits and commands unless the user approved them
/// 3. Log every decision for auditing

#include <acp/acp.hpp>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

struct PermissionLogEntry
{
    std::string timestamp;
    std::string tool_kind;
    std::string title;
    std::string decision;
};

std::vector<PermissionLogEntry> g_permission_log;
std::mutex g_log_mutex;

void log_decision(const acp::PermissionRequest& request, const std::string& decision)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::string timestamp = std::ctime(&time_t);
    if (!timestamp.empty() && timestamp.back() == '\n')
        timestamp.pop_back();

    std::string kind = request.tool_call.value("kind", "unknown");
    std::string title = request.tool_call.value("title", "");
    g_permission_log.push_back({timestamp, kind, title, decision});

    std::cout << "\n[PERMISSION] " << timestamp << " - " << kind << " " << title << ": " << decision
              << "\n";
}

/// First option of the given kind, if the agent offered one
const acp::PermissionOption* find_option(const acp::PermissionRequest& request, const std::string& kind)
{
    for (const auto& option : request.options)
        if (option.kind == kind)
            return &option;
    return nullptr;
}

int main()
{
    try
    {
        std::atomic<bool> user_approved{false};

        auto options = acp::EngineOptions::from_env();
        options.permission_policy = [&](const acp::PermissionRequest& request)
        {
            std::string kind = request.tool_call.value("kind", "");
            bool risky = kind == "edit" || kind == "delete" || kind == "execute";

            if (!risky || user_approved)
            {
                if (auto* allow = find_option(request, "allow_once"))
                {
                    log_decision(request, "ALLOWED (" + allow->option_id + ")");
                    return acp::PermissionOutcome::selected(allow->option_id);
                }
            }
            else if (auto* reject = find_option(request, "reject_once"))
            {
                log_decision(request, "REJECTED (" + reject->option_id + ")");
                return acp::PermissionOutcome::selected(reject->option_id);
            }

            log_decision(request, "CANCELLED");
            return acp::PermissionOutcome::cancel();
        };

        acp::SessionEngine engine(options);

        std::cout << "=== Permission Policy Example ===\n\n";
        std::cout << "- Reads and searches: always allowed\n";
        std::cout << "- Edits, deletes and commands: rejected until you type 'approve'\n\n";

        auto session = engine.create_session();
        std::cout << "Session created: " << session.session_id << "\n\n";

        std::cout << "Commands:\n";
        std::cout << "  'approve' - Allow risky tool calls\n";
        std::cout << "  'revoke'  - Reject risky tool calls again\n";
        std::cout << "  'log'     - Show the decision log\n";
        std::cout << "  'quit'    - Exit\n\n> ";

        std::string line;
        while (std::getline(std::cin, line))
        {
            if (line == "quit" || line == "exit")
                break;

            if (line == "approve" || line == "revoke")
            {
                user_approved = line == "approve";
                std::cout << "\n[Risky tools are now " << (user_approved ? "APPROVED" : "REJECTED")
                          << "]\n\n> ";
                continue;
            }

            if (line == "log")
            {
                std::lock_guard<std::mutex> lock(g_log_mutex);
                std::cout << "\n=== Permission Log ===\n";
                if (g_permission_log.empty())
                    std::cout << "(no permission requests yet)\n";
                for (const auto& entry : g_permission_log)
                    std::cout << entry.timestamp << " | " << entry.tool_kind << " | " << entry.title
                              << " | " << entry.decision << "\n";
                std::cout << "\n> ";
                continue;
            }

            if (line.empty())
            {
                std::cout << "> ";
                continue;
            }

            acp::PromptRequest request;
            request.session_id = session.session_id;
            request.text = line;
            request.on_chunk = [](const std::string& text) { std::cout << text << std::flush; };

            try
            {
                engine.send_prompt(request);
            }
            catch (const acp::Error& e)
            {
                std::cerr << "\nError: " << e.what() << "\n";
            }
            std::cout << "\n\n> " << std::flush;
        }

        engine.close();
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
