// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file streaming.cpp
/// @brief Example printing every streamed session update of one prompt turn
///
/// Message chunks are printed inline; plans, tool calls and thoughts are shown
/// as one-line summaries. Ctrl+C sends session/cancel and the turn ends with
/// stop reason "cancelled".

#include <acp/acp.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace
{
std::atomic<bool> g_interrupted{false};

void on_sigint(int)
{
    g_interrupted = true;
}
} // namespace

int main(int argc, char** argv)
{
    std::string text = argc > 1 ? argv[1] : "Write a haiku about pipes.";

    try
    {
        acp::SessionEngine engine(acp::EngineOptions::from_env());
        auto session = engine.create_session();

        acp::PromptRequest request;
        request.session_id = session.session_id;
        request.text = text;
        request.on_update = [](const acp::json& update)
        {
            std::string kind = update.value("sessionUpdate", "");
            if (kind == "agent_message_chunk")
            {
                const auto& content = update.value("content", acp::json::object());
                std::cout << content.value("text", "") << std::flush;
            }
            else if (kind == "agent_thought_chunk")
            {
                // Thoughts are noisy; show only that they happen
                std::cout << "." << std::flush;
            }
            else if (kind == "tool_call" || kind == "tool_call_update")
            {
                std::cout << "\n[" << kind << "] " << update.value("title", update.value("toolCallId", ""))
                          << " " << update.value("status", "") << "\n";
            }
            else if (kind == "plan")
            {
                std::cout << "\n[plan]\n";
                for (const auto& entry : update.value("entries", acp::json::array()))
                    std::cout << "  - " << entry.value("content", "") << " (" << entry.value("status", "")
                              << ")\n";
            }
        };

        std::signal(SIGINT, on_sigint);
        std::thread watcher(
            [&]
            {
                while (!g_interrupted)
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                engine.cancel_session(session.session_id);
            }
        );

        int status = 0;
        try
        {
            auto result = engine.send_prompt(request);
            std::cout << "\n\nStop reason: " << result.stop_reason << "\n";
        }
        catch (const acp::Error& e)
        {
            std::cerr << "\nPrompt failed: " << e.what() << "\n";
            status = 1;
        }

        g_interrupted = true;
        watcher.join();
        engine.close();
        return status;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
