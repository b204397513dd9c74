// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file basic_chat.cpp
/// @brief Simple Q&A loop over one agent session

#include <acp/acp.hpp>
#include <iostream>
#include <string>

int main()
{
    try
    {
        // ACP_AGENT_PATH, ACP_AGENT_MODEL, ACP_CONFIG_DIR and ACP_LOG_LEVEL are honored
        auto options = acp::EngineOptions::from_env();
        acp::SessionEngine engine(options);

        std::cout << "Starting agent...\n";
        engine.start();
        std::cout << "Connected to " << engine.agent_info().dump() << "\n";

        auto session = engine.create_session();
        std::cout << "Session created: " << session.session_id << "\n";

        std::cout << "\nEnter your messages (type 'quit' to exit):\n> ";
        std::string line;
        while (std::getline(std::cin, line))
        {
            if (line == "quit" || line == "exit")
                break;

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
                auto result = engine.send_prompt(request);
                std::cout << "\n[" << result.stop_reason << "]\n> " << std::flush;
            }
            catch (const acp::Error& e)
            {
                std::cerr << "\nError: " << e.what() << "\n";
                if (!e.recoverable())
                    break;
                std::cout << "> " << std::flush;
            }
        }

        std::cout << "\nStopping agent...\n";
        engine.close();

        std::cout << "Done!\n";
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
