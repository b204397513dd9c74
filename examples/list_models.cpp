// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file list_models.cpp
/// @brief Example listing the models the agent offers and their usage multipliers

#include <acp/acp.hpp>
#include <iostream>
#include <string>

int main()
{
    try
    {
        acp::SessionEngine engine(acp::EngineOptions::from_env());

        std::cout << "=== List Models Example ===\n\n";

        auto models = engine.list_models();
        auto current = engine.current_model_id();

        std::cout << "Found " << models.size() << " model(s):\n\n";
        for (size_t i = 0; i < models.size(); i++)
        {
            const auto& model = models[i];
            std::cout << "  " << (i + 1) << ". " << model.name << " [" << model.id << "]"
                      << " usage " << engine.model_multiplier(model.id);
            if (current && *current == model.id)
                std::cout << " (current)";
            std::cout << "\n";
            if (!model.description.empty())
                std::cout << "     " << model.description << "\n";
        }

        if (auto auth = engine.auth_method())
        {
            std::cout << "\nAuthentication: " << auth->name;
            if (auth->command)
            {
                std::cout << " (run: " << *auth->command;
                for (const auto& arg : auth->args)
                    std::cout << " " << arg;
                std::cout << ")";
            }
            std::cout << "\n";
        }

        engine.close();
        return 0;
    }
    catch (const acp::AgentNotFoundError& e)
    {
        std::cerr << e.what() << "\n";
        return 2;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
