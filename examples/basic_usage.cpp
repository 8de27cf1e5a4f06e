/**
 * @file basic_usage.cpp
 * @brief Basic usage example for geminiweb
 */

#include <geminiweb/geminiweb.hpp>
#include <iostream>

using namespace geminiweb;

int main() {
    std::cout << "geminiweb - Basic Usage Example\n\n";

    try {
        // Cookies come from GEMINI_SECURE_1PSID / GEMINI_SECURE_1PSIDTS
        // or ~/.gemini_webapi/.env
        ClientOptions options;
        options.log_level = LogLevel::Info;
        Client client(options);

        std::cout << "Initializing client...\n";
        client.init();
        std::cout << "Client initialized!\n\n";

        std::cout << "Available models:\n";
        for (const auto& [name, model] : get_gemini_web_models()) {
            std::cout << "  - " << name << "\n";
        }
        std::cout << "\n";

        GenerateOptions request;
        request.prompt = "What are three interesting facts about the C++ programming language?";
        request.model = "gemini-2.5-flash";

        ModelOutput output = client.generate_content(request);

        std::cout << "Response received:\n" << output.text() << "\n";
        if (output.thoughts().has_value()) {
            std::cout << "\nThoughts:\n" << *output.thoughts() << "\n";
        }
        for (const Image* image : output.images()) {
            std::cout << image->describe() << "\n";
        }

        // Gems
        GemCache gems = client.fetch_gems();
        std::cout << "\nPredefined gems:\n";
        for (const auto& [id, gem] : gems.filter(true)) {
            std::cout << "  - " << gem.name << " (" << id << ")\n";
        }

        std::cout << "\nClosing client...\n";
        client.close();
        std::cout << "Done!\n";

    } catch (const GeminiWebError& e) {
        std::cerr << "geminiweb Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
