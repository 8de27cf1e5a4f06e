/**
 * @file chat_session.cpp
 * @brief Multi-turn chat example for geminiweb
 */

#include <geminiweb/geminiweb.hpp>
#include <iostream>

using namespace geminiweb;

int main(int argc, char* argv[]) {
    std::cout << "geminiweb - Chat Session Example\n\n";

    try {
        ClientOptions options;
        options.auto_close = true;
        options.close_delay = 300;
        Client client(options);
        client.init();

        ChatOptions chat_options;
        chat_options.model = "gemini-2.5-pro";
        ChatSession chat = client.start_chat(chat_options);

        ModelOutput first = chat.send("Suggest a name for a small C++ HTTP library.");
        std::cout << "Gemini: " << first.text() << "\n\n";
        std::cout << chat.describe() << "\n\n";

        // Other drafts of the same reply can continue the conversation
        if (first.candidates().size() > 1) {
            chat.choose_candidate(1);
            std::cout << "Continuing from candidate 1\n\n";
        }

        ModelOutput second = chat.send("Why did you pick that name?");
        std::cout << "Gemini: " << second.text() << "\n\n";

        // Attach a file when one is given on the command line
        if (argc > 1) {
            ModelOutput third = chat.send("Describe this file.", {argv[1]});
            std::cout << "Gemini: " << third.text() << "\n";
        }

        client.close();

    } catch (const GeminiWebError& e) {
        std::cerr << "geminiweb Error [" << e.code() << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
