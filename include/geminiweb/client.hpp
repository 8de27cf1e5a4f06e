/**
 * @file client.hpp
 * @brief Main client for geminiweb
 */

#ifndef GEMINIWEB_CLIENT_HPP
#define GEMINIWEB_CLIENT_HPP

#include "types.hpp"
#include "auth.hpp"
#include "invoker.hpp"
#include "request_codec.hpp"
#include "response_parser.hpp"
#include "session.hpp"
#include "tasks.hpp"
#include <map>
#include <memory>
#include <mutex>

namespace geminiweb {

/**
 * Lifecycle settings applied by init(); kept so that an automatic
 * re-initialization uses the same values
 */
struct InitOptions {
    double timeout = 300.0;
    bool auto_close = false;
    double close_delay = 300.0;
    bool auto_refresh = true;
    double refresh_interval = 540.0;
};

/**
 * Main geminiweb client
 */
class Client {
public:
    /**
     * Create a client talking to gemini.google.com over libcurl
     * @param options Configuration options
     */
    explicit Client(const ClientOptions& options = {});

    /**
     * Create a client over caller-supplied collaborators
     */
    Client(
        const ClientOptions& options,
        std::shared_ptr<HttpTransport> transport,
        std::shared_ptr<FileUploader> uploader
    );

    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /**
     * Authenticate and start background tasks, using the lifecycle
     * settings from ClientOptions
     */
    void init();

    /**
     * Authenticate and start background tasks
     * @throws AuthError when the seed cookies are rejected
     * @throws ConfigurationError when no seed cookies are available
     */
    void init(const InitOptions& options);

    /**
     * Stop background tasks and drop the connection
     */
    void close();

    bool running() const;
    ConnectionState state() const;

    /**
     * Get authentication status
     * @return Status map
     */
    std::map<std::string, json> get_auth_status() const;

    /**
     * Gems from the last fetch_gems() call
     * @throws ConfigurationError when gems were never fetched
     */
    GemCache gems() const;

    /**
     * Fetch predefined and custom gems and replace the cached snapshot
     */
    GemCache fetch_gems(int retry = 2);

    /**
     * Run one generation turn
     * @param options Prompt, attachments, model, gem and retry budget
     * @param lineage Conversation to continue; a new one when absent
     * @throws ValidationError for an empty prompt or unknown model
     */
    ModelOutput generate_content(
        const GenerateOptions& options,
        const std::optional<ConversationLineage>& lineage = std::nullopt
    );

    /**
     * Create a conversation bound to this client
     */
    ChatSession start_chat(const ChatOptions& options = {});

private:
    void ensure_ready();
    void start_auto_refresh(const std::string& identity, double interval);
    void reset_close_task();
    void close_connection();

    ModelOutput generate_once(
        const GenerateOptions& options,
        const Model& model,
        const std::optional<ConversationLineage>& lineage
    );
    GemCache fetch_gems_once();

    HttpResponse send_or_timeout(HttpRequest request, const std::string& timeout_message);

    ClientOptions options_;
    InitOptions init_options_;
    CookieJar seed_cookies_;

    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<FileUploader> uploader_;
    CookieAuthenticator authenticator_;
    CredentialStore credentials_;
    ResponseParser parser_;
    RetryingInvoker invoker_;
    std::optional<GemCache> gems_;

    ConnectionState state_;
    bool running_;
    mutable std::mutex mutex_;

    // Declared last so their threads stop before anything they touch is destroyed
    TaskRegistry refreshers_;
    TaskRegistry timers_;
};

} // namespace geminiweb

#endif // GEMINIWEB_CLIENT_HPP
