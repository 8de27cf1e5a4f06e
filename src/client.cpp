/**
 * @file client.cpp
 * @brief Client implementation for geminiweb
 */

#include "geminiweb/client.hpp"
#include "geminiweb/errors.hpp"
#include <chrono>
#include <filesystem>

namespace geminiweb {

static constexpr const char* IDLE_CLOSE_TASK = "idle-close";

static TransportOptions transport_options_from(const ClientOptions& options) {
    TransportOptions transport_options;
    transport_options.proxy = options.proxy;
    transport_options.timeout = options.timeout;
    return transport_options;
}

static CookieJar seed_cookies_from(const ClientOptions& options) {
    if (!options.secure_1psid.has_value()) {
        return load_cookies_from_env();
    }

    CookieJar cookies;
    cookies[SECURE_1PSID] = *options.secure_1psid;
    if (options.secure_1psidts.has_value()) {
        cookies[SECURE_1PSIDTS] = *options.secure_1psidts;
    }
    return cookies;
}

static void require_utf8(const std::string& value, const std::string& field) {
    try {
        static_cast<void>(json(value).dump());
    } catch (const json::type_error&) {
        throw ValidationError(field + " must be valid UTF-8.", field);
    }
}

static std::chrono::milliseconds to_millis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
}

Client::Client(const ClientOptions& options)
    : Client(
          options,
          std::make_shared<CurlTransport>(transport_options_from(options)),
          std::make_shared<CurlFileUploader>(transport_options_from(options))
      ) {
}

Client::Client(
    const ClientOptions& options,
    std::shared_ptr<HttpTransport> transport,
    std::shared_ptr<FileUploader> uploader
)
    : options_(options),
      init_options_{options.timeout, options.auto_close, options.close_delay,
                    options.auto_refresh, options.refresh_interval},
      seed_cookies_(seed_cookies_from(options)),
      transport_(std::move(transport)),
      uploader_(std::move(uploader)),
      authenticator_(transport_),
      parser_(ParserOptions{options.image_scan_limit}),
      invoker_([this]() { ensure_ready(); }, options.retry_delay),
      state_(ConnectionState::Disconnected),
      running_(false) {
    log::set_level(options.log_level);
}

Client::~Client() {
    close();
}

bool Client::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

ConnectionState Client::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void Client::init() {
    InitOptions options;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        options = init_options_;
    }
    init(options);
}

void Client::init(const InitOptions& options) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        init_options_ = options;
        state_ = ConnectionState::Connecting;
    }

    try {
        // Rotated cookies from an earlier session take precedence over the seed
        CookieJar seed = credentials_.snapshot().cookies;
        if (seed.find(SECURE_1PSID) == seed.end()) {
            seed = seed_cookies_;
        }
        if (seed.find(SECURE_1PSID) == seed.end()) {
            throw ConfigurationError(
                "Failed to initialize client. Provide __Secure-1PSID through ClientOptions "
                "or the " + std::string(ENV_SECURE_1PSID) + " environment variable.",
                "secure_1psid"
            );
        }

        Credential credential = authenticator_.acquire(seed);
        credentials_.replace(credential);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = true;
            state_ = ConnectionState::Connected;
        }

        if (options.auto_close) {
            reset_close_task();
        }

        if (options.auto_refresh) {
            start_auto_refresh(credential.identity(), options.refresh_interval);
        }

        log::info("Gemini client initialized successfully.");
    } catch (const GeminiWebError& e) {
        log::error(std::string("Client initialization failed: ") + e.what());
        close();
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectionState::Error;
        throw;
    }
}

void Client::close() {
    timers_.cancel_all();
    refreshers_.cancel_all();
    close_connection();
}

void Client::close_connection() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        state_ = ConnectionState::Disconnected;
    }
    credentials_.clear_token();
    transport_->close();
}

void Client::start_auto_refresh(const std::string& identity, double interval) {
    auto step = [this]() {
        try {
            auto rotated = authenticator_.rotate(credentials_.snapshot().cookies);
            if (rotated.has_value()) {
                credentials_.set_cookie(SECURE_1PSIDTS, *rotated);
                log::debug("Cookies refreshed.");
            }
            return true;
        } catch (const GeminiWebError& e) {
            log::warning(
                std::string("Failed to refresh cookies. Background auto refresh task will be cancelled. ") +
                e.what()
            );
            return false;
        }
    };

    refreshers_.start_or_replace(
        identity,
        BackgroundTask::periodic("token-refresher", to_millis(interval), step)
    );
}

void Client::reset_close_task() {
    std::chrono::milliseconds delay;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delay = to_millis(init_options_.close_delay);
    }

    timers_.start_or_replace(
        IDLE_CLOSE_TASK,
        BackgroundTask::delayed(IDLE_CLOSE_TASK, delay, [this]() {
            log::info("Closing client after inactivity.");
            close_connection();
        })
    );
}

void Client::ensure_ready() {
    if (running()) {
        return;
    }

    init();

    if (!running()) {
        throw APIError("Failed to initialize client. Client initialization failed.");
    }
}

HttpResponse Client::send_or_timeout(HttpRequest request, const std::string& timeout_message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        request.timeout = init_options_.timeout;
    }

    try {
        return transport_->send(request);
    } catch (const TimeoutError& e) {
        throw TimeoutError(timeout_message, e.timeout());
    }
}

std::map<std::string, json> Client::get_auth_status() const {
    std::map<std::string, json> status;

    Credential credential = credentials_.snapshot();
    bool authenticated = !credential.access_token.empty();

    status["authenticated"] = authenticated;
    status["state"] = connection_state_to_string(state());
    status["auto_refresh"] = refreshers_.active(credential.identity());
    if (authenticated) {
        status["issued_at"] = format_timestamp(credential.issued_at);
    }

    return status;
}

GemCache Client::gems() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!gems_.has_value()) {
        throw ConfigurationError(
            "Gems not fetched yet. Call `Client::fetch_gems()` to fetch gems from gemini.google.com.",
            "gems"
        );
    }
    return *gems_;
}

GemCache Client::fetch_gems(int retry) {
    CallDescriptor<GemCache> descriptor{"fetch_gems", [this]() { return fetch_gems_once(); }, retry};
    return invoker_.invoke(descriptor);
}

GemCache Client::fetch_gems_once() {
    Credential credential = credentials_.snapshot();

    HttpRequest request;
    request.method = HttpMethod::Post;
    request.url = BATCH_EXEC_ENDPOINT;
    request.headers = gemini_headers();
    request.cookies = credential.cookies;
    request.form = RequestCodec::batch_form(credential.access_token, RequestCodec::gems_rpc_calls());

    HttpResponse response = send_or_timeout(
        request,
        "Fetch gems request timed out, please try again. If the problem persists, "
        "consider setting a higher `timeout` value when initializing the client."
    );

    if (response.status_code != 200) {
        close_connection();
        throw APIError(
            "Batch execution failed with status code " + std::to_string(response.status_code),
            static_cast<int>(response.status_code),
            BATCH_EXEC_ENDPOINT
        );
    }

    std::vector<Gem> gems;
    try {
        gems = parser_.parse_gems(response.body);
    } catch (const APIError&) {
        close_connection();
        throw;
    }

    GemCache cache(gems);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        gems_ = cache;
    }
    return cache;
}

ModelOutput Client::generate_content(
    const GenerateOptions& options,
    const std::optional<ConversationLineage>& lineage
) {
    if (options.prompt.empty()) {
        throw ValidationError("Prompt cannot be empty.", "prompt");
    }
    require_utf8(options.prompt, "prompt");
    if (options.gem.has_value()) {
        require_utf8(*options.gem, "gem");
    }

    Model model = Model::from_name(options.model);

    CallDescriptor<ModelOutput> descriptor{
        "generate_content",
        [&]() { return generate_once(options, model, lineage); },
        options.retry
    };
    return invoker_.invoke(descriptor);
}

ModelOutput Client::generate_once(
    const GenerateOptions& options,
    const Model& model,
    const std::optional<ConversationLineage>& lineage
) {
    bool auto_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto_close = init_options_.auto_close;
    }
    if (auto_close) {
        reset_close_task();
    }

    Credential credential = credentials_.snapshot();

    TurnRequest turn;
    turn.prompt = options.prompt;
    turn.lineage = lineage;
    turn.gem_id = options.gem;

    if (!options.files.empty() && !uploader_) {
        throw ConfigurationError("File attachments need an uploader.", "uploader");
    }
    for (const auto& path : options.files) {
        UploadedFile file;
        file.upload_ref = uploader_->upload(path);
        file.file_name = std::filesystem::path(path).filename().string();
        turn.files.push_back(file);
    }

    HttpRequest request;
    request.method = HttpMethod::Post;
    request.url = GENERATE_ENDPOINT;
    request.headers = gemini_headers();
    for (const auto& [key, value] : model.headers) {
        request.headers[key] = value;
    }
    request.cookies = credential.cookies;
    request.form = RequestCodec::generation_form(credential.access_token, turn);

    HttpResponse response = send_or_timeout(
        request,
        "Generate content request timed out, please try again. If the problem persists, "
        "consider setting a higher `timeout` value when initializing the client."
    );

    if (response.status_code != 200) {
        close_connection();
        throw APIError(
            "Failed to generate contents. Request failed with status code " +
                std::to_string(response.status_code),
            static_cast<int>(response.status_code),
            GENERATE_ENDPOINT
        );
    }

    ParseContext context;
    context.model_name = model.name;
    context.cookies = credential.cookies;

    try {
        return parser_.parse_generation(response.body, context);
    } catch (const ServiceRejection&) {
        close_connection();
        throw;
    } catch (const APIError&) {
        close_connection();
        throw;
    }
}

ChatSession Client::start_chat(const ChatOptions& options) {
    return ChatSession(*this, options);
}

} // namespace geminiweb
