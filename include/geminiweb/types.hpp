/**
 * @file types.hpp
 * @brief Type definitions for geminiweb
 */

#ifndef GEMINIWEB_TYPES_HPP
#define GEMINIWEB_TYPES_HPP

#include "http.hpp"
#include "images.hpp"
#include "logging.hpp"
#include <array>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace geminiweb {

using json = nlohmann::json;

// =============================================================================
// Constants
// =============================================================================

constexpr const char* INIT_ENDPOINT = "https://gemini.google.com/app";
constexpr const char* GENERATE_ENDPOINT =
    "https://gemini.google.com/_/BardChatUi/data/assistant.lamda.BardFrontendService/StreamGenerate";
constexpr const char* BATCH_EXEC_ENDPOINT = "https://gemini.google.com/_/BardChatUi/data/batchexecute";
constexpr const char* ROTATE_COOKIES_ENDPOINT = "https://accounts.google.com/RotateCookies";
constexpr const char* UPLOAD_ENDPOINT = "https://content-push.googleapis.com/upload";
constexpr const char* UPLOAD_PUSH_ID = "feeds/mcudyrk2a4khkz";

constexpr const char* SECURE_1PSID = "__Secure-1PSID";
constexpr const char* SECURE_1PSIDTS = "__Secure-1PSIDTS";

constexpr const char* MODEL_HEADER_KEY = "x-goog-ext-525001261-jspb";

constexpr const char* ENV_SECURE_1PSID = "GEMINI_SECURE_1PSID";
constexpr const char* ENV_SECURE_1PSIDTS = "GEMINI_SECURE_1PSIDTS";
constexpr const char* GEMINIWEB_DIR = ".gemini_webapi";
constexpr const char* GEMINIWEB_ENV_FILENAME = ".env";

/**
 * Headers the web app sends with every chat request
 */
HeaderMap gemini_headers();

// =============================================================================
// Enums
// =============================================================================

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Error
};

/**
 * Service error codes found in a rejected generation response
 */
enum class ErrorCode {
    UsageLimitExceeded = 1037,
    ModelHeaderInvalid = 1052,
    IpTemporarilyBlocked = 1060
};

std::string connection_state_to_string(ConnectionState state);
std::optional<ErrorCode> error_code_from_int(int code);

// =============================================================================
// Model Types
// =============================================================================

struct Model {
    std::string name;
    HeaderMap headers;
    bool advanced_only = false;

    /**
     * Look a model up by name
     * @throws ValidationError for unknown names
     */
    static Model from_name(const std::string& name);
    static Model unspecified();
};

std::map<std::string, Model> get_gemini_web_models();

// =============================================================================
// Gem Types
// =============================================================================

struct Gem {
    std::string id;
    std::string name;
    std::string description;
    std::optional<std::string> prompt;
    bool predefined = false;

    bool operator==(const Gem& other) const;
};

/**
 * Snapshot of fetched gems, keyed by id
 */
class GemCache {
public:
    using const_iterator = std::map<std::string, Gem>::const_iterator;

    GemCache() = default;
    explicit GemCache(const std::vector<Gem>& gems);

    std::optional<Gem> get(const std::string& id) const;
    std::optional<Gem> find_by_name(const std::string& name) const;

    /**
     * Gems matching every supplied criterion
     */
    GemCache filter(
        std::optional<bool> predefined = std::nullopt,
        const std::optional<std::string>& name = std::nullopt
    ) const;

    size_t size() const { return gems_.size(); }
    bool empty() const { return gems_.empty(); }
    const_iterator begin() const { return gems_.begin(); }
    const_iterator end() const { return gems_.end(); }

private:
    std::map<std::string, Gem> gems_;
};

// =============================================================================
// Conversation Types
// =============================================================================

/**
 * [cid, rid, rcid] triple identifying a turn in a conversation
 */
class ConversationLineage {
public:
    static constexpr size_t SIZE = 3;
    using Slot = std::optional<std::string>;

    ConversationLineage() = default;

    const Slot& cid() const { return slots_[0]; }
    const Slot& rid() const { return slots_[1]; }
    const Slot& rcid() const { return slots_[2]; }

    void set_cid(const Slot& value) { slots_[0] = value; }
    void set_rid(const Slot& value) { slots_[1] = value; }
    void set_rcid(const Slot& value) { slots_[2] = value; }

    /**
     * Overwrite the leading slots with `prefix`, leaving later slots untouched
     * @throws ValidationError when prefix has more than 3 elements
     */
    void assign(const std::vector<Slot>& prefix);

    std::vector<Slot> values() const;
    bool empty() const;

    /**
     * Three-element array with null for unset slots
     */
    json to_json() const;

    bool operator==(const ConversationLineage& other) const { return slots_ == other.slots_; }

private:
    std::array<Slot, SIZE> slots_;
};

struct Candidate {
    std::string rcid;
    std::string text;
    std::optional<std::string> thoughts;
    std::vector<WebImage> web_images;
    std::vector<GeneratedImage> generated_images;

    /**
     * Web images followed by generated images
     */
    std::vector<const Image*> images() const;

    bool operator==(const Candidate& other) const;
};

/**
 * Output of one generation call
 */
class ModelOutput {
public:
    ModelOutput(const std::vector<ConversationLineage::Slot>& lineage, const std::vector<Candidate>& candidates);

    const std::vector<ConversationLineage::Slot>& lineage() const { return lineage_; }
    const std::vector<Candidate>& candidates() const { return candidates_; }

    size_t chosen() const { return chosen_; }

    /**
     * @throws ValidationError when index is out of range
     */
    void set_chosen(size_t index);

    const Candidate& chosen_candidate() const { return candidates_.at(chosen_); }
    const std::string& text() const { return chosen_candidate().text; }
    const std::optional<std::string>& thoughts() const { return chosen_candidate().thoughts; }
    const std::string& rcid() const { return chosen_candidate().rcid; }
    std::vector<const Image*> images() const { return chosen_candidate().images(); }

    bool operator==(const ModelOutput& other) const;

private:
    std::vector<ConversationLineage::Slot> lineage_;
    std::vector<Candidate> candidates_;
    size_t chosen_;
};

// =============================================================================
// Client Types
// =============================================================================

struct ClientOptions {
    std::optional<std::string> secure_1psid;
    std::optional<std::string> secure_1psidts;
    std::optional<std::string> proxy;
    double timeout = 300.0;
    bool auto_close = false;
    double close_delay = 300.0;
    bool auto_refresh = true;
    double refresh_interval = 540.0;
    std::chrono::milliseconds retry_delay{1000};
    size_t image_scan_limit = 64;
    // Applied process-wide by the Client constructor; the last client constructed wins
    LogLevel log_level = LogLevel::Warning;
};

struct GenerateOptions {
    std::string prompt;
    std::vector<std::string> files;
    std::string model = "unspecified";
    std::optional<std::string> gem;
    int retry = 2;
};

struct ChatOptions {
    std::vector<ConversationLineage::Slot> lineage;
    std::optional<std::string> cid;
    std::optional<std::string> rid;
    std::optional<std::string> rcid;
    std::string model = "unspecified";
    std::optional<std::string> gem;
};

// =============================================================================
// Utility Functions
// =============================================================================

std::string get_geminiweb_env_path(const std::optional<std::string>& custom_path = std::nullopt);

/**
 * Seed cookies from the environment, falling back to the env file
 */
CookieJar load_cookies_from_env(const std::optional<std::string>& env_path = std::nullopt);

/**
 * ISO-8601 UTC rendering of a time point
 */
std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace geminiweb

#endif // GEMINIWEB_TYPES_HPP
