/**
 * @file types.cpp
 * @brief Type implementations for geminiweb
 */

#include "geminiweb/types.hpp"
#include "geminiweb/errors.hpp"
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#include <shlobj.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace geminiweb {

HeaderMap gemini_headers() {
    return {
        {"Content-Type", "application/x-www-form-urlencoded;charset=utf-8"},
        {"Host", "gemini.google.com"},
        {"Origin", "https://gemini.google.com"},
        {"Referer", "https://gemini.google.com/"},
        {"User-Agent",
         "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
         "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36"},
        {"X-Same-Domain", "1"}
    };
}

std::string connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Error: return "error";
        default: return "disconnected";
    }
}

std::optional<ErrorCode> error_code_from_int(int code) {
    switch (code) {
        case static_cast<int>(ErrorCode::UsageLimitExceeded): return ErrorCode::UsageLimitExceeded;
        case static_cast<int>(ErrorCode::ModelHeaderInvalid): return ErrorCode::ModelHeaderInvalid;
        case static_cast<int>(ErrorCode::IpTemporarilyBlocked): return ErrorCode::IpTemporarilyBlocked;
        default: return std::nullopt;
    }
}

// =============================================================================
// Models
// =============================================================================

std::map<std::string, Model> get_gemini_web_models() {
    return {
        {"unspecified", {"unspecified", {}, false}},
        {"gemini-2.5-flash", {
            "gemini-2.5-flash",
            {{MODEL_HEADER_KEY, R"([1,null,null,null,"35609594dbe934d8"])"}},
            false
        }},
        {"gemini-2.5-pro", {
            "gemini-2.5-pro",
            {{MODEL_HEADER_KEY, R"([1,null,null,null,"2525e3954d185b3c"])"}},
            false
        }},
        {"gemini-2.0-flash", {
            "gemini-2.0-flash",
            {{MODEL_HEADER_KEY, R"([1,null,null,null,"f299729663a2343f"])"}},
            false
        }},
        {"gemini-2.0-flash-thinking", {
            "gemini-2.0-flash-thinking",
            {{MODEL_HEADER_KEY, R"([null,null,null,null,"7ca48d02d802f20a"])"}},
            false
        }}
    };
}

Model Model::from_name(const std::string& name) {
    auto models = get_gemini_web_models();
    auto it = models.find(name);
    if (it == models.end()) {
        std::string available;
        for (const auto& [model_name, _] : models) {
            if (!available.empty()) available += ", ";
            available += model_name;
        }
        throw ValidationError("Unknown model name: " + name + ". Available models: " + available, "model", name);
    }
    return it->second;
}

Model Model::unspecified() {
    return from_name("unspecified");
}

// =============================================================================
// Gems
// =============================================================================

bool Gem::operator==(const Gem& other) const {
    return id == other.id && name == other.name && description == other.description &&
           prompt == other.prompt && predefined == other.predefined;
}

GemCache::GemCache(const std::vector<Gem>& gems) {
    for (const auto& gem : gems) {
        gems_[gem.id] = gem;
    }
}

std::optional<Gem> GemCache::get(const std::string& id) const {
    auto it = gems_.find(id);
    if (it != gems_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<Gem> GemCache::find_by_name(const std::string& name) const {
    for (const auto& [id, gem] : gems_) {
        if (gem.name == name) {
            return gem;
        }
    }
    return std::nullopt;
}

GemCache GemCache::filter(std::optional<bool> predefined, const std::optional<std::string>& name) const {
    std::vector<Gem> matched;
    for (const auto& [id, gem] : gems_) {
        if (predefined.has_value() && gem.predefined != *predefined) continue;
        if (name.has_value() && gem.name != *name) continue;
        matched.push_back(gem);
    }
    return GemCache(matched);
}

// =============================================================================
// Conversation
// =============================================================================

void ConversationLineage::assign(const std::vector<Slot>& prefix) {
    if (prefix.size() > SIZE) {
        throw ValidationError(
            "Lineage cannot exceed 3 elements, got " + std::to_string(prefix.size()),
            "lineage"
        );
    }
    for (size_t i = 0; i < prefix.size(); i++) {
        slots_[i] = prefix[i];
    }
}

std::vector<ConversationLineage::Slot> ConversationLineage::values() const {
    return std::vector<Slot>(slots_.begin(), slots_.end());
}

bool ConversationLineage::empty() const {
    for (const auto& slot : slots_) {
        if (slot.has_value()) return false;
    }
    return true;
}

json ConversationLineage::to_json() const {
    json result = json::array();
    for (const auto& slot : slots_) {
        result.push_back(slot.has_value() ? json(*slot) : json(nullptr));
    }
    return result;
}

std::vector<const Image*> Candidate::images() const {
    std::vector<const Image*> result;
    for (const auto& image : web_images) {
        result.push_back(&image);
    }
    for (const auto& image : generated_images) {
        result.push_back(&image);
    }
    return result;
}

bool Candidate::operator==(const Candidate& other) const {
    if (rcid != other.rcid || text != other.text || thoughts != other.thoughts) return false;
    if (web_images.size() != other.web_images.size()) return false;
    if (generated_images.size() != other.generated_images.size()) return false;

    for (size_t i = 0; i < web_images.size(); i++) {
        if (!(web_images[i] == other.web_images[i])) return false;
    }
    for (size_t i = 0; i < generated_images.size(); i++) {
        if (!(generated_images[i] == other.generated_images[i])) return false;
    }
    return true;
}

ModelOutput::ModelOutput(
    const std::vector<ConversationLineage::Slot>& lineage,
    const std::vector<Candidate>& candidates
) : lineage_(lineage),
    candidates_(candidates),
    chosen_(0) {
}

void ModelOutput::set_chosen(size_t index) {
    if (index >= candidates_.size()) {
        throw ValidationError(
            "Index " + std::to_string(index) + " exceeds the number of candidates in last model output.",
            "index",
            std::to_string(index)
        );
    }
    chosen_ = index;
}

bool ModelOutput::operator==(const ModelOutput& other) const {
    return lineage_ == other.lineage_ && candidates_ == other.candidates_ && chosen_ == other.chosen_;
}

// =============================================================================
// Configuration
// =============================================================================

static std::string get_home_directory() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_PROFILE, NULL, 0, path))) {
        return std::string(path);
    }
    const char* userprofile = getenv("USERPROFILE");
    if (userprofile) return std::string(userprofile);
    return "";
#else
    const char* home = getenv("HOME");
    if (home) return std::string(home);

    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return "";
#endif
}

std::string get_geminiweb_env_path(const std::optional<std::string>& custom_path) {
    if (custom_path.has_value()) {
        return *custom_path;
    }

    std::string home = get_home_directory();
    if (home.empty()) return "";

#ifdef _WIN32
    return home + "\\" + GEMINIWEB_DIR + "\\" + GEMINIWEB_ENV_FILENAME;
#else
    return home + "/" + GEMINIWEB_DIR + "/" + GEMINIWEB_ENV_FILENAME;
#endif
}

static std::string strip_quotes(std::string value) {
    if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
        value = value.substr(1);
    }
    if (!value.empty() && (value.back() == '"' || value.back() == '\'')) {
        value.pop_back();
    }
    return value;
}

static std::map<std::string, std::string> read_env_file(const std::string& env_file) {
    std::map<std::string, std::string> values;

    std::ifstream file(env_file);
    if (!file.is_open()) {
        return values;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        values[line.substr(0, eq)] = strip_quotes(line.substr(eq + 1));
    }
    return values;
}

CookieJar load_cookies_from_env(const std::optional<std::string>& env_path) {
    CookieJar cookies;

    const char* env_psid = getenv(ENV_SECURE_1PSID);
    const char* env_psidts = getenv(ENV_SECURE_1PSIDTS);

    if (env_psid && *env_psid) {
        cookies[SECURE_1PSID] = env_psid;
        if (env_psidts && *env_psidts) {
            cookies[SECURE_1PSIDTS] = env_psidts;
        }
        return cookies;
    }

    auto values = read_env_file(get_geminiweb_env_path(env_path));
    auto psid = values.find(ENV_SECURE_1PSID);
    if (psid != values.end() && !psid->second.empty()) {
        cookies[SECURE_1PSID] = psid->second;
        auto psidts = values.find(ENV_SECURE_1PSIDTS);
        if (psidts != values.end() && !psidts->second.empty()) {
            cookies[SECURE_1PSIDTS] = psidts->second;
        }
    }
    return cookies;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_now = std::chrono::system_clock::to_time_t(tp);

    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t_now), "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace geminiweb
