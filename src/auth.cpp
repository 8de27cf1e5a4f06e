/**
 * @file auth.cpp
 * @brief Cookie authentication implementation for geminiweb
 */

#include "geminiweb/auth.hpp"
#include "geminiweb/errors.hpp"

namespace geminiweb {

static constexpr const char* ROTATE_COOKIES_BODY = R"([000,"-0000000000000000000"])";

std::string Credential::identity() const {
    auto it = cookies.find(SECURE_1PSID);
    return it != cookies.end() ? it->second : "";
}

Credential CredentialStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credential_;
}

bool CredentialStore::has_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !credential_.access_token.empty();
}

void CredentialStore::replace(const Credential& credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    credential_ = credential;
}

void CredentialStore::set_cookie(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    credential_.cookies[name] = value;
}

void CredentialStore::clear_token() {
    std::lock_guard<std::mutex> lock(mutex_);
    credential_.access_token.clear();
}

CookieAuthenticator::CookieAuthenticator(std::shared_ptr<HttpTransport> transport)
    : transport_(std::move(transport)) {
}

std::optional<std::string> CookieAuthenticator::extract_access_token(const std::string& page) {
    static const std::string marker = R"("SNlM0e":")";
    size_t start = page.find(marker);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    start += marker.size();

    size_t end = page.find('"', start);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    return page.substr(start, end - start);
}

Credential CookieAuthenticator::acquire(const CookieJar& seed_cookies) {
    auto psid = seed_cookies.find(SECURE_1PSID);
    if (psid == seed_cookies.end() || psid->second.empty()) {
        throw AuthError("Failed to initialize client. __Secure-1PSID cookie is missing.");
    }

    HttpRequest request;
    request.method = HttpMethod::Get;
    request.url = INIT_ENDPOINT;
    request.headers = gemini_headers();
    request.cookies = seed_cookies;

    HttpResponse response = transport_->send(request);

    if (response.status_code != 200) {
        throw AuthError(
            "Failed to initialize client. Request failed with status code " +
                std::to_string(response.status_code),
            static_cast<int>(response.status_code)
        );
    }

    auto access_token = extract_access_token(response.body);
    if (!access_token.has_value()) {
        throw AuthError(
            "Failed to initialize client. SECURE_1PSIDTS could get expired frequently, "
            "please make sure cookie values are up to date.",
            static_cast<int>(response.status_code)
        );
    }

    Credential credential;
    credential.cookies = seed_cookies;
    for (const auto& [name, value] : response.cookies) {
        credential.cookies[name] = value;
    }
    credential.access_token = *access_token;
    credential.issued_at = std::chrono::system_clock::now();
    return credential;
}

std::optional<std::string> CookieAuthenticator::rotate(const CookieJar& cookies) {
    HttpRequest request;
    request.method = HttpMethod::Post;
    request.url = ROTATE_COOKIES_ENDPOINT;
    request.headers = {{"Content-Type", "application/json"}};
    request.cookies = cookies;
    request.body = ROTATE_COOKIES_BODY;

    HttpResponse response = transport_->send(request);

    if (response.status_code == 401) {
        throw AuthError("Cookie rotation rejected: session cookies are no longer valid", 401);
    }

    if (response.status_code != 200) {
        throw AuthError(
            "Cookie rotation failed with status code " + std::to_string(response.status_code),
            static_cast<int>(response.status_code)
        );
    }

    auto it = response.cookies.find(SECURE_1PSIDTS);
    if (it != response.cookies.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace geminiweb
