/**
 * @file auth.hpp
 * @brief Cookie authentication for geminiweb
 */

#ifndef GEMINIWEB_AUTH_HPP
#define GEMINIWEB_AUTH_HPP

#include "types.hpp"
#include <chrono>
#include <memory>
#include <mutex>

namespace geminiweb {

/**
 * Session cookies paired with the access token derived from them
 */
struct Credential {
    CookieJar cookies;
    std::string access_token;
    std::chrono::system_clock::time_point issued_at;

    /**
     * Value of __Secure-1PSID, the identity the credential belongs to
     */
    std::string identity() const;
};

/**
 * Holds the current credential. Readers take a snapshot so cookies and
 * token always come from the same write.
 */
class CredentialStore {
public:
    CredentialStore() = default;

    Credential snapshot() const;
    bool has_token() const;

    void replace(const Credential& credential);

    /**
     * Update one cookie in place, keeping the access token
     */
    void set_cookie(const std::string& name, const std::string& value);

    void clear_token();

private:
    Credential credential_;
    mutable std::mutex mutex_;
};

/**
 * Performs the cookie handshakes against gemini.google.com
 */
class CookieAuthenticator {
public:
    explicit CookieAuthenticator(std::shared_ptr<HttpTransport> transport);

    /**
     * Derive the access token from seed cookies
     * @param seed_cookies Cookies containing at least __Secure-1PSID
     * @return Credential with the merged cookie jar
     * @throws AuthError when the seed is rejected or no token is found
     */
    Credential acquire(const CookieJar& seed_cookies);

    /**
     * Ask Google to rotate the short-lived session cookie
     * @param cookies Current cookie jar
     * @return New __Secure-1PSIDTS value, if the response set one
     * @throws AuthError when the rotation is refused
     */
    std::optional<std::string> rotate(const CookieJar& cookies);

    /**
     * Pull the access token out of the app page
     */
    static std::optional<std::string> extract_access_token(const std::string& page);

private:
    std::shared_ptr<HttpTransport> transport_;
};

} // namespace geminiweb

#endif // GEMINIWEB_AUTH_HPP
