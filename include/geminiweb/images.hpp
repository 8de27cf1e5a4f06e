/**
 * @file images.hpp
 * @brief Images attached to a reply candidate
 */

#ifndef GEMINIWEB_IMAGES_HPP
#define GEMINIWEB_IMAGES_HPP

#include "http.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace geminiweb {

/**
 * Image reference returned by the service
 */
class Image {
public:
    Image(const std::string& url, const std::string& title, const std::string& alt);
    virtual ~Image() = default;

    const std::string& url() const { return url_; }
    const std::string& title() const { return title_; }
    const std::string& alt() const { return alt_; }

    /**
     * Whether fetching needs the session cookies
     */
    virtual bool requires_credentials() const = 0;

    /**
     * Human-readable one-line summary
     */
    virtual std::string describe() const;

    /**
     * Download the image
     * @param transport Transport to issue the GET on
     * @return Raw image bytes
     */
    virtual std::vector<uint8_t> fetch_bytes(HttpTransport& transport) const;

    /**
     * Download the image into a directory
     * @param directory Target directory, created when missing
     * @param filename File name, derived from the url when omitted
     * @return Path of the written file
     */
    std::string save(
        HttpTransport& transport,
        const std::string& directory = "temp",
        const std::optional<std::string>& filename = std::nullopt
    ) const;

    bool operator==(const Image& other) const;

protected:
    virtual const char* kind() const = 0;
    virtual std::string download_url() const { return url_; }
    virtual CookieJar download_cookies() const { return {}; }
    virtual std::string default_filename() const;

    std::string url_;
    std::string title_;
    std::string alt_;
};

/**
 * Image found on the web and linked from the reply
 */
class WebImage : public Image {
public:
    WebImage(const std::string& url, const std::string& title = "[Image]", const std::string& alt = "");

    bool requires_credentials() const override { return false; }

protected:
    const char* kind() const override { return "WebImage"; }
};

/**
 * Image produced by the model; only reachable with the session cookies
 */
class GeneratedImage : public Image {
public:
    GeneratedImage(
        const std::string& url,
        const std::string& title,
        const std::string& alt,
        const CookieJar& cookies,
        bool full_size = true
    );

    bool requires_credentials() const override { return true; }

    const CookieJar& cookies() const { return cookies_; }
    bool full_size() const { return full_size_; }
    void set_full_size(bool full_size) { full_size_ = full_size; }

protected:
    const char* kind() const override { return "GeneratedImage"; }
    std::string download_url() const override;
    CookieJar download_cookies() const override { return cookies_; }
    std::string default_filename() const override;

private:
    CookieJar cookies_;
    bool full_size_;
};

} // namespace geminiweb

#endif // GEMINIWEB_IMAGES_HPP
