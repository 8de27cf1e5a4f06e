/**
 * @file http.hpp
 * @brief HTTP transport used to reach gemini.google.com
 */

#ifndef GEMINIWEB_HTTP_HPP
#define GEMINIWEB_HTTP_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace geminiweb {

using CookieJar = std::map<std::string, std::string>;
using HeaderMap = std::map<std::string, std::string>;
using FormFields = std::vector<std::pair<std::string, std::string>>;

enum class HttpMethod {
    Get,
    Post
};

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;
    HeaderMap headers;
    CookieJar cookies;
    // Sent url-encoded when non-empty, otherwise `body` is sent as-is
    FormFields form;
    std::string body;
    std::optional<double> timeout;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
    // Cookies set by the response (Set-Cookie), name -> value
    CookieJar cookies;
};

/**
 * One HTTP exchange at a time over a reusable connection.
 * Implementations throw TimeoutError when the deadline passes and
 * APIError for any other transport failure.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse send(const HttpRequest& request) = 0;

    /**
     * Drop the underlying connection; the next send reconnects
     */
    virtual void close() {}
};

/**
 * Upload collaborator: turns a local file into an opaque upload reference
 */
class FileUploader {
public:
    virtual ~FileUploader() = default;

    virtual std::string upload(const std::string& path) = 0;
};

struct TransportOptions {
    std::optional<std::string> proxy;
    double timeout = 300.0;
    bool follow_redirects = true;
};

/**
 * libcurl transport keeping one easy handle alive between requests
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(const TransportOptions& options = {});
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse send(const HttpRequest& request) override;
    void close() override;

private:
    void* handle_;
    TransportOptions options_;
    std::mutex mutex_;
};

/**
 * Multipart upload to the content-push endpoint
 */
class CurlFileUploader : public FileUploader {
public:
    explicit CurlFileUploader(const TransportOptions& options = {});
    ~CurlFileUploader() override;

    std::string upload(const std::string& path) override;

private:
    TransportOptions options_;
};

std::string url_encode_form(const FormFields& form);
std::string format_cookie_header(const CookieJar& cookies);

/**
 * Parse one raw header line; returns the cookie when it is a Set-Cookie line
 */
std::optional<std::pair<std::string, std::string>> parse_set_cookie(const std::string& header_line);

} // namespace geminiweb

#endif // GEMINIWEB_HTTP_HPP
