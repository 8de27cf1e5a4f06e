/**
 * @file http.cpp
 * @brief libcurl transport for geminiweb
 */

#include "geminiweb/http.hpp"
#include "geminiweb/errors.hpp"
#include "geminiweb/logging.hpp"
#include "geminiweb/types.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace geminiweb {

static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, CookieJar* cookies) {
    std::string line(buffer, size * nitems);
    if (auto cookie = parse_set_cookie(line)) {
        (*cookies)[cookie->first] = cookie->second;
    }
    return size * nitems;
}

static std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

static std::string escape(CURL* curl, const std::string& value) {
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.length()));
    if (!escaped) {
        throw APIError("Failed to url-encode request field");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

std::string url_encode_form(const FormFields& form) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw APIError("Failed to initialize CURL");
    }

    std::string encoded;
    try {
        for (const auto& [key, value] : form) {
            if (!encoded.empty()) encoded += "&";
            encoded += escape(curl, key) + "=" + escape(curl, value);
        }
    } catch (const APIError&) {
        curl_easy_cleanup(curl);
        throw;
    }

    curl_easy_cleanup(curl);
    return encoded;
}

std::string format_cookie_header(const CookieJar& cookies) {
    std::string header;
    for (const auto& [name, value] : cookies) {
        if (!header.empty()) header += "; ";
        header += name + "=" + value;
    }
    return header;
}

std::optional<std::pair<std::string, std::string>> parse_set_cookie(const std::string& header_line) {
    static const std::string prefix = "set-cookie:";
    if (header_line.size() <= prefix.size()) {
        return std::nullopt;
    }

    std::string head = header_line.substr(0, prefix.size());
    std::transform(head.begin(), head.end(), head.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (head != prefix) {
        return std::nullopt;
    }

    std::string cookie = header_line.substr(prefix.size());
    cookie = trim(cookie.substr(0, cookie.find(';')));

    size_t eq = cookie.find('=');
    if (eq == std::string::npos || eq == 0) {
        return std::nullopt;
    }
    return std::make_pair(trim(cookie.substr(0, eq)), trim(cookie.substr(eq + 1)));
}

CurlTransport::CurlTransport(const TransportOptions& options)
    : handle_(nullptr), options_(options) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlTransport::~CurlTransport() {
    close();
    curl_global_cleanup();
}

void CurlTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_) {
        curl_easy_cleanup(static_cast<CURL*>(handle_));
        handle_ = nullptr;
    }
}

HttpResponse CurlTransport::send(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!handle_) {
        handle_ = curl_easy_init();
        if (!handle_) {
            throw APIError("Failed to initialize CURL", std::nullopt, request.url);
        }
    }

    CURL* curl = static_cast<CURL*>(handle_);
    curl_easy_reset(curl);

    HttpResponse response;
    std::string post_fields;
    double timeout = request.timeout.value_or(options_.timeout);

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.cookies);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout * 1000));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    if (options_.proxy.has_value()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, options_.proxy->c_str());
    }

    if (request.method == HttpMethod::Post) {
        post_fields = request.form.empty() ? request.body : url_encode_form(request.form);
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_fields.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_fields.size()));
    }

    std::string cookie_header = format_cookie_header(request.cookies);
    if (!cookie_header.empty()) {
        curl_easy_setopt(curl, CURLOPT_COOKIE, cookie_header.c_str());
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : request.headers) {
        header_list = curl_slist_append(header_list, (key + ": " + value).c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw TimeoutError("Request to " + request.url + " timed out", timeout);
    }

    if (res != CURLE_OK) {
        throw APIError("CURL error: " + std::string(curl_easy_strerror(res)), std::nullopt, request.url);
    }

    response.status_code = http_code;
    return response;
}

CurlFileUploader::CurlFileUploader(const TransportOptions& options)
    : options_(options) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlFileUploader::~CurlFileUploader() {
    curl_global_cleanup();
}

std::string CurlFileUploader::upload(const std::string& path) {
    if (!std::filesystem::is_regular_file(path)) {
        throw ValidationError("File not found: " + path, "file", path);
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw APIError("Failed to initialize CURL", std::nullopt, UPLOAD_ENDPOINT);
    }

    std::string response;

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_filedata(part, path.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, UPLOAD_ENDPOINT);
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout * 1000));

    if (options_.proxy.has_value()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, options_.proxy->c_str());
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, (std::string("Push-ID: ") + UPLOAD_PUSH_ID).c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw TimeoutError("File upload timed out: " + path, options_.timeout);
    }

    if (res != CURLE_OK) {
        throw APIError("CURL error: " + std::string(curl_easy_strerror(res)), std::nullopt, UPLOAD_ENDPOINT);
    }

    if (http_code != 200) {
        throw APIError(
            "Failed to upload " + path + ". Request failed with status code " + std::to_string(http_code),
            static_cast<int>(http_code),
            UPLOAD_ENDPOINT
        );
    }

    log::debug("Uploaded " + path + " as " + response);
    return response;
}

} // namespace geminiweb
