/**
 * @file images.cpp
 * @brief Image download helpers for geminiweb
 */

#include "geminiweb/images.hpp"
#include "geminiweb/errors.hpp"
#include "geminiweb/logging.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>

namespace geminiweb {

static constexpr const char* FULL_SIZE_SUFFIX = "=s2048";

Image::Image(const std::string& url, const std::string& title, const std::string& alt)
    : url_(url), title_(title), alt_(alt) {
}

std::string Image::describe() const {
    std::string shown_url = url_.size() > 50 ? url_.substr(0, 20) + "..." + url_.substr(url_.size() - 20) : url_;
    return std::string(kind()) + "(title='" + title_ + "', url='" + shown_url + "', alt='" + alt_ + "')";
}

std::vector<uint8_t> Image::fetch_bytes(HttpTransport& transport) const {
    HttpRequest request;
    request.method = HttpMethod::Get;
    request.url = download_url();
    request.cookies = download_cookies();

    HttpResponse response = transport.send(request);
    if (response.status_code != 200) {
        throw APIError(
            "Error downloading image: " + std::to_string(response.status_code),
            static_cast<int>(response.status_code),
            request.url
        );
    }

    return std::vector<uint8_t>(response.body.begin(), response.body.end());
}

std::string Image::default_filename() const {
    std::string name = url_.substr(url_.rfind('/') + 1);
    return name.substr(0, name.find('?'));
}

std::string Image::save(
    HttpTransport& transport,
    const std::string& directory,
    const std::optional<std::string>& filename
) const {
    std::string name = filename.value_or(default_filename());

    static const std::regex valid_name(R"(^.*\.\w+$)");
    if (!std::regex_match(name, valid_name)) {
        throw ValidationError("Invalid filename: " + name, "filename", name);
    }

    std::vector<uint8_t> data = fetch_bytes(transport);

    std::filesystem::create_directories(directory);
    std::filesystem::path dest = std::filesystem::path(directory) / name;

    std::ofstream file(dest, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot write image to " + dest.string(), "directory");
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));

    log::info("Image saved as " + dest.string());
    return dest.string();
}

bool Image::operator==(const Image& other) const {
    return url_ == other.url_ && title_ == other.title_ && alt_ == other.alt_ &&
           requires_credentials() == other.requires_credentials();
}

WebImage::WebImage(const std::string& url, const std::string& title, const std::string& alt)
    : Image(url, title, alt) {
}

GeneratedImage::GeneratedImage(
    const std::string& url,
    const std::string& title,
    const std::string& alt,
    const CookieJar& cookies,
    bool full_size
) : Image(url, title, alt),
    cookies_(cookies),
    full_size_(full_size) {
}

std::string GeneratedImage::download_url() const {
    return full_size_ ? url_ + FULL_SIZE_SUFFIX : url_;
}

std::string GeneratedImage::default_filename() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t_now), "%Y%m%d%H%M%S");
    std::string tail = url_.size() > 10 ? url_.substr(url_.size() - 10) : url_;
    std::replace(tail.begin(), tail.end(), '/', '_');
    ss << "_" << tail << ".png";
    return ss.str();
}

} // namespace geminiweb
