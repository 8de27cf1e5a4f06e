/**
 * @file mock_transport.hpp
 * @brief Scripted transport and uploader for tests
 */

#ifndef GEMINIWEB_TESTS_MOCK_TRANSPORT_HPP
#define GEMINIWEB_TESTS_MOCK_TRANSPORT_HPP

#include <geminiweb/http.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace geminiweb {
namespace testing {

/**
 * Answers every request through `handler` and records what was sent
 */
class MockTransport : public HttpTransport {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    MockTransport() = default;
    explicit MockTransport(Handler handler) : handler_(std::move(handler)) {}

    void set_handler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    HttpResponse send(const HttpRequest& request) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            handler = handler_;
        }
        if (!handler) {
            return HttpResponse{404, "", {}};
        }
        return handler(request);
    }

    void close() override { closes_++; }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t count(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& request : requests_) {
            if (request.url == url) n++;
        }
        return n;
    }

    int closes() const { return closes_.load(); }

private:
    Handler handler_;
    std::vector<HttpRequest> requests_;
    std::atomic<int> closes_{0};
    mutable std::mutex mutex_;
};

class MockUploader : public FileUploader {
public:
    std::string upload(const std::string& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        uploaded_.push_back(path);
        return "/contrib_service/ttl_1d/upload-" + std::to_string(uploaded_.size());
    }

    std::vector<std::string> uploaded() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return uploaded_;
    }

private:
    std::vector<std::string> uploaded_;
    mutable std::mutex mutex_;
};

/**
 * Look up a form field of a recorded request
 */
inline std::string form_value(const HttpRequest& request, const std::string& key) {
    for (const auto& [name, value] : request.form) {
        if (name == key) return value;
    }
    return "";
}

} // namespace testing
} // namespace geminiweb

#endif // GEMINIWEB_TESTS_MOCK_TRANSPORT_HPP
