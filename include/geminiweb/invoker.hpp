/**
 * @file invoker.hpp
 * @brief Readiness checks and bounded retry around client calls
 */

#ifndef GEMINIWEB_INVOKER_HPP
#define GEMINIWEB_INVOKER_HPP

#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace geminiweb {

/**
 * A call the invoker may repeat
 */
template <typename R>
struct CallDescriptor {
    std::string name;
    std::function<R()> call;
    // Attempts allowed after the first one
    int retry = 2;
    // Errors that leave at most one more attempt
    std::function<bool(const GeminiWebError&)> single_retry = [](const GeminiWebError& e) {
        return dynamic_cast<const ImageGenerationError*>(&e) != nullptr;
    };
};

/**
 * Runs call descriptors.
 *
 * Before every attempt `ensure_ready` is invoked; anything it throws reaches
 * the caller untouched. Library errors are retried while budget remains,
 * errors matching the descriptor's `single_retry` at most once more. Other
 * exceptions are not retried.
 */
class RetryingInvoker {
public:
    using ReadyCheck = std::function<void()>;

    RetryingInvoker(ReadyCheck ensure_ready, std::chrono::milliseconds retry_delay)
        : ensure_ready_(std::move(ensure_ready)), retry_delay_(retry_delay) {}

    template <typename R>
    R invoke(const CallDescriptor<R>& descriptor) const {
        int remaining = std::max(descriptor.retry, 0);

        while (true) {
            if (ensure_ready_) {
                ensure_ready_();
            }

            try {
                return descriptor.call();
            } catch (const GeminiWebError& e) {
                if (descriptor.single_retry && descriptor.single_retry(e)) {
                    remaining = std::min(remaining, 1);
                }
                if (remaining == 0) {
                    throw;
                }
                log_retry(descriptor.name, e.what(), remaining);
            }

            remaining--;
            if (retry_delay_.count() > 0) {
                std::this_thread::sleep_for(retry_delay_);
            }
        }
    }

    std::chrono::milliseconds retry_delay() const { return retry_delay_; }

private:
    static void log_retry(const std::string& name, const std::string& reason, int remaining) {
        log::warning(
            name + " failed: " + reason + ". Retrying (" +
            std::to_string(remaining) + " attempt(s) left)"
        );
    }

    ReadyCheck ensure_ready_;
    std::chrono::milliseconds retry_delay_;
};

} // namespace geminiweb

#endif // GEMINIWEB_INVOKER_HPP
