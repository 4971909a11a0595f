#ifndef DCS_RETRY_HPP
#define DCS_RETRY_HPP

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>

namespace dcs::retry {

class RetryAborted : public std::runtime_error {
public:
    explicit RetryAborted(const std::string& message, std::exception_ptr cause = nullptr)
        : std::runtime_error("Retry aborted: " + message), cause_(std::move(cause)) {}

    // Last failure observed before the abort, if any
    std::exception_ptr cause() const { return cause_; }

private:
    std::exception_ptr cause_;
};

// Shared cancellation flag. Waiters wake as soon as cancel() is called.
class CancellationToken {
public:
    void cancel();
    bool cancelled() const;

    // Sleeps up to duration; returns true if cancelled before or during the wait
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

// Result of one attempt. A null error means success.
struct Attempt {
    bool needs_retry = false;
    std::exception_ptr error;

    static Attempt success() { return Attempt{}; }
    static Attempt retryable(std::exception_ptr error) { return Attempt{true, std::move(error)}; }
    static Attempt fatal(std::exception_ptr error) { return Attempt{false, std::move(error)}; }
};

using Operation = std::function<Attempt()>;

// Exponential backoff with jitter: before retry n (0-based) sleeps
// base_delay * 2^n + uniform(0, base_delay), saturated at MAX_BACKOFF.
class WithRetry {
public:
    static constexpr int MAX_BACKOFF_EXPONENT = 30;
    static constexpr std::chrono::milliseconds MAX_BACKOFF{std::chrono::minutes(10)};

    WithRetry(int max_attempts, std::chrono::milliseconds base_delay);

    // Runs op at most max_attempts + 1 times. Returns null on success,
    // otherwise the error of the last attempt.
    std::exception_ptr run(const Operation& op) const;

    // As run(), but checks cancel before each attempt and during every
    // backoff sleep. Cancellation yields a RetryAborted carrying the last
    // error; an attempt already in flight is not interrupted.
    std::exception_ptr run(const Operation& op, const CancellationToken& cancel) const;

    int max_attempts() const { return max_attempts_; }
    std::chrono::milliseconds base_delay() const { return base_delay_; }

    // Delay before retry number attempt, jitter included, never above MAX_BACKOFF
    std::chrono::milliseconds backoff(int attempt) const;

private:
    int max_attempts_;
    std::chrono::milliseconds base_delay_;

    std::exception_ptr run_impl(const Operation& op, const CancellationToken* cancel) const;
};

// Human-readable message of an exception_ptr, for logs
std::string describe(const std::exception_ptr& error);

} // namespace dcs::retry

#endif // DCS_RETRY_HPP
