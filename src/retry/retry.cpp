#include "retry/retry.hpp"
#include <algorithm>
#include <random>
#include <thread>
#include <boost/log/trivial.hpp>

namespace dcs::retry {

//==============================================
// CANCELLATION
//==============================================

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_; });
}

//==============================================
// RETRY LOOP
//==============================================

WithRetry::WithRetry(int max_attempts, std::chrono::milliseconds base_delay)
    : max_attempts_(max_attempts < 0 ? 0 : max_attempts),
      base_delay_(std::clamp(base_delay, std::chrono::milliseconds::zero(), MAX_BACKOFF)) {}

std::chrono::milliseconds WithRetry::backoff(int attempt) const {
    using rep = std::chrono::milliseconds::rep;
    thread_local std::mt19937_64 rng{std::random_device{}()};

    const rep base = base_delay_.count();
    const rep cap = MAX_BACKOFF.count();
    const int exponent = std::clamp(attempt, 0, MAX_BACKOFF_EXPONENT);

    // base <= cap and exponent <= 30, so neither the check nor the shift overflows
    rep delay = cap;
    if (base <= (cap >> exponent)) {
        delay = base << exponent;
    }

    std::uniform_int_distribution<rep> jitter(0, base);
    delay += jitter(rng);
    return std::chrono::milliseconds(std::min(delay, cap));
}

std::exception_ptr WithRetry::run(const Operation& op) const {
    return run_impl(op, nullptr);
}

std::exception_ptr WithRetry::run(const Operation& op, const CancellationToken& cancel) const {
    return run_impl(op, &cancel);
}

std::exception_ptr WithRetry::run_impl(const Operation& op, const CancellationToken* cancel) const {
    std::exception_ptr last_error;

    for (int attempt = 0; attempt <= max_attempts_; ++attempt) {
        if (cancel && cancel->cancelled()) {
            BOOST_LOG_TRIVIAL(warning) << "Retry: Cancelled before attempt " << attempt + 1;
            return std::make_exception_ptr(RetryAborted("context cancelled", last_error));
        }

        Attempt result = op();
        if (!result.error) {
            if (attempt > 0) {
                BOOST_LOG_TRIVIAL(debug) << "Retry: Succeeded on attempt " << attempt + 1;
            }
            return nullptr;
        }
        last_error = result.error;

        if (!result.needs_retry || attempt >= max_attempts_) {
            BOOST_LOG_TRIVIAL(debug) << "Retry: Giving up after attempt " << attempt + 1 << ": "
                                     << describe(last_error);
            return last_error;
        }

        std::chrono::milliseconds delay = backoff(attempt);
        BOOST_LOG_TRIVIAL(warning) << "Retry: Attempt " << attempt + 1 << " failed (" << describe(last_error)
                                   << "), retrying in " << delay.count() << " ms";

        if (cancel) {
            if (cancel->wait_for(delay)) {
                BOOST_LOG_TRIVIAL(warning) << "Retry: Cancelled during backoff";
                return std::make_exception_ptr(RetryAborted(describe(last_error), last_error));
            }
        } else {
            std::this_thread::sleep_for(delay);
        }
    }

    return last_error;
}

std::string describe(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    }
    return {};
}

} // namespace dcs::retry
