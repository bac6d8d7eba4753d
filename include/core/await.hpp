#pragma once

#include "core/error.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <stop_token>

namespace credchain {

/**
 * @brief Wait for a Result future while honouring a stop token
 *
 * Deferred futures are run inline (they cannot be polled). For asynchronous
 * futures the stop token is checked every `poll_interval`; once stop is
 * requested the future is abandoned and CANCELLED is returned, so no partial
 * value ever escapes.
 */
template<typename T>
[[nodiscard]] Result<T> await_result(std::future<Result<T>>& future,
                                     const std::stop_token& stop,
                                     std::chrono::milliseconds poll_interval) {
    if (stop.stop_requested()) {
        return Result<T>::error(ErrorCategory::CANCELLED, "operation cancelled");
    }
    if (!future.valid()) {
        return Result<T>::error(ErrorCategory::UNHANDLED, "no result available (invalid future)");
    }

    for (;;) {
        const auto status = future.wait_for(poll_interval);
        if (status == std::future_status::deferred || status == std::future_status::ready) {
            break;
        }
        if (stop.stop_requested()) {
            return Result<T>::error(ErrorCategory::CANCELLED, "operation cancelled");
        }
    }

    try {
        auto result = future.get();
        if (stop.stop_requested()) {
            return Result<T>::error(ErrorCategory::CANCELLED, "operation cancelled");
        }
        return result;
    } catch (const std::exception& e) {
        return Result<T>::error(ErrorCategory::UNHANDLED, e.what());
    }
}

} // namespace credchain
