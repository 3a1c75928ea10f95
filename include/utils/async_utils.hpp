#pragma once

#include <chrono>
#include <future>
#include <stdexcept>
#include <utility>
#include "utils/worker_pool.hpp"

namespace arbscan {

/**
 * Raised by call_with_timeout when the call did not finish in time.
 */
class CallTimeout : public std::runtime_error {
public:
    CallTimeout() : std::runtime_error("call timed out") {}
};

/**
 * Raised when the worker pool refuses more work.
 */
class PoolSaturated : public std::runtime_error {
public:
    PoolSaturated() : std::runtime_error("worker pool saturated") {}
};

/**
 * Runs fn on `pool` and waits at most `timeout` for the result.
 *
 * On timeout the task is abandoned: it keeps its worker until fn returns and
 * its result is discarded. fn must therefore own (or share ownership of)
 * everything it touches. Exceptions thrown by fn are rethrown here.
 */
template <typename Fn, typename Rep, typename Period>
auto call_with_timeout(WorkerPool& pool, Fn fn, std::chrono::duration<Rep, Period> timeout)
    -> decltype(fn())
{
    auto future = pool.submit(std::move(fn));
    if (!future) {
        throw PoolSaturated();
    }
    if (future->wait_for(timeout) != std::future_status::ready) {
        throw CallTimeout();
    }
    return future->get();
}

} // namespace arbscan
