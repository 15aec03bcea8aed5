// include/campaign_analytics/core/parallel.hpp
#pragma once

#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace campaign_analytics {
namespace core {

/**
 * @brief Run each task on its own thread and wait for all of them
 *
 * Every task is waited on even when another one fails. The first exception
 * (in task order) is rethrown once all tasks have finished. If a thread cannot
 * be started, the tasks already launched are still waited on before the
 * std::system_error propagates.
 */
inline void run_in_parallel(const std::vector<std::function<void()>>& tasks) {
    std::vector<std::future<void>> futures;
    futures.reserve(tasks.size());
    for (const auto& task : tasks) {
        futures.push_back(std::async(std::launch::async, task));
    }

    std::exception_ptr first_error;
    for (auto& future : futures) {
        try {
            future.get();
        } catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

}  // namespace core
}  // namespace campaign_analytics
