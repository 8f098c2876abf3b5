/**
 * @file parallel.hpp
 * @brief Bounded fan-out over a list of work items.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace cozyd {
namespace utils {

/**
 * @brief Run `fn(item)` for every item using at most `maxWorkers` threads.
 *
 * Blocks until every item has been processed. Items are handed out in
 * order; completion order is unspecified. `fn` must not throw.
 *
 * `spawn` turns a worker body into a running std::thread. If it throws
 * std::system_error (thread limit reached) the workers already started
 * finish the remaining items; with none started the caller runs them.
 *
 * @code
 * parallelForEach(hosts, 64, [&](const std::string& ip) { probe(ip); });
 * @endcode
 */
template<typename Container, typename Fn, typename Spawn>
void parallelForEach(const Container& items, size_t maxWorkers, Fn fn, Spawn spawn) {
    const size_t count = items.size();
    if (count == 0) {
        return;
    }

    std::vector<typename Container::const_iterator> work;
    work.reserve(count);
    for (auto it = items.begin(); it != items.end(); ++it) {
        work.push_back(it);
    }

    std::atomic<size_t> next{0};
    auto drain = [&]() {
        for (size_t idx = next.fetch_add(1); idx < count; idx = next.fetch_add(1)) {
            fn(*work[idx]);
        }
    };

    const size_t workers = std::max<size_t>(1, std::min(maxWorkers, count));
    if (workers == 1) {
        drain();
        return;
    }

    std::vector<std::thread> threads;
    threads.reserve(workers);
    try {
        for (size_t i = 0; i < workers; ++i) {
            threads.push_back(spawn(std::function<void()>(drain)));
        }
    } catch (const std::system_error&) {
        if (threads.empty()) {
            drain();
        }
    }

    for (auto& t : threads) {
        t.join();
    }
}

template<typename Container, typename Fn>
void parallelForEach(const Container& items, size_t maxWorkers, Fn fn) {
    parallelForEach(items, maxWorkers, fn,
                    [](std::function<void()> body) { return std::thread(std::move(body)); });
}

}  // namespace utils
}  // namespace cozyd
