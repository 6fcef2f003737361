//
// Bounded worker pool over an index range
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace interlock::detail {
    /// Worker count for a requested value (0 = hardware concurrency), never more than count
    inline unsigned resolve_thread_count(unsigned requested, std::size_t count) {
        unsigned n = requested;
        if (n == 0) {
            n = std::max(1u, std::thread::hardware_concurrency());
        }
        if (count < n) {
            n = static_cast<unsigned>(std::max<std::size_t>(count, 1));
        }
        return n;
    }

    /**
     * Run fn(i) for i in [0, count) on a pool of threads pulling indices
     * from a shared counter. cancel is checked before every index. The
     * first exception thrown by fn stops the remaining work and is
     * rethrown after all workers joined.
     *
     * @return Number of indices fn completed
     */
    template<typename Fn>
    std::size_t parallel_for(std::size_t count, unsigned threads, const std::atomic<bool>* cancel, Fn&& fn) {
        std::atomic<std::size_t> next{0};
        std::atomic<std::size_t> completed{0};
        std::atomic<bool> failed{false};
        std::exception_ptr error;
        std::mutex error_mutex;

        auto worker = [&]() {
            while (!failed.load(std::memory_order_relaxed)) {
                if (cancel && cancel->load(std::memory_order_relaxed)) {
                    return;
                }
                const std::size_t i = next.fetch_add(1);
                if (i >= count) {
                    return;
                }
                try {
                    fn(i);
                    ++completed;
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!error) {
                        error = std::current_exception();
                    }
                    failed = true;
                }
            }
        };

        const unsigned n = resolve_thread_count(threads, count);
        if (n <= 1) {
            worker();
        } else {
            std::vector<std::thread> workers;
            workers.reserve(n);
            for (unsigned t = 0; t < n; ++t) {
                workers.emplace_back(worker);
            }
            for (auto& t : workers) {
                t.join();
            }
        }

        if (error) {
            std::rethrow_exception(error);
        }
        return completed.load();
    }
} // namespace interlock::detail
