/**
 * @file parallel.hh
 * @brief Parallel map over indices with a single join.
 *
 * Workers pull indices from a shared atomic counter and write into
 * pre-sized result slots, so results need no lock. The first exception
 * thrown by any task stops further pickup and is rethrown on the calling
 * thread after every worker has joined. If the system refuses to start
 * another thread, the calling thread joins in as a worker instead, so a map
 * always completes with whatever threads it got.
 *
 * @code{.cpp}
 * cancellation_token cancel;
 * auto lengths = parallel_map(words.size(), 4, cancel,
 *     [&](std::size_t i) { return words[i].size(); });
 * @endcode
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

namespace inkfont {
    /**
     * @brief Cooperative cancellation flag shared between a job and its caller.
     */
    class cancellation_token {
    public:
        void cancel() noexcept { m_cancelled.store(true, std::memory_order_relaxed); }
        [[nodiscard]] bool cancelled() const noexcept { return m_cancelled.load(std::memory_order_relaxed); }

    private:
        std::atomic<bool> m_cancelled{false};
    };

    /// Worker count for a requested value (0 = hardware concurrency) and a task count.
    [[nodiscard]] inline unsigned effective_workers(unsigned requested, std::size_t tasks) noexcept {
        unsigned n = requested != 0 ? requested : std::thread::hardware_concurrency();
        n = std::max(1u, n);
        if (tasks < n) {
            n = static_cast<unsigned>(std::max<std::size_t>(1, tasks));
        }
        return n;
    }

    /// Starts one worker thread running @p work.
    struct thread_spawner {
        template<typename W>
        [[nodiscard]] std::thread operator()(W& work) const {
            return std::thread(std::ref(work));
        }
    };

    /**
     * @brief Run @p fn(i) for every i in [0, count) on @p workers threads.
     *
     * Indices not yet started when @p cancel fires are skipped and their slots
     * stay empty. @p spawn starts each worker thread and may throw
     * std::system_error like the std::thread constructor.
     *
     * @return One optional per index, engaged for the tasks that ran
     */
    template<typename F, typename Spawn = thread_spawner>
    [[nodiscard]] auto parallel_map(std::size_t count, unsigned workers, const cancellation_token& cancel, F&& fn,
                                    Spawn spawn = Spawn{})
        -> std::vector<std::optional<std::invoke_result_t<F&, std::size_t>>> {
        using result_t = std::invoke_result_t<F&, std::size_t>;
        std::vector<std::optional<result_t>> results(count);

        std::atomic<std::size_t> next{0};
        std::atomic<bool> failed{false};
        std::exception_ptr first_error;
        std::mutex error_mutex;

        auto work = [&]() {
            for (;;) {
                if (failed.load(std::memory_order_relaxed) || cancel.cancelled()) {
                    return;
                }
                const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
                if (i >= count) {
                    return;
                }
                try {
                    results[i].emplace(fn(i));
                } catch (...) {
                    std::lock_guard lock(error_mutex);
                    if (!first_error) {
                        first_error = std::current_exception();
                    }
                    failed.store(true, std::memory_order_relaxed);
                    return;
                }
            }
        };

        const unsigned n = effective_workers(workers, count);
        if (n <= 1) {
            work();
        } else {
            std::vector<std::thread> threads;
            threads.reserve(n);
            try {
                for (unsigned t = 0; t < n; ++t) {
                    threads.push_back(spawn(work));
                }
            } catch (const std::system_error&) {
                // Threads already started must be joined; this one helps out meanwhile.
                work();
            }
            for (auto& t : threads) {
                t.join();
            }
        }

        if (first_error) {
            std::rethrow_exception(first_error);
        }
        return results;
    }
} // namespace inkfont
