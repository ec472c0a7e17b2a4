/**
 * Canopy Threading Utilities
 *
 * Thread pool and parallel execution helpers.
 */

#include "canopy/threading.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace canopy {
namespace threading {

namespace {

void rethrow_first(const std::vector<std::exception_ptr>& errors) {
    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
}

// Runs one unit, parking its exception in the unit's slot
void run_unit(const std::function<void(size_t)>& body, size_t i,
              std::exception_ptr& error) {
    try {
        body(i);
    } catch (...) {
        error = std::current_exception();
    }
}

void run_serial(size_t begin, size_t end, const std::function<void(size_t)>& body) {
    std::vector<std::exception_ptr> errors(end - begin);
    for (size_t i = begin; i < end; ++i) {
        run_unit(body, i, errors[i - begin]);
    }
    rethrow_first(errors);
}

#ifndef _OPENMP

// Set on pool workers so nested parallel_for calls run inline
thread_local bool in_worker = false;

// ============================================================================
// Thread Pool (for non-OpenMP builds)
// ============================================================================

class ThreadPool {
public:
    explicit ThreadPool(size_t n_threads = 0) {
        if (n_threads == 0) {
            n_threads = std::max<size_t>(1, std::thread::hardware_concurrency());
        }

        for (size_t i = 0; i < n_threads; ++i) {
            workers_.emplace_back([this] {
                in_worker = true;
                while (true) {
                    std::function<void()> task;

                    {
                        std::unique_lock<std::mutex> lock(mutex_);
                        condition_.wait(lock, [this] {
                            return stop_ || !tasks_.empty();
                        });

                        if (stop_ && tasks_.empty()) {
                            return;
                        }

                        task = std::move(tasks_.front());
                        tasks_.pop();
                    }

                    task();
                }
            });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stop_ = true;
        }
        condition_.notify_all();

        for (auto& worker : workers_) {
            worker.join();
        }
    }

    std::future<void> submit(std::function<void()> fn) {
        auto task = std::make_shared<std::packaged_task<void()>>(std::move(fn));
        std::future<void> result = task->get_future();

        {
            std::unique_lock<std::mutex> lock(mutex_);
            tasks_.emplace([task]() { (*task)(); });
        }

        condition_.notify_one();
        return result;
    }

    size_t n_threads() const {
        return workers_.size();
    }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

// Global thread pool; callers hold a reference for the length of a call so a
// concurrent set_num_threads cannot destroy the pool under running tasks
std::shared_ptr<ThreadPool> global_pool;
std::mutex pool_mutex;

std::shared_ptr<ThreadPool> get_global_pool() {
    std::lock_guard<std::mutex> lock(pool_mutex);
    if (!global_pool) {
        global_pool = std::make_shared<ThreadPool>();
    }
    return global_pool;
}

#endif

} // namespace

// ============================================================================
// Parallel For
// ============================================================================

void parallel_for(size_t begin, size_t end,
                  const std::function<void(size_t)>& body,
                  int n_threads) {
    if (end <= begin) return;
    if (end - begin == 1 || n_threads == 1) {
        run_serial(begin, end, body);
        return;
    }

    std::vector<std::exception_ptr> errors(end - begin);

    #ifdef _OPENMP
    const int threads = n_threads > 0 ? n_threads : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (size_t i = begin; i < end; ++i) {
        run_unit(body, i, errors[i - begin]);
    }
    #else
    if (in_worker) {
        run_serial(begin, end, body);
        return;
    }

    std::shared_ptr<ThreadPool> pool = get_global_pool();
    size_t n_workers = std::min(pool->n_threads(), end - begin);
    if (n_threads > 0) {
        n_workers = std::min(n_workers, static_cast<size_t>(n_threads));
    }

    // Each worker claims the next unclaimed index until the range is exhausted
    std::atomic<size_t> next{begin};
    std::vector<std::future<void>> futures;
    futures.reserve(n_workers);

    for (size_t w = 0; w < n_workers; ++w) {
        futures.push_back(pool->submit([&body, &next, &errors, begin, end]() {
            for (size_t i = next++; i < end; i = next++) {
                run_unit(body, i, errors[i - begin]);
            }
        }));
    }

    for (auto& f : futures) {
        f.wait();
    }
    #endif

    rethrow_first(errors);
}

// ============================================================================
// Thread Controls
// ============================================================================

int get_max_threads() {
    #ifdef _OPENMP
    return omp_get_max_threads();
    #else
    return static_cast<int>(get_global_pool()->n_threads());
    #endif
}

void set_num_threads(int n) {
    #ifdef _OPENMP
    omp_set_num_threads(n > 0 ? n : omp_get_num_procs());
    #else
    // In-flight calls keep the old pool alive until they join
    auto pool = std::make_shared<ThreadPool>(n > 0 ? static_cast<size_t>(n) : 0);
    std::lock_guard<std::mutex> lock(pool_mutex);
    global_pool.swap(pool);
    #endif
}

} // namespace threading
} // namespace canopy
