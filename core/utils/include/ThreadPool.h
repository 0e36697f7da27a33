#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace HuffStream {

    /**
     * @brief Fixed-size worker thread pool with admission control.
     *
     * Owned by the ConnectionManager, which runs one connection handler per
     * task. Capacity is the number of workers plus the allowed backlog;
     * trySubmit() refuses work beyond it instead of queueing without bound.
     */
    class ThreadPool {
    public:
        /**
         * @param threadCount Number of workers (0 = hardware concurrency)
         * @param maxPending Tasks allowed to wait for a free worker
         */
        explicit ThreadPool(std::size_t threadCount, std::size_t maxPending = 0);
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Enqueue a task, ignoring the capacity limit.
         * @return Future for the task; it reports broken_promise if the pool
         *         was already shut down.
         */
        template<typename F>
        std::future<void> enqueue(F&& func) {
            auto task = std::make_shared<std::packaged_task<void()>>(std::forward<F>(func));
            auto result = task->get_future();
            post([task]() { (*task)(); }, false);
            return result;
        }

        /**
         * @brief Submit a task if the pool has capacity for it.
         * @return false if the pool is saturated or stopping
         */
        bool trySubmit(std::function<void()> task);

        /// Tasks queued or running
        std::size_t inFlight() const;

        std::size_t capacity() const { return threadCount_ + maxPending_; }
        std::size_t threadCount() const { return threadCount_; }

        /**
         * @brief Stop accepting work, drain the queue and join all workers.
         */
        void shutdown();

    private:
        void workerLoop();
        bool post(std::function<void()> task, bool enforceCapacity);
        std::function<void()> takeTask();

        std::size_t threadCount_{0};
        std::size_t maxPending_{0};
        std::size_t inFlight_{0};   ///< queued + running
        std::vector<std::thread> workers_;
        std::deque<std::function<void()>> queue_;
        mutable std::mutex mutex_;
        std::condition_variable wake_;
        bool stopping_{false};
    };

} // namespace HuffStream
