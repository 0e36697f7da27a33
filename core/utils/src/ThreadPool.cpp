#include "ThreadPool.h"
#include "Logger.h"

#include <algorithm>
#include <exception>

namespace HuffStream {

    ThreadPool::ThreadPool(std::size_t threadCount, std::size_t maxPending)
        : threadCount_(threadCount != 0 ? threadCount : std::max(1u, std::thread::hardware_concurrency()))
        , maxPending_(maxPending) {
        workers_.reserve(threadCount_);
        for (std::size_t i = 0; i < threadCount_; ++i) {
            workers_.emplace_back([this]() { workerLoop(); });
        }
    }

    ThreadPool::~ThreadPool() {
        shutdown();
    }

    void ThreadPool::shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return;
            }
            stopping_ = true;
        }
        wake_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    bool ThreadPool::trySubmit(std::function<void()> task) {
        return post(std::move(task), true);
    }

    std::size_t ThreadPool::inFlight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inFlight_;
    }

    bool ThreadPool::post(std::function<void()> task, bool enforceCapacity) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stopping_ || (enforceCapacity && inFlight_ >= capacity())) {
            return false;
        }
        queue_.push_back(std::move(task));
        ++inFlight_;
        lock.unlock();

        wake_.notify_one();
        return true;
    }

    // Blocks until work arrives; an empty function means the pool is done
    std::function<void()> ThreadPool::takeTask() {
        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            return {};
        }

        auto task = std::move(queue_.front());
        queue_.pop_front();
        return task;
    }

    void ThreadPool::workerLoop() {
        while (auto task = takeTask()) {
            try {
                task();
            } catch (const std::exception& e) {
                Logger::instance().error(std::string("Worker task failed: ") + e.what(), "ThreadPool");
            }

            std::lock_guard<std::mutex> lock(mutex_);
            --inFlight_;
        }
    }

} // namespace HuffStream
