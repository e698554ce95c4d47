#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

/**
 * Fixed-size worker pool. Used by the batch runner to issue independent
 * ledger operations concurrently; each submitted job gets its own future.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t threadCount)
        : stop_(false)
    {
        if (threadCount == 0) threadCount = 1;
        for (size_t i = 0; i < threadCount; i++) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condition_.notify_all();
        for (std::thread& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t size() const { return workers_.size(); }

    // Exceptions thrown by f surface from future::get().
    template <class F>
    auto submit(F&& f) -> std::future<decltype(f())>
    {
        using ResultType = decltype(f());

        auto job = std::make_shared<std::packaged_task<ResultType()>>(std::forward<F>(f));
        std::future<ResultType> result = job->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("submit on stopped ThreadPool");
            }
            jobs_.push([job]() { (*job)(); });
        }
        condition_.notify_one();
        return result;
    }

private:
    void workerLoop() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                condition_.wait(lock, [this] { return stop_ || !jobs_.empty(); });
                if (stop_ && jobs_.empty()) {
                    return;
                }
                job = std::move(jobs_.front());
                jobs_.pop();
            }
            job();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    std::mutex queueMutex_;
    std::condition_variable condition_;
    bool stop_;
};

#endif // THREAD_POOL_HPP
