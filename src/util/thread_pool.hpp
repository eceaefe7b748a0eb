#ifndef PORTAL_UTIL_THREAD_POOL_HPP
#define PORTAL_UTIL_THREAD_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool. The sender engine runs file jobs here so that
 *        blocking file I/O and hashing stay off the response-reading thread.
 *
 * Usage Example:
 *  @code
 *    portal::util::ThreadPool pool(4);
 *    auto result = pool.enqueue([](int x) { return x*x; }, 10);
 *    std::cout << result.get() << std::endl;
 *  @endcode
 */

namespace portal {
namespace util {

/**
 * @class ThreadPool
 * @brief A basic fixed-size thread pool implementation.
 *
 * - Constructor spawns a given number of worker threads.
 * - enqueue(...) schedules tasks for asynchronous execution.
 * - Destructor drains the queue and joins every worker.
 */
class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads to create. If zero, uses hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);

        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(queueMutex_);
                        condVar_.wait(lock, [this] {
                            return !taskQueue_.empty() || stop_;
                        });

                        if (stop_ && taskQueue_.empty()) {
                            return;
                        }
                        task = std::move(taskQueue_.front());
                        taskQueue_.pop();
                    }
                    task();
                }
            });
        }
    }

    ~ThreadPool()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condVar_.notify_all();

        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueue a task into the thread pool for asynchronous execution.
     * @return A std::future<ReturnType> that can be used to retrieve the result.
     * @throw std::runtime_error when the pool is shutting down.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto taskPtr = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = taskPtr->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            taskQueue_.emplace([taskPtr]() { (*taskPtr)(); });
        }
        condVar_.notify_one();
        return res;
    }

    size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;               ///< The pool of worker threads
    std::queue<std::function<void()>> taskQueue_;    ///< Task queue
    std::mutex queueMutex_;                          ///< Protects the queue
    std::condition_variable condVar_;                ///< Signals task readiness
    bool stop_;                                      ///< Set once the pool stops accepting tasks
};

} // namespace util
} // namespace portal

#endif // PORTAL_UTIL_THREAD_POOL_HPP
