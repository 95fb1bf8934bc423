// =================================================================
// include/Modelgate/WorkerPool.hpp
// =================================================================
// Bounded thread pool used for adapter calls and fan-out dispatches.

#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace Modelgate {

/**
 * @brief Fixed-size pool of worker threads consuming a FIFO task queue
 *
 * Tasks queued before destruction still run; the destructor joins every
 * worker once the queue is drained.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads) : m_stop(false) {
        if (num_threads == 0) {
            num_threads = 1;
        }
        for (size_t i = 0; i < num_threads; ++i) {
            m_workers.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(m_queue_mutex);
                        m_condition.wait(lock, [this] { return m_stop || !m_tasks.empty(); });

                        if (m_stop && m_tasks.empty()) {
                            return;
                        }

                        task = std::move(m_tasks.front());
                        m_tasks.pop();
                    }

                    task();
                }
            });
        }
    }

    ~WorkerPool() {
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_stop = true;
        }

        m_condition.notify_all();

        for (std::thread& worker : m_workers) {
            worker.join();
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a callable
     * @return Future carrying the callable's result or exception
     * @throws std::runtime_error if the pool is shutting down
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using return_type = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = task->get_future();
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);

            if (m_stop) {
                throw std::runtime_error("enqueue on stopped WorkerPool");
            }

            m_tasks.emplace([task]() { (*task)(); });
        }

        m_condition.notify_one();
        return res;
    }

    size_t queueSize() const {
        std::unique_lock<std::mutex> lock(m_queue_mutex);
        return m_tasks.size();
    }

    size_t threadCount() const { return m_workers.size(); }

private:
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;

    mutable std::mutex m_queue_mutex;
    std::condition_variable m_condition;
    bool m_stop;
};

} // namespace Modelgate
