#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>
#include <exception>
#include "utils/Logger.hpp"

namespace utils {

/**
 * @brief 固定大小的线程池，任务队列有容量上限
 *
 * - 队列满时 submit() 阻塞，submitFor() 超时返回 false
 * - shutdown() 关闭队列：之后的提交全部失败，空闲线程在队列取空后退出
 * - 析构时关闭队列并 join 所有工作线程
 */
class ThreadPool {
public:
    /**
     * @brief 构造函数
     * @param numThreads 线程数量，默认为系统硬件并发数
     * @param maxQueuedTasks 队列容量上限，0 表示不限制
     */
    explicit ThreadPool(size_t numThreads = std::thread::hardware_concurrency(), size_t maxQueuedTasks = 0)
        : maxQueuedTasks_(maxQueuedTasks) {
        // 确保至少有一个线程
        numThreads = numThreads > 0 ? numThreads : 1;

        workers_.reserve(numThreads);
        for(size_t i = 0; i < numThreads; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    ~ThreadPool() {
        shutdown();
        join();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief 提交任务，队列满时阻塞等待
     * @return 线程池已关闭时返回 false
     */
    template<class F>
    bool submit(F&& task) {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            notFull_.wait(lock, [this] { return stop_ || hasRoom(); });
            if(stop_) {
                return false;
            }
            tasks_.emplace(std::forward<F>(task));
        }
        notEmpty_.notify_one();
        return true;
    }

    /**
     * @brief 提交任务，队列满时最多等待 timeout
     * @return 成功入队返回 true；超时或线程池已关闭返回 false
     */
    template<class F, class Rep, class Period>
    bool submitFor(F&& task, const std::chrono::duration<Rep, Period>& timeout) {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if(!notFull_.wait_for(lock, timeout, [this] { return stop_ || hasRoom(); })) {
                return false;
            }
            if(stop_) {
                return false;
            }
            tasks_.emplace(std::forward<F>(task));
        }
        notEmpty_.notify_one();
        return true;
    }

    /**
     * @brief 关闭任务队列
     * @param discardPending true 时丢弃尚未开始执行的任务
     * @return 被丢弃的任务数量
     */
    size_t shutdown(bool discardPending = false) {
        size_t discarded = 0;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            stop_ = true;
            if(discardPending) {
                discarded = tasks_.size();
                std::queue<std::function<void()>> empty;
                tasks_.swap(empty);
            }
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
        return discarded;
    }

    /**
     * @brief 等待所有工作线程退出（需先调用 shutdown）
     */
    void join() {
        for(std::thread& worker : workers_) {
            if(worker.joinable()) {
                worker.join();
            }
        }
    }

    size_t size() const {
        return workers_.size();
    }

    size_t queueSize() const {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return tasks_.size();
    }

private:
    bool hasRoom() const {
        return maxQueuedTasks_ == 0 || tasks_.size() < maxQueuedTasks_;
    }

    void workerLoop() {
        while(true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                notEmpty_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

                if(stop_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop();
            }
            notFull_.notify_one();

            try {
                task();
            } catch(const std::exception& e) {
                LOG_ERROR("ThreadPool task threw: ", e.what());
            }
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    const size_t maxQueuedTasks_;

    mutable std::mutex queueMutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    bool stop_ = false;
};

} // namespace utils
