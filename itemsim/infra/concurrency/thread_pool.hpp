// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <condition_variable>  // std::condition_variable
#include <functional>          // std::function
#include <future>              // std::future, std::packaged_task
#include <memory>              // std::make_shared, std::unique_ptr
#include <mutex>               // std::mutex, std::scoped_lock, std::unique_lock
#include <queue>               // std::queue
#include <string>              // std::to_string
#include <thread>              // std::thread::hardware_concurrency
#include <type_traits>         // std::decay_t, std::invoke_result_t
#include <utility>             // std::forward, std::move

#include <boost/thread/thread.hpp>  // boost::thread

#include <itemsim/infra/common/log.hpp>

namespace itemsim {

//! \brief Fixed size pool of worker threads executing submitted tasks in FIFO order.
//! Exceptions thrown by a task are delivered through the future returned by submit()
class ThreadPool {
  public:
    //! \param thread_count : number of workers (0 means 1)
    //! \param stack_size : stack size of each worker (0 means OS default)
    explicit ThreadPool(unsigned thread_count = std::thread::hardware_concurrency(), size_t stack_size = 0)
        : thread_count_(thread_count ? thread_count : 1),
          threads_(std::make_unique<boost::thread[]>(thread_count_)) {
        boost::thread::attributes attrs;
        if (stack_size) {
            attrs.set_stack_size(stack_size);
        }
        for (unsigned i = 0; i < thread_count_; ++i) {
            threads_[i] = boost::thread(attrs, [this, i] {
                log::set_thread_name(("pool-" + std::to_string(i)).c_str());
                worker();
            });
        }
    }

    // Not copyable nor movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    //! \brief Waits for queued tasks to complete, then joins all workers
    ~ThreadPool() {
        {
            std::scoped_lock tasks_lock(tasks_mutex_);
            stopping_ = true;
        }
        task_available_cv_.notify_all();
        for (unsigned i = 0; i < thread_count_; ++i) {
            threads_[i].join();
        }
    }

    unsigned get_thread_count() const { return thread_count_; }

    template <typename F, typename R = std::invoke_result_t<std::decay_t<F>>>
    [[nodiscard]] std::future<R> submit(F&& task) {
        auto packaged = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
        std::future<R> result = packaged->get_future();
        {
            std::scoped_lock tasks_lock(tasks_mutex_);
            tasks_.emplace([packaged] { (*packaged)(); });
        }
        task_available_cv_.notify_one();
        return result;
    }

  private:
    void worker() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> tasks_lock(tasks_mutex_);
                task_available_cv_.wait(tasks_lock, [this] { return !tasks_.empty() || stopping_; });
                if (tasks_.empty()) {
                    return;  // stopping and drained
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    unsigned thread_count_;
    std::unique_ptr<boost::thread[]> threads_;
    std::mutex tasks_mutex_;
    std::condition_variable task_available_cv_;
    std::queue<std::function<void()>> tasks_;
    bool stopping_{false};
};

}  // namespace itemsim
