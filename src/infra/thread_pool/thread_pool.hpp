#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <stop_token>
#include <vector>
#include <stdexcept>

namespace fxfer::infra {

// Ограниченный пул: фиксированное число потоков, неограниченная очередь задач.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads = std::jthread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Запуск задачи без возврата
    template<typename F>
    auto enqueue(F&& f) -> void;

    // Блокирующее ожидание: очередь пуста и ни одна задача не выполняется
    void wait();

    [[nodiscard]] auto size() const noexcept -> std::size_t { return workers_.size(); }

private:
    using Task = std::function<void()>;

    void worker_loop_(std::stop_token st);

    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any task_cv_;
    std::condition_variable idle_cv_;
    std::size_t active_tasks_ = 0;
    bool stop_ = false;
    // Последним: потоки должны завершиться раньше, чем разрушатся очередь и мьютекс
    std::vector<std::jthread> workers_;
};

// =============== Реализация шаблонов ===============

template<typename F>
void ThreadPool::enqueue(F&& f) {
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.emplace(std::forward<F>(f));
    }
    task_cv_.notify_one();
}

inline ThreadPool::ThreadPool(std::size_t nthreads) {
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);
    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop_(st); });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    task_cv_.notify_all();
    // jthread сам вызовет request_stop и join; оставшиеся задачи дорабатываются
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            task_cv_.wait(lock, st, [this] { return stop_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                // stop_ или stop_token и нечего доделывать
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_tasks_;
        }

        task();

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
            if (tasks_.empty() && active_tasks_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_ == 0;
    });
}

} // namespace fxfer::infra
