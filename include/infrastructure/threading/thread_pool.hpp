#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace TXR {

// EN: Thread pool statistics for monitoring.
// FR: Statistiques du pool de threads pour le monitoring.
struct ThreadPoolStats {
    size_t total_threads = 0;
    size_t active_threads = 0;
    size_t queued_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    size_t peak_queue_size = 0;
    double average_task_duration_ms = 0.0;
};

// EN: Configuration for thread pool behavior and limits.
// FR: Configuration pour le comportement et les limites du pool de threads.
struct ThreadPoolConfig {
    // EN: Number of worker threads (0 = hardware concurrency).
    // FR: Nombre de threads workers (0 = concurrence matérielle).
    size_t worker_threads = 0;

    // EN: Maximum number of queued tasks (0 = unbounded).
    // FR: Nombre maximum de tâches en queue (0 = illimité).
    size_t max_queue_size = 0;

    // EN: Name used in log entries.
    // FR: Nom utilisé dans les entrées de log.
    std::string name = "threadpool";
};

namespace detail {
    // EN: Internal task wrapper with a name for diagnostics.
    // FR: Wrapper interne de tâche avec un nom pour le diagnostic.
    struct Task {
        std::function<void()> function;
        std::string name;

        Task() = default;
        Task(std::function<void()> f, std::string n)
            : function(std::move(f)), name(std::move(n)) {}
    };
}

// EN: Fixed-size FIFO worker pool. Tasks report results through futures.
// FR: Pool de workers FIFO de taille fixe. Les tâches renvoient leurs résultats via des futures.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config = ThreadPoolConfig{});

    // EN: Destructor - waits for all tasks to complete and stops all threads.
    // FR: Destructeur - attend que toutes les tâches se terminent et arrête tous les threads.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // EN: Submit a task and return a future. Exceptions thrown by the task surface on get().
    // FR: Soumet une tâche et retourne un future. Les exceptions de la tâche remontent via get().
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    template<typename F, typename... Args>
    auto submitNamed(const std::string& name, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Wait for all currently queued tasks to complete.
    // FR: Attend que toutes les tâches actuellement en queue se terminent.
    void waitForAll();

    // EN: Shutdown the thread pool gracefully (drains the queue first).
    // FR: Arrête le pool de threads de manière gracieuse (vide la queue d'abord).
    void shutdown();

    size_t size() const { return worker_count_; }
    ThreadPoolStats getStats() const;
    const ThreadPoolConfig& getConfig() const { return config_; }

private:
    void workerLoop();
    void recordTask(bool success, std::chrono::milliseconds duration);

    ThreadPoolConfig config_;
    size_t worker_count_ = 0;

    std::vector<std::thread> workers_;

    std::queue<detail::Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> active_threads_{0};
    std::atomic<size_t> completed_tasks_{0};
    std::atomic<size_t> failed_tasks_{0};
    std::atomic<size_t> peak_queue_size_{0};

    mutable std::mutex stats_mutex_;
    double total_duration_ms_ = 0.0;
    size_t timed_tasks_ = 0;
};

// EN: Template method implementations.
// FR: Implémentations des méthodes templates.
template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submitNamed("", std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submitNamed(const std::string& name, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (shutdown_requested_) {
            throw std::runtime_error("ThreadPool is shutting down, cannot accept new tasks");
        }

        if (config_.max_queue_size > 0 && task_queue_.size() >= config_.max_queue_size) {
            throw std::runtime_error("Task queue is full, cannot accept new tasks");
        }

        task_queue_.emplace([task]() { (*task)(); }, name);

        size_t current_size = task_queue_.size();
        size_t current_peak = peak_queue_size_.load();
        while (current_size > current_peak &&
               !peak_queue_size_.compare_exchange_weak(current_peak, current_size)) {
        }
    }

    queue_condition_.notify_one();
    return result;
}

} // namespace TXR
