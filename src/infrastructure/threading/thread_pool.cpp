// EN: Implementation of the ThreadPool class. Fixed-size FIFO worker pool used for batch normalization.
// FR: Implémentation de la classe ThreadPool. Pool FIFO de taille fixe utilisé pour la normalisation par lots.

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"
#include <algorithm>

namespace TXR {

ThreadPool::ThreadPool(const ThreadPoolConfig& config) : config_(config) {
    worker_count_ = config_.worker_threads;
    if (worker_count_ == 0) {
        worker_count_ = std::max(1u, std::thread::hardware_concurrency());
    }

    workers_.reserve(worker_count_);
    for (size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }

    LOG_DEBUG(config_.name, "Thread pool started with " + std::to_string(worker_count_) + " threads");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::waitForAll() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] {
        return task_queue_.empty() && active_threads_.load() == 0;
    });
}

void ThreadPool::shutdown() {
    {
        // EN: Set under the queue lock so a worker between predicate and wait cannot miss it.
        // FR: Positionné sous le verrou de la queue pour qu'aucun worker entre prédicat et attente ne le manque.
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true)) {
            return; // EN: Already shutting down. FR: Déjà en cours d'arrêt.
        }
    }

    // EN: Workers drain the remaining queue before exiting.
    // FR: Les workers vident la queue restante avant de sortir.
    queue_condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    LOG_DEBUG(config_.name, "Thread pool shutdown completed - Processed " +
              std::to_string(completed_tasks_.load()) + " tasks");
}

ThreadPoolStats ThreadPool::getStats() const {
    ThreadPoolStats stats;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stats.queued_tasks = task_queue_.size();
    }
    stats.total_threads = workers_.size();
    stats.active_threads = active_threads_.load();
    stats.completed_tasks = completed_tasks_.load();
    stats.failed_tasks = failed_tasks_.load();
    stats.peak_queue_size = peak_queue_size_.load();

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats.average_task_duration_ms = timed_tasks_ > 0 ? total_duration_ms_ / timed_tasks_ : 0.0;
    return stats;
}

// EN: Worker thread function.
// FR: Fonction du thread worker.
void ThreadPool::workerLoop() {
    while (true) {
        detail::Task task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this] {
                return !task_queue_.empty() || shutdown_requested_.load();
            });

            if (task_queue_.empty()) {
                break; // EN: Shutdown with nothing left. FR: Arrêt sans tâche restante.
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            active_threads_++;
        }

        auto start = std::chrono::steady_clock::now();
        bool success = true;

        // EN: packaged_task stores exceptions in the future; this only guards the wrapper itself.
        // FR: packaged_task stocke les exceptions dans le future ; ceci protège seulement le wrapper.
        try {
            task.function();
        } catch (const std::exception& e) {
            success = false;
            LOG_ERROR(config_.name, "Task " + task.name + " failed: " + std::string(e.what()));
        }

        recordTask(success, std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start));

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_threads_--;
        }
        idle_condition_.notify_all();
    }
}

void ThreadPool::recordTask(bool success, std::chrono::milliseconds duration) {
    if (success) {
        completed_tasks_++;
    } else {
        failed_tasks_++;
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    total_duration_ms_ += static_cast<double>(duration.count());
    timed_tasks_++;
}

} // namespace TXR
