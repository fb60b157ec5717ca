// src/core/thread_pool.cpp
#include "thread_pool.h"
#include "../utils/logger.h"
#include <string>

namespace FairSlot {

ThreadPool::ThreadPool(int thread_count, const std::string& name)
    : name_(name), shutdown_(false), active_threads_(0), pending_tasks_(0)
    , total_tasks_(0), failed_tasks_(0), next_queue_(0) {
    
    if (thread_count <= 0) {
        thread_count = static_cast<int>(std::thread::hardware_concurrency());
        if (thread_count == 0) thread_count = 4;
    }
    
    thread_count_ = thread_count;
    queues_ = std::vector<WorkQueue<Task>>(thread_count_);
    workers_.reserve(thread_count_);
    
    for (int i = 0; i < thread_count_; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerThread, this, i);
    }
    
    LOG_INFO(name_ + " created with " + std::to_string(thread_count_) + " threads", "ThreadPool");
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

bool ThreadPool::Submit(Task task) {
    if (shutdown_) return false;
    
    pending_tasks_++;
    unsigned target = next_queue_++ % static_cast<unsigned>(thread_count_);
    queues_[target].PushBack(std::move(task));
    work_available_.notify_one();
    return true;
}

void ThreadPool::WorkerThread(int thread_id) {
    LOG_DEBUG(name_ + " worker " + std::to_string(thread_id) + " started", "ThreadPool");
    
    while (true) {
        Task task;
        if (TakeTask(thread_id, task)) {
            RunTask(thread_id, task);
            continue;
        }
        
        // 关闭时先把队列里剩余的任务执行完
        if (shutdown_ && AllQueuesEmpty()) {
            break;
        }
        
        std::unique_lock<std::mutex> lock(global_mutex_);
        work_available_.wait_for(lock, std::chrono::milliseconds(5), 
            [this] { return shutdown_ || !AllQueuesEmpty(); });
    }
    
    LOG_DEBUG(name_ + " worker " + std::to_string(thread_id) + " stopped", "ThreadPool");
}

bool ThreadPool::TakeTask(int thread_id, Task& task) {
    // 1. 本线程队列
    if (queues_[thread_id].PopFront(task)) {
        return true;
    }
    
    // 2. 从其他线程队列尾部窃取
    for (int attempts = 0; attempts < thread_count_ - 1; ++attempts) {
        int target = (thread_id + 1 + attempts) % thread_count_;
        if (queues_[target].PopBack(task)) {
            return true;
        }
    }
    return false;
}

void ThreadPool::RunTask(int thread_id, Task& task) {
    active_threads_++;
    try {
        task();
        total_tasks_++;
    } catch (const std::exception& e) {
        failed_tasks_++;
        LOG_ERROR("Task execution failed in " + name_ + " thread " + std::to_string(thread_id) + 
                 ": " + e.what(), "ThreadPool");
    }
    active_threads_--;
    
    if (--pending_tasks_ == 0) {
        std::lock_guard<std::mutex> lock(global_mutex_);
        all_done_.notify_all();
    }
}

bool ThreadPool::AllQueuesEmpty() const {
    for (const auto& queue : queues_) {
        if (!queue.Empty()) return false;
    }
    return true;
}

void ThreadPool::WaitForCompletion() {
    std::unique_lock<std::mutex> lock(global_mutex_);
    all_done_.wait(lock, [this] { return pending_tasks_.load() == 0; });
}

void ThreadPool::Shutdown() {
    if (shutdown_.exchange(true)) return;
    
    work_available_.notify_all();
    
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    
    LOG_INFO(name_ + " shutdown. Total tasks: " + std::to_string(total_tasks_.load()) +
             ", failed: " + std::to_string(failed_tasks_.load()), "ThreadPool");
}

ThreadPool::Stats ThreadPool::GetStats() const {
    Stats stats;
    stats.thread_count = thread_count_;
    stats.active_threads = active_threads_;
    stats.total_tasks = total_tasks_;
    stats.failed_tasks = failed_tasks_;
    
    for (const auto& queue : queues_) {
        stats.queue_sizes.push_back(queue.Size());
    }
    
    return stats;
}

} // namespace FairSlot
