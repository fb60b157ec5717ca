// src/core/thread_pool.h
#pragma once

#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <deque>
#include <string>

namespace FairSlot {

// 工作队列（支持窃取）
template<typename T>
class WorkQueue {
public:
    WorkQueue() = default;
    
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;
    
    void PushBack(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        deque_.push_back(std::move(item));
    }
    
    bool PopFront(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (deque_.empty()) return false;
        
        item = std::move(deque_.front());
        deque_.pop_front();
        return true;
    }
    
    bool PopBack(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (deque_.empty()) return false;
        
        item = std::move(deque_.back());
        deque_.pop_back();
        return true;
    }
    
    bool Empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return deque_.empty();
    }
    
    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return deque_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> deque_;
};

// 每个工作线程一个队列，空闲线程从其他队列尾部窃取
// 本地队列按FIFO执行，保证同一线程上提交顺序不被打乱
class ThreadPool {
public:
    using Task = std::function<void()>;
    
    explicit ThreadPool(int thread_count = 0, const std::string& name = "ThreadPool");
    ~ThreadPool();
    
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    
    // 关闭后提交返回 false
    bool Submit(Task task);
    
    template<typename Iterator>
    bool SubmitBatch(Iterator begin, Iterator end) {
        if (shutdown_) return false;
        
        int thread_idx = 0;
        for (auto it = begin; it != end; ++it) {
            pending_tasks_++;
            queues_[thread_idx % thread_count_].PushBack(*it);
            thread_idx++;
        }
        work_available_.notify_all();
        return true;
    }
    
    // 等待所有已提交任务执行完毕（包括执行中提交的新任务）
    void WaitForCompletion();
    
    void Shutdown();
    
    struct Stats {
        int thread_count;
        std::vector<size_t> queue_sizes;
        int active_threads;
        long long total_tasks;
        long long failed_tasks;
    };
    
    Stats GetStats() const;
    int GetThreadCount() const { return thread_count_; }

private:
    std::string name_;
    int thread_count_;
    std::vector<std::thread> workers_;
    std::vector<WorkQueue<Task>> queues_;
    
    std::condition_variable work_available_;
    std::condition_variable all_done_;
    std::mutex global_mutex_;
    std::atomic<bool> shutdown_;
    std::atomic<int> active_threads_;
    std::atomic<long long> pending_tasks_;
    std::atomic<long long> total_tasks_;
    std::atomic<long long> failed_tasks_;
    std::atomic<unsigned> next_queue_;
    
    void WorkerThread(int thread_id);
    bool TakeTask(int thread_id, Task& task);
    void RunTask(int thread_id, Task& task);
    bool AllQueuesEmpty() const;
};

} // namespace FairSlot
