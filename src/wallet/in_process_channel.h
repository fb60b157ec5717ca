// src/wallet/in_process_channel.h
#pragma once

#include "message_channel.h"
#include "../core/thread_pool.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace FairSlot {

// 进程内通道，投递在工作线程池上执行
// handler 抛异常时重试，超过最大次数后丢弃并记录错误
// 多个工作线程并发投递，同一账户的事件可能乱序到达
class InProcessChannel : public MessageChannel {
public:
    InProcessChannel(int worker_threads, int max_delivery_attempts,
                     std::chrono::milliseconds retry_backoff = std::chrono::milliseconds(5));
    ~InProcessChannel() override;
    
    void Publish(const std::string& topic, const ReconciliationEvent& event) override;
    void Subscribe(const std::string& topic, Handler handler) override;
    
    // 阻塞直到所有已发布事件处理完毕
    void Drain();
    void Shutdown();
    
    struct Stats {
        long long published;
        long long delivered;
        long long redeliveries;
        long long dropped;      // 重试耗尽或无订阅者
    };
    
    Stats GetStats() const;

private:
    std::unique_ptr<ThreadPool> pool_;
    int max_delivery_attempts_;
    std::chrono::milliseconds retry_backoff_;
    
    mutable std::mutex subscribers_mutex_;
    std::unordered_map<std::string, std::vector<Handler>> subscribers_;
    
    std::atomic<bool> shutdown_;
    std::atomic<long long> published_;
    std::atomic<long long> delivered_;
    std::atomic<long long> redeliveries_;
    std::atomic<long long> dropped_;
    
    void Deliver(const std::string& topic, const Handler& handler, 
                 const ReconciliationEvent& event);
};

} // namespace FairSlot
