// src/wallet/in_process_channel.cpp
#include "in_process_channel.h"
#include "../utils/logger.h"
#include <stdexcept>
#include <thread>

namespace FairSlot {

InProcessChannel::InProcessChannel(int worker_threads, int max_delivery_attempts,
                                   std::chrono::milliseconds retry_backoff)
    : pool_(std::make_unique<ThreadPool>(worker_threads, "ChannelPool"))
    , max_delivery_attempts_(max_delivery_attempts < 1 ? 1 : max_delivery_attempts)
    , retry_backoff_(retry_backoff)
    , shutdown_(false), published_(0), delivered_(0), redeliveries_(0), dropped_(0) {
}

InProcessChannel::~InProcessChannel() {
    Shutdown();
}

void InProcessChannel::Publish(const std::string& topic, const ReconciliationEvent& event) {
    if (shutdown_) {
        throw std::runtime_error("Channel is shut down, cannot publish to " + topic);
    }
    
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        auto it = subscribers_.find(topic);
        if (it != subscribers_.end()) {
            handlers = it->second;
        }
    }
    
    published_++;
    
    if (handlers.empty()) {
        dropped_++;
        LOG_DEBUG("No subscribers on " + topic + ", event for " + event.account_id + 
                  " dropped", "InProcessChannel");
        return;
    }
    
    for (auto& handler : handlers) {
        bool accepted = pool_->Submit([this, topic, handler, event]() {
            Deliver(topic, handler, event);
        });
        if (!accepted) {
            throw std::runtime_error("Channel worker pool rejected event for " + event.account_id);
        }
    }
}

void InProcessChannel::Subscribe(const std::string& topic, Handler handler) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_[topic].push_back(std::move(handler));
    LOG_INFO("Subscribed handler to " + topic, "InProcessChannel");
}

void InProcessChannel::Deliver(const std::string& topic, const Handler& handler, 
                               const ReconciliationEvent& event) {
    for (int attempt = 1; attempt <= max_delivery_attempts_; ++attempt) {
        try {
            handler(event);
            delivered_++;
            return;
        } catch (const std::exception& e) {
            LOG_WARNING("Delivery attempt " + std::to_string(attempt) + "/" + 
                        std::to_string(max_delivery_attempts_) + " on " + topic + 
                        " failed for " + event.account_id + ": " + e.what(), "InProcessChannel");
        }
        
        if (attempt < max_delivery_attempts_) {
            redeliveries_++;
            std::this_thread::sleep_for(retry_backoff_ * attempt);
        }
    }
    
    dropped_++;
    LOG_ERROR("Giving up on event for " + event.account_id + " (version " + 
              std::to_string(event.version) + ") on " + topic, "InProcessChannel");
}

void InProcessChannel::Drain() {
    pool_->WaitForCompletion();
}

void InProcessChannel::Shutdown() {
    if (shutdown_.exchange(true)) return;
    pool_->Shutdown();
}

InProcessChannel::Stats InProcessChannel::GetStats() const {
    Stats stats;
    stats.published = published_;
    stats.delivered = delivered_;
    stats.redeliveries = redeliveries_;
    stats.dropped = dropped_;
    return stats;
}

} // namespace FairSlot
