// src/wallet/message_channel.h
#pragma once

#include "../core/types.h"
#include <functional>
#include <string>

namespace FairSlot {

// 异步对账通道：至少一次投递，handler 必须幂等
class MessageChannel {
public:
    using Handler = std::function<void(const ReconciliationEvent&)>;
    
    virtual ~MessageChannel() = default;
    
    // 不等待处理结果；通道不可用时抛出
    virtual void Publish(const std::string& topic, const ReconciliationEvent& event) = 0;
    
    virtual void Subscribe(const std::string& topic, Handler handler) = 0;
};

} // namespace FairSlot
