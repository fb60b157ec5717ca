// src/slot_service.h
#pragma once

#include "core/types.h"
#include "fairness/fairness_service.h"
#include "game/account_service.h"
#include "game/spin_orchestrator.h"
#include "payout/rule_factory.h"
#include "storage/account_repository.h"
#include "storage/cache_store.h"
#include "wallet/in_process_channel.h"
#include "wallet/reconciliation_listener.h"
#include "wallet/wallet_service.h"
#include <memory>
#include <string>

namespace FairSlot {

// 组装所有组件，对外提供账户/余额/spin/公平性接口（Web层的调用入口）
// 领域错误以 ServiceError 子类抛出
class SlotService {
public:
    SlotService();
    ~SlotService();
    
    SlotService(const SlotService&) = delete;
    SlotService& operator=(const SlotService&) = delete;
    
    // 按配置创建存储与各组件；密码学原语不可用时返回 false
    bool Initialize(const ServiceConfig& config);
    
    // 使用外部提供的存储（测试或嵌入场景）
    bool Initialize(const ServiceConfig& config,
                    std::shared_ptr<AccountRepository> repository,
                    std::shared_ptr<CacheStore> cache);
    
    AccountSummary CreateAccount(const std::string& account_id);
    Money GetBalance(const std::string& account_id);
    SpinOutcome Spin(const std::string& account_id, const std::string& bet_amount);
    SpinOutcome Spin(const std::string& account_id, Money bet_amount);
    ProvablyFairData GetFairness(const std::string& account_id);
    SeedRotation RotateSeeds(const std::string& account_id, const std::string& new_client_seed);
    
    // 等待所有对账事件写入冷存储
    void Drain();
    void Shutdown();
    
    bool IsInitialized() const { return initialized_; }
    const ServiceConfig& GetConfig() const { return config_; }
    
    std::shared_ptr<AccountRepository> GetRepository() const { return repository_; }
    std::shared_ptr<WalletService> GetWallet() const { return wallet_; }
    std::shared_ptr<FairnessService> GetFairnessService() const { return fairness_; }
    std::shared_ptr<SpinOrchestrator> GetOrchestrator() const { return orchestrator_; }
    std::shared_ptr<InProcessChannel> GetChannel() const { return channel_; }
    std::shared_ptr<ReconciliationListener> GetListener() const { return listener_; }

private:
    ServiceConfig config_;
    bool initialized_;
    
    std::shared_ptr<AccountRepository> repository_;
    std::shared_ptr<CacheStore> cache_;
    std::shared_ptr<WalletService> wallet_;
    std::shared_ptr<FairnessService> fairness_;
    std::shared_ptr<PayoutEvaluator> evaluator_;
    std::shared_ptr<InProcessChannel> channel_;
    std::shared_ptr<ReconciliationListener> listener_;
    std::shared_ptr<AccountLockTable> locks_;
    std::unique_ptr<AccountService> account_service_;
    std::shared_ptr<SpinOrchestrator> orchestrator_;
    
    std::shared_ptr<AccountRepository> CreateRepository(const StorageConfig& storage) const;
    void RequireInitialized() const;
};

} // namespace FairSlot
