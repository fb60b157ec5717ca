// src/slot_service.cpp
#include "slot_service.h"
#include "core/errors.h"
#include "fairness/crypto_utils.h"
#include "storage/memory_account_repository.h"
#include "storage/memory_cache_store.h"
#include "storage/yaml_account_repository.h"
#include "utils/logger.h"
#include <stdexcept>

namespace FairSlot {

SlotService::SlotService() : initialized_(false) {
    LOG_DEBUG("SlotService created", "SlotService");
}

SlotService::~SlotService() {
    Shutdown();
    LOG_DEBUG("SlotService destroyed", "SlotService");
}

bool SlotService::Initialize(const ServiceConfig& config) {
    try {
        return Initialize(config, CreateRepository(config.storage), 
                          std::make_shared<MemoryCacheStore>());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to open durable store: " + std::string(e.what()), "SlotService");
        return false;
    }
}

bool SlotService::Initialize(const ServiceConfig& config,
                             std::shared_ptr<AccountRepository> repository,
                             std::shared_ptr<CacheStore> cache) {
    if (initialized_) {
        LOG_WARNING("SlotService already initialized", "SlotService");
        return true;
    }
    
    try {
        config_ = config;
        
        // 密码学原语不可用时拒绝启动
        CryptoUtils::EnsureCryptoAvailable();
        
        repository_ = std::move(repository);
        cache_ = std::move(cache);
        if (!repository_ || !cache_) {
            LOG_ERROR("Repository and cache must be provided", "SlotService");
            return false;
        }
        
        wallet_ = std::make_shared<WalletService>(cache_, repository_, config_.wallet);
        fairness_ = std::make_shared<FairnessService>(repository_, config_.fairness);
        
        RuleFactory rule_factory;
        evaluator_ = rule_factory.BuildEvaluator(config_.payout_rules, config_.fairness);
        if (!evaluator_) {
            LOG_ERROR("Failed to build payout evaluator", "SlotService");
            return false;
        }
        
        channel_ = std::make_shared<InProcessChannel>(
            config_.reconciliation.worker_threads, config_.reconciliation.max_delivery_attempts);
        listener_ = std::make_shared<ReconciliationListener>(repository_);
        listener_->Attach(*channel_, config_.reconciliation.topic);
        
        locks_ = std::make_shared<AccountLockTable>();
        account_service_ = std::make_unique<AccountService>(repository_, fairness_, 
                                                            config_.wallet);
        orchestrator_ = std::make_shared<SpinOrchestrator>(
            wallet_, fairness_, evaluator_, channel_, locks_, config_.reconciliation.topic);
        
        initialized_ = true;
        LOG_INFO("SlotService initialized (" + std::to_string(config_.fairness.reels) + 
                 " reels, " + std::to_string(config_.fairness.symbols.size()) + " symbols, " +
                 std::to_string(evaluator_->GetRuleCount()) + " payout rules)", "SlotService");
        return true;
        
    } catch (const std::exception& e) {
        LOG_ERROR("Exception during initialization: " + std::string(e.what()), "SlotService");
        return false;
    }
}

AccountSummary SlotService::CreateAccount(const std::string& account_id) {
    RequireInitialized();
    
    Account account = account_service_->CreateAccount(account_id);
    
    AccountSummary summary;
    summary.id = account.id;
    summary.balance = account.balance;
    summary.server_seed_hash = account.server_seed_hash;
    summary.client_seed = account.client_seed;
    summary.nonce = account.nonce;
    return summary;
}

Money SlotService::GetBalance(const std::string& account_id) {
    RequireInitialized();
    return wallet_->GetBalance(account_id);
}

SpinOutcome SlotService::Spin(const std::string& account_id, const std::string& bet_amount) {
    return Spin(account_id, ParseWager(bet_amount));
}

SpinOutcome SlotService::Spin(const std::string& account_id, Money bet_amount) {
    RequireInitialized();
    return orchestrator_->PerformSpin(account_id, bet_amount);
}

ProvablyFairData SlotService::GetFairness(const std::string& account_id) {
    RequireInitialized();
    return fairness_->GetCommitment(account_id);
}

SeedRotation SlotService::RotateSeeds(const std::string& account_id, 
                                      const std::string& new_client_seed) {
    RequireInitialized();
    // 与spin互斥，避免轮换发生在nonce消耗与结果返回之间
    auto account_lock = locks_->Lock(account_id);
    return fairness_->RotateSeeds(account_id, new_client_seed);
}

void SlotService::Drain() {
    if (channel_) {
        channel_->Drain();
    }
}

void SlotService::Shutdown() {
    if (channel_) {
        channel_->Drain();
        channel_->Shutdown();
    }
    initialized_ = false;
}

std::shared_ptr<AccountRepository> SlotService::CreateRepository(
    const StorageConfig& storage) const {
    if (storage.backend == "yaml") {
        return std::make_shared<YamlAccountRepository>(storage.path);
    }
    return std::make_shared<MemoryAccountRepository>();
}

void SlotService::RequireInitialized() const {
    if (!initialized_) {
        throw std::logic_error("SlotService is not initialized");
    }
}

} // namespace FairSlot
