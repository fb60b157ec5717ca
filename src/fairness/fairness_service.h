// src/fairness/fairness_service.h
#pragma once

#include "outcome_generator.h"
#include "../core/types.h"
#include "../storage/account_repository.h"
#include <memory>
#include <string>

namespace FairSlot {

// Provably Fair 的有状态部分：种子对、nonce 的读取、消耗与轮换
class FairnessService {
public:
    static constexpr size_t kMaxClientSeedLength = 128;
    
    FairnessService(std::shared_ptr<AccountRepository> repository, const FairnessConfig& config);
    
    // 为新账户生成种子对，nonce 置0
    void ArmAccount(Account& account) const;
    
    // 读取种子与nonce、生成结果、nonce+1 并写回，整个过程在一次原子更新内完成
    // 同一个nonce永远不会被使用两次
    GeneratedOutcome NextOutcome(const std::string& account_id);
    
    ProvablyFairData GetCommitment(const std::string& account_id) const;
    
    // 返回被替换的旧 server seed，玩家据此验证该种子周期内的所有spin
    SeedRotation RotateSeeds(const std::string& account_id, const std::string& new_client_seed);
    
    // 玩家侧验证：SHA256(公开的种子) == 承诺，且重算结果与记录一致
    bool VerifySpin(const std::string& revealed_server_seed,
                    const std::string& published_hash,
                    const std::string& client_seed,
                    std::int64_t nonce,
                    const Symbols& recorded_symbols) const;
    
    const OutcomeGenerator& GetGenerator() const { return generator_; }

private:
    std::shared_ptr<AccountRepository> repository_;
    FairnessConfig config_;
    OutcomeGenerator generator_;
    
    static void ValidateClientSeed(const std::string& client_seed);
};

} // namespace FairSlot
