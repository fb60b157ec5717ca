// src/fairness/fairness_service.cpp
#include "fairness_service.h"
#include "crypto_utils.h"
#include "../core/errors.h"
#include "../utils/logger.h"

namespace FairSlot {

FairnessService::FairnessService(std::shared_ptr<AccountRepository> repository, 
                                 const FairnessConfig& config)
    : repository_(std::move(repository)), config_(config)
    , generator_(config.symbols, config.reels) {
    
    if (!repository_) {
        throw std::invalid_argument("Repository cannot be null");
    }
}

void FairnessService::ArmAccount(Account& account) const {
    account.server_seed = CryptoUtils::GenerateSeed();
    account.server_seed_hash = CryptoUtils::Sha256Hex(account.server_seed);
    account.client_seed = config_.default_client_seed;
    account.nonce = 0;
}

GeneratedOutcome FairnessService::NextOutcome(const std::string& account_id) {
    GeneratedOutcome outcome;
    
    bool found = repository_->Update(account_id, [&](Account& account) {
        outcome.symbols = generator_.Generate(account.server_seed, account.client_seed, 
                                              account.nonce);
        outcome.nonce = account.nonce;
        
        account.nonce += 1;
        account.spin_count += 1;
        outcome.spin_count = account.spin_count;
        return true;
    });
    
    if (!found) {
        throw NotFoundError("Account", account_id);
    }
    
    return outcome;
}

ProvablyFairData FairnessService::GetCommitment(const std::string& account_id) const {
    auto account = repository_->Load(account_id);
    if (!account) {
        throw NotFoundError("Account", account_id);
    }
    
    ProvablyFairData data;
    data.server_seed_hash = account->server_seed_hash;
    data.client_seed = account->client_seed;
    data.nonce = account->nonce;
    return data;
}

SeedRotation FairnessService::RotateSeeds(const std::string& account_id, 
                                          const std::string& new_client_seed) {
    ValidateClientSeed(new_client_seed);
    
    const std::string new_server_seed = CryptoUtils::GenerateSeed();
    const std::string new_server_seed_hash = CryptoUtils::Sha256Hex(new_server_seed);
    
    SeedRotation rotation;
    bool found = repository_->Update(account_id, [&](Account& account) {
        rotation.previous_server_seed = account.server_seed;
        
        account.server_seed = new_server_seed;
        account.server_seed_hash = new_server_seed_hash;
        account.client_seed = new_client_seed;
        account.nonce = 0;
        return true;
    });
    
    if (!found) {
        throw NotFoundError("Account", account_id);
    }
    
    rotation.server_seed_hash = new_server_seed_hash;
    rotation.client_seed = new_client_seed;
    rotation.nonce = 0;
    
    LOG_INFO("Seeds rotated for " + account_id + ", new commitment " + new_server_seed_hash,
             "FairnessService");
    return rotation;
}

bool FairnessService::VerifySpin(const std::string& revealed_server_seed,
                                 const std::string& published_hash,
                                 const std::string& client_seed,
                                 std::int64_t nonce,
                                 const Symbols& recorded_symbols) const {
    if (CryptoUtils::Sha256Hex(revealed_server_seed) != published_hash) {
        return false;
    }
    return generator_.Generate(revealed_server_seed, client_seed, nonce) == recorded_symbols;
}

void FairnessService::ValidateClientSeed(const std::string& client_seed) {
    if (client_seed.empty()) {
        throw ValidationError("Client seed must not be empty");
    }
    if (client_seed.size() > kMaxClientSeedLength) {
        throw ValidationError("Client seed longer than " + 
                              std::to_string(kMaxClientSeedLength) + " characters");
    }
}

} // namespace FairSlot
