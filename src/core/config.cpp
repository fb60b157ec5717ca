// src/core/config.cpp
#include "config.h"
#include "../utils/logger.h"
#include <set>

namespace FairSlot {

bool ConfigManager::LoadServiceConfig(const std::string& config_path) {
    try {
        YAML::Node root = YAML::LoadFile(config_path);
        if (!ParseRoot(root)) {
            return false;
        }
        LOG_INFO("Loaded service config: " + config_path, "ConfigManager");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load service config " + config_path + ": " + e.what(), 
                  "ConfigManager");
        return false;
    }
}

bool ConfigManager::LoadServiceConfigFromString(const std::string& yaml_text) {
    try {
        return ParseRoot(YAML::Load(yaml_text));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to parse service config: " + std::string(e.what()), "ConfigManager");
        return false;
    }
}

bool ConfigManager::ParseRoot(const YAML::Node& root) {
    ServiceConfig config;
    
    if (root["wallet"]) ParseWalletConfig(root["wallet"], config.wallet);
    if (root["fairness"]) ParseFairnessConfig(root["fairness"], config.fairness);
    if (root["payout_rules"]) ParsePayoutRulesConfig(root["payout_rules"], config.payout_rules);
    if (root["reconciliation"]) {
        ParseReconciliationConfig(root["reconciliation"], config.reconciliation);
    }
    if (root["storage"]) ParseStorageConfig(root["storage"], config.storage);
    if (root["logging"]) ParseLoggingConfig(root["logging"], config.logging);
    if (root["load_test"]) ParseLoadTestConfig(root["load_test"], config.load_test);
    
    service_config_ = std::move(config);
    return true;
}

void ConfigManager::ParseWalletConfig(const YAML::Node& node, WalletConfig& config) {
    if (node["initial_balance"]) {
        config.initial_balance = ToMinorUnits(node["initial_balance"].as<std::string>());
    }
    config.cache_ttl_seconds = node["cache_ttl_seconds"].as<int>(config.cache_ttl_seconds);
    config.key_prefix = node["key_prefix"].as<std::string>(config.key_prefix);
    config.conditional_debit = node["conditional_debit"].as<bool>(config.conditional_debit);
}

void ConfigManager::ParseFairnessConfig(const YAML::Node& node, FairnessConfig& config) {
    config.default_client_seed = 
        node["default_client_seed"].as<std::string>(config.default_client_seed);
    config.reels = node["reels"].as<int>(config.reels);
    config.jackpot_symbol = node["jackpot_symbol"].as<std::string>(config.jackpot_symbol);
    
    if (node["symbols"]) {
        config.symbols.clear();
        for (const auto& symbol : node["symbols"]) {
            config.symbols.push_back(symbol.as<std::string>());
        }
    }
}

void ConfigManager::ParsePayoutRulesConfig(const YAML::Node& node, 
                                           std::vector<PayoutRuleConfig>& rules) {
    rules.clear();
    for (const auto& entry : node) {
        PayoutRuleConfig rule;
        rule.type = entry["type"].as<std::string>();
        rule.multiplier = entry["multiplier"].as<std::int64_t>();
        rules.push_back(std::move(rule));
    }
}

void ConfigManager::ParseReconciliationConfig(const YAML::Node& node, 
                                              ReconciliationConfig& config) {
    config.topic = node["topic"].as<std::string>(config.topic);
    config.worker_threads = node["worker_threads"].as<int>(config.worker_threads);
    config.max_delivery_attempts = 
        node["max_delivery_attempts"].as<int>(config.max_delivery_attempts);
}

void ConfigManager::ParseStorageConfig(const YAML::Node& node, StorageConfig& config) {
    config.backend = node["backend"].as<std::string>(config.backend);
    config.path = node["path"].as<std::string>(config.path);
}

void ConfigManager::ParseLoggingConfig(const YAML::Node& node, LoggingConfig& config) {
    config.file = node["file"].as<std::string>(config.file);
    config.console_level = node["console_level"].as<std::string>(config.console_level);
    config.file_level = node["file_level"].as<std::string>(config.file_level);
    config.console = node["console"].as<bool>(config.console);
}

void ConfigManager::ParseLoadTestConfig(const YAML::Node& node, LoadTestConfig& config) {
    config.accounts = node["accounts"].as<int>(config.accounts);
    config.spins_per_account = node["spins_per_account"].as<int>(config.spins_per_account);
    config.threads = node["threads"].as<int>(config.threads);
    if (node["bet"]) {
        config.bet = ParseWager(node["bet"].as<std::string>());
    }
}

bool ConfigManager::ValidateServiceConfig() const {
    const auto& config = service_config_;
    const auto& fairness = config.fairness;
    
    if (fairness.symbols.size() < 2) {
        LOG_ERROR("fairness.symbols needs at least 2 symbols", "ConfigManager");
        return false;
    }
    
    std::set<std::string> unique_symbols(fairness.symbols.begin(), fairness.symbols.end());
    if (unique_symbols.size() != fairness.symbols.size()) {
        LOG_ERROR("fairness.symbols contains duplicates", "ConfigManager");
        return false;
    }
    
    if (unique_symbols.count(fairness.jackpot_symbol) == 0) {
        LOG_ERROR("fairness.jackpot_symbol '" + fairness.jackpot_symbol + 
                  "' is not in the symbol alphabet", "ConfigManager");
        return false;
    }
    
    // 每个转轮占用8个十六进制字符，HMAC-SHA256 摘要共64个
    if (fairness.reels < 1 || fairness.reels > 8) {
        LOG_ERROR("fairness.reels must be between 1 and 8", "ConfigManager");
        return false;
    }
    
    if (fairness.default_client_seed.empty()) {
        LOG_ERROR("fairness.default_client_seed must not be empty", "ConfigManager");
        return false;
    }
    
    if (config.payout_rules.empty()) {
        LOG_WARNING("No payout rules configured, every spin pays zero", "ConfigManager");
    }
    
    for (const auto& rule : config.payout_rules) {
        if (rule.multiplier <= 0) {
            LOG_ERROR("Payout rule " + rule.type + " has non-positive multiplier", 
                      "ConfigManager");
            return false;
        }
    }
    
    if (config.wallet.initial_balance < 0) {
        LOG_ERROR("wallet.initial_balance must not be negative", "ConfigManager");
        return false;
    }
    
    if (config.wallet.cache_ttl_seconds <= 0) {
        LOG_ERROR("wallet.cache_ttl_seconds must be positive", "ConfigManager");
        return false;
    }
    
    if (config.storage.backend != "memory" && config.storage.backend != "yaml") {
        LOG_ERROR("storage.backend must be 'memory' or 'yaml', got '" + 
                  config.storage.backend + "'", "ConfigManager");
        return false;
    }
    
    if (config.reconciliation.topic.empty()) {
        LOG_ERROR("reconciliation.topic must not be empty", "ConfigManager");
        return false;
    }
    
    return true;
}

} // namespace FairSlot
