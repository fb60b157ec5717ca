// src/core/types.h
#pragma once

#include <cstdint>
#include <vector>
#include <string>

namespace FairSlot {

// 金额统一使用最小货币单位（分）
using Money = std::int64_t;
using Symbols = std::vector<std::string>;

constexpr Money kMinorUnitsPerMajor = 100;
constexpr int kMinorUnitDigits = 2;

// 十进制字符串 -> 分，多余的小数位直接截断（不四舍五入）
Money ToMinorUnits(const std::string& decimal_amount);

// 投注额边界校验：必须为正数，且不允许超过两位小数
Money ParseWager(const std::string& decimal_amount);

// 分 -> "12.34"
std::string FormatMoney(Money amount);

// 冷存储中的账户记录
struct Account {
    std::string id;
    Money balance;
    std::string server_seed;        // 私密种子，只在轮换时公开
    std::string server_seed_hash;   // 公开承诺 = SHA256(server_seed)
    std::string client_seed;
    std::int64_t nonce;             // 当前种子周期内的spin计数
    std::int64_t spin_count;        // 生命周期spin计数，不随轮换清零
    std::int64_t balance_version;   // 最近一次应用的对账事件版本
    
    Account() : balance(0), nonce(0), spin_count(0), balance_version(0) {}
};

// 对外展示的账户信息（不含私密种子）
struct AccountSummary {
    std::string id;
    Money balance;
    std::string server_seed_hash;
    std::string client_seed;
    std::int64_t nonce;
    
    AccountSummary() : balance(0), nonce(0) {}
};

// 热钱包 -> 冷存储的余额快照
struct ReconciliationEvent {
    std::string account_id;
    Money balance;
    std::int64_t version;
    
    ReconciliationEvent() : balance(0), version(0) {}
    ReconciliationEvent(const std::string& id, Money bal, std::int64_t ver)
        : account_id(id), balance(bal), version(ver) {}
};

// 一次结果生成（已消耗nonce）
struct GeneratedOutcome {
    Symbols symbols;
    std::int64_t nonce;
    std::int64_t spin_count;
    
    GeneratedOutcome() : nonce(0), spin_count(0) {}
};

struct PayoutResult {
    Money amount;
    std::string rule_name;  // 未中奖时为空
    
    PayoutResult() : amount(0) {}
    PayoutResult(Money amt, const std::string& name) : amount(amt), rule_name(name) {}
};

// Spin结果
struct SpinOutcome {
    std::string account_id;
    Symbols symbols;
    Money bet_amount;
    Money win_amount;
    Money balance;          // spin完成后的热钱包余额
    std::int64_t nonce;     // 本次使用的nonce
    std::string rule_name;
    
    SpinOutcome() : bet_amount(0), win_amount(0), balance(0), nonce(0) {}
};

struct ProvablyFairData {
    std::string server_seed_hash;
    std::string client_seed;
    std::int64_t nonce;
    
    ProvablyFairData() : nonce(0) {}
};

struct SeedRotation {
    std::string previous_server_seed;   // 玩家用于验证历史spin
    std::string server_seed_hash;
    std::string client_seed;
    std::int64_t nonce;
    
    SeedRotation() : nonce(0) {}
};

// 压测中单次spin的记录，用于轮换后的公平性验证
struct SpinRecord {
    std::int64_t nonce;
    Symbols symbols;
    Money bet_amount;
    Money win_amount;
    
    SpinRecord() : nonce(0), bet_amount(0), win_amount(0) {}
};

// 单个账户session的统计
struct SessionStats {
    std::string session_id;
    std::string account_id;
    
    // 本纪元的公开承诺（session期间不轮换）
    std::string server_seed_hash;
    std::string client_seed;
    std::int64_t initial_nonce = 0;
    
    int total_spins = 0;
    int rejected_spins = 0;
    int failed_spins = 0;
    int winning_spins = 0;
    Money total_bet = 0;
    Money total_win = 0;
    Money initial_balance = 0;
    Money final_balance = 0;
    double session_duration = 0.0;
    
    std::vector<SpinRecord> spins;
};

// 配置结构体
struct WalletConfig {
    Money initial_balance = 100 * kMinorUnitsPerMajor;
    int cache_ttl_seconds = 3600;
    std::string key_prefix = "balance:";
    bool conditional_debit = true;
};

struct FairnessConfig {
    std::string default_client_seed = "default-client-seed";
    int reels = 3;
    Symbols symbols = {"CEREJA", "LARANJA", "SETE", "BAR"};
    std::string jackpot_symbol = "SETE";
};

struct PayoutRuleConfig {
    std::string type;
    std::int64_t multiplier;
    
    PayoutRuleConfig() : multiplier(0) {}
    PayoutRuleConfig(const std::string& t, std::int64_t m) : type(t), multiplier(m) {}
};

struct ReconciliationConfig {
    std::string topic = "wallet.sync";
    int worker_threads = 2;
    int max_delivery_attempts = 3;
};

struct StorageConfig {
    std::string backend = "memory";     // "memory" 或 "yaml"
    std::string path = "data/accounts.yaml";
};

struct LoggingConfig {
    std::string file = "logs/fair_slot.log";
    std::string console_level = "info";
    std::string file_level = "debug";
    bool console = true;
};

struct LoadTestConfig {
    int accounts = 8;
    int spins_per_account = 200;
    Money bet = 1 * kMinorUnitsPerMajor;
    int threads = 0;                    // 0表示自动检测
};

struct ServiceConfig {
    WalletConfig wallet;
    FairnessConfig fairness;
    std::vector<PayoutRuleConfig> payout_rules;     // 按优先级排列
    ReconciliationConfig reconciliation;
    StorageConfig storage;
    LoggingConfig logging;
    LoadTestConfig load_test;
    
    ServiceConfig()
        : payout_rules{PayoutRuleConfig("jackpot", 100),
                       PayoutRuleConfig("three_of_a_kind", 10)} {}
};

} // namespace FairSlot
