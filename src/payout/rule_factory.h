// src/payout/rule_factory.h
#pragma once

#include "payout_evaluator.h"
#include "../core/types.h"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace FairSlot {

class RuleFactory {
public:
    using Creator = std::function<std::unique_ptr<WinRule>(const PayoutRuleConfig&, 
                                                           const FairnessConfig&)>;
    
    // 注册内置规则 "jackpot" 和 "three_of_a_kind"
    RuleFactory();
    ~RuleFactory() = default;
    
    void RegisterRuleType(const std::string& type, Creator creator);
    
    // 未注册的类型返回 nullptr
    std::unique_ptr<WinRule> CreateRule(const PayoutRuleConfig& rule_config,
                                        const FairnessConfig& fairness_config) const;
    
    // 按配置顺序构建评估器；任一规则创建失败返回 nullptr
    std::unique_ptr<PayoutEvaluator> BuildEvaluator(const std::vector<PayoutRuleConfig>& rules,
                                                    const FairnessConfig& fairness_config) const;
    
    std::vector<std::string> GetRegisteredTypes() const;
    bool IsRegistered(const std::string& type) const;

private:
    std::unordered_map<std::string, Creator> creators_;
};

} // namespace FairSlot
