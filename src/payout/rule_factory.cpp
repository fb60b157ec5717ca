// src/payout/rule_factory.cpp
#include "rule_factory.h"
#include "win_rules.h"
#include "../utils/logger.h"
#include <algorithm>

namespace FairSlot {

RuleFactory::RuleFactory() {
    RegisterRuleType("jackpot", [](const PayoutRuleConfig& rule, const FairnessConfig& fairness) {
        return std::make_unique<JackpotRule>(fairness.jackpot_symbol, rule.multiplier, 
                                             fairness.reels);
    });
    
    RegisterRuleType("three_of_a_kind", 
                     [](const PayoutRuleConfig& rule, const FairnessConfig& fairness) {
        return std::make_unique<ThreeOfAKindRule>(fairness.jackpot_symbol, rule.multiplier, 
                                                  fairness.reels);
    });
}

void RuleFactory::RegisterRuleType(const std::string& type, Creator creator) {
    creators_[type] = std::move(creator);
    LOG_DEBUG("Registered rule type: " + type, "RuleFactory");
}

std::unique_ptr<WinRule> RuleFactory::CreateRule(const PayoutRuleConfig& rule_config,
                                                 const FairnessConfig& fairness_config) const {
    auto it = creators_.find(rule_config.type);
    if (it == creators_.end()) {
        LOG_ERROR("Unknown rule type: " + rule_config.type, "RuleFactory");
        return nullptr;
    }
    
    try {
        return it->second(rule_config, fairness_config);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create rule " + rule_config.type + ": " + e.what(), "RuleFactory");
        return nullptr;
    }
}

std::unique_ptr<PayoutEvaluator> RuleFactory::BuildEvaluator(
    const std::vector<PayoutRuleConfig>& rules, const FairnessConfig& fairness_config) const {
    
    auto evaluator = std::make_unique<PayoutEvaluator>();
    
    for (const auto& rule_config : rules) {
        auto rule = CreateRule(rule_config, fairness_config);
        if (!rule) {
            return nullptr;
        }
        LOG_INFO("Payout rule " + std::to_string(evaluator->GetRuleCount() + 1) + ": " + 
                 rule_config.type + " x" + std::to_string(rule_config.multiplier), "RuleFactory");
        evaluator->AddRule(std::move(rule));
    }
    
    return evaluator;
}

std::vector<std::string> RuleFactory::GetRegisteredTypes() const {
    std::vector<std::string> types;
    types.reserve(creators_.size());
    
    for (const auto& [type, creator] : creators_) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    
    return types;
}

bool RuleFactory::IsRegistered(const std::string& type) const {
    return creators_.find(type) != creators_.end();
}

} // namespace FairSlot
