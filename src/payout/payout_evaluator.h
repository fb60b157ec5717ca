// src/payout/payout_evaluator.h
#pragma once

#include "win_rule.h"
#include <memory>
#include <vector>

namespace FairSlot {

// 按优先级依次匹配，第一条命中的规则决定派彩；全部不中则为0
// 头奖规则必须排在三连规则之前，否则会被遮蔽
class PayoutEvaluator {
public:
    PayoutEvaluator() = default;
    
    void AddRule(std::unique_ptr<WinRule> rule);
    
    PayoutResult Evaluate(const Symbols& symbols, Money bet_amount) const;
    
    size_t GetRuleCount() const { return rules_.size(); }
    std::vector<std::string> GetRuleNames() const;

private:
    std::vector<std::unique_ptr<WinRule>> rules_;
};

} // namespace FairSlot
