// src/payout/payout_evaluator.cpp
#include "payout_evaluator.h"
#include <stdexcept>

namespace FairSlot {

void PayoutEvaluator::AddRule(std::unique_ptr<WinRule> rule) {
    if (!rule) {
        throw std::invalid_argument("Win rule cannot be null");
    }
    rules_.push_back(std::move(rule));
}

PayoutResult PayoutEvaluator::Evaluate(const Symbols& symbols, Money bet_amount) const {
    for (const auto& rule : rules_) {
        if (rule->Matches(symbols)) {
            return PayoutResult(rule->CalculateWin(bet_amount), rule->GetName());
        }
    }
    return PayoutResult();
}

std::vector<std::string> PayoutEvaluator::GetRuleNames() const {
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& rule : rules_) {
        names.push_back(rule->GetName());
    }
    return names;
}

} // namespace FairSlot
