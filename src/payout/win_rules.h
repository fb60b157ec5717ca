// src/payout/win_rules.h
#pragma once

#include "win_rule.h"
#include <cstdint>

namespace FairSlot {

// 按固定倍数派彩的规则基类
class MultiplierRule : public WinRule {
public:
    MultiplierRule(const std::string& name, std::int64_t multiplier, int reel_count);
    
    Money CalculateWin(Money bet_amount) const override;
    const std::string& GetName() const override { return name_; }
    std::int64_t GetMultiplier() const { return multiplier_; }

protected:
    int reel_count_;
    
    // 符号数量正确且全部相同
    bool AllEqual(const Symbols& symbols) const;

private:
    std::string name_;
    std::int64_t multiplier_;
};

// 所有转轮都是头奖符号
class JackpotRule : public MultiplierRule {
public:
    JackpotRule(const std::string& jackpot_symbol, std::int64_t multiplier, int reel_count = 3);
    
    bool Matches(const Symbols& symbols) const override;

private:
    std::string jackpot_symbol_;
};

// 所有转轮相同，且不是头奖符号
class ThreeOfAKindRule : public MultiplierRule {
public:
    ThreeOfAKindRule(const std::string& jackpot_symbol, std::int64_t multiplier, int reel_count = 3);
    
    bool Matches(const Symbols& symbols) const override;

private:
    std::string jackpot_symbol_;
};

} // namespace FairSlot
